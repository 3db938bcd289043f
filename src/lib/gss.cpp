#include <gll/gss.hpp>

#include <algorithm>

namespace gll {

  gss::gss() {
    nodes_.push_back(gss_node{no_slot, 0, {}, {}});
    popped_ends_.emplace_back();
  }

  std::pair<gss_node_id, bool>
  gss::get_or_create(slot_id slot, std::size_t offset) {
    auto [it, inserted] = index_.try_emplace(
        key{slot, offset}, static_cast<gss_node_id>(nodes_.size()));
    if (inserted) {
      nodes_.push_back(gss_node{slot, offset, {}, {}});
      popped_ends_.emplace_back();
    }
    return {it->second, inserted};
  }

  bool
  gss::add_edge(gss_node_id from, gss_node_id to, sppf::node_id label) {
    auto& edges = nodes_[from].edges;
    gss_edge e{to, label};
    if (std::find(edges.begin(), edges.end(), e) != edges.end()) return false;
    edges.push_back(e);
    ++edge_count_;
    return true;
  }

  bool
  gss::add_popped(gss_node_id node, sppf::node_id result, std::size_t end) {
    auto& ends = popped_ends_[node];
    if (std::find(ends.begin(), ends.end(), end) != ends.end()) return false;
    ends.push_back(end);
    nodes_[node].popped.push_back(result);
    return true;
  }

} // namespace gll
