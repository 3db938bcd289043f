#pragma once

#include <gll/grammar.hpp>
#include <gll/sppf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gll {

  using gss_node_id = std::uint32_t;

  inline constexpr gss_node_id no_gss_node =
      std::numeric_limits<gss_node_id>::max();

  struct gss_edge {
    gss_node_id target = no_gss_node;
    // Forest node for the prefix matched before the call.
    sppf::node_id label = sppf::no_node;

    bool
    operator==(const gss_edge&) const = default;
  };

  // Identified by (return slot, offset). The root has slot no_slot.
  struct gss_node {
    slot_id slot = no_slot;
    std::size_t offset = 0;
    std::vector<gss_edge> edges;
    // Forest nodes this call has completed with, one per right extent.
    std::vector<sppf::node_id> popped;
  };

  class gss {
  public:
    gss();

    gss_node_id
    root() const {
      return 0;
    }

    // The node for (slot, offset) and whether it was created by this call.
    std::pair<gss_node_id, bool>
    get_or_create(slot_id slot, std::size_t offset);

    // False if the edge already existed.
    bool
    add_edge(gss_node_id from, gss_node_id to, sppf::node_id label);

    // False if a result with the same right extent was already recorded.
    bool
    add_popped(gss_node_id node, sppf::node_id result, std::size_t end);

    const gss_node&
    at(gss_node_id id) const {
      return nodes_[id];
    }

    std::size_t
    size() const {
      return nodes_.size();
    }

    std::size_t
    edge_count() const {
      return edge_count_;
    }

  private:
    struct key {
      slot_id slot;
      std::size_t offset;

      bool
      operator==(const key&) const = default;
    };

    struct key_hash {
      std::size_t
      operator()(const key& k) const noexcept {
        return std::hash<std::uint64_t>{}(
            (static_cast<std::uint64_t>(k.slot) << 40) ^ k.offset);
      }
    };

    std::vector<gss_node> nodes_;
    std::unordered_map<key, gss_node_id, key_hash> index_;
    std::vector<std::vector<std::size_t>> popped_ends_;
    std::size_t edge_count_ = 0;
  };

} // namespace gll
