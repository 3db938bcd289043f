#pragma once

#include <gll/cst.hpp>
#include <gll/engine.hpp>
#include <gll/sppf.hpp>

#include <compare>
#include <functional>

namespace gll {

  // Orders two competing packed nodes of the same forest node. `less` means
  // the first is preferred; `equivalent` leaves the choice unresolved.
  using disambiguation_policy = std::function<std::weak_ordering(
      const sppf::forest&, sppf::node_id, sppf::node_id)>;

  // Earliest-declared production wins, then the split with the longest
  // left child.
  disambiguation_policy
  default_policy();

  // Every choice between two derivations is an ambiguity.
  disambiguation_policy
  strict_policy();

  struct extract_options {
    disambiguation_policy policy = default_policy();
  };

  // Builds the CST of the symbol node `root`. Throws ambiguity_error when
  // the policy leaves two derivations tied, or when every derivation of a
  // node runs into a cycle.
  cst_node
  extract_cst(const sppf::forest& forest, sppf::node_id root,
              const extract_options& opts = {});

  // Throws parse_error for a failed result.
  cst_node
  extract_cst(const parse_result& result, const extract_options& opts = {});

} // namespace gll
