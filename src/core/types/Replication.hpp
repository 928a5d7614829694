#pragma once
#include <optional>
#include <string>

namespace weed {

// SeaweedFS caps each scope at two extra copies.
enum class ReplicaCount { One, Two };

// Replica placement requested at assign time, e.g. "100" for one copy in
// another data center. Slots serialize in data center, rack, node order.
struct ReplicationType {
  std::optional<ReplicaCount> data_center;
  std::optional<ReplicaCount> other_rack;
  std::optional<ReplicaCount> same_rack;

  // Always three digits.
  std::string toString() const;
};

} // namespace weed
