#include "Replication.hpp"

namespace weed {

static char digit(const std::optional<ReplicaCount>& slot) {
  if (!slot) return '0';
  return *slot == ReplicaCount::One ? '1' : '2';
}

std::string ReplicationType::toString() const {
  std::string s(3, '0');
  s[0] = digit(data_center);
  s[1] = digit(other_rack);
  s[2] = digit(same_rack);
  return s;
}

} // namespace weed
