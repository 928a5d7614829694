#include "Ttl.hpp"

namespace weed {

char unitLetter(TtlUnit unit) {
  switch (unit) {
    case TtlUnit::Minute: return 'm';
    case TtlUnit::Hour:   return 'h';
    case TtlUnit::Day:    return 'd';
    case TtlUnit::Week:   return 'w';
    case TtlUnit::Month:  return 'M';
    case TtlUnit::Year:   return 'y';
  }
  return 'm';
}

std::string Ttl::toString() const {
  return std::to_string(value) + unitLetter(unit);
}

} // namespace weed
