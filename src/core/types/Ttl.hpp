#pragma once
#include <cstdint>
#include <string>

namespace weed {

enum class TtlUnit { Minute, Hour, Day, Week, Month, Year };

// Time to live for an assigned file: "5m" is five minutes, "5M" five months.
struct Ttl {
  TtlUnit  unit  = TtlUnit::Minute;
  uint32_t value = 0;

  std::string toString() const;
};

char unitLetter(TtlUnit unit);

} // namespace weed
