#pragma once
#include <string>

namespace weed {

// Where a volume lives, as reported by the master. url is the address the
// cluster uses internally, public_url the one meant for outside readers.
struct Location {
  std::string public_url;
  std::string url;
};

} // namespace weed
