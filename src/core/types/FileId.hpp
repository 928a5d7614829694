#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace weed {

// A SeaweedFS file id such as "3,01637037d6" or "3,5442434343_2".
struct FileId {
  uint32_t                volume_id = 0;
  std::string             key;
  std::optional<uint64_t> generation;

  // Throws WeedError(MalformedHandle).
  static FileId parse(std::string_view text);

  std::string toString() const;
};

bool operator==(const FileId& a, const FileId& b);
bool operator!=(const FileId& a, const FileId& b);
std::ostream& operator<<(std::ostream& os, const FileId& fid);

} // namespace weed
