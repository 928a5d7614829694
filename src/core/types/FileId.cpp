#include "FileId.hpp"
#include "Numbers.hpp"
#include "core/Errors.hpp"

namespace weed {

FileId FileId::parse(std::string_view text) {
  const auto comma = text.find(',');
  if (comma == std::string_view::npos) {
    throw WeedError(ErrorKind::MalformedHandle, std::string(text));
  }

  auto volume = parseUnsigned<uint32_t>(text.substr(0, comma));
  if (!volume) throw WeedError(ErrorKind::MalformedHandle, std::string(text));

  std::string_view rest = text.substr(comma + 1);
  std::string_view key = rest;
  std::optional<uint64_t> generation;

  const auto underscore = rest.find('_');
  if (underscore != std::string_view::npos) {
    key = rest.substr(0, underscore);
    generation = parseUnsigned<uint64_t>(rest.substr(underscore + 1));
    if (!generation) throw WeedError(ErrorKind::MalformedHandle, std::string(text));
  }

  // "3," and "3,_2" would format back to something no server hands out
  if (key.empty()) throw WeedError(ErrorKind::MalformedHandle, std::string(text));

  return FileId{*volume, std::string(key), generation};
}

std::string FileId::toString() const {
  std::string s = std::to_string(volume_id) + "," + key;
  if (generation) s += "_" + std::to_string(*generation);
  return s;
}

bool operator==(const FileId& a, const FileId& b) {
  return a.volume_id == b.volume_id && a.key == b.key && a.generation == b.generation;
}

bool operator!=(const FileId& a, const FileId& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, const FileId& fid) {
  return os << fid.toString();
}

} // namespace weed
