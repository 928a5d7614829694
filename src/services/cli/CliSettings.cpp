#include "CliSettings.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace weed::cli {

spdlog::level::level_enum logLevelFrom(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("unknown WEED_LOG_LEVEL '{}', using info", name);
    return spdlog::level::info;
  }
  return level;
}

std::string uploadName(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

} // namespace weed::cli
