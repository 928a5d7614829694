#pragma once
#include <string>

#include <spdlog/common.h>

namespace weed::cli {

// spdlog level for a WEED_LOG_LEVEL value. Names spdlog does not know fall
// back to info instead of switching logging off.
spdlog::level::level_enum logLevelFrom(const std::string& name);

// Name sent as the multipart filename: the last path component only.
std::string uploadName(const std::string& path);

} // namespace weed::cli
