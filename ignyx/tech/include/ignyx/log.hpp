#pragma once

// Header-only spdlog is forced locally so that consumers linking the compiled variant do not get
// redefinition warnings from a public compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <string_view>

namespace ignyx {

namespace log = spdlog;

// Applies a textual level ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names leave the current level untouched and return false.
bool SetLogLevel(std::string_view levelName);

}  // namespace ignyx
