#include "ignyx/log.hpp"

#include <array>
#include <string_view>
#include <utility>

#include "ignyx/string-equal-ignore-case.hpp"

namespace ignyx {

bool SetLogLevel(std::string_view levelName) {
  static constexpr std::array<std::pair<std::string_view, log::level::level_enum>, 8> kLevels{{
      {"trace", log::level::trace},
      {"debug", log::level::debug},
      {"info", log::level::info},
      {"warn", log::level::warn},
      {"warning", log::level::warn},
      {"error", log::level::err},
      {"critical", log::level::critical},
      {"off", log::level::off},
  }};
  for (const auto& [name, level] : kLevels) {
    if (CaseInsensitiveEqual(name, levelName)) {
      log::set_level(level);
      return true;
    }
  }
  return false;
}

}  // namespace ignyx
