#pragma once

#include <string>
#include <string_view>

namespace sep39::env {

inline constexpr std::string_view kVerboseVar = "SEP39_VERBOSE";
inline constexpr std::string_view kNoColorVar = "SEP39_NO_COLOR";

std::string Get(std::string_view name);
// Unset, empty and unrecognized values yield `default_value`.
bool IsEnabled(std::string_view name, bool default_value = false);

}  // namespace sep39::env
