#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sep39::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

}  // namespace sep39::base64
