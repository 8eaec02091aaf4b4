#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sep39::base91 {

std::string Encode(const std::uint8_t* data, std::size_t size);
std::string Encode(const std::vector<std::uint8_t>& data);

// Strict: any character outside the alphabet sets *ok to false and yields
// empty output.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

}  // namespace sep39::base91
