#pragma once

#include <cstddef>
#include <string_view>

namespace sep39::constants {

inline constexpr std::size_t kMaxPayloadSize = 126000;
inline constexpr std::size_t kMaxLengthDigits = 6;

inline constexpr std::size_t kMaxKeyLength = 64;
inline constexpr std::size_t kMaxValueLength = 64;
inline constexpr std::size_t kIndexWidth = 2;
inline constexpr std::size_t kKeyHeaderChars = kMaxKeyLength - kIndexWidth;
inline constexpr std::size_t kHeaderCharsPerSlot = kKeyHeaderChars + kMaxValueLength;

inline constexpr std::string_view kIndexAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
inline constexpr std::size_t kMaxSlots = kIndexAlphabet.size() * kIndexAlphabet.size();

inline constexpr char kCurrentVersion = '2';
inline constexpr char kLegacyVersion = '1';

inline constexpr std::string_view kSizeParam = "s";
inline constexpr std::string_view kChecksumParam = "c";
inline constexpr std::string_view kNameParam = "n";

inline constexpr std::string_view kDefaultMediaType = "application/octet-stream";
inline constexpr std::string_view kDefaultCliName = "CLI";

}  // namespace sep39::constants
