#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sep39/frame.hpp"

namespace sep39::slots {

using Bytes = std::vector<std::uint8_t>;

// One ledger name/value entry. Both sides are capped at 64 units.
struct Slot {
    std::string key;
    Bytes value;
};

bool operator==(const Slot& lhs, const Slot& rhs);

struct FitResult {
    std::string encoded;
    std::size_t consumed = 0;
};

std::string EncodeIndex(std::size_t index);
std::optional<std::size_t> DecodeIndex(std::string_view key);

// basE91-encodes the longest prefix of data[offset..] whose encoding fits in
// `budget` characters. The scan starts at ceil(budget / 1.1) bytes, which no
// basE91 output can beat, and steps down to zero, so it runs at most that
// many trials. Returns an empty encoding when not even one byte fits.
FitResult FitNearest(const Bytes& data, std::size_t offset, std::size_t budget);

// Lays `header` out as plain text (62 chars in the key after the index, 64 in
// the value per slot) and then the payload: basE91 text in spare key space,
// raw bytes in spare value space.
std::vector<Slot> Pack(const std::string& header, const Bytes& data);

struct Unpacked {
    std::string metadata;
    Bytes payload;
    std::size_t header_length = 0;
};

// Exact inverse of Pack for a header produced with `revision`.
Unpacked Unpack(const std::vector<Slot>& slots, const frame::Revision& revision);

}  // namespace sep39::slots
