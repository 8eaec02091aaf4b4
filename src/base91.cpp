#include "sep39/base91.hpp"

#include <array>

namespace sep39::base91 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789!#$%&()*+,./:;<=>?@[]^_`{|}~\"";

constexpr std::uint32_t kRadix = 91;

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < kRadix; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(size + size / 4 + 2);
    std::uint32_t queue = 0;
    int bits = 0;
    for (std::size_t i = 0; i < size; ++i) {
        queue |= static_cast<std::uint32_t>(data[i]) << bits;
        bits += 8;
        if (bits > 13) {
            // 13 bits per pair unless that would leave an ambiguous low value.
            std::uint32_t value = queue & 8191;
            if (value > 88) {
                queue >>= 13;
                bits -= 13;
            } else {
                value = queue & 16383;
                queue >>= 14;
                bits -= 14;
            }
            out.push_back(kEncTable[value % kRadix]);
            out.push_back(kEncTable[value / kRadix]);
        }
    }
    if (bits > 0) {
        out.push_back(kEncTable[queue % kRadix]);
        if (bits > 7 || queue > 90) {
            out.push_back(kEncTable[queue / kRadix]);
        }
    }
    return out;
}

std::string Encode(const std::vector<std::uint8_t>& data) {
    return Encode(data.data(), data.size());
}

std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve(input.size());

    std::uint32_t queue = 0;
    int bits = 0;
    int pending = -1;
    for (unsigned char c : input) {
        std::uint8_t decoded = kDecTable[c];
        if (decoded == 0xFF) {
            success = false;
            break;
        }
        if (pending < 0) {
            pending = decoded;
            continue;
        }
        std::uint32_t value = static_cast<std::uint32_t>(pending) + decoded * kRadix;
        queue |= value << bits;
        bits += (value & 8191) > 88 ? 13 : 14;
        while (bits > 7) {
            out.push_back(static_cast<std::uint8_t>(queue & 0xFF));
            queue >>= 8;
            bits -= 8;
        }
        pending = -1;
    }
    if (success && pending >= 0) {
        out.push_back(static_cast<std::uint8_t>((queue | (static_cast<std::uint32_t>(pending) << bits)) & 0xFF));
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace sep39::base91
