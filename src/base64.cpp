#include "sep39/base64.hpp"

#include <array>

namespace sep39::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kPad = '=';

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        for (int shift = 18; shift >= 0; shift -= 6) {
            out.push_back(kEncTable[(triple >> shift) & 0x3F]);
        }
    }
    std::size_t tail = data.size() - i;
    if (tail > 0) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        if (tail == 2) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(tail == 2 ? kEncTable[(triple >> 6) & 0x3F] : kPad);
        out.push_back(kPad);
    }
    return out;
}

// Row files are machine written, so whitespace and data after padding are
// treated as corruption rather than skipped.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    bool success = input.size() % 4 == 0;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    std::uint32_t val = 0;
    int valb = -8;
    std::size_t padding = 0;
    for (std::size_t i = 0; success && i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == kPad) {
            ++padding;
            success = padding <= 2 && i + 2 >= input.size();
            continue;
        }
        std::uint8_t decoded = kDecTable[c];
        if (decoded == 0xFF || padding > 0) {
            success = false;
            break;
        }
        val = ((val << 6) | decoded) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace sep39::base64
