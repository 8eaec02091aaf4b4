#include "sep39/slots.hpp"

#include "sep39/base91.hpp"
#include "sep39/constants.hpp"
#include "sep39/errors.hpp"

#include <algorithm>

namespace sep39::slots {

namespace {

using constants::kHeaderCharsPerSlot;
using constants::kIndexWidth;
using constants::kKeyHeaderChars;
using constants::kMaxKeyLength;
using constants::kMaxValueLength;

// `offset_index` also admits the header character offset of the slot, which
// revision 1 writers used for header rows after the first.
void CheckSlot(const Slot& slot, std::size_t position, bool offset_index) {
    if (slot.key.size() > kMaxKeyLength || slot.value.size() > kMaxValueLength) {
        throw Error(ErrorKind::InvalidFrame,
                    "slot " + std::to_string(position) + " is " + std::to_string(slot.key.size()) + "/"
                        + std::to_string(slot.value.size()) + " units wide, limit is 64/64");
    }
    auto index = DecodeIndex(slot.key);
    bool matches = index && (*index == position || (offset_index && *index == position * kHeaderCharsPerSlot));
    if (!matches) {
        throw Error(ErrorKind::InvalidFrame,
                    "slot " + std::to_string(position) + " has index '" + slot.key.substr(0, kIndexWidth)
                        + "', expected '" + EncodeIndex(position) + "'");
    }
}

// Header character `pos` lives in slot pos / 126: the first 62 characters of
// each slot sit in the key after the index, the next 64 in the value.
void ReadHeader(const std::vector<Slot>& slots, std::size_t begin, std::size_t end, std::string& out) {
    std::size_t pos = begin;
    while (pos < end) {
        std::size_t slot_index = pos / kHeaderCharsPerSlot;
        std::size_t within = pos % kHeaderCharsPerSlot;
        if (slot_index >= slots.size()) {
            throw Error(ErrorKind::TruncatedMetadata,
                        "header needs " + std::to_string(end) + " characters, slots end after "
                            + std::to_string(pos));
        }
        const Slot& slot = slots[slot_index];
        std::size_t take = 0;
        if (within < kKeyHeaderChars) {
            take = std::min(kKeyHeaderChars - within, end - pos);
            std::size_t from = kIndexWidth + within;
            if (slot.key.size() < from + take) {
                throw Error(ErrorKind::TruncatedMetadata,
                            "slot " + std::to_string(slot_index) + " key ends inside the header");
            }
            out.append(slot.key, from, take);
        } else {
            std::size_t from = within - kKeyHeaderChars;
            take = std::min(kMaxValueLength - from, end - pos);
            if (slot.value.size() < from + take) {
                throw Error(ErrorKind::TruncatedMetadata,
                            "slot " + std::to_string(slot_index) + " value ends inside the header");
            }
            out.append(slot.value.begin() + static_cast<std::ptrdiff_t>(from),
                       slot.value.begin() + static_cast<std::ptrdiff_t>(from + take));
        }
        pos += take;
    }
}

void AppendBinary(const Slot& slot, std::size_t position, std::size_t key_offset, std::size_t value_offset,
                  Bytes& out) {
    if (slot.key.size() > key_offset) {
        bool ok = false;
        Bytes decoded = base91::Decode(std::string_view(slot.key).substr(key_offset), &ok);
        if (!ok) {
            throw Error(ErrorKind::InvalidEncoding,
                        "slot " + std::to_string(position) + " key is not valid basE91");
        }
        out.insert(out.end(), decoded.begin(), decoded.end());
    }
    if (slot.value.size() > value_offset) {
        out.insert(out.end(), slot.value.begin() + static_cast<std::ptrdiff_t>(value_offset), slot.value.end());
    }
}

}  // namespace

bool operator==(const Slot& lhs, const Slot& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

std::string EncodeIndex(std::size_t index) {
    const std::size_t radix = constants::kIndexAlphabet.size();
    if (index >= constants::kMaxSlots) {
        throw Error(ErrorKind::PayloadTooLarge,
                    "slot " + std::to_string(index) + " is past the last index "
                        + std::to_string(constants::kMaxSlots - 1));
    }
    std::string out(kIndexWidth, '0');
    out[0] = constants::kIndexAlphabet[index / radix];
    out[1] = constants::kIndexAlphabet[index % radix];
    return out;
}

std::optional<std::size_t> DecodeIndex(std::string_view key) {
    if (key.size() < kIndexWidth) {
        return std::nullopt;
    }
    std::size_t hi = constants::kIndexAlphabet.find(key[0]);
    std::size_t lo = constants::kIndexAlphabet.find(key[1]);
    if (hi == std::string_view::npos || lo == std::string_view::npos) {
        return std::nullopt;
    }
    return hi * constants::kIndexAlphabet.size() + lo;
}

FitResult FitNearest(const Bytes& data, std::size_t offset, std::size_t budget) {
    FitResult result;
    if (offset >= data.size()) {
        return result;
    }
    // ceil(budget / 1.1)
    std::size_t candidate = std::min((budget * 10 + 10) / 11, data.size() - offset);
    for (; candidate > 0; --candidate) {
        std::string encoded = base91::Encode(data.data() + offset, candidate);
        if (encoded.size() <= budget) {
            result.encoded = std::move(encoded);
            result.consumed = candidate;
            break;
        }
    }
    return result;
}

std::vector<Slot> Pack(const std::string& header, const Bytes& data) {
    std::vector<Slot> slots;
    for (std::size_t pos = 0; pos < header.size(); pos += kHeaderCharsPerSlot) {
        Slot slot;
        slot.key = EncodeIndex(slots.size()) + header.substr(pos, kKeyHeaderChars);
        if (pos + kKeyHeaderChars < header.size()) {
            std::string rest = header.substr(pos + kKeyHeaderChars, kMaxValueLength);
            slot.value.assign(rest.begin(), rest.end());
        }
        slots.push_back(std::move(slot));
    }

    std::size_t offset = 0;
    if (!slots.empty()) {
        Slot& last = slots.back();
        FitResult fit = FitNearest(data, offset, kMaxKeyLength - last.key.size());
        last.key += fit.encoded;
        offset += fit.consumed;
        std::size_t take = std::min(kMaxValueLength - last.value.size(), data.size() - offset);
        last.value.insert(last.value.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
                          data.begin() + static_cast<std::ptrdiff_t>(offset + take));
        offset += take;
    }

    while (offset < data.size()) {
        Slot slot;
        slot.key = EncodeIndex(slots.size());
        FitResult fit = FitNearest(data, offset, kMaxKeyLength - kIndexWidth);
        slot.key += fit.encoded;
        offset += fit.consumed;
        std::size_t take = std::min(kMaxValueLength, data.size() - offset);
        slot.value.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                          data.begin() + static_cast<std::ptrdiff_t>(offset + take));
        offset += take;
        slots.push_back(std::move(slot));
    }
    return slots;
}

Unpacked Unpack(const std::vector<Slot>& slots, const frame::Revision& revision) {
    if (slots.empty()) {
        throw Error(ErrorKind::InvalidFrame, "no slots to decode");
    }
    CheckSlot(slots.front(), 0, false);

    const std::string& first = slots.front().key;
    std::string prefix = EncodeIndex(0) + revision.version;
    if (first.compare(0, prefix.size(), prefix) != 0) {
        throw Error(ErrorKind::InvalidFrame,
                    "first key starts with '" + first.substr(0, prefix.size()) + "', expected '" + prefix + "'");
    }

    frame::LengthField length = frame::ParseLength(first, prefix.size(), revision);
    Unpacked result;
    std::size_t metadata_begin = 1 + length.width;
    result.header_length = metadata_begin + length.value;
    bool legacy = revision.framing == frame::LengthFraming::FixedWidth;
    std::size_t header_slots = (result.header_length + kHeaderCharsPerSlot - 1) / kHeaderCharsPerSlot;
    for (std::size_t i = 1; i < slots.size(); ++i) {
        CheckSlot(slots[i], i, legacy && i < header_slots);
    }
    result.metadata.reserve(length.value);
    ReadHeader(slots, metadata_begin, result.header_length, result.metadata);

    // The encoder topped off the slot holding the header's end; if the header
    // filled its last slot exactly, the payload starts on a fresh slot.
    std::size_t start = result.header_length / kHeaderCharsPerSlot;
    std::size_t used = result.header_length % kHeaderCharsPerSlot;
    for (std::size_t i = start; i < slots.size(); ++i) {
        std::size_t key_offset = kIndexWidth;
        std::size_t value_offset = 0;
        if (i == start) {
            key_offset += std::min(used, kKeyHeaderChars);
            value_offset = used > kKeyHeaderChars ? used - kKeyHeaderChars : 0;
        }
        AppendBinary(slots[i], i, key_offset, value_offset, result.payload);
    }
    return result;
}

}  // namespace sep39::slots
