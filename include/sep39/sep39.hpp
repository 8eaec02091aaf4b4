#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sep39/constants.hpp"
#include "sep39/errors.hpp"
#include "sep39/frame.hpp"
#include "sep39/media.hpp"
#include "sep39/slots.hpp"

namespace sep39 {

using Bytes = std::vector<std::uint8_t>;
using media::MediaDescriptor;
using slots::Slot;

struct Decoded {
    std::vector<MediaDescriptor> descriptors;
    std::vector<Bytes> attachments;
};

struct EncodeStats {
    std::size_t original_size = 0;
    std::size_t slot_count = 0;
    std::size_t encoded_size = 0;
    double ratio = 0.0;
};

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size);
std::uint32_t Crc32(const Bytes& data);

// Packs `data` (every descriptor but the last must declare "s") into ledger
// slots. Throws sep39::Error on any violated precondition.
std::vector<Slot> Encode(const Bytes& data,
                         const std::vector<MediaDescriptor>& descriptors,
                         const frame::Revision& revision = frame::CurrentRevision());

// Inverse of Encode: splits the payload per descriptor and verifies every
// declared checksum. With no descriptors the whole payload is returned as a
// single attachment.
Decoded Decode(const std::vector<Slot>& slots, const frame::Revision& revision = frame::CurrentRevision());

// Picks the revision named by the version digit of the first slot.
frame::Revision DetectRevision(const std::vector<Slot>& slots);

EncodeStats ComputeStats(std::size_t original_size, const std::vector<Slot>& slots);

Bytes ReadFile(const std::string& path);
void WriteFile(const std::string& path, const Bytes& data);

}  // namespace sep39
