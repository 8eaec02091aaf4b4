#include "sep39/sep39.hpp"

#include <zlib.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace sep39 {

namespace {

struct Span {
    std::size_t offset = 0;
    std::size_t size = 0;
};

// Works out where each attachment lives in a payload of `total` bytes.
// `on_decode` selects the error kinds reported for bad parameters.
std::vector<Span> LayoutAttachments(const std::vector<MediaDescriptor>& descriptors,
                                    std::size_t total,
                                    bool on_decode) {
    std::vector<Span> spans;
    if (descriptors.empty()) {
        spans.push_back(Span{0, total});
        return spans;
    }
    ErrorKind bad_param = on_decode ? ErrorKind::MalformedMetadata : ErrorKind::InvalidDescriptor;
    std::size_t offset = 0;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const MediaDescriptor& descriptor = descriptors[i];
        bool last = i + 1 == descriptors.size();
        auto declared = descriptor.Get(constants::kSizeParam);
        std::size_t remaining = total - offset;
        if (!declared) {
            if (!last) {
                if (on_decode) {
                    throw Error(ErrorKind::AttachmentCountMismatch,
                                "attachment " + std::to_string(i) + " of " + std::to_string(descriptors.size())
                                    + " has no size parameter");
                }
                throw Error(ErrorKind::MissingSizeParameter,
                            "attachment " + std::to_string(i) + " (" + descriptor.type + ") needs s=<bytes>");
            }
            spans.push_back(Span{offset, remaining});
            offset = total;
            continue;
        }
        auto size = media::ParseSize(*declared);
        if (!size) {
            throw Error(bad_param, "size '" + *declared + "' of attachment " + std::to_string(i) + " is not valid");
        }
        if (*size > remaining) {
            throw Error(ErrorKind::AttachmentCountMismatch,
                        "attachment " + std::to_string(i) + " declares " + std::to_string(*size) + " bytes, only "
                            + std::to_string(remaining) + " remain");
        }
        spans.push_back(Span{offset, *size});
        offset += *size;
    }
    if (offset != total) {
        throw Error(ErrorKind::AttachmentCountMismatch,
                    "attachments cover " + std::to_string(offset) + " of " + std::to_string(total) + " bytes");
    }
    return spans;
}

void VerifyChecksums(const std::vector<MediaDescriptor>& descriptors,
                     const std::vector<Span>& spans,
                     const Bytes& data,
                     bool on_decode) {
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        auto declared = descriptors[i].Get(constants::kChecksumParam);
        if (!declared) {
            continue;
        }
        auto expected = media::ParseChecksum(*declared);
        if (!expected) {
            throw Error(on_decode ? ErrorKind::MalformedMetadata : ErrorKind::InvalidDescriptor,
                        "checksum '" + *declared + "' of attachment " + std::to_string(i) + " is not valid");
        }
        std::uint32_t actual = Crc32(data.data() + spans[i].offset, spans[i].size);
        if (actual != *expected) {
            throw Error(ErrorKind::ChecksumMismatch,
                        "attachment " + std::to_string(i) + ": expected " + std::to_string(*expected) + " got "
                            + std::to_string(actual));
        }
    }
}

}  // namespace

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, data, chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t Crc32(const Bytes& data) {
    return Crc32(data.data(), data.size());
}

std::vector<Slot> Encode(const Bytes& data,
                         const std::vector<MediaDescriptor>& descriptors,
                         const frame::Revision& revision) {
    if (data.size() >= constants::kMaxPayloadSize) {
        throw Error(ErrorKind::PayloadTooLarge,
                    std::to_string(data.size()) + " bytes, limit is " + std::to_string(constants::kMaxPayloadSize - 1));
    }
    std::string metadata = media::Render(descriptors);
    auto spans = LayoutAttachments(descriptors, data.size(), false);
    VerifyChecksums(descriptors, spans, data, false);
    return slots::Pack(frame::BuildHeader(metadata, revision), data);
}

Decoded Decode(const std::vector<Slot>& slots, const frame::Revision& revision) {
    slots::Unpacked unpacked = slots::Unpack(slots, revision);
    Decoded decoded;
    decoded.descriptors = media::Parse(unpacked.metadata);
    auto spans = LayoutAttachments(decoded.descriptors, unpacked.payload.size(), true);
    VerifyChecksums(decoded.descriptors, spans, unpacked.payload, true);
    decoded.attachments.reserve(spans.size());
    for (const Span& span : spans) {
        auto begin = unpacked.payload.begin() + static_cast<std::ptrdiff_t>(span.offset);
        decoded.attachments.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(span.size));
    }
    return decoded;
}

frame::Revision DetectRevision(const std::vector<Slot>& slots) {
    if (slots.empty() || slots.front().key.size() <= constants::kIndexWidth) {
        throw Error(ErrorKind::InvalidFrame, "no version digit to read");
    }
    char version = slots.front().key[constants::kIndexWidth];
    auto revision = frame::RevisionFromDigit(version);
    if (!revision) {
        throw Error(ErrorKind::InvalidFrame, std::string("unknown wire revision '") + version + "'");
    }
    return *revision;
}

EncodeStats ComputeStats(std::size_t original_size, const std::vector<Slot>& slots) {
    EncodeStats stats;
    stats.original_size = original_size;
    stats.slot_count = slots.size();
    for (const Slot& slot : slots) {
        stats.encoded_size += slot.key.size() + slot.value.size();
    }
    if (original_size > 0) {
        stats.ratio = static_cast<double>(stats.encoded_size) / static_cast<double>(original_size);
    }
    return stats;
}

Bytes ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to read file size: " + path);
    }
    input.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw std::runtime_error("Failed to read file: " + path);
        }
    }
    return data;
}

void WriteFile(const std::string& path, const Bytes& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!output) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

}  // namespace sep39
