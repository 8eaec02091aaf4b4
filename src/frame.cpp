#include "sep39/frame.hpp"

#include "sep39/constants.hpp"
#include "sep39/errors.hpp"

namespace sep39::frame {

namespace {

bool IsDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

void CheckCap(std::size_t value) {
    if (value >= constants::kMaxPayloadSize) {
        throw Error(ErrorKind::InvalidLength,
                    "metadata length " + std::to_string(value) + " is not below "
                        + std::to_string(constants::kMaxPayloadSize));
    }
}

LengthField ParseFixed(std::string_view text, std::size_t offset) {
    if (offset + constants::kMaxLengthDigits > text.size()) {
        throw Error(ErrorKind::InvalidLength, "fixed-width length field is truncated");
    }
    LengthField field;
    field.width = constants::kMaxLengthDigits;
    for (std::size_t i = 0; i < field.width; ++i) {
        char ch = text[offset + i];
        if (!IsDigit(ch)) {
            throw Error(ErrorKind::InvalidLength,
                        std::string("non-digit '") + ch + "' in fixed-width length field");
        }
        field.value = field.value * 10 + static_cast<std::size_t>(ch - '0');
    }
    return field;
}

LengthField ParseSelfDelimiting(std::string_view text, std::size_t offset) {
    if (offset >= text.size() || !IsDigit(text[offset])) {
        throw Error(ErrorKind::InvalidLength, "length field does not start with a digit");
    }
    LengthField field;
    field.width = 1;
    if (text[offset] == '0') {
        // A leading zero is the whole field; whatever follows is payload.
        return field;
    }
    field.value = static_cast<std::size_t>(text[offset] - '0');
    while (field.width < constants::kMaxLengthDigits && offset + field.width < text.size()
           && IsDigit(text[offset + field.width])) {
        field.value = field.value * 10 + static_cast<std::size_t>(text[offset + field.width] - '0');
        ++field.width;
    }
    return field;
}

}  // namespace

bool operator==(const Revision& lhs, const Revision& rhs) {
    return lhs.version == rhs.version && lhs.framing == rhs.framing;
}

Revision CurrentRevision() {
    return Revision{constants::kCurrentVersion, LengthFraming::SelfDelimiting};
}

Revision LegacyRevision() {
    return Revision{constants::kLegacyVersion, LengthFraming::FixedWidth};
}

std::optional<Revision> RevisionFromDigit(char version) {
    if (version == constants::kCurrentVersion) {
        return CurrentRevision();
    }
    if (version == constants::kLegacyVersion) {
        return LegacyRevision();
    }
    return std::nullopt;
}

std::string BuildHeader(const std::string& metadata, const Revision& revision) {
    if (revision.framing != LengthFraming::SelfDelimiting) {
        throw Error(ErrorKind::InvalidFrame,
                    std::string("revision ") + revision.version + " can only be decoded");
    }
    if (metadata.size() >= constants::kMaxPayloadSize) {
        throw Error(ErrorKind::PayloadTooLarge,
                    "metadata is " + std::to_string(metadata.size()) + " characters, limit is "
                        + std::to_string(constants::kMaxPayloadSize - 1));
    }
    if (!metadata.empty() && IsDigit(metadata.front())) {
        throw Error(ErrorKind::InvalidDescriptor, "metadata may not begin with a digit");
    }
    std::string header;
    header.reserve(1 + constants::kMaxLengthDigits + metadata.size());
    header.push_back(revision.version);
    header += std::to_string(metadata.size());
    header += metadata;
    return header;
}

LengthField ParseLength(std::string_view text, std::size_t offset, const Revision& revision) {
    LengthField field = revision.framing == LengthFraming::FixedWidth ? ParseFixed(text, offset)
                                                                       : ParseSelfDelimiting(text, offset);
    CheckCap(field.value);
    return field;
}

}  // namespace sep39::frame
