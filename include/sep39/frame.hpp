#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "sep39/constants.hpp"

namespace sep39::frame {

enum class LengthFraming {
    SelfDelimiting,
    FixedWidth,
};

// A wire revision: the version digit that follows the first slot index and
// the way the metadata length is written after it.
struct Revision {
    char version = constants::kCurrentVersion;
    LengthFraming framing = LengthFraming::SelfDelimiting;
};

bool operator==(const Revision& lhs, const Revision& rhs);

Revision CurrentRevision();
// Fixed 6-digit zero-padded length. Decode only.
Revision LegacyRevision();
std::optional<Revision> RevisionFromDigit(char version);

struct LengthField {
    std::size_t value = 0;
    std::size_t width = 0;
};

// version || length || metadata
std::string BuildHeader(const std::string& metadata, const Revision& revision);

// Reads the length field of `text` starting at `offset`.
LengthField ParseLength(std::string_view text, std::size_t offset, const Revision& revision);

}  // namespace sep39::frame
