#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sep39::media {

using Param = std::pair<std::string, std::string>;

// One attachment's media type plus its parameters, kept in insertion order.
// Reserved keys: "s" (byte size) and "c" (CRC32), both decimal.
struct MediaDescriptor {
    std::string type;
    std::vector<Param> params;

    MediaDescriptor() = default;
    explicit MediaDescriptor(std::string type_subtype, std::vector<Param> parameters = {});

    bool Has(std::string_view key) const;
    std::optional<std::string> Get(std::string_view key) const;
    void Set(std::string_view key, std::string value);
};

bool operator==(const MediaDescriptor& lhs, const MediaDescriptor& rhs);
bool operator!=(const MediaDescriptor& lhs, const MediaDescriptor& rhs);

std::string Render(const std::vector<MediaDescriptor>& descriptors);
std::vector<MediaDescriptor> Parse(const std::string& metadata);

std::optional<std::size_t> ParseSize(std::string_view text);
std::optional<std::uint32_t> ParseChecksum(std::string_view text);

}  // namespace sep39::media
