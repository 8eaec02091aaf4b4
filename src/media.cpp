#include "sep39/media.hpp"

#include "sep39/constants.hpp"
#include "sep39/errors.hpp"

#include <cstdint>
#include <limits>

namespace sep39::media {

namespace {

bool IsTokenChar(char ch) {
    // printable ASCII minus space and the three separators
    return ch > ' ' && ch < 0x7F && ch != '=' && ch != ';' && ch != ',';
}

void CheckToken(std::string_view token, std::string_view what, bool allow_empty) {
    if (token.empty() && !allow_empty) {
        throw Error(ErrorKind::InvalidDescriptor, std::string(what) + " is empty");
    }
    for (char ch : token) {
        if (!IsTokenChar(ch)) {
            throw Error(ErrorKind::InvalidDescriptor,
                        std::string(what) + " '" + std::string(token) + "' contains a forbidden character");
        }
    }
}

std::optional<std::uint64_t> ParseDecimal(std::string_view text, std::uint64_t max_value) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(ch - '0');
        if (value > max_value) {
            return std::nullopt;
        }
    }
    return value;
}

}  // namespace

MediaDescriptor::MediaDescriptor(std::string type_subtype, std::vector<Param> parameters)
    : type(std::move(type_subtype)), params(std::move(parameters)) {}

bool MediaDescriptor::Has(std::string_view key) const {
    return Get(key).has_value();
}

std::optional<std::string> MediaDescriptor::Get(std::string_view key) const {
    for (const auto& param : params) {
        if (param.first == key) {
            return param.second;
        }
    }
    return std::nullopt;
}

void MediaDescriptor::Set(std::string_view key, std::string value) {
    for (auto& param : params) {
        if (param.first == key) {
            param.second = std::move(value);
            return;
        }
    }
    params.emplace_back(std::string(key), std::move(value));
}

bool operator==(const MediaDescriptor& lhs, const MediaDescriptor& rhs) {
    return lhs.type == rhs.type && lhs.params == rhs.params;
}

bool operator!=(const MediaDescriptor& lhs, const MediaDescriptor& rhs) {
    return !(lhs == rhs);
}

std::string Render(const std::vector<MediaDescriptor>& descriptors) {
    std::string out;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const MediaDescriptor& descriptor = descriptors[i];
        CheckToken(descriptor.type, "media type", false);
        if (i > 0) {
            out.push_back(',');
        }
        out += descriptor.type;
        for (const auto& param : descriptor.params) {
            CheckToken(param.first, "parameter key", false);
            CheckToken(param.second, "parameter value", true);
            out.push_back(';');
            out += param.first;
            out.push_back('=');
            out += param.second;
        }
    }
    return out;
}

std::vector<MediaDescriptor> Parse(const std::string& metadata) {
    std::vector<MediaDescriptor> result;
    if (metadata.empty()) {
        return result;
    }
    std::size_t group_start = 0;
    while (group_start <= metadata.size()) {
        std::size_t group_end = metadata.find(',', group_start);
        if (group_end == std::string::npos) {
            group_end = metadata.size();
        }
        std::string_view group(metadata.data() + group_start, group_end - group_start);

        std::size_t seg_end = group.find(';');
        MediaDescriptor descriptor;
        descriptor.type = std::string(group.substr(0, seg_end));
        if (descriptor.type.empty()) {
            throw Error(ErrorKind::MalformedMetadata,
                        "empty media type at offset " + std::to_string(group_start));
        }
        while (seg_end != std::string_view::npos) {
            std::size_t next = group.find(';', seg_end + 1);
            std::string_view segment = group.substr(seg_end + 1,
                                                    next == std::string_view::npos ? std::string_view::npos
                                                                                   : next - seg_end - 1);
            std::size_t eq = segment.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                throw Error(ErrorKind::MalformedMetadata,
                            "parameter '" + std::string(segment) + "' is not key=value");
            }
            std::string key(segment.substr(0, eq));
            if (descriptor.Has(key)) {
                throw Error(ErrorKind::MalformedMetadata, "duplicate parameter '" + key + "'");
            }
            descriptor.params.emplace_back(std::move(key), std::string(segment.substr(eq + 1)));
            seg_end = next;
        }
        result.push_back(std::move(descriptor));
        group_start = group_end + 1;
    }
    return result;
}

std::optional<std::size_t> ParseSize(std::string_view text) {
    auto value = ParseDecimal(text, constants::kMaxPayloadSize - 1);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*value);
}

std::optional<std::uint32_t> ParseChecksum(std::string_view text) {
    auto value = ParseDecimal(text, std::numeric_limits<std::uint32_t>::max());
    if (!value) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*value);
}

}  // namespace sep39::media
