#include "sep39/rowfile.hpp"

#include "sep39/base64.hpp"
#include "sep39/sep39.hpp"

#include <stdexcept>

namespace sep39::rowfile {

std::string Format(const std::vector<slots::Slot>& slots) {
    std::string out;
    out.reserve(slots.size() * (constants::kMaxKeyLength + 90));
    for (const auto& slot : slots) {
        out += slot.key;
        out.push_back('\t');
        out += base64::Encode(slot.value);
        out.push_back('\n');
    }
    return out;
}

std::vector<slots::Slot> Parse(const std::string& text) {
    std::vector<slots::Slot> result;
    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        ++line_no;
        std::size_t end = text.find('\n', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(pos, end - pos);
        pos = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        std::size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            throw std::runtime_error("Malformed row file (line " + std::to_string(line_no) + " has no tab)");
        }
        bool ok = false;
        slots::Slot slot;
        slot.key = line.substr(0, tab);
        slot.value = base64::Decode(std::string_view(line).substr(tab + 1), &ok);
        if (!ok) {
            throw std::runtime_error("Malformed row file (line " + std::to_string(line_no) + " has invalid base64)");
        }
        result.push_back(std::move(slot));
    }
    if (result.empty()) {
        throw std::runtime_error("Row file contains no rows");
    }
    return result;
}

void Write(const std::string& path, const std::vector<slots::Slot>& slots) {
    std::string text = Format(slots);
    WriteFile(path, Bytes(text.begin(), text.end()));
}

std::vector<slots::Slot> Read(const std::string& path) {
    Bytes raw = ReadFile(path);
    return Parse(std::string(raw.begin(), raw.end()));
}

}  // namespace sep39::rowfile
