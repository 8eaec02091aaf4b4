#pragma once

#include <string>
#include <vector>

#include "sep39/slots.hpp"

namespace sep39::rowfile {

// One slot per line: <key> TAB <base64(value)>.
std::string Format(const std::vector<slots::Slot>& slots);
std::vector<slots::Slot> Parse(const std::string& text);

void Write(const std::string& path, const std::vector<slots::Slot>& slots);
std::vector<slots::Slot> Read(const std::string& path);

}  // namespace sep39::rowfile
