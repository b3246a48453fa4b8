#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace MsBin::SymbolName {

constexpr char PREFIX_MARKER = '@'; // "@x" vendor marker, both characters dropped
constexpr size_t PREFIX_LENGTH = 2;
constexpr char DELIMITER = '#';     // everything from here on is dropped

// Fixed-width field -> string: cut at the first NUL, trim surrounding whitespace
std::string padded_string(const uint8_t *raw, size_t width);
std::string padded_string(const std::string &raw);

// MASTER / EMASTER symbol codes: padded_string, prefix strip, delimiter truncate
std::string normalize(const std::string &raw);
std::string normalize(const uint8_t *raw, size_t width);

} // namespace MsBin::SymbolName
