#include "index/symbol_name.hpp"

#include <cctype>

namespace MsBin::SymbolName {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string padded_string(const std::string &raw) {
  std::string value = raw.substr(0, raw.find('\0'));

  size_t begin = 0;
  while (begin < value.size() && is_space(value[begin]))
    ++begin;
  size_t end = value.size();
  while (end > begin && is_space(value[end - 1]))
    --end;
  return value.substr(begin, end - begin);
}

std::string padded_string(const uint8_t *raw, size_t width) {
  return padded_string(std::string(reinterpret_cast<const char *>(raw), width));
}

std::string normalize(const std::string &raw) {
  std::string name = padded_string(raw);
  if (name.empty())
    return name;

  size_t begin = (name[0] == PREFIX_MARKER) ? PREFIX_LENGTH : 0;
  // the delimiter is searched in the whole name, marker included
  size_t end = name.find(DELIMITER);
  if (end == std::string::npos)
    end = name.size();
  if (end <= begin)
    return std::string();
  // whitespace next to the marker or the delimiter is not part of the code
  return padded_string(name.substr(begin, end - begin));
}

std::string normalize(const uint8_t *raw, size_t width) {
  return normalize(std::string(reinterpret_cast<const char *>(raw), width));
}

} // namespace MsBin::SymbolName
