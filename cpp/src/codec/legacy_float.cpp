#include "codec/legacy_float.hpp"

#include <bit>
#include <cmath>

namespace MsBin::Codec {

uint32_t to_ieee_bits(const uint8_t *bytes4) {
  int32_t man = read_u16(bytes4 + 2);
  if (man == 0)
    return 0;

  // exponent byte rebiased, then shifted one bit right into the IEEE exponent
  // position; may go negative for tiny exponents (arithmetic shift keeps sign)
  int32_t exp = (man & 0xff00) - MBF_EXPONENT_REBIAS;
  man = (man & 0x7f) | ((man << 8) & 0x8000);
  man |= exp >> 1;

  return static_cast<uint32_t>(bytes4[0]) |
         (static_cast<uint32_t>(bytes4[1]) << 8) |
         (static_cast<uint32_t>(man & 0xff) << 16) |
         (static_cast<uint32_t>((man >> 8) & 0xff) << 24);
}

double decode(const uint8_t *bytes4) {
  uint32_t bits = to_ieee_bits(bytes4);
  if (bits == 0)
    return 0.0;
  return static_cast<double>(std::bit_cast<float>(bits));
}

namespace {

// Largest packed value either layout can hold; keeps the integer cast defined
constexpr double PACKED_DATE_LIMIT = 1.0e9;
constexpr double PACKED_TIME_LIMIT = 1.0e7;

bool in_packed_range(double value, double limit) {
  return std::isfinite(value) && value >= 0.0 && value < limit;
}

} // namespace

std::chrono::year_month_day float_to_date(double value) {
  if (!in_packed_range(value, PACKED_DATE_LIMIT))
    return std::chrono::year_month_day{};

  const int64_t packed = static_cast<int64_t>(value);
  const int year = 1900 + static_cast<int>(packed / 10000);
  const unsigned month = static_cast<unsigned>((packed % 10000) / 100);
  const unsigned day = static_cast<unsigned>(packed % 100);
  return std::chrono::year_month_day{std::chrono::year{year},
                                     std::chrono::month{month},
                                     std::chrono::day{day}};
}

std::optional<TimeOfDay> float_to_time(double value) {
  if (!in_packed_range(value, PACKED_TIME_LIMIT))
    return std::nullopt;

  const int64_t packed = static_cast<int64_t>(value);
  const int64_t hour = packed / 10000;
  const int64_t minute = (packed % 10000) / 100;
  if (hour > 23 || minute > 59)
    return std::nullopt;
  return TimeOfDay{std::chrono::hours{hour} + std::chrono::minutes{minute}};
}

std::chrono::year_month_day decode_date(const uint8_t *bytes4) {
  return float_to_date(decode(bytes4));
}

std::optional<TimeOfDay> decode_time(const uint8_t *bytes4) {
  return float_to_time(decode(bytes4));
}

std::chrono::year_month_day int_to_date(uint32_t value) {
  const int year = static_cast<int>(value / 10000);
  const unsigned month = (value % 10000) / 100;
  const unsigned day = value % 100;
  return std::chrono::year_month_day{std::chrono::year{year},
                                     std::chrono::month{month},
                                     std::chrono::day{day}};
}

} // namespace MsBin::Codec
