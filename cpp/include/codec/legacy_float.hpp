#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace MsBin::Codec {

// ============================================================================
// LITTLE-ENDIAN PRIMITIVES
// ============================================================================

inline uint8_t read_u8(const uint8_t *b) { return b[0]; }

inline uint16_t read_u16(const uint8_t *b) {
  return static_cast<uint16_t>(static_cast<uint16_t>(b[0]) |
                               (static_cast<uint16_t>(b[1]) << 8));
}

inline uint32_t read_u32(const uint8_t *b) {
  return static_cast<uint32_t>(b[0]) |
         (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

// ============================================================================
// MICROSOFT BINARY FORMAT (MBF) 32-BIT FLOAT
// ============================================================================
//
// byte:   0        1        2              3
// MBF:    mant_lo  mant_mid sign|mant_hi7  exponent (bias 129)
// IEEE:   mant_lo  mant_mid exp_lo|mant7   sign|exp_hi7 (bias 127)
//
// Bytes 2..3 form the "mantissa word". A zero mantissa word is 0.0 whatever
// the two low bytes hold.

constexpr int32_t MBF_EXPONENT_REBIAS = 0x0200; // (129 - 127) << 8

double decode(const uint8_t *bytes4);

// Reconstructed IEEE single-precision bit pattern (0 for the zero short-circuit)
uint32_t to_ieee_bits(const uint8_t *bytes4);

using TimeOfDay = std::chrono::hh_mm_ss<std::chrono::minutes>;

// Packed YYYMMDD with a 1900 year offset (e.g. 1230115 -> 2023-01-15).
// Values that cannot be a packed date yield a date with ok() == false.
std::chrono::year_month_day decode_date(const uint8_t *bytes4);

// Packed HHMM.. (e.g. 93000 -> 09:30); nullopt unless 00:00 <= t <= 23:59
std::optional<TimeOfDay> decode_time(const uint8_t *bytes4);

// Derivations on an already decoded value
std::chrono::year_month_day float_to_date(double value);
std::optional<TimeOfDay> float_to_time(double value);

// Plain 32-bit YYYYMMDD integer (cross-reference index); no MBF involved
std::chrono::year_month_day int_to_date(uint32_t value);

} // namespace MsBin::Codec
