#pragma once

#include "define/Dtype.hpp"
#include "define/Status.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace MsBin::Codec {

// ============================================================================
// COLUMN SLOTS
// ============================================================================

enum class ColumnKind : uint8_t {
  Date,    // MBF packed YYYMMDD
  Time,    // MBF packed HHMM
  Price,   // MBF, fixed-point text at the registry precision
  Integer  // MBF truncated toward zero
};

struct KnownColumn {
  std::string token;        // on-disk token, e.g. "VOL"
  std::string display_name; // output key, e.g. "Volume"
  ColumnKind kind;
  size_t width;
};

struct UnrecognizedColumn {
  std::string token;
  size_t width;
};

using ColumnSlot = std::variant<KnownColumn, UnrecognizedColumn>;

using ColumnValue = std::variant<double, int64_t,
                                 std::chrono::year_month_day,
                                 std::chrono::hh_mm_ss<std::chrono::minutes>>;

inline size_t slot_width(const ColumnSlot &slot) {
  return std::visit([](const auto &column) { return column.width; }, slot);
}

// ============================================================================
// REGISTRY
// ============================================================================

class ColumnRegistry {
public:
  static constexpr int DEFAULT_PRECISION = 2;
  static constexpr size_t DEFAULT_COLUMN_WIDTH = 4; // known and unknown columns alike

  explicit ColumnRegistry(int precision = DEFAULT_PRECISION);

  int precision() const { return precision_; }

  ColumnSlot slot_for(const std::string &token) const;
  std::vector<ColumnSlot> slots_for(const ColumnLayout &layout) const;

  // Bytes consumed by one stored record of this layout
  size_t record_width(const ColumnLayout &layout) const;

  // Decode one field; impossible dates/times or out-of-range integers are Decode errors
  Status decode(const KnownColumn &column, const uint8_t *bytes, ColumnValue &value) const;
  std::string format(const KnownColumn &column, const ColumnValue &value) const;

  // decode + format
  Status read_field(const KnownColumn &column, const uint8_t *bytes, std::string &text) const;

  static const std::vector<KnownColumn> &known_columns();

private:
  int precision_;
};

} // namespace MsBin::Codec
