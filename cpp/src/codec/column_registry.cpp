#include "codec/column_registry.hpp"
#include "codec/legacy_float.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace MsBin::Codec {

const std::vector<KnownColumn> &ColumnRegistry::known_columns() {
  static const std::vector<KnownColumn> columns = {
      {"DATE", "Date", ColumnKind::Date, DEFAULT_COLUMN_WIDTH},
      {"TIME", "Time", ColumnKind::Time, DEFAULT_COLUMN_WIDTH},
      {"OPEN", "Open", ColumnKind::Price, DEFAULT_COLUMN_WIDTH},
      {"HIGH", "High", ColumnKind::Price, DEFAULT_COLUMN_WIDTH},
      {"LOW", "Low", ColumnKind::Price, DEFAULT_COLUMN_WIDTH},
      {"CLOSE", "Close", ColumnKind::Price, DEFAULT_COLUMN_WIDTH},
      {"VOL", "Volume", ColumnKind::Integer, DEFAULT_COLUMN_WIDTH},
      {"OI", "Oi", ColumnKind::Integer, DEFAULT_COLUMN_WIDTH},
  };
  return columns;
}

ColumnRegistry::ColumnRegistry(int precision) : precision_(precision) {
  if (precision_ < 0) {
    throw std::invalid_argument("Decimal precision must be non-negative: " + std::to_string(precision_));
  }
}

ColumnSlot ColumnRegistry::slot_for(const std::string &token) const {
  for (const auto &column : known_columns()) {
    if (column.token == token)
      return column;
  }
  return UnrecognizedColumn{token, DEFAULT_COLUMN_WIDTH};
}

std::vector<ColumnSlot> ColumnRegistry::slots_for(const ColumnLayout &layout) const {
  std::vector<ColumnSlot> slots;
  slots.reserve(layout.size());
  for (const auto &token : layout) {
    slots.push_back(slot_for(token));
  }
  return slots;
}

size_t ColumnRegistry::record_width(const ColumnLayout &layout) const {
  size_t width = 0;
  for (const auto &token : layout) {
    width += slot_width(slot_for(token));
  }
  return width;
}

Status ColumnRegistry::decode(const KnownColumn &column, const uint8_t *bytes, ColumnValue &value) const {
  switch (column.kind) {
  case ColumnKind::Date: {
    auto date = decode_date(bytes);
    if (!date.ok()) {
      return Status::Decode(column.token + ": invalid packed date " + std::to_string(Codec::decode(bytes)));
    }
    value = date;
    return Status::Ok();
  }
  case ColumnKind::Time: {
    auto time = decode_time(bytes);
    if (!time) {
      return Status::Decode(column.token + ": invalid packed time " + std::to_string(Codec::decode(bytes)));
    }
    value = *time;
    return Status::Ok();
  }
  case ColumnKind::Price:
    value = Codec::decode(bytes);
    return Status::Ok();
  case ColumnKind::Integer: {
    double raw = Codec::decode(bytes);
    // 2^63 bound keeps the truncation defined
    if (!std::isfinite(raw) || std::fabs(raw) >= 9.2e18) {
      return Status::Decode(column.token + ": value out of integer range");
    }
    value = static_cast<int64_t>(raw);
    return Status::Ok();
  }
  }
  return Status::Decode("unhandled column kind for " + column.token);
}

std::string ColumnRegistry::format(const KnownColumn &column, const ColumnValue &value) const {
  std::ostringstream oss;
  switch (column.kind) {
  case ColumnKind::Date: {
    const auto &ymd = std::get<std::chrono::year_month_day>(value);
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
        << std::setw(2) << static_cast<unsigned>(ymd.month())
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    break;
  }
  case ColumnKind::Time: {
    // HHMMSS: a packed time has no seconds, so they are always 00
    const auto &hms = std::get<TimeOfDay>(value);
    oss << std::setfill('0') << std::setw(2) << hms.hours().count()
        << std::setw(2) << hms.minutes().count() << "00";
    break;
  }
  case ColumnKind::Price:
    oss << std::fixed << std::setprecision(precision_) << std::get<double>(value);
    break;
  case ColumnKind::Integer:
    oss << std::get<int64_t>(value);
    break;
  }
  return oss.str();
}

Status ColumnRegistry::read_field(const KnownColumn &column, const uint8_t *bytes, std::string &text) const {
  ColumnValue value;
  Status status = decode(column, bytes, value);
  if (!status.ok())
    return status;
  text = format(column, value);
  return Status::Ok();
}

} // namespace MsBin::Codec
