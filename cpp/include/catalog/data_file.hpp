#pragma once

#include "codec/column_registry.hpp"
#include "define/Dtype.hpp"
#include "define/Status.hpp"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace MsBin::Data {

constexpr const char *SYMBOL_KEY = "Symbol";
constexpr size_t HEADER_COUNTS_SIZE = 4; // uint16 max records + uint16 last record

// ============================================================================
// DATA FILE READER (F<n>.DAT / F<n>.MWD)
// ============================================================================
//
// Layout:
//   [u16 max_records][u16 last_record][padding (fields - 1) * 4]
//   (last_record - 1) x [column 0][column 1]...
//
// The padding size is empirical; it matches the files seen so far but is not
// documented by the vendor.
//
// Forward-only: next() yields one record per stored tick until the declared
// count is exhausted or an error occurs. Reopen to restart.

class DataFileReader {
public:
  explicit DataFileReader(const Codec::ColumnRegistry &registry);
  ~DataFileReader();

  DataFileReader(const DataFileReader &) = delete;
  DataFileReader &operator=(const DataFileReader &) = delete;

  Status open(const SymbolMetadata &symbol, const ColumnLayout &layout);

  // false at end of stream or on error; check status() to tell them apart
  bool next(DecodedRecord &record);

  void close();

  const Status &status() const { return status_; }
  bool is_open() const { return file_.is_open(); }
  uint16_t max_records() const { return max_records_; }
  uint16_t last_record() const { return last_record_; }
  size_t expected_records() const { return expected_records_; }
  size_t records_read() const { return records_read_; }
  size_t record_width() const { return record_width_; }
  size_t header_size() const { return header_size_; }

  static size_t header_padding(size_t field_count);

private:
  Status fail(Status status);

  const Codec::ColumnRegistry &registry_;
  std::ifstream file_;
  Status status_;
  std::string symbol_code_;
  std::string path_;
  std::vector<Codec::ColumnSlot> slots_;
  std::vector<uint8_t> record_buffer_;
  uint16_t max_records_ = 0;
  uint16_t last_record_ = 0;
  size_t expected_records_ = 0;
  size_t records_read_ = 0;
  size_t record_width_ = 0;
  size_t header_size_ = 0;
};

// "Symbol" followed by the display names of the recognized columns of a layout
std::vector<std::string> output_keys(const ColumnLayout &layout, const Codec::ColumnRegistry &registry);

// Resolve the layout and drain the reader into a vector
Status read_all(const SymbolMetadata &symbol, const Codec::ColumnRegistry &registry,
                std::vector<DecodedRecord> &records);

} // namespace MsBin::Data
