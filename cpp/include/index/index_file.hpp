#pragma once

#include "define/Dtype.hpp"
#include "define/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace MsBin::Index {

// ============================================================================
// INDEX LAYOUTS (one table per on-disk variant)
// ============================================================================

enum class DateEncoding : uint8_t {
  LegacyFloat, // MBF packed YYYMMDD
  PlainInteger // uint32 YYYYMMDD
};

enum class SymbolRule : uint8_t {
  Normalize, // prefix marker strip + delimiter truncate
  PaddedOnly // fixed-width trim only
};

// width 0: field not present in this variant
struct FieldSpan {
  size_t offset;
  size_t width;
};

struct IndexLayout {
  const char *variant;  // diagnostics
  const char *filename; // inside the data directory
  FieldSpan header_count;     // uint16 record count in the header record
  FieldSpan header_last_file; // uint16 highest file number (EMASTER only)
  size_t stride;              // record i lives at (i + 1) * stride

  FieldSpan file_number; // 1 or 2 bytes
  FieldSpan record_length;
  FieldSpan declared_fields;
  FieldSpan symbol;
  FieldSpan display_name;
  FieldSpan time_frame;
  FieldSpan first_date;
  FieldSpan last_date;

  DateEncoding date_encoding;
  SymbolRule symbol_rule;
  const char *data_file_ext;
  bool placeholder_short_circuit; // file number 0 stops the record decode

  // Bytes of the header / of a record that must exist on disk
  size_t header_extent() const;
  size_t record_extent() const;
};

extern const IndexLayout STANDARD_INDEX;        // MASTER
extern const IndexLayout EXTENDED_INDEX;        // EMASTER
extern const IndexLayout CROSS_REFERENCE_INDEX; // XMASTER

// ============================================================================
// INDEX SOURCE CAPABILITY
// ============================================================================

class IndexSource {
public:
  virtual ~IndexSource() = default;

  // Absent file is not an error: present() stays false and record_count() is 0
  virtual Status open_if_present() = 0;
  virtual bool present() const = 0;
  virtual size_t record_count() const = 0;
  virtual Status read_record_at(size_t index, SymbolMetadata &symbol) = 0;
  virtual void close() = 0;
  virtual std::string describe() const = 0;
};

// ============================================================================
// INDEX FILE
// ============================================================================

class IndexFile : public IndexSource {
public:
  enum class State : uint8_t {
    Unopened,
    Opened,
    Closed
  };

  IndexFile(const IndexLayout &layout, std::filesystem::path data_dir);
  ~IndexFile() override;

  IndexFile(const IndexFile &) = delete;
  IndexFile &operator=(const IndexFile &) = delete;

  Status open_if_present() override;
  bool present() const override { return present_; }
  size_t record_count() const override { return record_count_; }
  Status read_record_at(size_t index, SymbolMetadata &symbol) override;
  void close() override;
  std::string describe() const override;

  State state() const { return state_; }
  const IndexLayout &layout() const { return layout_; }
  std::filesystem::path path() const { return data_dir_ / layout_.filename; }

  // EMASTER header: highest file number in use (0 for other variants)
  uint16_t last_file_number() const { return last_file_number_; }

  // Decode one raw record buffer of at least layout.record_extent() bytes
  static SymbolMetadata decode_record(const IndexLayout &layout, const uint8_t *record,
                                      const std::filesystem::path &data_dir);

private:
  const IndexLayout &layout_;
  std::filesystem::path data_dir_;
  std::ifstream file_;
  State state_ = State::Unopened;
  bool present_ = false;
  size_t record_count_ = 0;
  uint16_t last_file_number_ = 0;
  std::vector<uint8_t> record_buffer_;
};

// Read every record of a source (open, iterate, close); placeholder slots skipped
Status load_all(IndexSource &source, std::vector<SymbolMetadata> &symbols);

} // namespace MsBin::Index
