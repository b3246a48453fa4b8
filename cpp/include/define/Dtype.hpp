#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace MsBin {

// ============================================================================
// SYMBOL METADATA (one index record)
// ============================================================================

struct SymbolMetadata {
  uint16_t file_number = 0;       // 0: unused slot, never enters a catalog
  uint8_t record_length = 0;      // MASTER only
  uint8_t declared_fields = 0;    // 0: not declared by the index (XMASTER)
  std::string symbol_code;        // normalized
  std::string display_name;       // may be empty
  char time_frame = 'D';          // 'D' daily, 'W' weekly, 'I' intraday...
  std::chrono::year_month_day first_date{};
  std::chrono::year_month_day last_date{};
  std::string data_file_ext;      // ".DAT" or ".MWD"
  std::filesystem::path data_dir; // directory holding F<n>.* files

  std::string base_filename() const { return "F" + std::to_string(file_number); }
  std::filesystem::path data_file_path() const { return data_dir / (base_filename() + data_file_ext); }
  std::filesystem::path sidecar_file_path() const { return data_dir / (base_filename() + ".DOP"); }
};

// ============================================================================
// COLUMN LAYOUT (on-disk field order of one data file)
// ============================================================================

// Unrecognized tokens stay in the sequence so byte offsets remain aligned
using ColumnLayout = std::vector<std::string>;

// ============================================================================
// DECODED RECORD (one stored tick)
// ============================================================================

struct DecodedRecord {
  // Ordered: "Symbol" first, then recognized columns in layout order
  std::vector<std::pair<std::string, std::string>> fields;

  void add(const std::string &key, std::string value) { fields.emplace_back(key, std::move(value)); }

  const std::string *find(const std::string &key) const {
    for (const auto &field : fields) {
      if (field.first == key)
        return &field.second;
    }
    return nullptr;
  }

  size_t size() const { return fields.size(); }
};

} // namespace MsBin
