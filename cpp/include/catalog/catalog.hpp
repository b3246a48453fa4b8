#pragma once

#include "codec/column_registry.hpp"
#include "define/Dtype.hpp"
#include "define/Status.hpp"
#include "index/index_file.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace MsBin {

// ============================================================================
// RESULT TYPES
// ============================================================================

struct SymbolFailure {
  std::string symbol_code;
  uint16_t file_number = 0;
  Status status;
};

struct SymbolResult {
  SymbolMetadata symbol;
  Status status;
  std::vector<DecodedRecord> records; // empty whenever status is not ok
};

struct ReadReport {
  std::vector<DecodedRecord> records; // symbols in selection order
  std::vector<SymbolFailure> failures;
  size_t symbols_read = 0;            // symbols decoded without error
};

// ============================================================================
// CATALOG
// ============================================================================
//
// MASTER is authoritative for which file numbers exist; EMASTER only renames
// (non-empty names, existing entries) unless MASTER is absent or failed to
// load, in which case its entries seed the table. EMASTER itself is mandatory. XMASTER is kept in
// a separate table and never merged.

class Catalog {
public:
  using Table = std::map<uint16_t, SymbolMetadata>; // file number -> metadata

  Catalog() = default;

  // MASTER / EMASTER / XMASTER inside dir
  Status build(const std::filesystem::path &dir);
  Status build(Index::IndexSource &standard, Index::IndexSource &extended, Index::IndexSource *cross_reference);

  const Table &symbols() const { return symbols_; }
  const Table &cross_reference() const { return cross_reference_; }

  const SymbolMetadata *find(uint16_t file_number) const;

  // all: every entry; otherwise exact symbol_code matches. File number order.
  std::vector<SymbolMetadata> select_symbols(bool all, const std::vector<std::string> &codes) const;
  std::vector<SymbolMetadata> select_cross_reference(bool all, const std::vector<std::string> &codes) const;

  // Listing as printed by the driver: "symbol: X, name: Y, file number: N"
  std::string describe_symbols() const;

  // Per-symbol failure isolation: errors are logged and returned, never thrown
  static SymbolResult read_symbol(const SymbolMetadata &symbol, const Codec::ColumnRegistry &registry);
  // One result per selected symbol, in selection order; workers > 1 decodes in parallel
  static std::vector<SymbolResult> read_symbol_results(const std::vector<SymbolMetadata> &selection,
                                                       const Codec::ColumnRegistry &registry,
                                                       size_t workers = 1);
  static ReadReport read_symbols(const std::vector<SymbolMetadata> &selection,
                                 const Codec::ColumnRegistry &registry,
                                 size_t workers = 1);

private:
  static std::vector<SymbolMetadata> select(const Table &table, bool all, const std::vector<std::string> &codes);

  Table symbols_;
  Table cross_reference_;
};

} // namespace MsBin
