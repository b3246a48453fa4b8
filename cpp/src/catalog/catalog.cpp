#include "catalog/catalog.hpp"
#include "catalog/data_file.hpp"
#include "misc/logging.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <sstream>
#include <unordered_set>

namespace MsBin {

// ============================================================================
// BUILD
// ============================================================================

Status Catalog::build(const std::filesystem::path &dir) {
  Index::IndexFile standard(Index::STANDARD_INDEX, dir);
  Index::IndexFile extended(Index::EXTENDED_INDEX, dir);
  Index::IndexFile cross_reference(Index::CROSS_REFERENCE_INDEX, dir);
  return build(standard, extended, &cross_reference);
}

Status Catalog::build(Index::IndexSource &standard, Index::IndexSource &extended,
                      Index::IndexSource *cross_reference) {
  symbols_.clear();
  cross_reference_.clear();

  // MASTER: optional, authoritative when present
  std::vector<SymbolMetadata> standard_symbols;
  Status status = Index::load_all(standard, standard_symbols);
  const bool standard_loaded = status.ok() && standard.present();
  if (!status.ok()) {
    Logger::log_index_error(standard.describe(), status.to_string());
    standard_symbols.clear();
  }
  for (auto &symbol : standard_symbols) {
    const uint16_t file_number = symbol.file_number;
    symbols_[file_number] = std::move(symbol);
  }
  Logger::log_index(standard.describe() + (standard_loaded ? "" : " (not loaded)") + ": " +
                    std::to_string(symbols_.size()) + " symbols");

  // EMASTER: mandatory
  std::vector<SymbolMetadata> extended_symbols;
  status = Index::load_all(extended, extended_symbols);
  if (!status.ok()) {
    Logger::log_index_error(extended.describe(), status.to_string());
    symbols_.clear();
    return status;
  }
  if (!extended.present()) {
    symbols_.clear();
    status = Status::Configuration("no " + extended.describe() + ", cannot build the symbol table");
    Logger::log_index_error(extended.describe(), status.to_string());
    return status;
  }

  size_t renamed = 0;
  size_t seeded = 0;
  for (auto &symbol : extended_symbols) {
    auto it = symbols_.find(symbol.file_number);
    if (it == symbols_.end()) {
      // MASTER absent or unreadable: EMASTER is the only source of entries
      if (!standard_loaded) {
        const uint16_t file_number = symbol.file_number;
        symbols_[file_number] = std::move(symbol);
        ++seeded;
      }
      continue;
    }
    if (!symbol.display_name.empty()) {
      it->second.display_name = symbol.display_name;
      ++renamed;
    }
  }
  Logger::log_index(extended.describe() + ": " + std::to_string(extended_symbols.size()) + " records, " +
                    std::to_string(renamed) + " renamed, " + std::to_string(seeded) + " seeded");

  // XMASTER: optional, independent table
  if (cross_reference != nullptr) {
    std::vector<SymbolMetadata> cross_symbols;
    status = Index::load_all(*cross_reference, cross_symbols);
    if (!status.ok()) {
      Logger::log_index_error(cross_reference->describe(), status.to_string());
      cross_symbols.clear();
    }
    for (auto &symbol : cross_symbols) {
      const uint16_t file_number = symbol.file_number;
      cross_reference_[file_number] = std::move(symbol);
    }
    Logger::log_index(cross_reference->describe() + ": " + std::to_string(cross_reference_.size()) + " symbols");
  }

  return Status::Ok();
}

// ============================================================================
// QUERIES
// ============================================================================

const SymbolMetadata *Catalog::find(uint16_t file_number) const {
  auto it = symbols_.find(file_number);
  return it == symbols_.end() ? nullptr : &it->second;
}

std::vector<SymbolMetadata> Catalog::select(const Table &table, bool all, const std::vector<std::string> &codes) {
  const std::unordered_set<std::string> wanted(codes.begin(), codes.end());
  std::vector<SymbolMetadata> selection;
  for (const auto &[file_number, symbol] : table) {
    if (all || wanted.count(symbol.symbol_code) > 0)
      selection.push_back(symbol);
  }
  return selection;
}

std::vector<SymbolMetadata> Catalog::select_symbols(bool all, const std::vector<std::string> &codes) const {
  return select(symbols_, all, codes);
}

std::vector<SymbolMetadata> Catalog::select_cross_reference(bool all, const std::vector<std::string> &codes) const {
  return select(cross_reference_, all, codes);
}

std::string Catalog::describe_symbols() const {
  std::ostringstream oss;
  oss << "Number of available symbols: " << symbols_.size() << "\n";
  for (const auto &[file_number, symbol] : symbols_) {
    oss << "symbol: " << symbol.symbol_code << ", name: " << symbol.display_name
        << ", file number: " << file_number << "\n";
  }
  return oss.str();
}

// ============================================================================
// DATA FILES
// ============================================================================

SymbolResult Catalog::read_symbol(const SymbolMetadata &symbol, const Codec::ColumnRegistry &registry) {
  SymbolResult result;
  result.symbol = symbol;
  result.status = Data::read_all(symbol, registry, result.records);
  if (!result.status.ok()) {
    result.records.clear();
    Logger::log_decode_error(symbol.symbol_code, result.status.to_string());
  } else {
    Logger::log_decode("Processed " + symbol.symbol_code + " (fileNo " + std::to_string(symbol.file_number) +
                       "): " + std::to_string(result.records.size()) + " records");
  }
  return result;
}

std::vector<SymbolResult> Catalog::read_symbol_results(const std::vector<SymbolMetadata> &selection,
                                                       const Codec::ColumnRegistry &registry,
                                                       size_t workers) {
  std::vector<SymbolResult> results(selection.size());

  workers = std::clamp<size_t>(workers, 1, std::max<size_t>(selection.size(), 1));
  if (workers == 1) {
    for (size_t i = 0; i < selection.size(); ++i) {
      results[i] = read_symbol(selection[i], registry);
    }
    return results;
  }

  // strided assignment; each worker owns distinct result slots
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [&selection, &registry, &results, w, workers]() {
      for (size_t i = w; i < selection.size(); i += workers) {
        results[i] = read_symbol(selection[i], registry);
      }
    }));
  }
  for (auto &future : futures) {
    future.get();
  }
  return results;
}

ReadReport Catalog::read_symbols(const std::vector<SymbolMetadata> &selection,
                                 const Codec::ColumnRegistry &registry,
                                 size_t workers) {
  std::vector<SymbolResult> results = read_symbol_results(selection, registry, workers);

  ReadReport report;
  for (auto &result : results) {
    if (!result.status.ok()) {
      report.failures.push_back({result.symbol.symbol_code, result.symbol.file_number, result.status});
      continue;
    }
    ++report.symbols_read;
    report.records.insert(report.records.end(), std::make_move_iterator(result.records.begin()),
                          std::make_move_iterator(result.records.end()));
  }
  return report;
}

} // namespace MsBin
