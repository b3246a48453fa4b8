#include "catalog/catalog.hpp"
#include "catalog/column_layout.hpp"
#include "catalog/data_file.hpp"
#include "codec/column_registry.hpp"
#include "codec/json_config.hpp"
#include "misc/logging.hpp"
#include "misc/misc.hpp"
#include "misc/text_export.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// METASTOCK -> TEXT
// ============================================================================
//
// MASTER ──┐
// EMASTER ─┼─> Catalog (file number -> symbol) ─> select ─┐
// XMASTER ─┘   (separate cross-reference table)           │
//                                                         v
//            F<n>.DOP ─> column layout ─> F<n>.DAT/.MWD decode ─> <SYMBOL>.TXT
//
// Each symbol is isolated: a failing data file is logged and skipped.
//
// ============================================================================
// CONFIGURATION SECTION
// ============================================================================
namespace Config {
constexpr const char *DEFAULT_CONFIG_FILE = "config/msbin.json";
} // namespace Config

namespace {

using namespace MsBin;

// Decode and export one selection; returns the number of failed symbols
size_t ExportSelection(const std::vector<SymbolMetadata> &selection,
                       const Codec::ColumnRegistry &registry,
                       const JsonConfig::AppConfig &config) {
  std::vector<SymbolResult> results = Catalog::read_symbol_results(selection, registry, config.workers);

  size_t failed = 0;
  size_t done = 0;
  for (const auto &result : results) {
    const SymbolMetadata &symbol = result.symbol;
    misc::print_progress(++done, results.size(), symbol.symbol_code);
    if (!result.status.ok()) {
      ++failed;
      continue;
    }

    ColumnLayout layout;
    Status status = Layout::resolve(symbol, layout);
    if (!status.ok()) {
      Logger::log_decode_error(symbol.symbol_code, status.to_string());
      ++failed;
      continue;
    }
    if (!TextExport::WriteSymbolText(symbol.symbol_code, Data::output_keys(layout, registry), result.records,
                                     config.output_dir)) {
      Logger::log_decode_error(symbol.symbol_code, "cannot write text output");
      ++failed;
    }
  }
  return failed;
}

} // namespace

// ============================================================================
// MAIN ENTRY POINT
// ============================================================================

int main(int argc, char **argv) {
  try {
    std::cout << "=== MetaStock Decoder ===" << "\n";

    const std::string config_file = argc > 1 ? argv[1] : Config::DEFAULT_CONFIG_FILE;
    const JsonConfig::AppConfig config = JsonConfig::ParseAppConfig(config_file);

    Logger::init(config.log_dir);

    std::cout << "Configuration:" << "\n";
    std::cout << "  Data dir: " << config.dir << "\n";
    std::cout << "  Output dir: " << config.output_dir << "\n";
    std::cout << "  Precision: " << config.precision << "\n";
    std::cout << "  Symbols: " << (config.all_symbols ? std::string("all") : std::to_string(config.symbols.size())) << "\n";
    std::cout << "  Cross-reference: " << (config.cross_reference ? "Yes" : "No") << "\n\n";

    // precision is fixed here, before any decoding
    const Codec::ColumnRegistry registry(config.precision);

    Catalog catalog;
    const Status status = catalog.build(config.dir);
    if (!status.ok()) {
      std::cerr << "Cannot build symbol catalog: " << status.to_string() << "\n";
      Logger::close();
      return 1;
    }

    std::cout << catalog.describe_symbols();
    if (config.list_only) {
      Logger::close();
      return 0;
    }

    size_t failed = 0;
    {
      misc::Timer timer("Export");
      failed += ExportSelection(catalog.select_symbols(config.all_symbols, config.symbols), registry, config);
      if (config.cross_reference) {
        failed += ExportSelection(catalog.select_cross_reference(config.all_symbols, config.symbols), registry, config);
      }
    }

    if (failed > 0) {
      std::cout << failed << " symbol(s) could not be converted, see " << config.log_dir << "/decode.log\n";
    }
    Logger::close();
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    Logger::close();
    return 1;
  }
}
