#include "catalog/column_layout.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <vector>

namespace MsBin::Layout {

const ColumnLayout &default_layout() {
  static const ColumnLayout layout = {"DATE", "OPEN", "HIGH", "LOW", "CLOSE", "VOL", "OI"};
  return layout;
}

Status parse_sidecar(const std::string &text, ColumnLayout &layout) {
  static const std::regex column_regex(R"re("(.+)",.+)re", std::regex::icase);

  std::istringstream iss(text);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }

  if (tokens.size() < SIDECAR_TRAILING_LINES) {
    return Status::StructuralFormat("empty column definition file");
  }
  tokens.resize(tokens.size() - SIDECAR_TRAILING_LINES);

  layout.clear();
  layout.reserve(tokens.size());
  for (const auto &line : tokens) {
    std::smatch match;
    if (!std::regex_search(line, match, column_regex)) {
      return Status::StructuralFormat("malformed column definition: " + line);
    }
    layout.push_back(match[1].str());
  }
  return Status::Ok();
}

Status resolve(const SymbolMetadata &symbol, ColumnLayout &layout) {
  const std::filesystem::path sidecar = symbol.sidecar_file_path();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(sidecar, ec)) {
    const ColumnLayout &fallback = default_layout();
    if (symbol.declared_fields != fallback.size()) {
      return Status::Configuration("no column definition file " + sidecar.string() + " and declared field count " +
                                   std::to_string(symbol.declared_fields) + " does not match the default " +
                                   std::to_string(fallback.size()) + "-column layout");
    }
    layout = fallback;
    return Status::Ok();
  }

  std::ifstream file(sidecar);
  if (!file.is_open()) {
    return Status::StructuralFormat("cannot open column definition file " + sidecar.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  Status status = parse_sidecar(buffer.str(), layout);
  if (!status.ok()) {
    return Status::StructuralFormat(sidecar.string() + ": " + status.message());
  }

  // XMASTER entries do not declare a count; the sidecar alone decides
  if (symbol.declared_fields != 0 && layout.size() != symbol.declared_fields) {
    return Status::StructuralFormat(sidecar.string() + " lists " + std::to_string(layout.size()) +
                                    " columns, index declares " + std::to_string(symbol.declared_fields));
  }
  return Status::Ok();
}

} // namespace MsBin::Layout
