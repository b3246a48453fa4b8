#include "misc/text_export.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace MsBin::TextExport {

std::string RenderSymbolText(const std::vector<std::string> &keys,
                             const std::vector<DecodedRecord> &records) {
  std::ostringstream output;

  // first key is the symbol column, written as "Name"
  output << "\"Name\"";
  for (size_t i = 1; i < keys.size(); ++i) {
    output << ",\"" << keys[i] << "\"";
  }
  output << "\n";

  for (const auto &record : records) {
    bool first = true;
    for (const auto &[key, value] : record.fields) {
      if (!first)
        output << ",";
      first = false;
      output << value;
    }
    output << "\n";
  }
  return output.str();
}

bool WriteSymbolText(const std::string &symbol_code,
                     const std::vector<std::string> &keys,
                     const std::vector<DecodedRecord> &records,
                     const std::string &output_dir) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "Failed to create directory: " << output_dir << " (" << ec.message() << ")\n";
    return false;
  }

  const std::filesystem::path filename = std::filesystem::path(output_dir) / (symbol_code + ".TXT");
  std::ofstream file(filename);
  if (!file.is_open()) {
    std::cerr << "Failed to create file: " << filename << "\n";
    return false;
  }

  file << RenderSymbolText(keys, records);
  if (!file) {
    std::cerr << "Failed to write file: " << filename << "\n";
    return false;
  }
  return true;
}

} // namespace MsBin::TextExport
