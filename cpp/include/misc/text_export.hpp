#pragma once

#include "define/Dtype.hpp"

#include <string>
#include <vector>

namespace MsBin::TextExport {

// <output_dir>/<symbol>.TXT
//   "Name","Date","Open",...      (keys after "Symbol", quoted)
//   ABC,20230115,10.00,...
// Returns false (and reports on stderr) when the file cannot be written
bool WriteSymbolText(const std::string &symbol_code,
                     const std::vector<std::string> &keys,
                     const std::vector<DecodedRecord> &records,
                     const std::string &output_dir);

// In-memory rendering used by WriteSymbolText
std::string RenderSymbolText(const std::vector<std::string> &keys,
                             const std::vector<DecodedRecord> &records);

} // namespace MsBin::TextExport
