#pragma once

#include "define/Dtype.hpp"
#include "define/Status.hpp"

#include <filesystem>
#include <string>

namespace MsBin::Layout {

// Column set assumed when a symbol has no F<n>.DOP sidecar
const ColumnLayout &default_layout();

constexpr size_t SIDECAR_TRAILING_LINES = 1; // non-data line closing every sidecar

// Parse sidecar text: whitespace separated tokens of the form "<NAME>",<rest>,
// last token dropped
Status parse_sidecar(const std::string &text, ColumnLayout &layout);

// Sidecar when present (must agree with a declared field count), otherwise the
// default layout (declared field count must equal its size)
Status resolve(const SymbolMetadata &symbol, ColumnLayout &layout);

} // namespace MsBin::Layout
