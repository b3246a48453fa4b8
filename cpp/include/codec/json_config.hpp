#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace MsBin::JsonConfig {

// Application configuration
struct AppConfig {
  std::string dir;                  // directory holding MASTER/EMASTER/XMASTER and F<n>.* files
  int precision = 2;                // digits after the decimal point for price columns
  bool all_symbols = true;          // false: only the codes listed in symbols
  std::vector<std::string> symbols; // exact symbol codes
  std::string output_dir = ".";     // <SYMBOL>.TXT files
  std::string log_dir = "log";
  size_t workers = 1;               // >1: decode symbols in parallel
  bool list_only = false;           // print the symbol table and stop
  bool cross_reference = false;     // also export XMASTER symbols
};

// Config parser, throws std::runtime_error on a missing file or invalid values
AppConfig ParseAppConfig(const std::string &config_file);

// Same rules on an in-memory document
AppConfig ParseAppConfigText(const std::string &json_text);

} // namespace MsBin::JsonConfig
