#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace MsBin::misc {

// Single-line symbol progress bar, updated in place with \r
inline void print_progress(size_t current, size_t total, const std::string &symbol = "") {
  if (total == 0)
    return;

  const int bar_width = 40;
  float progress = static_cast<float>(current) / static_cast<float>(total);
  int pos = static_cast<int>(bar_width * progress);

  // Build complete output string to avoid interleaving with log echoes
  std::ostringstream output;
  output << "\r[";
  for (int i = 0; i < bar_width; ++i) {
    if (i < pos)
      output << "=";
    else if (i == pos)
      output << ">";
    else
      output << " ";
  }
  output << "] " << std::setw(3) << static_cast<size_t>(progress * 100.0f)
         << "% (" << current << "/" << total << ")";
  if (!symbol.empty()) {
    output << " " << std::left << std::setw(14) << symbol;
  }

  std::cout << output.str() << std::flush;
  if (current == total) {
    std::cout << "\n";
  }
}

class Timer {
public:
  explicit Timer(const std::string &label = "")
      : label_(label), start_(std::chrono::steady_clock::now()) {}

  ~Timer() {
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<float> elapsed = end - start_;
    std::cout << label_ << " " << elapsed.count() * 1000 << "ms\n";
  }

private:
  std::string label_;
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

} // namespace MsBin::misc
