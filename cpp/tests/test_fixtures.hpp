#pragma once

#include "define/Dtype.hpp"

#include <gtest/gtest.h>

#include <array>
#include <bit>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace MsBinTest {

// IEEE single -> MBF bytes, for building fixtures only
inline std::array<uint8_t, 4> mbf(float value) {
  const uint32_t bits = std::bit_cast<uint32_t>(value);
  if ((bits & 0x7fffffff) == 0)
    return {0, 0, 0, 0};
  const uint32_t sign = bits >> 31;
  const uint32_t exponent = (bits >> 23) & 0xff;
  const uint32_t mantissa = bits & 0x7fffff;
  return {static_cast<uint8_t>(mantissa & 0xff),
          static_cast<uint8_t>((mantissa >> 8) & 0xff),
          static_cast<uint8_t>(((mantissa >> 16) & 0x7f) | (sign << 7)),
          static_cast<uint8_t>(exponent + 2)};
}

inline void put_u8(std::vector<uint8_t> &buf, size_t offset, uint8_t value) {
  buf.at(offset) = value;
}

inline void put_u16(std::vector<uint8_t> &buf, size_t offset, uint16_t value) {
  buf.at(offset) = static_cast<uint8_t>(value & 0xff);
  buf.at(offset + 1) = static_cast<uint8_t>(value >> 8);
}

inline void put_u32(std::vector<uint8_t> &buf, size_t offset, uint32_t value) {
  for (size_t i = 0; i < 4; ++i)
    buf.at(offset + i) = static_cast<uint8_t>((value >> (8 * i)) & 0xff);
}

inline void put_mbf(std::vector<uint8_t> &buf, size_t offset, float value) {
  const auto bytes = mbf(value);
  for (size_t i = 0; i < 4; ++i)
    buf.at(offset + i) = bytes[i];
}

// Fixed-width text field, padded with pad
inline void put_text(std::vector<uint8_t> &buf, size_t offset, size_t width, const std::string &text, char pad = ' ') {
  for (size_t i = 0; i < width; ++i)
    buf.at(offset + i) = static_cast<uint8_t>(i < text.size() ? text[i] : pad);
}

inline void write_file(const std::filesystem::path &path, const std::vector<uint8_t> &bytes) {
  std::ofstream file(path, std::ios::binary);
  file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const std::filesystem::path &path, const std::string &text) {
  std::ofstream file(path);
  file << text;
}

// ============================================================================
// INDEX FILE BUILDERS
// ============================================================================

struct IndexEntry {
  uint16_t file_number = 0;
  uint8_t fields = 7;
  std::string symbol;
  std::string name;
  char time_frame = 'D';
  float first_date = 0.0f; // MBF packed YYYMMDD (MASTER/EMASTER)
  float last_date = 0.0f;
  uint32_t first_date_int = 0; // plain YYYYMMDD (XMASTER)
  uint32_t last_date_int = 0;
};

inline std::vector<uint8_t> make_master(const std::vector<IndexEntry> &entries) {
  std::vector<uint8_t> buf((entries.size() + 1) * 53, 0);
  put_u16(buf, 0, static_cast<uint16_t>(entries.size()));
  for (size_t i = 0; i < entries.size(); ++i) {
    const size_t base = (i + 1) * 53;
    const auto &e = entries[i];
    put_u8(buf, base + 0, static_cast<uint8_t>(e.file_number));
    put_u8(buf, base + 3, static_cast<uint8_t>(e.fields * 4));
    put_u8(buf, base + 4, e.fields);
    put_text(buf, base + 7, 16, e.name);
    put_mbf(buf, base + 25, e.first_date);
    put_mbf(buf, base + 29, e.last_date);
    put_u8(buf, base + 33, static_cast<uint8_t>(e.time_frame));
    put_text(buf, base + 36, 14, e.symbol);
  }
  return buf;
}

inline std::vector<uint8_t> make_emaster(const std::vector<IndexEntry> &entries, uint16_t last_file = 0) {
  std::vector<uint8_t> buf((entries.size() + 1) * 192, 0);
  put_u16(buf, 0, static_cast<uint16_t>(entries.size()));
  put_u16(buf, 2, last_file);
  for (size_t i = 0; i < entries.size(); ++i) {
    const size_t base = (i + 1) * 192;
    const auto &e = entries[i];
    put_u8(buf, base + 2, static_cast<uint8_t>(e.file_number));
    put_u8(buf, base + 6, e.fields);
    put_text(buf, base + 11, 14, e.symbol, '\0');
    put_text(buf, base + 32, 16, e.name, '\0');
    put_u8(buf, base + 60, static_cast<uint8_t>(e.time_frame));
    put_mbf(buf, base + 64, e.first_date);
    put_mbf(buf, base + 72, e.last_date);
  }
  return buf;
}

inline std::vector<uint8_t> make_xmaster(const std::vector<IndexEntry> &entries) {
  std::vector<uint8_t> buf((entries.size() + 1) * 150, 0);
  put_u16(buf, 10, static_cast<uint16_t>(entries.size()));
  for (size_t i = 0; i < entries.size(); ++i) {
    const size_t base = (i + 1) * 150;
    const auto &e = entries[i];
    put_text(buf, base + 1, 14, e.symbol, '\0');
    put_text(buf, base + 16, 45, e.name, '\0');
    put_u8(buf, base + 62, static_cast<uint8_t>(e.time_frame));
    put_u16(buf, base + 65, e.file_number);
    put_u32(buf, base + 108, e.first_date_int);
    put_u32(buf, base + 116, e.last_date_int);
  }
  return buf;
}

// ============================================================================
// DATA FILE BUILDER
// ============================================================================

// One 4-byte cell per column; MBF-encoded unless raw is set
struct Cell {
  float value = 0.0f;
  bool raw = false;
  std::array<uint8_t, 4> bytes{};
};

inline Cell value(float v) { return Cell{v, false, {}}; }
inline Cell raw(std::array<uint8_t, 4> b) { return Cell{0.0f, true, b}; }

// Header: max_records, last_record (= rows + 1 unless overridden), (fields - 1) * 4 padding
inline std::vector<uint8_t> make_data_file(size_t fields, const std::vector<std::vector<Cell>> &rows,
                                           uint16_t max_records = 0, int last_record = -1) {
  const uint16_t last = last_record < 0 ? static_cast<uint16_t>(rows.size() + 1) : static_cast<uint16_t>(last_record);
  std::vector<uint8_t> buf(4 + (fields - 1) * 4 + rows.size() * fields * 4, 0);
  put_u16(buf, 0, max_records == 0 ? static_cast<uint16_t>(rows.size() + 10) : max_records);
  put_u16(buf, 2, last);
  size_t offset = 4 + (fields - 1) * 4;
  for (const auto &row : rows) {
    for (const auto &cell : row) {
      if (cell.raw) {
        for (size_t i = 0; i < 4; ++i)
          buf.at(offset + i) = cell.bytes[i];
      } else {
        put_mbf(buf, offset, cell.value);
      }
      offset += 4;
    }
  }
  return buf;
}

// ============================================================================
// TEMPORARY DIRECTORY FIXTURE
// ============================================================================

class TempDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("msbin_") + info->test_suite_name() + "_" + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

} // namespace MsBinTest
