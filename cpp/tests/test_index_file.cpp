#include "index/index_file.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace MsBin;
using namespace MsBinTest;
using namespace std::chrono;

class IndexFileTest : public TempDirTest {};

TEST(IndexLayout, ExtentsCoverEveryField) {
  EXPECT_EQ(Index::STANDARD_INDEX.record_extent(), 50u);
  EXPECT_EQ(Index::EXTENDED_INDEX.record_extent(), 76u);
  EXPECT_EQ(Index::CROSS_REFERENCE_INDEX.record_extent(), 120u);

  EXPECT_EQ(Index::STANDARD_INDEX.header_extent(), 2u);
  EXPECT_EQ(Index::EXTENDED_INDEX.header_extent(), 4u);
  EXPECT_EQ(Index::CROSS_REFERENCE_INDEX.header_extent(), 12u);
}

TEST_F(IndexFileTest, StandardIndexRecordOffsets) {
  IndexEntry entry;
  entry.file_number = 3;
  entry.fields = 7;
  entry.symbol = "@*ABC#1";
  entry.name = "ABC CORP";
  entry.time_frame = 'W';
  entry.first_date = 1230115.0f;
  entry.last_date = 1231229.0f;
  write_file(dir_ / "MASTER", make_master({entry}));

  Index::IndexFile master(Index::STANDARD_INDEX, dir_);
  ASSERT_TRUE(master.open_if_present().ok());
  EXPECT_TRUE(master.present());
  ASSERT_EQ(master.record_count(), 1u);

  SymbolMetadata symbol;
  ASSERT_TRUE(master.read_record_at(0, symbol).ok());
  EXPECT_EQ(symbol.file_number, 3);
  EXPECT_EQ(symbol.record_length, 28);
  EXPECT_EQ(symbol.declared_fields, 7);
  EXPECT_EQ(symbol.symbol_code, "ABC");
  EXPECT_EQ(symbol.display_name, "ABC CORP");
  EXPECT_EQ(symbol.time_frame, 'W');
  EXPECT_EQ(symbol.first_date, year_month_day{2023y / January / 15d});
  EXPECT_EQ(symbol.last_date, year_month_day{2023y / December / 29d});
  EXPECT_EQ(symbol.data_file_path(), dir_ / "F3.DAT");
  EXPECT_EQ(symbol.sidecar_file_path(), dir_ / "F3.DOP");
}

TEST_F(IndexFileTest, ExtendedIndexRecordOffsets) {
  IndexEntry first{.file_number = 1, .fields = 7, .symbol = "MSFT", .name = "MICROSOFT"};
  first.first_date = 1000104.0f;
  first.last_date = 1231229.0f;
  IndexEntry second{.file_number = 2, .fields = 8, .symbol = "@:ES#Z3", .name = "E-MINI", .time_frame = 'I'};
  write_file(dir_ / "EMASTER", make_emaster({first, second}, 2));

  Index::IndexFile emaster(Index::EXTENDED_INDEX, dir_);
  ASSERT_TRUE(emaster.open_if_present().ok());
  ASSERT_EQ(emaster.record_count(), 2u);
  EXPECT_EQ(emaster.last_file_number(), 2);

  SymbolMetadata symbol;
  ASSERT_TRUE(emaster.read_record_at(0, symbol).ok());
  EXPECT_EQ(symbol.file_number, 1);
  EXPECT_EQ(symbol.symbol_code, "MSFT");
  EXPECT_EQ(symbol.display_name, "MICROSOFT");
  EXPECT_EQ(symbol.first_date, year_month_day{2000y / January / 4d});
  EXPECT_EQ(symbol.record_length, 0);

  ASSERT_TRUE(emaster.read_record_at(1, symbol).ok());
  EXPECT_EQ(symbol.file_number, 2);
  EXPECT_EQ(symbol.declared_fields, 8);
  EXPECT_EQ(symbol.symbol_code, "ES");
  EXPECT_EQ(symbol.time_frame, 'I');
}

TEST_F(IndexFileTest, CrossReferenceIndexRecordOffsets) {
  IndexEntry entry{.file_number = 300, .symbol = "@LONGSYM#", .name = "A MUCH LONGER DISPLAY NAME THAN SIXTEEN"};
  entry.first_date_int = 20200102;
  entry.last_date_int = 20231229;
  write_file(dir_ / "XMASTER", make_xmaster({entry}));

  Index::IndexFile xmaster(Index::CROSS_REFERENCE_INDEX, dir_);
  ASSERT_TRUE(xmaster.open_if_present().ok());
  ASSERT_EQ(xmaster.record_count(), 1u);

  SymbolMetadata symbol;
  ASSERT_TRUE(xmaster.read_record_at(0, symbol).ok());
  EXPECT_EQ(symbol.file_number, 300);
  EXPECT_EQ(symbol.declared_fields, 0);
  // trimmed only, no marker or delimiter handling
  EXPECT_EQ(symbol.symbol_code, "@LONGSYM#");
  EXPECT_EQ(symbol.display_name, "A MUCH LONGER DISPLAY NAME THAN SIXTEEN");
  EXPECT_EQ(symbol.first_date, year_month_day{2020y / January / 2d});
  EXPECT_EQ(symbol.last_date, year_month_day{2023y / December / 29d});
  EXPECT_EQ(symbol.data_file_path(), dir_ / "F300.MWD");
}

TEST_F(IndexFileTest, ExtendedPlaceholderStopsDecode) {
  std::vector<uint8_t> record(Index::EXTENDED_INDEX.record_extent(), 0);
  put_text(record, 11, 14, "GHOST", '\0');
  put_text(record, 32, 16, "UNUSED", '\0');

  const SymbolMetadata extended = Index::IndexFile::decode_record(Index::EXTENDED_INDEX, record.data(), dir_);
  EXPECT_EQ(extended.file_number, 0);
  EXPECT_TRUE(extended.symbol_code.empty());
  EXPECT_TRUE(extended.display_name.empty());

  std::vector<uint8_t> standard_record(Index::STANDARD_INDEX.record_extent(), 0);
  put_text(standard_record, 36, 14, "GHOST");
  const SymbolMetadata standard =
      Index::IndexFile::decode_record(Index::STANDARD_INDEX, standard_record.data(), dir_);
  EXPECT_EQ(standard.file_number, 0);
  EXPECT_EQ(standard.symbol_code, "GHOST");
}

TEST_F(IndexFileTest, LoadAllSkipsPlaceholderSlots) {
  IndexEntry used{.file_number = 4, .symbol = "USED"};
  IndexEntry unused{.file_number = 0, .symbol = "GHOST"};
  write_file(dir_ / "EMASTER", make_emaster({unused, used}));

  Index::IndexFile emaster(Index::EXTENDED_INDEX, dir_);
  std::vector<SymbolMetadata> symbols;
  ASSERT_TRUE(Index::load_all(emaster, symbols).ok());
  ASSERT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols[0].symbol_code, "USED");
  EXPECT_EQ(emaster.state(), Index::IndexFile::State::Closed);
}

TEST_F(IndexFileTest, AbsentFileIsNotAnError) {
  Index::IndexFile master(Index::STANDARD_INDEX, dir_);
  const Status status = master.open_if_present();
  EXPECT_TRUE(status.ok());
  EXPECT_FALSE(master.present());
  EXPECT_EQ(master.record_count(), 0u);

  std::vector<SymbolMetadata> symbols;
  EXPECT_TRUE(Index::load_all(master, symbols).ok());
  EXPECT_TRUE(symbols.empty());
}

TEST_F(IndexFileTest, DeclaredCountBeyondFileSize) {
  auto bytes = make_master({IndexEntry{.file_number = 1, .symbol = "A"}, IndexEntry{.file_number = 2, .symbol = "B"}});
  put_u16(bytes, 0, 5);
  write_file(dir_ / "MASTER", bytes);

  Index::IndexFile master(Index::STANDARD_INDEX, dir_);
  const Status status = master.open_if_present();
  EXPECT_EQ(status.kind(), ErrorKind::StructuralFormat);
  EXPECT_EQ(master.record_count(), 0u);

  std::vector<SymbolMetadata> symbols;
  Index::IndexFile again(Index::STANDARD_INDEX, dir_);
  EXPECT_EQ(Index::load_all(again, symbols).kind(), ErrorKind::StructuralFormat);
  EXPECT_TRUE(symbols.empty());
}

TEST_F(IndexFileTest, FileTooShortForHeader) {
  write_file(dir_ / "XMASTER", std::vector<uint8_t>(6, 0));
  Index::IndexFile xmaster(Index::CROSS_REFERENCE_INDEX, dir_);
  EXPECT_EQ(xmaster.open_if_present().kind(), ErrorKind::StructuralFormat);
}

TEST_F(IndexFileTest, LifecycleAndRangeChecks) {
  write_file(dir_ / "MASTER", make_master({IndexEntry{.file_number = 1, .symbol = "A"}}));

  Index::IndexFile master(Index::STANDARD_INDEX, dir_);
  EXPECT_EQ(master.state(), Index::IndexFile::State::Unopened);

  SymbolMetadata symbol;
  EXPECT_EQ(master.read_record_at(0, symbol).kind(), ErrorKind::StructuralFormat);

  ASSERT_TRUE(master.open_if_present().ok());
  EXPECT_EQ(master.state(), Index::IndexFile::State::Opened);
  EXPECT_TRUE(master.read_record_at(0, symbol).ok());
  EXPECT_EQ(master.read_record_at(1, symbol).kind(), ErrorKind::StructuralFormat);

  master.close();
  EXPECT_EQ(master.state(), Index::IndexFile::State::Closed);
  EXPECT_EQ(master.read_record_at(0, symbol).kind(), ErrorKind::StructuralFormat);
}

TEST_F(IndexFileTest, EmptyIndexHasNoRecords) {
  write_file(dir_ / "EMASTER", make_emaster({}));
  Index::IndexFile emaster(Index::EXTENDED_INDEX, dir_);
  ASSERT_TRUE(emaster.open_if_present().ok());
  EXPECT_TRUE(emaster.present());
  EXPECT_EQ(emaster.record_count(), 0u);
}

TEST_F(IndexFileTest, UnrepresentableIndexDateStaysInvalid) {
  std::vector<uint8_t> record(Index::STANDARD_INDEX.record_extent(), 0);
  put_u8(record, 0, 1);
  put_text(record, 36, 14, "ABC");
  const uint8_t huge[4] = {0x00, 0x00, 0x00, 0xFF};
  for (size_t i = 0; i < 4; ++i)
    record[25 + i] = huge[i];

  const SymbolMetadata symbol = Index::IndexFile::decode_record(Index::STANDARD_INDEX, record.data(), dir_);
  EXPECT_EQ(symbol.symbol_code, "ABC");
  EXPECT_FALSE(symbol.first_date.ok());
}
