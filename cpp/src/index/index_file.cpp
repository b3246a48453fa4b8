#include "index/index_file.hpp"
#include "codec/legacy_float.hpp"
#include "index/symbol_name.hpp"

#include <algorithm>
#include <system_error>

namespace MsBin::Index {

// ============================================================================
// LAYOUT TABLES
// ============================================================================

// clang-format off
const IndexLayout STANDARD_INDEX = {
    "standard", "MASTER", /*header_count*/ {0, 2}, /*header_last_file*/ {0, 0}, /*stride*/ 53,
    /*file_number*/     {0, 1},
    /*record_length*/   {3, 1},
    /*declared_fields*/ {4, 1},
    /*symbol*/          {36, 14},
    /*display_name*/    {7, 16},
    /*time_frame*/      {33, 1},
    /*first_date*/      {25, 4},
    /*last_date*/       {29, 4},
    DateEncoding::LegacyFloat, SymbolRule::Normalize, ".DAT", false};

const IndexLayout EXTENDED_INDEX = {
    "extended", "EMASTER", /*header_count*/ {0, 2}, /*header_last_file*/ {2, 2}, /*stride*/ 192,
    /*file_number*/     {2, 1},
    /*record_length*/   {0, 0},
    /*declared_fields*/ {6, 1},
    /*symbol*/          {11, 14},
    /*display_name*/    {32, 16},
    /*time_frame*/      {60, 1},
    /*first_date*/      {64, 4},
    /*last_date*/       {72, 4},
    DateEncoding::LegacyFloat, SymbolRule::Normalize, ".DAT", true};

const IndexLayout CROSS_REFERENCE_INDEX = {
    "cross-reference", "XMASTER", /*header_count*/ {10, 2}, /*header_last_file*/ {0, 0}, /*stride*/ 150,
    /*file_number*/     {65, 2},
    /*record_length*/   {0, 0},
    /*declared_fields*/ {0, 0},
    /*symbol*/          {1, 14},
    /*display_name*/    {16, 45},
    /*time_frame*/      {62, 1},
    /*first_date*/      {108, 4},
    /*last_date*/       {116, 4},
    DateEncoding::PlainInteger, SymbolRule::PaddedOnly, ".MWD", false};
// clang-format on

namespace {

size_t span_end(const FieldSpan &span) {
  return span.width == 0 ? 0 : span.offset + span.width;
}

std::chrono::year_month_day read_date(const IndexLayout &layout, const uint8_t *record, const FieldSpan &span) {
  const uint8_t *bytes = record + span.offset;
  if (layout.date_encoding == DateEncoding::PlainInteger)
    return Codec::int_to_date(Codec::read_u32(bytes));
  return Codec::decode_date(bytes);
}

} // namespace

size_t IndexLayout::header_extent() const {
  return std::max(span_end(header_count), span_end(header_last_file));
}

size_t IndexLayout::record_extent() const {
  return std::max({span_end(file_number), span_end(record_length), span_end(declared_fields),
                   span_end(symbol), span_end(display_name), span_end(time_frame),
                   span_end(first_date), span_end(last_date)});
}

// ============================================================================
// INDEX FILE
// ============================================================================

IndexFile::IndexFile(const IndexLayout &layout, std::filesystem::path data_dir)
    : layout_(layout), data_dir_(std::move(data_dir)) {
  record_buffer_.resize(layout_.record_extent());
}

IndexFile::~IndexFile() {
  close();
}

std::string IndexFile::describe() const {
  return std::string(layout_.variant) + " index " + path().string();
}

Status IndexFile::open_if_present() {
  if (state_ == State::Opened)
    return Status::Ok();

  const std::filesystem::path file_path = path();
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    present_ = false;
    record_count_ = 0;
    state_ = State::Opened;
    return Status::Ok();
  }

  const auto file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return Status::StructuralFormat("cannot stat " + describe() + ": " + ec.message());
  }

  file_.open(file_path, std::ios::binary);
  if (!file_.is_open()) {
    return Status::StructuralFormat("cannot open " + describe());
  }
  present_ = true;
  state_ = State::Opened;

  // header record
  std::vector<uint8_t> header(layout_.header_extent());
  if (file_size < header.size()) {
    return Status::StructuralFormat(describe() + ": file too short for header (" + std::to_string(file_size) + " bytes)");
  }
  file_.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(header.size()));
  if (!file_) {
    return Status::StructuralFormat(describe() + ": short read in header");
  }
  record_count_ = Codec::read_u16(header.data() + layout_.header_count.offset);
  if (layout_.header_last_file.width != 0)
    last_file_number_ = Codec::read_u16(header.data() + layout_.header_last_file.offset);

  // declared count must fit in the file
  if (record_count_ > 0) {
    const uintmax_t required = static_cast<uintmax_t>(record_count_) * layout_.stride + layout_.record_extent();
    if (file_size < required) {
      const size_t declared = record_count_;
      record_count_ = 0;
      return Status::StructuralFormat(describe() + ": declares " + std::to_string(declared) +
                                      " records but holds " + std::to_string(file_size) + " bytes (need " +
                                      std::to_string(required) + ")");
    }
  }
  return Status::Ok();
}

Status IndexFile::read_record_at(size_t index, SymbolMetadata &symbol) {
  if (state_ != State::Opened || !present_) {
    return Status::StructuralFormat(describe() + ": read on a file that is not open");
  }
  if (index >= record_count_) {
    return Status::StructuralFormat(describe() + ": record " + std::to_string(index) +
                                    " past declared count " + std::to_string(record_count_));
  }

  file_.clear();
  file_.seekg(static_cast<std::streamoff>((index + 1) * layout_.stride), std::ios::beg);
  file_.read(reinterpret_cast<char *>(record_buffer_.data()), static_cast<std::streamsize>(record_buffer_.size()));
  if (!file_) {
    return Status::StructuralFormat(describe() + ": short read at record " + std::to_string(index));
  }

  symbol = decode_record(layout_, record_buffer_.data(), data_dir_);
  return Status::Ok();
}

SymbolMetadata IndexFile::decode_record(const IndexLayout &layout, const uint8_t *record,
                                        const std::filesystem::path &data_dir) {
  SymbolMetadata symbol;
  symbol.file_number = layout.file_number.width == 2 ? Codec::read_u16(record + layout.file_number.offset)
                                                     : Codec::read_u8(record + layout.file_number.offset);
  if (symbol.file_number == 0 && layout.placeholder_short_circuit)
    return symbol;

  symbol.data_dir = data_dir;
  symbol.data_file_ext = layout.data_file_ext;

  if (layout.record_length.width != 0)
    symbol.record_length = Codec::read_u8(record + layout.record_length.offset);
  if (layout.declared_fields.width != 0)
    symbol.declared_fields = Codec::read_u8(record + layout.declared_fields.offset);

  const uint8_t *raw_symbol = record + layout.symbol.offset;
  symbol.symbol_code = layout.symbol_rule == SymbolRule::Normalize
                           ? SymbolName::normalize(raw_symbol, layout.symbol.width)
                           : SymbolName::padded_string(raw_symbol, layout.symbol.width);
  symbol.display_name = SymbolName::padded_string(record + layout.display_name.offset, layout.display_name.width);
  symbol.time_frame = static_cast<char>(record[layout.time_frame.offset]);
  symbol.first_date = read_date(layout, record, layout.first_date);
  symbol.last_date = read_date(layout, record, layout.last_date);
  return symbol;
}

void IndexFile::close() {
  if (file_.is_open())
    file_.close();
  if (state_ != State::Unopened)
    state_ = State::Closed;
}

// ============================================================================
// LOAD HELPER
// ============================================================================

Status load_all(IndexSource &source, std::vector<SymbolMetadata> &symbols) {
  Status status = source.open_if_present();
  if (!status.ok()) {
    source.close();
    return status;
  }

  const size_t count = source.record_count();
  symbols.reserve(symbols.size() + count);
  for (size_t i = 0; i < count; ++i) {
    SymbolMetadata symbol;
    status = source.read_record_at(i, symbol);
    if (!status.ok()) {
      source.close();
      return status;
    }
    if (symbol.file_number > 0)
      symbols.push_back(std::move(symbol));
  }
  source.close();
  return Status::Ok();
}

} // namespace MsBin::Index
