#include "catalog/data_file.hpp"
#include "catalog/column_layout.hpp"
#include "codec/legacy_float.hpp"

#include <filesystem>
#include <iterator>
#include <system_error>
#include <variant>

namespace MsBin::Data {

DataFileReader::DataFileReader(const Codec::ColumnRegistry &registry) : registry_(registry) {}

DataFileReader::~DataFileReader() {
  close();
}

size_t DataFileReader::header_padding(size_t field_count) {
  return field_count > 0 ? (field_count - 1) * Codec::ColumnRegistry::DEFAULT_COLUMN_WIDTH : 0;
}

Status DataFileReader::fail(Status status) {
  status_ = std::move(status);
  close();
  return status_;
}

Status DataFileReader::open(const SymbolMetadata &symbol, const ColumnLayout &layout) {
  close();
  status_ = Status::Ok();
  records_read_ = 0;
  expected_records_ = 0;
  symbol_code_ = symbol.symbol_code;

  const std::filesystem::path file_path = symbol.data_file_path();
  path_ = file_path.string();

  slots_ = registry_.slots_for(layout);
  record_width_ = registry_.record_width(layout);
  record_buffer_.assign(record_width_, 0);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    return fail(Status::StructuralFormat("data file not found: " + path_));
  }
  const auto file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return fail(Status::StructuralFormat("cannot stat " + path_ + ": " + ec.message()));
  }

  file_.open(file_path, std::ios::binary);
  if (!file_.is_open()) {
    return fail(Status::StructuralFormat("cannot open " + path_));
  }

  uint8_t counts[HEADER_COUNTS_SIZE];
  file_.read(reinterpret_cast<char *>(counts), sizeof(counts));
  if (!file_) {
    return fail(Status::StructuralFormat(path_ + ": short read in header"));
  }
  max_records_ = Codec::read_u16(counts);
  last_record_ = Codec::read_u16(counts + 2);
  expected_records_ = last_record_ > 0 ? static_cast<size_t>(last_record_) - 1 : 0;

  // MASTER/EMASTER declare the field count; XMASTER symbols rely on the sidecar
  const size_t field_count = symbol.declared_fields != 0 ? symbol.declared_fields : layout.size();
  const size_t padding = header_padding(field_count);
  header_size_ = HEADER_COUNTS_SIZE + padding;

  const uintmax_t required = header_size_ + static_cast<uintmax_t>(expected_records_) * record_width_;
  if (file_size < required) {
    return fail(Status::StructuralFormat(path_ + ": declares " + std::to_string(expected_records_) + " records of " +
                                         std::to_string(record_width_) + " bytes but holds " +
                                         std::to_string(file_size) + " bytes (need " + std::to_string(required) + ")"));
  }

  file_.seekg(static_cast<std::streamoff>(padding), std::ios::cur);
  if (!file_) {
    return fail(Status::StructuralFormat(path_ + ": cannot skip header padding"));
  }
  return Status::Ok();
}

bool DataFileReader::next(DecodedRecord &record) {
  if (!status_.ok() || !file_.is_open() || records_read_ >= expected_records_)
    return false;

  file_.read(reinterpret_cast<char *>(record_buffer_.data()), static_cast<std::streamsize>(record_width_));
  if (!file_) {
    fail(Status::Decode(path_ + ": short read at record " + std::to_string(records_read_)));
    return false;
  }

  record.fields.clear();
  record.add(SYMBOL_KEY, symbol_code_);

  size_t offset = 0;
  for (const auto &slot : slots_) {
    if (const auto *column = std::get_if<Codec::KnownColumn>(&slot)) {
      std::string text;
      Status status = registry_.read_field(*column, record_buffer_.data() + offset, text);
      if (!status.ok()) {
        fail(Status::Decode(path_ + ": record " + std::to_string(records_read_) + ": " + status.message()));
        return false;
      }
      record.add(column->display_name, std::move(text));
    }
    offset += Codec::slot_width(slot);
  }

  ++records_read_;
  if (records_read_ == expected_records_)
    close();
  return true;
}

void DataFileReader::close() {
  if (file_.is_open())
    file_.close();
}

std::vector<std::string> output_keys(const ColumnLayout &layout, const Codec::ColumnRegistry &registry) {
  std::vector<std::string> keys = {SYMBOL_KEY};
  for (const auto &token : layout) {
    const Codec::ColumnSlot slot = registry.slot_for(token);
    if (const auto *column = std::get_if<Codec::KnownColumn>(&slot))
      keys.push_back(column->display_name);
  }
  return keys;
}

Status read_all(const SymbolMetadata &symbol, const Codec::ColumnRegistry &registry,
                std::vector<DecodedRecord> &records) {
  ColumnLayout layout;
  Status status = Layout::resolve(symbol, layout);
  if (!status.ok())
    return status;

  DataFileReader reader(registry);
  status = reader.open(symbol, layout);
  if (!status.ok())
    return status;

  // all or nothing: a failing symbol contributes no records
  std::vector<DecodedRecord> decoded;
  decoded.reserve(reader.expected_records());
  DecodedRecord record;
  while (reader.next(record)) {
    decoded.push_back(std::move(record));
  }
  if (!reader.status().ok())
    return reader.status();

  records.insert(records.end(), std::make_move_iterator(decoded.begin()), std::make_move_iterator(decoded.end()));
  return Status::Ok();
}

} // namespace MsBin::Data
