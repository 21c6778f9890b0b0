/**
 * @file npy_format.cpp
 * @brief Structured .npy reader/writer
 */

#include "codec/npy_format.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "codec/dtype.h"

namespace casereader::codec {

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr size_t kMagicLen = 6;
constexpr size_t kHeaderAlignment = 64;

utils::Unexpected<utils::Error> DecodeFailure(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, "npy: " + message));
}

/**
 * @brief Parser for the Python literal subset used in .npy headers
 *
 * dict, list, tuple, str, int, True, False, None. Tuples become JSON arrays.
 */
class LiteralParser {
 public:
  explicit LiteralParser(const std::string& text) : text_(text) {}

  utils::Expected<nlohmann::json, utils::Error> Parse() {
    auto value = ParseValue();
    if (!value) {
      return value;
    }
    SkipSpace();
    if (pos_ != text_.size()) {
      return DecodeFailure("trailing characters in header");
    }
    return value;
  }

 private:
  void SkipSpace() {
    while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\t')) {
      ++pos_;
    }
  }

  bool Consume(char expected) {
    SkipSpace();
    if (pos_ < text_.size() && text_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  utils::Expected<nlohmann::json, utils::Error> ParseValue() {
    SkipSpace();
    if (pos_ >= text_.size()) {
      return DecodeFailure("unexpected end of header");
    }
    char chr = text_[pos_];
    if (chr == '{') {
      return ParseDict();
    }
    if (chr == '[' || chr == '(') {
      return ParseSequence(chr == '[' ? ']' : ')');
    }
    if (chr == '\'' || chr == '"') {
      return ParseString();
    }
    if (chr == '-' || (chr >= '0' && chr <= '9')) {
      return ParseInteger();
    }
    return ParseKeyword();
  }

  utils::Expected<nlohmann::json, utils::Error> ParseDict() {
    ++pos_;
    nlohmann::json object = nlohmann::json::object();
    while (!Consume('}')) {
      auto key = ParseValue();
      if (!key) {
        return key;
      }
      if (!key->is_string()) {
        return DecodeFailure("non-string dict key in header");
      }
      if (!Consume(':')) {
        return DecodeFailure("expected ':' in header dict");
      }
      auto value = ParseValue();
      if (!value) {
        return value;
      }
      object[key->get<std::string>()] = std::move(*value);
      if (!Consume(',')) {
        if (!Consume('}')) {
          return DecodeFailure("expected ',' or '}' in header dict");
        }
        break;
      }
    }
    return object;
  }

  utils::Expected<nlohmann::json, utils::Error> ParseSequence(char closing) {
    ++pos_;
    nlohmann::json array = nlohmann::json::array();
    while (!Consume(closing)) {
      auto value = ParseValue();
      if (!value) {
        return value;
      }
      array.push_back(std::move(*value));
      if (!Consume(',')) {
        if (!Consume(closing)) {
          return DecodeFailure("unterminated sequence in header");
        }
        break;
      }
    }
    return array;
  }

  utils::Expected<nlohmann::json, utils::Error> ParseString() {
    char quote = text_[pos_++];
    std::string value;
    while (pos_ < text_.size() && text_[pos_] != quote) {
      if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
        ++pos_;
      }
      value += text_[pos_++];
    }
    if (pos_ >= text_.size()) {
      return DecodeFailure("unterminated string in header");
    }
    ++pos_;
    return nlohmann::json(value);
  }

  utils::Expected<nlohmann::json, utils::Error> ParseInteger() {
    size_t start = pos_;
    if (text_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      ++pos_;
    }
    // Python 2 headers may carry a long suffix: (1L,)
    std::string digits = text_.substr(start, pos_ - start);
    if (pos_ < text_.size() && text_[pos_] == 'L') {
      ++pos_;
    }
    if (digits.empty() || digits == "-") {
      return DecodeFailure("malformed integer in header");
    }
    try {
      return nlohmann::json(std::stoll(digits));
    } catch (const std::exception&) {
      return DecodeFailure("integer out of range in header: " + digits);
    }
  }

  utils::Expected<nlohmann::json, utils::Error> ParseKeyword() {
    static const std::pair<const char*, int> kKeywords[] = {{"True", 1}, {"False", 0}, {"None", -1}};
    for (const auto& [word, kind] : kKeywords) {
      size_t len = std::strlen(word);
      if (text_.compare(pos_, len, word) == 0) {
        pos_ += len;
        if (kind < 0) {
          return nlohmann::json(nullptr);
        }
        return nlohmann::json(kind == 1);
      }
    }
    return DecodeFailure("unexpected token in header at offset " + std::to_string(pos_));
  }

  const std::string& text_;
  size_t pos_ = 0;
};

uint32_t ReadLittleEndian(const std::string& bytes, size_t offset, size_t width) {
  uint32_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + i])) << (8 * i);
  }
  return value;
}

struct FieldLayout {
  std::string name;
  Dtype dtype;
  std::vector<size_t> subshape;
  size_t offset = 0;
};

utils::Expected<std::vector<size_t>, utils::Error> ShapeFromJson(const nlohmann::json& value) {
  std::vector<size_t> shape;
  if (value.is_number_integer()) {
    if (value.get<int64_t>() < 0) {
      return DecodeFailure("shape has a negative dimension");
    }
    shape.push_back(value.get<size_t>());
    return shape;
  }
  if (!value.is_array()) {
    return DecodeFailure("shape is not a tuple");
  }
  for (const auto& dim : value) {
    if (!dim.is_number_integer() || dim.get<int64_t>() < 0) {
      return DecodeFailure("shape has a non-integer dimension");
    }
    shape.push_back(dim.get<size_t>());
  }
  return shape;
}

std::string ShapeLiteral(const std::vector<size_t>& shape) {
  std::ostringstream out;
  out << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << shape[i];
  }
  if (shape.size() == 1) {
    out << ",";
  }
  out << ")";
  return out.str();
}

std::string QuoteName(const std::string& name) {
  char quote = name.find('\'') == std::string::npos ? '\'' : '"';
  return std::string(1, quote) + name + std::string(1, quote);
}

}  // namespace

utils::Expected<NamedArrays, utils::Error> ReadStructuredNpy(const std::string& bytes) {
  if (bytes.size() < kMagicLen + 4 || bytes.compare(0, kMagicLen, kMagic, kMagicLen) != 0) {
    return DecodeFailure("missing magic string");
  }

  auto major = static_cast<unsigned char>(bytes[kMagicLen]);
  size_t len_width = 0;
  if (major == 1) {
    len_width = 2;
  } else if (major == 2 || major == 3) {
    len_width = 4;
  } else {
    return DecodeFailure("unsupported .npy version " + std::to_string(major));
  }

  size_t prefix = kMagicLen + 2;
  if (bytes.size() < prefix + len_width) {
    return DecodeFailure("truncated header length");
  }
  size_t header_len = ReadLittleEndian(bytes, prefix, len_width);
  size_t data_start = prefix + len_width + header_len;
  if (bytes.size() < data_start) {
    return DecodeFailure("truncated header");
  }

  std::string header_text = bytes.substr(prefix + len_width, header_len);
  while (!header_text.empty() && (header_text.back() == '\n' || header_text.back() == ' ')) {
    header_text.pop_back();
  }

  auto header = LiteralParser(header_text).Parse();
  if (!header) {
    return utils::MakeUnexpected(header.error());
  }
  if (!header->is_object() || !header->contains("descr") || !header->contains("shape")) {
    return DecodeFailure("header lacks 'descr' or 'shape'");
  }
  if (header->value("fortran_order", false)) {
    return DecodeFailure("fortran-ordered structured arrays are not supported");
  }

  const auto& descr = (*header)["descr"];
  if (!descr.is_array()) {
    return DecodeFailure("expected a structured dtype");
  }

  auto record_shape = ShapeFromJson((*header)["shape"]);
  if (!record_shape) {
    return utils::MakeUnexpected(record_shape.error());
  }
  auto record_count = CheckedShapeSize(*record_shape);
  if (!record_count) {
    return DecodeFailure("record count overflows");
  }

  std::vector<FieldLayout> layout;
  size_t record_size = 0;
  for (const auto& entry : descr) {
    if (!entry.is_array() || entry.size() < 2) {
      return DecodeFailure("malformed descr entry");
    }
    FieldLayout field;
    const auto& name = entry[0];
    if (name.is_array() && name.size() == 2 && name[1].is_string()) {
      field.name = name[1].get<std::string>();
    } else if (name.is_string()) {
      field.name = name.get<std::string>();
    } else {
      return DecodeFailure("malformed field name");
    }
    if (!entry[1].is_string()) {
      return DecodeFailure("nested dtype for field '" + field.name + "'");
    }
    auto dtype = ParseDtype(entry[1].get<std::string>());
    if (!dtype) {
      return DecodeFailure(dtype.error().message() + " for field '" + field.name + "'");
    }
    field.dtype = *dtype;
    if (entry.size() >= 3) {
      auto subshape = ShapeFromJson(entry[2]);
      if (!subshape) {
        return utils::MakeUnexpected(subshape.error());
      }
      field.subshape = std::move(*subshape);
    }
    auto per_record = CheckedShapeSize(field.subshape);
    if (!per_record || (*per_record != 0 && field.dtype.itemsize > std::numeric_limits<size_t>::max() / *per_record)) {
      return DecodeFailure("field '" + field.name + "' is too large");
    }
    size_t field_size = field.dtype.itemsize * *per_record;
    if (field_size > std::numeric_limits<size_t>::max() - record_size) {
      return DecodeFailure("record size overflows");
    }
    field.offset = record_size;
    record_size += field_size;
    layout.push_back(std::move(field));
  }

  size_t data_size = bytes.size() - data_start;
  if (record_size != 0 && *record_count > data_size / record_size) {
    return DecodeFailure("truncated data section");
  }

  NamedArrays result;
  for (const auto& field : layout) {
    if (field.dtype.kind == Dtype::Kind::kVoid) {
      continue;
    }
    size_t per_record = ShapeSize(field.subshape);
    NdArray array;
    if (*record_count == 1) {
      array.shape = field.subshape;
    } else {
      array.shape = *record_shape;
      array.shape.insert(array.shape.end(), field.subshape.begin(), field.subshape.end());
    }
    size_t records = per_record == 0 ? 0 : *record_count;
    array.data.reserve(per_record * records);
    for (size_t record = 0; record < records; ++record) {
      const char* base = bytes.data() + data_start + record * record_size + field.offset;
      for (size_t i = 0; i < per_record; ++i) {
        array.data.push_back(ReadElement(base + i * field.dtype.itemsize, field.dtype));
      }
    }
    result.emplace_back(field.name, std::move(array));
  }
  return result;
}

std::string WriteStructuredNpy(const NamedArrays& fields) {
  std::ostringstream descr;
  descr << "[";
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      descr << ", ";
    }
    descr << "(" << QuoteName(fields[i].first) << ", '<f8'";
    if (!fields[i].second.shape.empty()) {
      descr << ", " << ShapeLiteral(fields[i].second.shape);
    }
    descr << ")";
  }
  descr << "]";

  std::string header = "{'descr': " + descr.str() + ", 'fortran_order': False, 'shape': (1,), }";
  size_t unpadded = kMagicLen + 2 + 2 + header.size() + 1;
  size_t padding = (kHeaderAlignment - unpadded % kHeaderAlignment) % kHeaderAlignment;
  header.append(padding, ' ');
  header.push_back('\n');

  std::string out(kMagic, kMagicLen);
  out.push_back('\x01');
  out.push_back('\x00');
  out.push_back(static_cast<char>(header.size() & 0xFF));
  out.push_back(static_cast<char>((header.size() >> 8) & 0xFF));
  out += header;

  bool swap = !HostIsLittleEndian();
  for (const auto& [name, array] : fields) {
    for (double value : array.data) {
      char buffer[sizeof(double)];
      std::memcpy(buffer, &value, sizeof(double));
      if (swap) {
        std::reverse(buffer, buffer + sizeof(double));
      }
      out.append(buffer, sizeof(double));
    }
  }
  return out;
}

}  // namespace casereader::codec
