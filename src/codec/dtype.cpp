/**
 * @file dtype.cpp
 * @brief NumPy dtype parsing
 */

#include "codec/dtype.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace casereader::codec {

namespace {

template <typename T>
T LoadAs(const char* data, bool swap) {
  char buffer[sizeof(T)];
  std::memcpy(buffer, data, sizeof(T));
  if (swap) {
    std::reverse(buffer, buffer + sizeof(T));
  }
  T value;
  std::memcpy(&value, buffer, sizeof(T));
  return value;
}

}  // namespace

bool HostIsLittleEndian() {
  const uint16_t marker = 1;
  unsigned char first = 0;
  std::memcpy(&first, &marker, 1);
  return first == 1;
}

utils::Expected<Dtype, utils::Error> ParseDtype(const std::string& descr) {
  auto fail = [&descr]() {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, "Unsupported dtype '" + descr + "'"));
  };

  if (descr.empty()) {
    return fail();
  }

  Dtype dtype;
  size_t pos = 0;
  switch (descr[0]) {
    case '<':
      dtype.little_endian = true;
      pos = 1;
      break;
    case '>':
      dtype.little_endian = false;
      pos = 1;
      break;
    case '|':
    case '=':
      dtype.little_endian = HostIsLittleEndian();
      pos = 1;
      break;
    default:
      dtype.little_endian = HostIsLittleEndian();
      break;
  }

  if (pos >= descr.size()) {
    return fail();
  }
  char kind = descr[pos++];
  std::string size_text = descr.substr(pos);
  if (size_text.empty() || !std::all_of(size_text.begin(), size_text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return fail();
  }
  try {
    dtype.itemsize = static_cast<size_t>(std::stoul(size_text));
  } catch (const std::exception&) {
    return fail();
  }

  switch (kind) {
    case 'f':
      dtype.kind = Dtype::Kind::kFloat;
      if (dtype.itemsize != 4 && dtype.itemsize != 8) {
        return fail();
      }
      break;
    case 'i':
    case 'u':
      dtype.kind = kind == 'i' ? Dtype::Kind::kInt : Dtype::Kind::kUnsigned;
      if (dtype.itemsize != 1 && dtype.itemsize != 2 && dtype.itemsize != 4 && dtype.itemsize != 8) {
        return fail();
      }
      break;
    case 'b':
      dtype.kind = Dtype::Kind::kBool;
      if (dtype.itemsize != 1) {
        return fail();
      }
      break;
    case 'V':
      dtype.kind = Dtype::Kind::kVoid;
      break;
    default:
      return fail();
  }
  return dtype;
}

double ReadElement(const char* data, const Dtype& dtype) {
  bool swap = dtype.little_endian != HostIsLittleEndian();
  switch (dtype.kind) {
    case Dtype::Kind::kFloat:
      if (dtype.itemsize == 4) {
        return static_cast<double>(LoadAs<float>(data, swap));
      }
      return LoadAs<double>(data, swap);
    case Dtype::Kind::kInt:
      switch (dtype.itemsize) {
        case 1:
          return static_cast<double>(LoadAs<int8_t>(data, false));
        case 2:
          return static_cast<double>(LoadAs<int16_t>(data, swap));
        case 4:
          return static_cast<double>(LoadAs<int32_t>(data, swap));
        default:
          return static_cast<double>(LoadAs<int64_t>(data, swap));
      }
    case Dtype::Kind::kUnsigned:
      switch (dtype.itemsize) {
        case 1:
          return static_cast<double>(LoadAs<uint8_t>(data, false));
        case 2:
          return static_cast<double>(LoadAs<uint16_t>(data, swap));
        case 4:
          return static_cast<double>(LoadAs<uint32_t>(data, swap));
        default:
          return static_cast<double>(LoadAs<uint64_t>(data, swap));
      }
    case Dtype::Kind::kBool:
      return data[0] != 0 ? 1.0 : 0.0;
    case Dtype::Kind::kVoid:
      break;
  }
  return 0.0;
}

}  // namespace casereader::codec
