/**
 * @file npy_format_test.cpp
 * @brief Unit tests for structured .npy decoding
 */

#include "codec/npy_format.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>

#include "codec/dtype.h"

using namespace casereader::codec;
using casereader::utils::ErrorCode;

namespace {

/**
 * @brief Assemble a version 1.0 .npy file from a header and raw data
 */
std::string MakeNpy(const std::string& header, const std::string& data) {
  std::string padded = header + "\n";
  std::string out("\x93NUMPY", 6);
  out.push_back('\x01');
  out.push_back('\x00');
  out.push_back(static_cast<char>(padded.size() & 0xFF));
  out.push_back(static_cast<char>((padded.size() >> 8) & 0xFF));
  return out + padded + data;
}

template <typename T>
void AppendLittleEndian(T value, std::string& out) {
  char buffer[sizeof(T)];
  std::memcpy(buffer, &value, sizeof(T));
  if (!HostIsLittleEndian()) {
    std::reverse(buffer, buffer + sizeof(T));
  }
  out.append(buffer, sizeof(T));
}

}  // namespace

TEST(NpyFormatTest, WriteThenReadPreservesFieldsAndShapes) {
  NamedArrays fields = {{"x", NdArray({1}, {2.5})}, {"y", NdArray({2, 2}, {1.0, 2.0, 3.0, 4.0})}};

  auto decoded = ReadStructuredNpy(WriteStructuredNpy(fields));
  ASSERT_TRUE(decoded) << decoded.error().message();
  EXPECT_EQ(*decoded, fields);
}

TEST(NpyFormatTest, HeaderIsAlignedToSixtyFourBytes) {
  std::string bytes = WriteStructuredNpy({{"z", NdArray({2}, {1.0, 2.0})}});
  size_t header_len = static_cast<unsigned char>(bytes[8]) | (static_cast<unsigned char>(bytes[9]) << 8);
  EXPECT_EQ((10 + header_len) % 64, 0U);
  EXPECT_EQ(bytes[10 + header_len - 1], '\n');
}

TEST(NpyFormatTest, MixedDtypesWithPadding) {
  std::string data;
  AppendLittleEndian<double>(1.5, data);
  AppendLittleEndian<int32_t>(-3, data);
  AppendLittleEndian<int32_t>(7, data);
  data.append(4, '\0');  // padding field
  data.push_back('\x01');

  std::string npy = MakeNpy(
      "{'descr': [('a', '<f8'), ('b', '<i4', (2,)), ('', '|V4'), ('c', '|b1')], 'fortran_order': False, "
      "'shape': (1,), }",
      data);

  auto decoded = ReadStructuredNpy(npy);
  ASSERT_TRUE(decoded) << decoded.error().message();
  ASSERT_EQ(decoded->size(), 3U);
  EXPECT_EQ((*decoded)[0].first, "a");
  EXPECT_TRUE((*decoded)[0].second.shape.empty());
  EXPECT_DOUBLE_EQ((*decoded)[0].second.data[0], 1.5);
  EXPECT_EQ((*decoded)[1].first, "b");
  EXPECT_EQ((*decoded)[1].second, NdArray({2}, {-3.0, 7.0}));
  EXPECT_EQ((*decoded)[2].first, "c");
  EXPECT_DOUBLE_EQ((*decoded)[2].second.data[0], 1.0);
}

TEST(NpyFormatTest, BigEndianFields) {
  std::string data;
  double value = 4.25;
  char buffer[sizeof(double)];
  std::memcpy(buffer, &value, sizeof(double));
  if (HostIsLittleEndian()) {
    std::reverse(buffer, buffer + sizeof(double));
  }
  data.append(buffer, sizeof(double));

  auto decoded = ReadStructuredNpy(MakeNpy("{'descr': [('v', '>f8')], 'fortran_order': False, 'shape': (1,), }", data));
  ASSERT_TRUE(decoded) << decoded.error().message();
  EXPECT_DOUBLE_EQ((*decoded)[0].second.data[0], 4.25);
}

TEST(NpyFormatTest, MultipleRecordsPrependRecordShape) {
  std::string data;
  for (double value : {1.0, 2.0, 3.0}) {
    AppendLittleEndian<double>(value, data);
  }
  auto decoded = ReadStructuredNpy(MakeNpy("{'descr': [('v', '<f8')], 'fortran_order': False, 'shape': (3,), }", data));
  ASSERT_TRUE(decoded) << decoded.error().message();
  EXPECT_EQ((*decoded)[0].second, NdArray({3}, {1.0, 2.0, 3.0}));
}

TEST(NpyFormatTest, TitledFieldNamesUseTheName) {
  std::string data;
  AppendLittleEndian<double>(9.0, data);
  auto decoded = ReadStructuredNpy(
      MakeNpy("{'descr': [(('title', 'name'), '<f8')], 'fortran_order': False, 'shape': (1,), }", data));
  ASSERT_TRUE(decoded) << decoded.error().message();
  EXPECT_EQ((*decoded)[0].first, "name");
}

TEST(NpyFormatTest, MalformedInputs) {
  EXPECT_EQ(ReadStructuredNpy("not an npy file").error().code(), ErrorCode::kDecodeError);

  std::string truncated = WriteStructuredNpy({{"x", NdArray({3}, {1.0, 2.0, 3.0})}});
  truncated.resize(truncated.size() - 4);
  EXPECT_FALSE(ReadStructuredNpy(truncated));

  EXPECT_FALSE(ReadStructuredNpy(MakeNpy("{'descr': '<f8', 'fortran_order': False, 'shape': (1,), }", "")));
  EXPECT_FALSE(ReadStructuredNpy(MakeNpy("{'descr': [('o', '|O')], 'fortran_order': False, 'shape': (1,), }", "")));
  EXPECT_FALSE(
      ReadStructuredNpy(MakeNpy("{'descr': [('v', '<f8')], 'fortran_order': True, 'shape': (1,), }", "12345678")));
}

TEST(NpyFormatTest, OutOfRangeHeaderValuesAreDecodeErrors) {
  std::string one_double;
  AppendLittleEndian<double>(1.0, one_double);

  auto too_long = ReadStructuredNpy(
      MakeNpy("{'descr': [('v', '<f8')], 'fortran_order': False, 'shape': (99999999999999999999,), }", one_double));
  ASSERT_FALSE(too_long);
  EXPECT_EQ(too_long.error().code(), ErrorCode::kDecodeError);

  // Record count times record size wraps around size_t
  auto wrapping = ReadStructuredNpy(
      MakeNpy("{'descr': [('v', '<f8')], 'fortran_order': False, 'shape': (2305843009213693953,), }", one_double));
  ASSERT_FALSE(wrapping);
  EXPECT_EQ(wrapping.error().code(), ErrorCode::kDecodeError);

  auto huge_subshape = ReadStructuredNpy(MakeNpy(
      "{'descr': [('v', '<f8', (4611686018427387904, 4))], 'fortran_order': False, 'shape': (1,), }", one_double));
  ASSERT_FALSE(huge_subshape);
  EXPECT_EQ(huge_subshape.error().code(), ErrorCode::kDecodeError);

  EXPECT_FALSE(ReadStructuredNpy(MakeNpy("{'descr': [('v', '<f8')], 'fortran_order': False, 'shape': -1, }", "")));
  EXPECT_FALSE(
      ReadStructuredNpy(MakeNpy("{'descr': [('v', '<f8', (-2,))], 'fortran_order': False, 'shape': (1,), }", "")));
  EXPECT_FALSE(ReadStructuredNpy(
      MakeNpy("{'descr': [('v', '|V99999999999999999999999')], 'fortran_order': False, 'shape': (1,), }", "")));
}

TEST(NpyFormatTest, EmptySubshapeFieldsReadNoData) {
  std::string data;
  AppendLittleEndian<double>(4.0, data);
  auto decoded = ReadStructuredNpy(
      MakeNpy("{'descr': [('e', '<f8', (0,)), ('v', '<f8')], 'fortran_order': False, 'shape': (1,), }", data));
  ASSERT_TRUE(decoded) << decoded.error().message();
  ASSERT_EQ(decoded->size(), 2U);
  EXPECT_TRUE((*decoded)[0].second.data.empty());
  EXPECT_EQ((*decoded)[1].second, NdArray({}, {4.0}));
}

TEST(DtypeTest, ParseDtypeStrings) {
  auto f8 = ParseDtype("<f8");
  ASSERT_TRUE(f8);
  EXPECT_EQ(f8->kind, Dtype::Kind::kFloat);
  EXPECT_EQ(f8->itemsize, 8U);
  EXPECT_TRUE(f8->little_endian);

  auto i4 = ParseDtype(">i4");
  ASSERT_TRUE(i4);
  EXPECT_EQ(i4->kind, Dtype::Kind::kInt);
  EXPECT_FALSE(i4->little_endian);

  EXPECT_TRUE(ParseDtype("|b1"));
  EXPECT_TRUE(ParseDtype("u2"));
  EXPECT_FALSE(ParseDtype("<c16"));
  EXPECT_FALSE(ParseDtype("|O"));
  EXPECT_FALSE(ParseDtype(""));
  EXPECT_FALSE(ParseDtype("<f99999999999999999999999"));
}
