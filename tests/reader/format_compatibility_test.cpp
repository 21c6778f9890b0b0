/**
 * @file format_compatibility_test.cpp
 * @brief Stores of every supported format version read the same
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "reader/case_reader.h"
#include "test_utils/sellar_store.h"

using casereader::codec::NdArray;
using casereader::reader::CaseReader;
using casereader::test::StoreBuilder;

namespace test = casereader::test;

class FormatCompatibilityTest : public ::testing::TestWithParam<int64_t> {};

TEST_P(FormatCompatibilityTest, DriverValues) {
  StoreBuilder builder("compat_v" + std::to_string(GetParam()), GetParam());
  test::WriteSellarCases(builder);

  auto reader = CaseReader::Open(builder.Path());
  ASSERT_TRUE(reader) << reader.error().message();
  EXPECT_EQ((*reader)->FormatVersion(), GetParam());

  auto last = (*reader)->GetCase("rank0:SLSQP|5");
  ASSERT_TRUE(last) << last.error().message();
  EXPECT_EQ(*(*last)->Get("z"), test::SellarZ(5));
  EXPECT_EQ(*(*last)->Get("pz.z"), test::SellarZ(5));
  EXPECT_EQ(*(*last)->Get("x"), NdArray::Scalar(test::SellarX(5)));

  auto desvars = (*last)->GetDesignVariables();
  EXPECT_EQ(desvars.size(), 2U);
  EXPECT_EQ((*last)->GetObjectives().at("obj"), NdArray::Scalar(test::SellarObjective(5)));
  EXPECT_EQ((*last)->GetConstraints().size(), 2U);

  auto driver_cases = (*reader)->ListCases("driver", false);
  ASSERT_TRUE(driver_cases);
  EXPECT_EQ(driver_cases->size(), 6U);
}

TEST_P(FormatCompatibilityTest, OptionalTables) {
  StoreBuilder builder("compat_tables_v" + std::to_string(GetParam()), GetParam());
  test::WriteSellarCases(builder, {2, 1});

  auto reader = CaseReader::Open(builder.Path());
  ASSERT_TRUE(reader) << reader.error().message();
  auto sources = (*reader)->ListSources();
  bool has_problem = std::find(sources.begin(), sources.end(), "problem") != sources.end();
  EXPECT_EQ(has_problem, GetParam() >= 2);

  auto derivatives = (*reader)->GetDerivativeCase(test::DriverCoordinate(1));
  EXPECT_EQ(static_cast<bool>(derivatives), GetParam() >= 2);
}

INSTANTIATE_TEST_SUITE_P(AllFormatVersions, FormatCompatibilityTest, ::testing::Values(1, 2, 3, 4));
