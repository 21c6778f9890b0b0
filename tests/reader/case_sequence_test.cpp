/**
 * @file case_sequence_test.cpp
 * @brief Unit tests for lazy case sequences
 */

#include "reader/case_sequence.h"

#include <gtest/gtest.h>

using namespace casereader::reader;
using casereader::cases::Case;
using casereader::cases::CaseData;
using casereader::cases::CasePtr;
using casereader::cases::Category;
using casereader::utils::ErrorCode;

namespace {

CaseSequence::Fetcher CountingFetcher(int& fetches) {
  return [&fetches](const CaseSequence::Entry& entry) -> casereader::utils::Expected<CasePtr, casereader::utils::Error> {
    ++fetches;
    if (entry.key == "broken") {
      return casereader::utils::MakeUnexpected(
          casereader::utils::MakeError(ErrorCode::kDecodeError, "Cannot decode", entry.key));
    }
    CaseData data;
    data.category = entry.category;
    data.coordinate = entry.key;
    return std::make_shared<const Case>(std::move(data), nullptr);
  };
}

}  // namespace

TEST(CaseSequenceTest, FetchesLazily) {
  int fetches = 0;
  CaseSequence sequence({{Category::kDriver, "a"}, {Category::kSystem, "b"}}, CountingFetcher(fetches));
  EXPECT_EQ(sequence.Size(), 2U);
  EXPECT_EQ(fetches, 0);
  EXPECT_FALSE(sequence.Current());

  auto more = sequence.Next();
  ASSERT_TRUE(more);
  ASSERT_TRUE(*more);
  EXPECT_EQ(fetches, 1);
  EXPECT_EQ(sequence.Current()->Coordinate(), "a");

  more = sequence.Next();
  ASSERT_TRUE(more);
  ASSERT_TRUE(*more);
  EXPECT_EQ(sequence.Current()->GetCategory(), Category::kSystem);

  more = sequence.Next();
  ASSERT_TRUE(more);
  EXPECT_FALSE(*more);
  EXPECT_FALSE(sequence.Current());
  EXPECT_EQ(fetches, 2);
}

TEST(CaseSequenceTest, RestartAndCollect) {
  int fetches = 0;
  CaseSequence sequence({{Category::kDriver, "a"}, {Category::kDriver, "b"}, {Category::kDriver, "c"}},
                        CountingFetcher(fetches));
  ASSERT_TRUE(sequence.Next());

  auto rest = sequence.Collect();
  ASSERT_TRUE(rest);
  ASSERT_EQ(rest->size(), 2U);
  EXPECT_EQ((*rest)[0]->Coordinate(), "b");

  sequence.Restart();
  auto all = sequence.Collect();
  ASSERT_TRUE(all);
  EXPECT_EQ(all->size(), 3U);
  EXPECT_EQ(fetches, 6);
}

TEST(CaseSequenceTest, FetchErrorPropagates) {
  int fetches = 0;
  CaseSequence sequence({{Category::kDriver, "a"}, {Category::kDriver, "broken"}}, CountingFetcher(fetches));
  auto all = sequence.Collect();
  ASSERT_FALSE(all);
  EXPECT_EQ(all.error().code(), ErrorCode::kDecodeError);
  EXPECT_EQ(all.error().context(), "broken");
}

TEST(CaseSequenceTest, EmptyPlan) {
  int fetches = 0;
  CaseSequence sequence({}, CountingFetcher(fetches));
  auto more = sequence.Next();
  ASSERT_TRUE(more);
  EXPECT_FALSE(*more);
  EXPECT_TRUE(sequence.Plan().empty());
}
