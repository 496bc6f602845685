#include "parqlint/lint/cardinality.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

std::shared_ptr<parquet::WriterProperties> NoDictionary() {
  return parquet::WriterProperties::Builder().disable_dictionary()->build();
}

OptionalVector<std::string> Repeat(const std::vector<std::string>& values, size_t rows) {
  OptionalVector<std::string> result;
  for (size_t i = 0; i < rows; ++i) {
    result.emplace_back(values[i % values.size()]);
  }
  return result;
}

TEST(ScaleDistinctTest, Scales) {
  EXPECT_EQ(ScaleDistinct(10, 100, 1000), 100);
  EXPECT_EQ(ScaleDistinct(100, 100, 1000), 1000);
}

TEST(ScaleDistinctTest, Clamped) {
  EXPECT_EQ(ScaleDistinct(5, 10, 3), 3);
  EXPECT_EQ(ScaleDistinct(5, 1000, 1001), 5);
}

TEST(ScaleDistinctTest, EmptySample) { EXPECT_EQ(ScaleDistinct(0, 0, 50), 50); }

TEST(EstimateCardinalityTest, DictionaryPage) {
  Table table{.columns = {MakeStringColumn("s", 1, Repeat({"a", "b", "c", "d", "e"}, 1000))}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source, logger));
  ASSERT_EQ(estimates.size(), 1);
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 5, .non_null_count = 1000}));
  EXPECT_EQ(logger->Messages("metrics:cardinality:tier"), std::vector<std::string>{"dictionary"});
}

TEST(EstimateCardinalityTest, SampledValues) {
  OptionalVector<int64_t> unique;
  OptionalVector<int64_t> few;
  for (int64_t i = 0; i < 1000; ++i) {
    unique.emplace_back(i);
    few.emplace_back(i % 7);
  }
  Table table{.columns = {MakeInt64Column("unique", 1, unique), MakeInt64Column("few", 2, few)}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table, NoDictionary()));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source, logger));
  ASSERT_EQ(estimates.size(), 2);
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 1000, .non_null_count = 1000}));
  EXPECT_EQ(estimates[1], (ColumnCardinality{.distinct_count = 7, .non_null_count = 1000}));
  EXPECT_EQ(logger->Count("metrics:cardinality:tier"), 2);
}

TEST(EstimateCardinalityTest, NullsAreNotCounted) {
  OptionalVector<int32_t> values;
  for (int32_t i = 0; i < 100; ++i) {
    values.push_back(i % 2 == 0 ? std::optional<int32_t>(i) : std::nullopt);
  }
  Table table{.columns = {MakeInt32Column("x", 1, values)}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table, NoDictionary()));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source));
  ASSERT_EQ(estimates.size(), 1);
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 50, .non_null_count = 50}));
}

TEST(EstimateCardinalityTest, SampleOfFirstNonEmptyRowGroup) {
  OptionalVector<int64_t> values;
  for (int64_t i = 0; i < 400; ++i) {
    values.emplace_back(i < 100 ? i % 10 : i);
  }
  Table table{.columns = {MakeInt64Column("x", 1, values)}, .row_group_sizes = {0, 100, 300}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table, NoDictionary()));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source));
  ASSERT_EQ(estimates.size(), 1);
  // 10 distinct in 100 sampled values scale to 40 over the file
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 40, .non_null_count = 400}));
}

TEST(EstimateCardinalityTest, NestedColumnsAssumedUnique) {
  ArrayContainer vectors;
  for (int i = 0; i < 10; ++i) {
    vectors.arrays.push_back(OptionalVector<float>{1.0f, 1.0f, 1.0f});
  }
  Table table{.columns = {MakeFloatArrayColumn("vec", 1, vectors)}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table, NoDictionary()));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source, logger));
  ASSERT_EQ(estimates.size(), 1);
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 30, .non_null_count = 30}));
  EXPECT_EQ(logger->Count("degraded:cardinality"), 1);
}

TEST(EstimateCardinalityTest, EmptyRowGroup) {
  Table table{.columns = {MakeInt64Column("x", 1, {})}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  ASSIGN_OR_FAIL(auto estimates, EstimateCardinality(*source));
  ASSERT_EQ(estimates.size(), 1);
  EXPECT_EQ(estimates[0], (ColumnCardinality{.distinct_count = 0, .non_null_count = 0}));
  EXPECT_EQ(estimates[0].Ratio(), 0.0);
}

}  // namespace
}  // namespace parqlint
