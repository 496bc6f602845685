#include "parqlint/lint/sampling.h"

#include "gtest/gtest.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

TEST(SamplingTest, PicksFirstNonEmptyRowGroup) {
  Table table{.columns = {MakeInt32Column("x", 1, {1, 2, 3})}, .row_group_sizes = {0, 0, 2, 1}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  EXPECT_EQ(PickSampleRowGroup(*source->Metadata()), 2);
}

TEST(SamplingTest, FlatSchema) {
  Table flat{.columns = {MakeInt32Column("x", 1, {1}), MakeStringColumn("s", 2, {"a"})}};
  ASSIGN_OR_FAIL(auto flat_buffer, WriteToBuffer(flat));
  ASSIGN_OR_FAIL(auto flat_source, OpenBufferSource(flat_buffer));
  EXPECT_TRUE(IsFlatSchema(*flat_source->Metadata()->schema()));

  Table nested{.columns = {MakeInt32Column("x", 1, {1}),
                           MakeFloatArrayColumn("vec", 2, ArrayContainer{.arrays = {OptionalVector<float>{1.0f}}})}};
  ASSIGN_OR_FAIL(auto nested_buffer, WriteToBuffer(nested));
  ASSIGN_OR_FAIL(auto nested_source, OpenBufferSource(nested_buffer));
  EXPECT_FALSE(IsFlatSchema(*nested_source->Metadata()->schema()));
}

TEST(SamplingTest, ChunkNonNullCount) {
  Table table{.columns = {MakeInt32Column("x", 1, {1, std::nullopt, 3, std::nullopt})}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  EXPECT_EQ(ChunkNonNullCount(*source->Metadata()->RowGroup(0)->ColumnChunk(0)), 2);
}

TEST(SamplingTest, StreamIsCapped) {
  OptionalVector<int32_t> values;
  for (int32_t i = 0; i < kSampleRows + 100; ++i) {
    values.emplace_back(i);
  }
  Table table{.columns = {MakeInt32Column("x", 1, values), MakeInt32Column("y", 2, values)}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  ASSIGN_OR_FAIL(auto stream, OpenSampleStream(*source, {1}));
  int64_t rows = 0;
  while (auto batch = stream->ReadNext()) {
    ASSERT_EQ(batch->num_columns(), 1);
    EXPECT_EQ(batch->schema()->field(0)->name(), "y");
    rows += batch->num_rows();
  }
  EXPECT_EQ(rows, kSampleRows);
}

TEST(SamplingTest, UnsortedColumns) {
  Table table{.columns = {MakeInt32Column("x", 1, {1}), MakeInt32Column("y", 2, {1})}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
  ASSIGN_OR_FAIL(auto source, OpenBufferSource(buffer));

  EXPECT_TRUE(OpenSampleStream(*source, {1, 0}).status().IsInvalid());
}

}  // namespace
}  // namespace parqlint
