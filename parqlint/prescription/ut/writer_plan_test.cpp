#include "parqlint/prescription/writer_plan.h"

#include <memory>

#include "gtest/gtest.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

using parquet::schema::ColumnPath;

class WriterPlanTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Table table{.columns = {MakeInt64Column("id", 1, {1}), MakeStringColumn("name", 2, {"a"}),
                           MakeDoubleColumn("score", 3, {1.0})}};
    buffer_ = ValueSafe(WriteToBuffer(table));
    source_ = ValueSafe(OpenBufferSource(buffer_));
  }

  const parquet::SchemaDescriptor& Schema() const { return *source_->Metadata()->schema(); }

  std::shared_ptr<arrow::Buffer> buffer_;
  FileSourcePtr source_;
};

TEST_F(WriterPlanTest, FileSettings) {
  WriterPlan plan;
  plan.compression = Codec::Zstd(7);
  plan.max_row_group_size = 0;
  plan.data_page_size_limit = 65536;
  plan.created_by = "parqlint test";

  auto properties = BuildWriterProperties(plan, Schema());
  auto id = ColumnPath::FromDotString("id");
  EXPECT_EQ(properties->compression(id), arrow::Compression::ZSTD);
  EXPECT_EQ(properties->compression_level(id), 7);
  EXPECT_EQ(properties->max_row_group_length(), 1);
  EXPECT_EQ(properties->data_pagesize(), 65536);
  EXPECT_EQ(properties->created_by(), "parqlint test");
}

TEST_F(WriterPlanTest, ColumnSettings) {
  WriterPlan plan;
  plan.compression = Codec::Snappy();
  plan.Column("name").compression = Codec::Gzip(4);
  plan.Column("name").dictionary = false;
  plan.Column("name").encoding = DataEncoding::kDeltaLengthByteArray;
  plan.Column("score").encoding = DataEncoding::kByteStreamSplit;
  plan.Column("id").statistics = StatisticsLevel::kNone;
  plan.Column("score").statistics = StatisticsLevel::kPage;

  auto properties = BuildWriterProperties(plan, Schema());
  auto id = ColumnPath::FromDotString("id");
  auto name = ColumnPath::FromDotString("name");
  auto score = ColumnPath::FromDotString("score");

  EXPECT_EQ(properties->compression(id), arrow::Compression::SNAPPY);
  EXPECT_EQ(properties->compression(name), arrow::Compression::GZIP);
  EXPECT_EQ(properties->compression_level(name), 4);
  EXPECT_FALSE(properties->dictionary_enabled(name));
  EXPECT_TRUE(properties->dictionary_enabled(id));
  EXPECT_EQ(properties->encoding(name), parquet::Encoding::DELTA_LENGTH_BYTE_ARRAY);
  EXPECT_EQ(properties->encoding(score), parquet::Encoding::BYTE_STREAM_SPLIT);
  EXPECT_FALSE(properties->statistics_enabled(id));
  EXPECT_TRUE(properties->statistics_enabled(score));
  EXPECT_TRUE(properties->page_index_enabled(score));
}

TEST_F(WriterPlanTest, UnsupportedSettingsAreLogged) {
  WriterPlan plan;
  plan.Column("missing").dictionary = true;
  plan.Column("id").encoding = DataEncoding::kByteStreamSplit;
  plan.Column("name").bloom_filter = true;

  auto logger = std::make_shared<CollectingLogger>();
  auto properties = BuildWriterProperties(plan, Schema(), logger);
  EXPECT_EQ(logger->Count("rewrite:unsupported"), 3);
  EXPECT_NE(properties->encoding(ColumnPath::FromDotString("id")), parquet::Encoding::BYTE_STREAM_SPLIT);
}

TEST_F(WriterPlanTest, DictionaryPageSizeLimitTakesLargest) {
  WriterPlan plan;
  plan.Column("id").dictionary_page_size_limit = 1 << 20;
  plan.Column("name").dictionary_page_size_limit = 4 << 20;

  auto properties = BuildWriterProperties(plan, Schema());
  EXPECT_EQ(properties->dictionary_pagesize_limit(), 4 << 20);
}

TEST(EncodingSupportTest, PhysicalTypes) {
  EXPECT_TRUE(IsEncodingSupported(DataEncoding::kPlain, parquet::Type::BOOLEAN));
  EXPECT_TRUE(IsEncodingSupported(DataEncoding::kDeltaBinaryPacked, parquet::Type::INT32));
  EXPECT_FALSE(IsEncodingSupported(DataEncoding::kDeltaBinaryPacked, parquet::Type::DOUBLE));
  EXPECT_TRUE(IsEncodingSupported(DataEncoding::kDeltaByteArray, parquet::Type::FIXED_LEN_BYTE_ARRAY));
  EXPECT_FALSE(IsEncodingSupported(DataEncoding::kDeltaLengthByteArray, parquet::Type::FIXED_LEN_BYTE_ARRAY));
  EXPECT_TRUE(IsEncodingSupported(DataEncoding::kByteStreamSplit, parquet::Type::FLOAT));
}

TEST(EncodingSupportTest, Conversions) {
  EXPECT_EQ(ToArrowCompression(CodecKind::kLz4Raw), arrow::Compression::LZ4);
  EXPECT_EQ(ToArrowCompression(CodecKind::kBrotli), arrow::Compression::BROTLI);
  EXPECT_EQ(ToParquetEncoding(DataEncoding::kDeltaByteArray), parquet::Encoding::DELTA_BYTE_ARRAY);
}

}  // namespace
}  // namespace parqlint
