#include "parqlint/io/file_source.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "parqlint/common/fs/filesystem_provider_impl.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/scoped_temp_dir.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

class FileSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    OptionalVector<int64_t> ids;
    OptionalVector<std::string> names;
    for (int64_t i = 0; i < 100; ++i) {
      ids.emplace_back(i);
      names.emplace_back("name_" + std::to_string(i % 10));
    }
    url_ = dir_.FileUrl("data.parquet");
    Table table{.columns = {MakeInt64Column("id", 1, ids), MakeStringColumn("name", 2, names)},
                .row_group_sizes = {60, 40}};
    ASSERT_OK(WriteToFile(table, url_));
  }

  ScopedTempDir dir_;
  std::string url_;
};

TEST_F(FileSourceTest, Metadata) {
  ASSIGN_OR_FAIL(auto source, OpenLocalSource(url_));
  auto metadata = source->Metadata();
  EXPECT_EQ(metadata->num_rows(), 100);
  EXPECT_EQ(metadata->num_row_groups(), 2);
  EXPECT_EQ(metadata->num_columns(), 2);

  ASSIGN_OR_FAIL(auto schema, source->ArrowSchema());
  EXPECT_EQ(schema->field(1)->name(), "name");
}

TEST_F(FileSourceTest, BarePathIsLocalFile) {
  ASSIGN_OR_FAIL(auto source, OpenLocalSource((dir_.path() / "data.parquet").string()));
  EXPECT_EQ(source->Metadata()->num_rows(), 100);
}

TEST_F(FileSourceTest, BatchStreamProjection) {
  ASSIGN_OR_FAIL(auto source, OpenLocalSource(url_));
  ASSIGN_OR_FAIL(auto stream, source->OpenBatchStream(BatchStreamOptions{
                                  .row_groups = std::vector<int>{1}, .columns = std::vector<int>{0}, .batch_size = 16}));

  int64_t rows = 0;
  while (auto batch = stream->ReadNext()) {
    ASSERT_EQ(batch->num_columns(), 1);
    EXPECT_LE(batch->num_rows(), 16);
    rows += batch->num_rows();
  }
  EXPECT_EQ(rows, 40);
}

TEST_F(FileSourceTest, BatchStreamRowLimit) {
  ASSIGN_OR_FAIL(auto source, OpenLocalSource(url_));
  ASSIGN_OR_FAIL(auto stream, source->OpenBatchStream(BatchStreamOptions{.row_limit = 75}));

  int64_t rows = 0;
  while (auto batch = stream->ReadNext()) {
    EXPECT_EQ(batch->num_columns(), 2);
    rows += batch->num_rows();
  }
  EXPECT_EQ(rows, 75);
}

TEST_F(FileSourceTest, ReadRange) {
  ASSIGN_OR_FAIL(auto source, OpenLocalSource(url_));
  ASSIGN_OR_FAIL(auto magic, source->ReadRange(0, 4));
  EXPECT_EQ(magic->ToString(), "PAR1");

  EXPECT_TRUE(source->ReadRange(-1, 4).status().IsInvalid());
  EXPECT_FALSE(source->ReadRange(1 << 30, 4).ok());
}

TEST_F(FileSourceTest, CountsReads) {
  auto logger = std::make_shared<CollectingLogger>();
  {
    ASSIGN_OR_FAIL(auto source, OpenLocalSource(url_, logger));
    ASSERT_OK(source->ReadRange(0, 4));
  }
  ASSERT_EQ(logger->Count("metrics:io:requests"), 1);
  ASSERT_EQ(logger->Count("metrics:io:bytes"), 1);
  EXPECT_GT(std::stoll(logger->Messages("metrics:io:requests")[0]), 1);
}

TEST_F(FileSourceTest, MissingFile) { EXPECT_FALSE(OpenLocalSource(dir_.FileUrl("missing.parquet")).ok()); }

TEST_F(FileSourceTest, NotParquet) {
  auto provider = MakeDefaultFileSystemProvider();
  ASSIGN_OR_FAIL(auto fs, provider->GetFileSystem("file:///"));
  ASSIGN_OR_FAIL(auto out, fs->OpenOutputStream((dir_.path() / "text.parquet").string()));
  ASSERT_OK(out->Write("not a parquet file"));
  ASSERT_OK(out->Close());

  EXPECT_FALSE(OpenLocalSource(dir_.FileUrl("text.parquet")).ok());
}

TEST_F(FileSourceTest, UnknownScheme) {
  FileSourceProvider provider(MakeDefaultFileSystemProvider());
  EXPECT_FALSE(provider.Open("hdfs://namenode/data.parquet").ok());
}

TEST_F(FileSourceTest, S3RequiresConfig) {
  FileSourceProvider provider(MakeDefaultFileSystemProvider());
  EXPECT_FALSE(provider.Open("s3://bucket/data.parquet").ok());
}

}  // namespace
}  // namespace parqlint
