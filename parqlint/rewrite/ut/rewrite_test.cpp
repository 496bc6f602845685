#include "parqlint/rewrite/rewrite.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "arrow/io/memory.h"
#include "gtest/gtest.h"
#include "parqlint/common/fs/filesystem_provider_impl.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/read.h"
#include "parqlint/test_utils/scoped_temp_dir.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

Table SampleTable() {
  OptionalVector<int64_t> ids;
  OptionalVector<std::string> names;
  OptionalVector<double> scores;
  for (int i = 0; i < 1000; ++i) {
    ids.emplace_back(i);
    names.emplace_back(i % 10 == 0 ? std::nullopt : std::optional<std::string>("name_" + std::to_string(i % 13)));
    scores.emplace_back(i * 0.25);
  }
  return Table{.columns = {MakeInt64Column("id", 1, ids), MakeStringColumn("name", 2, names),
                           MakeDoubleColumn("score", 3, scores)},
               .row_group_sizes = {400, 400, 200}};
}

// Accepts the leading magic bytes of a Parquet file, then fails every write.
class FailingOutputStream : public arrow::io::OutputStream {
 public:
  using arrow::io::OutputStream::Write;

  arrow::Status Write(const void*, int64_t nbytes) override {
    if (position_ + nbytes > 4) {
      return arrow::Status::IOError("no space left on device");
    }
    position_ += nbytes;
    return arrow::Status::OK();
  }

  arrow::Status Close() override {
    closed_ = true;
    return arrow::Status::OK();
  }

  bool closed() const override { return closed_; }

  arrow::Result<int64_t> Tell() const override { return position_; }

 private:
  int64_t position_ = 0;
  bool closed_ = false;
};

class RewriteTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto properties = parquet::WriterProperties::Builder().compression(arrow::Compression::SNAPPY)->build();
    ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(SampleTable(), properties));
    ASSIGN_OR_FAIL(source_, OpenBufferSource(buffer));
  }

  arrow::Result<FileSourcePtr> RewriteToBuffer(const Prescription& prescription, RewriteOptions options = {}) {
    ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
    ARROW_RETURN_NOT_OK(RewriteToStream(*source_, sink, prescription, options));
    // Close() keeps the buffer
    ARROW_ASSIGN_OR_RAISE(auto buffer, sink->Finish());
    return OpenBufferSource(buffer);
  }

  FileSourcePtr source_;
};

TEST_F(RewriteTest, EmptyPrescriptionKeepsProperties) {
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(Prescription{}));
  ASSERT_OK(VerifySameSchema(*source_, *output));

  auto metadata = output->Metadata();
  EXPECT_EQ(metadata->num_rows(), 1000);
  EXPECT_EQ(metadata->num_row_groups(), 3);
  for (int col = 0; col < metadata->num_columns(); ++col) {
    EXPECT_EQ(metadata->RowGroup(0)->ColumnChunk(col)->compression(), arrow::Compression::SNAPPY);
  }

  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*source_));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));
}

TEST_F(RewriteTest, AppliesDirectives) {
  auto prescription = Prescription::Parse(
      "set file compression zstd(3)\n"
      "set column name compression gzip(6)\n"
      "set column score encoding byte_stream_split\n"
      "set column score dictionary false\n"
      "set file max_row_group_size 250\n");
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(prescription));
  ASSERT_OK(VerifySameSchema(*source_, *output));

  auto metadata = output->Metadata();
  EXPECT_EQ(metadata->num_rows(), 1000);
  for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
    EXPECT_LE(metadata->RowGroup(rg)->num_rows(), 250);
  }
  auto chunk = [&](int col) { return metadata->RowGroup(0)->ColumnChunk(col); };
  EXPECT_EQ(chunk(0)->compression(), arrow::Compression::ZSTD);
  EXPECT_EQ(chunk(1)->compression(), arrow::Compression::GZIP);
  EXPECT_EQ(chunk(2)->compression(), arrow::Compression::ZSTD);
  EXPECT_FALSE(chunk(2)->has_dictionary_page());
  const auto& encodings = chunk(2)->encodings();
  EXPECT_NE(std::find(encodings.begin(), encodings.end(), parquet::Encoding::BYTE_STREAM_SPLIT), encodings.end());

  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*source_));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));
}

TEST_F(RewriteTest, ColumnCompressionSurvivesLaterFileCompression) {
  auto prescription = Prescription::Parse(
      "set column name compression gzip(6)\n"
      "set file compression zstd(3)\n");
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(prescription));

  auto metadata = output->Metadata();
  for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
    auto row_group = metadata->RowGroup(rg);
    EXPECT_EQ(row_group->ColumnChunk(0)->compression(), arrow::Compression::ZSTD);
    EXPECT_EQ(row_group->ColumnChunk(1)->compression(), arrow::Compression::GZIP);
    EXPECT_EQ(row_group->ColumnChunk(2)->compression(), arrow::Compression::ZSTD);
  }
}

TEST_F(RewriteTest, SmallBatches) {
  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(Prescription{}, RewriteOptions{.batch_size = 7, .logger = logger}));

  ASSERT_EQ(logger->Messages("metrics:rewrite:rows"), std::vector<std::string>{"1000"});
  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*source_));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));
}

TEST_F(RewriteTest, ConflictLastWins) {
  auto logger = std::make_shared<CollectingLogger>();
  auto prescription = Prescription::Parse("set file compression gzip(1)\nset file compression zstd(3)");
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(prescription, RewriteOptions{.logger = logger}));

  EXPECT_EQ(logger->Count("rewrite:conflict"), 1);
  EXPECT_EQ(output->Metadata()->RowGroup(0)->ColumnChunk(0)->compression(), arrow::Compression::ZSTD);
}

TEST_F(RewriteTest, UnsupportedSettingsAreSkipped) {
  auto logger = std::make_shared<CollectingLogger>();
  auto prescription = Prescription::Parse(
      "set column id encoding byte_stream_split\n"
      "set column missing compression snappy\n");
  ASSIGN_OR_FAIL(auto output, RewriteToBuffer(prescription, RewriteOptions{.logger = logger}));

  EXPECT_EQ(logger->Count("rewrite:unsupported"), 2);
  ASSERT_OK(VerifySameSchema(*source_, *output));
}

TEST_F(RewriteTest, SchemaMismatch) {
  Table other{.columns = {MakeInt64Column("id", 1, {1, 2, 3})}};
  ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(other));
  ASSIGN_OR_FAIL(auto other_source, OpenBufferSource(buffer));

  auto status = VerifySameSchema(*source_, *other_source);
  EXPECT_TRUE(status.IsInvalid()) << status.ToString();
}

TEST_F(RewriteTest, FailedWriteClosesSink) {
  auto sink = std::make_shared<FailingOutputStream>();
  auto status = RewriteToStream(*source_, sink, Prescription::Parse("set file max_row_group_size 100"));
  EXPECT_TRUE(status.IsIOError()) << status.ToString();
  EXPECT_TRUE(sink->closed());
}

TEST(RewriteFileTest, LocalFiles) {
  ScopedTempDir dir;
  const auto input_url = dir.FileUrl("input.parquet");
  const auto output_url = dir.FileUrl("output.parquet");
  ASSERT_OK(WriteToFile(SampleTable(), input_url));

  auto fs_provider = MakeDefaultFileSystemProvider();
  ASSERT_OK(Rewrite(fs_provider, input_url, output_url, Prescription::Parse("set file compression lz4_raw")));

  ASSIGN_OR_FAIL(auto input, OpenLocalSource(input_url));
  ASSIGN_OR_FAIL(auto output, OpenLocalSource(output_url));
  EXPECT_EQ(output->Metadata()->RowGroup(0)->ColumnChunk(0)->compression(), arrow::Compression::LZ4);

  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*input));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));
}

TEST(RewriteFileTest, MissingInput) {
  ScopedTempDir dir;
  auto status = Rewrite(MakeDefaultFileSystemProvider(), dir.FileUrl("absent.parquet"),
                        dir.FileUrl("output.parquet"), Prescription{});
  EXPECT_FALSE(status.ok());
}

TEST(RewriteFileTest, UnreadableInputLeavesNoOutput) {
  ScopedTempDir dir;
  const auto input_url = dir.FileUrl("input.parquet");
  const auto output_path = dir.path() / "output.parquet";
  ASSERT_OK(WriteToFile(SampleTable(), input_url));
  {
    // the first page header follows the magic bytes, the footer stays readable
    std::fstream input(dir.path() / "input.parquet", std::ios::in | std::ios::out | std::ios::binary);
    input.seekp(4);
    const std::string garbage(32, '\xff');
    input.write(garbage.data(), static_cast<std::streamsize>(garbage.size()));
  }

  bool failed = false;
  try {
    failed = !Rewrite(MakeDefaultFileSystemProvider(), input_url, dir.FileUrl("output.parquet"), Prescription{}).ok();
  } catch (const std::runtime_error&) {
    failed = true;
  }
  EXPECT_TRUE(failed);
  EXPECT_FALSE(std::filesystem::exists(output_path));
}

}  // namespace
}  // namespace parqlint
