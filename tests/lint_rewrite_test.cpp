#include <memory>
#include <string>
#include <vector>

#include "arrow/api.h"
#include "gtest/gtest.h"
#include "parqlint/common/fs/filesystem_provider_impl.h"
#include "parqlint/lint/lint.h"
#include "parqlint/prescription/prescription.h"
#include "parqlint/rewrite/rewrite.h"
#include "parqlint/test_utils/arrow_array.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/read.h"
#include "parqlint/test_utils/scoped_temp_dir.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

class LintRewriteTest : public ::testing::Test {
 protected:
  void SetUp() override { fs_provider_ = MakeDefaultFileSystemProvider(); }

  std::string Url(const std::string& name) const { return dir_.FileUrl(name); }

  arrow::Result<std::vector<Diagnostic>> LintFile(const std::string& url, LintOptions options = {}) {
    return Lint(FileSourceProvider(fs_provider_), url, options);
  }

  ScopedTempDir dir_;
  std::shared_ptr<IFileSystemProvider> fs_provider_;
};

// ~90 bytes per value, repetitive enough for any codec
OptionalVector<std::string> CompressibleStrings(int count) {
  OptionalVector<std::string> result;
  result.reserve(count);
  for (int i = 0; i < count; ++i) {
    std::string value = "event=" + std::to_string(i % 1000) + ";source=collector;status=ok;";
    while (value.size() < 90) {
      value += "payload-";
    }
    result.emplace_back(value.substr(0, 90));
  }
  return result;
}

TEST_F(LintRewriteTest, WeakCodecOnLargeColumn) {
  Table table{.columns = {MakeBinaryColumn("events", 1, CompressibleStrings(120000))}};
  auto properties =
      parquet::WriterProperties::Builder().compression(arrow::Compression::LZ4)->disable_dictionary()->build();
  ASSERT_OK(WriteToFile(table, Url("weak_codec.parquet"), properties));

  ASSIGN_OR_FAIL(auto diagnostics,
                 LintFile(Url("weak_codec.parquet"),
                          LintOptions{.rule_names = std::vector<std::string>{"compression-codec-upgrade"}}));
  ASSERT_EQ(diagnostics.size(), 1);
  EXPECT_EQ(diagnostics[0].severity, Severity::kSuggestion);
  EXPECT_EQ(diagnostics[0].location, Location{ColumnLocation{.index = 0, .path = "events"}});
  EXPECT_EQ(diagnostics[0].prescription, Prescription::Parse("set column events compression zstd(3)"));
}

TEST_F(LintRewriteTest, LowCardinalityDictionaryIsKept) {
  OptionalVector<std::string> values;
  for (int i = 0; i < 1000; ++i) {
    values.emplace_back("category_" + std::to_string(i % 5));
  }
  Table table{.columns = {MakeStringColumn("category", 1, values)}};
  ASSERT_OK(WriteToFile(table, Url("categories.parquet")));

  ASSIGN_OR_FAIL(auto diagnostics, LintFile(Url("categories.parquet")));
  for (const auto& diagnostic : diagnostics) {
    EXPECT_NE(diagnostic.rule_name, "dictionary-encoding-cardinality") << diagnostic.ToString();
    EXPECT_NE(diagnostic.prescription, Prescription::Parse("set column category dictionary false"));
  }
}

TEST_F(LintRewriteTest, ConflictingFileCompression) {
  auto prescription = Prescription::Parse("set file compression zstd(3)\nset file compression snappy");
  auto conflict = prescription.Validate();
  ASSERT_TRUE(conflict.has_value());
  EXPECT_EQ(conflict->key, "file compression");
  EXPECT_EQ(conflict->first, "set file compression zstd(3)");
  EXPECT_EQ(conflict->second, "set file compression snappy");
}

TEST_F(LintRewriteTest, RewriteSingleNestedColumn) {
  auto b = CreateArray<arrow::Int64Builder>(OptionalVector<int64_t>{1, 2, std::nullopt, 4});
  auto struct_type = arrow::struct_({arrow::field("b", arrow::int64())});
  auto a = ValueSafe(arrow::StructArray::Make({b}, struct_type->fields()));
  auto c = CreateArray<arrow::StringBuilder>(OptionalVector<std::string>{"w", "x", "y", std::nullopt});
  auto schema = arrow::schema({arrow::field("a", struct_type), arrow::field("c", arrow::utf8())});
  auto arrow_table = arrow::Table::Make(schema, {a, c});

  const auto input_url = Url("nested.parquet");
  const auto output_url = Url("nested_rewritten.parquet");
  ASSERT_OK(WriteArrowTable(*arrow_table, input_url, 2,
                            parquet::WriterProperties::Builder().compression(arrow::Compression::SNAPPY)->build()));

  ASSERT_OK(Rewrite(fs_provider_, input_url, output_url, Prescription::Parse("set column a.b compression zstd(3)")));

  ASSIGN_OR_FAIL(auto input, OpenLocalSource(input_url));
  ASSIGN_OR_FAIL(auto output, OpenLocalSource(output_url));
  auto metadata = output->Metadata();
  ASSERT_EQ(metadata->num_columns(), 2);
  for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
    EXPECT_EQ(metadata->RowGroup(rg)->ColumnChunk(0)->compression(), arrow::Compression::ZSTD);
    EXPECT_EQ(metadata->RowGroup(rg)->ColumnChunk(1)->compression(), arrow::Compression::SNAPPY);
  }

  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*input));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));
}

TEST_F(LintRewriteTest, LintIsDeterministic) {
  OptionalVector<int64_t> ids;
  OptionalVector<double> scores;
  for (int i = 0; i < 5000; ++i) {
    ids.emplace_back(i);
    scores.emplace_back(i * 0.5);
  }
  Table table{.columns = {MakeInt64Column("id", 1, ids), MakeDoubleColumn("score", 2, scores),
                          MakeStringColumn("text", 3, CompressibleStrings(5000))},
              .row_group_sizes = {1000, 2000, 2000}};
  ASSERT_OK(WriteToFile(table, Url("deterministic.parquet"),
                        parquet::WriterProperties::Builder().disable_dictionary()->build()));

  ASSIGN_OR_FAIL(auto first, LintFile(Url("deterministic.parquet"), LintOptions{.gpu = true}));
  ASSIGN_OR_FAIL(auto second, LintFile(Url("deterministic.parquet"), LintOptions{.gpu = true}));
  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, second);
}

TEST_F(LintRewriteTest, ApplyLintFixes) {
  OptionalVector<int64_t> timestamps;
  OptionalVector<double> scores;
  OptionalVector<std::string> kinds;
  for (int i = 0; i < 3000; ++i) {
    timestamps.emplace_back(1700000000000000 + i * 1000000);
    scores.emplace_back(i / 3.0);
    kinds.emplace_back(i % 3 == 0 ? "a" : "b");
  }
  Table table{.columns = {MakeTimestampColumn("ts", 1, timestamps), MakeDoubleColumn("score", 2, scores),
                          MakeStringColumn("kind", 3, kinds)}};
  const auto input_url = Url("fixable.parquet");
  const auto output_url = Url("fixed.parquet");
  ASSERT_OK(WriteToFile(table, input_url, parquet::WriterProperties::Builder().disable_dictionary()->build()));

  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto diagnostics, LintFile(input_url));
  auto fixes = MergePrescriptions(diagnostics);
  ASSERT_FALSE(fixes.Empty());
  EXPECT_EQ(Prescription::Parse(fixes.Serialize()), fixes);

  ASSERT_OK(Rewrite(fs_provider_, input_url, output_url, fixes, RewriteOptions{.logger = logger}));
  EXPECT_EQ(logger->Count("rewrite:conflict"), 0);

  ASSIGN_OR_FAIL(auto input, OpenLocalSource(input_url));
  ASSIGN_OR_FAIL(auto output, OpenLocalSource(output_url));
  ASSIGN_OR_FAIL(auto expected, ReadAllRows(*input));
  ASSIGN_OR_FAIL(auto actual, ReadAllRows(*output));
  EXPECT_TRUE(expected->Equals(*actual));

  ASSIGN_OR_FAIL(auto after, LintFile(output_url));
  for (const auto& diagnostic : after) {
    EXPECT_NE(diagnostic.rule_name, "timestamp-delta-encoding") << diagnostic.ToString();
    EXPECT_NE(diagnostic.rule_name, "float-byte-stream-split") << diagnostic.ToString();
    EXPECT_NE(diagnostic.rule_name, "missing-page-statistics") << diagnostic.ToString();
  }
}

}  // namespace
}  // namespace parqlint
