#include "parqlint/prescription/directive.h"

#include <vector>

#include "gtest/gtest.h"
#include "parqlint/prescription/prescription.h"

namespace parqlint {
namespace {

TEST(DirectiveTest, CodecText) {
  EXPECT_EQ(Codec::Zstd(3).ToString(), "zstd(3)");
  EXPECT_EQ(Codec::Gzip(0).ToString(), "gzip(0)");
  EXPECT_EQ(Codec::Brotli(11).ToString(), "brotli(11)");
  EXPECT_EQ(Codec::Lz4Raw().ToString(), "lz4_raw");
  EXPECT_EQ(Codec::Uncompressed().ToString(), "uncompressed");
  EXPECT_FALSE(Codec::Snappy().HasLevel());
}

TEST(DirectiveTest, Text) {
  EXPECT_EQ(ToString(Directive{SetColumnCompression{.column = "a.b", .codec = Codec::Zstd(3)}}),
            "set column a.b compression zstd(3)");
  EXPECT_EQ(ToString(Directive{SetFileStatisticsTruncateLength{.length = std::nullopt}}),
            "set file statistics_truncate_length none");
  EXPECT_EQ(ToString(Directive{SetColumnBloomFilterFpp{.column = "id", .fpp = 0.01}}),
            "set column id bloom_filter_fpp 0.01");
  EXPECT_EQ(ToString(Directive{SetColumnEncoding{.column = "v", .encoding = DataEncoding::kByteStreamSplit}}),
            "set column v encoding byte_stream_split");
}

TEST(DirectiveTest, TextParsesBack) {
  const std::vector<Directive> directives = {
      SetFileCompression{.codec = Codec::Gzip(6)},
      SetFileMaxRowGroupSize{.rows = 1000000},
      SetFileDataPageSizeLimit{.bytes = 1048576},
      SetFileStatisticsTruncateLength{.length = 64},
      SetColumnCompression{.column = "a.b", .codec = Codec::Lz4Raw()},
      SetColumnEncoding{.column = "s", .encoding = DataEncoding::kDeltaLengthByteArray},
      SetColumnDictionary{.column = "s", .enabled = false},
      SetColumnDictionaryPageSizeLimit{.column = "s", .bytes = 4194304},
      SetColumnStatistics{.column = "x", .level = StatisticsLevel::kPage},
      SetColumnBloomFilter{.column = "id", .enabled = true},
      SetColumnBloomFilterNdv{.column = "id", .ndv = 12345},
      SetColumnBloomFilterFpp{.column = "id", .fpp = 0.001},
  };
  for (const auto& directive : directives) {
    auto parsed = Prescription::Parse(ToString(directive));
    ASSERT_EQ(parsed.Directives().size(), 1) << ToString(directive);
    EXPECT_EQ(parsed.Directives()[0], directive) << ToString(directive);
  }
}

TEST(DirectiveTest, ConflictKey) {
  EXPECT_EQ(ConflictKey(SetFileCompression{.codec = Codec::Snappy()}), "file compression");
  EXPECT_EQ(ConflictKey(SetColumnCompression{.column = "a.b", .codec = Codec::Snappy()}), "column a.b compression");
  EXPECT_EQ(ConflictKey(SetColumnBloomFilterNdv{.column = "id", .ndv = 1}), "column id bloom_filter_ndv");
}

TEST(DirectiveTest, ConflictValue) {
  EXPECT_EQ(ConflictValue(SetFileDataPageSizeLimit{.bytes = 1024}), "1024");
  EXPECT_EQ(ConflictValue(SetColumnDictionary{.column = "x", .enabled = true}), "true");
}

TEST(DirectiveTest, FormatDouble) {
  EXPECT_EQ(FormatDouble(0.01), "0.01");
  EXPECT_EQ(FormatDouble(1.0), "1");
  EXPECT_EQ(FormatDouble(0.1 + 0.2), "0.30000000000000004");
}

}  // namespace
}  // namespace parqlint
