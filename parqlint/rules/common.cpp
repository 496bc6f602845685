#include "parqlint/rules/common.h"

#include <algorithm>

#include "absl/strings/str_format.h"

namespace parqlint::rules {

std::string CompressionName(arrow::Compression::type compression) {
  switch (compression) {
    case arrow::Compression::UNCOMPRESSED:
      return "UNCOMPRESSED";
    case arrow::Compression::SNAPPY:
      return "SNAPPY";
    case arrow::Compression::GZIP:
      return "GZIP";
    case arrow::Compression::BROTLI:
      return "BROTLI";
    case arrow::Compression::ZSTD:
      return "ZSTD";
    case arrow::Compression::LZ4:
      return "LZ4_RAW";
    case arrow::Compression::LZ4_HADOOP:
    case arrow::Compression::LZ4_FRAME:
      return "LZ4";
    case arrow::Compression::LZO:
      return "LZO";
    case arrow::Compression::BZ2:
      return "BZ2";
  }
  return "UNKNOWN";
}

std::vector<parquet::Encoding::type> DataPageEncodings(const parquet::ColumnChunkMetaData& chunk) {
  std::vector<parquet::Encoding::type> result;
  auto add = [&result](parquet::Encoding::type encoding) {
    if (!HasEncoding(result, encoding)) {
      result.push_back(encoding);
    }
  };

  const auto& encoding_stats = chunk.encoding_stats();
  if (!encoding_stats.empty()) {
    for (const auto& stats : encoding_stats) {
      if (stats.page_type == parquet::PageType::DATA_PAGE || stats.page_type == parquet::PageType::DATA_PAGE_V2) {
        add(stats.encoding);
      }
    }
    return result;
  }

  for (auto encoding : chunk.encodings()) {
    if (encoding == parquet::Encoding::RLE || encoding == parquet::Encoding::BIT_PACKED) {
      continue;
    }
    add(encoding);
  }
  return result;
}

bool HasEncoding(const std::vector<parquet::Encoding::type>& encodings, parquet::Encoding::type encoding) {
  return std::find(encodings.begin(), encodings.end(), encoding) != encodings.end();
}

bool IsDictionaryEncoding(parquet::Encoding::type encoding) {
  return encoding == parquet::Encoding::PLAIN_DICTIONARY || encoding == parquet::Encoding::RLE_DICTIONARY;
}

bool IsTextLogicalType(const parquet::LogicalType& logical_type) {
  return logical_type.is_string() || logical_type.is_JSON() || logical_type.is_enum();
}

bool HasBloomFilter(const parquet::ColumnChunkMetaData& chunk) { return chunk.bloom_filter_offset().has_value(); }

ColumnLocation MakeColumnLocation(const ColumnContext& column) {
  return ColumnLocation{.index = column.column_index, .path = column.path};
}

std::string FormatFixed(double value, int precision) { return absl::StrFormat("%.*f", precision, value); }

double ToMiB(int64_t bytes) { return static_cast<double>(bytes) / static_cast<double>(kMiB); }

}  // namespace parqlint::rules
