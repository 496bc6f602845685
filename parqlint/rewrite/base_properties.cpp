#include "parqlint/rewrite/base_properties.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "arrow/util/compression.h"
#include "parqlint/result.h"
#include "parquet/schema.h"

namespace parqlint {

namespace {

// Counts in order of first appearance, so that ties go to the first seen value.
template <typename T>
class MajorityCounter {
 public:
  void Add(const T& value) {
    for (auto& [seen, count] : counts_) {
      if (seen == value) {
        ++count;
        return;
      }
    }
    counts_.emplace_back(value, 1);
  }

  std::optional<T> Majority() const {
    std::optional<T> result;
    int64_t best = 0;
    for (const auto& [value, count] : counts_) {
      if (count > best) {
        best = count;
        result = value;
      }
    }
    return result;
  }

 private:
  std::vector<std::pair<T, int64_t>> counts_;
};

std::optional<DataEncoding> ToDataEncoding(parquet::Encoding::type encoding) {
  switch (encoding) {
    case parquet::Encoding::PLAIN:
      return DataEncoding::kPlain;
    case parquet::Encoding::DELTA_BINARY_PACKED:
      return DataEncoding::kDeltaBinaryPacked;
    case parquet::Encoding::DELTA_LENGTH_BYTE_ARRAY:
      return DataEncoding::kDeltaLengthByteArray;
    case parquet::Encoding::DELTA_BYTE_ARRAY:
      return DataEncoding::kDeltaByteArray;
    case parquet::Encoding::BYTE_STREAM_SPLIT:
      return DataEncoding::kByteStreamSplit;
    default:
      return std::nullopt;
  }
}

// levels are not stored in the footer
Codec WithDefaultLevel(CodecKind kind, arrow::Compression::type compression) {
  return Codec{.kind = kind, .level = ValueSafe(arrow::util::Codec::DefaultCompressionLevel(compression))};
}

std::optional<Codec> ToCodec(arrow::Compression::type compression) {
  switch (compression) {
    case arrow::Compression::UNCOMPRESSED:
      return Codec::Uncompressed();
    case arrow::Compression::SNAPPY:
      return Codec::Snappy();
    case arrow::Compression::LZ4:
      return Codec::Lz4Raw();
    case arrow::Compression::GZIP:
      return WithDefaultLevel(CodecKind::kGzip, compression);
    case arrow::Compression::BROTLI:
      return WithDefaultLevel(CodecKind::kBrotli, compression);
    case arrow::Compression::ZSTD:
      return WithDefaultLevel(CodecKind::kZstd, compression);
    default:
      return std::nullopt;
  }
}

bool SameSortingColumns(const std::vector<parquet::SortingColumn>& lhs, const std::vector<parquet::SortingColumn>& rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                    [](const parquet::SortingColumn& a, const parquet::SortingColumn& b) {
                      return a.column_idx == b.column_idx && a.descending == b.descending &&
                             a.nulls_first == b.nulls_first;
                    });
}

std::vector<parquet::SortingColumn> CommonSortingColumns(const parquet::FileMetaData& metadata) {
  if (metadata.num_row_groups() == 0) {
    return {};
  }
  auto sorting_columns = metadata.RowGroup(0)->sorting_columns();
  for (int rg = 1; rg < metadata.num_row_groups(); ++rg) {
    if (!SameSortingColumns(sorting_columns, metadata.RowGroup(rg)->sorting_columns())) {
      return {};
    }
  }
  return sorting_columns;
}

bool HasDataPageV2(const parquet::ColumnChunkMetaData& chunk) {
  return std::any_of(chunk.encoding_stats().begin(), chunk.encoding_stats().end(),
                     [](const parquet::PageEncodingStats& stats) {
                       return stats.page_type == parquet::PageType::DATA_PAGE_V2;
                     });
}

ColumnPlan InferColumnPlan(const std::vector<const parquet::ColumnChunkMetaData*>& chunks,
                           parquet::Type::type physical_type) {
  ColumnPlan plan;

  MajorityCounter<arrow::Compression::type> compressions;
  bool dictionary = false;
  bool all_page_index = true;
  bool chunk_statistics = false;
  bool bloom_filter = false;
  int non_empty = 0;
  for (const auto* chunk : chunks) {
    compressions.Add(chunk->compression());
    if (chunk->bloom_filter_offset().has_value()) {
      bloom_filter = true;
    }
    if (chunk->num_values() == 0) {
      continue;
    }
    ++non_empty;
    dictionary = dictionary || chunk->has_dictionary_page();
    all_page_index = all_page_index && chunk->GetColumnIndexLocation().has_value();
    chunk_statistics = chunk_statistics || chunk->is_stats_set();
  }

  if (auto compression = compressions.Majority()) {
    plan.compression = ToCodec(*compression);
    plan.inferred_compression = plan.compression.has_value();
  }
  plan.dictionary = dictionary;

  if (auto encoding = MajorityDataEncoding(chunks)) {
    const bool plain_behind_dictionary = dictionary && *encoding == DataEncoding::kPlain;
    if (IsEncodingSupported(*encoding, physical_type) && !plain_behind_dictionary) {
      plan.encoding = *encoding;
    }
  }

  if (non_empty > 0) {
    if (all_page_index) {
      plan.statistics = StatisticsLevel::kPage;
    } else if (chunk_statistics) {
      plan.statistics = StatisticsLevel::kChunk;
    } else {
      plan.statistics = StatisticsLevel::kNone;
    }
  }
  if (bloom_filter) {
    plan.bloom_filter = true;
  }
  return plan;
}

}  // namespace

std::optional<DataEncoding> MajorityDataEncoding(const std::vector<const parquet::ColumnChunkMetaData*>& chunks) {
  MajorityCounter<parquet::Encoding::type> encodings;
  for (const auto* chunk : chunks) {
    for (auto encoding : chunk->encodings()) {
      switch (encoding) {
        case parquet::Encoding::RLE:
        case parquet::Encoding::BIT_PACKED:
        case parquet::Encoding::PLAIN_DICTIONARY:
        case parquet::Encoding::RLE_DICTIONARY:
          break;
        default:
          encodings.Add(encoding);
      }
    }
  }
  auto majority = encodings.Majority();
  return majority ? ToDataEncoding(*majority) : std::nullopt;
}

WriterPlan InferBaseWriterPlan(const parquet::FileMetaData& metadata) {
  WriterPlan plan;
  plan.version = metadata.version();
  plan.created_by = metadata.created_by();
  plan.sorting_columns = CommonSortingColumns(metadata);

  int64_t max_rows = 1;
  bool data_page_v2 = false;
  const auto& schema = *metadata.schema();
  for (int col = 0; col < schema.num_columns(); ++col) {
    std::vector<const parquet::ColumnChunkMetaData*> chunks;
    // keeps the chunk metadata alive while the raw pointers are used
    std::vector<std::unique_ptr<parquet::ColumnChunkMetaData>> owned;
    for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
      auto row_group = metadata.RowGroup(rg);
      max_rows = std::max(max_rows, row_group->num_rows());
      owned.push_back(row_group->ColumnChunk(col));
      chunks.push_back(owned.back().get());
      data_page_v2 = data_page_v2 || HasDataPageV2(*owned.back());
    }
    plan.columns.emplace(schema.Column(col)->path()->ToDotString(),
                         InferColumnPlan(chunks, schema.Column(col)->physical_type()));
  }

  plan.max_row_group_size = static_cast<uint64_t>(max_rows);
  plan.data_page_version = data_page_v2 ? parquet::ParquetDataPageVersion::V2 : parquet::ParquetDataPageVersion::V1;
  return plan;
}

}  // namespace parqlint
