#include "parqlint/prescription/writer_plan.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

namespace parqlint {

namespace {

void Unsupported(const LoggerPtr& logger, const std::string& message) {
  Log(logger, message, "rewrite:unsupported");
}

void ApplyCompression(parquet::WriterProperties::Builder& builder, const std::string& path, const Codec& codec) {
  builder.compression(path, ToArrowCompression(codec.kind));
  if (codec.HasLevel()) {
    builder.compression_level(path, codec.level);
  }
}

void ApplyStatistics(parquet::WriterProperties::Builder& builder, const std::string& path, StatisticsLevel level) {
  switch (level) {
    case StatisticsLevel::kNone:
      builder.disable_statistics(path);
      builder.disable_write_page_index(path);
      break;
    case StatisticsLevel::kChunk:
      builder.enable_statistics(path);
      builder.disable_write_page_index(path);
      break;
    case StatisticsLevel::kPage:
      builder.enable_statistics(path);
      builder.enable_write_page_index(path);
      break;
  }
}

}  // namespace

arrow::Compression::type ToArrowCompression(CodecKind kind) {
  switch (kind) {
    case CodecKind::kUncompressed:
      return arrow::Compression::UNCOMPRESSED;
    case CodecKind::kSnappy:
      return arrow::Compression::SNAPPY;
    case CodecKind::kGzip:
      return arrow::Compression::GZIP;
    case CodecKind::kBrotli:
      return arrow::Compression::BROTLI;
    case CodecKind::kZstd:
      return arrow::Compression::ZSTD;
    case CodecKind::kLz4Raw:
      // arrow's LZ4 is the raw block format, the hadoop framed one is LZ4_HADOOP
      return arrow::Compression::LZ4;
  }
  throw std::runtime_error("ToArrowCompression: unexpected codec kind");
}

parquet::Encoding::type ToParquetEncoding(DataEncoding encoding) {
  switch (encoding) {
    case DataEncoding::kPlain:
      return parquet::Encoding::PLAIN;
    case DataEncoding::kDeltaBinaryPacked:
      return parquet::Encoding::DELTA_BINARY_PACKED;
    case DataEncoding::kDeltaLengthByteArray:
      return parquet::Encoding::DELTA_LENGTH_BYTE_ARRAY;
    case DataEncoding::kDeltaByteArray:
      return parquet::Encoding::DELTA_BYTE_ARRAY;
    case DataEncoding::kByteStreamSplit:
      return parquet::Encoding::BYTE_STREAM_SPLIT;
  }
  throw std::runtime_error("ToParquetEncoding: unexpected data encoding");
}

bool IsEncodingSupported(DataEncoding encoding, parquet::Type::type physical_type) {
  switch (encoding) {
    case DataEncoding::kPlain:
      return true;
    case DataEncoding::kDeltaBinaryPacked:
      return physical_type == parquet::Type::INT32 || physical_type == parquet::Type::INT64;
    case DataEncoding::kDeltaLengthByteArray:
      return physical_type == parquet::Type::BYTE_ARRAY;
    case DataEncoding::kDeltaByteArray:
      return physical_type == parquet::Type::BYTE_ARRAY || physical_type == parquet::Type::FIXED_LEN_BYTE_ARRAY;
    case DataEncoding::kByteStreamSplit:
      return physical_type == parquet::Type::FLOAT || physical_type == parquet::Type::DOUBLE;
  }
  return false;
}

std::shared_ptr<parquet::WriterProperties> BuildWriterProperties(const WriterPlan& plan,
                                                                 const parquet::SchemaDescriptor& schema,
                                                                 LoggerPtr logger) {
  absl::flat_hash_map<std::string, parquet::Type::type> leaf_types;
  for (int i = 0; i < schema.num_columns(); ++i) {
    leaf_types[schema.Column(i)->path()->ToDotString()] = schema.Column(i)->physical_type();
  }

  parquet::WriterProperties::Builder builder;

  if (plan.compression) {
    builder.compression(ToArrowCompression(plan.compression->kind));
    if (plan.compression->HasLevel()) {
      builder.compression_level(plan.compression->level);
    }
  }
  if (plan.max_row_group_size) {
    builder.max_row_group_length(static_cast<int64_t>(std::max<uint64_t>(*plan.max_row_group_size, 1)));
  }
  if (plan.data_page_size_limit) {
    builder.data_pagesize(static_cast<int64_t>(*plan.data_page_size_limit));
  }
  if (plan.statistics_truncate_length) {
    const uint64_t length = *plan.statistics_truncate_length;
    builder.max_statistics_size(length == kUnlimitedStatistics ? std::numeric_limits<size_t>::max()
                                                               : static_cast<size_t>(length));
  }
  if (plan.version) {
    builder.version(*plan.version);
  }
  if (plan.data_page_version) {
    builder.data_page_version(*plan.data_page_version);
  }
  if (plan.created_by) {
    builder.created_by(*plan.created_by);
  }
  if (!plan.sorting_columns.empty()) {
    builder.set_sorting_columns(plan.sorting_columns);
  }

  std::optional<uint64_t> dictionary_page_size_limit;
  for (const auto& [path, column] : plan.columns) {
    auto leaf = leaf_types.find(path);
    if (leaf == leaf_types.end()) {
      Unsupported(logger, absl::StrCat("column ", path, " does not exist, its settings are skipped"));
      continue;
    }
    const parquet::Type::type physical_type = leaf->second;

    if (column.compression) {
      ApplyCompression(builder, path, *column.compression);
    }
    if (column.dictionary) {
      if (*column.dictionary) {
        builder.enable_dictionary(path);
      } else {
        builder.disable_dictionary(path);
      }
    }
    if (column.encoding) {
      if (IsEncodingSupported(*column.encoding, physical_type)) {
        builder.encoding(path, ToParquetEncoding(*column.encoding));
      } else {
        Unsupported(logger, absl::StrCat("encoding ", ToString(*column.encoding), " is not supported for column ",
                                         path, " of type ", parquet::TypeToString(physical_type)));
      }
    }
    if (column.dictionary_page_size_limit) {
      // the Parquet C++ writer has a single dictionary page size limit
      dictionary_page_size_limit = std::max(dictionary_page_size_limit.value_or(0), *column.dictionary_page_size_limit);
    }
    if (column.statistics) {
      ApplyStatistics(builder, path, *column.statistics);
    }
    if (column.bloom_filter.value_or(false) || column.bloom_filter_ndv || column.bloom_filter_fpp) {
      Unsupported(logger, absl::StrCat("bloom filter settings of column ", path, " are not written"));
    }
  }
  if (dictionary_page_size_limit) {
    builder.dictionary_pagesize_limit(static_cast<int64_t>(*dictionary_page_size_limit));
  }

  return builder.build();
}

}  // namespace parqlint
