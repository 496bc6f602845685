#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arrow/result.h"
#include "arrow/util/compression.h"
#include "parqlint/common/logger.h"
#include "parqlint/prescription/directive.h"
#include "parquet/properties.h"
#include "parquet/schema.h"
#include "parquet/types.h"

namespace parqlint {

// statistics_truncate_length value meaning "no limit"
inline constexpr uint64_t kUnlimitedStatistics = std::numeric_limits<uint64_t>::max();

struct ColumnPlan {
  std::optional<Codec> compression;
  std::optional<DataEncoding> encoding;
  std::optional<bool> dictionary;
  std::optional<uint64_t> dictionary_page_size_limit;
  std::optional<StatisticsLevel> statistics;
  std::optional<bool> bloom_filter;
  std::optional<uint64_t> bloom_filter_ndv;
  std::optional<double> bloom_filter_fpp;
  // compression was inferred from the source file, a file level codec replaces it
  bool inferred_compression = false;

  bool operator==(const ColumnPlan& other) const = default;
};

// Physical properties of a file to write. Unset fields keep the writer defaults.
struct WriterPlan {
  std::optional<Codec> compression;
  std::optional<uint64_t> max_row_group_size;
  std::optional<uint64_t> data_page_size_limit;
  std::optional<uint64_t> statistics_truncate_length;

  std::optional<parquet::ParquetVersion::type> version;
  std::optional<parquet::ParquetDataPageVersion> data_page_version;
  std::optional<std::string> created_by;
  std::vector<parquet::SortingColumn> sorting_columns;

  // keyed by dot separated leaf path
  std::map<std::string, ColumnPlan> columns;

  ColumnPlan& Column(const std::string& path) { return columns[path]; }

  const ColumnPlan* FindColumn(const std::string& path) const {
    auto it = columns.find(path);
    return it == columns.end() ? nullptr : &it->second;
  }
};

arrow::Compression::type ToArrowCompression(CodecKind kind);
parquet::Encoding::type ToParquetEncoding(DataEncoding encoding);

// Whether the Parquet C++ writer can encode values of the physical type with the encoding.
bool IsEncodingSupported(DataEncoding encoding, parquet::Type::type physical_type);

// Converts the plan for a file with the given schema. Settings the writer cannot honor (unknown column paths,
// encodings invalid for the physical type, bloom filters) are skipped and reported as "rewrite:unsupported".
std::shared_ptr<parquet::WriterProperties> BuildWriterProperties(const WriterPlan& plan,
                                                                 const parquet::SchemaDescriptor& schema,
                                                                 LoggerPtr logger = nullptr);

}  // namespace parqlint
