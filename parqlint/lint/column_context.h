#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "arrow/result.h"
#include "arrow/type.h"
#include "parqlint/common/logger.h"
#include "parqlint/io/file_source.h"
#include "parqlint/lint/cardinality.h"
#include "parquet/schema.h"
#include "parquet/types.h"

namespace parqlint {

struct BooleanStats {
  std::optional<bool> min;
  std::optional<bool> max;
};

struct IntStats {
  // logical width (8, 16, 32 or 64), physical width without an integer annotation
  int bit_width = 64;
  bool is_signed = true;
  // INT32 values are widened, unsigned values are reinterpreted
  std::optional<int64_t> min;
  std::optional<int64_t> max;
};

struct FloatStats {
  int bit_width = 64;
  std::optional<double> min;
  std::optional<double> max;
};

struct ByteLengthStats {
  uint64_t min = 0;
  uint64_t max = 0;
  double avg = 0;
};

struct StringStats {
  std::optional<std::string> min_value;
  std::optional<std::string> max_value;
  // sampled
  std::optional<ByteLengthStats> lengths;
};

struct BinaryStats {
  std::optional<std::string> min_value;
  std::optional<std::string> max_value;
  std::optional<ByteLengthStats> lengths;
};

struct FixedLenBinaryStats {
  int type_length = 0;
  std::optional<std::string> min_value;
  std::optional<std::string> max_value;
};

struct UnknownStats {};

using TypeStats = std::variant<BooleanStats, IntStats, FloatStats, StringStats, BinaryStats, FixedLenBinaryStats,
                               UnknownStats>;

struct ColumnContext {
  int column_index = 0;
  // dot separated path of the leaf
  std::string path;
  parquet::Type::type physical_type = parquet::Type::UNDEFINED;
  // never nullptr, parquet::NoLogicalType when the column has no annotation
  std::shared_ptr<const parquet::LogicalType> logical_type;
  std::shared_ptr<arrow::DataType> value_type;
  int16_t max_repetition_level = 0;

  uint64_t num_values = 0;
  uint64_t null_count = 0;
  uint64_t distinct_count = 0;

  int64_t uncompressed_size = 0;
  int64_t compressed_size = 0;

  TypeStats type_stats = UnknownStats{};

  uint64_t NonNullCount() const { return num_values > null_count ? num_values - null_count : 0; }

  double NullRatio() const {
    return num_values == 0 ? 0.0 : static_cast<double>(null_count) / static_cast<double>(num_values);
  }

  double CardinalityRatio() const {
    const uint64_t non_null = NonNullCount();
    return non_null == 0 ? 0.0 : static_cast<double>(distinct_count) / static_cast<double>(non_null);
  }

  bool IsRepeated() const { return max_repetition_level > 0; }
};

// Value type a reader would produce for the leaf, derived from its physical type and annotation.
std::shared_ptr<arrow::DataType> MapValueType(const parquet::ColumnDescriptor& descriptor);

// Empty TypeStats of the variant matching the leaf.
TypeStats MakeEmptyTypeStats(const parquet::ColumnDescriptor& descriptor);

// Logical bit width and signedness of an integer leaf.
std::pair<int, bool> IntTypeInfo(const parquet::LogicalType& logical_type, int physical_bits);

// Builds one context per leaf column. Exact min/max come from chunk statistics marked exact in every non-empty
// row group; gaps (and byte lengths) are filled by one sample pass over all columns needing it, flat schemas only.
arrow::Result<std::vector<ColumnContext>> BuildColumnContexts(IFileSource& source,
                                                              const std::vector<ColumnCardinality>& cardinalities,
                                                              LoggerPtr logger = nullptr);

}  // namespace parqlint
