#include "parqlint/lint/column_context.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "arrow/array/array_binary.h"
#include "arrow/array/array_primitive.h"
#include "arrow/type_traits.h"
#include "parqlint/lint/sampling.h"
#include "parqlint/rules/common.h"
#include "parquet/metadata.h"
#include "parquet/statistics.h"

namespace parqlint {

namespace {

using LogicalTypePtr = std::shared_ptr<const parquet::LogicalType>;

arrow::TimeUnit::type ToArrowTimeUnit(parquet::LogicalType::TimeUnit::unit unit) {
  switch (unit) {
    case parquet::LogicalType::TimeUnit::MILLIS:
      return arrow::TimeUnit::MILLI;
    case parquet::LogicalType::TimeUnit::NANOS:
      return arrow::TimeUnit::NANO;
    default:
      return arrow::TimeUnit::MICRO;
  }
}

std::shared_ptr<arrow::DataType> DecimalType(const parquet::LogicalType& type) {
  const auto& decimal = static_cast<const parquet::DecimalLogicalType&>(type);
  return arrow::decimal128(decimal.precision(), decimal.scale());
}

// Byte array bounds may be truncated by the writer: only bounds explicitly marked exact are used.
// Fixed width bounds are exact unless the writer says otherwise.
std::pair<bool, bool> ExactBounds(const parquet::ColumnChunkMetaData& chunk) {
  auto encoded = chunk.encoded_statistics();
  if (!encoded) {
    return {false, false};
  }
  const bool fixed_width = chunk.type() != parquet::Type::BYTE_ARRAY;
  auto is_exact = [fixed_width](const std::optional<bool>& flag) { return flag.value_or(fixed_width); };
  return {is_exact(encoded->is_min_value_exact), is_exact(encoded->is_max_value_exact)};
}

template <typename Value>
struct Bounds {
  std::optional<Value> min;
  std::optional<Value> max;
};

// Aggregates exact chunk bounds over all row groups. A bound is known only if every row group with non-null values
// contributes an exact, representable one.
template <parquet::Type::type parquet_type, typename Value, typename Convert>
Bounds<Value> AggregateExactBounds(const parquet::FileMetaData& metadata, int column, Convert convert) {
  using TypedStatistics = parquet::TypedStatistics<parquet::PhysicalType<parquet_type>>;

  Bounds<Value> result;
  bool min_known = true;
  bool max_known = true;
  for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
    auto chunk = metadata.RowGroup(rg)->ColumnChunk(column);
    if (ChunkNonNullCount(*chunk) == 0) {
      continue;
    }
    auto stats = chunk->statistics();
    if (!stats || !stats->HasMinMax()) {
      return {};
    }
    const auto [min_exact, max_exact] = ExactBounds(*chunk);
    auto typed = std::static_pointer_cast<TypedStatistics>(stats);

    std::optional<Value> chunk_min = min_exact ? convert(typed->min()) : std::nullopt;
    std::optional<Value> chunk_max = max_exact ? convert(typed->max()) : std::nullopt;
    if (!chunk_min) {
      min_known = false;
    } else if (!result.min || *chunk_min < *result.min) {
      result.min = std::move(chunk_min);
    }
    if (!chunk_max) {
      max_known = false;
    } else if (!result.max || *result.max < *chunk_max) {
      result.max = std::move(chunk_max);
    }
  }
  if (!min_known) {
    result.min.reset();
  }
  if (!max_known) {
    result.max.reset();
  }
  return result;
}

template <typename Float>
std::optional<double> FloatValue(Float value) {
  if (std::isnan(value)) {
    return std::nullopt;
  }
  return static_cast<double>(value);
}

TypeStats ExtractTypeStats(const parquet::FileMetaData& metadata, int column) {
  const auto* descriptor = metadata.schema()->Column(column);
  TypeStats result = MakeEmptyTypeStats(*descriptor);

  switch (descriptor->physical_type()) {
    case parquet::Type::BOOLEAN: {
      auto bounds = AggregateExactBounds<parquet::Type::BOOLEAN, bool>(
          metadata, column, [](bool v) { return std::optional<bool>(v); });
      result = BooleanStats{.min = bounds.min, .max = bounds.max};
      break;
    }
    case parquet::Type::INT32: {
      auto& stats = std::get<IntStats>(result);
      auto bounds =
          stats.is_signed
              ? AggregateExactBounds<parquet::Type::INT32, int64_t>(
                    metadata, column, [](int32_t v) { return std::optional<int64_t>(v); })
              : AggregateExactBounds<parquet::Type::INT32, int64_t>(
                    metadata, column, [](int32_t v) { return std::optional<int64_t>(static_cast<uint32_t>(v)); });
      stats.min = bounds.min;
      stats.max = bounds.max;
      break;
    }
    case parquet::Type::INT64: {
      auto& stats = std::get<IntStats>(result);
      const bool is_signed = stats.is_signed;
      // unsigned values above INT64_MAX are not representable
      auto bounds = AggregateExactBounds<parquet::Type::INT64, int64_t>(
          metadata, column, [is_signed](int64_t v) -> std::optional<int64_t> {
            if (!is_signed && v < 0) {
              return std::nullopt;
            }
            return v;
          });
      stats.min = bounds.min;
      stats.max = bounds.max;
      break;
    }
    case parquet::Type::FLOAT: {
      auto bounds = AggregateExactBounds<parquet::Type::FLOAT, double>(metadata, column, FloatValue<float>);
      result = FloatStats{.bit_width = 32, .min = bounds.min, .max = bounds.max};
      break;
    }
    case parquet::Type::DOUBLE: {
      auto bounds = AggregateExactBounds<parquet::Type::DOUBLE, double>(metadata, column, FloatValue<double>);
      result = FloatStats{.bit_width = 64, .min = bounds.min, .max = bounds.max};
      break;
    }
    case parquet::Type::BYTE_ARRAY: {
      auto bounds =
          AggregateExactBounds<parquet::Type::BYTE_ARRAY, std::string>(metadata, column, [](const parquet::ByteArray& v) {
            return std::optional<std::string>(std::in_place, reinterpret_cast<const char*>(v.ptr), v.len);
          });
      std::visit(
          [&bounds](auto& stats) {
            if constexpr (std::is_same_v<std::decay_t<decltype(stats)>, StringStats> ||
                          std::is_same_v<std::decay_t<decltype(stats)>, BinaryStats>) {
              stats.min_value = bounds.min;
              stats.max_value = bounds.max;
            }
          },
          result);
      break;
    }
    case parquet::Type::FIXED_LEN_BYTE_ARRAY: {
      const int length = descriptor->type_length();
      auto bounds = AggregateExactBounds<parquet::Type::FIXED_LEN_BYTE_ARRAY, std::string>(
          metadata, column, [length](const parquet::FixedLenByteArray& v) {
            return std::optional<std::string>(std::in_place, reinterpret_cast<const char*>(v.ptr), length);
          });
      auto& stats = std::get<FixedLenBinaryStats>(result);
      stats.min_value = bounds.min;
      stats.max_value = bounds.max;
      break;
    }
    default:
      break;
  }
  return result;
}

// Typed accumulation of one sampled column.
class SampleAccumulator {
 public:
  void Add(const arrow::Array& array) {
    switch (array.type_id()) {
      case arrow::Type::BOOL: {
        const auto& typed = static_cast<const arrow::BooleanArray&>(array);
        for (int64_t i = 0; i < typed.length(); ++i) {
          if (typed.IsValid(i)) {
            Update(bool_bounds_, typed.Value(i));
          }
        }
        return;
      }
      case arrow::Type::INT8:
        return AddIntegers<arrow::Int8Type>(array);
      case arrow::Type::INT16:
        return AddIntegers<arrow::Int16Type>(array);
      case arrow::Type::INT32:
        return AddIntegers<arrow::Int32Type>(array);
      case arrow::Type::INT64:
        return AddIntegers<arrow::Int64Type>(array);
      case arrow::Type::UINT8:
        return AddIntegers<arrow::UInt8Type>(array);
      case arrow::Type::UINT16:
        return AddIntegers<arrow::UInt16Type>(array);
      case arrow::Type::UINT32:
        return AddIntegers<arrow::UInt32Type>(array);
      case arrow::Type::UINT64:
        return AddIntegers<arrow::UInt64Type>(array);
      case arrow::Type::DATE32:
        return AddIntegers<arrow::Date32Type>(array);
      case arrow::Type::DATE64:
        return AddIntegers<arrow::Date64Type>(array);
      case arrow::Type::TIME32:
        return AddIntegers<arrow::Time32Type>(array);
      case arrow::Type::TIME64:
        return AddIntegers<arrow::Time64Type>(array);
      case arrow::Type::TIMESTAMP:
        return AddIntegers<arrow::TimestampType>(array);
      case arrow::Type::FLOAT:
        return AddFloats<arrow::FloatType>(array);
      case arrow::Type::DOUBLE:
        return AddFloats<arrow::DoubleType>(array);
      case arrow::Type::STRING:
      case arrow::Type::BINARY:
        return AddBytes<arrow::BinaryArray>(array, true);
      case arrow::Type::LARGE_STRING:
      case arrow::Type::LARGE_BINARY:
        return AddBytes<arrow::LargeBinaryArray>(array, true);
      case arrow::Type::FIXED_SIZE_BINARY:
        return AddBytes<arrow::FixedSizeBinaryArray>(array, false);
      default:
        return;
    }
  }

  void FillMissing(TypeStats& type_stats) const {
    std::visit([this](auto& stats) { FillMissing(stats); }, type_stats);
  }

 private:
  template <typename Value>
  static void Update(Bounds<Value>& bounds, const Value& value) {
    if (!bounds.min || value < *bounds.min) {
      bounds.min = value;
    }
    if (!bounds.max || *bounds.max < value) {
      bounds.max = value;
    }
  }

  template <typename ArrowType>
  void AddIntegers(const arrow::Array& array) {
    const auto& typed = static_cast<const typename arrow::TypeTraits<ArrowType>::ArrayType&>(array);
    for (int64_t i = 0; i < typed.length(); ++i) {
      if (!typed.IsValid(i)) {
        continue;
      }
      const auto value = typed.Value(i);
      if constexpr (std::is_same_v<ArrowType, arrow::UInt64Type>) {
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          int_overflow_ = true;
          continue;
        }
      }
      Update(int_bounds_, static_cast<int64_t>(value));
    }
  }

  template <typename ArrowType>
  void AddFloats(const arrow::Array& array) {
    const auto& typed = static_cast<const typename arrow::TypeTraits<ArrowType>::ArrayType&>(array);
    for (int64_t i = 0; i < typed.length(); ++i) {
      if (typed.IsValid(i) && !std::isnan(typed.Value(i))) {
        Update(float_bounds_, static_cast<double>(typed.Value(i)));
      }
    }
  }

  template <typename ArrayType>
  void AddBytes(const arrow::Array& array, bool variable_length) {
    const auto& typed = static_cast<const ArrayType&>(array);
    for (int64_t i = 0; i < typed.length(); ++i) {
      if (!typed.IsValid(i)) {
        continue;
      }
      const std::string_view value = typed.GetView(i);
      if (!bytes_bounds_.min || value < *bytes_bounds_.min) {
        bytes_bounds_.min = std::string(value);
      }
      if (!bytes_bounds_.max || *bytes_bounds_.max < value) {
        bytes_bounds_.max = std::string(value);
      }
      if (variable_length) {
        const uint64_t length = value.size();
        length_min_ = length_count_ == 0 ? length : std::min(length_min_, length);
        length_max_ = std::max(length_max_, length);
        length_total_ += length;
        ++length_count_;
      }
    }
  }

  std::optional<ByteLengthStats> Lengths() const {
    if (length_count_ == 0) {
      return std::nullopt;
    }
    return ByteLengthStats{.min = length_min_,
                           .max = length_max_,
                           .avg = static_cast<double>(length_total_) / static_cast<double>(length_count_)};
  }

  template <typename Value>
  static void FillBound(std::optional<Value>& target, const std::optional<Value>& sampled) {
    if (!target) {
      target = sampled;
    }
  }

  void FillMissing(BooleanStats& stats) const {
    FillBound(stats.min, bool_bounds_.min);
    FillBound(stats.max, bool_bounds_.max);
  }

  void FillMissing(IntStats& stats) const {
    // the true bounds are unknown once a value did not fit
    if (int_overflow_) {
      return;
    }
    FillBound(stats.min, int_bounds_.min);
    FillBound(stats.max, int_bounds_.max);
  }

  void FillMissing(FloatStats& stats) const {
    FillBound(stats.min, float_bounds_.min);
    FillBound(stats.max, float_bounds_.max);
  }

  void FillMissing(StringStats& stats) const {
    FillBound(stats.min_value, bytes_bounds_.min);
    FillBound(stats.max_value, bytes_bounds_.max);
    FillBound(stats.lengths, Lengths());
  }

  void FillMissing(BinaryStats& stats) const {
    FillBound(stats.min_value, bytes_bounds_.min);
    FillBound(stats.max_value, bytes_bounds_.max);
    FillBound(stats.lengths, Lengths());
  }

  void FillMissing(FixedLenBinaryStats& stats) const {
    FillBound(stats.min_value, bytes_bounds_.min);
    FillBound(stats.max_value, bytes_bounds_.max);
  }

  void FillMissing(UnknownStats&) const {}

  Bounds<bool> bool_bounds_;
  Bounds<int64_t> int_bounds_;
  bool int_overflow_ = false;
  Bounds<double> float_bounds_;
  Bounds<std::string> bytes_bounds_;

  uint64_t length_count_ = 0;
  uint64_t length_total_ = 0;
  uint64_t length_min_ = 0;
  uint64_t length_max_ = 0;
};

bool NeedsSample(const TypeStats& type_stats) {
  return std::visit(
      [](const auto& stats) -> bool {
        using T = std::decay_t<decltype(stats)>;
        if constexpr (std::is_same_v<T, StringStats> || std::is_same_v<T, BinaryStats>) {
          return !stats.min_value || !stats.max_value || !stats.lengths;
        } else if constexpr (std::is_same_v<T, FixedLenBinaryStats>) {
          return !stats.min_value || !stats.max_value;
        } else if constexpr (std::is_same_v<T, UnknownStats>) {
          return false;
        } else {
          return !stats.min || !stats.max;
        }
      },
      type_stats);
}

arrow::Status SampleMissingStats(IFileSource& source, std::vector<ColumnContext>& columns) {
  std::vector<int> to_sample;
  for (const auto& column : columns) {
    if (NeedsSample(column.type_stats)) {
      to_sample.push_back(column.column_index);
    }
  }
  if (to_sample.empty()) {
    return arrow::Status::OK();
  }

  ARROW_ASSIGN_OR_RAISE(auto stream, OpenSampleStream(source, to_sample));
  std::vector<SampleAccumulator> accumulators(to_sample.size());
  while (auto batch = stream->ReadNext()) {
    for (size_t i = 0; i < to_sample.size(); ++i) {
      accumulators[i].Add(*batch->column(i));
    }
  }

  for (size_t i = 0; i < to_sample.size(); ++i) {
    accumulators[i].FillMissing(columns[to_sample[i]].type_stats);
  }
  return arrow::Status::OK();
}

}  // namespace

std::pair<int, bool> IntTypeInfo(const parquet::LogicalType& logical_type, int physical_bits) {
  if (logical_type.is_int()) {
    const auto& int_type = static_cast<const parquet::IntLogicalType&>(logical_type);
    return {int_type.bit_width(), int_type.is_signed()};
  }
  return {physical_bits, true};
}

std::shared_ptr<arrow::DataType> MapValueType(const parquet::ColumnDescriptor& descriptor) {
  LogicalTypePtr logical_type = descriptor.logical_type();
  if (!logical_type) {
    logical_type = parquet::NoLogicalType::Make();
  }

  switch (descriptor.physical_type()) {
    case parquet::Type::BOOLEAN:
      return arrow::boolean();
    case parquet::Type::INT32: {
      if (logical_type->is_int()) {
        auto [bit_width, is_signed] = IntTypeInfo(*logical_type, 32);
        switch (bit_width) {
          case 8:
            return is_signed ? arrow::int8() : arrow::uint8();
          case 16:
            return is_signed ? arrow::int16() : arrow::uint16();
          default:
            return is_signed ? arrow::int32() : arrow::uint32();
        }
      }
      if (logical_type->is_date()) {
        return arrow::date32();
      }
      if (logical_type->is_decimal()) {
        return DecimalType(*logical_type);
      }
      if (logical_type->is_time()) {
        return arrow::time32(arrow::TimeUnit::MILLI);
      }
      return arrow::int32();
    }
    case parquet::Type::INT64: {
      if (logical_type->is_int()) {
        return IntTypeInfo(*logical_type, 64).second ? arrow::int64() : arrow::uint64();
      }
      if (logical_type->is_timestamp()) {
        const auto& timestamp = static_cast<const parquet::TimestampLogicalType&>(*logical_type);
        return timestamp.is_adjusted_to_utc() ? arrow::timestamp(ToArrowTimeUnit(timestamp.time_unit()), "UTC")
                                              : arrow::timestamp(ToArrowTimeUnit(timestamp.time_unit()));
      }
      if (logical_type->is_time()) {
        const auto& time = static_cast<const parquet::TimeLogicalType&>(*logical_type);
        if (time.time_unit() == parquet::LogicalType::TimeUnit::MILLIS) {
          return arrow::int64();
        }
        return arrow::time64(ToArrowTimeUnit(time.time_unit()));
      }
      if (logical_type->is_decimal()) {
        return DecimalType(*logical_type);
      }
      return arrow::int64();
    }
    case parquet::Type::INT96:
      return arrow::timestamp(arrow::TimeUnit::NANO);
    case parquet::Type::FLOAT:
      return arrow::float32();
    case parquet::Type::DOUBLE:
      return arrow::float64();
    case parquet::Type::BYTE_ARRAY:
      if (rules::IsTextLogicalType(*logical_type)) {
        return arrow::utf8();
      }
      return arrow::binary();
    case parquet::Type::FIXED_LEN_BYTE_ARRAY:
      if (logical_type->is_decimal()) {
        return DecimalType(*logical_type);
      }
      return arrow::fixed_size_binary(descriptor.type_length());
    default:
      return arrow::null();
  }
}

TypeStats MakeEmptyTypeStats(const parquet::ColumnDescriptor& descriptor) {
  LogicalTypePtr logical_type = descriptor.logical_type();
  if (!logical_type) {
    logical_type = parquet::NoLogicalType::Make();
  }

  switch (descriptor.physical_type()) {
    case parquet::Type::BOOLEAN:
      return BooleanStats{};
    case parquet::Type::INT32:
    case parquet::Type::INT64: {
      const int physical_bits = descriptor.physical_type() == parquet::Type::INT32 ? 32 : 64;
      auto [bit_width, is_signed] = IntTypeInfo(*logical_type, physical_bits);
      return IntStats{.bit_width = bit_width, .is_signed = is_signed};
    }
    case parquet::Type::FLOAT:
      return FloatStats{.bit_width = 32};
    case parquet::Type::DOUBLE:
      return FloatStats{.bit_width = 64};
    case parquet::Type::BYTE_ARRAY:
      if (rules::IsTextLogicalType(*logical_type)) {
        return StringStats{};
      }
      return BinaryStats{};
    case parquet::Type::FIXED_LEN_BYTE_ARRAY:
      return FixedLenBinaryStats{.type_length = descriptor.type_length()};
    default:
      return UnknownStats{};
  }
}

arrow::Result<std::vector<ColumnContext>> BuildColumnContexts(IFileSource& source,
                                                              const std::vector<ColumnCardinality>& cardinalities,
                                                              LoggerPtr logger) {
  auto metadata = source.Metadata();
  const auto* schema = metadata->schema();
  const int num_columns = metadata->num_columns();
  if (metadata->num_row_groups() > 0 && static_cast<int>(cardinalities.size()) != num_columns) {
    return arrow::Status::Invalid("BuildColumnContexts: expected ", num_columns, " cardinalities, got ",
                                  cardinalities.size());
  }

  const bool is_flat = IsFlatSchema(*schema);

  std::vector<std::shared_ptr<arrow::DataType>> value_types(num_columns);
  if (is_flat) {
    auto maybe_schema = source.ArrowSchema();
    if (maybe_schema.ok() && (*maybe_schema)->num_fields() == num_columns) {
      for (int col = 0; col < num_columns; ++col) {
        value_types[col] = (*maybe_schema)->field(col)->type();
      }
    } else if (logger) {
      logger->Log("arrow schema unavailable, deriving value types from leaves", "degraded:column_context");
    }
  }

  std::vector<ColumnContext> columns;
  columns.reserve(num_columns);
  for (int col = 0; col < num_columns; ++col) {
    const auto* descriptor = schema->Column(col);

    ColumnContext context;
    context.column_index = col;
    context.path = descriptor->path()->ToDotString();
    context.physical_type = descriptor->physical_type();
    context.logical_type = descriptor->logical_type() ? descriptor->logical_type() : parquet::NoLogicalType::Make();
    context.value_type = value_types[col] ? value_types[col] : MapValueType(*descriptor);
    context.max_repetition_level = descriptor->max_repetition_level();

    for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
      auto chunk = metadata->RowGroup(rg)->ColumnChunk(col);
      if (chunk->num_values() > 0) {
        context.num_values += chunk->num_values();
      }
      if (auto stats = chunk->statistics(); stats && stats->HasNullCount() && stats->null_count() > 0) {
        context.null_count += stats->null_count();
      }
      context.uncompressed_size += chunk->total_uncompressed_size();
      context.compressed_size += chunk->total_compressed_size();
    }
    context.null_count = std::min(context.null_count, context.num_values);
    if (col < static_cast<int>(cardinalities.size())) {
      context.distinct_count = std::min(cardinalities[col].distinct_count, context.NonNullCount());
    }
    context.type_stats = ExtractTypeStats(*metadata, col);

    columns.push_back(std::move(context));
  }

  if (metadata->num_row_groups() == 0) {
    return columns;
  }
  if (!is_flat) {
    if (logger) {
      logger->Log("nested schema, statistics sampling skipped", "degraded:column_context");
    }
    return columns;
  }
  ARROW_RETURN_NOT_OK(SampleMissingStats(source, columns));
  return columns;
}

}  // namespace parqlint
