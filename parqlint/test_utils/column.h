#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "parqlint/test_utils/optional_vector.h"
#include "parquet/schema.h"
#include "parquet/types.h"

namespace parqlint {

struct ParquetInfo {
  std::string name;
  parquet::Type::type physical_type;
  std::shared_ptr<const parquet::LogicalType> logical_type;
  int field_id = -1;
  int length = -1;
  parquet::Repetition::type repetition = parquet::Repetition::OPTIONAL;

  // REPEATED columns become three-level lists of optional elements
  parquet::schema::NodePtr MakeField() const;
};

struct ArrayContainer;

// BYTE_ARRAY and FIXED_LEN_BYTE_ARRAY values are kept as strings
using ParquetColumnData =
    std::variant<OptionalVector<bool>, OptionalVector<int32_t>, OptionalVector<int64_t>, OptionalVector<float>,
                 OptionalVector<double>, OptionalVector<std::string>, ArrayContainer>;

// One list per row
struct ArrayContainer {
  std::vector<ParquetColumnData> arrays;

  size_t size() const { return arrays.size(); }
};

size_t GetSize(const ParquetColumnData& data);

struct ParquetColumn {
  ParquetInfo info;
  ParquetColumnData data;

  size_t Size() const { return GetSize(data); }
};

struct Table {
  std::vector<ParquetColumn> columns;
  // all rows in one row group if empty
  std::vector<size_t> row_group_sizes;
};

ParquetColumn MakeBoolColumn(const std::string& name, int field_id, const OptionalVector<bool>& data);
ParquetColumn MakeInt32Column(const std::string& name, int field_id, const OptionalVector<int32_t>& data);
ParquetColumn MakeInt64Column(const std::string& name, int field_id, const OptionalVector<int64_t>& data);
ParquetColumn MakeUInt32Column(const std::string& name, int field_id, const OptionalVector<int32_t>& data);
ParquetColumn MakeFloatColumn(const std::string& name, int field_id, const OptionalVector<float>& data);
ParquetColumn MakeDoubleColumn(const std::string& name, int field_id, const OptionalVector<double>& data);
ParquetColumn MakeStringColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data);
ParquetColumn MakeBinaryColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data);
ParquetColumn MakeUuidColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data);
ParquetColumn MakeTimestampColumn(const std::string& name, int field_id, const OptionalVector<int64_t>& data);
ParquetColumn MakeDateColumn(const std::string& name, int field_id, const OptionalVector<int32_t>& data);
ParquetColumn MakeFloatArrayColumn(const std::string& name, int field_id, const ArrayContainer& arrays);

}  // namespace parqlint
