#include "parqlint/test_utils/column.h"

#include <utility>

namespace parqlint {

namespace {

ParquetColumn MakeColumn(const std::string& name, int field_id, parquet::Type::type physical_type,
                         std::shared_ptr<const parquet::LogicalType> logical_type, ParquetColumnData data) {
  return ParquetColumn{.info = ParquetInfo{.name = name,
                                           .physical_type = physical_type,
                                           .logical_type = std::move(logical_type),
                                           .field_id = field_id},
                       .data = std::move(data)};
}

}  // namespace

parquet::schema::NodePtr ParquetInfo::MakeField() const {
  if (repetition != parquet::Repetition::REPEATED) {
    return parquet::schema::PrimitiveNode::Make(name, repetition, logical_type, physical_type, length, field_id);
  }
  // optional group <name> (LIST) {
  //   repeated group list {
  //     optional <element-type> element;
  //   }
  // }
  auto element = parquet::schema::PrimitiveNode::Make("element", parquet::Repetition::OPTIONAL, logical_type,
                                                      physical_type, length);
  auto list = parquet::schema::GroupNode::Make("list", parquet::Repetition::REPEATED, {element});
  return parquet::schema::GroupNode::Make(name, parquet::Repetition::OPTIONAL, {list},
                                          parquet::ListLogicalType::Make(), field_id);
}

ParquetColumn MakeBoolColumn(const std::string& name, int field_id, const OptionalVector<bool>& data) {
  return MakeColumn(name, field_id, parquet::Type::BOOLEAN, parquet::LogicalType::None(), data);
}

ParquetColumn MakeInt32Column(const std::string& name, int field_id, const OptionalVector<int32_t>& data) {
  return MakeColumn(name, field_id, parquet::Type::INT32, parquet::IntLogicalType::Make(32, true), data);
}

ParquetColumn MakeInt64Column(const std::string& name, int field_id, const OptionalVector<int64_t>& data) {
  return MakeColumn(name, field_id, parquet::Type::INT64, parquet::IntLogicalType::Make(64, true), data);
}

ParquetColumn MakeUInt32Column(const std::string& name, int field_id, const OptionalVector<int32_t>& data) {
  return MakeColumn(name, field_id, parquet::Type::INT32, parquet::IntLogicalType::Make(32, false), data);
}

ParquetColumn MakeFloatColumn(const std::string& name, int field_id, const OptionalVector<float>& data) {
  return MakeColumn(name, field_id, parquet::Type::FLOAT, parquet::LogicalType::None(), data);
}

ParquetColumn MakeDoubleColumn(const std::string& name, int field_id, const OptionalVector<double>& data) {
  return MakeColumn(name, field_id, parquet::Type::DOUBLE, parquet::LogicalType::None(), data);
}

ParquetColumn MakeStringColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data) {
  return MakeColumn(name, field_id, parquet::Type::BYTE_ARRAY, parquet::StringLogicalType::Make(), data);
}

ParquetColumn MakeBinaryColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data) {
  return MakeColumn(name, field_id, parquet::Type::BYTE_ARRAY, parquet::LogicalType::None(), data);
}

ParquetColumn MakeUuidColumn(const std::string& name, int field_id, const OptionalVector<std::string>& data) {
  auto column =
      MakeColumn(name, field_id, parquet::Type::FIXED_LEN_BYTE_ARRAY, parquet::UUIDLogicalType::Make(), data);
  column.info.length = 16;
  return column;
}

ParquetColumn MakeTimestampColumn(const std::string& name, int field_id, const OptionalVector<int64_t>& data) {
  return MakeColumn(name, field_id, parquet::Type::INT64,
                    parquet::TimestampLogicalType::Make(false, parquet::LogicalType::TimeUnit::MICROS), data);
}

ParquetColumn MakeDateColumn(const std::string& name, int field_id, const OptionalVector<int32_t>& data) {
  return MakeColumn(name, field_id, parquet::Type::INT32, parquet::DateLogicalType::Make(), data);
}

ParquetColumn MakeFloatArrayColumn(const std::string& name, int field_id, const ArrayContainer& arrays) {
  auto column = MakeColumn(name, field_id, parquet::Type::FLOAT, parquet::LogicalType::None(), arrays);
  column.info.repetition = parquet::Repetition::REPEATED;
  return column;
}

size_t GetSize(const ParquetColumnData& data) {
  return std::visit([](const auto& values) -> size_t { return values.size(); }, data);
}

}  // namespace parqlint
