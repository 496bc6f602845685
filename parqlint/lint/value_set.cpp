#include "parqlint/lint/value_set.h"

#include <bit>
#include <string_view>

#include "absl/hash/hash.h"
#include "arrow/array/array_binary.h"
#include "arrow/array/array_primitive.h"
#include "arrow/type_traits.h"

namespace parqlint {

namespace {

template <typename ArrowType>
void HashIntegers(const arrow::Array& array, absl::flat_hash_set<uint64_t>& hashes) {
  const auto& typed = static_cast<const typename arrow::TypeTraits<ArrowType>::ArrayType&>(array);
  for (int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsValid(i)) {
      hashes.insert(absl::HashOf(typed.Value(i)));
    }
  }
}

template <typename ArrowType, typename Bits>
void HashFloats(const arrow::Array& array, absl::flat_hash_set<uint64_t>& hashes) {
  const auto& typed = static_cast<const typename arrow::TypeTraits<ArrowType>::ArrayType&>(array);
  for (int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsValid(i)) {
      hashes.insert(absl::HashOf(std::bit_cast<Bits>(typed.Value(i))));
    }
  }
}

template <typename ArrayType>
void HashViews(const arrow::Array& array, absl::flat_hash_set<uint64_t>& hashes) {
  const auto& typed = static_cast<const ArrayType&>(array);
  for (int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsValid(i)) {
      hashes.insert(absl::HashOf(std::string_view(typed.GetView(i))));
    }
  }
}

}  // namespace

void DistinctValueCounter::Add(const arrow::Array& array) {
  non_null_values_ += array.length() - array.null_count();

  switch (array.type_id()) {
    case arrow::Type::BOOL: {
      const auto& typed = static_cast<const arrow::BooleanArray&>(array);
      for (int64_t i = 0; i < typed.length(); ++i) {
        if (typed.IsValid(i)) {
          hashes_.insert(absl::HashOf(typed.Value(i)));
        }
      }
      return;
    }
    case arrow::Type::INT8:
      return HashIntegers<arrow::Int8Type>(array, hashes_);
    case arrow::Type::INT16:
      return HashIntegers<arrow::Int16Type>(array, hashes_);
    case arrow::Type::INT32:
      return HashIntegers<arrow::Int32Type>(array, hashes_);
    case arrow::Type::INT64:
      return HashIntegers<arrow::Int64Type>(array, hashes_);
    case arrow::Type::UINT8:
      return HashIntegers<arrow::UInt8Type>(array, hashes_);
    case arrow::Type::UINT16:
      return HashIntegers<arrow::UInt16Type>(array, hashes_);
    case arrow::Type::UINT32:
      return HashIntegers<arrow::UInt32Type>(array, hashes_);
    case arrow::Type::UINT64:
      return HashIntegers<arrow::UInt64Type>(array, hashes_);
    case arrow::Type::DATE32:
      return HashIntegers<arrow::Date32Type>(array, hashes_);
    case arrow::Type::DATE64:
      return HashIntegers<arrow::Date64Type>(array, hashes_);
    case arrow::Type::TIME32:
      return HashIntegers<arrow::Time32Type>(array, hashes_);
    case arrow::Type::TIME64:
      return HashIntegers<arrow::Time64Type>(array, hashes_);
    case arrow::Type::TIMESTAMP:
      return HashIntegers<arrow::TimestampType>(array, hashes_);
    case arrow::Type::FLOAT:
      return HashFloats<arrow::FloatType, uint32_t>(array, hashes_);
    case arrow::Type::DOUBLE:
      return HashFloats<arrow::DoubleType, uint64_t>(array, hashes_);
    case arrow::Type::STRING:
    case arrow::Type::BINARY:
      return HashViews<arrow::BinaryArray>(array, hashes_);
    case arrow::Type::LARGE_STRING:
    case arrow::Type::LARGE_BINARY:
      return HashViews<arrow::LargeBinaryArray>(array, hashes_);
    case arrow::Type::FIXED_SIZE_BINARY:
    case arrow::Type::DECIMAL128:
    case arrow::Type::DECIMAL256:
      return HashViews<arrow::FixedSizeBinaryArray>(array, hashes_);
    default:
      opaque_values_ += array.length() - array.null_count();
      return;
  }
}

}  // namespace parqlint
