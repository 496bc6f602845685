#pragma once

#include <memory>

#include "arrow/array.h"
#include "arrow/array/builder_binary.h"
#include "arrow/array/builder_primitive.h"
#include "parqlint/result.h"
#include "parqlint/test_utils/optional_vector.h"

namespace parqlint {

// CreateArray<arrow::Int64Builder>(OptionalVector<int64_t>{1, std::nullopt, 3})
template <typename ArrayBuilder, typename OptVector>
std::shared_ptr<arrow::Array> CreateArray(const OptVector& values) {
  ArrayBuilder builder;
  Ensure(builder.Reserve(values.size()));
  for (const auto& value : values) {
    if (value.has_value()) {
      Ensure(builder.Append(value.value()));
    } else {
      Ensure(builder.AppendNull());
    }
  }
  return ValueSafe(builder.Finish());
}

}  // namespace parqlint
