#pragma once

#include "arrow/result.h"
#include "arrow/status.h"
#include "parqlint/common/error.h"

namespace parqlint {

inline void Ensure(const arrow::Status& s) { Ensure(s.ok(), s.ToString()); }

template <typename T>
T& ValueSafe(arrow::Result<T>& value) {
  Ensure(value.ok(), value.status().ToString());
  return value.ValueUnsafe();
}

template <typename T>
const T& ValueSafe(const arrow::Result<T>& value) {
  Ensure(value.ok(), value.status().ToString());
  return value.ValueUnsafe();
}

template <typename T>
T ValueSafe(arrow::Result<T>&& value) {
  Ensure(value.ok(), value.status().ToString());
  return value.MoveValueUnsafe();
}

}  // namespace parqlint
