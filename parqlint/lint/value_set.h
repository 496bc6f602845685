#pragma once

#include <cstdint>

#include "absl/container/flat_hash_set.h"
#include "arrow/array.h"

namespace parqlint {

// Counts distinct non-null values of arrays of one column.
// Floating point values are compared by bit pattern, so NaN payloads and -0.0 are distinct values.
// Values of unsupported types are all counted as distinct.
class DistinctValueCounter {
 public:
  void Add(const arrow::Array& array);

  uint64_t DistinctCount() const { return hashes_.size() + opaque_values_; }
  uint64_t NonNullCount() const { return non_null_values_; }

 private:
  absl::flat_hash_set<uint64_t> hashes_;
  uint64_t opaque_values_ = 0;
  uint64_t non_null_values_ = 0;
};

}  // namespace parqlint
