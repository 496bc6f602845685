#pragma once

#include <cstdint>
#include <vector>

#include "arrow/result.h"
#include "parqlint/common/logger.h"
#include "parqlint/io/file_source.h"

namespace parqlint {

struct ColumnCardinality {
  uint64_t distinct_count = 0;
  uint64_t non_null_count = 0;

  // 0 when the column has no non-null values
  double Ratio() const {
    return non_null_count == 0 ? 0.0 : static_cast<double>(distinct_count) / static_cast<double>(non_null_count);
  }

  bool operator==(const ColumnCardinality& other) const = default;
};

// Scales a distinct count observed on `sample_total` values to `full_total` values.
// The result is clamped to [sample_distinct, full_total].
uint64_t ScaleDistinct(uint64_t sample_distinct, uint64_t sample_total, uint64_t full_total);

// One estimate per leaf column, resolved in order by
// 1. distinct_count of the representative row group statistics,
// 2. the entry count of its dictionary page,
// 3. hashing a sample of its values (flat schemas only).
// Columns left unresolved are assumed to be fully unique.
//
// Reads at most one dictionary page per column and one sample of kSampleRows rows.
// Failures of the dictionary page read degrade to the next tier, failures of the sample pass are returned.
arrow::Result<std::vector<ColumnCardinality>> EstimateCardinality(IFileSource& source, LoggerPtr logger = nullptr);

}  // namespace parqlint
