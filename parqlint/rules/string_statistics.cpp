#include "parqlint/rules/string_statistics.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr size_t kMaxStatisticsLength = 64;

}  // namespace

std::vector<Diagnostic> StringStatisticsRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  for (const auto& column : context.columns) {
    if (column.physical_type != parquet::Type::BYTE_ARRAY) {
      continue;
    }

    int affected_groups = 0;
    size_t peak_min_length = 0;
    size_t peak_max_length = 0;
    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto encoded = metadata.RowGroup(rg)->ColumnChunk(column.column_index)->encoded_statistics();
      if (!encoded) {
        continue;
      }
      // writers that truncate say so, older writers never truncate
      const size_t min_length =
          encoded->has_min && encoded->is_min_value_exact.value_or(true) ? encoded->min().size() : 0;
      const size_t max_length =
          encoded->has_max && encoded->is_max_value_exact.value_or(true) ? encoded->max().size() : 0;
      if (min_length > kMaxStatisticsLength || max_length > kMaxStatisticsLength) {
        ++affected_groups;
        peak_min_length = std::max(peak_min_length, min_length);
        peak_max_length = std::max(peak_max_length, max_length);
      }
    }
    if (affected_groups == 0) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetFileStatisticsTruncateLength{.length = kMaxStatisticsLength});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kWarning,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("string statistics are large (up to min: ", peak_min_length, "B, max: ",
                                peak_max_length, "B) in ", affected_groups, "/", num_row_groups,
                                " row groups and untruncated; consider truncating to ", kMaxStatisticsLength,
                                " bytes"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
