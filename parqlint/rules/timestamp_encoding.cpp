#include "parqlint/rules/timestamp_encoding.h"

#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

std::vector<Diagnostic> TimestampEncodingRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  for (const auto& column : context.columns) {
    const bool is_int = column.physical_type == parquet::Type::INT32 || column.physical_type == parquet::Type::INT64;
    const bool is_temporal = column.logical_type->is_timestamp() || column.logical_type->is_date();
    if (!is_int || !is_temporal || column.IsRepeated()) {
      continue;
    }

    int plain_groups = 0;
    int non_empty_groups = 0;
    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      if (chunk->num_values() == 0) {
        continue;
      }
      ++non_empty_groups;
      const auto encodings = DataPageEncodings(*chunk);
      if (HasEncoding(encodings, parquet::Encoding::PLAIN) &&
          !HasEncoding(encodings, parquet::Encoding::DELTA_BINARY_PACKED)) {
        ++plain_groups;
      }
    }
    if (plain_groups == 0) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetColumnEncoding{.column = column.path, .encoding = DataEncoding::kDeltaBinaryPacked});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kSuggestion,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("timestamp/date column uses PLAIN without DELTA_BINARY_PACKED in ", plain_groups, "/",
                                non_empty_groups,
                                " row groups; DELTA_BINARY_PACKED is typically more efficient for temporal data"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
