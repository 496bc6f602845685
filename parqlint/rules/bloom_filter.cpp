#include "parqlint/rules/bloom_filter.h"

#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr double kHighCardinalityRatio = 0.5;

}  // namespace

std::vector<Diagnostic> BloomFilterRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;

  for (const auto& column : context.columns) {
    if (column.physical_type != parquet::Type::BYTE_ARRAY &&
        column.physical_type != parquet::Type::FIXED_LEN_BYTE_ARRAY) {
      continue;
    }

    int non_empty_groups = 0;
    int missing_groups = 0;
    for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      if (chunk->num_values() == 0) {
        continue;
      }
      ++non_empty_groups;
      if (!HasBloomFilter(*chunk)) {
        ++missing_groups;
      }
    }
    if (missing_groups == 0) {
      continue;
    }

    const bool is_uuid = column.logical_type->is_UUID();
    if (!is_uuid && column.CardinalityRatio() <= kHighCardinalityRatio) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetColumnBloomFilter{.column = column.path, .enabled = true});
    prescription.Push(SetColumnBloomFilterNdv{.column = column.path, .ndv = column.distinct_count});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kSuggestion,
        .location = MakeColumnLocation(column),
        .message = is_uuid ? absl::StrCat("UUID column missing bloom filters in ", missing_groups, "/",
                                          non_empty_groups, " row groups; bloom filters enable fast point lookups")
                           : absl::StrCat("high-cardinality byte array column missing bloom filters in ",
                                          missing_groups, "/", non_empty_groups, " row groups (~",
                                          column.distinct_count, " estimated distinct values)"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
