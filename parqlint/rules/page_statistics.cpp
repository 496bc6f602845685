#include "parqlint/rules/page_statistics.h"

#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

std::vector<Diagnostic> PageStatisticsRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  for (const auto& column : context.columns) {
    int missing_groups = 0;
    for (int rg = 0; rg < num_row_groups; ++rg) {
      if (!metadata.RowGroup(rg)->ColumnChunk(column.column_index)->GetColumnIndexLocation().has_value()) {
        ++missing_groups;
      }
    }
    if (missing_groups == 0) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetColumnStatistics{.column = column.path, .level = StatisticsLevel::kPage});
    diagnostics.push_back(Diagnostic{.rule_name = std::string(kName),
                                     .severity = Severity::kWarning,
                                     .location = MakeColumnLocation(column),
                                     .message = absl::StrCat("no page-level column index found in ", missing_groups,
                                                             "/", num_row_groups,
                                                             " row groups; page statistics are missing"),
                                     .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
