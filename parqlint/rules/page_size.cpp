#include "parqlint/rules/page_size.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr int64_t kMaxRowsPerRowGroup = 64 * 1024;
constexpr int64_t kMaxRowGroupBytes = 256 * kMiB;
constexpr uint64_t kIdealDataPageSize = 1 * kMiB;
constexpr uint64_t kHardMaxDataPageSize = 4 * kMiB;

}  // namespace

std::optional<RowGroupSuggestion> ComputeRowGroupSuggestion(const std::vector<RowGroupShape>& row_groups) {
  RowGroupSuggestion suggestion{.target_max_rows = static_cast<uint64_t>(kMaxRowsPerRowGroup)};
  for (const auto& row_group : row_groups) {
    if (row_group.num_rows > kMaxRowsPerRowGroup) {
      ++suggestion.oversized_rows_groups;
    }
    if (row_group.compressed_size > kMaxRowGroupBytes) {
      ++suggestion.oversized_size_groups;
      if (row_group.num_rows > 0) {
        // shrink proportionally so the compressed size trends toward the ceiling
        const auto scaled = static_cast<uint64_t>(std::floor(static_cast<double>(row_group.num_rows) *
                                                             static_cast<double>(kMaxRowGroupBytes) /
                                                             static_cast<double>(row_group.compressed_size)));
        suggestion.target_max_rows = std::min(suggestion.target_max_rows, std::max<uint64_t>(scaled, 1));
      }
    }
  }
  if (suggestion.oversized_rows_groups == 0 && suggestion.oversized_size_groups == 0) {
    return std::nullopt;
  }
  return suggestion;
}

std::string BuildRowGroupSizeMessage(const RowGroupSuggestion& suggestion, int total_row_groups) {
  std::vector<std::string> parts;
  if (suggestion.oversized_rows_groups > 0) {
    parts.push_back(absl::StrCat(suggestion.oversized_rows_groups, "/", total_row_groups, " row group(s) exceed ",
                                 kMaxRowsPerRowGroup / 1024, "K rows"));
  }
  if (suggestion.oversized_size_groups > 0) {
    parts.push_back(absl::StrCat(suggestion.oversized_size_groups, "/", total_row_groups, " row group(s) exceed ",
                                 kMaxRowGroupBytes / kMiB, "MB compressed"));
  }
  return absl::StrCat(absl::StrJoin(parts, "; "), "; set max_row_group_size=", suggestion.target_max_rows, " (",
                      kMaxRowsPerRowGroup / 1024, "K rows). Recommended data_page_size_limit=",
                      kIdealDataPageSize / kMiB, "MB (hard max ", kHardMaxDataPageSize / kMiB, "MB).");
}

std::vector<Diagnostic> PageSizeRule::Check(const RuleContext& context) const {
  const auto& metadata = *context.metadata;
  std::vector<RowGroupShape> row_groups;
  row_groups.reserve(metadata.num_row_groups());
  for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
    auto row_group = metadata.RowGroup(rg);
    row_groups.push_back(
        RowGroupShape{.num_rows = row_group->num_rows(), .compressed_size = row_group->total_compressed_size()});
  }

  auto suggestion = ComputeRowGroupSuggestion(row_groups);
  if (!suggestion) {
    return {};
  }

  Prescription prescription;
  prescription.Push(SetFileMaxRowGroupSize{.rows = suggestion->target_max_rows});
  prescription.Push(SetFileDataPageSizeLimit{.bytes = kIdealDataPageSize});

  std::vector<Diagnostic> diagnostics;
  diagnostics.push_back(
      Diagnostic{.rule_name = std::string(kName),
                 .severity = Severity::kWarning,
                 .location = FileLocation{},
                 .message = BuildRowGroupSizeMessage(*suggestion, static_cast<int>(row_groups.size())),
                 .prescription = std::move(prescription)});
  return diagnostics;
}

}  // namespace parqlint::rules
