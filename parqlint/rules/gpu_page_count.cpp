#include "parqlint/rules/gpu_page_count.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/io/page_inspector.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr int64_t kRecommendedPagesPerRowGroup = 100;

struct ColumnPages {
  int64_t total_pages = 0;
  int non_empty_row_groups = 0;
};

struct RowGroupPages {
  int index = 0;
  int64_t total_pages = 0;
  int non_empty_columns = 0;
};

}  // namespace

std::vector<Diagnostic> GpuPageCountRule::Check(const RuleContext& context) const {
  if (!context.gpu || !context.source) {
    return {};
  }
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  std::vector<std::optional<ColumnPages>> columns(context.columns.size());
  std::optional<RowGroupPages> first_bad;
  int failed_row_groups = 0;

  for (int rg = 0; rg < num_row_groups; ++rg) {
    auto row_group = metadata.RowGroup(rg);
    if (row_group->num_rows() <= 0) {
      continue;
    }

    RowGroupPages row_group_pages{.index = rg};
    std::vector<std::pair<size_t, int64_t>> column_pages;
    bool failed = false;
    for (size_t i = 0; i < context.columns.size(); ++i) {
      const int column = context.columns[i].column_index;
      if (row_group->ColumnChunk(column)->num_values() == 0) {
        continue;
      }
      auto pages = CountColumnChunkPages(*context.source, rg, column);
      if (!pages.ok()) {
        if (context.logger) {
          context.logger->Log(absl::StrCat("row_group[", rg, "]: ", pages.status().ToString()),
                              "degraded:page_count");
        }
        failed = true;
        break;
      }
      column_pages.emplace_back(i, *pages);
    }
    if (failed) {
      ++failed_row_groups;
      continue;
    }

    for (const auto& [i, pages] : column_pages) {
      row_group_pages.total_pages += pages;
      ++row_group_pages.non_empty_columns;
      auto& aggregate = columns[i];
      if (!aggregate) {
        aggregate = ColumnPages{};
      }
      aggregate->total_pages += pages;
      ++aggregate->non_empty_row_groups;
    }
    if (row_group_pages.total_pages < kRecommendedPagesPerRowGroup && !first_bad) {
      first_bad = row_group_pages;
    }
  }

  std::vector<Diagnostic> diagnostics;
  if (first_bad) {
    for (size_t i = 0; i < context.columns.size(); ++i) {
      if (!columns[i]) {
        continue;
      }
      const auto& aggregate = *columns[i];
      const double average =
          static_cast<double>(aggregate.total_pages) / static_cast<double>(std::max(aggregate.non_empty_row_groups, 1));
      diagnostics.push_back(Diagnostic{
          .rule_name = std::string(kName),
          .severity = Severity::kWarning,
          .location = MakeColumnLocation(context.columns[i]),
          .message = absl::StrCat("page count detail: this column averages ", FormatFixed(average, 1),
                                  " pages per non-empty row group (", aggregate.total_pages, " total pages across ",
                                  aggregate.non_empty_row_groups, "/", num_row_groups,
                                  " row groups); for GPU scans, Parquet is recommended to have more than ",
                                  kRecommendedPagesPerRowGroup, " pages in each row group")});
    }
    if (diagnostics.empty()) {
      diagnostics.push_back(Diagnostic{
          .rule_name = std::string(kName),
          .severity = Severity::kWarning,
          .location = RowGroupLocation{.index = first_bad->index},
          .message = absl::StrCat("page count check failed for row_group[", first_bad->index, "] (",
                                  first_bad->total_pages, " total pages across ", first_bad->non_empty_columns,
                                  " non-empty column chunks); column averages unavailable")});
    }
  }

  if (failed_row_groups > 0) {
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kWarning,
        .location = FileLocation{},
        .message = absl::StrCat("page count check could not read page counts for ", failed_row_groups,
                                " row groups; ", first_bad ? "column averages" : "results", " may be incomplete")});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
