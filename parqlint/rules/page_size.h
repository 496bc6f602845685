#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

struct RowGroupShape {
  int64_t num_rows = 0;
  int64_t compressed_size = 0;
};

struct RowGroupSuggestion {
  uint64_t target_max_rows = 0;
  int oversized_rows_groups = 0;
  int oversized_size_groups = 0;

  bool operator==(const RowGroupSuggestion& other) const = default;
};

// nullopt if no row group exceeds the row or the size ceiling.
std::optional<RowGroupSuggestion> ComputeRowGroupSuggestion(const std::vector<RowGroupShape>& row_groups);

// Mentions only the violated ceilings.
std::string BuildRowGroupSizeMessage(const RowGroupSuggestion& suggestion, int total_row_groups);

class PageSizeRule : public IRule {
 public:
  static constexpr std::string_view kName = "page-row-group-size";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
