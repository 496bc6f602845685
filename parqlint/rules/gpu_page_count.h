#pragma once

#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

// Page counts per row group for GPU scans.
// Runs only when RuleContext::gpu is set. Diagnostics carry no prescription.
class GpuPageCountRule : public IRule {
 public:
  static constexpr std::string_view kName = "gpu-page-count";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
