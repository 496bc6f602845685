#pragma once

#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

class BloomFilterRule : public IRule {
 public:
  static constexpr std::string_view kName = "bloom-filter-recommendation";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
