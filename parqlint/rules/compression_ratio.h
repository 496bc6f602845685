#pragma once

#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

// Compressed columns that do not shrink are better stored uncompressed.
class CompressionRatioRule : public IRule {
 public:
  static constexpr std::string_view kName = "low-compression-ratio";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
