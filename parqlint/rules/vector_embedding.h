#pragma once

#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

// Long repeated float lists are treated as embeddings, which are read by point lookups.
class VectorEmbeddingRule : public IRule {
 public:
  static constexpr std::string_view kName = "vector-embedding-page-size";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
