#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arrow/result.h"
#include "parqlint/common/logger.h"
#include "parqlint/io/file_source.h"
#include "parqlint/lint/diagnostic.h"
#include "parqlint/lint/rule.h"

namespace parqlint {

struct LintOptions {
  // all rules if not set; unknown names match nothing
  std::optional<std::vector<std::string>> rule_names;
  // enables gpu-page-count
  bool gpu = false;
  LoggerPtr logger;
};

// Estimates cardinality and builds column contexts.
arrow::Result<std::shared_ptr<const RuleContext>> BuildRuleContext(FileSourcePtr source, bool gpu = false,
                                                                   LoggerPtr logger = nullptr);

// Runs the rules in order and sorts the result by severity.
std::vector<Diagnostic> RunRules(const RuleContext& context, const std::vector<RulePtr>& rules);

arrow::Result<std::vector<Diagnostic>> Lint(FileSourcePtr source, const LintOptions& options = {});

arrow::Result<std::vector<Diagnostic>> Lint(const IFileSourceProvider& provider, const std::string& url,
                                            const LintOptions& options = {});

}  // namespace parqlint
