#include "parqlint/lint/lint.h"

#include <iterator>
#include <string>
#include <utility>

#include "parqlint/common/measure.h"
#include "parqlint/lint/cardinality.h"
#include "parqlint/lint/column_context.h"
#include "parqlint/rules/registry.h"

namespace parqlint {

arrow::Result<std::shared_ptr<const RuleContext>> BuildRuleContext(FileSourcePtr source, bool gpu, LoggerPtr logger) {
  if (!source) {
    return arrow::Status::Invalid("BuildRuleContext: source is nullptr");
  }

  std::vector<ColumnCardinality> cardinalities;
  {
    ScopedStageTimer timer(logger, "cardinality");
    ARROW_ASSIGN_OR_RAISE(cardinalities, EstimateCardinality(*source, logger));
  }

  auto context = std::make_shared<RuleContext>();
  {
    ScopedStageTimer timer(logger, "column_context");
    ARROW_ASSIGN_OR_RAISE(context->columns, BuildColumnContexts(*source, cardinalities, logger));
  }
  context->metadata = source->Metadata();
  context->source = std::move(source);
  context->gpu = gpu;
  context->logger = std::move(logger);
  return std::shared_ptr<const RuleContext>(std::move(context));
}

std::vector<Diagnostic> RunRules(const RuleContext& context, const std::vector<RulePtr>& rules) {
  std::vector<Diagnostic> diagnostics;
  for (const auto& rule : rules) {
    ScopedStageTimer timer(context.logger, "rule:" + std::string(rule->Name()));
    auto rule_diagnostics = rule->Check(context);
    diagnostics.insert(diagnostics.end(), std::make_move_iterator(rule_diagnostics.begin()),
                       std::make_move_iterator(rule_diagnostics.end()));
  }
  SortBySeverity(diagnostics);
  return diagnostics;
}

arrow::Result<std::vector<Diagnostic>> Lint(FileSourcePtr source, const LintOptions& options) {
  ARROW_ASSIGN_OR_RAISE(auto context, BuildRuleContext(std::move(source), options.gpu, options.logger));
  return RunRules(*context, rules::GetRules(options.rule_names));
}

arrow::Result<std::vector<Diagnostic>> Lint(const IFileSourceProvider& provider, const std::string& url,
                                            const LintOptions& options) {
  ARROW_ASSIGN_OR_RAISE(auto source, provider.Open(url));
  return Lint(std::move(source), options);
}

}  // namespace parqlint
