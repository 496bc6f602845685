#include "parqlint/lint/lint.h"

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/collecting_logger.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

class FixedRule : public IRule {
 public:
  FixedRule(std::string name, std::vector<Severity> severities)
      : name_(std::move(name)), severities_(std::move(severities)) {}

  std::string_view Name() const override { return name_; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override {
    std::vector<Diagnostic> result;
    for (size_t i = 0; i < severities_.size(); ++i) {
      result.push_back(Diagnostic{.rule_name = name_,
                                  .severity = severities_[i],
                                  .location = FileLocation{},
                                  .message = std::to_string(i) + " of " + std::to_string(context.columns.size())});
    }
    return result;
  }

 private:
  std::string name_;
  std::vector<Severity> severities_;
};

class LintTest : public ::testing::Test {
 protected:
  void SetUp() override {
    OptionalVector<int64_t> values;
    for (int64_t i = 0; i < 100; ++i) {
      values.emplace_back(i % 4);
    }
    Table table{.columns = {MakeInt64Column("x", 1, values), MakeStringColumn("s", 2, OptionalVector<std::string>(100, "v"))}};
    ASSIGN_OR_FAIL(auto buffer, WriteToBuffer(table));
    ASSIGN_OR_FAIL(source_, OpenBufferSource(buffer));
  }

  FileSourcePtr source_;
};

TEST_F(LintTest, RunRulesSortsBySeverity) {
  ASSIGN_OR_FAIL(auto context, BuildRuleContext(source_));
  ASSERT_EQ(context->columns.size(), 2);

  std::vector<RulePtr> rules{
      std::make_shared<FixedRule>("first", std::vector<Severity>{Severity::kWarning, Severity::kSuggestion}),
      std::make_shared<FixedRule>("second", std::vector<Severity>{Severity::kError, Severity::kSuggestion})};
  auto diagnostics = RunRules(*context, rules);

  ASSERT_EQ(diagnostics.size(), 4);
  EXPECT_EQ(diagnostics[0].rule_name, "first");
  EXPECT_EQ(diagnostics[0].message, "1 of 2");
  EXPECT_EQ(diagnostics[1].rule_name, "second");
  EXPECT_EQ(diagnostics[1].severity, Severity::kSuggestion);
  EXPECT_EQ(diagnostics[2].severity, Severity::kWarning);
  EXPECT_EQ(diagnostics[3].severity, Severity::kError);
}

TEST_F(LintTest, TimesEveryRule) {
  auto logger = std::make_shared<CollectingLogger>();
  ASSIGN_OR_FAIL(auto context, BuildRuleContext(source_, false, logger));

  std::vector<RulePtr> rules{std::make_shared<FixedRule>("a", std::vector<Severity>{}),
                             std::make_shared<FixedRule>("b", std::vector<Severity>{})};
  EXPECT_TRUE(RunRules(*context, rules).empty());
  EXPECT_EQ(logger->Count("metrics:time:rule:a"), 1);
  EXPECT_EQ(logger->Count("metrics:time:rule:b"), 1);
  EXPECT_EQ(logger->Count("metrics:time:cardinality"), 1);
  EXPECT_EQ(logger->Count("metrics:time:column_context"), 1);
}

TEST_F(LintTest, CompliantFile) {
  ASSIGN_OR_FAIL(auto diagnostics, Lint(source_));
  for (const auto& diagnostic : diagnostics) {
    EXPECT_NE(diagnostic.severity, Severity::kError) << diagnostic.ToString();
  }
}

TEST_F(LintTest, RuleFilter) {
  ASSIGN_OR_FAIL(auto none, Lint(source_, LintOptions{.rule_names = std::vector<std::string>{"no-such-rule"}}));
  EXPECT_TRUE(none.empty());

  // written without a page index by default
  ASSIGN_OR_FAIL(auto only, Lint(source_, LintOptions{.rule_names = std::vector<std::string>{"missing-page-statistics"}}));
  ASSERT_EQ(only.size(), 2);
  for (const auto& diagnostic : only) {
    EXPECT_EQ(diagnostic.rule_name, "missing-page-statistics");
  }
}

TEST(LintSourceTest, NullSource) {
  auto result = Lint(FileSourcePtr{});
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

}  // namespace
}  // namespace parqlint
