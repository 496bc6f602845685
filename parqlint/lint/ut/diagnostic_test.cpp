#include "parqlint/lint/diagnostic.h"

#include <vector>

#include "gtest/gtest.h"

namespace parqlint {
namespace {

Diagnostic MakeDiagnostic(std::string rule, Severity severity) {
  return Diagnostic{.rule_name = std::move(rule), .severity = severity, .location = FileLocation{}, .message = "m"};
}

TEST(DiagnosticTest, SeverityText) {
  EXPECT_EQ(ToString(Severity::kWarning), "warning");
  EXPECT_EQ(ParseSeverity("error"), Severity::kError);
  EXPECT_EQ(ParseSeverity("suggestion"), Severity::kSuggestion);
  EXPECT_EQ(ParseSeverity("Warning"), std::nullopt);
}

TEST(DiagnosticTest, LocationText) {
  EXPECT_EQ(ToString(Location{FileLocation{}}), "file");
  EXPECT_EQ(ToString(Location{RowGroupLocation{.index = 2}}), "row_group[2]");
  EXPECT_EQ(ToString(Location{ColumnLocation{.index = 3, .path = "a.b"}}), "column[3] a.b");
}

TEST(DiagnosticTest, Format) {
  Diagnostic diagnostic{.rule_name = "low-compression-ratio",
                        .severity = Severity::kWarning,
                        .location = ColumnLocation{.index = 0, .path = "payload"},
                        .message = "data is nearly incompressible",
                        .prescription = Prescription::Parse("set column payload compression uncompressed")};

  EXPECT_EQ(diagnostic.ToString(),
            "[warning] low-compression-ratio: column[0] payload: data is nearly incompressible\n"
            "  fix: set column payload compression uncompressed");
}

TEST(DiagnosticTest, SortIsStable) {
  std::vector<Diagnostic> diagnostics = {
      MakeDiagnostic("w1", Severity::kWarning), MakeDiagnostic("s1", Severity::kSuggestion),
      MakeDiagnostic("e1", Severity::kError), MakeDiagnostic("s2", Severity::kSuggestion),
      MakeDiagnostic("w2", Severity::kWarning)};
  SortBySeverity(diagnostics);

  std::vector<std::string> names;
  for (const auto& diagnostic : diagnostics) {
    names.push_back(diagnostic.rule_name);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"s1", "s2", "w1", "w2", "e1"}));
}

TEST(DiagnosticTest, HasWarningsOrErrors) {
  EXPECT_FALSE(HasWarningsOrErrors({}));
  EXPECT_FALSE(HasWarningsOrErrors({MakeDiagnostic("s", Severity::kSuggestion)}));
  EXPECT_TRUE(HasWarningsOrErrors({MakeDiagnostic("s", Severity::kSuggestion), MakeDiagnostic("e", Severity::kError)}));
}

TEST(DiagnosticTest, MergePrescriptions) {
  auto first = MakeDiagnostic("a", Severity::kSuggestion);
  first.prescription = Prescription::Parse("set column x dictionary false");
  auto second = MakeDiagnostic("b", Severity::kWarning);
  second.prescription = Prescription::Parse("set file data_page_size_limit 1048576\nset column x bloom_filter true");

  auto merged = MergePrescriptions({first, second});
  EXPECT_EQ(merged.Serialize(),
            "set column x dictionary false\n"
            "set file data_page_size_limit 1048576\n"
            "set column x bloom_filter true");
}

}  // namespace
}  // namespace parqlint
