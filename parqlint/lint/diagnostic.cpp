#include "parqlint/lint/diagnostic.h"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/str_cat.h"

namespace parqlint {

std::string ToString(Severity severity) {
  switch (severity) {
    case Severity::kSuggestion:
      return "suggestion";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
  }
  throw std::runtime_error("ToString: unexpected severity");
}

std::optional<Severity> ParseSeverity(std::string_view text) {
  if (text == "suggestion") {
    return Severity::kSuggestion;
  }
  if (text == "warning") {
    return Severity::kWarning;
  }
  if (text == "error") {
    return Severity::kError;
  }
  return std::nullopt;
}

std::string ToString(const Location& location) {
  if (std::holds_alternative<FileLocation>(location)) {
    return "file";
  }
  if (const auto* row_group = std::get_if<RowGroupLocation>(&location)) {
    return absl::StrCat("row_group[", row_group->index, "]");
  }
  const auto& column = std::get<ColumnLocation>(location);
  return absl::StrCat("column[", column.index, "] ", column.path);
}

std::string Diagnostic::ToString() const {
  std::string result =
      absl::StrCat("[", parqlint::ToString(severity), "] ", rule_name, ": ", parqlint::ToString(location), ": ", message);
  for (const auto& directive : prescription.Directives()) {
    absl::StrAppend(&result, "\n  fix: ", parqlint::ToString(directive));
  }
  return result;
}

void SortBySeverity(std::vector<Diagnostic>& diagnostics) {
  std::stable_sort(diagnostics.begin(), diagnostics.end(),
                   [](const Diagnostic& lhs, const Diagnostic& rhs) { return lhs.severity < rhs.severity; });
}

bool HasWarningsOrErrors(const std::vector<Diagnostic>& diagnostics) {
  return std::any_of(diagnostics.begin(), diagnostics.end(),
                     [](const Diagnostic& d) { return d.severity != Severity::kSuggestion; });
}

Prescription MergePrescriptions(const std::vector<Diagnostic>& diagnostics) {
  Prescription result;
  for (const auto& diagnostic : diagnostics) {
    result.Extend(diagnostic.prescription);
  }
  return result;
}

}  // namespace parqlint
