#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "parqlint/prescription/prescription.h"

namespace parqlint {

enum class Severity {
  kSuggestion,
  kWarning,
  kError,
};

std::string ToString(Severity severity);

// "suggestion", "warning" or "error"
std::optional<Severity> ParseSeverity(std::string_view text);

struct FileLocation {
  bool operator==(const FileLocation& other) const = default;
};

struct RowGroupLocation {
  int index = 0;
  bool operator==(const RowGroupLocation& other) const = default;
};

struct ColumnLocation {
  int index = 0;
  std::string path;
  bool operator==(const ColumnLocation& other) const = default;
};

using Location = std::variant<FileLocation, RowGroupLocation, ColumnLocation>;

// "file", "row_group[2]" or "column[3] a.b"
std::string ToString(const Location& location);

struct Diagnostic {
  std::string rule_name;
  Severity severity = Severity::kSuggestion;
  Location location;
  std::string message;
  Prescription prescription;

  // "[warning] rule: location: message" followed by one "  fix: <directive>" line per directive
  std::string ToString() const;

  bool operator==(const Diagnostic& other) const = default;
};

// Stable, Suggestion first.
void SortBySeverity(std::vector<Diagnostic>& diagnostics);

bool HasWarningsOrErrors(const std::vector<Diagnostic>& diagnostics);

// Concatenation of all prescriptions in diagnostic order.
Prescription MergePrescriptions(const std::vector<Diagnostic>& diagnostics);

}  // namespace parqlint
