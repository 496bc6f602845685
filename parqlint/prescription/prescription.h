#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parqlint/prescription/directive.h"
#include "parqlint/prescription/writer_plan.h"

namespace parqlint {

class ParseError : public std::runtime_error {
 public:
  ParseError(size_t line, std::string message);

  // 1-based
  size_t Line() const { return line_; }
  const std::string& Message() const { return message_; }

 private:
  size_t line_;
  std::string message_;
};

struct ConflictError {
  std::string key;
  std::string first;
  std::string second;

  // "conflicting directives for <key>: '<second>' conflicts with '<first>'"
  std::string ToString() const;
};

// Ordered directives. Applying them is "last write wins" per conflict key; Validate() reports keys that are
// set to different values.
class Prescription {
 public:
  Prescription() = default;
  explicit Prescription(std::vector<Directive> directives) : directives_(std::move(directives)) {}

  // One directive per line, '#' starts a comment. Throws ParseError, never returns a partial prescription.
  static Prescription Parse(std::string_view text);

  void Push(Directive directive) { directives_.push_back(std::move(directive)); }

  void Extend(const Prescription& other) {
    directives_.insert(directives_.end(), other.directives_.begin(), other.directives_.end());
  }

  const std::vector<Directive>& Directives() const { return directives_; }
  bool Empty() const { return directives_.empty(); }

  // First directive (in order) whose key was already set to another value.
  std::optional<ConflictError> Validate() const;

  // Folds directives in order onto the plan. Setting the file compression drops the column compressions
  // inferred from the source file, column compressions set by directives are kept.
  void Apply(WriterPlan& plan) const;

  // Directive texts joined with '\n', without a trailing newline.
  std::string Serialize() const;

  bool operator==(const Prescription& other) const = default;

 private:
  std::vector<Directive> directives_;
};

// Parses, validates and applies. Throws ParseError, or std::runtime_error on a conflict.
void ApplyPrescriptionText(std::string_view text, WriterPlan& plan);

}  // namespace parqlint
