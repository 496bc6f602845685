#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "parqlint/lint/rule.h"
#include "parquet/types.h"

namespace parqlint::rules {

struct StringColumnSummary {
  int64_t total_uncompressed = 0;
  int64_t total_compressed = 0;
  int non_empty_groups = 0;

  // compressed / uncompressed, nullopt if either total is zero
  std::optional<double> Ratio() const;

  int64_t AverageChunkSize() const { return non_empty_groups == 0 ? 0 : total_uncompressed / non_empty_groups; }
};

struct StringEncodingFlags {
  bool has_plain = false;
  bool has_dictionary = false;
  bool has_delta = false;
};

// Text by annotation, or by a path that does not look like raw bytes.
bool LooksLikeTextColumn(const parquet::LogicalType& logical_type, std::string_view path);

// True for dictionary/plain text columns matching the "few large chunks" or the "many small chunks" profile.
bool ShouldPreferDeltaLengthByteArray(const StringColumnSummary& summary, const parquet::LogicalType& logical_type,
                                      std::string_view path, const StringEncodingFlags& flags);

class StringEncodingRule : public IRule {
 public:
  static constexpr std::string_view kName = "string-byte-array-encoding";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
