#include "parqlint/rules/compression_ratio.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr double kMaxRatio = 0.95;

}  // namespace

std::vector<Diagnostic> CompressionRatioRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  for (const auto& column : context.columns) {
    int64_t compressed = 0;
    int64_t uncompressed = 0;
    int compressed_groups = 0;
    std::optional<arrow::Compression::type> codec;

    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      if (chunk->compression() == arrow::Compression::UNCOMPRESSED || chunk->total_uncompressed_size() <= 0) {
        continue;
      }
      compressed += chunk->total_compressed_size();
      uncompressed += chunk->total_uncompressed_size();
      ++compressed_groups;
      codec = chunk->compression();
    }
    if (uncompressed <= 0 || !codec) {
      continue;
    }

    const double ratio = static_cast<double>(compressed) / static_cast<double>(uncompressed);
    if (ratio <= kMaxRatio) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetColumnCompression{.column = column.path, .codec = Codec::Uncompressed()});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kWarning,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("aggregated compression ratio is ", FormatFixed(ratio, 2), " (",
                                CompressionName(*codec), ") across ", compressed_groups, "/", num_row_groups,
                                " row groups; data is nearly incompressible"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
