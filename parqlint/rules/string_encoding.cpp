#include "parqlint/rules/string_encoding.h"

#include <string>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"
#include "parqlint/rules/dictionary_encoding.h"

namespace parqlint::rules {

namespace {

// few large chunks
constexpr int64_t kMinTotalBytes = 32 * kMiB;
constexpr int kMinNonEmptyGroups = 2;
constexpr int kMaxNonEmptyGroups = 32;
constexpr int64_t kMinAverageChunkBytes = 4 * kMiB;
constexpr double kMinRatio = 0.35;
constexpr double kMaxRatio = 0.75;

// many small chunks
constexpr int64_t kSmallChunkMinTotalBytes = 64 * kMiB;
constexpr int kSmallChunkMinGroups = 64;
constexpr int64_t kSmallChunkMaxAverageBytes = 1 * kMiB;
constexpr double kSmallChunkMinRatio = 0.55;
constexpr double kSmallChunkMaxRatio = 0.85;

}  // namespace

std::optional<double> StringColumnSummary::Ratio() const {
  if (total_uncompressed <= 0 || total_compressed <= 0) {
    return std::nullopt;
  }
  return static_cast<double>(total_compressed) / static_cast<double>(total_uncompressed);
}

bool LooksLikeTextColumn(const parquet::LogicalType& logical_type, std::string_view path) {
  if (IsTextLogicalType(logical_type) || logical_type.is_BSON()) {
    return true;
  }
  const std::string lower = absl::AsciiStrToLower(path);
  return !absl::StrContains(lower, "bytes") && !absl::StrContains(lower, "embedding") &&
         !absl::StrContains(lower, "image");
}

bool ShouldPreferDeltaLengthByteArray(const StringColumnSummary& summary, const parquet::LogicalType& logical_type,
                                      std::string_view path, const StringEncodingFlags& flags) {
  if (flags.has_delta || !flags.has_plain || !flags.has_dictionary) {
    return false;
  }
  if (!LooksLikeTextColumn(logical_type, path)) {
    return false;
  }
  const auto ratio = summary.Ratio();
  if (!ratio) {
    return false;
  }
  const int64_t average_chunk = summary.AverageChunkSize();

  const bool few_large_chunks = summary.total_uncompressed >= kMinTotalBytes &&
                                summary.non_empty_groups >= kMinNonEmptyGroups &&
                                summary.non_empty_groups <= kMaxNonEmptyGroups &&
                                average_chunk >= kMinAverageChunkBytes && *ratio >= kMinRatio && *ratio <= kMaxRatio;
  const bool many_small_chunks = summary.total_uncompressed >= kSmallChunkMinTotalBytes &&
                                 summary.non_empty_groups >= kSmallChunkMinGroups && average_chunk > 0 &&
                                 average_chunk <= kSmallChunkMaxAverageBytes && *ratio >= kSmallChunkMinRatio &&
                                 *ratio <= kSmallChunkMaxRatio;
  return few_large_chunks || many_small_chunks;
}

std::vector<Diagnostic> StringEncodingRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  for (const auto& column : context.columns) {
    if (column.physical_type != parquet::Type::BYTE_ARRAY) {
      continue;
    }

    StringColumnSummary summary;
    StringEncodingFlags flags;
    bool fallback = false;
    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      fallback = fallback || ClassifyDictionaryState(*chunk) == DictionaryState::kFallback;
      if (chunk->total_uncompressed_size() > 0) {
        summary.total_uncompressed += chunk->total_uncompressed_size();
        ++summary.non_empty_groups;
      }
      if (chunk->total_compressed_size() > 0) {
        summary.total_compressed += chunk->total_compressed_size();
      }
      for (auto encoding : chunk->encodings()) {
        if (encoding == parquet::Encoding::PLAIN) {
          flags.has_plain = true;
        } else if (IsDictionaryEncoding(encoding)) {
          flags.has_dictionary = true;
        } else if (encoding == parquet::Encoding::DELTA_BYTE_ARRAY ||
                   encoding == parquet::Encoding::DELTA_LENGTH_BYTE_ARRAY) {
          flags.has_delta = true;
        }
      }
    }

    // a proven fallback belongs to the dictionary rule
    if (fallback || !ShouldPreferDeltaLengthByteArray(summary, *column.logical_type, column.path, flags)) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetColumnDictionary{.column = column.path, .enabled = false});
    prescription.Push(SetColumnEncoding{.column = column.path, .encoding = DataEncoding::kDeltaLengthByteArray});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kSuggestion,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("text column (", FormatFixed(ToMiB(summary.total_uncompressed), 1), "MB across ",
                                summary.non_empty_groups, "/", num_row_groups, " row groups, ratio ",
                                FormatFixed(summary.Ratio().value_or(0.0), 2),
                                ") uses dictionary/plain pages; try DELTA_LENGTH_BYTE_ARRAY and disable dictionary"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
