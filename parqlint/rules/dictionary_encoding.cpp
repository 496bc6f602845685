#include "parqlint/rules/dictionary_encoding.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr double kHighCardinalityRatio = 0.5;
constexpr double kLowCardinalityRatio = 0.1;

constexpr uint64_t kDictionaryPageFloor = 2 * kMiB;
constexpr uint64_t kDictionaryPageCap = 16 * kMiB;
constexpr double kDictionaryHeadroom = 1.25;

constexpr size_t kAmbiguousSamplePercent = 5;

std::string CardinalityText(const ColumnContext& column) {
  return absl::StrCat("~", column.distinct_count, " distinct / ", column.NonNullCount(), " total = ",
                      FormatFixed(column.CardinalityRatio() * 100.0, 0), "%");
}

}  // namespace

Prescription SuggestDictionaryPageSize(const std::string& column, uint64_t estimate, int64_t max_rows) {
  Prescription prescription;
  if (estimate <= kDictionaryPageCap) {
    prescription.Push(SetColumnDictionaryPageSizeLimit{.column = column, .bytes = estimate});
    return prescription;
  }
  const auto rows = static_cast<uint64_t>(
      std::max(1.0, std::floor(static_cast<double>(max_rows) * static_cast<double>(kDictionaryPageCap) /
                               static_cast<double>(estimate))));
  prescription.Push(SetColumnDictionaryPageSizeLimit{.column = column, .bytes = kDictionaryPageCap});
  prescription.Push(SetFileMaxRowGroupSize{.rows = rows});
  return prescription;
}

DictionaryState ClassifyDictionaryState(const parquet::ColumnChunkMetaData& chunk) {
  const auto& encoding_stats = chunk.encoding_stats();
  if (!encoding_stats.empty()) {
    bool dictionary = false;
    bool dictionary_data = false;
    bool other_data = false;
    for (const auto& stats : encoding_stats) {
      if (stats.page_type == parquet::PageType::DICTIONARY_PAGE) {
        dictionary = true;
      } else if (stats.page_type == parquet::PageType::DATA_PAGE ||
                 stats.page_type == parquet::PageType::DATA_PAGE_V2) {
        if (IsDictionaryEncoding(stats.encoding)) {
          dictionary_data = true;
        } else {
          other_data = true;
        }
      }
    }
    if (!dictionary && !dictionary_data) {
      return DictionaryState::kNoDictionary;
    }
    return other_data ? DictionaryState::kFallback : DictionaryState::kDictionaryOnly;
  }

  bool dictionary = chunk.has_dictionary_page();
  bool plain = false;
  bool other = false;
  for (auto encoding : chunk.encodings()) {
    if (IsDictionaryEncoding(encoding)) {
      dictionary = true;
    } else if (encoding == parquet::Encoding::PLAIN) {
      plain = true;
    } else if (encoding != parquet::Encoding::RLE && encoding != parquet::Encoding::BIT_PACKED) {
      other = true;
    }
  }
  if (!dictionary) {
    return DictionaryState::kNoDictionary;
  }
  if (other) {
    return DictionaryState::kFallback;
  }
  // PLAIN may be the encoding of the dictionary page itself
  return plain ? DictionaryState::kAmbiguous : DictionaryState::kDictionaryOnly;
}

DictionaryState ClassifyScannedPages(const ChunkPages& pages) {
  bool dictionary = pages.has_dictionary_page;
  bool other_data = false;
  for (auto encoding : pages.data_page_encodings) {
    if (IsDictionaryEncoding(encoding)) {
      dictionary = true;
    } else {
      other_data = true;
    }
  }
  if (!dictionary) {
    return DictionaryState::kNoDictionary;
  }
  return other_data ? DictionaryState::kFallback : DictionaryState::kDictionaryOnly;
}

std::vector<size_t> PickAmbiguousSample(size_t count) {
  std::vector<size_t> result;
  if (count == 0) {
    return result;
  }
  const size_t sample_size = std::max<size_t>(1, count * kAmbiguousSamplePercent / 100);
  result.reserve(sample_size);
  for (size_t i = 0; i < sample_size; ++i) {
    result.push_back(i * count / sample_size);
  }
  return result;
}

uint64_t EstimateDictionaryPageSize(int64_t uncompressed_bytes, double cardinality_ratio) {
  const double needed =
      std::ceil(static_cast<double>(std::max<int64_t>(uncompressed_bytes, 0)) * cardinality_ratio * kDictionaryHeadroom);
  uint64_t size = kDictionaryPageFloor;
  while (static_cast<double>(size) < needed) {
    size *= 2;
  }
  return size;
}

std::vector<Diagnostic> DictionaryEncodingRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();

  int64_t max_rows = 0;
  for (int rg = 0; rg < num_row_groups; ++rg) {
    max_rows = std::max(max_rows, metadata.RowGroup(rg)->num_rows());
  }

  for (const auto& column : context.columns) {
    int non_empty_groups = 0;
    int fallback_groups = 0;
    int dictionary_groups = 0;
    int64_t largest_fallback_chunk = 0;
    std::vector<int> ambiguous;

    auto count_state = [&](DictionaryState state, const parquet::ColumnChunkMetaData& chunk) {
      if (state == DictionaryState::kFallback) {
        ++fallback_groups;
        largest_fallback_chunk = std::max(largest_fallback_chunk, chunk.total_uncompressed_size());
      }
      if (state != DictionaryState::kNoDictionary) {
        ++dictionary_groups;
      }
    };

    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      if (chunk->num_values() == 0) {
        continue;
      }
      ++non_empty_groups;
      const auto state = ClassifyDictionaryState(*chunk);
      if (state == DictionaryState::kAmbiguous) {
        ambiguous.push_back(rg);
      }
      count_state(state, *chunk);
    }
    if (non_empty_groups == 0 || column.NonNullCount() == 0) {
      continue;
    }

    if (!ambiguous.empty() && context.source) {
      for (size_t position : PickAmbiguousSample(ambiguous.size())) {
        const int rg = ambiguous[position];
        auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
        auto pages = ScanColumnChunkPages(*context.source, *chunk);
        if (!pages.ok()) {
          if (context.logger) {
            context.logger->Log(absl::StrCat("row_group[", rg, "] ", column.path, ": ", pages.status().ToString()),
                                "degraded:dictionary_state");
          }
          continue;
        }
        const auto state = ClassifyScannedPages(*pages);
        if (state == DictionaryState::kFallback) {
          ++fallback_groups;
          largest_fallback_chunk = std::max(largest_fallback_chunk, chunk->total_uncompressed_size());
        }
      }
    }

    const double ratio = column.CardinalityRatio();
    if (fallback_groups > 0) {
      const std::string groups_text = absl::StrCat(fallback_groups, "/", num_row_groups, " row groups");
      Prescription prescription;
      std::string message;
      if (ratio > kHighCardinalityRatio) {
        prescription.Push(SetColumnDictionary{.column = column.path, .enabled = false});
        message = absl::StrCat("dictionary fell back to plain in ", groups_text,
                               "; estimated cardinality is high (", CardinalityText(column),
                               "), dictionary encoding is not beneficial");
      } else {
        const uint64_t estimate = EstimateDictionaryPageSize(largest_fallback_chunk, ratio);
        message = absl::StrCat("dictionary fell back to plain in ", groups_text,
                               "; estimated cardinality is moderate (", CardinalityText(column),
                               "), dictionary page size may be too small");
        prescription = SuggestDictionaryPageSize(column.path, estimate, max_rows);
        if (estimate > kDictionaryPageCap) {
          absl::StrAppend(&message, "; the dictionary needs ~", estimate / kMiB,
                          "MB, row groups must shrink to fit the ", kDictionaryPageCap / kMiB, "MB cap");
        }
      }
      diagnostics.push_back(Diagnostic{.rule_name = std::string(kName),
                                       .severity = Severity::kWarning,
                                       .location = MakeColumnLocation(column),
                                       .message = std::move(message),
                                       .prescription = std::move(prescription)});
      continue;
    }

    if (dictionary_groups == 0 && ratio < kLowCardinalityRatio && column.physical_type != parquet::Type::BOOLEAN) {
      Prescription prescription;
      prescription.Push(SetColumnDictionary{.column = column.path, .enabled = true});
      diagnostics.push_back(
          Diagnostic{.rule_name = std::string(kName),
                     .severity = Severity::kSuggestion,
                     .location = MakeColumnLocation(column),
                     .message = absl::StrCat("low cardinality (", CardinalityText(column),
                                             "), consider enabling dictionary encoding"),
                     .prescription = std::move(prescription)});
    }
  }
  return diagnostics;
}

}  // namespace parqlint::rules
