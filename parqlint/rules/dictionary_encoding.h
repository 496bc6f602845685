#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "parqlint/io/page_inspector.h"
#include "parqlint/lint/rule.h"
#include "parquet/metadata.h"

namespace parqlint::rules {

enum class DictionaryState {
  kNoDictionary,
  kDictionaryOnly,
  // some data pages are dictionary encoded, some are not
  kFallback,
  // metadata cannot tell kDictionaryOnly from kFallback
  kAmbiguous,
};

// From the page encoding stats if present, otherwise from the chunk encodings.
DictionaryState ClassifyDictionaryState(const parquet::ColumnChunkMetaData& chunk);

// Never kAmbiguous.
DictionaryState ClassifyScannedPages(const ChunkPages& pages);

// Positions (into a list of `count` ambiguous chunks) whose pages are scanned: 5% of them, at least one,
// evenly spread.
std::vector<size_t> PickAmbiguousSample(size_t count);

// Dictionary page size limit that fits `uncompressed_bytes * cardinality_ratio` with headroom,
// a power of two times the 2 MB floor.
uint64_t EstimateDictionaryPageSize(int64_t uncompressed_bytes, double cardinality_ratio);

// Dictionary page size limit for `column`. Above the 16 MB cap the limit is the cap and row groups
// shrink from `max_rows` in proportion.
Prescription SuggestDictionaryPageSize(const std::string& column, uint64_t estimate, int64_t max_rows);

class DictionaryEncodingRule : public IRule {
 public:
  static constexpr std::string_view kName = "dictionary-encoding-cardinality";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
