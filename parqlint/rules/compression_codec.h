#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "arrow/util/compression.h"
#include "parqlint/lint/rule.h"
#include "parquet/schema.h"
#include "parquet/types.h"

namespace parqlint::rules {

struct CodecChunk {
  arrow::Compression::type compression = arrow::Compression::UNCOMPRESSED;
  int64_t num_values = 0;
  int64_t uncompressed_size = 0;
  int64_t compressed_size = 0;
};

struct CodecRecommendation {
  // zstd(3) or lz4_raw
  bool use_lz4 = false;
  // codec of the first row group counted for the recommendation
  arrow::Compression::type current = arrow::Compression::UNCOMPRESSED;
  int row_groups = 0;
  std::string reason;
};

// Per row group decision for one column, chunks in row group order.
std::optional<CodecRecommendation> RecommendCodec(const std::vector<CodecChunk>& chunks,
                                                  const parquet::ColumnDescriptor& descriptor);

class CompressionCodecRule : public IRule {
 public:
  static constexpr std::string_view kName = "compression-codec-upgrade";

  std::string_view Name() const override { return kName; }

  std::vector<Diagnostic> Check(const RuleContext& context) const override;
};

}  // namespace parqlint::rules
