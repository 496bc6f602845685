#include "parqlint/rules/compression_codec.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

constexpr int kTargetZstdLevel = 3;

constexpr int64_t kMinColumnBytes = 8 * kMiB;
constexpr int64_t kLargeChunkBytes = 4 * kMiB;
constexpr int64_t kMinTextBytesForLz4 = 32 * kMiB;

constexpr double kMaxRatioForZstd = 0.95;
constexpr double kMaxSnappyRatioForZstd = 0.90;
constexpr double kMaxRatioForLz4 = 0.98;

constexpr int kSmallChunkMinGroups = 64;
constexpr int64_t kSmallChunkMaxAvgBytes = 1 * kMiB;
constexpr double kSmallChunkMinRatio = 0.55;
constexpr double kSmallChunkMaxRatio = 0.85;

constexpr std::string_view kZstdReason = "default compression policy prefers ZSTD level 3";
constexpr std::string_view kLz4Reason = "large column chunks are decompression-sensitive";
constexpr std::string_view kSmallChunkReason = "many small byte array chunks are decompression-bound";

bool IsTextOrBson(const parquet::LogicalType& logical_type) {
  return IsTextLogicalType(logical_type) || logical_type.is_BSON();
}

bool CanBenefitFromZstd(const parquet::ColumnDescriptor& descriptor) {
  switch (descriptor.physical_type()) {
    case parquet::Type::BYTE_ARRAY:
    case parquet::Type::FIXED_LEN_BYTE_ARRAY:
      return true;
    case parquet::Type::INT32:
    case parquet::Type::INT64:
      return descriptor.logical_type() && IsTextOrBson(*descriptor.logical_type());
    default:
      return false;
  }
}

struct Tally {
  int row_groups = 0;
  std::optional<arrow::Compression::type> first_codec;

  void Add(arrow::Compression::type codec) {
    ++row_groups;
    if (!first_codec) {
      first_codec = codec;
    }
  }
};

}  // namespace

std::optional<CodecRecommendation> RecommendCodec(const std::vector<CodecChunk>& chunks,
                                                  const parquet::ColumnDescriptor& descriptor) {
  const auto physical_type = descriptor.physical_type();
  const bool repeated = descriptor.max_repetition_level() > 0;
  if (physical_type == parquet::Type::BOOLEAN ||
      (!repeated && (physical_type == parquet::Type::FLOAT || physical_type == parquet::Type::DOUBLE))) {
    return std::nullopt;
  }

  Tally zstd;
  Tally lz4;
  int64_t total_uncompressed = 0;
  int64_t total_compressed = 0;
  int non_empty_groups = 0;
  bool all_snappy = true;
  std::optional<arrow::Compression::type> first_codec;

  for (const auto& chunk : chunks) {
    if (chunk.num_values <= 0) {
      continue;
    }
    ++non_empty_groups;
    if (!first_codec) {
      first_codec = chunk.compression;
    }
    if (chunk.uncompressed_size > 0) {
      total_uncompressed += chunk.uncompressed_size;
    }
    if (chunk.compressed_size > 0) {
      total_compressed += chunk.compressed_size;
    }
    if (chunk.compression != arrow::Compression::SNAPPY) {
      all_snappy = false;
    }

    // the footer does not store the level, every ZSTD chunk is on target
    if (chunk.compression == arrow::Compression::ZSTD) {
      continue;
    }
    if (chunk.compression == arrow::Compression::SNAPPY && chunk.uncompressed_size > kLargeChunkBytes) {
      lz4.Add(chunk.compression);
    } else {
      zstd.Add(chunk.compression);
    }
  }

  if (total_uncompressed < kMinColumnBytes) {
    return std::nullopt;
  }
  const double ratio = static_cast<double>(total_compressed) / static_cast<double>(total_uncompressed);

  if (!CanBenefitFromZstd(descriptor) || ratio > kMaxRatioForZstd ||
      (first_codec == arrow::Compression::SNAPPY && ratio >= kMaxSnappyRatioForZstd)) {
    zstd = Tally{};
  }

  const bool is_text = descriptor.logical_type() && IsTextLogicalType(*descriptor.logical_type());
  if ((is_text && total_uncompressed < kMinTextBytesForLz4) || ratio > kMaxRatioForLz4) {
    lz4 = Tally{};
  }

  std::string_view lz4_reason = kLz4Reason;
  if (non_empty_groups >= kSmallChunkMinGroups && total_uncompressed / non_empty_groups < kSmallChunkMaxAvgBytes &&
      physical_type == parquet::Type::BYTE_ARRAY && all_snappy && ratio >= kSmallChunkMinRatio &&
      ratio <= kSmallChunkMaxRatio) {
    lz4 = Tally{.row_groups = non_empty_groups, .first_codec = arrow::Compression::SNAPPY};
    zstd = Tally{};
    lz4_reason = kSmallChunkReason;
  }

  if (lz4.row_groups > zstd.row_groups) {
    return CodecRecommendation{
        .use_lz4 = true, .current = *lz4.first_codec, .row_groups = lz4.row_groups, .reason = std::string(lz4_reason)};
  }
  if (zstd.row_groups > 0) {
    return CodecRecommendation{.use_lz4 = false,
                               .current = *zstd.first_codec,
                               .row_groups = zstd.row_groups,
                               .reason = std::string(kZstdReason)};
  }
  return std::nullopt;
}

std::vector<Diagnostic> CompressionCodecRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;
  const int num_row_groups = metadata.num_row_groups();
  if (num_row_groups == 0) {
    return diagnostics;
  }

  for (const auto& column : context.columns) {
    std::vector<CodecChunk> chunks;
    chunks.reserve(num_row_groups);
    for (int rg = 0; rg < num_row_groups; ++rg) {
      auto chunk = metadata.RowGroup(rg)->ColumnChunk(column.column_index);
      chunks.push_back(CodecChunk{.compression = chunk->compression(),
                                  .num_values = chunk->num_values(),
                                  .uncompressed_size = chunk->total_uncompressed_size(),
                                  .compressed_size = chunk->total_compressed_size()});
    }

    auto recommendation = RecommendCodec(chunks, *metadata.schema()->Column(column.column_index));
    if (!recommendation) {
      continue;
    }

    const Codec target = recommendation->use_lz4 ? Codec::Lz4Raw() : Codec::Zstd(kTargetZstdLevel);
    const std::string_view advice = recommendation->use_lz4 ? "recommend switching to LZ4 for faster decompression"
                                                            : "recommend switching to ZSTD level 3";

    Prescription prescription;
    prescription.Push(SetColumnCompression{.column = column.path, .codec = target});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = recommendation->use_lz4 ? Severity::kWarning : Severity::kSuggestion,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("using ", CompressionName(recommendation->current), " in ",
                                recommendation->row_groups, "/", num_row_groups, " row groups; ",
                                recommendation->reason, "; ", advice, " (column size ",
                                FormatFixed(ToMiB(column.uncompressed_size), 1), "MB)"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
