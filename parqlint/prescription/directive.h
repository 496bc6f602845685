#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace parqlint {

enum class CodecKind {
  kUncompressed,
  kSnappy,
  kGzip,
  kBrotli,
  kZstd,
  kLz4Raw,
};

// Compression codec with its level. Deprecated LZ4 (hadoop framing) and LZO are not supported.
struct Codec {
  CodecKind kind = CodecKind::kUncompressed;
  // meaningful for gzip (0-9), brotli (0-11) and zstd (1-22) only
  int level = 0;

  static Codec Uncompressed() { return Codec{.kind = CodecKind::kUncompressed}; }
  static Codec Snappy() { return Codec{.kind = CodecKind::kSnappy}; }
  static Codec Lz4Raw() { return Codec{.kind = CodecKind::kLz4Raw}; }
  static Codec Gzip(int level) { return Codec{.kind = CodecKind::kGzip, .level = level}; }
  static Codec Brotli(int level) { return Codec{.kind = CodecKind::kBrotli, .level = level}; }
  static Codec Zstd(int level) { return Codec{.kind = CodecKind::kZstd, .level = level}; }

  bool HasLevel() const {
    return kind == CodecKind::kGzip || kind == CodecKind::kBrotli || kind == CodecKind::kZstd;
  }

  // "zstd(3)", "snappy", ...
  std::string ToString() const;

  bool operator==(const Codec& other) const = default;
};

// Data page encodings. Dictionary and level encodings are not directives.
enum class DataEncoding {
  kPlain,
  kDeltaBinaryPacked,
  kDeltaLengthByteArray,
  kDeltaByteArray,
  kByteStreamSplit,
};

enum class StatisticsLevel {
  kNone,
  kChunk,
  kPage,
};

std::string ToString(DataEncoding encoding);
std::string ToString(StatisticsLevel level);

struct SetFileCompression {
  Codec codec;
  bool operator==(const SetFileCompression& other) const = default;
};

struct SetFileMaxRowGroupSize {
  uint64_t rows = 0;
  bool operator==(const SetFileMaxRowGroupSize& other) const = default;
};

struct SetFileDataPageSizeLimit {
  uint64_t bytes = 0;
  bool operator==(const SetFileDataPageSizeLimit& other) const = default;
};

struct SetFileStatisticsTruncateLength {
  // nullopt = no limit
  std::optional<uint64_t> length;
  bool operator==(const SetFileStatisticsTruncateLength& other) const = default;
};

struct SetColumnCompression {
  std::string column;
  Codec codec;
  bool operator==(const SetColumnCompression& other) const = default;
};

struct SetColumnEncoding {
  std::string column;
  DataEncoding encoding = DataEncoding::kPlain;
  bool operator==(const SetColumnEncoding& other) const = default;
};

struct SetColumnDictionary {
  std::string column;
  bool enabled = false;
  bool operator==(const SetColumnDictionary& other) const = default;
};

struct SetColumnDictionaryPageSizeLimit {
  std::string column;
  uint64_t bytes = 0;
  bool operator==(const SetColumnDictionaryPageSizeLimit& other) const = default;
};

struct SetColumnStatistics {
  std::string column;
  StatisticsLevel level = StatisticsLevel::kNone;
  bool operator==(const SetColumnStatistics& other) const = default;
};

struct SetColumnBloomFilter {
  std::string column;
  bool enabled = false;
  bool operator==(const SetColumnBloomFilter& other) const = default;
};

struct SetColumnBloomFilterNdv {
  std::string column;
  uint64_t ndv = 0;
  bool operator==(const SetColumnBloomFilterNdv& other) const = default;
};

struct SetColumnBloomFilterFpp {
  std::string column;
  double fpp = 0;
  bool operator==(const SetColumnBloomFilterFpp& other) const = default;
};

// Column paths are dot separated leaf paths ("a.b").
using Directive =
    std::variant<SetFileCompression, SetFileMaxRowGroupSize, SetFileDataPageSizeLimit, SetFileStatisticsTruncateLength,
                 SetColumnCompression, SetColumnEncoding, SetColumnDictionary, SetColumnDictionaryPageSizeLimit,
                 SetColumnStatistics, SetColumnBloomFilter, SetColumnBloomFilterNdv, SetColumnBloomFilterFpp>;

// Text form, e.g. "set column a.b compression zstd(3)". Parsing it yields the same directive.
std::string ToString(const Directive& directive);

// Scope, property and column path: "file compression", "column a.b encoding".
std::string ConflictKey(const Directive& directive);

// Canonical text of the payload.
std::string ConflictValue(const Directive& directive);

// Shortest text that parses back to the same double.
std::string FormatDouble(double value);

}  // namespace parqlint
