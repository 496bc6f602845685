#include "parqlint/prescription/directive.h"

#include <charconv>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "absl/strings/str_cat.h"
#include "parqlint/common/error.h"

namespace parqlint {

namespace {

std::string BoolText(bool value) { return value ? "true" : "false"; }

template <typename T>
constexpr bool kIsColumnDirective =
    std::is_same_v<T, SetColumnCompression> || std::is_same_v<T, SetColumnEncoding> ||
    std::is_same_v<T, SetColumnDictionary> || std::is_same_v<T, SetColumnDictionaryPageSizeLimit> ||
    std::is_same_v<T, SetColumnStatistics> || std::is_same_v<T, SetColumnBloomFilter> ||
    std::is_same_v<T, SetColumnBloomFilterNdv> || std::is_same_v<T, SetColumnBloomFilterFpp>;

template <typename T>
const char* PropertyName() {
  if constexpr (std::is_same_v<T, SetFileCompression> || std::is_same_v<T, SetColumnCompression>) {
    return "compression";
  } else if constexpr (std::is_same_v<T, SetFileMaxRowGroupSize>) {
    return "max_row_group_size";
  } else if constexpr (std::is_same_v<T, SetFileDataPageSizeLimit>) {
    return "data_page_size_limit";
  } else if constexpr (std::is_same_v<T, SetFileStatisticsTruncateLength>) {
    return "statistics_truncate_length";
  } else if constexpr (std::is_same_v<T, SetColumnEncoding>) {
    return "encoding";
  } else if constexpr (std::is_same_v<T, SetColumnDictionary>) {
    return "dictionary";
  } else if constexpr (std::is_same_v<T, SetColumnDictionaryPageSizeLimit>) {
    return "dictionary_page_size_limit";
  } else if constexpr (std::is_same_v<T, SetColumnStatistics>) {
    return "statistics";
  } else if constexpr (std::is_same_v<T, SetColumnBloomFilter>) {
    return "bloom_filter";
  } else if constexpr (std::is_same_v<T, SetColumnBloomFilterNdv>) {
    return "bloom_filter_ndv";
  } else {
    static_assert(std::is_same_v<T, SetColumnBloomFilterFpp>);
    return "bloom_filter_fpp";
  }
}

std::string ValueText(const SetFileCompression& d) { return d.codec.ToString(); }
std::string ValueText(const SetFileMaxRowGroupSize& d) { return std::to_string(d.rows); }
std::string ValueText(const SetFileDataPageSizeLimit& d) { return std::to_string(d.bytes); }
std::string ValueText(const SetFileStatisticsTruncateLength& d) {
  return d.length.has_value() ? std::to_string(*d.length) : "none";
}
std::string ValueText(const SetColumnCompression& d) { return d.codec.ToString(); }
std::string ValueText(const SetColumnEncoding& d) { return ToString(d.encoding); }
std::string ValueText(const SetColumnDictionary& d) { return BoolText(d.enabled); }
std::string ValueText(const SetColumnDictionaryPageSizeLimit& d) { return std::to_string(d.bytes); }
std::string ValueText(const SetColumnStatistics& d) { return ToString(d.level); }
std::string ValueText(const SetColumnBloomFilter& d) { return BoolText(d.enabled); }
std::string ValueText(const SetColumnBloomFilterNdv& d) { return std::to_string(d.ndv); }
std::string ValueText(const SetColumnBloomFilterFpp& d) { return FormatDouble(d.fpp); }

}  // namespace

std::string Codec::ToString() const {
  switch (kind) {
    case CodecKind::kUncompressed:
      return "uncompressed";
    case CodecKind::kSnappy:
      return "snappy";
    case CodecKind::kLz4Raw:
      return "lz4_raw";
    case CodecKind::kGzip:
      return absl::StrCat("gzip(", level, ")");
    case CodecKind::kBrotli:
      return absl::StrCat("brotli(", level, ")");
    case CodecKind::kZstd:
      return absl::StrCat("zstd(", level, ")");
  }
  throw std::runtime_error("Codec::ToString: unexpected codec kind");
}

std::string ToString(DataEncoding encoding) {
  switch (encoding) {
    case DataEncoding::kPlain:
      return "plain";
    case DataEncoding::kDeltaBinaryPacked:
      return "delta_binary_packed";
    case DataEncoding::kDeltaLengthByteArray:
      return "delta_length_byte_array";
    case DataEncoding::kDeltaByteArray:
      return "delta_byte_array";
    case DataEncoding::kByteStreamSplit:
      return "byte_stream_split";
  }
  throw std::runtime_error("ToString: unexpected data encoding");
}

std::string ToString(StatisticsLevel level) {
  switch (level) {
    case StatisticsLevel::kNone:
      return "none";
    case StatisticsLevel::kChunk:
      return "chunk";
    case StatisticsLevel::kPage:
      return "page";
  }
  throw std::runtime_error("ToString: unexpected statistics level");
}

std::string FormatDouble(double value) {
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  Ensure(ec == std::errc(), "FormatDouble: cannot format value");
  return std::string(buffer, end);
}

std::string ConflictKey(const Directive& directive) {
  return std::visit(
      [](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (kIsColumnDirective<T>) {
          return absl::StrCat("column ", d.column, " ", PropertyName<T>());
        } else {
          return absl::StrCat("file ", PropertyName<T>());
        }
      },
      directive);
}

std::string ConflictValue(const Directive& directive) {
  return std::visit([](const auto& d) { return ValueText(d); }, directive);
}

std::string ToString(const Directive& directive) {
  return absl::StrCat("set ", ConflictKey(directive), " ", ConflictValue(directive));
}

}  // namespace parqlint
