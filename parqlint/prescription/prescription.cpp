#include "parqlint/prescription/prescription.h"

#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace parqlint {

namespace {

class DirectiveParser {
 public:
  DirectiveParser(std::vector<std::string_view> tokens, size_t line) : tokens_(std::move(tokens)), line_(line) {}

  Directive Parse() const {
    if (tokens_[0] != "set") {
      Fail("directive must start with 'set'");
    }
    if (tokens_.size() < 2) {
      Fail("missing scope after 'set'");
    }
    if (tokens_[1] == "file") {
      return ParseFileDirective();
    }
    if (tokens_[1] == "column") {
      return ParseColumnDirective();
    }
    Fail(absl::StrCat("unknown scope '", tokens_[1], "', expected 'file' or 'column'"));
  }

 private:
  [[noreturn]] void Fail(std::string message) const { throw ParseError(line_, std::move(message)); }

  Directive ParseFileDirective() const {
    if (tokens_.size() != 4) {
      Fail("file directive must be: set file <property> <value>");
    }
    const std::string_view property = tokens_[2];
    const std::string_view value = tokens_[3];

    if (property == "compression") {
      return SetFileCompression{.codec = ParseCodec(value)};
    }
    if (property == "max_row_group_size") {
      return SetFileMaxRowGroupSize{.rows = ParseUnsigned(value, property)};
    }
    if (property == "data_page_size_limit") {
      return SetFileDataPageSizeLimit{.bytes = ParseUnsigned(value, property)};
    }
    if (property == "statistics_truncate_length") {
      if (value == "none") {
        return SetFileStatisticsTruncateLength{.length = std::nullopt};
      }
      return SetFileStatisticsTruncateLength{.length = ParseUnsigned(value, property)};
    }
    Fail(absl::StrCat("unknown file property '", property, "'"));
  }

  Directive ParseColumnDirective() const {
    if (tokens_.size() != 5) {
      Fail("column directive must be: set column <column_path> <property> <value>");
    }
    std::string column = ParseColumnPath(tokens_[2]);
    const std::string_view property = tokens_[3];
    const std::string_view value = tokens_[4];

    if (property == "compression") {
      return SetColumnCompression{.column = std::move(column), .codec = ParseCodec(value)};
    }
    if (property == "encoding") {
      return SetColumnEncoding{.column = std::move(column), .encoding = ParseEncoding(value)};
    }
    if (property == "dictionary") {
      return SetColumnDictionary{.column = std::move(column), .enabled = ParseBool(value, property)};
    }
    if (property == "dictionary_page_size_limit") {
      return SetColumnDictionaryPageSizeLimit{.column = std::move(column), .bytes = ParseUnsigned(value, property)};
    }
    if (property == "statistics") {
      return SetColumnStatistics{.column = std::move(column), .level = ParseStatisticsLevel(value)};
    }
    if (property == "bloom_filter") {
      return SetColumnBloomFilter{.column = std::move(column), .enabled = ParseBool(value, property)};
    }
    if (property == "bloom_filter_ndv") {
      return SetColumnBloomFilterNdv{.column = std::move(column), .ndv = ParseUnsigned(value, property)};
    }
    if (property == "bloom_filter_fpp") {
      return SetColumnBloomFilterFpp{.column = std::move(column), .fpp = ParseDouble(value, property)};
    }
    Fail(absl::StrCat("unknown column property '", property, "'"));
  }

  std::string ParseColumnPath(std::string_view value) const {
    for (std::string_view part : absl::StrSplit(value, '.')) {
      if (part.empty()) {
        Fail(absl::StrCat("invalid column path '", value, "'"));
      }
    }
    return std::string(value);
  }

  // "zstd(3)" -> 3; nullopt if the value is not of the form "<codec>(..."
  std::optional<int> ParseLevel(std::string_view value, std::string_view codec) const {
    std::string_view rest = value;
    if (!absl::ConsumePrefix(&rest, codec) || !absl::ConsumePrefix(&rest, "(")) {
      return std::nullopt;
    }
    if (!absl::ConsumeSuffix(&rest, ")")) {
      Fail(absl::StrCat("invalid ", codec, " format '", value, "', expected ", codec, "(<level>)"));
    }
    int level = 0;
    if (!absl::SimpleAtoi(rest, &level)) {
      Fail(absl::StrCat("invalid ", codec, " level '", rest, "'"));
    }
    return level;
  }

  Codec ParseCodec(std::string_view value) const {
    if (value == "uncompressed") {
      return Codec::Uncompressed();
    }
    if (value == "snappy") {
      return Codec::Snappy();
    }
    if (value == "lz4_raw") {
      return Codec::Lz4Raw();
    }
    if (auto level = ParseLevel(value, "zstd")) {
      if (*level < 1 || *level > 22) {
        Fail("zstd level must be between 1 and 22");
      }
      return Codec::Zstd(*level);
    }
    if (auto level = ParseLevel(value, "gzip")) {
      if (*level < 0 || *level > 9) {
        Fail("gzip level must be between 0 and 9");
      }
      return Codec::Gzip(*level);
    }
    if (auto level = ParseLevel(value, "brotli")) {
      if (*level < 0 || *level > 11) {
        Fail("brotli level must be between 0 and 11");
      }
      return Codec::Brotli(*level);
    }
    Fail(absl::StrCat("unknown codec '", value, "'"));
  }

  DataEncoding ParseEncoding(std::string_view value) const {
    if (value == "plain") {
      return DataEncoding::kPlain;
    }
    if (value == "delta_binary_packed") {
      return DataEncoding::kDeltaBinaryPacked;
    }
    if (value == "delta_length_byte_array") {
      return DataEncoding::kDeltaLengthByteArray;
    }
    if (value == "delta_byte_array") {
      return DataEncoding::kDeltaByteArray;
    }
    if (value == "byte_stream_split") {
      return DataEncoding::kByteStreamSplit;
    }
    Fail(absl::StrCat("unknown encoding '", value, "'"));
  }

  StatisticsLevel ParseStatisticsLevel(std::string_view value) const {
    if (value == "none") {
      return StatisticsLevel::kNone;
    }
    if (value == "chunk") {
      return StatisticsLevel::kChunk;
    }
    if (value == "page") {
      return StatisticsLevel::kPage;
    }
    Fail(absl::StrCat("unknown statistics level '", value, "'"));
  }

  bool ParseBool(std::string_view value, std::string_view property) const {
    if (value == "true") {
      return true;
    }
    if (value == "false") {
      return false;
    }
    Fail(absl::StrCat("invalid boolean for ", property, " ('", value, "')"));
  }

  uint64_t ParseUnsigned(std::string_view value, std::string_view property) const {
    uint64_t result = 0;
    // SimpleAtoi accepts a leading '-' for "-0"
    if (value.starts_with('-') || !absl::SimpleAtoi(value, &result)) {
      Fail(absl::StrCat("invalid integer for ", property, " ('", value, "')"));
    }
    return result;
  }

  double ParseDouble(std::string_view value, std::string_view property) const {
    double result = 0;
    if (!absl::SimpleAtod(value, &result)) {
      Fail(absl::StrCat("invalid float for ", property, " ('", value, "')"));
    }
    return result;
  }

  std::vector<std::string_view> tokens_;
  size_t line_;
};

class PlanUpdater {
 public:
  explicit PlanUpdater(WriterPlan& plan) : plan_(plan) {}

  void operator()(const SetFileCompression& d) {
    plan_.compression = d.codec;
    for (auto& [path, column] : plan_.columns) {
      if (column.inferred_compression) {
        column.compression.reset();
        column.inferred_compression = false;
      }
    }
  }
  void operator()(const SetFileMaxRowGroupSize& d) { plan_.max_row_group_size = d.rows; }
  void operator()(const SetFileDataPageSizeLimit& d) { plan_.data_page_size_limit = d.bytes; }
  void operator()(const SetFileStatisticsTruncateLength& d) {
    plan_.statistics_truncate_length = d.length.value_or(kUnlimitedStatistics);
  }
  void operator()(const SetColumnCompression& d) {
    auto& column = plan_.Column(d.column);
    column.compression = d.codec;
    column.inferred_compression = false;
  }
  void operator()(const SetColumnEncoding& d) { plan_.Column(d.column).encoding = d.encoding; }
  void operator()(const SetColumnDictionary& d) { plan_.Column(d.column).dictionary = d.enabled; }
  void operator()(const SetColumnDictionaryPageSizeLimit& d) {
    plan_.Column(d.column).dictionary_page_size_limit = d.bytes;
  }
  void operator()(const SetColumnStatistics& d) { plan_.Column(d.column).statistics = d.level; }
  void operator()(const SetColumnBloomFilter& d) { plan_.Column(d.column).bloom_filter = d.enabled; }
  void operator()(const SetColumnBloomFilterNdv& d) { plan_.Column(d.column).bloom_filter_ndv = d.ndv; }
  void operator()(const SetColumnBloomFilterFpp& d) { plan_.Column(d.column).bloom_filter_fpp = d.fpp; }

 private:
  WriterPlan& plan_;
};

}  // namespace

ParseError::ParseError(size_t line, std::string message)
    : std::runtime_error(absl::StrCat("invalid prescription at line ", line, ": ", message)),
      line_(line),
      message_(std::move(message)) {}

std::string ConflictError::ToString() const {
  return absl::StrCat("conflicting directives for ", key, ": '", second, "' conflicts with '", first, "'");
}

Prescription Prescription::Parse(std::string_view text) {
  Prescription result;
  size_t line_number = 0;
  for (std::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    std::string_view content = line.substr(0, line.find('#'));
    content = absl::StripAsciiWhitespace(content);
    if (content.empty()) {
      continue;
    }
    std::vector<std::string_view> tokens = absl::StrSplit(content, absl::ByAnyChar(" \t\r\f\v"), absl::SkipEmpty());
    result.Push(DirectiveParser(std::move(tokens), line_number).Parse());
  }
  return result;
}

std::optional<ConflictError> Prescription::Validate() const {
  struct FirstSeen {
    std::string value;
    std::string text;
  };
  absl::flat_hash_map<std::string, FirstSeen> seen;

  for (const auto& directive : directives_) {
    std::string key = ConflictKey(directive);
    std::string value = ConflictValue(directive);
    auto it = seen.find(key);
    if (it == seen.end()) {
      seen.emplace(std::move(key), FirstSeen{.value = std::move(value), .text = ToString(directive)});
      continue;
    }
    if (it->second.value != value) {
      return ConflictError{.key = std::move(key), .first = it->second.text, .second = ToString(directive)};
    }
  }
  return std::nullopt;
}

void Prescription::Apply(WriterPlan& plan) const {
  PlanUpdater updater(plan);
  for (const auto& directive : directives_) {
    std::visit(updater, directive);
  }
}

std::string Prescription::Serialize() const {
  return absl::StrJoin(directives_, "\n",
                       [](std::string* out, const Directive& directive) { out->append(ToString(directive)); });
}

void ApplyPrescriptionText(std::string_view text, WriterPlan& plan) {
  auto prescription = Prescription::Parse(text);
  if (auto conflict = prescription.Validate()) {
    throw std::runtime_error(conflict->ToString());
  }
  prescription.Apply(plan);
}

}  // namespace parqlint
