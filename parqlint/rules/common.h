#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "arrow/util/compression.h"
#include "parqlint/lint/column_context.h"
#include "parqlint/lint/diagnostic.h"
#include "parquet/metadata.h"
#include "parquet/types.h"

namespace parqlint::rules {

constexpr int64_t kMiB = 1024 * 1024;

// Upper case codec name as stored in the footer: "ZSTD", "LZ4_RAW", ...
std::string CompressionName(arrow::Compression::type compression);

// Encodings of the data pages of the chunk. Taken from the page encoding stats when the writer recorded them,
// otherwise from the chunk encodings without the level encodings (then the dictionary page encoding may appear).
std::vector<parquet::Encoding::type> DataPageEncodings(const parquet::ColumnChunkMetaData& chunk);

bool HasEncoding(const std::vector<parquet::Encoding::type>& encodings, parquet::Encoding::type encoding);

bool IsDictionaryEncoding(parquet::Encoding::type encoding);

// STRING, JSON or ENUM. BSON is a binary document and does not count.
bool IsTextLogicalType(const parquet::LogicalType& logical_type);

bool HasBloomFilter(const parquet::ColumnChunkMetaData& chunk);

ColumnLocation MakeColumnLocation(const ColumnContext& column);

// "12.3" for 12.34 with precision 1
std::string FormatFixed(double value, int precision);

double ToMiB(int64_t bytes);

}  // namespace parqlint::rules
