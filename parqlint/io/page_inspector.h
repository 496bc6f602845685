#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "arrow/result.h"
#include "parqlint/io/file_source.h"
#include "parquet/metadata.h"
#include "parquet/types.h"

namespace parqlint {

struct ColumnChunkRange {
  int64_t offset = 0;
  int64_t length = 0;
};

// Range of all pages of the chunk, including the dictionary page when its offset is set.
ColumnChunkRange GetColumnChunkRange(const parquet::ColumnChunkMetaData& chunk);

// Dictionary page offset if the chunk metadata declares a usable one.
std::optional<int64_t> GetDictionaryPageOffset(const parquet::ColumnChunkMetaData& chunk);

// Fetches only the dictionary page bytes. nullopt if the chunk has no dictionary page.
arrow::Result<std::optional<int64_t>> ReadDictionaryEntryCount(IFileSource& source,
                                                               const parquet::ColumnChunkMetaData& chunk);

struct ChunkPages {
  bool has_dictionary_page = false;
  int64_t data_pages = 0;
  // encodings of data pages in order of first appearance
  std::vector<parquet::Encoding::type> data_page_encodings;
};

// Fetches the whole chunk and walks its page headers.
arrow::Result<ChunkPages> ScanColumnChunkPages(IFileSource& source, const parquet::ColumnChunkMetaData& chunk);

// Data pages from the offset index plus the dictionary page. Scans the chunk when the file has no offset index
// for it.
arrow::Result<int64_t> CountColumnChunkPages(IFileSource& source, int row_group, int column);

}  // namespace parqlint
