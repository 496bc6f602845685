#include "parqlint/io/page_inspector.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "arrow/io/memory.h"
#include "parquet/column_page.h"
#include "parquet/column_reader.h"
#include "parquet/exception.h"
#include "parquet/page_index.h"

namespace parqlint {

namespace {

std::unique_ptr<parquet::PageReader> OpenPageReader(IFileSource& source, std::shared_ptr<arrow::Buffer> bytes,
                                                    const parquet::ColumnChunkMetaData& chunk) {
  auto stream = std::make_shared<arrow::io::BufferReader>(std::move(bytes));
  return parquet::PageReader::Open(std::move(stream), chunk.num_values(), chunk.compression(),
                                   source.ReaderProperties());
}

arrow::Result<std::optional<int64_t>> OffsetIndexPageCount(IFileSource& source, int row_group, int column) {
  std::optional<int64_t> result;
  BEGIN_PARQUET_CATCH_EXCEPTIONS
  auto page_index = source.PageIndexReader();
  auto row_group_index = page_index ? page_index->RowGroup(row_group) : nullptr;
  auto offset_index = row_group_index ? row_group_index->GetOffsetIndex(column) : nullptr;
  if (offset_index) {
    result = static_cast<int64_t>(offset_index->page_locations().size());
  }
  END_PARQUET_CATCH_EXCEPTIONS
  return result;
}

}  // namespace

std::optional<int64_t> GetDictionaryPageOffset(const parquet::ColumnChunkMetaData& chunk) {
  if (!chunk.has_dictionary_page()) {
    return std::nullopt;
  }
  const int64_t offset = chunk.dictionary_page_offset();
  // some writers leave the offset at 0 or point it at the data page
  if (offset <= 0 || offset >= chunk.data_page_offset()) {
    return std::nullopt;
  }
  return offset;
}

ColumnChunkRange GetColumnChunkRange(const parquet::ColumnChunkMetaData& chunk) {
  int64_t offset = chunk.data_page_offset();
  if (auto dictionary_offset = GetDictionaryPageOffset(chunk)) {
    offset = *dictionary_offset;
  }
  return ColumnChunkRange{.offset = offset, .length = chunk.total_compressed_size()};
}

arrow::Result<std::optional<int64_t>> ReadDictionaryEntryCount(IFileSource& source,
                                                               const parquet::ColumnChunkMetaData& chunk) {
  auto dictionary_offset = GetDictionaryPageOffset(chunk);
  if (!dictionary_offset) {
    return std::nullopt;
  }

  ARROW_ASSIGN_OR_RAISE(auto bytes,
                        source.ReadRange(*dictionary_offset, chunk.data_page_offset() - *dictionary_offset));

  std::optional<int64_t> result;
  BEGIN_PARQUET_CATCH_EXCEPTIONS
  auto page_reader = OpenPageReader(source, std::move(bytes), chunk);
  auto page = page_reader->NextPage();
  if (page && page->type() == parquet::PageType::DICTIONARY_PAGE) {
    result = static_cast<const parquet::DictionaryPage&>(*page).num_values();
  }
  END_PARQUET_CATCH_EXCEPTIONS
  return result;
}

arrow::Result<ChunkPages> ScanColumnChunkPages(IFileSource& source, const parquet::ColumnChunkMetaData& chunk) {
  const auto range = GetColumnChunkRange(chunk);
  ARROW_ASSIGN_OR_RAISE(auto bytes, source.ReadRange(range.offset, range.length));

  ChunkPages result;
  BEGIN_PARQUET_CATCH_EXCEPTIONS
  auto page_reader = OpenPageReader(source, std::move(bytes), chunk);
  while (auto page = page_reader->NextPage()) {
    switch (page->type()) {
      case parquet::PageType::DICTIONARY_PAGE:
        result.has_dictionary_page = true;
        break;
      case parquet::PageType::DATA_PAGE:
      case parquet::PageType::DATA_PAGE_V2: {
        ++result.data_pages;
        const auto encoding = static_cast<const parquet::DataPage&>(*page).encoding();
        if (std::find(result.data_page_encodings.begin(), result.data_page_encodings.end(), encoding) ==
            result.data_page_encodings.end()) {
          result.data_page_encodings.push_back(encoding);
        }
        break;
      }
      default:
        break;
    }
  }
  END_PARQUET_CATCH_EXCEPTIONS
  return result;
}

arrow::Result<int64_t> CountColumnChunkPages(IFileSource& source, int row_group, int column) {
  auto chunk = source.Metadata()->RowGroup(row_group)->ColumnChunk(column);

  ARROW_ASSIGN_OR_RAISE(auto data_pages, OffsetIndexPageCount(source, row_group, column));
  if (data_pages) {
    return *data_pages + (chunk->has_dictionary_page() ? 1 : 0);
  }

  ARROW_ASSIGN_OR_RAISE(auto pages, ScanColumnChunkPages(source, *chunk));
  return pages.data_pages + (pages.has_dictionary_page ? 1 : 0);
}

}  // namespace parqlint
