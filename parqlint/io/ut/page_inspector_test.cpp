#include "parqlint/io/page_inspector.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "parqlint/test_utils/assertions.h"
#include "parqlint/test_utils/write.h"

namespace parqlint {
namespace {

OptionalVector<int64_t> Sequence(int64_t count, int64_t modulo) {
  OptionalVector<int64_t> result;
  for (int64_t i = 0; i < count; ++i) {
    result.emplace_back(i % modulo);
  }
  return result;
}

FileSourcePtr MakeSource(const Table& table, std::shared_ptr<parquet::WriterProperties> properties) {
  auto buffer = ValueSafe(WriteToBuffer(table, std::move(properties)));
  return ValueSafe(OpenBufferSource(buffer));
}

TEST(PageInspectorTest, DictionaryEntryCount) {
  Table table{.columns = {MakeInt64Column("x", 1, Sequence(1000, 17))}};
  auto source = MakeSource(table, parquet::default_writer_properties());
  auto chunk = source->Metadata()->RowGroup(0)->ColumnChunk(0);

  ASSERT_TRUE(GetDictionaryPageOffset(*chunk).has_value());
  auto range = GetColumnChunkRange(*chunk);
  EXPECT_EQ(range.offset, *GetDictionaryPageOffset(*chunk));
  EXPECT_EQ(range.length, chunk->total_compressed_size());

  ASSIGN_OR_FAIL(auto entries, ReadDictionaryEntryCount(*source, *chunk));
  EXPECT_EQ(entries, 17);
}

TEST(PageInspectorTest, NoDictionary) {
  Table table{.columns = {MakeInt64Column("x", 1, Sequence(100, 100))}};
  auto source = MakeSource(table, parquet::WriterProperties::Builder().disable_dictionary()->build());
  auto chunk = source->Metadata()->RowGroup(0)->ColumnChunk(0);

  EXPECT_FALSE(GetDictionaryPageOffset(*chunk).has_value());
  EXPECT_EQ(GetColumnChunkRange(*chunk).offset, chunk->data_page_offset());
  ASSIGN_OR_FAIL(auto entries, ReadDictionaryEntryCount(*source, *chunk));
  EXPECT_FALSE(entries.has_value());

  ASSIGN_OR_FAIL(auto pages, ScanColumnChunkPages(*source, *chunk));
  EXPECT_FALSE(pages.has_dictionary_page);
  EXPECT_EQ(pages.data_pages, 1);
  EXPECT_EQ(pages.data_page_encodings, std::vector<parquet::Encoding::type>{parquet::Encoding::PLAIN});
}

TEST(PageInspectorTest, DictionaryFallback) {
  // a tiny dictionary page limit makes the writer fall back to plain pages
  Table table{.columns = {MakeInt64Column("x", 1, Sequence(5000, 5000))}};
  auto source =
      MakeSource(table, parquet::WriterProperties::Builder().dictionary_pagesize_limit(1024)->data_pagesize(1024)->build());
  auto chunk = source->Metadata()->RowGroup(0)->ColumnChunk(0);

  ASSIGN_OR_FAIL(auto pages, ScanColumnChunkPages(*source, *chunk));
  EXPECT_TRUE(pages.has_dictionary_page);
  EXPECT_GT(pages.data_pages, 1);
  ASSERT_EQ(pages.data_page_encodings.size(), 2);
  EXPECT_EQ(pages.data_page_encodings[0], parquet::Encoding::RLE_DICTIONARY);
  EXPECT_EQ(pages.data_page_encodings[1], parquet::Encoding::PLAIN);
}

TEST(PageInspectorTest, CountPagesFromOffsetIndex) {
  Table table{.columns = {MakeInt64Column("x", 1, Sequence(10000, 10000))}};
  auto source = MakeSource(
      table,
      parquet::WriterProperties::Builder().disable_dictionary()->data_pagesize(1024)->enable_write_page_index()->build());
  ASSERT_NE(source->PageIndexReader(), nullptr);

  ASSIGN_OR_FAIL(auto pages, ScanColumnChunkPages(*source, *source->Metadata()->RowGroup(0)->ColumnChunk(0)));
  ASSIGN_OR_FAIL(auto count, CountColumnChunkPages(*source, 0, 0));
  EXPECT_GT(count, 1);
  EXPECT_EQ(count, pages.data_pages);
}

TEST(PageInspectorTest, CountPagesWithoutOffsetIndex) {
  Table table{.columns = {MakeInt64Column("x", 1, Sequence(1000, 10))}};
  auto source =
      MakeSource(table, parquet::WriterProperties::Builder().disable_write_page_index()->build());

  ASSIGN_OR_FAIL(auto count, CountColumnChunkPages(*source, 0, 0));
  // dictionary page and one data page
  EXPECT_EQ(count, 2);
}

}  // namespace
}  // namespace parqlint
