#include "parqlint/test_utils/write.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arrow/io/memory.h"
#include "parqlint/common/fs/filesystem_provider_impl.h"
#include "parqlint/common/fs/url.h"
#include "parqlint/result.h"
#include "parquet/arrow/writer.h"
#include "parquet/column_writer.h"
#include "parquet/exception.h"
#include "parquet/file_writer.h"
#include "parquet/types.h"

namespace parqlint {
namespace {

using parquet::Repetition;
using parquet::schema::GroupNode;
using WriteProc = void (*)(parquet::ColumnWriter* writer, const ParquetColumnData& data, size_t position);

// Values of the variant alternative as the writer takes them. String storage must outlive the call.
template <typename TWriter>
struct ValueAdapter {
  using Stored = typename TWriter::T;

  static typename TWriter::T Convert(const Stored& value) { return value; }
};

template <>
struct ValueAdapter<parquet::ByteArrayWriter> {
  using Stored = std::string;

  static parquet::ByteArray Convert(const std::string& value) { return parquet::ByteArray(value); }
};

template <>
struct ValueAdapter<parquet::FixedLenByteArrayWriter> {
  using Stored = std::string;

  static parquet::FixedLenByteArray Convert(const std::string& value) {
    return parquet::FixedLenByteArray(reinterpret_cast<const uint8_t*>(value.data()));
  }
};

template <typename TWriter>
void WriteOne(TWriter* writer, const std::optional<typename ValueAdapter<TWriter>::Stored>& value, int16_t def,
              int16_t null_def, const int16_t* rep) {
  if (value.has_value()) {
    auto converted = ValueAdapter<TWriter>::Convert(*value);
    writer->WriteBatch(1, &def, rep, &converted);
  } else {
    writer->WriteBatch(1, &null_def, rep, nullptr);
  }
}

template <typename TWriter>
void WriteNextPrimitive(parquet::ColumnWriter* writer, const ParquetColumnData& data, size_t position) {
  const auto& typed_data = std::get<OptionalVector<typename ValueAdapter<TWriter>::Stored>>(data);
  const int16_t max_def = writer->descr()->max_definition_level();
  WriteOne(static_cast<TWriter*>(writer), typed_data[position], max_def, max_def - 1, nullptr);
}

// Three-level list, see parquet-format LogicalTypes.md. An empty list is written as a single empty entry.
template <typename TWriter>
void WriteNextList(parquet::ColumnWriter* writer, const ParquetColumnData& data, size_t position) {
  const auto& list = std::get<ArrayContainer>(data).arrays[position];
  const auto& typed_data = std::get<OptionalVector<typename ValueAdapter<TWriter>::Stored>>(list);
  auto typed_writer = static_cast<TWriter*>(writer);
  const int16_t max_def = writer->descr()->max_definition_level();
  const int16_t max_rep = writer->descr()->max_repetition_level();

  int16_t rep = max_rep - 1;
  if (typed_data.empty()) {
    int16_t def = max_def - 2;
    typed_writer->WriteBatch(1, &def, &rep, nullptr);
    return;
  }
  for (const auto& value : typed_data) {
    WriteOne(typed_writer, value, max_def, max_def - 1, &rep);
    rep = max_rep;
  }
}

template <template <typename> class Proc>
WriteProc SelectProc(parquet::Type::type type) {
  switch (type) {
    case parquet::Type::BOOLEAN:
      return &Proc<parquet::BoolWriter>::Run;
    case parquet::Type::INT32:
      return &Proc<parquet::Int32Writer>::Run;
    case parquet::Type::INT64:
      return &Proc<parquet::Int64Writer>::Run;
    case parquet::Type::FLOAT:
      return &Proc<parquet::FloatWriter>::Run;
    case parquet::Type::DOUBLE:
      return &Proc<parquet::DoubleWriter>::Run;
    case parquet::Type::FIXED_LEN_BYTE_ARRAY:
      return &Proc<parquet::FixedLenByteArrayWriter>::Run;
    case parquet::Type::BYTE_ARRAY:
      return &Proc<parquet::ByteArrayWriter>::Run;
    case parquet::Type::INT96:
    case parquet::Type::UNDEFINED:
      return nullptr;
  }
  return nullptr;
}

template <typename TWriter>
struct PrimitiveProc {
  static void Run(parquet::ColumnWriter* writer, const ParquetColumnData& data, size_t position) {
    WriteNextPrimitive<TWriter>(writer, data, position);
  }
};

template <typename TWriter>
struct ListProc {
  static void Run(parquet::ColumnWriter* writer, const ParquetColumnData& data, size_t position) {
    WriteNextList<TWriter>(writer, data, position);
  }
};

std::vector<size_t> RowGroupSizes(const Table& table) {
  if (!table.row_group_sizes.empty()) {
    return table.row_group_sizes;
  }
  return {table.columns.empty() ? 0 : table.columns.front().Size()};
}

void WriteRows(const Table& table, parquet::ParquetFileWriter* writer) {
  size_t row = 0;
  for (size_t rows_in_group : RowGroupSizes(table)) {
    auto rg_writer = writer->AppendRowGroup();
    for (const auto& column : table.columns) {
      WriteProc write_proc = column.info.repetition == Repetition::REPEATED
                                 ? SelectProc<ListProc>(column.info.physical_type)
                                 : SelectProc<PrimitiveProc>(column.info.physical_type);
      Ensure(write_proc != nullptr, std::string(__PRETTY_FUNCTION__) + ": unsupported type of " + column.info.name);
      parquet::ColumnWriter* column_writer = rg_writer->NextColumn();
      for (size_t i = 0; i < rows_in_group; ++i) {
        write_proc(column_writer, column.data, row + i);
      }
    }
    row += rows_in_group;
  }
}

std::shared_ptr<GroupNode> GetSchema(const std::vector<ParquetColumn>& columns) {
  parquet::schema::NodeVector fields;
  fields.reserve(columns.size());
  for (const auto& column : columns) {
    fields.push_back(column.info.MakeField());
  }
  return std::static_pointer_cast<GroupNode>(GroupNode::Make("schema", Repetition::REQUIRED, fields));
}

arrow::Result<std::shared_ptr<arrow::io::OutputStream>> OpenOutput(const std::string& url) {
  auto provider = MakeDefaultFileSystemProvider();
  const std::string normalized = NormalizeUrl(url);
  ARROW_ASSIGN_OR_RAISE(auto fs, provider->GetFileSystem(normalized));
  return fs->OpenOutputStream(FileSystemPath(normalized));
}

}  // namespace

arrow::Status WriteToStream(const Table& table, std::shared_ptr<arrow::io::OutputStream> sink,
                            std::shared_ptr<parquet::WriterProperties> properties) {
  size_t total_rows = 0;
  for (size_t rows : RowGroupSizes(table)) {
    total_rows += rows;
  }
  for (const auto& column : table.columns) {
    if (column.Size() != total_rows) {
      return arrow::Status::Invalid("column ", column.info.name, " has ", column.Size(), " rows, expected ",
                                    total_rows);
    }
  }

  BEGIN_PARQUET_CATCH_EXCEPTIONS
  auto file_writer = parquet::ParquetFileWriter::Open(sink, GetSchema(table.columns), std::move(properties));
  WriteRows(table, file_writer.get());
  file_writer->Close();
  END_PARQUET_CATCH_EXCEPTIONS
  return sink->Close();
}

arrow::Status WriteToFile(const Table& table, const std::string& url,
                          std::shared_ptr<parquet::WriterProperties> properties) {
  ARROW_ASSIGN_OR_RAISE(auto sink, OpenOutput(url));
  return WriteToStream(table, std::move(sink), std::move(properties));
}

arrow::Result<std::shared_ptr<arrow::Buffer>> WriteToBuffer(const Table& table,
                                                            std::shared_ptr<parquet::WriterProperties> properties) {
  ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
  // Close() is called by WriteToStream, the buffer stays with the stream
  ARROW_RETURN_NOT_OK(WriteToStream(table, sink, std::move(properties)));
  return sink->Finish();
}

arrow::Status WriteArrowTable(const arrow::Table& table, const std::string& url, int64_t row_group_size,
                              std::shared_ptr<parquet::WriterProperties> properties) {
  ARROW_ASSIGN_OR_RAISE(auto sink, OpenOutput(url));
  ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), sink, row_group_size,
                                                 std::move(properties)));
  return sink->Close();
}

arrow::Result<FileSourcePtr> OpenBufferSource(std::shared_ptr<arrow::Buffer> buffer, LoggerPtr logger) {
  return ParquetFileSource::Make(std::make_shared<arrow::io::BufferReader>(std::move(buffer)), std::move(logger));
}

arrow::Result<FileSourcePtr> OpenLocalSource(const std::string& url, LoggerPtr logger) {
  FileSourceProvider provider(MakeDefaultFileSystemProvider(), std::move(logger));
  return provider.Open(url);
}

}  // namespace parqlint
