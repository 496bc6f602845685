#include "parqlint/io/file_source.h"

#include <numeric>
#include <string>
#include <utility>

#include "parqlint/common/fs/url.h"
#include "parqlint/io/counting_input_file.h"
#include "parqlint/streams/arrow/batch_reader.h"

namespace parqlint {

arrow::Result<FileSourcePtr> ParquetFileSource::Make(std::shared_ptr<arrow::io::RandomAccessFile> file,
                                                     LoggerPtr logger) {
  if (!file) {
    return arrow::Status::Invalid("ParquetFileSource: file is nullptr");
  }

  parquet::ReaderProperties reader_properties = parquet::default_reader_properties();

  parquet::arrow::FileReaderBuilder reader_builder;
  ARROW_RETURN_NOT_OK(reader_builder.Open(file, reader_properties));

  std::unique_ptr<parquet::arrow::FileReader> reader;
  ARROW_RETURN_NOT_OK(reader_builder.Build(&reader));

  return FileSourcePtr(
      new ParquetFileSource(std::move(file), std::move(reader_properties), std::move(reader), std::move(logger)));
}

ParquetFileSource::ParquetFileSource(std::shared_ptr<arrow::io::RandomAccessFile> file,
                                     parquet::ReaderProperties reader_properties,
                                     std::unique_ptr<parquet::arrow::FileReader> reader, LoggerPtr logger)
    : file_(std::move(file)),
      reader_properties_(std::move(reader_properties)),
      reader_(std::move(reader)),
      logger_(std::move(logger)) {}

std::shared_ptr<parquet::FileMetaData> ParquetFileSource::Metadata() const {
  return reader_->parquet_reader()->metadata();
}

arrow::Result<std::shared_ptr<arrow::Buffer>> ParquetFileSource::ReadRange(int64_t offset, int64_t length) {
  if (offset < 0 || length < 0) {
    return arrow::Status::Invalid("ReadRange: invalid range (offset ", offset, ", length ", length, ")");
  }
  ARROW_ASSIGN_OR_RAISE(auto buffer, file_->ReadAt(offset, length));
  if (buffer->size() != length) {
    return arrow::Status::IOError("ReadRange: expected ", length, " bytes at offset ", offset, ", got ",
                                  buffer->size());
  }
  return buffer;
}

arrow::Result<BatchStreamPtr> ParquetFileSource::OpenBatchStream(const BatchStreamOptions& options) {
  auto metadata = Metadata();

  std::vector<int> row_groups;
  if (options.row_groups.has_value()) {
    row_groups = *options.row_groups;
  } else {
    row_groups.resize(metadata->num_row_groups());
    std::iota(row_groups.begin(), row_groups.end(), 0);
  }

  std::vector<int> columns;
  if (options.columns.has_value()) {
    columns = *options.columns;
  } else {
    columns.resize(metadata->num_columns());
    std::iota(columns.begin(), columns.end(), 0);
  }

  reader_->set_batch_size(options.batch_size);

  std::shared_ptr<arrow::RecordBatchReader> record_batch_reader;
  ARROW_RETURN_NOT_OK(reader_->GetRecordBatchReader(row_groups, columns, &record_batch_reader));
  if (logger_) {
    logger_->Log(std::to_string(row_groups.size()), "metrics:row_groups:read");
  }

  BatchStreamPtr stream = std::make_shared<RecordBatchReaderStream>(std::move(record_batch_reader));
  if (options.row_limit.has_value()) {
    stream = std::make_shared<RowLimitStream>(std::move(stream), *options.row_limit);
  }
  return stream;
}

arrow::Result<std::shared_ptr<arrow::Schema>> ParquetFileSource::ArrowSchema() const {
  std::shared_ptr<arrow::Schema> schema;
  ARROW_RETURN_NOT_OK(reader_->GetSchema(&schema));
  return schema;
}

std::shared_ptr<parquet::PageIndexReader> ParquetFileSource::PageIndexReader() {
  return reader_->parquet_reader()->GetPageIndexReader();
}

arrow::Result<FileSourcePtr> FileSourceProvider::Open(const std::string& url) const {
  const std::string normalized_url = NormalizeUrl(url);
  ARROW_ASSIGN_OR_RAISE(auto fs, fs_provider_->GetFileSystem(normalized_url));

  ARROW_ASSIGN_OR_RAISE(auto input_file, fs->OpenInputFile(FileSystemPath(normalized_url)));
  auto counting_file = std::make_shared<CountingInputFile>(std::move(input_file), logger_);

  return ParquetFileSource::Make(std::move(counting_file), logger_);
}

}  // namespace parqlint
