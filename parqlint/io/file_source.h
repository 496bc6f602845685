#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arrow/buffer.h"
#include "arrow/io/interfaces.h"
#include "arrow/result.h"
#include "arrow/type.h"
#include "parqlint/common/fs/filesystem_provider.h"
#include "parqlint/common/logger.h"
#include "parqlint/streams/arrow/stream.h"
#include "parquet/arrow/reader.h"
#include "parquet/metadata.h"
#include "parquet/page_index.h"
#include "parquet/properties.h"

namespace parqlint {

struct BatchStreamOptions {
  // all row groups if not set
  std::optional<std::vector<int>> row_groups;
  // leaf column indices, all leaves if not set
  std::optional<std::vector<int>> columns;
  int64_t batch_size = 64 * 1024;
  std::optional<int64_t> row_limit;
};

// Metadata and bytes of one Parquet file. All I/O of lint and rewrite goes through this interface.
class IFileSource {
 public:
  virtual std::shared_ptr<parquet::FileMetaData> Metadata() const = 0;

  virtual arrow::Result<std::shared_ptr<arrow::Buffer>> ReadRange(int64_t offset, int64_t length) = 0;

  virtual arrow::Result<BatchStreamPtr> OpenBatchStream(const BatchStreamOptions& options) = 0;

  virtual arrow::Result<std::shared_ptr<arrow::Schema>> ArrowSchema() const = 0;

  // nullptr if the file has no page index
  virtual std::shared_ptr<parquet::PageIndexReader> PageIndexReader() = 0;

  virtual const parquet::ReaderProperties& ReaderProperties() const = 0;

  virtual ~IFileSource() = default;
};

using FileSourcePtr = std::shared_ptr<IFileSource>;

class ParquetFileSource : public IFileSource {
 public:
  static arrow::Result<FileSourcePtr> Make(std::shared_ptr<arrow::io::RandomAccessFile> file,
                                           LoggerPtr logger = nullptr);

  std::shared_ptr<parquet::FileMetaData> Metadata() const override;

  arrow::Result<std::shared_ptr<arrow::Buffer>> ReadRange(int64_t offset, int64_t length) override;

  arrow::Result<BatchStreamPtr> OpenBatchStream(const BatchStreamOptions& options) override;

  arrow::Result<std::shared_ptr<arrow::Schema>> ArrowSchema() const override;

  std::shared_ptr<parquet::PageIndexReader> PageIndexReader() override;

  const parquet::ReaderProperties& ReaderProperties() const override { return reader_properties_; }

 private:
  ParquetFileSource(std::shared_ptr<arrow::io::RandomAccessFile> file, parquet::ReaderProperties reader_properties,
                    std::unique_ptr<parquet::arrow::FileReader> reader, LoggerPtr logger);

  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  parquet::ReaderProperties reader_properties_;
  std::unique_ptr<parquet::arrow::FileReader> reader_;
  LoggerPtr logger_;
};

class IFileSourceProvider {
 public:
  virtual arrow::Result<FileSourcePtr> Open(const std::string& url) const = 0;

  virtual ~IFileSourceProvider() = default;
};

// Resolves "file://" and "s3://" urls (a bare path means "file://") and counts the bytes read from them.
class FileSourceProvider : public IFileSourceProvider {
 public:
  explicit FileSourceProvider(std::shared_ptr<IFileSystemProvider> fs_provider, LoggerPtr logger = nullptr)
      : fs_provider_(std::move(fs_provider)), logger_(std::move(logger)) {}

  arrow::Result<FileSourcePtr> Open(const std::string& url) const override;

 private:
  std::shared_ptr<IFileSystemProvider> fs_provider_;
  LoggerPtr logger_;
};

}  // namespace parqlint
