#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "arrow/buffer.h"
#include "arrow/io/interfaces.h"
#include "arrow/result.h"
#include "arrow/status.h"
#include "arrow/table.h"
#include "parqlint/io/file_source.h"
#include "parqlint/test_utils/column.h"
#include "parquet/properties.h"

namespace parqlint {

arrow::Status WriteToStream(const Table& table, std::shared_ptr<arrow::io::OutputStream> sink,
                            std::shared_ptr<parquet::WriterProperties> properties);

arrow::Status WriteToFile(const Table& table, const std::string& url,
                          std::shared_ptr<parquet::WriterProperties> properties = parquet::default_writer_properties());

// In-memory file for tests that only need metadata and a few pages.
arrow::Result<std::shared_ptr<arrow::Buffer>> WriteToBuffer(
    const Table& table, std::shared_ptr<parquet::WriterProperties> properties = parquet::default_writer_properties());

// Goes through the Arrow writer, for nested schemas the column builders cannot express.
arrow::Status WriteArrowTable(const arrow::Table& table, const std::string& url, int64_t row_group_size,
                              std::shared_ptr<parquet::WriterProperties> properties =
                                  parquet::default_writer_properties());

arrow::Result<FileSourcePtr> OpenBufferSource(std::shared_ptr<arrow::Buffer> buffer, LoggerPtr logger = nullptr);

arrow::Result<FileSourcePtr> OpenLocalSource(const std::string& url, LoggerPtr logger = nullptr);

}  // namespace parqlint
