#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "arrow/io/interfaces.h"
#include "arrow/result.h"
#include "parqlint/common/logger.h"

namespace parqlint {

// Forwards every call to the wrapped file and counts read requests and bytes.
// Totals are reported as "metrics:io:requests" and "metrics:io:bytes" when the file is destroyed.
class CountingInputFile : public arrow::io::RandomAccessFile {
 public:
  CountingInputFile(std::shared_ptr<arrow::io::RandomAccessFile> file, LoggerPtr logger)
      : file_(std::move(file)), logger_(std::move(logger)) {}

  ~CountingInputFile() override {
    if (logger_) {
      logger_->Log(std::to_string(requests_), "metrics:io:requests");
      logger_->Log(std::to_string(bytes_read_), "metrics:io:bytes");
    }
  }

  arrow::Result<int64_t> ReadAt(int64_t position, int64_t nbytes, void* out) override {
    ARROW_ASSIGN_OR_RAISE(auto bytes, file_->ReadAt(position, nbytes, out));
    Count(bytes);
    return bytes;
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> ReadAt(int64_t position, int64_t nbytes) override {
    ARROW_ASSIGN_OR_RAISE(auto buffer, file_->ReadAt(position, nbytes));
    Count(buffer->size());
    return buffer;
  }

  arrow::Result<int64_t> Read(int64_t nbytes, void* out) override {
    ARROW_ASSIGN_OR_RAISE(auto bytes, file_->Read(nbytes, out));
    Count(bytes);
    return bytes;
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override {
    ARROW_ASSIGN_OR_RAISE(auto buffer, file_->Read(nbytes));
    Count(buffer->size());
    return buffer;
  }

  arrow::Status Close() override { return file_->Close(); }

  bool closed() const override { return file_->closed(); }

  arrow::Result<int64_t> Tell() const override { return file_->Tell(); }

  arrow::Status Seek(int64_t position) override { return file_->Seek(position); }

  arrow::Result<int64_t> GetSize() override { return file_->GetSize(); }

  int64_t requests() const { return requests_; }
  int64_t bytes_read() const { return bytes_read_; }

 private:
  void Count(int64_t bytes) {
    ++requests_;
    bytes_read_ += bytes;
  }

  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  LoggerPtr logger_;

  int64_t requests_ = 0;
  int64_t bytes_read_ = 0;
};

}  // namespace parqlint
