#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "arrow/record_batch.h"
#include "parqlint/result.h"
#include "parqlint/streams/arrow/stream.h"

namespace parqlint {

class RecordBatchReaderStream : public IBatchStream {
 public:
  explicit RecordBatchReaderStream(std::shared_ptr<arrow::RecordBatchReader> record_batch_reader)
      : record_batch_reader_(std::move(record_batch_reader)) {
    Ensure(record_batch_reader_ != nullptr, std::string(__PRETTY_FUNCTION__) + ": record_batch_reader is nullptr");
  }

  std::shared_ptr<arrow::RecordBatch> ReadNext() override {
    std::shared_ptr<arrow::RecordBatch> batch;
    parqlint::Ensure(record_batch_reader_->ReadNext(&batch));
    return batch;
  }

 private:
  std::shared_ptr<arrow::RecordBatchReader> record_batch_reader_;
};

// Stops after row_limit rows, slicing the last batch if needed.
class RowLimitStream : public IBatchStream {
 public:
  RowLimitStream(BatchStreamPtr input, int64_t row_limit) : input_(std::move(input)), rows_left_(row_limit) {
    Ensure(input_ != nullptr, std::string(__PRETTY_FUNCTION__) + ": input is nullptr");
    Ensure(row_limit >= 0, std::string(__PRETTY_FUNCTION__) + ": row_limit is negative");
  }

  std::shared_ptr<arrow::RecordBatch> ReadNext() override {
    if (rows_left_ == 0) {
      return nullptr;
    }
    auto batch = input_->ReadNext();
    if (!batch) {
      return nullptr;
    }
    if (batch->num_rows() > rows_left_) {
      batch = batch->Slice(0, rows_left_);
    }
    rows_left_ -= batch->num_rows();
    return batch;
  }

 private:
  BatchStreamPtr input_;
  int64_t rows_left_;
};

}  // namespace parqlint
