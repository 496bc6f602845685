#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "arrow/record_batch.h"

namespace parqlint {

// Pull-based stream. ReadNext() returns nullptr once the stream is exhausted.
template <typename T>
class IStream {
 public:
  virtual std::shared_ptr<T> ReadNext() = 0;

  virtual ~IStream() = default;
};

template <typename T>
using StreamPtr = std::shared_ptr<IStream<T>>;

// Reads the stream to the end. Only for streams known to be small.
template <typename T>
std::vector<std::shared_ptr<T>> Drain(IStream<T>& stream) {
  std::vector<std::shared_ptr<T>> result;
  while (auto item = stream.ReadNext()) {
    result.push_back(std::move(item));
  }
  return result;
}

using IBatchStream = IStream<arrow::RecordBatch>;
using BatchStreamPtr = StreamPtr<arrow::RecordBatch>;

}  // namespace parqlint
