#pragma once

#include <memory>

#include "arrow/result.h"
#include "arrow/table.h"
#include "parqlint/io/file_source.h"

namespace parqlint {

// Every row of the source, decoded with the Arrow reader.
arrow::Result<std::shared_ptr<arrow::Table>> ReadAllRows(IFileSource& source);

}  // namespace parqlint
