#include "parqlint/test_utils/read.h"

namespace parqlint {

arrow::Result<std::shared_ptr<arrow::Table>> ReadAllRows(IFileSource& source) {
  ARROW_ASSIGN_OR_RAISE(auto schema, source.ArrowSchema());
  ARROW_ASSIGN_OR_RAISE(auto stream, source.OpenBatchStream(BatchStreamOptions{}));

  ARROW_ASSIGN_OR_RAISE(auto table, arrow::Table::FromRecordBatches(schema, Drain(*stream)));
  return table->CombineChunks();
}

}  // namespace parqlint
