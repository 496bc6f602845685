#include "parqlint/lint/sampling.h"

#include <algorithm>

namespace parqlint {

int PickSampleRowGroup(const parquet::FileMetaData& metadata) {
  for (int i = 0; i < metadata.num_row_groups(); ++i) {
    if (metadata.RowGroup(i)->num_rows() > 0) {
      return i;
    }
  }
  return 0;
}

bool IsFlatSchema(const parquet::SchemaDescriptor& schema) {
  const auto* root = schema.group_node();
  if (root->field_count() != schema.num_columns()) {
    return false;
  }
  for (int i = 0; i < root->field_count(); ++i) {
    if (root->field(i)->is_repeated()) {
      return false;
    }
  }
  return true;
}

uint64_t ChunkNonNullCount(const parquet::ColumnChunkMetaData& chunk) {
  if (chunk.num_values() <= 0) {
    return 0;
  }
  const uint64_t total = chunk.num_values();
  uint64_t null_count = 0;
  if (auto stats = chunk.statistics(); stats && stats->HasNullCount() && stats->null_count() > 0) {
    null_count = std::min<uint64_t>(stats->null_count(), total);
  }
  return total - null_count;
}

arrow::Result<BatchStreamPtr> OpenSampleStream(IFileSource& source, const std::vector<int>& columns) {
  if (!std::is_sorted(columns.begin(), columns.end())) {
    return arrow::Status::Invalid("OpenSampleStream: columns must be sorted");
  }
  auto metadata = source.Metadata();
  BatchStreamOptions options{.row_groups = std::vector<int>{PickSampleRowGroup(*metadata)},
                             .columns = columns,
                             .batch_size = kSampleRows,
                             .row_limit = kSampleRows};
  return source.OpenBatchStream(options);
}

}  // namespace parqlint
