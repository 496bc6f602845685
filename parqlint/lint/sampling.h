#pragma once

#include <cstdint>
#include <vector>

#include "arrow/result.h"
#include "parqlint/io/file_source.h"
#include "parqlint/streams/arrow/stream.h"
#include "parquet/metadata.h"
#include "parquet/schema.h"

namespace parqlint {

// Row cap of every sample pass.
inline constexpr int64_t kSampleRows = 16384;

// First row group with rows, 0 if there is none.
int PickSampleRowGroup(const parquet::FileMetaData& metadata);

// Every leaf is a top-level field: no groups, no repeated fields.
bool IsFlatSchema(const parquet::SchemaDescriptor& schema);

// Non-null values of one column chunk as declared by its metadata (0 if the chunk is empty).
uint64_t ChunkNonNullCount(const parquet::ColumnChunkMetaData& chunk);

// Streams at most kSampleRows rows of the representative row group, projected to the given leaves.
// Batch columns follow the order of `columns`, which must be sorted and belong to a flat schema.
arrow::Result<BatchStreamPtr> OpenSampleStream(IFileSource& source, const std::vector<int>& columns);

}  // namespace parqlint
