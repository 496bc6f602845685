#pragma once

#include <optional>
#include <vector>

#include "parqlint/prescription/directive.h"
#include "parqlint/prescription/writer_plan.h"
#include "parquet/metadata.h"
#include "parquet/types.h"

namespace parqlint {

// Most frequent data encoding of the chunks, ignoring level and dictionary index encodings. Ties go to the
// encoding seen first. nullopt if no chunk has such an encoding or it has no DataEncoding counterpart.
std::optional<DataEncoding> MajorityDataEncoding(const std::vector<const parquet::ColumnChunkMetaData*>& chunks);

// Physical properties the source file was written with, to be overlaid by a prescription:
// writer version and data page version, created_by, sorting columns shared by all row groups,
// the largest row group as max_row_group_size and, per column, the majority codec and data encoding,
// dictionary usage, statistics level and bloom filter presence.
WriterPlan InferBaseWriterPlan(const parquet::FileMetaData& metadata);

}  // namespace parqlint
