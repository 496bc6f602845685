#include "parqlint/lint/cardinality.h"

#include <algorithm>
#include <optional>
#include <string>

#include "parqlint/io/page_inspector.h"
#include "parqlint/lint/sampling.h"
#include "parqlint/lint/value_set.h"

namespace parqlint {

namespace {

std::vector<uint64_t> TotalNonNullCounts(const parquet::FileMetaData& metadata) {
  std::vector<uint64_t> totals(metadata.num_columns(), 0);
  for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
    auto rg_meta = metadata.RowGroup(rg);
    for (int col = 0; col < metadata.num_columns(); ++col) {
      totals[col] += ChunkNonNullCount(*rg_meta->ColumnChunk(col));
    }
  }
  return totals;
}

}  // namespace

uint64_t ScaleDistinct(uint64_t sample_distinct, uint64_t sample_total, uint64_t full_total) {
  if (sample_total == 0 || full_total == 0) {
    return full_total;
  }
  const double ratio = static_cast<double>(sample_distinct) / static_cast<double>(sample_total);
  const auto scaled = static_cast<uint64_t>(ratio * static_cast<double>(full_total));
  return std::min(std::max(scaled, sample_distinct), full_total);
}

arrow::Result<std::vector<ColumnCardinality>> EstimateCardinality(IFileSource& source, LoggerPtr logger) {
  auto metadata = source.Metadata();
  const int num_columns = metadata->num_columns();
  if (metadata->num_row_groups() == 0) {
    return std::vector<ColumnCardinality>{};
  }

  const int sample_rg = PickSampleRowGroup(*metadata);
  auto sample_rg_meta = metadata->RowGroup(sample_rg);
  const auto totals = TotalNonNullCounts(*metadata);

  std::vector<std::optional<ColumnCardinality>> result(num_columns);

  for (int col = 0; col < num_columns; ++col) {
    auto chunk = sample_rg_meta->ColumnChunk(col);
    const uint64_t sample_non_null = ChunkNonNullCount(*chunk);
    const uint64_t total_non_null = totals[col];
    if (sample_non_null == 0) {
      continue;
    }

    if (auto stats = chunk->statistics(); stats && stats->HasDistinctCount()) {
      const uint64_t distinct = std::min<uint64_t>(std::max<int64_t>(stats->distinct_count(), 0), sample_non_null);
      result[col] = ColumnCardinality{.distinct_count = ScaleDistinct(distinct, sample_non_null, total_non_null),
                                      .non_null_count = total_non_null};
      Log(logger, "statistics", "metrics:cardinality:tier");
      continue;
    }

    auto maybe_entries = ReadDictionaryEntryCount(source, *chunk);
    if (!maybe_entries.ok()) {
      Log(logger, "column " + std::to_string(col) + ": " + maybe_entries.status().ToString(), "degraded:cardinality");
      continue;
    }
    if (auto entries = *maybe_entries) {
      const uint64_t dictionary_distinct = std::max<int64_t>(*entries, 0);
      const uint64_t scaled =
          ScaleDistinct(std::min(dictionary_distinct, sample_non_null), sample_non_null, total_non_null);
      result[col] = ColumnCardinality{.distinct_count = std::max(scaled, std::min(dictionary_distinct, total_non_null)),
                                      .non_null_count = total_non_null};
      Log(logger, "dictionary", "metrics:cardinality:tier");
    }
  }

  if (IsFlatSchema(*metadata->schema())) {
    std::vector<int> unresolved;
    for (int col = 0; col < num_columns; ++col) {
      if (!result[col].has_value()) {
        unresolved.push_back(col);
      }
    }

    if (!unresolved.empty()) {
      ARROW_ASSIGN_OR_RAISE(auto stream, OpenSampleStream(source, unresolved));
      std::vector<DistinctValueCounter> counters(unresolved.size());
      while (auto batch = stream->ReadNext()) {
        for (size_t i = 0; i < unresolved.size(); ++i) {
          counters[i].Add(*batch->column(i));
        }
      }

      for (size_t i = 0; i < unresolved.size(); ++i) {
        const int col = unresolved[i];
        const uint64_t sample_non_null = counters[i].NonNullCount();
        if (sample_non_null == 0) {
          continue;
        }
        const uint64_t sample_distinct = counters[i].DistinctCount();
        const uint64_t total_non_null = totals[col];
        const uint64_t estimated = ScaleDistinct(sample_distinct, sample_non_null, total_non_null);
        result[col] = ColumnCardinality{.distinct_count = std::min(std::max(estimated, sample_distinct), total_non_null),
                                        .non_null_count = total_non_null};
        Log(logger, "sample", "metrics:cardinality:tier");
      }
    }
  } else {
    Log(logger, "nested schema, value sampling skipped", "degraded:cardinality");
  }

  std::vector<ColumnCardinality> estimates;
  estimates.reserve(num_columns);
  for (int col = 0; col < num_columns; ++col) {
    if (result[col].has_value()) {
      estimates.push_back(*result[col]);
    } else {
      estimates.push_back(ColumnCardinality{.distinct_count = totals[col], .non_null_count = totals[col]});
    }
  }
  return estimates;
}

}  // namespace parqlint
