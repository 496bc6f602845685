#include "parqlint/rules/vector_embedding.h"

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "parqlint/rules/common.h"

namespace parqlint::rules {

namespace {

// a quarter of the 1 MB default data page size
constexpr uint64_t kSmallPageSize = 256 * 1024;
constexpr int64_t kMinValuesPerRow = 64;

}  // namespace

std::vector<Diagnostic> VectorEmbeddingRule::Check(const RuleContext& context) const {
  std::vector<Diagnostic> diagnostics;
  const auto& metadata = *context.metadata;

  for (const auto& column : context.columns) {
    const bool is_float =
        column.physical_type == parquet::Type::FLOAT || column.physical_type == parquet::Type::DOUBLE;
    if (!is_float || !column.IsRepeated()) {
      continue;
    }

    int64_t total_rows = 0;
    int64_t total_values = 0;
    for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
      auto row_group = metadata.RowGroup(rg);
      if (row_group->num_rows() <= 0) {
        continue;
      }
      total_rows += row_group->num_rows();
      total_values += row_group->ColumnChunk(column.column_index)->num_values();
    }
    if (total_rows <= 0) {
      continue;
    }

    const int64_t average_values = total_values / total_rows;
    if (average_values < kMinValuesPerRow) {
      continue;
    }

    Prescription prescription;
    prescription.Push(SetFileDataPageSizeLimit{.bytes = kSmallPageSize});
    diagnostics.push_back(Diagnostic{
        .rule_name = std::string(kName),
        .severity = Severity::kWarning,
        .location = MakeColumnLocation(column),
        .message = absl::StrCat("column looks like a vector embedding (", average_values,
                                " values/row on average), consider smaller page size for random-access lookups"),
        .prescription = std::move(prescription)});
  }
  return diagnostics;
}

}  // namespace parqlint::rules
