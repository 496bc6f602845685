#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "parqlint/common/logger.h"
#include "parqlint/io/file_source.h"
#include "parqlint/lint/column_context.h"
#include "parqlint/lint/diagnostic.h"
#include "parquet/metadata.h"

namespace parqlint {

// Snapshot shared by all rules of one run. Rules only read it.
struct RuleContext {
  std::shared_ptr<parquet::FileMetaData> metadata;
  // one per leaf column, in schema order
  std::vector<ColumnContext> columns;
  // for rules that inspect pages
  FileSourcePtr source;
  bool gpu = false;
  LoggerPtr logger;
};

class IRule {
 public:
  virtual std::string_view Name() const = 0;

  // No diagnostics when the file is compliant or the evidence is insufficient.
  virtual std::vector<Diagnostic> Check(const RuleContext& context) const = 0;

  virtual ~IRule() = default;
};

using RulePtr = std::shared_ptr<const IRule>;

}  // namespace parqlint
