#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "arrow/io/interfaces.h"
#include "arrow/status.h"
#include "parqlint/common/fs/filesystem_provider.h"
#include "parqlint/common/logger.h"
#include "parqlint/io/file_source.h"
#include "parqlint/prescription/prescription.h"

namespace parqlint {

struct RewriteOptions {
  // rows per decoded batch, the only data held in memory
  int64_t batch_size = 64 * 1024;
  LoggerPtr logger;
};

// Streams every row of the source into `sink` with the source physical properties overlaid by the prescription.
// Conflicting directives are logged as "rewrite:conflict", the last one wins. Closes the sink, also on failure.
arrow::Status RewriteToStream(IFileSource& source, std::shared_ptr<arrow::io::OutputStream> sink,
                              const Prescription& prescription, const RewriteOptions& options = {});

// Invalid status if the Parquet or the Arrow schema of `output` differs from the one of `source`.
arrow::Status VerifySameSchema(IFileSource& source, IFileSource& output);

// Rewrites the file at `input_url` to `output_url` and checks the written schema.
// The output file is deleted if the rewrite fails before it is complete.
arrow::Status Rewrite(std::shared_ptr<IFileSystemProvider> fs_provider, const std::string& input_url,
                      const std::string& output_url, const Prescription& prescription,
                      const RewriteOptions& options = {});

}  // namespace parqlint
