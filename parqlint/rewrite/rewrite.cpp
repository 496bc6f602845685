#include "parqlint/rewrite/rewrite.h"

#include <string>
#include <string_view>
#include <utility>

#include "absl/strings/str_cat.h"
#include "arrow/filesystem/filesystem.h"
#include "arrow/memory_pool.h"
#include "arrow/record_batch.h"
#include "parqlint/common/fs/url.h"
#include "parqlint/common/measure.h"
#include "parqlint/rewrite/base_properties.h"
#include "parquet/arrow/writer.h"
#include "parquet/properties.h"

namespace parqlint {

namespace {

constexpr std::string_view kArrowSchemaKey = "ARROW:schema";

bool HasStoredArrowSchema(const parquet::FileMetaData& metadata) {
  auto key_value_metadata = metadata.key_value_metadata();
  return key_value_metadata && key_value_metadata->FindKey(std::string(kArrowSchemaKey)) >= 0;
}

arrow::Status WriteRows(IFileSource& source, const std::shared_ptr<arrow::io::OutputStream>& sink,
                        const Prescription& prescription, const RewriteOptions& options) {
  const auto& logger = options.logger;
  auto metadata = source.Metadata();

  WriterPlan plan = InferBaseWriterPlan(*metadata);
  if (auto conflict = prescription.Validate(); conflict && logger) {
    logger->Log(conflict->ToString(), "rewrite:conflict");
  }
  prescription.Apply(plan);

  auto properties = BuildWriterProperties(plan, *metadata->schema(), logger);
  parquet::ArrowWriterProperties::Builder arrow_properties_builder;
  if (HasStoredArrowSchema(*metadata)) {
    arrow_properties_builder.store_schema();
  }
  auto arrow_properties = arrow_properties_builder.build();

  ARROW_ASSIGN_OR_RAISE(auto schema, source.ArrowSchema());
  ARROW_ASSIGN_OR_RAISE(auto writer, parquet::arrow::FileWriter::Open(*schema, arrow::default_memory_pool(), sink,
                                                                      properties, arrow_properties));

  ARROW_ASSIGN_OR_RAISE(auto stream, source.OpenBatchStream(BatchStreamOptions{.batch_size = options.batch_size}));
  int64_t rows = 0;
  {
    ScopedStageTimer timer(logger, "rewrite:copy");
    while (auto batch = stream->ReadNext()) {
      ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
      rows += batch->num_rows();
    }
  }
  ARROW_RETURN_NOT_OK(writer->Close());
  ARROW_RETURN_NOT_OK(sink->Close());

  Log(logger, std::to_string(rows), "metrics:rewrite:rows");
  return arrow::Status::OK();
}

// Deletes the output file unless the rewrite completed.
class PartialOutputGuard {
 public:
  PartialOutputGuard(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path, LoggerPtr logger)
      : fs_(std::move(fs)), path_(std::move(path)), logger_(std::move(logger)) {}

  PartialOutputGuard(const PartialOutputGuard&) = delete;
  PartialOutputGuard& operator=(const PartialOutputGuard&) = delete;

  ~PartialOutputGuard() {
    if (committed_) {
      return;
    }
    if (auto status = fs_->DeleteFile(path_); !status.ok()) {
      Log(logger_, absl::StrCat(path_, ": ", status.ToString()), "rewrite:delete_partial_output");
    }
  }

  void Commit() { committed_ = true; }

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string path_;
  LoggerPtr logger_;
  bool committed_ = false;
};

}  // namespace

arrow::Status RewriteToStream(IFileSource& source, std::shared_ptr<arrow::io::OutputStream> sink,
                              const Prescription& prescription, const RewriteOptions& options) {
  auto status = WriteRows(source, sink, prescription, options);
  if (!status.ok() && !sink->closed()) {
    if (auto close_status = sink->Close(); !close_status.ok()) {
      Log(options.logger, close_status.ToString(), "rewrite:close_sink");
    }
  }
  return status;
}

arrow::Status VerifySameSchema(IFileSource& source, IFileSource& output) {
  const auto& source_schema = *source.Metadata()->schema();
  const auto& output_schema = *output.Metadata()->schema();
  ARROW_ASSIGN_OR_RAISE(auto source_arrow_schema, source.ArrowSchema());
  ARROW_ASSIGN_OR_RAISE(auto output_arrow_schema, output.ArrowSchema());

  if (!source_schema.Equals(output_schema) || !source_arrow_schema->Equals(*output_arrow_schema, false)) {
    return arrow::Status::Invalid("rewritten schema differs from source schema: source ",
                                  source_arrow_schema->ToString(), ", rewritten ", output_arrow_schema->ToString());
  }
  return arrow::Status::OK();
}

arrow::Status Rewrite(std::shared_ptr<IFileSystemProvider> fs_provider, const std::string& input_url,
                      const std::string& output_url, const Prescription& prescription, const RewriteOptions& options) {
  FileSourceProvider sources(fs_provider, options.logger);
  ARROW_ASSIGN_OR_RAISE(auto source, sources.Open(input_url));

  const std::string normalized_output = NormalizeUrl(output_url);
  ARROW_ASSIGN_OR_RAISE(auto output_fs, fs_provider->GetFileSystem(normalized_output));
  const std::string output_path = FileSystemPath(normalized_output);
  ARROW_ASSIGN_OR_RAISE(auto sink, output_fs->OpenOutputStream(output_path));
  PartialOutputGuard guard(output_fs, output_path, options.logger);

  ARROW_RETURN_NOT_OK(RewriteToStream(*source, std::move(sink), prescription, options));
  guard.Commit();

  ARROW_ASSIGN_OR_RAISE(auto output, sources.Open(normalized_output));
  return VerifySameSchema(*source, *output);
}

}  // namespace parqlint
