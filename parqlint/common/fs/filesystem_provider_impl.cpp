#include "parqlint/common/fs/filesystem_provider_impl.h"

#include <cstdlib>
#include <string>
#include <utility>

#include "arrow/filesystem/localfs.h"
#include "arrow/filesystem/s3fs.h"
#include "parqlint/common/fs/url.h"

namespace parqlint {

namespace {

arrow::Status InitializeS3IfNecessary() {
  if (!arrow::fs::IsS3Initialized()) {
    arrow::fs::S3GlobalOptions global_options{};
    global_options.log_level = arrow::fs::S3LogLevel::Fatal;
    return arrow::fs::InitializeS3(global_options);
  }
  return arrow::Status::OK();
}

}  // namespace

FileSystemProvider::FileSystemProvider(std::map<std::string, std::shared_ptr<IFileSystemGetter>> scheme_to_getter)
    : scheme_to_getter_(std::move(scheme_to_getter)) {}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> FileSystemProvider::GetFileSystem(const std::string& url) {
  auto components = SplitUrl(url);
  const std::string scheme = std::string(components.scheme);

  auto it = scheme_to_getter_.find(scheme);
  if (it == scheme_to_getter_.end()) {
    return arrow::Status::ExecutionError("FileSystemProvider: unexpected filesystem scheme '", scheme, "' for url ",
                                         url);
  }

  return it->second->Get();
}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> LocalFileSystemGetter::Get() {
  if (!localfs_) {
    localfs_ = std::make_shared<arrow::fs::LocalFileSystem>();
  }
  return localfs_;
}

LoggingS3RetryStrategy::LoggingS3RetryStrategy(int64_t max_attempts, LoggerPtr logger)
    : standard_strategy_(arrow::fs::S3RetryStrategy::GetAwsStandardRetryStrategy(max_attempts)),
      logger_(std::move(logger)) {}

bool LoggingS3RetryStrategy::ShouldRetry(const AWSErrorDetail& error, int64_t attempted_retries) {
  bool result = standard_strategy_->ShouldRetry(error, attempted_retries);
  if (result && logger_) {
    logger_->Log(error.message, "metrics:s3:retry");
  }
  return result;
}

int64_t LoggingS3RetryStrategy::CalculateDelayBeforeNextRetry(const AWSErrorDetail& error,
                                                              int64_t attempted_retries) {
  return standard_strategy_->CalculateDelayBeforeNextRetry(error, attempted_retries);
}

S3FileSystemGetter::S3FileSystemGetter(const Config& config, LoggerPtr logger)
    : config_(config), logger_(std::move(logger)) {}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> S3FileSystemGetter::Get() {
  if (!s3fs_) {
    ARROW_ASSIGN_OR_RAISE(auto options, MakeS3Options());
    setenv("AWS_EC2_METADATA_DISABLED", "true", 1);
    ARROW_ASSIGN_OR_RAISE(s3fs_, arrow::fs::S3FileSystem::Make(options));
  }
  return s3fs_;
}

arrow::Result<arrow::fs::S3Options> S3FileSystemGetter::MakeS3Options() const {
  ARROW_RETURN_NOT_OK(InitializeS3IfNecessary());

  auto options = config_.access_key.empty()
                     ? arrow::fs::S3Options::Defaults()
                     : arrow::fs::S3Options::FromAccessKey(config_.access_key, config_.secret_key);
  options.endpoint_override = config_.endpoint_override;
  options.scheme = config_.scheme;
  if (!config_.region.empty()) {
    options.region = config_.region;
  }
  options.connect_timeout = config_.connect_timeout.count() / 1000.0;
  options.request_timeout = config_.request_timeout.count() / 1000.0;
  options.retry_strategy = std::make_shared<LoggingS3RetryStrategy>(config_.retry_max_attempts, logger_);
  return options;
}

std::shared_ptr<IFileSystemProvider> MakeDefaultFileSystemProvider(
    const std::optional<S3FileSystemGetter::Config>& s3_config, LoggerPtr logger) {
  std::map<std::string, std::shared_ptr<IFileSystemGetter>> getters;
  getters["file"] = std::make_shared<LocalFileSystemGetter>();
  if (s3_config.has_value()) {
    getters["s3"] = std::make_shared<S3FileSystemGetter>(*s3_config, std::move(logger));
  }
  return std::make_shared<FileSystemProvider>(std::move(getters));
}

}  // namespace parqlint
