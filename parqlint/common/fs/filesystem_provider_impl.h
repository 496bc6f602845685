#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "arrow/filesystem/filesystem.h"
#include "arrow/filesystem/s3fs.h"
#include "arrow/result.h"
#include "parqlint/common/fs/filesystem_provider.h"
#include "parqlint/common/logger.h"

namespace parqlint {

class IFileSystemGetter {
 public:
  virtual arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> Get() = 0;

  virtual ~IFileSystemGetter() = default;
};

// Dispatches on the url scheme ("file", "s3", ...).
class FileSystemProvider : public IFileSystemProvider {
 public:
  explicit FileSystemProvider(std::map<std::string, std::shared_ptr<IFileSystemGetter>> scheme_to_getter);

  arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> GetFileSystem(const std::string& url) override;

 private:
  std::map<std::string, std::shared_ptr<IFileSystemGetter>> scheme_to_getter_;
};

class LocalFileSystemGetter : public IFileSystemGetter {
 public:
  arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> Get() override;

 private:
  std::shared_ptr<arrow::fs::FileSystem> localfs_;
};

// Wraps the AWS standard retry strategy and reports every retry as "metrics:s3:retry".
class LoggingS3RetryStrategy : public arrow::fs::S3RetryStrategy {
 public:
  LoggingS3RetryStrategy(int64_t max_attempts, LoggerPtr logger);

  bool ShouldRetry(const AWSErrorDetail& error, int64_t attempted_retries) override;

  int64_t CalculateDelayBeforeNextRetry(const AWSErrorDetail& error, int64_t attempted_retries) override;

 private:
  std::shared_ptr<arrow::fs::S3RetryStrategy> standard_strategy_;
  LoggerPtr logger_;
};

class S3FileSystemGetter : public IFileSystemGetter {
 public:
  struct Config {
    std::string endpoint_override;
    std::string scheme = "https";
    std::string region;
    std::string access_key;
    std::string secret_key;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
    uint32_t retry_max_attempts = 3;
  };

  explicit S3FileSystemGetter(const Config& config, LoggerPtr logger = nullptr);

  arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> Get() override;

 private:
  arrow::Result<arrow::fs::S3Options> MakeS3Options() const;

  Config config_;
  LoggerPtr logger_;

  std::shared_ptr<arrow::fs::FileSystem> s3fs_;
};

// Provider serving "file://" urls and, when a config is given, "s3://" urls.
std::shared_ptr<IFileSystemProvider> MakeDefaultFileSystemProvider(
    const std::optional<S3FileSystemGetter::Config>& s3_config = std::nullopt, LoggerPtr logger = nullptr);

}  // namespace parqlint
