#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "arrow/filesystem/s3fs.h"
#include "parqlint/common/error.h"
#include "parqlint/common/fs/filesystem_provider_impl.h"
#include "parqlint/common/logger.h"
#include "parqlint/common/measure.h"
#include "parqlint/io/file_source.h"
#include "parqlint/lint/diagnostic.h"
#include "parqlint/lint/lint.h"
#include "parqlint/prescription/prescription.h"
#include "parqlint/result.h"
#include "parqlint/rewrite/rewrite.h"

ABSL_FLAG(std::string, mode, "lint", "lint/rewrite");
ABSL_FLAG(std::string, input, "", "url or path of the parquet file");
ABSL_FLAG(std::string, output, "", "url or path of the rewritten file (rewrite mode)");
ABSL_FLAG(std::vector<std::string>, rules, {}, "rules to run, all rules if empty");
ABSL_FLAG(std::string, severity, "suggestion", "minimal severity to report (suggestion/warning/error)");
ABSL_FLAG(bool, gpu, false, "enable checks for GPU readers");
ABSL_FLAG(std::string, export_prescription, "", "file to write the prescription to");
ABSL_FLAG(std::string, from_prescription, "", "prescription file to apply instead of lint fixes (rewrite mode)");
ABSL_FLAG(bool, dry_run, false, "print the directives without rewriting (rewrite mode)");
ABSL_FLAG(int64_t, batch_size, 64 * 1024, "rows per batch while rewriting");
ABSL_FLAG(bool, verbose, false, "");
ABSL_FLAG(bool, print_timings, false, "");
ABSL_FLAG(std::string, s3_endpoint, "", "s3 endpoint");
ABSL_FLAG(std::string, s3_scheme, "https", "s3 scheme (http/https)");
ABSL_FLAG(std::string, s3_region, "", "s3 region");
ABSL_FLAG(std::string, s3_access_key, "", "s3 access key");
ABSL_FLAG(std::string, s3_secret_key, "", "s3 secret key");
ABSL_FLAG(int64_t, s3_connect_timeout_ms, 10000, "");
ABSL_FLAG(int64_t, s3_request_timeout_ms, 60000, "");
ABSL_FLAG(uint32_t, s3_retry_max_attempts, 3, "");

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIssues = 1;
constexpr int kExitError = 2;

class StderrLogger : public parqlint::ILogger {
 public:
  StderrLogger(bool verbose, bool print_timings) : verbose_(verbose), print_timings_(print_timings) {}

  void Log(const Message& message, const MessageType& message_type) override {
    if (verbose_ || (print_timings_ && message_type.starts_with("metrics:time:"))) {
      std::cerr << "[" << message_type << "] " << message << std::endl;
    }
  }

 private:
  const bool verbose_;
  const bool print_timings_;
};

struct S3FinalizerGuard {
  ~S3FinalizerGuard() {
    if (arrow::fs::IsS3Initialized() && !arrow::fs::IsS3Finalized()) {
      if (auto status = arrow::fs::EnsureS3Finalized(); !status.ok()) {
        std::cerr << status.ToString() << std::endl;
      }
    }
  }
};

parqlint::S3FileSystemGetter::Config S3ConfigFromFlags() {
  parqlint::S3FileSystemGetter::Config config;
  config.endpoint_override = absl::GetFlag(FLAGS_s3_endpoint);
  config.scheme = absl::GetFlag(FLAGS_s3_scheme);
  config.region = absl::GetFlag(FLAGS_s3_region);
  config.access_key = absl::GetFlag(FLAGS_s3_access_key);
  config.secret_key = absl::GetFlag(FLAGS_s3_secret_key);
  config.connect_timeout = std::chrono::milliseconds(absl::GetFlag(FLAGS_s3_connect_timeout_ms));
  config.request_timeout = std::chrono::milliseconds(absl::GetFlag(FLAGS_s3_request_timeout_ms));
  config.retry_max_attempts = absl::GetFlag(FLAGS_s3_retry_max_attempts);
  return config;
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream input(path);
  parqlint::Ensure(input.good(), "cannot open " + path);
  std::stringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

void WriteTextFile(const std::string& path, const std::string& text) {
  std::ofstream output(path);
  parqlint::Ensure(output.good(), "cannot write " + path);
  output << text;
  parqlint::Ensure(output.good(), "cannot write " + path);
}

std::vector<parqlint::Diagnostic> FilterBySeverity(const std::vector<parqlint::Diagnostic>& diagnostics,
                                                   parqlint::Severity min_severity) {
  std::vector<parqlint::Diagnostic> result;
  for (const auto& diagnostic : diagnostics) {
    if (diagnostic.severity >= min_severity) {
      result.push_back(diagnostic);
    }
  }
  return result;
}

void ExportPrescription(const parqlint::Prescription& prescription, const std::string& path) {
  if (path.empty()) {
    return;
  }
  if (auto conflict = prescription.Validate()) {
    std::cerr << "warning: exported prescription has conflicts: " << conflict->ToString() << std::endl;
  }
  std::string text = prescription.Serialize();
  if (!text.empty()) {
    text += "\n";
  }
  WriteTextFile(path, text);
  std::cout << "Prescription written to " << path << std::endl;
}

std::vector<parqlint::Diagnostic> RunLint(const parqlint::IFileSourceProvider& sources, const std::string& input,
                                          parqlint::LoggerPtr logger) {
  parqlint::LintOptions options{.gpu = absl::GetFlag(FLAGS_gpu), .logger = std::move(logger)};
  if (auto rules = absl::GetFlag(FLAGS_rules); !rules.empty()) {
    options.rule_names = std::move(rules);
  }

  const std::string severity_text = absl::GetFlag(FLAGS_severity);
  auto min_severity = parqlint::ParseSeverity(severity_text);
  parqlint::Ensure(min_severity.has_value(), "unknown severity '" + severity_text + "'");

  return FilterBySeverity(parqlint::ValueSafe(parqlint::Lint(sources, input, options)), *min_severity);
}

int LintMode(const parqlint::IFileSourceProvider& sources, const std::string& input, parqlint::LoggerPtr logger) {
  const auto diagnostics = RunLint(sources, input, std::move(logger));
  for (const auto& diagnostic : diagnostics) {
    std::cout << diagnostic.ToString() << std::endl;
  }
  if (diagnostics.empty()) {
    std::cout << "No issues found." << std::endl;
  } else {
    std::cout << diagnostics.size() << " issue(s) found." << std::endl;
  }

  ExportPrescription(parqlint::MergePrescriptions(diagnostics), absl::GetFlag(FLAGS_export_prescription));
  return parqlint::HasWarningsOrErrors(diagnostics) ? kExitIssues : kExitOk;
}

int RewriteMode(std::shared_ptr<parqlint::IFileSystemProvider> fs_provider,
                const parqlint::IFileSourceProvider& sources, const std::string& input, parqlint::LoggerPtr logger) {
  const std::string output = absl::GetFlag(FLAGS_output);
  const std::string from_prescription = absl::GetFlag(FLAGS_from_prescription);
  if (output.empty()) {
    std::cerr << "--output is required in rewrite mode" << std::endl;
    return kExitError;
  }
  if (!from_prescription.empty() && !absl::GetFlag(FLAGS_rules).empty()) {
    std::cerr << "--rules and --from_prescription cannot both be set" << std::endl;
    return kExitError;
  }

  parqlint::Prescription prescription;
  if (!from_prescription.empty()) {
    prescription = parqlint::Prescription::Parse(ReadTextFile(from_prescription));
    if (prescription.Empty()) {
      std::cout << "No directives to apply." << std::endl;
      return kExitOk;
    }
  } else {
    prescription = parqlint::MergePrescriptions(RunLint(sources, input, logger));
    if (prescription.Empty()) {
      std::cout << "No fixes to apply." << std::endl;
      return kExitOk;
    }
  }

  if (auto conflict = prescription.Validate()) {
    std::cerr << "Conflicting directives detected; continuing with last directive wins: " << conflict->ToString()
              << std::endl;
  }
  ExportPrescription(prescription, absl::GetFlag(FLAGS_export_prescription));

  if (absl::GetFlag(FLAGS_dry_run)) {
    std::cout << "Would apply " << prescription.Directives().size() << " directive(s):" << std::endl;
    for (const auto& directive : prescription.Directives()) {
      std::cout << "  " << parqlint::ToString(directive) << std::endl;
    }
    return kExitOk;
  }

  parqlint::RewriteOptions options{.batch_size = absl::GetFlag(FLAGS_batch_size), .logger = std::move(logger)};
  parqlint::Ensure(parqlint::Rewrite(std::move(fs_provider), input, output, prescription, options));
  std::cout << "Applied " << prescription.Directives().size() << " directive(s), written to " << output << std::endl;
  return kExitOk;
}

std::string FormatSeconds(parqlint::DurationClock duration) {
  auto millis_total = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  std::stringstream ss;
  ss << millis_total / 1000 << "." << std::setw(3) << std::setfill('0') << millis_total % 1000 << "s";
  return ss.str();
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage("Lints parquet files and rewrites them with the suggested physical properties");
  absl::ParseCommandLine(argc, argv);

  S3FinalizerGuard s3_guard;
  try {
    const std::string mode = absl::GetFlag(FLAGS_mode);
    const std::string input = absl::GetFlag(FLAGS_input);
    if (input.empty()) {
      std::cerr << "--input is required" << std::endl;
      return kExitError;
    }

    const bool print_timings = absl::GetFlag(FLAGS_print_timings);
    auto logger = std::make_shared<StderrLogger>(absl::GetFlag(FLAGS_verbose), print_timings);
    auto fs_provider = parqlint::MakeDefaultFileSystemProvider(S3ConfigFromFlags(), logger);
    parqlint::FileSourceProvider sources(fs_provider, logger);

    int exit_code = kExitError;
    parqlint::DurationClock total{};
    {
      parqlint::ScopedTimerClock timer(total);
      if (mode == "lint") {
        exit_code = LintMode(sources, input, logger);
      } else if (mode == "rewrite") {
        exit_code = RewriteMode(fs_provider, sources, input, logger);
      } else {
        std::cerr << "unknown mode '" << mode << "', expected lint or rewrite" << std::endl;
      }
    }
    if (print_timings) {
      std::cerr << "total: " << FormatSeconds(total) << std::endl;
    }
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return kExitError;
  }
}
