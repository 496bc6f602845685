#include "parqlint/test_utils/scoped_temp_dir.h"

#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "parqlint/common/error.h"

namespace parqlint {

ScopedTempDir::ScopedTempDir() {
  std::string name_template{std::filesystem::temp_directory_path() / "parqlint_test_XXXXXX"};
  Ensure(mkdtemp(name_template.data()) != nullptr,
         std::string(__PRETTY_FUNCTION__) + ": mkdtemp failed: " + std::strerror(errno));
  path_ = name_template;
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::string ScopedTempDir::FileUrl(const std::string& name) const { return "file://" + (path_ / name).string(); }

}  // namespace parqlint
