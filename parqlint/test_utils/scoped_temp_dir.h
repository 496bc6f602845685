#pragma once

#include <filesystem>
#include <string>

namespace parqlint {

// Local directory removed with everything in it on destruction.
class ScopedTempDir {
 public:
  ScopedTempDir();
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // "file://" url of a file inside the directory
  std::string FileUrl(const std::string& name) const;

 private:
  std::filesystem::path path_;
};

}  // namespace parqlint
