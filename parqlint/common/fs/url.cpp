#include "parqlint/common/fs/url.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace parqlint {

namespace {
using std::literals::string_view_literals::operator""sv;

constexpr std::string_view kSchemeDelimiter = "://";
constexpr std::string_view::size_type kNPos = std::string_view::npos;
}  // namespace

UrlComponents SplitUrl(std::string_view url) {
  UrlComponents result;
  if (auto pos = url.find(kSchemeDelimiter); pos != kNPos) {
    result.scheme = url.substr(0, pos);
    url.remove_prefix(pos + kSchemeDelimiter.size());
  }
  // local paths and "file://" urls may contain '?' and '#' in file names
  if (auto pos = url.find_first_of("?#"sv); pos != kNPos && !result.scheme.empty() && result.scheme != "file") {
    url = url.substr(0, pos);
  }
  if (auto pos = url.find('/'); pos != kNPos) {
    result.location = url.substr(0, pos);
    result.path = url.substr(pos);
  } else {
    result.location = url;
  }
  return result;
}

std::string NormalizeUrl(std::string_view url) {
  if (url.find(kSchemeDelimiter) != kNPos) {
    return std::string(url);
  }
  auto absolute = std::filesystem::absolute(std::filesystem::path(url)).lexically_normal();
  return "file://" + absolute.generic_string();
}

std::string FileSystemPath(std::string_view url) {
  // "file:///tmp/x" has an empty location, "s3://bucket/key" keeps the bucket as the first path element.
  auto components = SplitUrl(url);
  std::string result(components.location);
  result += components.path;
  return result;
}

}  // namespace parqlint
