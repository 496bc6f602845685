#pragma once

#include <string>
#include <string_view>

namespace parqlint {

// "s3://bucket/dir/file.parquet" -> {scheme: "s3", location: "bucket", path: "/dir/file.parquet"}
// Query and fragment parts are dropped, except for local paths and "file" urls.
struct UrlComponents {
  std::string_view scheme;
  std::string_view location;
  std::string_view path;
};

UrlComponents SplitUrl(std::string_view url);

// Bare local paths ("data/x.parquet", "/tmp/x.parquet") become absolute "file://" urls.
std::string NormalizeUrl(std::string_view url);

// Path understood by the arrow filesystem serving the url's scheme.
std::string FileSystemPath(std::string_view url);

}  // namespace parqlint
