#pragma once

#include <string>
#include <vector>

// Virtual path helpers.
//
// Normalized form: '/'-separated segments with no leading separator, no empty,
// "." or ".." segments, and a trailing '/' iff the path names a directory.
// The storage root is the empty string.
namespace storify::path {

// Resolve "."/".." and duplicate separators. ".." never climbs above the root.
std::string normalize(const std::string& raw);

bool is_root(const std::string& p);
bool is_dir(const std::string& p);

// Add / remove the trailing directory marker (root stays "").
std::string as_dir(const std::string& p);
std::string as_file(const std::string& p);

std::string join(const std::string& base, const std::string& name);

// Parent directory with trailing '/', "" for top-level entries.
std::string parent(const std::string& p);

// Last segment without trailing '/'.
std::string basename(const std::string& p);

// Path of `full` below directory `base` ("" when equal or unrelated).
std::string relative_to(const std::string& full, const std::string& base);

std::vector<std::string> segments(const std::string& p);

// Directory depth below the root: "a/b/c" -> 3.
size_t depth(const std::string& p);

// "/" for the root, otherwise the path itself.
std::string display(const std::string& p);

} // namespace storify::path
