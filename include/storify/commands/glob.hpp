#pragma once

#include <regex>
#include <string>

namespace storify {

// Translate a path glob into an anchored ECMAScript pattern.
//   "**/"  zero or more whole segments
//   "**"   anything, separators included
//   "*"    anything within one segment
//   "?"    one character other than '/'
//   "[..]" character class ("[!..]" negates)
// Throws StorageError(InvalidArgument) for an unterminated class.
std::string glob_to_regex(const std::string& glob);

std::regex compile_glob(const std::string& glob);

// Compile a user regex; InvalidArgument when malformed
std::regex compile_regex(const std::string& pattern, bool ignore_case = false);

} // namespace storify
