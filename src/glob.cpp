#include "storify/commands/glob.hpp"
#include "storify/core/error.hpp"

#include <cstring>

namespace storify {

std::string glob_to_regex(const std::string& glob) {
    std::string re = "^";
    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                bool segment_start = (i == 0 || glob[i - 1] == '/');
                if (segment_start && i + 2 < glob.size() && glob[i + 2] == '/') {
                    re += "(?:[^/]+/)*";
                    i += 3;
                } else {
                    re += ".*";
                    i += 2;
                }
            } else {
                re += "[^/]*";
                ++i;
            }
        } else if (c == '?') {
            re += "[^/]";
            ++i;
        } else if (c == '[') {
            size_t close = i + 1;
            if (close < glob.size() && (glob[close] == '!' || glob[close] == '^')) ++close;
            if (close < glob.size() && glob[close] == ']') ++close;
            while (close < glob.size() && glob[close] != ']') ++close;
            if (close >= glob.size()) {
                throw StorageError(ErrorKind::InvalidArgument,
                                   "unterminated character class in glob", glob);
            }
            re += '[';
            size_t j = i + 1;
            if (glob[j] == '!' || glob[j] == '^') {
                re += '^';
                ++j;
            }
            for (; j < close; ++j) {
                if (glob[j] == '\\' || glob[j] == '[' || glob[j] == ']') re += '\\';
                re += glob[j];
            }
            re += ']';
            i = close + 1;
        } else if (c == '\\' && i + 1 < glob.size()) {
            re += '\\';
            re += glob[i + 1];
            i += 2;
        } else {
            if (std::strchr(".^$|()+{}]\\", c) != nullptr) re += '\\';
            re += c;
            ++i;
        }
    }
    re += '$';
    return re;
}

std::regex compile_glob(const std::string& glob) {
    if (glob.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, "empty glob pattern");
    }
    try {
        return std::regex(glob_to_regex(glob), std::regex::ECMAScript);
    } catch (const std::regex_error&) {
        throw StorageError(ErrorKind::InvalidArgument, "malformed glob pattern", glob);
    }
}

std::regex compile_regex(const std::string& pattern, bool ignore_case) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) flags |= std::regex::icase;
    try {
        return std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw StorageError(ErrorKind::InvalidArgument,
                           std::string("malformed regular expression: ") + e.what(), pattern);
    }
}

} // namespace storify
