#pragma once

#include "storify/storage/backend.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace storify {

// Buffered line splitter over a ReadStream. Lines are returned without the
// trailing '\n'; a final line without newline is still returned.
class LineReader {
public:
    explicit LineReader(ReadStream& stream, size_t buffer_size = 64 * 1024);

    bool next(std::string& line);

    // First `n` bytes of the stream (fewer at EOF) without consuming them
    std::string_view peek(size_t n);

    // True when the last line returned by next() ended with '\n'
    bool last_had_newline() const { return last_newline_; }

private:
    bool fill();

    ReadStream& stream_;
    std::string buffer_;
    size_t pos_ = 0;
    size_t chunk_;
    bool eof_ = false;
    bool last_newline_ = false;
};

// Keeps the last `capacity` lines pushed into it. Memory is bounded by the
// capacity regardless of how many lines stream through.
class LineRing {
public:
    explicit LineRing(size_t capacity) : capacity_(capacity) {}

    void push(std::string line);

    // Retained lines, oldest first
    std::vector<std::string> lines() const;

    size_t size() const { return lines_.size(); }

private:
    size_t capacity_;
    std::deque<std::string> lines_;
};

// NUL byte or malformed UTF-8 in the sample. A multibyte sequence cut off at
// the end of the sample is accepted.
bool looks_binary(std::string_view sample);

// "0B", "512B", "1.5K", "3.0M" (base 1024, one decimal)
std::string format_size(uint64_t bytes);

// Drop trailing spaces, tabs and CR
std::string rtrim(std::string_view s);

} // namespace storify
