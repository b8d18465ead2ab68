#include "storify/commands/text.hpp"

#include <cstdio>

namespace storify {

LineReader::LineReader(ReadStream& stream, size_t buffer_size)
    : stream_(stream)
    , chunk_(buffer_size == 0 ? 4096 : buffer_size) {}

bool LineReader::fill() {
    if (eof_) return false;
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    size_t old = buffer_.size();
    buffer_.resize(old + chunk_);
    size_t n = stream_.read(buffer_.data() + old, chunk_);
    buffer_.resize(old + n);
    if (n == 0) eof_ = true;
    return n > 0;
}

bool LineReader::next(std::string& line) {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl != std::string::npos) {
            line.assign(buffer_, pos_, nl - pos_);
            pos_ = nl + 1;
            last_newline_ = true;
            return true;
        }
        if (!fill()) {
            if (pos_ >= buffer_.size()) return false;
            line.assign(buffer_, pos_, std::string::npos);
            pos_ = buffer_.size();
            last_newline_ = false;
            return true;
        }
    }
}

std::string_view LineReader::peek(size_t n) {
    while (buffer_.size() - pos_ < n && fill()) {
    }
    std::string_view view(buffer_);
    view.remove_prefix(pos_);
    return view.substr(0, n);
}

void LineRing::push(std::string line) {
    if (capacity_ == 0) return;
    if (lines_.size() == capacity_) lines_.pop_front();
    lines_.push_back(std::move(line));
}

std::vector<std::string> LineRing::lines() const {
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

namespace {

// Length of the UTF-8 sequence starting at `s[i]`, 0 when malformed, or
// std::string_view::npos when it is cut off by the end of the sample.
size_t utf8_sequence_length(std::string_view s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);
    if (lead < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;       // overlong
        if (lead == 0xED) hi = 0x9F;       // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;       // overlong
        if (lead == 0xF4) hi = 0x8F;       // above U+10FFFF
    } else {
        return 0;
    }

    for (size_t k = 1; k < len; ++k) {
        if (i + k >= s.size()) return std::string_view::npos;
        unsigned char c = byte(i + k);
        if (k == 1 ? (c < lo || c > hi) : (c < 0x80 || c > 0xBF)) return 0;
    }
    return len;
}

} // anonymous namespace

bool looks_binary(std::string_view sample) {
    if (sample.find('\0') != std::string_view::npos) return true;
    size_t i = 0;
    while (i < sample.size()) {
        size_t len = utf8_sequence_length(sample, i);
        if (len == 0) return true;
        if (len == std::string_view::npos) break;
        i += len;
    }
    return false;
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"K", "M", "G", "T"};
    if (bytes < 1024) return std::to_string(bytes) + "B";
    double value = static_cast<double>(bytes);
    int unit = -1;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%s", value, units[unit]);
    return buf;
}

std::string rtrim(std::string_view s) {
    size_t end = s.find_last_not_of(" \t\r");
    if (end == std::string_view::npos) return {};
    return std::string(s.substr(0, end + 1));
}

} // namespace storify
