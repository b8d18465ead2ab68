#pragma once

#include <string>

namespace storify {

// String holder for credentials and derived keys; zeroes its buffer whenever
// the value is replaced or destroyed.
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(const std::string& s) : data_(s) {}
    explicit SecureString(std::string&& s) : data_(std::move(s)) {}

    SecureString(const SecureString& other) : data_(other.data_) {}

    SecureString(SecureString&& other) noexcept : data_(std::move(other.data_)) {
        other.secure_clear();
    }

    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear();
            data_ = std::move(other.data_);
            other.secure_clear();
        }
        return *this;
    }

    SecureString& operator=(const std::string& s) {
        secure_clear();
        data_ = s;
        return *this;
    }

    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    const char* c_str() const { return data_.c_str(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    bool operator==(const SecureString& other) const { return data_ == other.data_; }
    bool operator!=(const SecureString& other) const { return data_ != other.data_; }

private:
    void secure_clear() {
        if (data_.empty()) return;
        volatile char* p = const_cast<volatile char*>(data_.data());
        size_t len = data_.size();
        while (len--) {
            *p++ = 0;
        }
        data_.clear();
        data_.shrink_to_fit();
    }

    std::string data_;
};

} // namespace storify
