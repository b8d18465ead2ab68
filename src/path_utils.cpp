#include "storify/core/path.hpp"

namespace storify::path {

std::vector<std::string> segments(const std::string& p) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= p.size()) {
        size_t slash = p.find('/', pos);
        if (slash == std::string::npos) slash = p.size();
        if (slash > pos) {
            out.push_back(p.substr(pos, slash - pos));
        }
        pos = slash + 1;
    }
    return out;
}

std::string normalize(const std::string& raw) {
    std::vector<std::string> stack;
    bool trailing_dir = !raw.empty() && raw.back() == '/';

    auto parts = segments(raw);
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& seg = parts[i];
        bool last = (i + 1 == parts.size());
        if (seg == ".") {
            if (last) trailing_dir = true;
            continue;
        }
        if (seg == "..") {
            if (!stack.empty()) stack.pop_back();
            if (last) trailing_dir = true;
            continue;
        }
        stack.push_back(seg);
    }

    std::string out;
    for (size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) out += '/';
        out += stack[i];
    }
    if (!out.empty() && trailing_dir) {
        out += '/';
    }
    return out;
}

bool is_root(const std::string& p) {
    return p.empty() || p == "/";
}

bool is_dir(const std::string& p) {
    return is_root(p) || p.back() == '/';
}

std::string as_dir(const std::string& p) {
    if (is_root(p)) return "";
    return p.back() == '/' ? p : p + "/";
}

std::string as_file(const std::string& p) {
    std::string out = p;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

std::string join(const std::string& base, const std::string& name) {
    if (is_root(base)) return normalize(name);
    return normalize(as_dir(base) + name);
}

std::string parent(const std::string& p) {
    std::string trimmed = as_file(p);
    auto idx = trimmed.rfind('/');
    if (idx == std::string::npos) return "";
    return trimmed.substr(0, idx + 1);
}

std::string basename(const std::string& p) {
    std::string trimmed = as_file(p);
    auto idx = trimmed.rfind('/');
    return idx == std::string::npos ? trimmed : trimmed.substr(idx + 1);
}

std::string relative_to(const std::string& full, const std::string& base) {
    std::string dir = as_dir(base);
    if (dir.empty()) return full;
    if (full.size() > dir.size() && full.starts_with(dir)) {
        return full.substr(dir.size());
    }
    return "";
}

size_t depth(const std::string& p) {
    return segments(p).size();
}

std::string display(const std::string& p) {
    return is_root(p) ? "/" : p;
}

} // namespace storify::path
