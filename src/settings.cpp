#include "storify/config/settings.hpp"
#include "storify/core/error.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace storify {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Integer env tunable within [lo, hi]; warns and returns nullopt otherwise
std::optional<int64_t> bounded_env(const EnvGetter& env, const char* name,
                                   int64_t lo, int64_t hi) {
    auto v = env_value(env, name);
    if (!v) return std::nullopt;
    try {
        size_t used = 0;
        int64_t n = std::stoll(*v, &used);
        if (used == v->size() && n >= lo && n <= hi) return n;
    } catch (const std::logic_error&) {
        // reported below
    }
    std::cerr << "warning: ignoring " << name << "=" << *v << " (expected an integer in "
              << lo << ".." << hi << ")\n";
    return std::nullopt;
}

std::string home_dir(const EnvGetter& env) {
    if (auto h = env_value(env, "HOME")) return *h;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

} // namespace

EnvGetter process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) return std::string(v);
        return std::nullopt;
    };
}

std::optional<std::string> env_value(const EnvGetter& env, const std::string& name) {
    auto v = env(name);
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

bool Settings::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open settings file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("concurrency")) concurrency = j["concurrency"].get<size_t>();
        if (j.contains("request_timeout"))
            request_timeout_seconds = j["request_timeout"].get<int>();
        if (j.contains("temp_ttl")) temp_ttl_seconds = j["temp_ttl"].get<int64_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing settings: " << e.what() << "\n";
        return false;
    }
}

void Settings::apply_env(const EnvGetter& env) {
    if (auto n = bounded_env(env, "STORIFY_CONCURRENCY", 1,
                             static_cast<int64_t>(constants::MAX_TRANSFER_CONCURRENCY))) {
        concurrency = static_cast<size_t>(*n);
    }
    if (auto n = bounded_env(env, "STORIFY_REQUEST_TIMEOUT", 5, 3600)) {
        request_timeout_seconds = static_cast<int>(*n);
    }
    if (auto n = bounded_env(env, "STORIFY_TEMP_TTL", 1, 365LL * 24 * 60 * 60)) {
        temp_ttl_seconds = *n;
    }
    if (auto v = env_value(env, "STORIFY_METRICS_FILE")) metrics_file = *v;
    if (auto v = env_value(env, "STORIFY_VERBOSE")) {
        verbose = (*v == "1" || *v == "true" || *v == "yes");
    }
}

std::string Settings::validate() const {
    if (concurrency == 0 || concurrency > constants::MAX_TRANSFER_CONCURRENCY)
        return "concurrency must be between 1 and " +
               std::to_string(constants::MAX_TRANSFER_CONCURRENCY);
    if (request_timeout_seconds < 5 || request_timeout_seconds > 3600)
        return "request_timeout must be between 5 and 3600 seconds";
    if (temp_ttl_seconds <= 0) return "temp_ttl must be positive";
    return {};
}

std::filesystem::path resolve_store_path(const std::optional<std::string>& explicit_path,
                                         const EnvGetter& env) {
    if (explicit_path && !explicit_path->empty()) return *explicit_path;
    if (auto v = env_value(env, "STORIFY_PROFILE_PATH")) return *v;
    if (auto v = env_value(env, "STORIFY_CONFIG")) return *v;
    if (auto v = env_value(env, "XDG_CONFIG_HOME")) {
        return std::filesystem::path(*v) / "storify" / "profiles.enc";
    }
    std::string home = home_dir(env);
    if (home.empty()) {
        throw StorageError(ErrorKind::ConfigError,
                           "cannot locate the profile store: HOME is not set "
                           "(use --config-path or STORIFY_PROFILE_PATH)");
    }
    return std::filesystem::path(home) / ".config" / "storify" / "profiles.enc";
}

} // namespace storify
