#include "storify/commands/config_commands.hpp"
#include "storify/core/error.hpp"
#include "storify/core/time_format.hpp"

#include <iomanip>
#include <vector>

namespace storify {

namespace {

struct FieldLine {
    const char* name;
    std::string value;
};

std::vector<FieldLine> profile_lines(const Profile& p, bool show_secrets) {
    std::vector<FieldLine> lines;
    lines.push_back({"provider", provider_name(p.provider)});
    if (!p.bucket.empty()) lines.push_back({"bucket", p.bucket});
    if (!p.access_key_id.empty()) {
        lines.push_back({"access_key_id", mask_key_id(p.access_key_id, show_secrets)});
    }
    if (!p.access_key_secret.empty()) {
        lines.push_back({"access_key_secret", mask_secret(p.access_key_secret, show_secrets)});
    }
    if (!p.endpoint.empty()) lines.push_back({"endpoint", p.endpoint});
    if (!p.region.empty()) lines.push_back({"region", p.region});
    if (!p.root_path.empty()) lines.push_back({"root_path", p.root_path});
    if (!p.name_node.empty()) lines.push_back({"name_node", p.name_node});
    if (p.anonymous) lines.push_back({"anonymous", "true"});
    return lines;
}

// Short "key=value" summary for config list
std::string profile_summary(const Profile& p, bool show_secrets) {
    std::string out;
    for (const auto& line : profile_lines(p, show_secrets)) {
        if (std::string(line.name) == "provider") continue;
        if (!out.empty()) out += " ";
        out += std::string(line.name) + "=" + line.value;
    }
    return out;
}

void validate_name(const std::string& name) {
    if (name.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, "profile name must not be empty");
    }
}

} // anonymous namespace

// ============================================================================
// ProfileFields
// ============================================================================

Profile ProfileFields::to_profile(const std::string& subject) const {
    if (!provider) {
        throw StorageError(ErrorKind::InvalidArgument, "--provider is required", subject);
    }
    auto parsed = parse_provider(*provider);
    if (!parsed) {
        throw StorageError(ErrorKind::InvalidArgument, "unknown provider '" + *provider + "'",
                           subject);
    }

    Profile p;
    p.provider = *parsed;
    p.bucket = bucket.value_or("");
    p.access_key_id = access_key_id.value_or("");
    p.access_key_secret = SecureString(access_key_secret.value_or(""));
    p.endpoint = endpoint.value_or("");
    p.region = region.value_or("");
    p.root_path = root_path.value_or("");
    p.name_node = name_node.value_or("");
    p.anonymous = anonymous;

    // Validate what the profile would resolve to, but store it as given
    Profile resolved = p;
    resolved.apply_defaults();
    auto err = resolved.validate();
    if (!err.empty()) throw StorageError(ErrorKind::ConfigError, err, subject);
    return p;
}

void print_profile(std::ostream& out, const Profile& profile, bool show_secrets,
                   const std::map<std::string, std::string>* sources) {
    for (const auto& line : profile_lines(profile, show_secrets)) {
        out << "  " << std::left << std::setw(18) << (std::string(line.name) + ":")
            << line.value;
        if (sources) {
            auto it = sources->find(line.name);
            if (it != sources->end()) out << "  (" << it->second << ")";
        }
        out << "\n";
    }
}

// ============================================================================
// Named profiles
// ============================================================================

void config_create(ProfileStore& store, const ConfigCreateOptions& options, std::ostream& out) {
    validate_name(options.name);
    Profile profile = options.fields.to_profile(options.name);
    bool replaced = store.contains(options.name);
    store.put(options.name, profile, options.force);
    if (options.make_default || !store.default_name()) store.set_default(options.name);
    store.save();

    out << (replaced ? "Updated" : "Created") << " profile '" << options.name << "' ("
        << provider_name(profile.provider) << ")";
    if (store.default_name() == options.name) out << " [default]";
    out << "\n";
}

void config_list(const ProfileStore& store, bool show_secrets, std::ostream& out) {
    auto names = store.names();
    if (names.empty()) {
        out << "No profiles configured.\n";
        return;
    }
    for (const auto& name : names) {
        const Profile& p = store.get(name);
        bool is_default = store.default_name() == name;
        out << (is_default ? "* " : "  ") << std::left << std::setw(16) << name << " "
            << std::setw(7) << provider_name(p.provider);
        std::string summary = profile_summary(p, show_secrets);
        if (!summary.empty()) out << " " << summary;
        out << "\n";
    }
}

void config_show(const ProfileStore& store, const ConfigShowOptions& options,
                 const ConfigRequest& request, const EnvGetter& env, std::ostream& out) {
    if (options.profile && options.default_profile) {
        throw StorageError(ErrorKind::InvalidArgument,
                           "--profile and --default are mutually exclusive");
    }

    if (options.profile || options.default_profile) {
        std::string name;
        if (options.profile) {
            name = *options.profile;
        } else if (store.default_name()) {
            name = *store.default_name();
        } else {
            throw StorageError(ErrorKind::ConfigError, "no default profile is set");
        }
        out << "Profile '" << name << "'";
        if (store.default_name() == name) out << " [default]";
        out << "\n";
        print_profile(out, store.get(name), options.show_secrets);
        return;
    }

    EffectiveConfig effective = resolve_effective_config(store, request, env);
    out << "Effective configuration";
    if (!effective.profile_name.empty()) {
        out << " (profile '" << effective.profile_name << "')";
    } else if (effective.from_temporary) {
        out << " (temporary config)";
    }
    out << "\n";
    print_profile(out, effective.profile, options.show_secrets, &effective.sources);
}

void config_set(ProfileStore& store, const std::optional<std::string>& name, std::ostream& out) {
    if (!name) {
        store.clear_default();
        store.save();
        out << "Default profile cleared\n";
        return;
    }
    store.set_default(*name);
    store.save();
    out << "Default profile set to '" << *name << "'\n";
}

void config_delete(ProfileStore& store, const std::string& name, bool force,
                   const std::function<bool(const std::string&)>& confirm, std::ostream& out) {
    store.get(name);
    if (!force) {
        std::string prompt = "Delete profile '" + name + "'? [y/N] ";
        if (!confirm || !confirm(prompt)) {
            throw StorageError(ErrorKind::Interrupted, "profile not deleted", name);
        }
    }
    store.remove(name);
    store.save();
    out << "Deleted profile '" << name << "'\n";
}

// ============================================================================
// Temporary config
// ============================================================================

void config_temp_set(ProfileStore& store, const ConfigTempSetOptions& options, std::ostream& out) {
    TemporaryConfig temp;
    temp.profile = options.fields.to_profile("temporary config");
    temp.created_at = std::chrono::system_clock::now();
    temp.ttl = options.ttl;
    store.save_temporary(temp);
    out << "Temporary config set (" << provider_name(temp.profile.provider) << "), expires "
        << timefmt::format_iso8601(temp.expires_at()) << "\n";
}

void config_temp_show(const ProfileStore& store, bool show_secrets, std::ostream& out) {
    auto temp = store.load_temporary();
    if (!temp) {
        out << "No active temporary config.\n";
        return;
    }
    out << "Temporary config, expires " << timefmt::format_iso8601(temp->expires_at()) << "\n";
    print_profile(out, temp->profile, show_secrets);
}

void config_temp_clear(ProfileStore& store, std::ostream& out) {
    if (store.clear_temporary()) {
        out << "Temporary config cleared\n";
    } else {
        out << "No temporary config to clear\n";
    }
}

} // namespace storify
