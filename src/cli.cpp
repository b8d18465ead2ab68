#include "storify/cli/cli.hpp"
#include "storify/commands/config_commands.hpp"
#include "storify/commands/metrics.hpp"
#include "storify/commands/transfer.hpp"
#include "storify/config/crypto.hpp"
#include "storify/config/effective_config.hpp"
#include "storify/config/profile_store.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace storify {

namespace {

const std::vector<std::string>& known_verbs() {
    static const std::vector<std::string> verbs = {
        "ls", "tree", "find", "grep", "du", "stat", "cat", "head", "tail", "diff",
        "append", "rm", "cp", "mv", "mkdir", "touch", "truncate", "put", "get", "config",
    };
    return verbs;
}

Settings load_settings(const GlobalOptions& globals, const EnvGetter& env) {
    Settings settings;
    std::optional<std::string> file = globals.settings_file;
    if (!file) file = env_value(env, "STORIFY_SETTINGS");
    if (file && !settings.load_json(*file)) {
        throw StorageError(ErrorKind::ConfigError, "cannot load settings file", *file);
    }
    settings.apply_env(env);

    if (globals.concurrency) settings.concurrency = *globals.concurrency;
    if (globals.metrics_file) settings.metrics_file = *globals.metrics_file;
    if (globals.verbose) settings.verbose = true;

    auto err = settings.validate();
    if (!err.empty()) throw StorageError(ErrorKind::ConfigError, err);
    return settings;
}

KeyMaterial store_key(const GlobalOptions& globals, const EnvGetter& env,
                      const std::filesystem::path& store_path) {
    if (globals.master_password) return passphrase_key(*globals.master_password);
    if (auto pw = env_value(env, "STORIFY_MASTER_PASSWORD")) return passphrase_key(*pw);
    return machine_bound_key(store_path);
}

// Prompt on err, answer from in: "y" or "yes" accepts
std::function<bool(const std::string&)> stdin_confirm(CliEnvironment& environment) {
    return [&environment](const std::string& prompt) {
        environment.err << prompt << std::flush;
        std::string answer;
        if (!std::getline(environment.in, answer)) return false;
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return answer == "y" || answer == "yes";
    };
}

int run_config(const Args& args, ProfileStore& store, const Settings& settings,
               const GlobalOptions& globals, CliEnvironment& environment) {
    ConfigArgs c = parse_config(args);
    auto& out = environment.out;
    switch (c.action) {
        case ConfigAction::Create:
            config_create(store, c.create, out);
            break;
        case ConfigAction::List:
            config_list(store, c.show.show_secrets, out);
            break;
        case ConfigAction::Show:
            config_show(store, c.show, globals.request, environment.env, out);
            break;
        case ConfigAction::Set:
            config_set(store, c.name, out);
            break;
        case ConfigAction::Delete:
            config_delete(store, *c.name, c.force, stdin_confirm(environment), out);
            break;
        case ConfigAction::TempSet:
            c.temp.ttl = c.temp_ttl.value_or(std::chrono::seconds(settings.temp_ttl_seconds));
            config_temp_set(store, c.temp, out);
            break;
        case ConfigAction::TempShow:
            config_temp_show(store, c.show.show_secrets, out);
            break;
        case ConfigAction::TempClear:
            config_temp_clear(store, out);
            break;
    }
    return 0;
}

int run_transfer_verb(const Invocation& inv, CommandContext& ctx, const Settings& settings) {
    TransferArgs t = parse_transfer(inv.verb, inv.args);
    TransferOptions options;
    options.recursive = t.recursive;
    options.concurrency = t.concurrency.value_or(settings.concurrency);

    auto local = StorageBackendFactory::create_local(constants::DEFAULT_ROOT_PATH);
    TransferMetrics metrics({{"provider", ctx.provider}, {"command", inv.verb}});

    TransferReport report = inv.verb == "put"
        ? run_put(ctx, *local, t.source, t.destination, options, metrics)
        : run_get(ctx, *local, t.source, t.destination, options, metrics);

    print_transfer_report(ctx, report);
    if (!settings.metrics_file.empty()) metrics.write_textfile(settings.metrics_file);
    return transfer_exit_code(report);
}

int run_storage_verb(const Invocation& inv, CommandContext& ctx, const Settings& settings,
                     CliEnvironment& environment) {
    const std::string& verb = inv.verb;
    const Args& args = inv.args;

    if (verb == "ls") {
        cmd_ls(ctx, parse_ls(args));
    } else if (verb == "tree") {
        cmd_tree(ctx, parse_tree(args));
    } else if (verb == "find") {
        cmd_find(ctx, parse_find(args));
    } else if (verb == "grep") {
        GrepResult result = cmd_grep(ctx, parse_grep(args));
        if (result.failed_files > 0) return constants::EXIT_PARTIAL_FAILURE;
    } else if (verb == "du") {
        cmd_du(ctx, parse_du(args));
    } else if (verb == "stat") {
        cmd_stat(ctx, parse_stat(args));
    } else if (verb == "cat") {
        cmd_cat(ctx, parse_cat(args));
    } else if (verb == "head") {
        cmd_head(ctx, parse_head_tail(verb, args));
    } else if (verb == "tail") {
        cmd_tail(ctx, parse_head_tail(verb, args));
    } else if (verb == "diff") {
        cmd_diff(ctx, parse_diff(args));
    } else if (verb == "append") {
        uint64_t n = cmd_append(ctx, parse_append(args), environment.in);
        if (ctx.verbose) ctx.err << "[storify] appended " << n << " bytes\n";
    } else if (verb == "rm") {
        RmResult result = cmd_rm(ctx, parse_rm(args));
        if (ctx.verbose) ctx.err << "[storify] removed " << result.removed << " object(s)\n";
        if (result.failed > 0) return constants::EXIT_PARTIAL_FAILURE;
    } else if (verb == "cp") {
        CopyArgs c = parse_copy(verb, args);
        cmd_cp(ctx, c.source, c.destination);
    } else if (verb == "mv") {
        CopyArgs c = parse_copy(verb, args);
        cmd_mv(ctx, c.source, c.destination);
    } else if (verb == "mkdir") {
        MkdirArgs m = parse_mkdir(args);
        cmd_mkdir(ctx, m.path, m.parents);
    } else if (verb == "touch") {
        cmd_touch(ctx, parse_touch(args));
    } else if (verb == "truncate") {
        cmd_truncate(ctx, parse_truncate(args));
    } else if (verb == "put" || verb == "get") {
        return run_transfer_verb(inv, ctx, settings);
    } else {
        throw StorageError(ErrorKind::InvalidArgument, "unknown command: " + verb);
    }
    return 0;
}

} // anonymous namespace

int transfer_exit_code(const TransferReport& report) {
    if (report.interrupted) {
        throw StorageError(ErrorKind::Interrupted,
                           "transfer interrupted; " + std::to_string(report.not_started) +
                           " task(s) not started");
    }
    return report.failed > 0 ? constants::EXIT_PARTIAL_FAILURE : 0;
}

int run_cli(const Invocation& inv, CliEnvironment& environment) {
    if (inv.verb == "help") {
        print_usage(environment.out);
        return 0;
    }
    if (inv.verb == "version") {
        environment.out << "storify " << constants::VERSION << "\n";
        return 0;
    }

    const auto& verbs = known_verbs();
    if (std::find(verbs.begin(), verbs.end(), inv.verb) == verbs.end()) {
        throw StorageError(ErrorKind::InvalidArgument, "unknown command: " + inv.verb);
    }

    Settings settings = load_settings(inv.globals, environment.env);
    auto store_path = resolve_store_path(inv.globals.config_path, environment.env);
    if (settings.verbose) environment.err << "[storify] profile store: " << store_path << "\n";

    ProfileStore store = ProfileStore::open(store_path,
                                            store_key(inv.globals, environment.env, store_path));
    if (inv.verb == "config") {
        return run_config(inv.args, store, settings, inv.globals, environment);
    }

    EffectiveConfig effective = resolve_effective_config(store, inv.globals.request,
                                                         environment.env);
    std::string provider = provider_name(effective.profile.provider);
    if (settings.verbose) {
        environment.err << "[storify] backend: " << provider;
        if (!effective.profile_name.empty()) {
            environment.err << " (profile '" << effective.profile_name << "')";
        } else if (effective.from_temporary) {
            environment.err << " (temporary config)";
        }
        if (effective.profile.anonymous) environment.err << " anonymous";
        environment.err << "\n";
    }

    auto backend = StorageBackendFactory::create(
        effective.profile.provider, effective.backend_params(settings.request_timeout_seconds));

    CommandContext ctx{*backend, environment.out, environment.err};
    ctx.confirm = stdin_confirm(environment);
    ctx.interrupted = environment.interrupted;
    ctx.provider = provider;
    ctx.verbose = settings.verbose;

    return run_storage_verb(inv, ctx, settings, environment);
}

} // namespace storify
