#include "storify/cli/invocation.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"

#include <cctype>
#include <iostream>

namespace storify {

namespace {

[[noreturn]] void usage_error(const std::string& verb, const std::string& message) {
    throw StorageError(ErrorKind::InvalidArgument, verb + ": " + message);
}

bool is_flag(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

// "-Rf" -> "-R", "-f". Stops at "--".
Args expand_short_flags(const Args& args) {
    Args out;
    bool options_done = false;
    for (const auto& arg : args) {
        if (arg == "--") options_done = true;
        bool cluster = !options_done && arg.size() > 2 && arg[0] == '-' && arg[1] != '-';
        for (size_t k = 1; cluster && k < arg.size(); ++k) {
            if (!std::isalpha(static_cast<unsigned char>(arg[k]))) cluster = false;
        }
        if (!cluster) {
            out.push_back(arg);
            continue;
        }
        for (size_t k = 1; k < arg.size(); ++k) out.push_back(std::string("-") + arg[k]);
    }
    return out;
}

// Walks one verb's arguments, handing out flags and collecting operands
class ArgParser {
public:
    ArgParser(std::string verb, const Args& args)
        : verb_(std::move(verb)), args_(expand_short_flags(args)) {}

    std::optional<std::string> next_flag() {
        while (i_ < args_.size()) {
            const std::string& arg = args_[i_++];
            if (!options_done_ && arg == "--") {
                options_done_ = true;
                continue;
            }
            if (!options_done_ && is_flag(arg)) return arg;
            operands_.push_back(arg);
        }
        return std::nullopt;
    }

    std::string value(const std::string& flag) {
        if (i_ >= args_.size()) usage_error(verb_, flag + " requires an argument");
        return args_[i_++];
    }

    uint64_t count(const std::string& flag) { return parse_count(value(flag), flag); }

    [[noreturn]] void unknown(const std::string& flag) const {
        usage_error(verb_, "unknown option: " + flag);
    }

    std::string optional_operand() const {
        if (operands_.size() > 1) usage_error(verb_, "too many operands");
        return operands_.empty() ? std::string() : operands_.front();
    }

    std::string single_operand(const char* what) const {
        if (operands_.empty()) usage_error(verb_, std::string("missing ") + what);
        if (operands_.size() > 1) usage_error(verb_, "too many operands");
        return operands_.front();
    }

    const Args& operands(size_t at_least, const char* what) const {
        if (operands_.size() < at_least) usage_error(verb_, std::string("missing ") + what);
        return operands_;
    }

    const std::string& verb() const { return verb_; }

private:
    std::string verb_;
    Args args_;
    size_t i_ = 0;
    bool options_done_ = false;
    Args operands_;
};

uint64_t size_limit(ArgParser& p, const std::string& flag) {
    uint64_t mb = p.count(flag);
    if (mb == 0) usage_error(p.verb(), flag + " must be at least 1");
    return mb;
}

// Profile field flags shared by "config create" and "config temp set"
bool parse_profile_flag(ArgParser& p, const std::string& flag, ProfileFields& fields) {
    if (flag == "--provider") {
        fields.provider = p.value(flag);
    } else if (flag == "--bucket" || flag == "--container") {
        fields.bucket = p.value(flag);
    } else if (flag == "--access-key-id") {
        fields.access_key_id = p.value(flag);
    } else if (flag == "--access-key-secret") {
        fields.access_key_secret = p.value(flag);
    } else if (flag == "--endpoint") {
        fields.endpoint = p.value(flag);
    } else if (flag == "--region") {
        fields.region = p.value(flag);
    } else if (flag == "--root-path") {
        fields.root_path = p.value(flag);
    } else if (flag == "--name-node") {
        fields.name_node = p.value(flag);
    } else if (flag == "--anonymous") {
        fields.anonymous = true;
    } else {
        return false;
    }
    return true;
}

} // anonymous namespace

uint64_t parse_count(const std::string& value, const std::string& flag) {
    bool digits = !value.empty();
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
    }
    if (digits) {
        try {
            return std::stoull(value);
        } catch (const std::out_of_range&) {
            // reported below
        }
    }
    throw StorageError(ErrorKind::InvalidArgument,
                       flag + " expects a non-negative integer, got '" + value + "'");
}

// ============================================================================
// Global flags
// ============================================================================

std::optional<Invocation> Invocation::from_args(int argc, char* argv[]) {
    Invocation inv;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (!is_flag(arg)) break;

        if (arg == "--profile") {
            auto* v = next_arg(i, "--profile");
            if (!v) return std::nullopt;
            inv.globals.request.profile = v;
        } else if (arg == "--anonymous") {
            inv.globals.request.anonymous = true;
        } else if (arg == "--config-path") {
            auto* v = next_arg(i, "--config-path");
            if (!v) return std::nullopt;
            inv.globals.config_path = v;
        } else if (arg == "--master-password") {
            auto* v = next_arg(i, "--master-password");
            if (!v) return std::nullopt;
            inv.globals.master_password = v;
        } else if (arg == "--settings") {
            auto* v = next_arg(i, "--settings");
            if (!v) return std::nullopt;
            inv.globals.settings_file = v;
        } else if (arg == "--concurrency") {
            auto* v = next_arg(i, "--concurrency");
            if (!v) return std::nullopt;
            try {
                uint64_t n = parse_count(v, "--concurrency");
                if (n < 1 || n > constants::MAX_TRANSFER_CONCURRENCY) {
                    std::cerr << "Error: --concurrency must be between 1 and "
                              << constants::MAX_TRANSFER_CONCURRENCY << "\n";
                    return std::nullopt;
                }
                inv.globals.concurrency = static_cast<size_t>(n);
            } catch (const StorageError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return std::nullopt;
            }
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            inv.globals.metrics_file = v;
        } else if (arg == "-v" || arg == "--verbose") {
            inv.globals.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            inv.verb = "help";
            return inv;
        } else if (arg == "--version" || arg == "-V") {
            inv.verb = "version";
            return inv;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (i >= argc) {
        inv.verb = "help";
        return inv;
    }
    inv.verb = argv[i++];
    for (; i < argc; ++i) inv.args.emplace_back(argv[i]);
    return inv;
}

void print_usage(std::ostream& out) {
    out <<
        "Usage: storify [global options] <command> [args]\n"
        "\n"
        "Browsing:\n"
        "  ls [-L] [-R] [PATH]                    List a directory\n"
        "  tree [-d N] [--dirs-only] [PATH]       Render a directory tree\n"
        "  find [PATH] [--name GLOB | --regex RE] [--type f|d|o]\n"
        "  grep [-i] [-n] [-R] PATTERN PATH...    Search file contents\n"
        "  du [-s] [--bytes] [PATH]               Disk usage per directory\n"
        "  stat [--json | --raw] PATH             Show metadata\n"
        "\n"
        "Reading:\n"
        "  cat [-f] [--size-limit MB] PATH\n"
        "  head [-n N | -c N] [-q] [-v] PATH...\n"
        "  tail [-n N | -c N] [-q] [-v] PATH...\n"
        "  diff [-U N] [-w] [--size-limit MB] [-f] LEFT RIGHT\n"
        "\n"
        "Writing:\n"
        "  put [-R] [--concurrency N] LOCAL REMOTE\n"
        "  get [--concurrency N] REMOTE LOCAL\n"
        "  append [-c] [-p] [--src LOCAL] [--if-size N] [--if-etag TAG] PATH\n"
        "  cp SRC DST | mv SRC DST\n"
        "  mkdir [-p] PATH\n"
        "  touch [-c] [-t] [-p] PATH\n"
        "  truncate --size N [-c] [-p] PATH\n"
        "  rm [-R] [-f] PATH...\n"
        "\n"
        "Profiles:\n"
        "  config create NAME --provider P [--bucket B] [--access-key-id K]\n"
        "                [--access-key-secret S] [--endpoint E] [--region R]\n"
        "                [--root-path P] [--name-node URL] [--anonymous]\n"
        "                [--force] [--make-default]\n"
        "  config list [--show-secrets]\n"
        "  config show [--profile NAME | --default] [--show-secrets]\n"
        "  config set NAME | --clear\n"
        "  config delete NAME [--force]\n"
        "  config temp set --provider P ... [--ttl SECONDS]\n"
        "  config temp show [--show-secrets] | config temp clear\n"
        "\n"
        "Global options:\n"
        "  --profile <name>             Use a named profile\n"
        "  --anonymous                  Access without credentials\n"
        "  --config-path <path>         Profile store (default: ~/.config/storify/profiles.enc)\n"
        "  --master-password <secret>   Passphrase for the profile store\n"
        "                               (or STORIFY_MASTER_PASSWORD env)\n"
        "  --settings <file>            JSON settings file (or STORIFY_SETTINGS env)\n"
        "  --concurrency <N>            Transfer workers (default: 8)\n"
        "  --metrics-file <path>        Prometheus .prom file written after put/get\n"
        "  -v, --verbose                Debug traces on stderr\n"
        "  --version                    Print the version\n"
        "  --help                       Show this help\n";
}

// ============================================================================
// Listing verbs
// ============================================================================

LsOptions parse_ls(const Args& args) {
    ArgParser p("ls", args);
    LsOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-L" || *flag == "-l" || *flag == "--long") o.long_format = true;
        else if (*flag == "-R" || *flag == "-r" || *flag == "--recursive") o.recursive = true;
        else p.unknown(*flag);
    }
    o.path = p.optional_operand();
    return o;
}

TreeOptions parse_tree(const Args& args) {
    ArgParser p("tree", args);
    TreeOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-d" || *flag == "--depth") o.max_depth = static_cast<size_t>(p.count(*flag));
        else if (*flag == "--dirs-only") o.dirs_only = true;
        else p.unknown(*flag);
    }
    o.path = p.optional_operand();
    return o;
}

FindOptions parse_find(const Args& args) {
    ArgParser p("find", args);
    FindOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "--name") {
            o.name_glob = p.value(*flag);
        } else if (*flag == "--regex") {
            o.regex = p.value(*flag);
        } else if (*flag == "--type") {
            std::string t = p.value(*flag);
            if (t == "f" || t == "file") o.kind = EntryKind::File;
            else if (t == "d" || t == "dir") o.kind = EntryKind::Directory;
            else if (t == "o" || t == "other") o.kind = EntryKind::Other;
            else usage_error("find", "--type expects f, d or o");
        } else {
            p.unknown(*flag);
        }
    }
    if (o.name_glob && o.regex) usage_error("find", "--name and --regex are mutually exclusive");
    o.path = p.optional_operand();
    return o;
}

GrepOptions parse_grep(const Args& args) {
    ArgParser p("grep", args);
    GrepOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-i" || *flag == "--ignore-case") o.ignore_case = true;
        else if (*flag == "-n" || *flag == "--line-number") o.line_numbers = true;
        else if (*flag == "-R" || *flag == "-r" || *flag == "--recursive") o.recursive = true;
        else p.unknown(*flag);
    }
    const Args& operands = p.operands(2, "PATTERN and PATH");
    o.pattern = operands.front();
    o.paths.assign(operands.begin() + 1, operands.end());
    return o;
}

HeadTailOptions parse_head_tail(const std::string& verb, const Args& args) {
    ArgParser p(verb, args);
    HeadTailOptions o;
    o.lines = verb == "tail" ? constants::DEFAULT_TAIL_LINES : constants::DEFAULT_HEAD_LINES;
    while (auto flag = p.next_flag()) {
        if (*flag == "-n" || *flag == "--lines") o.lines = static_cast<size_t>(p.count(*flag));
        else if (*flag == "-c" || *flag == "--bytes") o.bytes = p.count(*flag);
        else if (*flag == "-q" || *flag == "--quiet") o.quiet = true;
        else if (*flag == "-v" || *flag == "--verbose") o.verbose = true;
        else p.unknown(*flag);
    }
    o.paths = p.operands(1, "PATH");
    return o;
}

DuOptions parse_du(const Args& args) {
    ArgParser p("du", args);
    DuOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-s" || *flag == "--summarize") o.summarize = true;
        else if (*flag == "-b" || *flag == "--bytes") o.raw_bytes = true;
        else p.unknown(*flag);
    }
    o.path = p.optional_operand();
    return o;
}

StatOptions parse_stat(const Args& args) {
    ArgParser p("stat", args);
    StatOptions o;
    bool json = false;
    bool raw = false;
    while (auto flag = p.next_flag()) {
        if (*flag == "--json") json = true;
        else if (*flag == "--raw") raw = true;
        else p.unknown(*flag);
    }
    if (json && raw) usage_error("stat", "--json and --raw are mutually exclusive");
    if (json) o.format = StatFormat::Json;
    if (raw) o.format = StatFormat::Raw;
    o.path = p.single_operand("PATH");
    return o;
}

// ============================================================================
// Content verbs
// ============================================================================

CatOptions parse_cat(const Args& args) {
    ArgParser p("cat", args);
    CatOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-f" || *flag == "--force") o.force = true;
        else if (*flag == "--size-limit") o.size_limit_mb = size_limit(p, *flag);
        else p.unknown(*flag);
    }
    o.path = p.single_operand("PATH");
    return o;
}

DiffOptions parse_diff(const Args& args) {
    ArgParser p("diff", args);
    DiffOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-U" || *flag == "--unified") o.context = static_cast<size_t>(p.count(*flag));
        else if (*flag == "-w" || *flag == "--ignore-trailing-space") o.ignore_trailing_ws = true;
        else if (*flag == "--size-limit") o.size_limit_mb = size_limit(p, *flag);
        else if (*flag == "-f" || *flag == "--force") o.force = true;
        else p.unknown(*flag);
    }
    const Args& operands = p.operands(2, "LEFT and RIGHT");
    if (operands.size() > 2) usage_error("diff", "too many operands");
    o.left = operands[0];
    o.right = operands[1];
    return o;
}

// ============================================================================
// Mutating verbs
// ============================================================================

AppendOptions parse_append(const Args& args) {
    ArgParser p("append", args);
    AppendOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-c" || *flag == "--no-create") o.no_create = true;
        else if (*flag == "-p" || *flag == "--parents") o.parents = true;
        else if (*flag == "--src") o.source_file = p.value(*flag);
        else if (*flag == "--if-size") o.if_size = p.count(*flag);
        else if (*flag == "--if-etag") o.if_etag = p.value(*flag);
        else p.unknown(*flag);
    }
    o.path = p.single_operand("PATH");
    return o;
}

RmOptions parse_rm(const Args& args) {
    ArgParser p("rm", args);
    RmOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-R" || *flag == "-r" || *flag == "--recursive") o.recursive = true;
        else if (*flag == "-f" || *flag == "--force") o.force = true;
        else p.unknown(*flag);
    }
    o.paths = p.operands(1, "PATH");
    return o;
}

TouchOptions parse_touch(const Args& args) {
    ArgParser p("touch", args);
    TouchOptions o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-c" || *flag == "--no-create") o.no_create = true;
        else if (*flag == "-t" || *flag == "--truncate") o.truncate = true;
        else if (*flag == "-p" || *flag == "--parents") o.parents = true;
        else p.unknown(*flag);
    }
    o.path = p.single_operand("PATH");
    return o;
}

TruncateOptions parse_truncate(const Args& args) {
    ArgParser p("truncate", args);
    TruncateOptions o;
    bool have_size = false;
    while (auto flag = p.next_flag()) {
        if (*flag == "-s" || *flag == "--size") {
            o.size = p.count(*flag);
            have_size = true;
        } else if (*flag == "-c" || *flag == "--no-create") {
            o.no_create = true;
        } else if (*flag == "-p" || *flag == "--parents") {
            o.parents = true;
        } else {
            p.unknown(*flag);
        }
    }
    if (!have_size) usage_error("truncate", "--size is required");
    o.path = p.single_operand("PATH");
    return o;
}

MkdirArgs parse_mkdir(const Args& args) {
    ArgParser p("mkdir", args);
    MkdirArgs o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-p" || *flag == "--parents") o.parents = true;
        else p.unknown(*flag);
    }
    o.path = p.single_operand("PATH");
    return o;
}

CopyArgs parse_copy(const std::string& verb, const Args& args) {
    ArgParser p(verb, args);
    while (auto flag = p.next_flag()) {
        // Directory sources are always handled recursively
        if (*flag != "-R" && *flag != "-r" && *flag != "--recursive") p.unknown(*flag);
    }
    const Args& operands = p.operands(2, "SRC and DST");
    if (operands.size() > 2) usage_error(verb, "too many operands");
    return {operands[0], operands[1]};
}

TransferArgs parse_transfer(const std::string& verb, const Args& args) {
    ArgParser p(verb, args);
    TransferArgs o;
    while (auto flag = p.next_flag()) {
        if (*flag == "-R" || *flag == "-r" || *flag == "--recursive") {
            o.recursive = true;
        } else if (*flag == "--concurrency") {
            uint64_t n = p.count(*flag);
            if (n < 1 || n > constants::MAX_TRANSFER_CONCURRENCY) {
                usage_error(verb, "--concurrency must be between 1 and " +
                                  std::to_string(constants::MAX_TRANSFER_CONCURRENCY));
            }
            o.concurrency = static_cast<size_t>(n);
        } else {
            p.unknown(*flag);
        }
    }
    const Args& operands = p.operands(2, verb == "put" ? "LOCAL and REMOTE" : "REMOTE and LOCAL");
    if (operands.size() > 2) usage_error(verb, "too many operands");
    o.source = operands[0];
    o.destination = operands[1];
    return o;
}

// ============================================================================
// config
// ============================================================================

ConfigArgs parse_config(const Args& args) {
    if (args.empty()) usage_error("config", "missing action (create, list, show, set, delete, temp)");

    ConfigArgs c;
    const std::string& action = args.front();
    Args rest(args.begin() + 1, args.end());

    if (action == "create") {
        ArgParser p("config create", rest);
        c.action = ConfigAction::Create;
        while (auto flag = p.next_flag()) {
            if (parse_profile_flag(p, *flag, c.create.fields)) continue;
            if (*flag == "--force" || *flag == "-f") c.create.force = true;
            else if (*flag == "--make-default" || *flag == "--default") c.create.make_default = true;
            else p.unknown(*flag);
        }
        c.create.name = p.single_operand("NAME");
    } else if (action == "list") {
        ArgParser p("config list", rest);
        c.action = ConfigAction::List;
        while (auto flag = p.next_flag()) {
            if (*flag == "--show-secrets") c.show.show_secrets = true;
            else p.unknown(*flag);
        }
        if (!p.optional_operand().empty()) usage_error("config list", "unexpected operand");
    } else if (action == "show") {
        ArgParser p("config show", rest);
        c.action = ConfigAction::Show;
        while (auto flag = p.next_flag()) {
            if (*flag == "--profile") c.show.profile = p.value(*flag);
            else if (*flag == "--default") c.show.default_profile = true;
            else if (*flag == "--show-secrets") c.show.show_secrets = true;
            else p.unknown(*flag);
        }
        if (c.show.profile && c.show.default_profile) {
            usage_error("config show", "--profile and --default are mutually exclusive");
        }
        if (!p.optional_operand().empty()) usage_error("config show", "unexpected operand");
    } else if (action == "set") {
        ArgParser p("config set", rest);
        c.action = ConfigAction::Set;
        bool clear = false;
        while (auto flag = p.next_flag()) {
            if (*flag == "--clear") clear = true;
            else p.unknown(*flag);
        }
        std::string name = p.optional_operand();
        if (clear == !name.empty()) usage_error("config set", "expected NAME or --clear");
        if (!clear) c.name = name;
    } else if (action == "delete") {
        ArgParser p("config delete", rest);
        c.action = ConfigAction::Delete;
        while (auto flag = p.next_flag()) {
            if (*flag == "--force" || *flag == "-f") c.force = true;
            else p.unknown(*flag);
        }
        c.name = p.single_operand("NAME");
    } else if (action == "temp") {
        if (rest.empty()) usage_error("config temp", "missing action (set, show, clear)");
        const std::string& sub = rest.front();
        Args temp_args(rest.begin() + 1, rest.end());
        ArgParser p("config temp " + sub, temp_args);
        if (sub == "set") {
            c.action = ConfigAction::TempSet;
            while (auto flag = p.next_flag()) {
                if (parse_profile_flag(p, *flag, c.temp.fields)) continue;
                if (*flag == "--ttl") {
                    uint64_t ttl = p.count(*flag);
                    if (ttl == 0) usage_error("config temp set", "--ttl must be at least 1");
                    c.temp_ttl = std::chrono::seconds(static_cast<int64_t>(ttl));
                } else {
                    p.unknown(*flag);
                }
            }
        } else if (sub == "show") {
            c.action = ConfigAction::TempShow;
            while (auto flag = p.next_flag()) {
                if (*flag == "--show-secrets") c.show.show_secrets = true;
                else p.unknown(*flag);
            }
        } else if (sub == "clear") {
            c.action = ConfigAction::TempClear;
            while (auto flag = p.next_flag()) p.unknown(*flag);
        } else {
            usage_error("config temp", "unknown action: " + sub);
        }
        if (!p.optional_operand().empty()) usage_error("config temp " + sub, "unexpected operand");
    } else {
        usage_error("config", "unknown action: " + action);
    }
    return c;
}

} // namespace storify
