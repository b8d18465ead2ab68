#pragma once

#include "storify/commands/commands.hpp"
#include "storify/commands/config_commands.hpp"
#include "storify/commands/transfer.hpp"
#include "storify/config/effective_config.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace storify {

using Args = std::vector<std::string>;

/// Flags accepted before the verb.
struct GlobalOptions {
    ConfigRequest request;                         // --profile, --anonymous
    std::optional<std::string> config_path;        // --config-path
    std::optional<std::string> master_password;    // --master-password
    std::optional<std::string> settings_file;      // --settings
    std::optional<size_t> concurrency;             // --concurrency
    std::optional<std::string> metrics_file;       // --metrics-file
    bool verbose = false;                          // -v / --verbose
};

/// A parsed command line: global flags, the verb and its raw arguments.
/// Verb arguments are parsed by the parse_* functions below once the verb
/// is known.
struct Invocation {
    GlobalOptions globals;
    std::string verb;   // "help" for --help / no arguments
    Args args;

    /// Parse argv. Returns empty optional on error (prints the reason to
    /// stderr).
    static std::optional<Invocation> from_args(int argc, char* argv[]);
};

void print_usage(std::ostream& out);

// ============================================================================
// Verb argument parsers. Each throws StorageError(InvalidArgument) on an
// unknown flag, a missing value or a wrong operand count.
// ============================================================================

LsOptions parse_ls(const Args& args);
TreeOptions parse_tree(const Args& args);
FindOptions parse_find(const Args& args);
GrepOptions parse_grep(const Args& args);
HeadTailOptions parse_head_tail(const std::string& verb, const Args& args);
DuOptions parse_du(const Args& args);
DiffOptions parse_diff(const Args& args);
CatOptions parse_cat(const Args& args);
StatOptions parse_stat(const Args& args);
AppendOptions parse_append(const Args& args);
RmOptions parse_rm(const Args& args);
TouchOptions parse_touch(const Args& args);
TruncateOptions parse_truncate(const Args& args);

struct MkdirArgs {
    std::string path;
    bool parents = false;
};
MkdirArgs parse_mkdir(const Args& args);

/// cp / mv operands
struct CopyArgs {
    std::string source;
    std::string destination;
};
CopyArgs parse_copy(const std::string& verb, const Args& args);

/// put LOCAL REMOTE / get REMOTE LOCAL
struct TransferArgs {
    std::string source;
    std::string destination;
    bool recursive = false;
    std::optional<size_t> concurrency;   // overrides the configured pool size
};
TransferArgs parse_transfer(const std::string& verb, const Args& args);

enum class ConfigAction {
    Create,
    List,
    Show,
    Set,
    Delete,
    TempSet,
    TempShow,
    TempClear,
};

struct ConfigArgs {
    ConfigAction action = ConfigAction::List;
    ConfigCreateOptions create;
    ConfigShowOptions show;            // show_secrets also used by list / temp show
    std::optional<std::string> name;   // set (nullopt with --clear) / delete
    bool force = false;                // delete
    ConfigTempSetOptions temp;
    std::optional<std::chrono::seconds> temp_ttl;   // --ttl; the configured TTL otherwise
};
ConfigArgs parse_config(const Args& args);

/// Parse a non-negative integer flag value; InvalidArgument otherwise.
uint64_t parse_count(const std::string& value, const std::string& flag);

} // namespace storify
