#pragma once

#include "storify/cli/invocation.hpp"
#include "storify/config/settings.hpp"

#include <atomic>
#include <istream>
#include <ostream>

namespace storify {

/// Process surroundings of one invocation. main() binds the real streams,
/// environment and signal flag; tests bind string streams and a fake env.
struct CliEnvironment {
    std::ostream& out;
    std::ostream& err;
    std::istream& in;
    EnvGetter env;
    const std::atomic<bool>* interrupted = nullptr;
};

/// Execute a parsed invocation and return the process exit code.
/// StorageError escapes to the caller, which maps it with exit_code_for().
int run_cli(const Invocation& invocation, CliEnvironment& environment);

/// Exit code for a finished batch: 0, or EXIT_PARTIAL_FAILURE when any task
/// failed. Throws Interrupted when the batch was cut short.
int transfer_exit_code(const TransferReport& report);

} // namespace storify
