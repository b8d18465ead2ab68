#include "storify/cli/cli.hpp"
#include "storify/cli/invocation.hpp"
#include "storify/core/error.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {
std::atomic<bool> g_interrupted{false};

void signal_handler(int sig) {
    (void)sig;
    g_interrupted.store(true);
}
}  // namespace

int main(int argc, char* argv[]) {
    auto invocation = storify::Invocation::from_args(argc, argv);
    if (!invocation) {
        std::cerr << "Run 'storify --help' for usage.\n";
        return storify::exit_code_for(storify::ErrorKind::InvalidArgument);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    storify::CliEnvironment environment{std::cout, std::cerr, std::cin, storify::process_env(),
                                        &g_interrupted};
    try {
        int rc = storify::run_cli(*invocation, environment);
        std::cout.flush();
        return rc;
    } catch (const storify::StorageError& e) {
        std::cout.flush();
        std::cerr << "Error: " << e.describe() << "\n";
        return storify::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cout.flush();
        std::cerr << "Error: " << storify::error_kind_name(storify::ErrorKind::ProviderError)
                  << ": " << e.what() << "\n";
        return storify::exit_code_for(storify::ErrorKind::ProviderError);
    }
}
