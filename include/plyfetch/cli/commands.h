#pragma once

#include <memory>
#include <string>

namespace CLI {
class App;
}

namespace plyfetch::cli {

/**
 * Options shared by every subcommand. Commands report their exit status through exitCode.
 */
struct GlobalOptions {
    std::string configPath;
    bool verbose{false};
    bool quiet{false};
    int exitCode{0};
};

// Exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/// warn by default, debug with --verbose, error with --quiet
void applyLogLevel(const GlobalOptions& globals);

void registerFetchCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals);
void registerCacheCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals);

/// Parse argv, run the selected subcommand and return the process exit code.
int run(int argc, char* argv[]);

} // namespace plyfetch::cli
