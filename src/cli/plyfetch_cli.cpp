/*
 * plyfetch/src/cli/plyfetch_cli.cpp
 *
 * Top-level CLI11 application: global flags, subcommand registration and exit-code mapping.
 *   0  success
 *   1  transfer, manifest or cache failure
 *   2  usage error (CLI11 parse/validation failure)
 */

#include <plyfetch/cli/commands.h>
#include <plyfetch/version.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <exception>
#include <memory>

namespace plyfetch::cli {

void applyLogLevel(const GlobalOptions& globals) {
    if (globals.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (globals.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

int run(int argc, char* argv[]) {
    CLI::App app{"Parallel chunked artifact fetcher with a local TTL cache", "plyfetch"};
    app.set_version_flag("--version", PLYFETCH_VERSION_STRING);
    app.require_subcommand(1);

    auto globals = std::make_shared<GlobalOptions>();
    app.add_option("--config", globals->configPath,
                   "Config file (default: $PLYFETCH_CONFIG or ~/.config/plyfetch/config.toml)");
    auto* verbose = app.add_flag("-v,--verbose", globals->verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", globals->quiet, "Only log errors")->excludes(verbose);

    registerFetchCommand(app, globals);
    registerCacheCommand(app, globals);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? kExitOk : kExitUsage;
    }
    return globals->exitCode;
}

} // namespace plyfetch::cli
