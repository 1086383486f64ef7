#include <cstdio>
#include <exception>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <plyfetch/cli/commands.h>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so --json output on stdout stays machine-readable
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("plyfetch", stderr_sink);
        spdlog::set_default_logger(logger);

        // Conservative default; run() adjusts based on -v/--quiet
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        return plyfetch::cli::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
