#include <segdl/cli/cmd_get.h>
#include <segdl/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout stays clean for progress and JSON output
    spdlog::set_default_logger(spdlog::stderr_color_mt("segdl"));
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"segdl - segmented, resumable HTTP downloader", "segdl"};
    app.set_version_flag("--version", SEGDL_VERSION_STRING);
    app.require_subcommand(1);

    segdl::cli::registerGetCommand(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled error: {}", e.what());
        return segdl::cli::kExitFailed;
    }
    return segdl::cli::kExitCompleted;
}
