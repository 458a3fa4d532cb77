/**
 * ocicfg CLI - Entry Point
 *
 * Generates OCI runtime configurations from images in an OCI layout.
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include "common.hpp"

// Forward declarations for commands
namespace ocicfg::cli::commands {
    void setup_runtime_config(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace ocicfg::cli;

    CLI::App app{"ocicfg - OCI runtime configuration generator"};
    app.set_version_flag("-V,--version", OCICFG_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Logging is configured before any subcommand callback runs
    app.parse_complete_callback([&opts]() { configure_logging(opts); });

    // Commands
    auto* config_cmd = app.add_subcommand("runtime-config", "Generate a runtime config.json for an image");
    config_cmd->alias("config");
    commands::setup_runtime_config(config_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Print the descriptor path of an image reference");
    commands::setup_resolve(resolve_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
