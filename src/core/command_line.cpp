#include "command_line.h"
#include "args.hxx"
#include "core/bridge.h"
#include "core/logger.h"
#include "utils/url.h"
#include <csignal>
#include <filesystem>

namespace bridge::core {

    std::optional<CommandLine> parse_command_line(int argc, const char *const *argv,
                                                  std::ostream &err, int &exit_code) {
        args::ArgumentParser parser("Bridges a stdio JSON-RPC peer to a remote SSE endpoint.",
                                    "Lines read from stdin are POSTed to the endpoint; SSE events are written to stdout.");
        parser.Prog(argc > 0 ? argv[0] : "sse-bridge");

        args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
        args::ValueFlag<std::string> config_path(parser, "PATH", "INI configuration file", {"config"});
        args::ValueFlag<std::string> log_level(parser, "LEVEL", "trace, debug, info, warn, error, critical or off", {"log-level"});
        args::ValueFlag<std::size_t> reconnect_ms(parser, "MS", "Delay before reopening a dropped SSE stream", {"reconnect-ms"});
        args::Flag write_config(parser, "write-config", "Write a default configuration file and exit", {"write-config"});
        args::Positional<std::string> sse_url(parser, "SSE_URL", "http(s) URL of the remote SSE stream");

        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Help &) {
            err << parser;
            exit_code = 0;
            return std::nullopt;
        } catch (const args::ParseError &e) {
            err << "Error parsing command line: " << e.what() << std::endl;
            err << parser;
            exit_code = 1;
            return std::nullopt;
        } catch (const args::ValidationError &e) {
            err << "Validation error: " << e.what() << std::endl;
            err << parser;
            exit_code = 1;
            return std::nullopt;
        }

        CommandLine cli;
        if (config_path) cli.config_path = args::get(config_path);
        if (log_level) cli.log_level = args::get(log_level);
        if (reconnect_ms) cli.reconnect_ms = args::get(reconnect_ms);
        cli.write_config = args::get(write_config);

        if (!cli.write_config && !sse_url) {
            err << "Error: SSE_URL is required" << std::endl;
            err << parser;
            exit_code = 1;
            return std::nullopt;
        }
        if (sse_url) cli.sse_url = args::get(sse_url);
        exit_code = 0;
        return cli;
    }

    std::optional<config::BridgeConfig> load_startup_config(const CommandLine &cli,
                                                            std::ostream &err, int &exit_code) {
        if (cli.config_path) {
            config::set_config_file_path(*cli.config_path);
        }
        if (cli.write_config) {
            config::write_default_config(config::get_config_file_path());
            err << "Wrote " << config::get_config_file_path() << std::endl;
            exit_code = 0;
            return std::nullopt;
        }
        if (cli.config_path && !std::filesystem::exists(*cli.config_path)) {
            err << "Error: config file not found: " << *cli.config_path << std::endl;
            exit_code = 1;
            return std::nullopt;
        }

        auto bridge_config = config::load_config(config::ConfigMode::STATIC).bridge;

        // Command-line values take precedence over the file
        if (cli.log_level) bridge_config.log_level = *cli.log_level;
        if (cli.reconnect_ms) bridge_config.reconnect_interval_ms = *cli.reconnect_ms;
        exit_code = 0;
        return bridge_config;
    }

    int run_command_line(int argc, const char *const *argv, std::ostream &err) {
        int exit_code = 0;
        auto cli = parse_command_line(argc, argv, err, exit_code);
        if (!cli) {
            return exit_code;
        }

        try {
            // Step 1: Resolve and load the configuration file.
            auto bridge_config = load_startup_config(*cli, err, exit_code);
            if (!bridge_config) {
                return exit_code;
            }

            // Step 2: Logging goes to stderr (and optionally a file), never to stdout.
            initializeLogger(bridge_config->log_path, bridge_config->log_level,
                             bridge_config->max_file_size, bridge_config->max_files);
            BRIDGE_DEBUG("Configuration file: {}", config::get_config_file_path());

#ifndef _WIN32
            // a vanished peer must surface as a write error, not kill the process
            std::signal(SIGPIPE, SIG_IGN);
#endif

            // Step 3: Wire the bridge.
            auto sse_bridge = Bridge::Builder{}
                                      .with_sse_url(cli->sse_url)
                                      .with_reconnect_interval(std::chrono::milliseconds(bridge_config->reconnect_interval_ms))
                                      .with_max_line_size(bridge_config->max_line_size)
                                      .with_max_event_size(bridge_config->max_event_size)
                                      .with_path_suffixes(bridge_config->sse_path_suffix, bridge_config->post_path_suffix)
                                      .with_suppressed_methods(bridge_config->suppressed_methods)
                                      .with_shutdown_grace(std::chrono::milliseconds(bridge_config->shutdown_grace_ms))
                                      .with_tls_verification(bridge_config->verify_tls)
                                      .build();

            // Step 4: Block until stdin closes or SIGINT / SIGTERM.
            sse_bridge->run();

            shutdownLogger();
            return 0;

        } catch (const utils::UrlError &e) {
            err << "Error: invalid SSE URL: " << e.what() << std::endl;
            shutdownLogger();
            return 1;
        } catch (const std::exception &e) {
            err << "Error: " << e.what() << std::endl;
            BRIDGE_CRITICAL("Bridge error: {}", e.what());
            shutdownLogger();
            return 1;
        }
    }

}// namespace bridge::core
