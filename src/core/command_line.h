// src/core/command_line.h
#pragma once

#include "config/config.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace bridge::core {

    struct CommandLine {
        std::string sse_url;
        std::optional<std::string> config_path;
        std::optional<std::string> log_level;
        std::optional<std::size_t> reconnect_ms;
        bool write_config = false;
    };

    /**
     * @brief Parse the process arguments.
     * @return nullopt when the process should end right away; @p exit_code then
     *         holds 0 (help) or 1 (usage error, reported on @p err with the usage text)
     */
    std::optional<CommandLine> parse_command_line(int argc, const char *const *argv,
                                                  std::ostream &err, int &exit_code);

    /**
     * @brief Load the INI file and apply command-line overrides on top of it.
     *
     * An explicitly named file must exist. --write-config writes the defaults
     * and ends the process with 0.
     * @return nullopt when the process should end with @p exit_code
     */
    std::optional<config::BridgeConfig> load_startup_config(const CommandLine &cli,
                                                            std::ostream &err, int &exit_code);

    /**
     * @brief Whole startup sequence of the sse-bridge executable.
     * Blocks until stdin closes or SIGINT / SIGTERM arrives.
     * @return 0 on a clean shutdown, 1 on a usage or startup error
     */
    int run_command_line(int argc, const char *const *argv, std::ostream &err);

}// namespace bridge::core
