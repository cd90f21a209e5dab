#ifndef BRIDGE_CONFIG_HPP
#define BRIDGE_CONFIG_HPP

#include "core/executable_path.h"
#include "core/logger.h"
#include "inicpp.hpp"
#include "utils/string_utils.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>


namespace bridge {
    namespace config {

        constexpr const char *CONFIG_FILE = "sse_bridge.ini";

        inline std::string g_config_file_path;

        // Explicit path if one was set, otherwise sse_bridge.ini beside the executable
        inline std::string get_config_file_path() {
            if (!g_config_file_path.empty()) {
                return g_config_file_path;
            }
            static std::string config_file_path = []() {
                std::filesystem::path exe_dir(bridge::core::getExecutableDirectory());
                return (exe_dir / CONFIG_FILE).string();
            }();
            return config_file_path;
        }

        inline void set_config_file_path(const std::string &path) {
            g_config_file_path = path;
        }

        enum class ConfigMode {
            NONE,  // Use default settings without file
            STATIC // Load from file once, defaults if it is missing
        };

        /**
 * Bridge tunables, section [bridge]
 */
        struct BridgeConfig {
            std::string log_level = "info";
            std::string log_path;// empty: stderr only
            size_t max_file_size = 5 * 1024 * 1024;
            size_t max_files = 3;
            size_t reconnect_interval_ms = 5000;
            size_t max_line_size = 16 * 1024 * 1024;
            size_t max_event_size = 16 * 1024 * 1024;
            size_t shutdown_grace_ms = 2000;
            std::string sse_path_suffix = "/sse";
            std::string post_path_suffix = "/mcp";
            std::vector<std::string> suppressed_methods{"connection/ready", "server/capabilities"};
            bool verify_tls = true;

            static BridgeConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["bridge"];
                    BridgeConfig config;

                    if (!section["log_level"].String().empty()) config.log_level = section["log_level"].String();
                    if (!section["log_path"].String().empty()) config.log_path = section["log_path"].String();
                    if (!section["sse_path_suffix"].String().empty()) config.sse_path_suffix = section["sse_path_suffix"].String();
                    if (!section["post_path_suffix"].String().empty()) config.post_path_suffix = section["post_path_suffix"].String();

                    config.max_file_size = section["max_file_size"].String().empty() ? config.max_file_size : static_cast<size_t>(section["max_file_size"]);
                    config.max_files = section["max_files"].String().empty() ? config.max_files : static_cast<size_t>(section["max_files"]);
                    config.reconnect_interval_ms = section["reconnect_interval_ms"].String().empty() ? config.reconnect_interval_ms : static_cast<size_t>(section["reconnect_interval_ms"]);
                    config.max_line_size = section["max_line_size"].String().empty() ? config.max_line_size : static_cast<size_t>(section["max_line_size"]);
                    config.max_event_size = section["max_event_size"].String().empty() ? config.max_event_size : static_cast<size_t>(section["max_event_size"]);
                    config.shutdown_grace_ms = section["shutdown_grace_ms"].String().empty() ? config.shutdown_grace_ms : static_cast<size_t>(section["shutdown_grace_ms"]);
                    config.verify_tls = section["verify_tls"].String().empty() ? true : static_cast<bool>(section["verify_tls"]);

                    auto methods = section["suppressed_methods"].String();
                    if (!methods.empty()) {
                        config.suppressed_methods = utils::split_list(methods);
                    }

                    return config;
                } catch (const std::exception &e) {
                    BRIDGE_ERROR("Failed to load bridge config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Global configuration
 */
        struct GlobalConfig {
            std::string title;
            BridgeConfig bridge;

            static GlobalConfig load(const std::string &path) {
                try {
                    inicpp::IniManager ini(path);
                    BRIDGE_DEBUG("Loading configuration from: {}", path);

                    GlobalConfig config;
                    config.title = ini[""]["title"].String().empty() ? "SSE Bridge Configuration" : ini[""]["title"].String();
                    config.bridge = BridgeConfig::load(ini);
                    return config;
                } catch (const std::exception &e) {
                    BRIDGE_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Abstract loader, subclasses decide what the defaults are
 */
        class ConfigLoader {
        protected:
            virtual std::unique_ptr<GlobalConfig> createDefaultConfig() = 0;

            virtual std::unique_ptr<GlobalConfig> loadFromStaticFile() {
                return std::make_unique<GlobalConfig>(GlobalConfig::load(get_config_file_path()));
            }

        public:
            virtual ~ConfigLoader() = default;

            std::unique_ptr<GlobalConfig> load(ConfigMode mode) {
                std::unique_ptr<GlobalConfig> config;

                switch (mode) {
                    case ConfigMode::NONE:
                        config = createDefaultConfig();
                        break;
                    case ConfigMode::STATIC:
                        if (std::filesystem::exists(get_config_file_path())) {
                            config = loadFromStaticFile();
                        } else {
                            BRIDGE_DEBUG("Config file {} not found, using default settings", get_config_file_path());
                            config = createDefaultConfig();
                        }
                        break;
                    default:
                        config = createDefaultConfig();
                }
                return config;
            }
        };

        /**
 * Default implementation of ConfigLoader
 */
        class DefaultConfigLoader : public ConfigLoader {
        protected:
            std::unique_ptr<GlobalConfig> createDefaultConfig() override {
                auto config = std::make_unique<GlobalConfig>();
                config->title = "Default SSE Bridge Config";
                return config;
            }
        };

        inline GlobalConfig load_config(ConfigMode mode = ConfigMode::STATIC) {
            DefaultConfigLoader loader;
            return *loader.load(mode);
        }

        /**
 * Write a commented configuration file holding the defaults.
 */
        inline void write_default_config(const std::string &config_file) {
            BridgeConfig defaults;
            inicpp::IniManager ini(config_file);
            BRIDGE_INFO("Creating default config file: {}", config_file);

            ini.set("", "title", "SSE Bridge Configuration");

            // [bridge]
            ini.set("bridge", "log_level", defaults.log_level);
            ini.set("bridge", "log_path", "logs/sse_bridge.log");
            ini.set("bridge", "max_file_size", defaults.max_file_size);
            ini.set("bridge", "max_files", defaults.max_files);
            ini.set("bridge", "reconnect_interval_ms", defaults.reconnect_interval_ms);
            ini.set("bridge", "max_line_size", defaults.max_line_size);
            ini.set("bridge", "max_event_size", defaults.max_event_size);
            ini.set("bridge", "shutdown_grace_ms", defaults.shutdown_grace_ms);
            ini.set("bridge", "sse_path_suffix", defaults.sse_path_suffix);
            ini.set("bridge", "post_path_suffix", defaults.post_path_suffix);
            ini.set("bridge", "suppressed_methods", "connection/ready,server/capabilities");
            ini.set("bridge", "verify_tls", 1);

            ini.setComment("bridge", "log_level", "Logging severity (trace, debug, info, warn, error, critical, off)");
            ini.setComment("bridge", "log_path", "Rotating log file, leave empty to log to stderr only");
            ini.setComment("bridge", "reconnect_interval_ms", "Fixed delay before reopening a dropped SSE stream");
            ini.setComment("bridge", "max_line_size", "Longest accepted stdin line in bytes (0 = unlimited)");
            ini.setComment("bridge", "max_event_size", "Longest accepted SSE event in bytes (0 = unlimited)");
            ini.setComment("bridge", "shutdown_grace_ms", "Time allowed for in-flight POSTs after stdin closes");
            ini.setComment("bridge", "sse_path_suffix", "Path suffix of the SSE URL replaced to form the initial POST URL");
            ini.setComment("bridge", "post_path_suffix", "Replacement suffix for the initial POST URL");
            ini.setComment("bridge", "suppressed_methods", "Comma separated notification methods never forwarded to stdout");
            ini.setComment("bridge", "verify_tls", "Verify https server certificates (1/0)");
        }

    }// namespace config
}// namespace bridge

#endif// BRIDGE_CONFIG_HPP
