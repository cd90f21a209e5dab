#pragma once

#include <memory>
#include <string>

// Include format library for format string support
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

#define BRIDGE_TRACE(...) ::bridge::core::BridgeLogger::instance().trace(__VA_ARGS__)
#define BRIDGE_DEBUG(...) ::bridge::core::BridgeLogger::instance().debug(__VA_ARGS__)
#define BRIDGE_INFO(...) ::bridge::core::BridgeLogger::instance().info(__VA_ARGS__)
#define BRIDGE_WARN(...) ::bridge::core::BridgeLogger::instance().warn(__VA_ARGS__)
#define BRIDGE_ERROR(...) ::bridge::core::BridgeLogger::instance().error(__VA_ARGS__)
#define BRIDGE_CRITICAL(...) ::bridge::core::BridgeLogger::instance().critical(__VA_ARGS__)

namespace bridge {
    namespace core {

        /**
        * @brief Log levels for the logger
        */
        enum class LogLevel {
            TRACE = 0,
            DEBUG = 1,
            INFO = 2,
            WARN = 3,
            ERR = 4,
            CRITICAL = 5,
            OFF = 6
        };

        // global logger instance
        extern std::shared_ptr<spdlog::logger> g_logger;
        extern LogLevel g_current_level;

        /**
        * @brief Map a level name (trace, debug, info, warn, error, critical, off) to a LogLevel.
        * Unknown names map to INFO.
        */
        LogLevel parse_log_level(const std::string &name);

        /**
        * @brief Thin wrapper over the process-wide spdlog logger.
        *
        * Every sink writes to stderr or a file. Standard output belongs to the
        * local peer and must only ever carry protocol frames.
        */
        class BridgeLogger {
        public:
            static BridgeLogger &instance();

            std::shared_ptr<spdlog::logger> operator->();

            template<typename... Args>
            void trace(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void debug(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void info(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void warn(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void error(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void critical(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
            }

            // Overloads for string literals (without format arguments)
            void trace(const char *msg);
            void debug(const char *msg);
            void info(const char *msg);
            void warn(const char *msg);
            void error(const char *msg);
            void critical(const char *msg);

            void set_level(LogLevel level);
            LogLevel get_level() const;

        private:
            BridgeLogger() = default;

            template<typename... Args>
            void log(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) {
                if (!g_logger || static_cast<int>(level) < static_cast<int>(g_current_level)) {
                    return;
                }

                try {
                    std::string formatted_msg = fmt::format(fmt, std::forward<Args>(args)...);
                    switch (level) {
                        case LogLevel::TRACE:
                            g_logger->trace(formatted_msg);
                            break;
                        case LogLevel::DEBUG:
                            g_logger->debug(formatted_msg);
                            break;
                        case LogLevel::INFO:
                            g_logger->info(formatted_msg);
                            break;
                        case LogLevel::WARN:
                            g_logger->warn(formatted_msg);
                            break;
                        case LogLevel::ERR:
                            g_logger->error(formatted_msg);
                            break;
                        case LogLevel::CRITICAL:
                            g_logger->critical(formatted_msg);
                            break;
                        default:
                            g_logger->info(formatted_msg);
                            break;
                    }
                } catch (const std::exception &e) {
                    // Fallback in case of formatting error
                    g_logger->error("Log formatting error: {}", e.what());
                }
            }
        };

        /**
        * @brief Initialize the global logger.
        * @param log_path Rotating log file path, empty for stderr only
        * @param log_level Log level (trace, debug, info, warn, error, critical, off)
        * @param max_file_size Maximum size of each log file (bytes)
        * @param max_files Maximum number of log files
        */
        void initializeLogger(
                const std::string &log_path,
                const std::string &log_level = "info",
                size_t max_file_size = 1048576 * 5,// 5MB
                size_t max_files = 3);

        /**
        * @brief Flush and drop the global logger.
        */
        void shutdownLogger();

    }// namespace core
}// namespace bridge
