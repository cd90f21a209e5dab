#include "logger.h"
#include <filesystem>
#include <memory>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace bridge {
    namespace core {

        // Static logger instance
        std::shared_ptr<spdlog::logger> g_logger = nullptr;
        LogLevel g_current_level = LogLevel::INFO;

        BridgeLogger &BridgeLogger::instance() {
            static BridgeLogger instance;
            return instance;
        }

        // allow access to the underlying spdlog::logger
        std::shared_ptr<spdlog::logger> BridgeLogger::operator->() {
            return g_logger;
        }

        void BridgeLogger::set_level(LogLevel level) {
            g_current_level = level;
            if (g_logger) {
                g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(level)));
            }
        }

        LogLevel BridgeLogger::get_level() const {
            return g_current_level;
        }

        // Overloads for string literals (without format arguments)
        void BridgeLogger::trace(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::TRACE) >= static_cast<int>(g_current_level)) {
                g_logger->trace(msg);
            }
        }

        void BridgeLogger::debug(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::DEBUG) >= static_cast<int>(g_current_level)) {
                g_logger->debug(msg);
            }
        }

        void BridgeLogger::info(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::INFO) >= static_cast<int>(g_current_level)) {
                g_logger->info(msg);
            }
        }

        void BridgeLogger::warn(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::WARN) >= static_cast<int>(g_current_level)) {
                g_logger->warn(msg);
            }
        }

        void BridgeLogger::error(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::ERR) >= static_cast<int>(g_current_level)) {
                g_logger->error(msg);
            }
        }

        void BridgeLogger::critical(const char *msg) {
            if (g_logger && static_cast<int>(LogLevel::CRITICAL) >= static_cast<int>(g_current_level)) {
                g_logger->critical(msg);
            }
        }

        LogLevel parse_log_level(const std::string &name) {
            if (name == "trace") return LogLevel::TRACE;
            if (name == "debug") return LogLevel::DEBUG;
            if (name == "warn" || name == "warning") return LogLevel::WARN;
            if (name == "error") return LogLevel::ERR;
            if (name == "critical") return LogLevel::CRITICAL;
            if (name == "off") return LogLevel::OFF;
            return LogLevel::INFO;
        }

        void initializeLogger(const std::string &log_path, const std::string &log_level, size_t max_file_size,
                              size_t max_files) {
            // stdout carries protocol frames, so the console sink is stderr
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_color_mode(spdlog::color_mode::automatic);
            console_sink->set_color(spdlog::level::trace, "\033[36m");           // Cyan
            console_sink->set_color(spdlog::level::debug, "\033[34m");           // Blue
            console_sink->set_color(spdlog::level::info, "\033[32m");            // Green
            console_sink->set_color(spdlog::level::warn, "\033[33m");            // Yellow
            console_sink->set_color(spdlog::level::err, "\033[31m");             // Red
            console_sink->set_color(spdlog::level::critical, "\033[41m\033[37m");// White on red background

            std::vector<spdlog::sink_ptr> sinks{console_sink};
            if (!log_path.empty()) {
                auto parent = std::filesystem::path(log_path).parent_path();
                if (!parent.empty()) {
                    std::error_code ec;
                    std::filesystem::create_directories(parent, ec);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, max_file_size, max_files));
            }

            g_current_level = parse_log_level(log_level);
            auto level_val = static_cast<spdlog::level::level_enum>(static_cast<int>(g_current_level));

            g_logger = std::make_shared<spdlog::logger>("sse_bridge", sinks.begin(), sinks.end());
            g_logger->set_level(level_val);
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            g_logger->flush_on(spdlog::level::warn);

            spdlog::drop("sse_bridge");
            spdlog::register_logger(g_logger);
            spdlog::set_default_logger(g_logger);

            // Start periodic flushing (every 3 seconds)
            spdlog::flush_every(std::chrono::seconds(3));
        }

        void shutdownLogger() {
            if (g_logger) {
                g_logger->flush();
            }
            g_logger.reset();
            spdlog::shutdown();
        }

    }// namespace core
}// namespace bridge
