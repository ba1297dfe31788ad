#include "logging.hpp"

#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "errors.hpp"

namespace attribution::logging {

namespace {

std::mutex                      g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> makeLogger(const LoggingConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("cannot open log file '" + cfg.file + "': " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");

    const auto level = spdlog::level::from_str(cfg.level);
    if (level == spdlog::level::off && cfg.level != "off")
        throw ConfigError("unknown log level '" + cfg.level + "'");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void init(const LoggingConfig& cfg)
{
    auto logger = makeLogger(cfg);
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> get()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger)
        g_logger = makeLogger(LoggingConfig{});
    return g_logger;
}

} // namespace attribution::logging
