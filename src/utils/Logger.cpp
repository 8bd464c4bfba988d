#include "utils/Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace DryDock {

DatabaseLogSink::DatabaseLogSink(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)), repository_(*pool_) {}

const char* DatabaseLogSink::levelName(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug: return "DEBUG";
        case spdlog::level::warn: return "WARNING";
        case spdlog::level::err:
        case spdlog::level::critical: return "ERROR";
        default: return "INFO";
    }
}

void DatabaseLogSink::sink_it_(const spdlog::details::log_msg& msg) {
    std::string message(msg.payload.data(), msg.payload.size());
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(msg.time.time_since_epoch()).count();
    Error err = repository_.append(levelName(msg.level), message, static_cast<std::int64_t>(timestamp));
    if (!err.ok()) {
        std::cerr << "Failed to store log entry: " << err.describe() << std::endl;
    }
}

namespace Logging {

namespace {
std::shared_ptr<DatabaseLogSink> databaseSink;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") lower = "warn";
    if (lower == "error") lower = "err";
    auto level = spdlog::level::from_str(lower);
    // from_str maps unknown names to off; keep the hub talking instead
    if (level == spdlog::level::off && lower != "off") return spdlog::level::info;
    return level;
}

void init(const std::string& level) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("drydock", console);
    logger->set_level(parseLevel(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void attachDatabase(std::shared_ptr<ConnectionPool> pool) {
    detachDatabase();
    databaseSink = std::make_shared<DatabaseLogSink>(std::move(pool));
    databaseSink->set_level(spdlog::level::info);
    spdlog::default_logger()->sinks().push_back(databaseSink);
}

void detachDatabase() {
    if (!databaseSink) return;
    auto& sinks = spdlog::default_logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), databaseSink), sinks.end());
    databaseSink.reset();
}

}
}
