#pragma once
#include "db/ConnectionPool.hpp"
#include "db/LogRepository.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>

namespace DryDock {

// Mirrors log records into the logs table for the in-app log view.
// Nothing reachable from sink_it_ may log through spdlog, or the sink's
// mutex would be taken twice.
class DatabaseLogSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit DatabaseLogSink(std::shared_ptr<ConnectionPool> pool);

    static const char* levelName(spdlog::level::level_enum level);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::shared_ptr<ConnectionPool> pool_;
    LogRepository repository_;
};

namespace Logging {

// Installs the default "drydock" logger writing to stderr.
void init(const std::string& level = "info");

// Sinks are swapped without synchronisation: call these before background
// threads start and after they stop.
void attachDatabase(std::shared_ptr<ConnectionPool> pool);
void detachDatabase();

spdlog::level::level_enum parseLevel(const std::string& name);

}
}
