#pragma once
#include <cstdint>
#include <string>

namespace DryDock {

struct LogEntry {
    std::int64_t id = 0;
    std::string level;   // INFO, WARNING, ERROR or DEBUG
    std::string message;
    std::int64_t timestamp = 0;
};

}
