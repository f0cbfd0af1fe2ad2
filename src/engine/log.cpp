#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace lectern::engine::log {

    namespace {
        std::atomic<Level> g_level{Level::Info};
        std::mutex g_write_mutex;
    }

    void set_level(Level level) { g_level = level; }

    Level level() { return g_level; }

    Level level_from_string(const std::string& value) {
        if (value == "debug") return Level::Debug;
        if (value == "warn" || value == "warning") return Level::Warn;
        if (value == "error" || value == "quiet") return Level::Error;
        return Level::Info;
    }

    bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(g_level.load());
    }

    void write(Level level, const std::string& component, const std::string& message) {
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::ostream& out = (level == Level::Info) ? std::cout : std::cerr;
        out << "[" << component << "] ";
        if (level == Level::Warn) out << "Warning: ";
        else if (level == Level::Error) out << "Error: ";
        out << message << "\n";
    }

}
