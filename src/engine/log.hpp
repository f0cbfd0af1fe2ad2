#pragma once

#include <sstream>
#include <string>

namespace lectern::engine::log {

    enum class Level {
        Debug,
        Info,
        Warn,
        Error
    };

    void set_level(Level level);
    Level level();
    Level level_from_string(const std::string& value);

    bool enabled(Level level);

    /**
     * @brief Writes "[component] message" as one line. Info goes to stdout, everything else to stderr.
     */
    void write(Level level, const std::string& component, const std::string& message);

    template <typename... Args>
    std::string concat(const Args&... args) {
        std::ostringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    template <typename... Args>
    void debug(const std::string& component, const Args&... args) {
        if (enabled(Level::Debug)) write(Level::Debug, component, concat(args...));
    }

    template <typename... Args>
    void info(const std::string& component, const Args&... args) {
        if (enabled(Level::Info)) write(Level::Info, component, concat(args...));
    }

    template <typename... Args>
    void warn(const std::string& component, const Args&... args) {
        if (enabled(Level::Warn)) write(Level::Warn, component, concat(args...));
    }

    template <typename... Args>
    void error(const std::string& component, const Args&... args) {
        if (enabled(Level::Error)) write(Level::Error, component, concat(args...));
    }

}
