#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Slowosiec {

/**
 * @brief Thread-safe console logger shared by the loader and the tools.
 *
 * Levels are ordered by severity; messages below the minimum level are
 * dropped. Errors are always printed.
 */
class Logger {
public:
    enum class Level {
        Bulk,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (level != Level::Error && level < min_level()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[LOAD] "; break; // Magenta
        }

        std::cout << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_min_level(Level level) { min_level_ref().store(level); }
    static Level min_level() { return min_level_ref().load(); }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    static std::atomic<Level>& min_level_ref() {
        static std::atomic<Level> level{Level::Bulk};
        return level;
    }
};

} // namespace Slowosiec
