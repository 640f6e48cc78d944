#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <mutex>

namespace Stonetrail {

/**
 * @brief Thread-safe logging utility for the tracking engine.
 *
 * Minimum level comes from STONETRAIL_LOG_LEVEL (debug, info, warning, error, off)
 * and can be overridden at runtime with set_level().
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void log(Level level, const std::string& message) {
        if (level < min_level()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Off:     return;
        }

        std::cout << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static void set_level(Level level) { level_ref().store(level); }

    static Level min_level() { return level_ref().load(); }

    static Level parse_level(const std::string& name) {
        if (name == "debug") return Level::Debug;
        if (name == "warning" || name == "warn") return Level::Warning;
        if (name == "error") return Level::Error;
        if (name == "off") return Level::Off;
        return Level::Info;
    }

private:
    static std::atomic<Level>& level_ref() {
        static std::atomic<Level> level{[] {
            const char* env = std::getenv("STONETRAIL_LOG_LEVEL");
            return env ? parse_level(env) : Level::Info;
        }()};
        return level;
    }
};

} // namespace Stonetrail
