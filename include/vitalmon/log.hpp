#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace vitalmon {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Process-wide stderr logger. Lines from the sampler, dispatcher and main
// threads are written whole under a single mutex.
class Log {
public:
    static void set_debug(bool enabled) { debug_enabled_ = enabled; }
    static bool debug_enabled() { return debug_enabled_; }

    template<typename... Args>
    static void debug(Args&&... args) {
        if (debug_enabled_) {
            write(LogLevel::Debug, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(Args&&... args) {
        write(LogLevel::Info, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(Args&&... args) {
        write(LogLevel::Warn, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(Args&&... args) {
        write(LogLevel::Error, std::forward<Args>(args)...);
    }

    // Redirect output (tests); pass nullptr to restore std::cerr
    static void set_stream(std::ostream* stream);

private:
    template<typename... Args>
    static void write(LogLevel level, Args&&... args) {
        std::ostringstream line;
        line << prefix(level);
        ((line << args), ...);
        line << '\n';
        emit(line.str());
    }

    static const char* prefix(LogLevel level);
    static void emit(const std::string& line);

    static std::atomic<bool> debug_enabled_;
    static std::mutex mutex_;
    static std::ostream* stream_;
};

} // namespace vitalmon
