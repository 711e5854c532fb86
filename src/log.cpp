#include "vitalmon/log.hpp"

namespace vitalmon {

std::atomic<bool> Log::debug_enabled_{false};
std::mutex Log::mutex_;
std::ostream* Log::stream_ = nullptr;

void Log::set_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

const char* Log::prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Info:  return "[INFO] ";
        case LogLevel::Warn:  return "[WARN] ";
        case LogLevel::Error: return "[ERROR] ";
    }
    return "";
}

void Log::emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = stream_ ? *stream_ : std::cerr;
    out << line;
    out.flush();
}

} // namespace vitalmon
