#include <narrative/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

namespace narrative::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

// Extracts the "[Tag]" prefix used by every component as the sink category
static std::string category_of(const std::string& message) {
    if (message.empty() || message.front() != '[') return {};
    auto end = message.find(']');
    if (end == std::string::npos) return {};
    return message.substr(1, end - 1);
}

void log(LogLevel level, const char* message) {
    log(level, std::string(message ? message : ""));
}

void log(LogLevel level, const std::string& message) {
    if (level < s_log_level) return;

    std::printf("%s %s\n", to_string(level), message.c_str());

    // Forward to registered sinks
    std::string category = category_of(message);
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "?????";
}

} // namespace narrative::core
