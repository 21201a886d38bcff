#include "log.hh"

#include <atomic>
#include <iostream>
#include <mutex>

#include "fmt/format.h"

namespace herald::log {

static std::atomic<Level> level_ = Level::Warn;
static std::mutex sink_mutex_;
static Sink sink_;

void set_level(Level level) { level_ = level; }

Level level() { return level_; }

bool enabled(Level level) { return level != Level::Off && level >= level_.load(); }

void set_sink(Sink sink) {
    std::lock_guard guard(sink_mutex_);
    sink_ = std::move(sink);
}

const char *to_string(Level level) {
    switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        default:
            return "OFF";
    }
}

void write(Level level, const std::string &identifier, const std::string &message) {
    if (!enabled(level)) return;
    std::lock_guard guard(sink_mutex_);
    if (sink_) {
        sink_(level, identifier, message);
    } else {
        std::cerr << fmt::format("[{0}] {1}: {2}\n", to_string(level), identifier, message);
    }
}

}  // namespace herald::log
