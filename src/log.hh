#ifndef HERALD_LOG_HH
#define HERALD_LOG_HH

#include <functional>
#include <string>

namespace herald::log {

enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

using Sink = std::function<void(Level, const std::string &, const std::string &)>;

void set_level(Level level);
Level level();
[[nodiscard]] bool enabled(Level level);

// replace the default stderr sink. an empty sink restores the default one
void set_sink(Sink sink);

const char *to_string(Level level);

void write(Level level, const std::string &identifier, const std::string &message);

inline void trace(const std::string &identifier, const std::string &message) {
    write(Level::Trace, identifier, message);
}
inline void debug(const std::string &identifier, const std::string &message) {
    write(Level::Debug, identifier, message);
}
inline void info(const std::string &identifier, const std::string &message) {
    write(Level::Info, identifier, message);
}
inline void warn(const std::string &identifier, const std::string &message) {
    write(Level::Warn, identifier, message);
}
inline void error(const std::string &identifier, const std::string &message) {
    write(Level::Error, identifier, message);
}

}  // namespace herald::log

#endif  // HERALD_LOG_HH
