#ifndef HERALD_ERROR_HH
#define HERALD_ERROR_HH

#include <stdexcept>
#include <string>

namespace herald {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// handler and queue consumption mixed on one client
class InvalidModeError : public Error {
public:
    explicit InvalidModeError(const std::string &msg) : Error(msg) {}
};

class InvalidOperationError : public Error {
public:
    explicit InvalidOperationError(const std::string &msg) : Error(msg) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string &msg) : Error(msg) {}
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string &msg) : Error(msg) {}
};

class TransportUnavailableError : public Error {
public:
    explicit TransportUnavailableError(const std::string &msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &msg) : Error(msg) {}
};

// a handler failure. only ever reported to the log and the error hook
struct ConsumerError {
    std::string channel;
    std::string pattern;
    std::string reason;
};

}  // namespace herald

#endif  // HERALD_ERROR_HH
