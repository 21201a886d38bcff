#include "util.hh"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace herald {

namespace string {
std::vector<std::string> split(const std::string &str, const std::string &delimiter) {
    std::vector<std::string> tokens;
    size_t prev = 0, pos;
    while ((pos = str.find_first_of(delimiter, prev)) != std::string::npos) {
        if (pos > prev) {
            tokens.emplace_back(str.substr(prev, pos - prev));
        }
        prev = pos + 1;
    }
    if (prev < str.length()) tokens.emplace_back(str.substr(prev, std::string::npos));
    return tokens;
}

std::string trim(const std::string &str) {
    constexpr auto spaces = " \t\n\r\f\v";
    auto start = str.find_first_not_of(spaces);
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(spaces);
    return str.substr(start, end - start + 1);
}

bool is_blank(const std::string &str) { return trim(str).empty(); }
}  // namespace string

namespace parse {
std::optional<uint64_t> parse_uint64(const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}
}  // namespace parse

namespace fs {
std::optional<std::string> read_file(const std::string &path) {
    std::ifstream stream(path);
    if (!stream.good()) return std::nullopt;
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}
}  // namespace fs

}  // namespace herald
