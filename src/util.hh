#ifndef HERALD_UTIL_HH
#define HERALD_UTIL_HH

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace herald {

namespace string {
// splits on any character of the delimiter set, dropping empty tokens
std::vector<std::string> split(const std::string &str, const std::string &delimiter);
std::string trim(const std::string &str);
[[nodiscard]] bool is_blank(const std::string &str);
}  // namespace string

namespace parse {
// the whole value must be a non-negative decimal number
std::optional<uint64_t> parse_uint64(const std::string &value);
}  // namespace parse

namespace fs {
std::optional<std::string> read_file(const std::string &path);
}  // namespace fs

}  // namespace herald

#endif  // HERALD_UTIL_HH
