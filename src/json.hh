#ifndef HERALD_JSON_HH
#define HERALD_JSON_HH

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "channel.hh"
#include "message.hh"
#include "rapidjson/document.h"
#include "rapidjson/rapidjson.h"

namespace herald::json {
template <typename T, typename K, typename A>
void set_member(K &json_value, A &allocator, const char *name, const T &value) {
    rapidjson::Value key(name, allocator);  // NOLINT
    if constexpr (std::is_same<T, std::string>::value) {
        rapidjson::Value v(value.c_str(), static_cast<rapidjson::SizeType>(value.size()),
                           allocator);
        json_value.AddMember(key, v, allocator);
    } else if constexpr (std::is_same<T, std::optional<std::string>>::value) {
        if (value) {
            set_member(json_value, allocator, name, *value);
        } else {
            json_value.AddMember(key, rapidjson::Value(), allocator);
        }
    } else if constexpr (std::is_integral<T>::value) {
        json_value.AddMember(key.Move(), value, allocator);
    } else if constexpr (std::is_same<T, rapidjson::Value>::value) {
        rapidjson::Value v_copy(value, allocator);
        json_value.AddMember(key.Move(), v_copy.Move(), allocator);
    } else if constexpr (std::is_same<T, std::set<std::string>>::value) {
        rapidjson::Value v(rapidjson::kArrayType);
        for (auto const &entry : value) {
            rapidjson::Value s(entry.c_str(), static_cast<rapidjson::SizeType>(entry.size()),
                               allocator);
            v.PushBack(s, allocator);
        }
        json_value.AddMember(key.Move(), v.Move(), allocator);
    } else {
        throw std::runtime_error("Unable to determine type for " + std::string(name));
    }
}

static bool check_member(const rapidjson::Value &value, const char *member_name) {
    return value.IsObject() && value.HasMember(member_name);
}

// nullopt when the member is missing or has a different type
template <typename T>
static std::optional<T> get_member(const rapidjson::Value &value, const char *member_name) {
    if (!check_member(value, member_name)) return std::nullopt;
    auto const &member = value[member_name];
    if constexpr (std::is_same<T, std::string>::value) {
        if (member.IsString()) {
            return std::string(member.GetString(), member.GetStringLength());
        }
    } else if constexpr (std::is_same<T, bool>::value) {
        if (member.IsBool()) {
            return member.GetBool();
        }
    } else if constexpr (std::is_integral<T>::value) {
        if (member.template Is<T>()) {
            return member.template Get<T>();
        }
    } else if constexpr (std::is_same<T, std::vector<std::string>>::value) {
        if (member.IsArray()) {
            std::vector<std::string> result;
            for (auto const &entry : member.GetArray()) {
                if (!entry.IsString()) return std::nullopt;
                result.emplace_back(entry.GetString(), entry.GetStringLength());
            }
            return result;
        }
    }
    return std::nullopt;
}

rapidjson::Value serialize(rapidjson::MemoryPoolAllocator<> &allocator, const Message &message);
rapidjson::Value serialize(rapidjson::MemoryPoolAllocator<> &allocator,
                           const SubscriptionMap &subscriptions);
std::string serialize(const rapidjson::Value &value, bool pretty_print);

}  // namespace herald::json

#endif  // HERALD_JSON_HH
