#include "json.hh"

#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace herald {

std::string Message::json() const {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto value = json::serialize(doc.GetAllocator(), *this);
    return json::serialize(value, false);
}

namespace json {

rapidjson::Value serialize(rapidjson::MemoryPoolAllocator<> &allocator, const Message &message) {
    using namespace rapidjson;
    Value result(kObjectType);
    set_member(result, allocator, "message", message.payload());
    set_member(result, allocator, "channel", message.channel());
    set_member(result, allocator, "pattern", message.pattern());
    return result;
}

rapidjson::Value serialize(rapidjson::MemoryPoolAllocator<> &allocator,
                           const SubscriptionMap &subscriptions) {
    using namespace rapidjson;
    Value result(kObjectType);
    for (auto const &[mode, values] : subscriptions) {
        set_member(result, allocator, to_string(mode), values);
    }
    return result;
}

std::string serialize(const rapidjson::Value &value, bool pretty_print) {
    using namespace rapidjson;
    StringBuffer buffer;
    if (pretty_print) {
        PrettyWriter w(buffer);
        value.Accept(w);
    } else {
        Writer w(buffer);
        value.Accept(w);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace json
}  // namespace herald
