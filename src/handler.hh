#ifndef HERALD_HANDLER_HH
#define HERALD_HANDLER_HH

#include <functional>
#include <memory>

#include "message.hh"

namespace herald {

using MessageCallback = std::function<void(const Message &)>;

// a push consumer. registrations compare handlers by identity, so subscribing
// the same handler twice to one address is a no-op
class Handler : public std::enable_shared_from_this<Handler> {
public:
    Handler() = default;
    explicit Handler(MessageCallback callback) : callback_(std::move(callback)) {}
    virtual ~Handler() = default;

    virtual void on_message(const Message &message) {
        if (callback_) callback_(message);
    }

private:
    MessageCallback callback_;
};

using HandlerPtr = std::shared_ptr<Handler>;

inline HandlerPtr make_handler(MessageCallback callback) {
    return std::make_shared<Handler>(std::move(callback));
}

}  // namespace herald

#endif  // HERALD_HANDLER_HH
