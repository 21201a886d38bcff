#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../client.hh"
#include "../local.hh"

namespace py = pybind11;

namespace {
// joining the delivery thread with the GIL held would deadlock against a
// handler waiting for it
struct ReleasingDelete {
    void operator()(herald::Client *client) const {
        py::gil_scoped_release release;
        delete client;
    }
};
using ClientHolder = std::unique_ptr<herald::Client, ReleasingDelete>;
}  // namespace

void init_handler(py::module &m) {
    class PyHandler : public herald::Handler {
    public:
        using herald::Handler::Handler;

        void on_message(const herald::Message &message) override {
            /* Acquire GIL before calling Python code */
            py::gil_scoped_acquire acquire;
            PYBIND11_OVERRIDE(void, herald::Handler, on_message, message);
        }
    };

    auto handler =
        py::class_<herald::Handler, PyHandler, std::shared_ptr<herald::Handler>>(m, "Handler");
    handler.def(py::init<>());
    handler.def(py::init<herald::MessageCallback>(), py::arg("callback"));
    handler.def("on_message", &herald::Handler::on_message, py::arg("message"));
}

void init_local(py::module &m) {
    auto transport =
        py::class_<herald::Transport, std::shared_ptr<herald::Transport>>(m, "Transport");
    transport.def_property_readonly("is_cluster", &herald::Transport::is_cluster);

    py::class_<herald::LocalTransport, herald::Transport, std::shared_ptr<herald::LocalTransport>>(
        m, "LocalTransport")
        .def_property_readonly("broker", &herald::LocalTransport::broker);

    auto broker =
        py::class_<herald::LocalBroker, std::shared_ptr<herald::LocalBroker>>(m, "LocalBroker");
    broker.def(py::init<bool>(), py::arg("cluster") = false);
    broker.def("connect", &herald::LocalBroker::connect);
    broker.def("publish", &herald::LocalBroker::publish, py::arg("channel"), py::arg("payload"),
               py::call_guard<py::gil_scoped_release>());
    broker.def("spublish", &herald::LocalBroker::spublish, py::arg("channel"), py::arg("payload"),
               py::call_guard<py::gil_scoped_release>());
    broker.def("set_ack_delay", &herald::LocalBroker::set_ack_delay, py::arg("delay"));
    broker.def("kill_connections", &herald::LocalBroker::kill_connections,
               py::call_guard<py::gil_scoped_release>());
    broker.def_property("reachable", &herald::LocalBroker::reachable,
                        &herald::LocalBroker::set_reachable);
    broker.def_property_readonly("is_cluster", &herald::LocalBroker::is_cluster);
    broker.def_property_readonly("sessions", &herald::LocalBroker::sessions);
}

void init_client(py::module &m) {
    py::enum_<herald::DeliveryMode>(m, "DeliveryMode")
        .value("Unresolved", herald::DeliveryMode::Unresolved)
        .value("Handler", herald::DeliveryMode::Handler)
        .value("Queue", herald::DeliveryMode::Queue);
    py::enum_<herald::ResyncState>(m, "ResyncState")
        .value("Synced", herald::ResyncState::Synced)
        .value("Resyncing", herald::ResyncState::Resyncing);

    auto token = py::class_<herald::CancellationToken>(m, "CancellationToken");
    token.def(py::init<>());
    token.def("cancel", &herald::CancellationToken::cancel,
              py::call_guard<py::gil_scoped_release>());
    token.def_property_readonly("cancelled", &herald::CancellationToken::cancelled);

    auto queue =
        py::class_<herald::MessageQueue, std::shared_ptr<herald::MessageQueue>>(m, "MessageQueue");
    queue.def("try_get", &herald::MessageQueue::try_get);
    queue.def("get", &herald::MessageQueue::get,
              py::arg("token") = herald::CancellationToken::none(),
              py::call_guard<py::gil_scoped_release>());
    // the callback takes the GIL back for every message
    queue.def("get_messages", &herald::MessageQueue::get_messages, py::arg("token"),
              py::arg("callback"), py::call_guard<py::gil_scoped_release>());
    queue.def("__len__", &herald::MessageQueue::size);
    queue.def_property_readonly("dropped", &herald::MessageQueue::dropped);

    auto state = py::class_<herald::SubscriptionState>(m, "SubscriptionState");
    state.def_readonly("desired", &herald::SubscriptionState::desired);
    state.def_readonly("actual", &herald::SubscriptionState::actual);

    auto client = py::class_<herald::Client, ClientHolder>(m, "Client");
    client.def(py::init([](herald::ClientConfig config,
                           const std::shared_ptr<herald::Transport> &transport) {
                   py::gil_scoped_release release;
                   return ClientHolder(new herald::Client(std::move(config), transport));
               }),
               py::arg("config"), py::arg("transport"));
    client.def("subscribe",
               py::overload_cast<const herald::ChannelAddress &, herald::HandlerPtr,
                                 herald::Client::Timeout>(&herald::Client::subscribe),
               py::arg("address"), py::arg("handler") = py::none(),
               py::arg("timeout") = py::none(), py::call_guard<py::gil_scoped_release>());
    client.def("subscribe",
               py::overload_cast<const std::vector<herald::ChannelAddress> &, herald::HandlerPtr,
                                 herald::Client::Timeout>(&herald::Client::subscribe),
               py::arg("addresses"), py::arg("handler") = py::none(),
               py::arg("timeout") = py::none(), py::call_guard<py::gil_scoped_release>());
    client.def("subscribe_lazy",
               py::overload_cast<const std::vector<herald::ChannelAddress> &, herald::HandlerPtr>(
                   &herald::Client::subscribe_lazy),
               py::arg("addresses"), py::arg("handler") = py::none(),
               py::call_guard<py::gil_scoped_release>());
    client.def("unsubscribe",
               py::overload_cast<const std::vector<herald::ChannelAddress> &,
                                 const herald::HandlerPtr &, herald::Client::Timeout>(
                   &herald::Client::unsubscribe),
               py::arg("addresses"), py::arg("handler") = py::none(),
               py::arg("timeout") = py::none(), py::call_guard<py::gil_scoped_release>());
    client.def("unsubscribe_lazy",
               py::overload_cast<const std::vector<herald::ChannelAddress> &,
                                 const herald::HandlerPtr &>(&herald::Client::unsubscribe_lazy),
               py::arg("addresses"), py::arg("handler") = py::none(),
               py::call_guard<py::gil_scoped_release>());
    client.def(
        "unsubscribe_all",
        [](herald::Client &c, std::optional<herald::ChannelMode> mode,
           herald::Client::Timeout timeout) {
            if (mode) {
                c.unsubscribe_all(*mode, timeout);
            } else {
                c.unsubscribe_all(timeout);
            }
        },
        py::arg("mode") = py::none(), py::arg("timeout") = py::none(),
        py::call_guard<py::gil_scoped_release>());
    client.def("queue", &herald::Client::queue);
    client.def("publish", &herald::Client::publish, py::arg("channel"), py::arg("payload"),
               py::call_guard<py::gil_scoped_release>());
    client.def("spublish", &herald::Client::spublish, py::arg("channel"), py::arg("payload"),
               py::call_guard<py::gil_scoped_release>());
    client.def("get_subscriptions", &herald::Client::get_subscriptions);
    client.def("pubsub_channels", &herald::Client::pubsub_channels,
               py::arg("pattern") = py::none());
    client.def("pubsub_numsub", &herald::Client::pubsub_numsub, py::arg("channels"));
    client.def("pubsub_numpat", &herald::Client::pubsub_numpat);
    client.def_property_readonly("resync_state", &herald::Client::resync_state);
    client.def_property_readonly("resync_count", &herald::Client::resync_count);
    client.def_property_readonly("delivery_mode", &herald::Client::delivery_mode);
    client.def_property_readonly("closed", &herald::Client::closed);
    client.def("flush", &herald::Client::flush, py::arg("timeout"),
               py::call_guard<py::gil_scoped_release>());
    client.def("close", &herald::Client::close, py::call_guard<py::gil_scoped_release>());
    client.def("set_consumer_error_hook", &herald::Client::set_consumer_error_hook,
               py::arg("hook"));
    client.def("__enter__", [](herald::Client &c) -> herald::Client & { return c; },
               py::return_value_policy::reference);
    client.def(
        "__exit__",
        [](herald::Client &c, const py::args &) {
            py::gil_scoped_release release;
            c.close();
        });
}
