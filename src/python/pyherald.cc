#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../config.hh"
#include "../error.hh"
#include "../log.hh"
#include "../message.hh"

namespace py = pybind11;

void init_handler(py::module &m);
void init_client(py::module &m);
void init_local(py::module &m);

void init_channel(py::module &m) {
    py::enum_<herald::ChannelMode>(m, "ChannelMode")
        .value("Exact", herald::ChannelMode::Exact)
        .value("Pattern", herald::ChannelMode::Pattern)
        .value("Sharded", herald::ChannelMode::Sharded);

    auto address = py::class_<herald::ChannelAddress>(m, "ChannelAddress");
    address.def(py::init<herald::ChannelMode, std::string>(), py::arg("mode"), py::arg("value"));
    address.def_static("exact", &herald::ChannelAddress::exact, py::arg("channel"));
    address.def_static("pattern", &herald::ChannelAddress::pattern, py::arg("pattern"));
    address.def_static("sharded", &herald::ChannelAddress::sharded, py::arg("channel"));
    address.def_property_readonly("mode", &herald::ChannelAddress::mode);
    address.def_property_readonly("value", &herald::ChannelAddress::value);
    address.def("matches", &herald::ChannelAddress::matches, py::arg("channel"));
    address.def("__eq__", &herald::ChannelAddress::operator==);
    address.def("__hash__", [](const herald::ChannelAddress &a) {
        return std::hash<std::string>()(a.str());
    });
    address.def("__repr__", &herald::ChannelAddress::str);

    m.def("glob_match", &herald::glob_match, py::arg("pattern"), py::arg("channel"));
}

void init_message(py::module &m) {
    auto message = py::class_<herald::Message>(m, "Message");
    message.def(py::init<std::string, std::string, std::optional<std::string>>(),
                py::arg("channel"), py::arg("payload"), py::arg("pattern") = py::none());
    message.def_property_readonly("channel", &herald::Message::channel);
    // payloads are binary safe
    message.def_property_readonly(
        "payload", [](const herald::Message &msg) { return py::bytes(msg.payload()); });
    message.def_property_readonly("pattern", &herald::Message::pattern);
    message.def("json", &herald::Message::json);
    message.def("__eq__", &herald::Message::operator==);
    message.def("__repr__", &herald::Message::json);
}

void init_config(py::module &m) {
    auto node = py::class_<herald::NodeAddress>(m, "NodeAddress");
    node.def(py::init([](const std::string &host, uint16_t port) {
                 return herald::NodeAddress{host, port};
             }),
             py::arg("host"), py::arg("port") = herald::NodeAddress::default_port);
    node.def_static("parse", &herald::NodeAddress::parse, py::arg("value"));
    node.def_readwrite("host", &herald::NodeAddress::host);
    node.def_readwrite("port", &herald::NodeAddress::port);
    node.def("__repr__", &herald::NodeAddress::str);

    auto subscriptions = py::class_<herald::SubscriptionConfig>(m, "SubscriptionConfig");
    subscriptions.def(py::init<>());
    subscriptions.def("with_channel", &herald::SubscriptionConfig::with_channel,
                      py::arg("channel"), py::arg("handler") = py::none(),
                      py::return_value_policy::reference_internal);
    subscriptions.def("with_pattern", &herald::SubscriptionConfig::with_pattern,
                      py::arg("pattern"), py::arg("handler") = py::none(),
                      py::return_value_policy::reference_internal);
    subscriptions.def("with_sharded_channel", &herald::SubscriptionConfig::with_sharded_channel,
                      py::arg("channel"), py::arg("handler") = py::none(),
                      py::return_value_policy::reference_internal);
    subscriptions.def("with_subscription", &herald::SubscriptionConfig::with_subscription,
                      py::arg("mode"), py::arg("value"), py::arg("handler") = py::none(),
                      py::return_value_policy::reference_internal);
    subscriptions.def("with_callback", &herald::SubscriptionConfig::with_callback,
                      py::arg("handler"), py::return_value_policy::reference_internal);
    subscriptions.def("__len__",
                      [](const herald::SubscriptionConfig &c) { return c.entries().size(); });

    auto config = py::class_<herald::ClientConfig>(m, "ClientConfig");
    config.def(py::init<>());
    config.def_readwrite("addresses", &herald::ClientConfig::addresses);
    config.def_readwrite("cluster_mode", &herald::ClientConfig::cluster_mode);
    config.def_readwrite("request_timeout", &herald::ClientConfig::request_timeout);
    config.def_readwrite("shutdown_timeout", &herald::ClientConfig::shutdown_timeout);
    config.def_readwrite("max_queue_size", &herald::ClientConfig::max_queue_size);
    config.def_readwrite("subscriptions", &herald::ClientConfig::subscriptions);
    config.def("validate", &herald::ClientConfig::validate);

    m.def("parse_config", &herald::parse_config, py::arg("json"));
    m.def("load_config", &herald::load_config, py::arg("path"));
}

void init_log(py::module &m) {
    auto log = m.def_submodule("log");
    py::enum_<herald::log::Level>(log, "Level")
        .value("Trace", herald::log::Level::Trace)
        .value("Debug", herald::log::Level::Debug)
        .value("Info", herald::log::Level::Info)
        .value("Warn", herald::log::Level::Warn)
        .value("Error", herald::log::Level::Error)
        .value("Off", herald::log::Level::Off);
    log.def("set_level", &herald::log::set_level, py::arg("level"));
    log.def("level", &herald::log::level);
    // sinks are called from the delivery thread, the GIL is taken by the
    // function wrapper
    log.def("set_sink", &herald::log::set_sink, py::arg("sink"));
    log.def("reset_sink", []() { herald::log::set_sink(nullptr); });
}

void init_errors(py::module &m) {
    auto base = py::register_exception<herald::Error>(m, "Error");
    py::register_exception<herald::InvalidModeError>(m, "InvalidModeError", base);
    py::register_exception<herald::InvalidOperationError>(m, "InvalidOperationError", base);
    py::register_exception<herald::TimeoutError>(m, "TimeoutError", base);
    py::register_exception<herald::CancelledError>(m, "CancelledError", base);
    py::register_exception<herald::TransportUnavailableError>(m, "TransportUnavailableError",
                                                              base);
    py::register_exception<herald::ConfigError>(m, "ConfigError", base);

    auto consumer_error = py::class_<herald::ConsumerError>(m, "ConsumerError");
    consumer_error.def_readonly("channel", &herald::ConsumerError::channel);
    consumer_error.def_readonly("pattern", &herald::ConsumerError::pattern);
    consumer_error.def_readonly("reason", &herald::ConsumerError::reason);
}

PYBIND11_MODULE(pyherald, m) {
    init_errors(m);
    init_log(m);
    init_channel(m);
    init_message(m);
    init_handler(m);
    init_config(m);
    init_local(m);
    init_client(m);
}
