/**
 * @file bindings.cpp
 * @brief Defines the Python module for the capturehub device engine.
 * @details Exposes the engine, both managers, the message bus and the C++ log queue so a
 *          Python host (web layer, CLI) can drive the subsystem and consume its events.
 *          Field maps convert to and from Python dicts of str/int/float/bool values.
 */
#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "bus/message_bus.h"
#include "device_errors.h"
#include "managers/device_engine.h"
#include "utils/cpp_logger.h"

#include <tuple>

namespace py = pybind11;
using namespace capturehub;
using namespace capturehub::devices;

namespace {

void bind_logger(py::module_& m) {
    py::enum_<logging::LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", logging::LogLevel::DEBUG)
        .value("INFO", logging::LogLevel::INFO)
        .value("WARNING", logging::LogLevel::WARNING)
        .value("ERROR", logging::LogLevel::ERR)
        .export_values();

    m.def("get_cpp_log_messages", [](int timeout_ms) {
        std::vector<std::tuple<logging::LogLevel, std::string, std::string, int>> entries_tuples;
        std::vector<logging::LogEntry> cpp_entries;
        {
            py::gil_scoped_release release_gil;
            cpp_entries = logging::retrieve_log_entries(timeout_ms);
        }
        for (const auto& entry : cpp_entries) {
            entries_tuples.emplace_back(entry.level, entry.message, entry.filename, entry.line_number);
        }
        return entries_tuples;
    }, py::arg("timeout_ms") = 100,
       "Retrieves buffered C++ log messages, blocking until messages are available or timeout occurs (in ms). Returns a list of (level, message, filename, line) tuples.");

    m.def("shutdown_cpp_logger", &logging::shutdown_cpp_logger,
          "Signals the C++ logger to prepare for shutdown, unblocking any waiting log retrieval calls.");

    m.def("set_cpp_log_level", &logging::set_cpp_log_level, py::arg("level"),
          "Sets the C++ global log level.");
}

void bind_errors(py::module_& m) {
    static py::exception<DeviceError> device_error(m, "DeviceError");
    static py::exception<DuplicateIdentityError> duplicate_error(m, "DuplicateIdentityError", device_error);
    static py::exception<NotFoundError> not_found_error(m, "NotFoundError", device_error);
    static py::exception<ValidationError> validation_error(m, "ValidationError", device_error);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) {
                std::rethrow_exception(p);
            }
        } catch (const DuplicateIdentityError& e) {
            duplicate_error(e.what());
        } catch (const NotFoundError& e) {
            not_found_error(e.what());
        } catch (const ValidationError& e) {
            validation_error(e.what());
        } catch (const DeviceError& e) {
            device_error(e.what());
        }
    });
}

void bind_bus(py::module_& m) {
    py::class_<bus::BusMessage>(m, "BusMessage")
        .def_readonly("topic", &bus::BusMessage::topic)
        .def_readonly("payload", &bus::BusMessage::payload)
        .def_readonly("sender", &bus::BusMessage::sender)
        .def_readonly("message_id", &bus::BusMessage::message_id)
        .def_readonly("timestamp", &bus::BusMessage::timestamp);

    py::class_<bus::MessageBus, std::shared_ptr<bus::MessageBus>>(m, "MessageBus")
        .def("subscribe", &bus::MessageBus::subscribe, py::arg("pattern"), py::arg("handler"),
             "Registers a callable for every topic matching the pattern ('+' and trailing '#' wildcards).")
        .def("unsubscribe", &bus::MessageBus::unsubscribe, py::arg("handle"))
        .def("publish", &bus::MessageBus::publish, py::arg("topic"), py::arg("payload") = FieldMap{},
             py::arg("sender") = "")
        .def("flush", [](bus::MessageBus& self, int timeout_ms) {
            py::gil_scoped_release release_gil;
            return self.flush(std::chrono::milliseconds(timeout_ms));
        }, py::arg("timeout_ms") = 1000)
        .def_property_readonly("delivery_errors", &bus::MessageBus::delivery_errors)
        .def_property_readonly("undelivered_commands", &bus::MessageBus::undelivered_commands);
}

py::dict device_to_dict(const DeviceInfo& device) {
    py::dict result;
    for (const auto& entry : to_fields(device, true)) {
        result[py::str(entry.first)] = py::cast(entry.second);
    }
    return result;
}

py::dict devices_to_dict(const DeviceMap& devices) {
    py::dict result;
    for (const auto& entry : devices) {
        result[py::str(entry.first)] = device_to_dict(entry.second);
    }
    return result;
}

template <typename Manager>
void bind_manager(py::module_& m, const char* name) {
    py::class_<Manager>(m, name)
        .def("start", &Manager::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &Manager::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running", &Manager::is_running)
        .def("add_device", &Manager::add_device, py::arg("spec"))
        .def("remove_device", &Manager::remove_device, py::arg("device_id"))
        .def("update_device",
             static_cast<bool (Manager::*)(const std::string&, const FieldMap&)>(&Manager::update_device),
             py::arg("device_id"), py::arg("fields"))
        .def("get_devices", [](const Manager& self) { return devices_to_dict(self.get_devices()); })
        .def("get_device", [](const Manager& self, const std::string& device_id) -> py::object {
            auto device = self.get_device(device_id);
            if (!device) {
                return py::none();
            }
            return device_to_dict(*device);
        }, py::arg("device_id"))
        .def("request_scan", &Manager::request_scan)
        .def("publish_device_snapshot", &Manager::publish_device_snapshot, py::arg("reason") = "get_devices")
        .def("scan_now", [](Manager& self) {
            discovery::CycleReport report;
            {
                py::gil_scoped_release release_gil;
                report = self.scan_now();
            }
            py::dict result;
            result["added"] = report.added;
            result["updated"] = report.updated;
            result["removed"] = report.removed;
            result["candidates"] = report.candidates;
            result["abandoned_protocols"] = report.abandoned_protocols;
            return result;
        })
        .def_property_readonly("domain", &Manager::domain);
}

} // namespace

PYBIND11_MODULE(capturehub_devices_py, m) {
    m.doc() = "capturehub device discovery and lifecycle engine";

    bind_logger(m);
    bind_errors(m);
    bind_bus(m);
    bind_manager<LocalDeviceManager>(m, "LocalDeviceManager");
    bind_manager<NetworkDeviceManager>(m, "NetworkDeviceManager");

    py::class_<DeviceEngine>(m, "DeviceEngine")
        .def(py::init([](const std::string& config_path) { return DeviceEngine::from_config(config_path); }),
             py::arg("config_path") = "")
        .def("start", &DeviceEngine::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &DeviceEngine::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running", &DeviceEngine::is_running)
        .def_property_readonly("bus", &DeviceEngine::bus)
        .def_property_readonly("local_devices", &DeviceEngine::local_devices, py::return_value_policy::reference_internal)
        .def_property_readonly("network_devices", &DeviceEngine::network_devices, py::return_value_policy::reference_internal);

    m.attr("LOCAL_DOMAIN") = config::kLocalDomain;
    m.attr("NETWORK_DOMAIN") = config::kNetworkDomain;
}
