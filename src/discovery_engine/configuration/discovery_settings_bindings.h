/**
 * @file discovery_settings_bindings.h
 * @brief pybind11 bindings for the discovery settings structs.
 */
#ifndef AUDYN_DISCOVERY_SETTINGS_BINDINGS_H
#define AUDYN_DISCOVERY_SETTINGS_BINDINGS_H

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "discovery_settings.h"

namespace audyn {
namespace discovery {

inline void bind_discovery_settings(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<SapDiscoverySettings>(m, "SapDiscoverySettings")
        .def(py::init<>())
        .def_readwrite("bind_interface", &SapDiscoverySettings::bind_interface)
        .def_readwrite("multicast_addr", &SapDiscoverySettings::multicast_addr)
        .def_readwrite("port", &SapDiscoverySettings::port)
        .def_readwrite("stream_timeout_sec", &SapDiscoverySettings::stream_timeout_sec)
        .def_readwrite("sweep_interval_sec", &SapDiscoverySettings::sweep_interval_sec)
        .def_readwrite("poll_interval_ms", &SapDiscoverySettings::poll_interval_ms)
        .def_readwrite("receive_buffer_bytes", &SapDiscoverySettings::receive_buffer_bytes)
        .def_readwrite("join_admin_scope_with_global", &SapDiscoverySettings::join_admin_scope_with_global);

    py::class_<SapDiscoverySettingsUpdate>(m, "SapDiscoverySettingsUpdate")
        .def(py::init<>())
        .def_readwrite("bind_interface", &SapDiscoverySettingsUpdate::bind_interface)
        .def_readwrite("multicast_addr", &SapDiscoverySettingsUpdate::multicast_addr)
        .def_readwrite("port", &SapDiscoverySettingsUpdate::port)
        .def_readwrite("stream_timeout_sec", &SapDiscoverySettingsUpdate::stream_timeout_sec)
        .def_readwrite("sweep_interval_sec", &SapDiscoverySettingsUpdate::sweep_interval_sec)
        .def_readwrite("poll_interval_ms", &SapDiscoverySettingsUpdate::poll_interval_ms)
        .def_readwrite("receive_buffer_bytes", &SapDiscoverySettingsUpdate::receive_buffer_bytes)
        .def_readwrite("join_admin_scope_with_global", &SapDiscoverySettingsUpdate::join_admin_scope_with_global);

    m.def("sanitize_settings", &sanitize_settings, py::arg("settings"),
          "Replaces out-of-range values with their defaults.");
    m.def("apply_settings_update", &apply_settings_update, py::arg("current"), py::arg("update"),
          "Merges the set fields of an update into a copy of the current settings.");
}

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SETTINGS_BINDINGS_H
