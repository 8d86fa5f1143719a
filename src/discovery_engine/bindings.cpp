/**
 * @file bindings.cpp
 * @brief Defines the Python module for the Audyn SAP/SDP discovery engine.
 * @details Binding functions are declared next to the components they expose and
 *          called here in dependency order: logger, settings, plain types, listener.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "configuration/discovery_settings_bindings.h"
#include "sap/sap_bindings.h"
#include "utils/cpp_logger_bindings.h"

namespace py = pybind11;
using namespace audyn;

PYBIND11_MODULE(audyn_discovery_engine, m) {
    m.doc() = "Audyn SAP/SDP stream discovery engine";

    // 1. Logger has no dependencies on other bound types
    discovery::logging::bind_logger(m);

    // 2. Settings are used by the SapListener constructor
    discovery::bind_discovery_settings(m);

    // 3. Descriptors, events, statistics and the pure helpers
    discovery::bind_sap_types(m);

    // 4. The listener itself
    discovery::bind_sap_listener(m);
}
