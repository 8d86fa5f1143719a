/**
 * @file sap_bindings.h
 * @brief pybind11 bindings for the SAP/SDP discovery types, helpers and listener.
 */
#ifndef AUDYN_DISCOVERY_SAP_BINDINGS_H
#define AUDYN_DISCOVERY_SAP_BINDINGS_H

#include <memory>
#include <stdexcept>
#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/stl.h>

#include "sap_listener.h"
#include "sap_packet.h"
#include "sap_types.h"
#include "sdp_builder.h"
#include "sdp_parser.h"
#include "st2110_attributes.h"

namespace audyn {
namespace discovery {

/**
 * @brief Binds the plain data types and the pure codec/parser helpers.
 */
inline void bind_sap_types(pybind11::module_ &m) {
    namespace py = pybind11;

    m.attr("SAP_ADDR_GLOBAL") = kSapAddrGlobal;
    m.attr("SAP_ADDR_ADMIN") = kSapAddrAdmin;
    m.attr("SAP_PORT") = kSapPort;

    py::enum_<DiscoveryEvent>(m, "DiscoveryEvent")
        .value("NEW", DiscoveryEvent::NEW)
        .value("UPDATE", DiscoveryEvent::UPDATE)
        .value("DELETE", DiscoveryEvent::DELETE)
        .value("EXPIRE", DiscoveryEvent::EXPIRE);

    py::enum_<SapDecodeStatus>(m, "SapDecodeStatus")
        .value("OK", SapDecodeStatus::OK)
        .value("TOO_SHORT", SapDecodeStatus::TOO_SHORT)
        .value("UNSUPPORTED_VERSION", SapDecodeStatus::UNSUPPORTED_VERSION)
        .value("UNSUPPORTED", SapDecodeStatus::UNSUPPORTED)
        .value("TRUNCATED", SapDecodeStatus::TRUNCATED);

    py::class_<StreamDescriptor>(m, "StreamDescriptor")
        .def(py::init<>())
        .def_readwrite("session_name", &StreamDescriptor::session_name)
        .def_readwrite("session_id", &StreamDescriptor::session_id)
        .def_readwrite("session_version", &StreamDescriptor::session_version)
        .def_readwrite("origin_addr", &StreamDescriptor::origin_addr)
        .def_readwrite("session_info", &StreamDescriptor::session_info)
        .def_readwrite("multicast_addr", &StreamDescriptor::multicast_addr)
        .def_readwrite("ttl", &StreamDescriptor::ttl)
        .def_readwrite("port", &StreamDescriptor::port)
        .def_readwrite("payload_type", &StreamDescriptor::payload_type)
        .def_readwrite("encoding", &StreamDescriptor::encoding)
        .def_readwrite("sample_rate", &StreamDescriptor::sample_rate)
        .def_readwrite("channels", &StreamDescriptor::channels)
        .def_readwrite("ptime_ms", &StreamDescriptor::ptime_ms)
        .def_readwrite("samples_per_packet", &StreamDescriptor::samples_per_packet)
        .def_readwrite("source_addr", &StreamDescriptor::source_addr)
        .def_readwrite("is_ssm", &StreamDescriptor::is_ssm)
        .def_readwrite("channel_labels", &StreamDescriptor::channel_labels)
        .def_readwrite("channel_order_raw", &StreamDescriptor::channel_order_raw)
        .def_readwrite("mediaclk", &StreamDescriptor::mediaclk)
        .def_readwrite("mediaclk_offset", &StreamDescriptor::mediaclk_offset)
        .def_readwrite("is_st2110_compliant", &StreamDescriptor::is_st2110_compliant)
        .def_readwrite("ts_refclk", &StreamDescriptor::ts_refclk)
        .def_readwrite("ptp_grandmaster", &StreamDescriptor::ptp_grandmaster)
        .def_readwrite("ptp_domain", &StreamDescriptor::ptp_domain)
        .def_readwrite("conformance_level", &StreamDescriptor::conformance_level)
        .def_readwrite("raw_sdp", &StreamDescriptor::raw_sdp)
        .def_property_readonly("bit_depth", [](const StreamDescriptor& sdp) { return encoding_bit_depth(sdp.encoding); })
        .def("__repr__", [](const StreamDescriptor& sdp) { return "<StreamDescriptor " + describe_stream(sdp) + ">"; });

    py::class_<DiscoveredStream>(m, "DiscoveredStream")
        .def_readonly("id", &DiscoveredStream::id)
        .def_readonly("sdp", &DiscoveredStream::sdp)
        .def_readonly("origin_ip", &DiscoveredStream::origin_ip)
        .def_readonly("first_seen", &DiscoveredStream::first_seen)
        .def_readonly("last_seen", &DiscoveredStream::last_seen)
        .def_readonly("active", &DiscoveredStream::active);

    py::class_<DiscoveryStatistics>(m, "DiscoveryStatistics")
        .def_readonly("packets_received", &DiscoveryStatistics::packets_received)
        .def_readonly("packets_invalid", &DiscoveryStatistics::packets_invalid)
        .def_readonly("announcements", &DiscoveryStatistics::announcements)
        .def_readonly("deletions", &DiscoveryStatistics::deletions)
        .def_readonly("sdp_parse_errors", &DiscoveryStatistics::sdp_parse_errors)
        .def_readonly("active_streams", &DiscoveryStatistics::active_streams);

    py::class_<SapPacket>(m, "SapPacket")
        .def_readonly("version", &SapPacket::version)
        .def_readonly("is_ipv6", &SapPacket::is_ipv6)
        .def_readonly("is_deletion", &SapPacket::is_deletion)
        .def_readonly("is_encrypted", &SapPacket::is_encrypted)
        .def_readonly("is_compressed", &SapPacket::is_compressed)
        .def_readonly("msg_id_hash", &SapPacket::msg_id_hash)
        .def_readonly("origin", &SapPacket::origin)
        .def_readonly("mime_type", &SapPacket::mime_type)
        .def_readonly("payload", &SapPacket::payload)
        .def_property_readonly("stream_id", &SapPacket::stream_id);

    py::class_<SdpBuildOptions>(m, "SdpBuildOptions")
        .def(py::init<>())
        .def_readwrite("session_name", &SdpBuildOptions::session_name)
        .def_readwrite("session_info", &SdpBuildOptions::session_info)
        .def_readwrite("multicast_addr", &SdpBuildOptions::multicast_addr)
        .def_readwrite("port", &SdpBuildOptions::port)
        .def_readwrite("sample_rate", &SdpBuildOptions::sample_rate)
        .def_readwrite("channels", &SdpBuildOptions::channels)
        .def_readwrite("encoding", &SdpBuildOptions::encoding)
        .def_readwrite("ptime_ms", &SdpBuildOptions::ptime_ms)
        .def_readwrite("origin_ip", &SdpBuildOptions::origin_ip)
        .def_readwrite("session_id", &SdpBuildOptions::session_id)
        .def_readwrite("payload_type", &SdpBuildOptions::payload_type)
        .def_readwrite("ptp_grandmaster", &SdpBuildOptions::ptp_grandmaster)
        .def_readwrite("ptp_domain", &SdpBuildOptions::ptp_domain)
        .def_readwrite("channel_config", &SdpBuildOptions::channel_config);

    m.def("parse_sdp", &parse_sdp, py::arg("sdp_text"),
          "Parses an SDP document. Returns a StreamDescriptor or None when the connection address or port is missing.");
    m.def("expand_channel_order", &expand_channel_order, py::arg("channel_order"),
          "Expands a SMPTE2110 channel-order value into per-channel labels.");
    m.def("conformance_level", &conformance_level,
          py::arg("channels"), py::arg("ptime_ms"), py::arg("sample_rate"),
          "ST 2110-30 conformance level (A, B, C, AX, BX, CX) or an empty string.");
    m.def("build_sdp", &build_sdp, py::arg("options"), "Builds an ST 2110-30 SDP document.");

    m.def("decode_sap_packet", [](py::bytes data, const std::string& sender_ip) {
            const std::string buffer = data;
            SapPacket packet;
            const SapDecodeStatus status = decode_sap_packet(
                reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size(), sender_ip, packet);
            return py::make_tuple(status, packet);
        },
        py::arg("data"), py::arg("sender_ip") = "",
        "Decodes a SAP datagram. Returns a (SapDecodeStatus, SapPacket) tuple.");

    m.def("encode_sap_announcement", [](const std::string& sdp, const std::string& origin_ip,
                                        uint16_t msg_id_hash, bool deletion) -> py::bytes {
            std::vector<uint8_t> packet = encode_sap_packet(sdp, origin_ip, msg_id_hash, deletion);
            return py::bytes(reinterpret_cast<const char*>(packet.data()), packet.size());
        },
        py::arg("sdp"), py::arg("origin_ip"), py::arg("msg_id_hash"), py::arg("deletion") = false,
        "Encodes an IPv4 SAP announcement (or deletion) carrying the SDP text.");
}

/**
 * @brief Binds SapListener.
 * @details Python callbacks are invoked from the receive thread; the GIL is taken
 *          around each call and Python errors are turned into std::runtime_error so
 *          the listener logs them like any other subscriber failure.
 */
inline void bind_sap_listener(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<SapListener>(m, "SapListener", "Listens for SAP announcements and tracks discovered streams")
        .def(py::init<SapDiscoverySettings>(), py::arg("settings") = SapDiscoverySettings())
        .def("start", py::overload_cast<>(&SapListener::start), py::call_guard<py::gil_scoped_release>(),
             "Opens the socket and starts the receive and expiry threads. Raises RuntimeError on failure.")
        .def("start", py::overload_cast<const std::string&, const std::string&>(&SapListener::start),
             py::arg("bind_interface"), py::arg("multicast_addr") = std::string(kSapAddrAdmin),
             py::call_guard<py::gil_scoped_release>(),
             "Starts on the given interface (empty for any) and SAP group.")
        .def("stop", &SapListener::stop, py::call_guard<py::gil_scoped_release>(),
             "Stops the listener and closes the socket.")
        .def("is_running", &SapListener::is_running)
        .def("get_streams", &SapListener::get_streams, py::arg("active_only") = true,
             py::call_guard<py::gil_scoped_release>())
        .def("get_stats", &SapListener::get_stats, py::call_guard<py::gil_scoped_release>())
        .def("find_stream", &SapListener::find_stream, py::arg("multicast_addr"), py::arg("port") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("find_by_name", &SapListener::find_by_name, py::arg("session_name"),
             py::call_guard<py::gil_scoped_release>())
        .def("cleanup_now", &SapListener::cleanup_now, py::call_guard<py::gil_scoped_release>())
        .def("last_error", &SapListener::last_error)
        .def_property_readonly("settings", &SapListener::settings)
        .def("handle_datagram", [](SapListener& self, py::bytes data, const std::string& sender_ip) {
                const std::string buffer = data;
                py::gil_scoped_release release;
                self.handle_datagram(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size(),
                                     sender_ip, Clock::now());
            },
            py::arg("data"), py::arg("sender_ip"),
            "Processes one SAP datagram as if it had been received on the socket.")
        .def("add_callback", [](SapListener& self, py::function fn) {
                // The function is only touched with the GIL held, including when the last copy goes away.
                std::shared_ptr<py::function> holder(new py::function(std::move(fn)), [](py::function* f) {
                    py::gil_scoped_acquire gil;
                    delete f;
                });
                return self.add_callback([holder](DiscoveryEvent event, const DiscoveredStream& stream) {
                    py::gil_scoped_acquire gil;
                    try {
                        (*holder)(event, py::cast(stream));
                    } catch (py::error_already_set& e) {
                        throw std::runtime_error(e.what());
                    }
                });
            },
            py::arg("callback"),
            "Registers callback(event, stream). Returns a listener id.")
        .def("remove_callback", &SapListener::remove_callback, py::arg("listener_id"));
}

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_BINDINGS_H
