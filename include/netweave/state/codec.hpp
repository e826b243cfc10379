/* SPDX-License-Identifier: MIT */
/*
 * Netweave State Codec
 * nlohmann::json conversions for everything persisted in the state file
 */

#pragma once

#include <datapod/datapod.hpp>
#include <netweave/cfg/config.hpp>
#include <netweave/core/types.hpp>
#include <netweave/netdev/bridge.hpp>
#include <netweave/netdev/direct_link.hpp>
#include <netweave/netdev/namespace.hpp>
#include <netweave/netdev/veth.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace netweave {

    using namespace dp;

    namespace state {
        namespace detail {

            inline auto to_json_str(const String &s) -> std::string { return std::string(s.c_str()); }

            // Throws nlohmann::json::exception on missing keys or wrong types
            inline auto get_str(const nlohmann::json &j, const char *key) -> String {
                return String(j.at(key).get<std::string>().c_str());
            }

            template <typename T> auto vector_to_json(const Vector<T> &items) -> nlohmann::json {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &item : items) {
                    arr.push_back(nlohmann::json(item));
                }
                return arr;
            }

            // null is accepted as an empty list
            template <typename T> auto vector_from_json(const nlohmann::json &j, const char *key) -> Vector<T> {
                Vector<T> items;
                const auto &arr = j.at(key);
                if (arr.is_null()) {
                    return items;
                }
                for (const auto &elem : arr) {
                    items.push_back(elem.get<T>());
                }
                return items;
            }

        } // namespace detail
    } // namespace state

    // =============================================================================
    // Configuration entries
    // =============================================================================

    inline void to_json(nlohmann::json &j, const DeviceConfig &dc) {
        j = nlohmann::json{{"name", state::detail::to_json_str(dc.name)}, {"cidr", state::detail::to_json_str(dc.cidr)}};
    }

    inline void from_json(const nlohmann::json &j, DeviceConfig &dc) {
        dc.name = state::detail::get_str(j, "name");
        dc.cidr = state::detail::get_str(j, "cidr");
    }

    namespace netdev {

        // =============================================================================
        // Links
        // =============================================================================

        inline void to_json(nlohmann::json &j, const Veth &v) {
            j = nlohmann::json{{"name", state::detail::to_json_str(v.name)}, {"attached", v.attached}};
        }

        inline void from_json(const nlohmann::json &j, Veth &v) {
            v.name = state::detail::get_str(j, "name");
            v.attached = j.at("attached").get<bool>();
        }

        inline void to_json(nlohmann::json &j, const VethPair &p) {
            j = nlohmann::json{{"name", state::detail::to_json_str(p.name)},
                               {"veth_left", nlohmann::json(p.left)},
                               {"veth_right", nlohmann::json(p.right)},
                               {"is_active", p.active}};
        }

        inline void from_json(const nlohmann::json &j, VethPair &p) {
            p.name = state::detail::get_str(j, "name");
            p.left = j.at("veth_left").get<Veth>();
            p.right = j.at("veth_right").get<Veth>();
            p.active = j.at("is_active").get<bool>();
        }

        inline void to_json(nlohmann::json &j, const DirectLink &d) {
            j = nlohmann::json{{"name", state::detail::to_json_str(d.name)},
                               {"veth_pair", nlohmann::json(d.veth_pair)},
                               {"busy", d.busy}};
        }

        inline void from_json(const nlohmann::json &j, DirectLink &d) {
            d.name = state::detail::get_str(j, "name");
            d.veth_pair = j.at("veth_pair").get<VethPair>();
            d.busy = j.at("busy").get<bool>();
        }

        inline void to_json(nlohmann::json &j, const Bridge &b) {
            j = nlohmann::json{{"name", state::detail::to_json_str(b.name)},
                               {"is_active", b.active},
                               {"ports", state::detail::vector_to_json(b.ports)},
                               {"busy", b.busy}};
        }

        inline void from_json(const nlohmann::json &j, Bridge &b) {
            b.name = state::detail::get_str(j, "name");
            b.active = j.at("is_active").get<bool>();
            b.ports = state::detail::vector_from_json<VethPair>(j, "ports");
            b.busy = j.at("busy").get<bool>();
        }

        // =============================================================================
        // Namespaces
        // =============================================================================

        inline void to_json(nlohmann::json &j, const RegisteredDeviceConfig &r) {
            j = nlohmann::json{{"device_config", nlohmann::json(r.device_config)}, {"configured", r.configured}};
        }

        inline void from_json(const nlohmann::json &j, RegisteredDeviceConfig &r) {
            r.device_config = j.at("device_config").get<DeviceConfig>();
            r.configured = j.at("configured").get<bool>();
        }

        inline void to_json(nlohmann::json &j, const Namespace &n) {
            j = nlohmann::json{{"name", state::detail::to_json_str(n.name)},
                               {"is_active", n.active},
                               {"registered_device_config", state::detail::vector_to_json(n.registered_device_config)}};
        }

        inline void from_json(const nlohmann::json &j, Namespace &n) {
            n.name = state::detail::get_str(j, "name");
            n.active = j.at("is_active").get<bool>();
            n.registered_device_config = state::detail::vector_from_json<RegisteredDeviceConfig>(j, "registered_device_config");
        }

    } // namespace netdev

} // namespace netweave
