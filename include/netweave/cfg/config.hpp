/* SPDX-License-Identifier: MIT */
/*
 * Netweave Configuration
 * Declarative topology description using datapod types
 */

#pragma once

#include <echo/echo.hpp>
#include <datapod/datapod.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>

namespace netweave {

    using namespace dp;

    // =============================================================================
    // Link Config - A named link and how it is realised on the host
    // =============================================================================

    struct LinkConfig {
        String name;
        LinkMode mode = LinkMode::DirectLink;

        LinkConfig() = default;

        LinkConfig(String n, LinkMode m) : name(std::move(n)), mode(m) {}

        [[nodiscard]] auto is_direct_link() const -> boolean { return mode == LinkMode::DirectLink; }
        [[nodiscard]] auto is_bridge() const -> boolean { return mode == LinkMode::Bridge; }

        auto members() noexcept { return std::tie(name, mode); }
        auto members() const noexcept { return std::tie(name, mode); }
    };

    // =============================================================================
    // Device Config - Name prefix of a link end and the address it receives
    // =============================================================================

    struct DeviceConfig {
        String name; // link name; matched as a prefix of veth names
        String cidr; // e.g. "10.0.0.1/24"

        DeviceConfig() = default;

        DeviceConfig(String n, String c) : name(std::move(n)), cidr(std::move(c)) {}

        auto members() noexcept { return std::tie(name, cidr); }
        auto members() const noexcept { return std::tie(name, cidr); }
    };

    // =============================================================================
    // Namespace Config
    // =============================================================================

    struct NamespaceConfig {
        String name;
        Vector<DeviceConfig> devices;

        auto members() noexcept { return std::tie(name, devices); }
        auto members() const noexcept { return std::tie(name, devices); }
    };

    // =============================================================================
    // Logging Config
    // =============================================================================

    struct LoggingConfig {
        String level{"info"};

        [[nodiscard]] auto get_log_level() const -> echo::Level {
            if (level == "trace")
                return echo::Level::Trace;
            if (level == "debug")
                return echo::Level::Debug;
            if (level == "info")
                return echo::Level::Info;
            if (level == "warn")
                return echo::Level::Warn;
            if (level == "error")
                return echo::Level::Error;
            if (level == "critical")
                return echo::Level::Critical;
            return echo::Level::Info;
        }

        auto members() noexcept { return std::tie(level); }
        auto members() const noexcept { return std::tie(level); }
    };

    // =============================================================================
    // Main Config - Complete topology description
    // =============================================================================

    struct Config {
        u32 version = 1;
        Vector<LinkConfig> links;
        Vector<NamespaceConfig> namespaces;
        LoggingConfig logging;

        auto members() noexcept { return std::tie(version, links, namespaces, logging); }
        auto members() const noexcept { return std::tie(version, links, namespaces, logging); }
    };

    // =============================================================================
    // Config Validation
    // =============================================================================

    namespace cfg {

        namespace detail {

            // Usable both as an interface name and as a file name under /var/run/netns
            inline auto is_valid_name(const String &name) -> boolean {
                if (name.empty() || name == "." || name == "..") {
                    return false;
                }
                for (usize i = 0; i < name.size(); ++i) {
                    char c = name[i];
                    boolean ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                                 c == '-' || c == '_' || c == '.';
                    if (!ok) {
                        return false;
                    }
                }
                return true;
            }

        } // namespace detail

        [[nodiscard]] inline auto validate_link(const LinkConfig &link) -> VoidRes {
            if (link.name.empty()) {
                return result::err(err::config("Link name is required"));
            }

            if (!detail::is_valid_name(link.name)) {
                String msg = String("Link name ") + link.name + " may only contain letters, digits, '-', '_' and '.'";
                return result::err(err::config(msg.c_str()));
            }

            usize limit = link.is_bridge() ? MAX_BRIDGE_NAME_LEN : MAX_DIRECT_LINK_NAME_LEN;
            if (link.name.size() > limit) {
                String msg = String("Link name ") + link.name + " is too long for mode " +
                             link_mode_to_string(link.mode) + " (max " + to_str(static_cast<u64>(limit)) +
                             " characters)";
                return result::err(err::config(msg.c_str()));
            }

            return result::ok();
        }

        [[nodiscard]] inline auto validate_namespace(const NamespaceConfig &ns) -> VoidRes {
            if (ns.name.empty()) {
                return result::err(err::config("Namespace name is required"));
            }

            if (!detail::is_valid_name(ns.name)) {
                String msg = String("Namespace name ") + ns.name +
                             " may only contain letters, digits, '-', '_' and '.'";
                return result::err(err::config(msg.c_str()));
            }

            for (const auto &dev : ns.devices) {
                if (dev.name.empty()) {
                    String msg = String("Namespace ") + ns.name + " has a device without a name";
                    return result::err(err::config(msg.c_str()));
                }
                if (!detail::is_valid_name(dev.name)) {
                    String msg = String("Namespace ") + ns.name + " device name " + dev.name + " is invalid";
                    return result::err(err::config(msg.c_str()));
                }
                if (dev.cidr.empty()) {
                    String msg = String("Namespace ") + ns.name + " device " + dev.name + " has no cidr";
                    return result::err(err::config(msg.c_str()));
                }
            }

            return result::ok();
        }

        // Structural checks only; subnets are parsed when a device is attached
        [[nodiscard]] inline auto validate(const Config &config) -> VoidRes {
            if (config.version != 1) {
                return result::err(err::config("Unsupported config version"));
            }

            Map<String, boolean> seen_links;
            for (const auto &link : config.links) {
                auto res = validate_link(link);
                if (res.is_err()) {
                    return res;
                }
                if (seen_links.find(link.name) != seen_links.end()) {
                    String msg = String("Duplicate link name ") + link.name;
                    return result::err(err::config(msg.c_str()));
                }
                seen_links[link.name] = true;
            }

            // Devices are matched to roster entries by name prefix, and bridge ports
            // are named "<bridge><index>", so no link name may prefix another
            for (usize i = 0; i < config.links.size(); ++i) {
                for (usize j = 0; j < config.links.size(); ++j) {
                    const auto &shorter = config.links[i].name;
                    const auto &longer = config.links[j].name;
                    if (i != j && has_prefix(longer, shorter)) {
                        String msg = String("Link name ") + shorter + " is a prefix of link name " + longer;
                        return result::err(err::config(msg.c_str()));
                    }
                }
            }

            Map<String, boolean> seen_namespaces;
            for (const auto &ns : config.namespaces) {
                auto res = validate_namespace(ns);
                if (res.is_err()) {
                    return res;
                }
                if (seen_namespaces.find(ns.name) != seen_namespaces.end()) {
                    String msg = String("Duplicate namespace name ") + ns.name;
                    return result::err(err::config(msg.c_str()));
                }
                seen_namespaces[ns.name] = true;
            }

            return result::ok();
        }

        [[nodiscard]] inline auto default_config() -> Config {
            Config config;
            config.version = 1;
            config.logging.level = "info";
            return config;
        }

    } // namespace cfg

} // namespace netweave
