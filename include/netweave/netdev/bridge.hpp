/* SPDX-License-Identifier: MIT */
/*
 * Netweave Bridge
 * Fan-out link: a bridge device with one veth port per attached namespace
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/cfg/config.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>
#include <netweave/netdev/link.hpp>
#include <netweave/netdev/namespace.hpp>
#include <netweave/netdev/veth.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        // Port i is the veth pair "<name><i>": its left end is attached to a
        // namespace, its right end is enslaved to the bridge device "<name>".
        struct Bridge {
            String name;
            boolean active = false; // bridge device exists
            Vector<VethPair> ports;
            boolean busy = false; // every port wired

            Bridge() = default;

            [[nodiscard]] static auto init(const LinkConfig &config, exec::Host &host) -> Res<Bridge> {
                if (!config.is_bridge()) {
                    String msg = String("invalid mode ") + link_mode_to_string(config.mode) + " for bridge " +
                                 config.name;
                    return result::err(err::config(msg.c_str()));
                }

                auto res = host.create_bridge(config.name);
                if (res.is_err()) {
                    return result::err(res.error());
                }

                Bridge bridge;
                bridge.name = config.name;
                bridge.active = true;
                echo::info("succeeded to create bridge ", config.name.c_str());
                return result::ok(std::move(bridge));
            }

            // True while the bridge device or any of its ports is still on the host
            [[nodiscard]] auto exists() const -> boolean {
                if (active) {
                    return true;
                }
                for (const auto &port : ports) {
                    if (port.active) {
                        return true;
                    }
                }
                return false;
            }

            [[nodiscard]] auto port_name(usize index) const -> String { return name + to_str(static_cast<u64>(index)); }

            // One port per namespace, in order. A failure leaves earlier ports wired.
            auto wire(const Vector<Namespace *> &namespaces, exec::Host &host) -> VoidRes {
                if (busy) {
                    String msg = name + " has been already busy";
                    return result::err(err::precondition(msg.c_str()));
                }
                if (!active) {
                    String msg = String("bridge ") + name + " doesn't exist";
                    return result::err(err::precondition(msg.c_str()));
                }
                if (namespaces.size() < 2) {
                    String msg = String("bridge ") + name + " needs at least 2 namespaces";
                    return result::err(err::config(msg.c_str()));
                }
                if (ports.size() + namespaces.size() > MAX_BRIDGE_PORTS) {
                    String msg = String("bridge ") + name + " has too many ports";
                    return result::err(err::config(msg.c_str()));
                }

                for (auto *ns : namespaces) {
                    auto pair = init_veth_pair(port_name(ports.size()), host);
                    if (pair.is_err()) {
                        return result::err(pair.error());
                    }
                    ports.push_back(std::move(pair.value()));
                    auto &port = ports[ports.size() - 1];

                    auto res = host.attach_to_bridge(port.right.name, name);
                    if (res.is_err()) {
                        return res;
                    }

                    res = ns->attach(port.left, host);
                    if (res.is_err()) {
                        return res;
                    }
                }

                busy = true;
                return result::ok();
            }

            auto destroy(exec::Host &host) -> VoidRes {
                if (!busy) {
                    String msg = name + " is not busy";
                    return result::err(err::precondition(msg.c_str()));
                }
                return release(host);
            }

            // Removes every live port, then the bridge device
            auto release(exec::Host &host) -> VoidRes {
                ErrorList errors;
                for (auto &port : ports) {
                    if (port.active) {
                        errors.append(port.destroy(host));
                    }
                }

                if (active) {
                    auto res = host.delete_link(name);
                    if (res.is_ok()) {
                        active = false;
                        echo::info("succeeded to delete bridge ", name.c_str());
                    }
                    errors.append(res);
                }

                return errors.to_result();
            }

            auto members() noexcept { return std::tie(name, active, ports, busy); }
            auto members() const noexcept { return std::tie(name, active, ports, busy); }
        };

        [[nodiscard]] inline auto init_bridges(const Vector<LinkConfig> &configs, exec::Host &host) -> Vector<Bridge> {
            return detail::init_links<Bridge>(configs, LinkMode::Bridge, host);
        }

        [[nodiscard]] inline auto cleanup_bridges(Vector<Bridge> &bridges, exec::Host &host) -> VoidRes {
            return detail::cleanup_links(bridges, host);
        }

    } // namespace netdev

} // namespace netweave
