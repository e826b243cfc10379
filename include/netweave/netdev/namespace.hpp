/* SPDX-License-Identifier: MIT */
/*
 * Netweave Namespace
 * Network namespace with its roster of expected devices
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/cfg/config.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>
#include <netweave/netdev/cidr.hpp>
#include <netweave/netdev/veth.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        // =============================================================================
        // Registered Device Config - roster entry, configured at most once
        // =============================================================================

        struct RegisteredDeviceConfig {
            DeviceConfig device_config;
            boolean configured = false;

            RegisteredDeviceConfig() = default;

            explicit RegisteredDeviceConfig(DeviceConfig dc) : device_config(std::move(dc)) {}

            [[nodiscard]] auto name() const -> const String & { return device_config.name; }
            [[nodiscard]] auto cidr() const -> const String & { return device_config.cidr; }

            auto members() noexcept { return std::tie(device_config, configured); }
            auto members() const noexcept { return std::tie(device_config, configured); }
        };

        // =============================================================================
        // Namespace
        // =============================================================================

        struct Namespace {
            String name;
            boolean active = false;
            Vector<RegisteredDeviceConfig> registered_device_config;

            Namespace() = default;

            [[nodiscard]] auto configured_count() const -> usize {
                usize n = 0;
                for (const auto &dev : registered_device_config) {
                    if (dev.configured) {
                        ++n;
                    }
                }
                return n;
            }

            auto destroy(exec::Host &host) -> VoidRes {
                if (!active) {
                    String msg = name + " is already inactive";
                    return result::err(err::precondition(msg.c_str()));
                }

                auto res = host.delete_netns(name);
                if (res.is_err()) {
                    return res;
                }

                active = false;
                echo::info("succeeded to delete ns ", name.c_str());
                return result::ok();
            }

            // Moves `veth` in and addresses it using the first roster entry whose
            // name prefixes the veth name. No matching entry is not an error.
            auto attach(Veth &veth, exec::Host &host) -> VoidRes {
                if (veth.attached) {
                    String msg = String("device ") + veth.name + " is already attached";
                    return result::err(err::precondition(msg.c_str()));
                }

                for (auto &dev : registered_device_config) {
                    if (!has_prefix(veth.name, dev.name())) {
                        continue;
                    }

                    if (dev.configured) {
                        String msg = String("device ") + dev.name() + " has been attached to namespace " + name;
                        return result::err(err::precondition(msg.c_str()));
                    }

                    auto cidr = parse_cidr(dev.cidr());
                    if (cidr.is_err()) {
                        String what = String("failed to parse CIDR ") + dev.cidr() + " in namespace " + name +
                                      " device " + dev.name();
                        return result::err(err::context(what, cidr.error()));
                    }

                    auto moved = host.move_to_netns(veth.name, name);
                    if (moved.is_err()) {
                        String what = String("failed to set device ") + dev.name() + " in namespace " + name;
                        return result::err(err::context(what, moved.error()));
                    }

                    auto assigned = host.assign_cidr(veth.name, name, dev.cidr());
                    if (assigned.is_err()) {
                        String what = String("failed to assign CIDR ") + dev.cidr() + " to ns " + name + " on " +
                                      veth.name;
                        return result::err(err::context(what, assigned.error()));
                    }

                    echo::info("succeeded to attach CIDR ", dev.cidr().c_str(), " to dev ", veth.name.c_str(),
                               " on ns ", name.c_str());

                    dev.configured = true;
                    veth.attached = true;
                    break;
                }

                return result::ok();
            }

            auto members() noexcept { return std::tie(name, active, registered_device_config); }
            auto members() const noexcept { return std::tie(name, active, registered_device_config); }
        };

        // =============================================================================
        // Construction / Teardown
        // =============================================================================

        [[nodiscard]] inline auto init_namespace(const NamespaceConfig &config, exec::Host &host) -> Res<Namespace> {
            Namespace ns;
            ns.name = config.name;
            for (const auto &dev : config.devices) {
                ns.registered_device_config.push_back(RegisteredDeviceConfig(dev));
            }

            auto res = host.add_netns(config.name);
            if (res.is_err()) {
                return result::err(res.error());
            }

            ns.active = true;
            echo::info("succeeded to create ns ", config.name.c_str());
            return result::ok(std::move(ns));
        }

        // Namespaces are mandatory: stops at the first failure. `created` keeps
        // whatever was built so the caller can tear it down.
        [[nodiscard]] inline auto init_namespaces(const Vector<NamespaceConfig> &configs, exec::Host &host,
                                                  Vector<Namespace> &created) -> VoidRes {
            for (const auto &config : configs) {
                auto ns = init_namespace(config, host);
                if (ns.is_err()) {
                    return result::err(ns.error());
                }
                created.push_back(std::move(ns.value()));
            }
            return result::ok();
        }

        // Attempts every active namespace; failures are combined
        [[nodiscard]] inline auto cleanup_namespaces(Vector<Namespace> &namespaces, exec::Host &host) -> VoidRes {
            ErrorList errors;
            for (auto &ns : namespaces) {
                if (!ns.active) {
                    echo::debug("ns ", ns.name.c_str(), " is already removed");
                    continue;
                }
                errors.append(ns.destroy(host));
            }
            return errors.to_result();
        }

    } // namespace netdev

} // namespace netweave
