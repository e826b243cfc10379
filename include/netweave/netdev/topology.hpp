/* SPDX-License-Identifier: MIT */
/*
 * Netweave Topology Builder
 * Matches link names referenced by namespace rosters to links and wires them
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>
#include <netweave/netdev/bridge.hpp>
#include <netweave/netdev/direct_link.hpp>
#include <netweave/netdev/link.hpp>
#include <netweave/netdev/namespace.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        // =============================================================================
        // Link References
        // =============================================================================

        // Namespace indices referencing one link name; a namespace appears once per
        // roster entry naming the link
        struct LinkReference {
            String name;
            Vector<usize> namespaces;

            [[nodiscard]] auto degree() const -> usize { return namespaces.size(); }

            auto members() noexcept { return std::tie(name, namespaces); }
            auto members() const noexcept { return std::tie(name, namespaces); }
        };

        // Ordered by first appearance while walking namespaces and rosters in order
        [[nodiscard]] inline auto collect_link_references(const Vector<Namespace> &namespaces)
            -> Vector<LinkReference> {
            Vector<LinkReference> refs;
            Map<String, usize> index;

            for (usize i = 0; i < namespaces.size(); ++i) {
                for (const auto &dev : namespaces[i].registered_device_config) {
                    auto it = index.find(dev.name());
                    if (it == index.end()) {
                        LinkReference ref;
                        ref.name = dev.name();
                        ref.namespaces.push_back(i);
                        index[dev.name()] = refs.size();
                        refs.push_back(ref);
                    } else {
                        refs[it->second].namespaces.push_back(i);
                    }
                }
            }

            return refs;
        }

        // =============================================================================
        // Validation
        // =============================================================================

        [[nodiscard]] inline auto check_link_reference(const LinkReference &ref, const Vector<Namespace> &namespaces,
                                                       Vector<DirectLink> &links, Vector<Bridge> &bridges)
            -> VoidRes {
            if (ref.degree() == 1) {
                String msg = ref.name + " has only 1 link in " + namespaces[ref.namespaces[0]].name;
                return result::err(err::config(msg.c_str()));
            }

            if (detail::find_link(links, ref.name) != nullptr) {
                if (ref.degree() > 2) {
                    String msg = ref.name + " has " + to_str(static_cast<u64>(ref.degree())) +
                                 " links despite over 2 is not supported for direct links";
                    return result::err(err::config(msg.c_str()));
                }
                return result::ok();
            }

            if (detail::find_link(bridges, ref.name) != nullptr) {
                return result::ok();
            }

            String msg = String("can't find device ") + ref.name + " in configured links";
            return result::err(err::not_found(msg.c_str()));
        }

        // =============================================================================
        // Build
        // =============================================================================

        // Every reference is checked before the first wire call; wiring then stops
        // at the first failure
        [[nodiscard]] inline auto build_topology(Vector<Namespace> &namespaces, Vector<DirectLink> &links,
                                                 Vector<Bridge> &bridges, exec::Host &host) -> VoidRes {
            auto refs = collect_link_references(namespaces);

            for (const auto &ref : refs) {
                auto res = check_link_reference(ref, namespaces, links, bridges);
                if (res.is_err()) {
                    return res;
                }
            }

            for (const auto &ref : refs) {
                VoidRes res = result::ok();

                auto *link = detail::find_link(links, ref.name);
                if (link != nullptr) {
                    res = link->wire(namespaces[ref.namespaces[0]], namespaces[ref.namespaces[1]], host);
                } else {
                    auto *bridge = detail::find_link(bridges, ref.name);
                    Vector<Namespace *> members;
                    for (auto idx : ref.namespaces) {
                        members.push_back(&namespaces[idx]);
                    }
                    res = bridge->wire(members, host);
                }

                if (res.is_err()) {
                    return result::err(err::context(String("failed to create links ") + ref.name, res.error()));
                }

                echo::info("wired ", ref.name.c_str(), " across ", ref.degree(), " namespaces");
            }

            return result::ok();
        }

    } // namespace netdev

} // namespace netweave
