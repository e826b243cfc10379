/* SPDX-License-Identifier: MIT */
/*
 * Netweave Veth
 * Virtual ethernet ends and the pair that owns them
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        // =============================================================================
        // Veth - one end of a pair; attached once it has been moved into a namespace
        // =============================================================================

        struct Veth {
            String name;
            boolean attached = false;

            Veth() = default;

            explicit Veth(String n) : name(std::move(n)) {}

            auto members() noexcept { return std::tie(name, attached); }
            auto members() const noexcept { return std::tie(name, attached); }
        };

        // =============================================================================
        // Veth Pair - created and destroyed as a unit
        // =============================================================================

        struct VethPair {
            String name;
            Veth left;
            Veth right;
            boolean active = false;

            VethPair() = default;

            explicit VethPair(const String &n) : name(n), left(n + VETH_LEFT_SUFFIX), right(n + VETH_RIGHT_SUFFIX) {}

            // "<left>@<right>", as ip(8) prints pairs
            [[nodiscard]] auto label() const -> String { return left.name + "@" + right.name; }

            auto create(exec::Host &host) -> VoidRes {
                if (active) {
                    String msg = label() + " is already created";
                    return result::err(err::precondition(msg.c_str()));
                }

                auto res = host.create_veth_pair(left.name, right.name);
                if (res.is_err()) {
                    return res;
                }

                active = true;
                echo::info("succeeded to create ", label().c_str());
                return result::ok();
            }

            // Deleting either end removes both, so only an end still in the root
            // namespace is deleted; with both ends moved away nothing is reachable
            auto destroy(exec::Host &host) -> VoidRes {
                if (!active) {
                    String msg = label() + " doesn't exist";
                    return result::err(err::precondition(msg.c_str()));
                }

                const Veth *target = nullptr;
                if (!left.attached) {
                    target = &left;
                } else if (!right.attached) {
                    target = &right;
                }

                if (target == nullptr) {
                    echo::info("veth-pair ", label().c_str(), " is invisible from host");
                    return result::ok();
                }

                auto res = host.delete_link(target->name);
                if (res.is_err()) {
                    return res;
                }

                active = false;
                echo::info("succeeded to delete ", label().c_str());
                return result::ok();
            }

            auto members() noexcept { return std::tie(name, left, right, active); }
            auto members() const noexcept { return std::tie(name, left, right, active); }
        };

        [[nodiscard]] inline auto init_veth_pair(const String &name, exec::Host &host) -> Res<VethPair> {
            VethPair pair(name);
            auto res = pair.create(host);
            if (res.is_err()) {
                return result::err(res.error());
            }
            return result::ok(std::move(pair));
        }

    } // namespace netdev

} // namespace netweave
