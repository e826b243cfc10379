/* SPDX-License-Identifier: MIT */
/*
 * Netweave Direct Link
 * Point-to-point link: one veth pair between exactly two namespaces
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

        struct DirectLink {
            String name;
            VethPair veth_pair;
            boolean busy = false; // both ends wired into namespaces

            DirectLink() = default;

            [[nodiscard]] static auto init(const LinkConfig &config, exec::Host &host) -> Res<DirectLink> {
                if (!config.is_direct_link()) {
                    String msg = String("invalid mode ") + link_mode_to_string(config.mode) + " for direct link " +
                                 config.name;
                    return result::err(err::config(msg.c_str()));
                }

                auto pair = init_veth_pair(config.name, host);
                if (pair.is_err()) {
                    return result::err(pair.error());
                }

                DirectLink link;
                link.name = config.name;
                link.veth_pair = std::move(pair.value());
                link.busy = false;
                return result::ok(std::move(link));
            }

            // Left end goes into `left`, then right end into `right`. If the second
            // attach fails the first is not undone and the link stays not busy.
            auto wire(Namespace &left, Namespace &right, exec::Host &host) -> VoidRes {
                if (busy) {
                    String msg = name + " has been already busy";
                    return result::err(err::precondition(msg.c_str()));
                }

                auto res = left.attach(veth_pair.left, host);
                if (res.is_err()) {
                    return res;
                }

                res = right.attach(veth_pair.right, host);
                if (res.is_err()) {
                    echo::warn("direct link ", name.c_str(), " is half-wired: ", veth_pair.left.name.c_str(),
                               " remains in ns ", left.name.c_str());
                    return res;
                }

                busy = true;
                return result::ok();
            }

            // False once the veth pair has been deleted
            [[nodiscard]] auto exists() const -> boolean { return veth_pair.active; }

            // Only a wired link can be destroyed; an unwired one is torn down through release()
            auto destroy(exec::Host &host) -> VoidRes {
                if (!busy) {
                    String msg = name + " is not busy";
                    return result::err(err::precondition(msg.c_str()));
                }
                return veth_pair.destroy(host);
            }

            // Tear down whatever exists regardless of wiring
            auto release(exec::Host &host) -> VoidRes {
                if (busy) {
                    return destroy(host);
                }
                if (!veth_pair.active) {
                    return result::ok();
                }
                return veth_pair.destroy(host);
            }

            auto members() noexcept { return std::tie(name, veth_pair, busy); }
            auto members() const noexcept { return std::tie(name, veth_pair, busy); }
        };

        [[nodiscard]] inline auto init_direct_links(const Vector<LinkConfig> &configs, exec::Host &host)
            -> Vector<DirectLink> {
            return detail::init_links<DirectLink>(configs, LinkMode::DirectLink, host);
        }

        [[nodiscard]] inline auto cleanup_direct_links(Vector<DirectLink> &links, exec::Host &host) -> VoidRes {
            return detail::cleanup_links(links, host);
        }

    } // namespace netdev

} // namespace netweave
