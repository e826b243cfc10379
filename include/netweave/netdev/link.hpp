/* SPDX-License-Identifier: MIT */
/*
 * Netweave Link Batches
 * Shared batch construction, teardown and lookup for direct links and bridges
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/cfg/config.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        namespace detail {

            // Link must provide: static init(const LinkConfig &, exec::Host &) -> Res<Link>,
            // destroy(exec::Host &) -> VoidRes, exists() -> boolean and a `name` member.

            // Best effort: entries of another mode and entries that fail are skipped
            template <typename Link>
            [[nodiscard]] auto init_links(const Vector<LinkConfig> &configs, LinkMode mode, exec::Host &host)
                -> Vector<Link> {
                Vector<Link> links;
                for (const auto &config : configs) {
                    if (config.mode != mode) {
                        continue;
                    }

                    auto link = Link::init(config, host);
                    if (link.is_err()) {
                        echo::error("failed to init ", link_mode_to_string(mode), " ", config.name.c_str(), ": ",
                                    link.error().message.c_str());
                        continue;
                    }

                    links.push_back(std::move(link.value()));
                }
                return links;
            }

            // Links already removed by an earlier, partly failed cleanup are skipped
            template <typename Link> [[nodiscard]] auto cleanup_links(Vector<Link> &links, exec::Host &host) -> VoidRes {
                ErrorList errors;
                for (auto &link : links) {
                    if (!link.exists()) {
                        echo::debug(link.name.c_str(), " is already removed");
                        continue;
                    }
                    errors.append(link.destroy(host));
                }
                return errors.to_result();
            }

            template <typename Link> [[nodiscard]] auto find_link(Vector<Link> &links, const String &name) -> Link * {
                for (auto &link : links) {
                    if (link.name == name) {
                        return &link;
                    }
                }
                return nullptr;
            }

        } // namespace detail

    } // namespace netdev

} // namespace netweave
