/* SPDX-License-Identifier: MIT */
/*
 * Netweave Commands
 * argv-style host commands and the ip(8) invocations used to build topologies
 */

#pragma once

#include <datapod/datapod.hpp>
#include <initializer_list>
#include <netweave/core/types.hpp>
#include <string>

namespace netweave {

    using namespace dp;

    namespace exec {

        // =============================================================================
        // Command - program plus arguments, executed without a shell
        // =============================================================================

        struct Command {
            Vector<String> argv;

            Command() = default;

            Command(std::initializer_list<String> args) {
                for (const auto &a : args) {
                    argv.push_back(a);
                }
            }

            [[nodiscard]] auto empty() const -> boolean { return argv.empty(); }

            [[nodiscard]] auto program() const -> String { return argv.empty() ? String() : argv[0]; }

            // Space separated command line, for logs and dry-run output
            [[nodiscard]] auto to_string() const -> String {
                String line;
                for (usize i = 0; i < argv.size(); ++i) {
                    if (i > 0) {
                        line = line + " ";
                    }
                    line = line + argv[i];
                }
                return line;
            }

            // Substring match against the full command line
            [[nodiscard]] auto contains(const String &fragment) const -> boolean {
                return std::string(to_string().c_str()).find(fragment.c_str()) != std::string::npos;
            }

            auto members() noexcept { return std::tie(argv); }
            auto members() const noexcept { return std::tie(argv); }
        };

        // =============================================================================
        // ip(8) command builders
        // =============================================================================

        namespace ip {

            inline constexpr const char *IP_BIN = "ip";

            inline auto link_add_veth(const String &left, const String &right) -> Command {
                return Command{IP_BIN, "link", "add", left, "type", "veth", "peer", "name", right};
            }

            inline auto link_delete(const String &dev) -> Command { return Command{IP_BIN, "link", "delete", dev}; }

            inline auto netns_add(const String &ns) -> Command { return Command{IP_BIN, "netns", "add", ns}; }

            inline auto netns_delete(const String &ns) -> Command { return Command{IP_BIN, "netns", "delete", ns}; }

            inline auto link_set_netns(const String &dev, const String &ns) -> Command {
                return Command{IP_BIN, "link", "set", dev, "netns", ns};
            }

            inline auto addr_add_in(const String &ns, const String &dev, const String &cidr) -> Command {
                return Command{IP_BIN, "-n", ns, "addr", "add", cidr, "dev", dev};
            }

            inline auto link_up_in(const String &ns, const String &dev) -> Command {
                return Command{IP_BIN, "-n", ns, "link", "set", dev, "up"};
            }

            inline auto link_add_bridge(const String &name) -> Command {
                return Command{IP_BIN, "link", "add", "name", name, "type", "bridge"};
            }

            inline auto link_set_master(const String &dev, const String &bridge) -> Command {
                return Command{IP_BIN, "link", "set", dev, "master", bridge};
            }

            inline auto link_up(const String &dev) -> Command { return Command{IP_BIN, "link", "set", dev, "up"}; }

        } // namespace ip

    } // namespace exec

} // namespace netweave
