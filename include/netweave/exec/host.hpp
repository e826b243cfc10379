/* SPDX-License-Identifier: MIT */
/*
 * Netweave Host
 * Issues namespace and link manipulation commands, or only logs them in dry-run mode
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/command.hpp>
#include <netweave/exec/runner.hpp>

namespace netweave {

    using namespace dp;

    namespace exec {

        class Host {
          private:
            CommandRunner *runner_;
            boolean dry_run_ = false;
            Vector<Command> journal_;

          public:
            explicit Host(CommandRunner &runner, boolean dry_run = false) : runner_(&runner), dry_run_(dry_run) {}

            [[nodiscard]] auto is_dry_run() const -> boolean { return dry_run_; }

            // Every command passed to run(), executed or not
            [[nodiscard]] auto journal() const -> const Vector<Command> & { return journal_; }

            auto run(const Command &cmd) -> VoidRes {
                journal_.push_back(cmd);

                if (dry_run_) {
                    echo::info("[dry-run] ", cmd.to_string().c_str());
                    return result::ok();
                }

                echo::debug("exec: ", cmd.to_string().c_str());
                return runner_->run(cmd);
            }

            // =============================================================================
            // Link operations (root namespace)
            // =============================================================================

            auto create_veth_pair(const String &left, const String &right) -> VoidRes {
                auto res = run(ip::link_add_veth(left, right));
                if (res.is_err()) {
                    return result::err(err::context(String("failed to create veth pair ") + left + "@" + right,
                                                    res.error()));
                }
                return result::ok();
            }

            auto delete_link(const String &dev) -> VoidRes {
                auto res = run(ip::link_delete(dev));
                if (res.is_err()) {
                    return result::err(err::context(String("failed to delete link ") + dev, res.error()));
                }
                return result::ok();
            }

            // Bridge device is brought up as soon as it exists
            auto create_bridge(const String &name) -> VoidRes {
                auto res = run(ip::link_add_bridge(name));
                if (res.is_ok()) {
                    res = run(ip::link_up(name));
                }
                if (res.is_err()) {
                    return result::err(err::context(String("failed to create bridge ") + name, res.error()));
                }
                return result::ok();
            }

            auto attach_to_bridge(const String &dev, const String &bridge) -> VoidRes {
                auto res = run(ip::link_set_master(dev, bridge));
                if (res.is_ok()) {
                    res = run(ip::link_up(dev));
                }
                if (res.is_err()) {
                    return result::err(
                        err::context(String("failed to attach ") + dev + " to bridge " + bridge, res.error()));
                }
                return result::ok();
            }

            // =============================================================================
            // Namespace operations
            // =============================================================================

            auto add_netns(const String &ns) -> VoidRes {
                auto res = run(ip::netns_add(ns));
                if (res.is_err()) {
                    return result::err(err::context(String("failed to create ns ") + ns, res.error()));
                }
                return result::ok();
            }

            auto delete_netns(const String &ns) -> VoidRes {
                auto res = run(ip::netns_delete(ns));
                if (res.is_err()) {
                    return result::err(err::context(String("failed to delete ns ") + ns, res.error()));
                }
                return result::ok();
            }

            auto move_to_netns(const String &dev, const String &ns) -> VoidRes { return run(ip::link_set_netns(dev, ns)); }

            // Address assignment plus link up, both inside the namespace
            auto assign_cidr(const String &dev, const String &ns, const String &cidr) -> VoidRes {
                auto res = run(ip::addr_add_in(ns, dev, cidr));
                if (res.is_err()) {
                    return res;
                }
                return run(ip::link_up_in(ns, dev));
            }
        };

    } // namespace exec

} // namespace netweave
