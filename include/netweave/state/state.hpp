/* SPDX-License-Identifier: MIT */
/*
 * Netweave State
 * Every live link and namespace on the host; the unit of build, load, save and dispose
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/cfg/config.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/host.hpp>
#include <netweave/netdev/bridge.hpp>
#include <netweave/netdev/direct_link.hpp>
#include <netweave/netdev/namespace.hpp>
#include <netweave/netdev/topology.hpp>
#include <netweave/state/codec.hpp>
#include <netweave/state/store.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace netweave {

    using namespace dp;

    namespace state {

        struct State {
            Vector<netdev::DirectLink> direct_links;
            Vector<netdev::Bridge> bridges;
            Vector<netdev::Namespace> namespaces;

            State() = default;

            [[nodiscard]] auto empty() const -> boolean {
                return direct_links.empty() && bridges.empty() && namespaces.empty();
            }

            // =============================================================================
            // Build
            // =============================================================================

            // Refuses to run over an existing topology; it must be disposed first
            [[nodiscard]] static auto build(const Config &config, const Optional<State> &existing, exec::Host &host)
                -> Res<State> {
                if (existing.has_value()) {
                    return result::err(
                        err::precondition("existing topology found, dispose it before building a new one"));
                }

                auto valid = cfg::validate(config);
                if (valid.is_err()) {
                    return result::err(valid.error());
                }

                State state;
                state.direct_links = netdev::init_direct_links(config.links, host);
                state.bridges = netdev::init_bridges(config.links, host);

                auto ns_res = netdev::init_namespaces(config.namespaces, host, state.namespaces);
                if (ns_res.is_err()) {
                    return result::err(state.rollback(ns_res.error(), host));
                }

                auto topo_res = netdev::build_topology(state.namespaces, state.direct_links, state.bridges, host);
                if (topo_res.is_err()) {
                    return result::err(state.rollback(topo_res.error(), host));
                }

                echo::info("topology built: ", state.direct_links.size(), " direct links, ", state.bridges.size(),
                           " bridges, ", state.namespaces.size(), " namespaces");
                return result::ok(std::move(state));
            }

            // =============================================================================
            // Persistence
            // =============================================================================

            [[nodiscard]] static auto load(const StateStore &store) -> Res<Optional<State>> {
                auto content = store.read();
                if (content.is_err()) {
                    return result::err(content.error());
                }
                if (!content.value().has_value()) {
                    echo::debug("no saved state at ", store.path().c_str());
                    return result::ok(Optional<State>());
                }

                auto parsed = from_json_text(content.value().value());
                if (parsed.is_err()) {
                    String what = String("failed to load ") + store.path();
                    return result::err(err::context(what, parsed.error()));
                }
                return result::ok(Optional<State>(std::move(parsed.value())));
            }

            [[nodiscard]] auto save(StateStore &store) const -> VoidRes {
                std::string text;
                try {
                    text = to_json().dump();
                } catch (const nlohmann::json::exception &e) {
                    String msg = String("failed to encode state: ") + String(e.what());
                    return result::err(err::invalid(msg.c_str()));
                }
                return store.write(String(text.c_str()));
            }

            // =============================================================================
            // Dispose
            // =============================================================================

            // Links, then bridges, then namespaces; the first failing category stops
            // the sequence and what is left is written back, so a rerun only
            // retries the remaining members
            [[nodiscard]] auto dispose(exec::Host &host, StateStore &store) -> VoidRes {
                auto res = netdev::cleanup_direct_links(direct_links, host);
                if (res.is_err()) {
                    return result::err(keep_remaining(err::context("failed to destroy direct links", res.error()),
                                                      host, store));
                }

                res = netdev::cleanup_bridges(bridges, host);
                if (res.is_err()) {
                    return result::err(
                        keep_remaining(err::context("failed to destroy bridges", res.error()), host, store));
                }

                res = netdev::cleanup_namespaces(namespaces, host);
                if (res.is_err()) {
                    return result::err(
                        keep_remaining(err::context("failed to destroy namespaces", res.error()), host, store));
                }

                if (host.is_dry_run()) {
                    echo::info("[dry-run] keep ", store.path().c_str());
                    return result::ok();
                }

                return store.remove();
            }

            // =============================================================================
            // JSON
            // =============================================================================

            [[nodiscard]] auto to_json() const -> nlohmann::json {
                return nlohmann::json{{"direct_links", detail::vector_to_json(direct_links)},
                                      {"bridges", detail::vector_to_json(bridges)},
                                      {"namespaces", detail::vector_to_json(namespaces)}};
            }

            // Indented rendering for humans
            [[nodiscard]] auto dump() const -> String {
                return String(to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace).c_str());
            }

            [[nodiscard]] static auto from_json_text(const String &text) -> Res<State> {
                try {
                    auto j = nlohmann::json::parse(text.c_str());
                    State state;
                    state.direct_links = detail::vector_from_json<netdev::DirectLink>(j, "direct_links");
                    state.bridges = detail::vector_from_json<netdev::Bridge>(j, "bridges");
                    state.namespaces = detail::vector_from_json<netdev::Namespace>(j, "namespaces");
                    return result::ok(std::move(state));
                } catch (const nlohmann::json::exception &e) {
                    return result::err(err::invalid(e.what()));
                }
            }

          private:
            // Persists the partly torn-down state after a failed dispose. Dry-run
            // leaves the file alone.
            auto keep_remaining(const Error &cause, exec::Host &host, StateStore &store) const -> Error {
                if (host.is_dry_run()) {
                    return cause;
                }

                auto saved = save(store);
                if (saved.is_ok()) {
                    echo::warn("partial teardown recorded in ", store.path().c_str());
                    return cause;
                }

                Error combined = cause;
                combined.message = cause.message + "; state: " + saved.error().message;
                return combined;
            }

            // Best-effort teardown after a failed build. `cause` stays the primary
            // error; teardown failures are appended to its message.
            auto rollback(const Error &cause, exec::Host &host) -> Error {
                ErrorList errors;
                for (auto &link : direct_links) {
                    errors.append(link.release(host));
                }
                for (auto &bridge : bridges) {
                    errors.append(bridge.release(host));
                }
                for (auto &ns : namespaces) {
                    if (ns.active) {
                        errors.append(ns.destroy(host));
                    }
                }

                if (errors.empty()) {
                    return cause;
                }

                echo::warn("rollback left resources behind: ", errors.message().c_str());
                Error combined = cause;
                combined.message = cause.message + "; rollback: " + errors.message();
                return combined;
            }
        };

    } // namespace state

} // namespace netweave
