/* SPDX-License-Identifier: MIT */
/*
 * Netweave - Virtual Network Topologies on a Single Host
 *
 * Main umbrella header - includes all netweave modules
 *
 * Features:
 * - Network namespaces with declared device rosters
 * - veth-backed direct links and bridge fan-out links
 * - Topology wiring by link name
 * - Persisted state for later teardown
 * - Dry-run for every host mutation
 *
 * Dependencies:
 * - datapod: POD-compatible data structures and Result types
 * - echo: Logging
 * - nlohmann_json: State file encoding
 */

#pragma once

// Core modules
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>

// Configuration
#include <netweave/cfg/config.hpp>
#include <netweave/cfg/config_file.hpp>

// Host command execution
#include <netweave/exec/command.hpp>
#include <netweave/exec/host.hpp>
#include <netweave/exec/runner.hpp>

// Network devices and topology
#include <netweave/netdev/bridge.hpp>
#include <netweave/netdev/cidr.hpp>
#include <netweave/netdev/direct_link.hpp>
#include <netweave/netdev/link.hpp>
#include <netweave/netdev/namespace.hpp>
#include <netweave/netdev/topology.hpp>
#include <netweave/netdev/veth.hpp>

// Persisted state
#include <netweave/state/codec.hpp>
#include <netweave/state/state.hpp>
#include <netweave/state/store.hpp>

namespace netweave {

    // Library version
    inline constexpr u32 VERSION_MAJOR = 0;
    inline constexpr u32 VERSION_MINOR = 1;
    inline constexpr u32 VERSION_PATCH = 0;
    inline constexpr const char *VERSION_STRING = "0.1.0";

} // namespace netweave
