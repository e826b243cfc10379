/* SPDX-License-Identifier: MIT */
/*
 * Topology Demo
 * Builds a mixed topology against a recording runner and prints the result
 */

#include <netweave/netweave.hpp>
#include <iostream>

namespace nw = netweave;

int main() {
    std::cout << "=== Topology Demo ===\n\n";

    std::cout << "Commands go to a RecordingRunner, so nothing touches the\n";
    std::cout << "host and no privileges are required.\n\n";

    // ==========================================================================
    // Step 1: Describe the topology
    // ==========================================================================
    std::cout << "1. Describing the topology...\n";

    nw::Config config = nw::cfg::default_config();
    config.links.push_back(nw::LinkConfig("link0", nw::LinkMode::DirectLink));
    config.links.push_back(nw::LinkConfig("lan", nw::LinkMode::Bridge));

    const char *names[] = {"ns-a", "ns-b", "ns-c"};
    for (int i = 0; i < 3; ++i) {
        nw::NamespaceConfig ns;
        ns.name = nw::String(names[i]);
        if (i < 2) {
            ns.devices.push_back(nw::DeviceConfig("link0", i == 0 ? "10.0.0.1/24" : "10.0.0.2/24"));
        }
        nw::String cidr = nw::String("192.168.0.") + nw::to_str(static_cast<nw::u32>(i + 1)) + "/24";
        ns.devices.push_back(nw::DeviceConfig("lan", cidr));
        config.namespaces.push_back(ns);
    }
    std::cout << "   link0: direct link between ns-a and ns-b\n";
    std::cout << "   lan:   bridge joining ns-a, ns-b and ns-c\n\n";

    // ==========================================================================
    // Step 2: Build
    // ==========================================================================
    std::cout << "2. Building...\n";

    nw::exec::RecordingRunner runner;
    nw::exec::Host host(runner);

    auto built = nw::state::State::build(config, nw::Optional<nw::state::State>(), host);
    if (built.is_err()) {
        std::cout << "   build failed: " << built.error().message.c_str() << "\n";
        return 1;
    }
    auto topology = built.value();

    std::cout << "   " << runner.commands().size() << " commands issued:\n";
    for (const auto &cmd : runner.commands()) {
        std::cout << "     " << cmd.to_string().c_str() << "\n";
    }
    std::cout << "\n";

    // ==========================================================================
    // Step 3: Inspect
    // ==========================================================================
    std::cout << "3. Resulting state:\n";
    std::cout << topology.dump().c_str() << "\n\n";

    // ==========================================================================
    // Step 4: Rejected topology
    // ==========================================================================
    std::cout << "4. Adding ns-c to link0...\n";

    nw::Config bad = config;
    bad.namespaces[2].devices.push_back(nw::DeviceConfig("link0", "10.0.0.3/24"));

    nw::exec::RecordingRunner bad_runner;
    nw::exec::Host bad_host(bad_runner);
    auto rejected = nw::state::State::build(bad, nw::Optional<nw::state::State>(), bad_host);
    std::cout << "   build: " << (rejected.is_ok() ? "OK" : rejected.error().message.c_str()) << "\n\n";

    // ==========================================================================
    // Step 5: Dry-run teardown
    // ==========================================================================
    std::cout << "5. Dry-run teardown...\n";

    nw::state::StateStore store("/tmp/netweave-demo");
    nw::exec::Host dry(runner, true);
    auto disposed = topology.dispose(dry, store);
    std::cout << "   dispose: " << (disposed.is_ok() ? "OK" : disposed.error().message.c_str()) << "\n";
    for (const auto &cmd : dry.journal()) {
        std::cout << "     " << cmd.to_string().c_str() << "\n";
    }

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
