/* SPDX-License-Identifier: MIT */
/*
 * Netweave Command Line Tool
 * Builds, inspects and tears down a virtual network topology on this host
 *
 * Usage:
 *   ./netweave create -c topology.conf   # Build the topology and save its state
 *   ./netweave delete                    # Tear down the saved topology
 *   ./netweave dump                      # Print the saved state as JSON
 *   ./netweave template                  # Print an example topology file
 *
 * Options:
 *   --dry-run          Log the ip(8) commands without running them
 *   --state-dir DIR    State directory (default: $HOME/.netweave)
 */

#include <netweave/netweave.hpp>

#include <cstring>
#include <iostream>

using namespace netweave;
using namespace dp;

void print_usage(const char *prog) {
    std::cout << "Netweave " << VERSION_STRING << " - virtual network topologies\n\n";
    std::cout << "Usage: " << prog << " <command> [OPTIONS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  create         Build the topology described by a topology file\n";
    std::cout << "  delete         Tear down the saved topology and remove its state\n";
    std::cout << "  dump           Print the saved state as JSON\n";
    std::cout << "  template       Print an example topology file\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h         Show this help message\n";
    std::cout << "  -c, --config FILE  Topology file (create)\n";
    std::cout << "  --dry-run          Log commands without running them\n";
    std::cout << "  --state-dir DIR    State directory (default: $HOME/.netweave)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << prog << " template > topology.conf\n";
    std::cout << "  sudo " << prog << " create -c topology.conf\n";
    std::cout << "  sudo " << prog << " delete\n";
}

int fail(const char *what, const Error &error) {
    std::cerr << what << ": " << error.message.c_str() << "\n";
    return 1;
}

int run_create(const String &config_path, exec::Host &host, state::StateStore &store) {
    auto config = cfg::load_config_file(config_path);
    if (config.is_err()) {
        return fail("Failed to load topology", config.error());
    }
    echo::debug("log level from topology file: ", config.value().logging.level.c_str());

    auto existing = state::State::load(store);
    if (existing.is_err()) {
        return fail("Failed to read state", existing.error());
    }

    auto built = state::State::build(config.value(), existing.value(), host);
    if (built.is_err()) {
        return fail("Failed to create topology", built.error());
    }

    if (host.is_dry_run()) {
        std::cout << built.value().dump().c_str() << "\n";
        return 0;
    }

    auto saved = built.value().save(store);
    if (saved.is_err()) {
        return fail("Topology created but its state could not be saved", saved.error());
    }

    std::cout << "Topology created, state saved to " << store.path().c_str() << "\n";
    return 0;
}

int run_delete(exec::Host &host, state::StateStore &store) {
    auto loaded = state::State::load(store);
    if (loaded.is_err()) {
        return fail("Failed to read state", loaded.error());
    }
    if (!loaded.value().has_value()) {
        std::cout << "No topology to delete\n";
        return 0;
    }

    auto topology = loaded.value().value();
    auto disposed = topology.dispose(host, store);
    if (disposed.is_err()) {
        return fail("Failed to delete topology", disposed.error());
    }

    std::cout << "Topology deleted\n";
    return 0;
}

int run_dump(const state::StateStore &store) {
    auto loaded = state::State::load(store);
    if (loaded.is_err()) {
        return fail("Failed to read state", loaded.error());
    }
    if (!loaded.value().has_value()) {
        std::cout << "No saved topology\n";
        return 0;
    }

    std::cout << loaded.value().value().dump().c_str() << "\n";
    return 0;
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    String command;
    String config_path;
    String state_dir;
    boolean dry_run = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = String(argv[++i]);
        } else if (strcmp(argv[i], "--state-dir") == 0 && i + 1 < argc) {
            state_dir = String(argv[++i]);
        } else if (argv[i][0] != '-' && command.empty()) {
            command = String(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command == "template") {
        std::cout << cfg::generate_config_template(true).c_str();
        return 0;
    }

    if (state_dir.empty()) {
        auto dir = state::StateStore::default_dir();
        if (dir.is_err()) {
            return fail("Cannot locate state directory", dir.error());
        }
        state_dir = dir.value();
    }
    state::StateStore store(state_dir);

    exec::ProcessRunner runner;
    exec::Host host(runner, dry_run);

    if (command == "create") {
        if (config_path.empty()) {
            std::cerr << "create requires -c FILE\n";
            return 1;
        }
        return run_create(config_path, host, store);
    }
    if (command == "delete") {
        return run_delete(host, store);
    }
    if (command == "dump") {
        return run_dump(store);
    }

    std::cerr << "Unknown command: " << command.c_str() << "\n";
    print_usage(argv[0]);
    return 1;
}
