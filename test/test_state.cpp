/* SPDX-License-Identifier: MIT */
/*
 * Netweave State Tests
 * Tests for state building, persistence and disposal
 */

#include <doctest/doctest.h>
#include <netweave/netweave.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace netweave;
using namespace dp;

namespace {

    // Fresh directory per call, removed with the guard
    struct TempDir {
        std::filesystem::path path;

        TempDir() {
            static int counter = 0;
            path = std::filesystem::temp_directory_path() /
                   ("netweave_state_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
            std::filesystem::remove_all(path);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }

        auto store() const -> state::StateStore { return state::StateStore(String(path.string().c_str())); }
    };

    auto direct_config() -> Config {
        Config config = cfg::default_config();
        config.links.push_back(LinkConfig("link0", LinkMode::DirectLink));
        NamespaceConfig a;
        a.name = "ns-a";
        a.devices.push_back(DeviceConfig("link0", "10.0.0.1/24"));
        NamespaceConfig b;
        b.name = "ns-b";
        b.devices.push_back(DeviceConfig("link0", "10.0.0.2/24"));
        config.namespaces.push_back(a);
        config.namespaces.push_back(b);
        return config;
    }

    auto mixed_config() -> Config {
        Config config = direct_config();
        config.links.push_back(LinkConfig("lan", LinkMode::Bridge));
        config.namespaces[0].devices.push_back(DeviceConfig("lan", "192.168.0.1/24"));
        config.namespaces[1].devices.push_back(DeviceConfig("lan", "192.168.0.2/24"));
        return config;
    }

} // namespace

TEST_SUITE("State - Build") {

    TEST_CASE("Build a mixed topology") {
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto res = state::State::build(mixed_config(), Optional<state::State>(), host);
        REQUIRE(res.is_ok());
        const auto &s = res.value();
        REQUIRE(s.direct_links.size() == 1);
        REQUIRE(s.bridges.size() == 1);
        REQUIRE(s.namespaces.size() == 2);
        CHECK(s.direct_links[0].busy);
        CHECK(s.bridges[0].busy);
        CHECK(s.namespaces[0].configured_count() == 2);
        CHECK_FALSE(s.empty());
    }

    TEST_CASE("Links are created before namespaces") {
        exec::RecordingRunner runner;
        exec::Host host(runner);

        REQUIRE(state::State::build(mixed_config(), Optional<state::State>(), host).is_ok());
        const auto &cmds = runner.commands();
        REQUIRE(cmds.size() > 4);
        CHECK(cmds[0].contains("type veth"));
        CHECK(cmds[1].contains("type bridge"));
        CHECK(cmds[3].contains("netns add ns-a"));
        CHECK(cmds[4].contains("netns add ns-b"));
    }

    TEST_CASE("An existing state blocks a new build") {
        exec::RecordingRunner runner;
        exec::Host host(runner);

        Optional<state::State> existing(state::State{});
        auto res = state::State::build(direct_config(), existing, host);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "existing topology found, dispose it before building a new one");
        CHECK(runner.commands().empty());
    }

    TEST_CASE("An invalid config issues no commands") {
        exec::RecordingRunner runner;
        exec::Host host(runner);

        Config config = direct_config();
        config.links.push_back(LinkConfig("link0", LinkMode::DirectLink));
        CHECK(state::State::build(config, Optional<state::State>(), host).is_err());
        CHECK(runner.commands().empty());
    }

    TEST_CASE("A namespace name the host cannot use issues no commands") {
        exec::RecordingRunner runner;
        exec::Host host(runner);

        Config config = direct_config();
        config.namespaces[1].name = "ns\xff";
        CHECK(state::State::build(config, Optional<state::State>(), host).is_err());
        CHECK(runner.commands().empty());
    }

    TEST_CASE("A failing namespace rolls back links and earlier namespaces") {
        exec::RecordingRunner runner;
        runner.fail_when("netns add ns-b");
        exec::Host host(runner);

        auto res = state::State::build(direct_config(), Optional<state::State>(), host);
        REQUIRE(res.is_err());
        CHECK(std::string(res.error().message.c_str()).find("failed to create ns ns-b") == 0);
        CHECK(runner.count("link delete link0-left") == 1);
        CHECK(runner.count("netns delete ns-a") == 1);
        CHECK(runner.count("netns delete ns-b") == 0);
    }

    TEST_CASE("Rollback failures are appended to the cause") {
        exec::RecordingRunner runner;
        runner.fail_when("netns add ns-b");
        runner.fail_when("netns delete ns-a");
        exec::Host host(runner);

        auto res = state::State::build(direct_config(), Optional<state::State>(), host);
        REQUIRE(res.is_err());
        std::string msg = res.error().message.c_str();
        CHECK(msg.find("failed to create ns ns-b") == 0);
        CHECK(msg.find("; rollback: failed to delete ns ns-a") != std::string::npos);
    }

    TEST_CASE("A wiring failure rolls back everything") {
        exec::RecordingRunner runner;
        runner.fail_when("addr add 192.168.0.2/24");
        exec::Host host(runner);

        auto res = state::State::build(mixed_config(), Optional<state::State>(), host);
        REQUIRE(res.is_err());
        CHECK(std::string(res.error().message.c_str()).find("failed to create links lan") == 0);
        CHECK(runner.count("ip link delete lan0-right") == 1);
        // the failed port's left end is not marked attached, so it is the one deleted
        CHECK(runner.count("ip link delete lan1-left") == 1);
        CHECK(runner.count("ip link delete lan") == 3);
        CHECK(runner.count("netns delete ns-a") == 1);
        CHECK(runner.count("netns delete ns-b") == 1);
    }

}

TEST_SUITE("State - Persistence") {

    TEST_CASE("Load without a saved state") {
        TempDir dir;
        auto res = state::State::load(dir.store());
        REQUIRE(res.is_ok());
        CHECK_FALSE(res.value().has_value());
    }

    TEST_CASE("Save then load reproduces the state") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto built = state::State::build(mixed_config(), Optional<state::State>(), host);
        REQUIRE(built.is_ok());
        REQUIRE(built.value().save(store).is_ok());
        CHECK(store.exists());

        auto loaded = state::State::load(store);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().has_value());
        const auto &s = loaded.value().value();
        CHECK(s.to_json() == built.value().to_json());
        REQUIRE(s.bridges.size() == 1);
        CHECK(s.bridges[0].ports.size() == 2);
        CHECK(s.namespaces[1].registered_device_config[1].cidr() == "192.168.0.2/24");
    }

    TEST_CASE("Save replaces an earlier file") {
        TempDir dir;
        auto store = dir.store();

        state::State first;
        netdev::Namespace ns;
        ns.name = "ns-a";
        ns.active = true;
        first.namespaces.push_back(ns);
        REQUIRE(first.save(store).is_ok());

        state::State second;
        REQUIRE(second.save(store).is_ok());

        auto loaded = state::State::load(store);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().has_value());
        CHECK(loaded.value().value().empty());
        CHECK_FALSE(std::filesystem::exists(std::string(store.path().c_str()) + ".tmp"));
    }

    TEST_CASE("Names that cannot be encoded fail the save") {
        TempDir dir;
        auto store = dir.store();

        state::State s;
        netdev::Namespace ns;
        ns.name = "ns\xff";
        ns.active = true;
        s.namespaces.push_back(ns);

        auto res = s.save(store);
        REQUIRE(res.is_err());
        CHECK(res.error().code == Error::INVALID_ARGUMENT);
        CHECK_FALSE(store.exists());
    }

    TEST_CASE("Malformed file is an error, not an absent state") {
        TempDir dir;
        auto store = dir.store();
        std::filesystem::create_directories(dir.path);
        {
            std::ofstream out(store.path().c_str());
            out << "{ not json";
        }

        auto res = state::State::load(store);
        REQUIRE(res.is_err());
        CHECK(res.error().code == Error::INVALID_ARGUMENT);
        CHECK(std::string(res.error().message.c_str()).find("failed to load") == 0);
    }

    TEST_CASE("Null lists decode as empty") {
        auto res = state::State::from_json_text(R"({"direct_links": null, "bridges": null, "namespaces": []})");
        REQUIRE(res.is_ok());
        CHECK(res.value().empty());
    }

    TEST_CASE("Missing fields are rejected") {
        CHECK(state::State::from_json_text(R"({"direct_links": []})").is_err());
        CHECK(state::State::from_json_text(R"({"direct_links": [{"name": "link0"}], "bridges": [],
                                               "namespaces": []})")
                  .is_err());
    }

    TEST_CASE("Persisted field names") {
        exec::RecordingRunner runner;
        exec::Host host(runner);
        auto s = state::State::build(direct_config(), Optional<state::State>(), host).value();

        auto j = s.to_json();
        const auto &link = j.at("direct_links").at(0);
        CHECK(link.at("name").get<std::string>() == "link0");
        CHECK(link.at("busy").get<bool>());
        CHECK(link.at("veth_pair").at("is_active").get<bool>());
        CHECK(link.at("veth_pair").at("veth_left").at("name").get<std::string>() == "link0-left");
        CHECK(link.at("veth_pair").at("veth_right").at("attached").get<bool>());

        const auto &ns = j.at("namespaces").at(0);
        CHECK(ns.at("is_active").get<bool>());
        const auto &dev = ns.at("registered_device_config").at(0);
        CHECK(dev.at("configured").get<bool>());
        CHECK(dev.at("device_config").at("cidr").get<std::string>() == "10.0.0.1/24");
    }

    TEST_CASE("dump is indented JSON") {
        state::State s;
        std::string text = s.dump().c_str();
        CHECK(text.find("\n  \"bridges\"") != std::string::npos);
        CHECK(nlohmann::json::parse(text) == s.to_json());
    }

}

TEST_SUITE("State - Dispose") {

    TEST_CASE("Dispose tears down and removes the file") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto s = state::State::build(mixed_config(), Optional<state::State>(), host).value();
        REQUIRE(s.save(store).is_ok());
        runner.clear();

        REQUIRE(s.dispose(host, store).is_ok());
        CHECK_FALSE(store.exists());

        const auto &cmds = runner.commands();
        REQUIRE(cmds.size() == 5);
        CHECK(cmds[0].to_string() == "ip link delete lan0-right");
        CHECK(cmds[1].to_string() == "ip link delete lan1-right");
        CHECK(cmds[2].to_string() == "ip link delete lan");
        CHECK(cmds[3].to_string() == "ip netns delete ns-a");
        CHECK(cmds[4].to_string() == "ip netns delete ns-b");
    }

    TEST_CASE("A failing category stops later categories and keeps the file") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto s = state::State::build(mixed_config(), Optional<state::State>(), host).value();
        REQUIRE(s.save(store).is_ok());
        runner.fail_when("link delete lan");
        runner.clear();

        auto res = s.dispose(host, store);
        REQUIRE(res.is_err());
        CHECK(std::string(res.error().message.c_str()).find("failed to destroy bridges") == 0);
        CHECK(runner.count("netns delete") == 0);
        CHECK(store.exists());
    }

    TEST_CASE("Unwired direct links stop disposal") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        state::State s;
        s.direct_links.push_back(netdev::DirectLink::init(LinkConfig("link0", LinkMode::DirectLink), host).value());
        runner.clear();

        auto res = s.dispose(host, store);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "failed to destroy direct links: link0 is not busy");
        CHECK(runner.commands().empty());
    }

    TEST_CASE("A failed dispose records what is left and can be rerun") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto s = state::State::build(direct_config(), Optional<state::State>(), host).value();
        REQUIRE(s.save(store).is_ok());
        runner.fail_when("netns delete ns-b");
        runner.clear();

        CHECK(s.dispose(host, store).is_err());
        REQUIRE(store.exists());

        auto remaining = state::State::load(store);
        REQUIRE(remaining.is_ok());
        REQUIRE(remaining.value().has_value());
        auto again = remaining.value().value();
        CHECK_FALSE(again.namespaces[0].active);
        CHECK(again.namespaces[1].active);

        runner.clear_failures();
        runner.clear();
        REQUIRE(again.dispose(host, store).is_ok());
        CHECK_FALSE(store.exists());
        REQUIRE(runner.commands().size() == 1);
        CHECK(runner.commands()[0].to_string() == "ip netns delete ns-b");
    }

    TEST_CASE("A rerun after a failed bridge port only retries that port") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto s = state::State::build(mixed_config(), Optional<state::State>(), host).value();
        REQUIRE(s.save(store).is_ok());
        runner.fail_when("delete lan1-right");
        runner.clear();

        auto first = s.dispose(host, store);
        REQUIRE(first.is_err());
        CHECK(std::string(first.error().message.c_str()).find("failed to destroy bridges") == 0);
        CHECK(runner.count("netns delete") == 0);

        auto remaining = state::State::load(store);
        REQUIRE(remaining.is_ok());
        REQUIRE(remaining.value().has_value());
        auto again = remaining.value().value();
        CHECK_FALSE(again.bridges[0].active);
        CHECK_FALSE(again.bridges[0].ports[0].active);
        CHECK(again.bridges[0].ports[1].active);

        runner.clear_failures();
        runner.clear();
        REQUIRE(again.dispose(host, store).is_ok());
        CHECK_FALSE(store.exists());

        const auto &cmds = runner.commands();
        REQUIRE(cmds.size() == 3);
        CHECK(cmds[0].to_string() == "ip link delete lan1-right");
        CHECK(cmds[1].to_string() == "ip netns delete ns-a");
        CHECK(cmds[2].to_string() == "ip netns delete ns-b");
    }

    TEST_CASE("Dry-run dispose keeps the file") {
        TempDir dir;
        auto store = dir.store();
        exec::RecordingRunner runner;
        exec::Host host(runner);

        auto s = state::State::build(direct_config(), Optional<state::State>(), host).value();
        REQUIRE(s.save(store).is_ok());
        runner.clear();

        exec::Host dry(runner, true);
        REQUIRE(s.dispose(dry, store).is_ok());
        CHECK(store.exists());
        CHECK(runner.commands().empty());
        CHECK(dry.journal().size() == 2);
    }

    TEST_CASE("Store location") {
        state::StateStore store("/var/lib/netweave-test");
        CHECK(store.dir() == "/var/lib/netweave-test");
        CHECK(store.path() == "/var/lib/netweave-test/state.json");

        TempDir dir;
        auto empty = dir.store();
        CHECK_FALSE(empty.exists());
        CHECK(empty.remove().is_ok());
    }

}
