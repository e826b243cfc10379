/* SPDX-License-Identifier: MIT */
/*
 * Netweave Config File Tests
 * Tests for topology file parsing and generation
 */

#include <doctest/doctest.h>
#include <netweave/netweave.hpp>

#include <cstdio>
#include <string>

using namespace netweave;
using namespace dp;

TEST_SUITE("ConfigFile - ConfigParser") {

    TEST_CASE("Parse empty content") {
        cfg::ConfigParser parser;
        CHECK(parser.parse("").is_ok());
        CHECK(parser.section_count() == 0);
    }

    TEST_CASE("Parse comments") {
        cfg::ConfigParser parser;
        CHECK(parser.parse("# comment\n; another\n").is_ok());
    }

    TEST_CASE("Dotted section names") {
        cfg::ConfigParser parser;
        String content = "[namespace.0.device.1]\nname = link0\n";
        REQUIRE(parser.parse(content).is_ok());
        CHECK(parser.has_section("namespace.0.device.1"));
        CHECK(parser.get_or("namespace.0.device.1", "name", "") == "link0");
    }

    TEST_CASE("Empty section is still registered") {
        cfg::ConfigParser parser;
        REQUIRE(parser.parse("[namespace.0]\n").is_ok());
        CHECK(parser.has_section("namespace.0"));
    }

    TEST_CASE("Quoted values") {
        cfg::ConfigParser parser;
        REQUIRE(parser.parse("[t]\na = \"10.0.0.1/24\"\nb = 'x y'\n").is_ok());
        CHECK(parser.get_or("t", "a", "") == "10.0.0.1/24");
        CHECK(parser.get_or("t", "b", "") == "x y");
    }

    TEST_CASE("require reports the section") {
        cfg::ConfigParser parser;
        REQUIRE(parser.parse("[link.0]\nmode = bridge\n").is_ok());

        auto name = parser.require("link.0", "name");
        REQUIRE(name.is_err());
        CHECK(std::string(name.error().message.c_str()).find("[link.0]") != std::string::npos);

        auto mode = parser.require("link.0", "mode");
        REQUIRE(mode.is_ok());
        CHECK(mode.value() == "bridge");
    }

    TEST_CASE("Empty value does not satisfy require") {
        cfg::ConfigParser parser;
        REQUIRE(parser.parse("[link.0]\nname =\n").is_ok());
        CHECK(parser.require("link.0", "name").is_err());
    }

    TEST_CASE("Parse errors") {
        cfg::ConfigParser parser;
        CHECK(parser.parse("[unclosed\n").is_err());
        CHECK(parser.parse("[]\n").is_err());
        CHECK(parser.parse("[t]\nno_equals\n").is_err());
        CHECK(parser.parse("[t]\n = value\n").is_err());
    }

}

TEST_SUITE("ConfigFile - Topology") {

    TEST_CASE("Parse two namespaces joined by a direct link") {
        String content = "[link.0]\n"
                         "name = link0\n"
                         "mode = direct-link\n"
                         "[namespace.0]\n"
                         "name = ns-a\n"
                         "[namespace.0.device.0]\n"
                         "name = link0\n"
                         "cidr = 10.0.0.1/24\n"
                         "[namespace.1]\n"
                         "name = ns-b\n"
                         "[namespace.1.device.0]\n"
                         "name = link0\n"
                         "cidr = 10.0.0.2/24\n";

        auto res = cfg::parse_config(content);
        REQUIRE(res.is_ok());
        const auto &config = res.value();

        REQUIRE(config.links.size() == 1);
        CHECK(config.links[0].name == "link0");
        CHECK(config.links[0].mode == LinkMode::DirectLink);

        REQUIRE(config.namespaces.size() == 2);
        CHECK(config.namespaces[0].name == "ns-a");
        REQUIRE(config.namespaces[0].devices.size() == 1);
        CHECK(config.namespaces[0].devices[0].cidr == "10.0.0.1/24");
        CHECK(config.namespaces[1].name == "ns-b");
        CHECK(config.namespaces[1].devices[0].cidr == "10.0.0.2/24");
    }

    TEST_CASE("Mode defaults to direct-link") {
        auto res = cfg::parse_config("[link.0]\nname = l0\n");
        REQUIRE(res.is_ok());
        CHECK(res.value().links[0].mode == LinkMode::DirectLink);
    }

    TEST_CASE("Bridge mode") {
        auto res = cfg::parse_config("[link.0]\nname = lan\nmode = bridge\n");
        REQUIRE(res.is_ok());
        CHECK(res.value().links[0].is_bridge());
    }

    TEST_CASE("Unknown mode is rejected") {
        auto res = cfg::parse_config("[link.0]\nname = l0\nmode = vxlan\n");
        REQUIRE(res.is_err());
        CHECK(std::string(res.error().message.c_str()).find("vxlan") != std::string::npos);
    }

    TEST_CASE("Indices stop at the first gap") {
        auto res = cfg::parse_config("[link.0]\nname = a\n[link.2]\nname = c\n");
        REQUIRE(res.is_ok());
        CHECK(res.value().links.size() == 1);
    }

    TEST_CASE("Entries past the limit are rejected") {
        auto links = [](usize count) {
            std::string content;
            for (usize i = 0; i < count; ++i) {
                std::string idx = (i < 10 ? "0" : "") + std::to_string(i);
                content += "[link." + std::to_string(i) + "]\nname = l" + idx + "\n";
            }
            return String(content.c_str());
        };

        auto at_limit = cfg::parse_config(links(MAX_CONFIG_ENTRIES));
        REQUIRE(at_limit.is_ok());
        CHECK(at_limit.value().links.size() == MAX_CONFIG_ENTRIES);

        auto over = cfg::parse_config(links(MAX_CONFIG_ENTRIES + 1));
        REQUIRE(over.is_err());
        CHECK(std::string(over.error().message.c_str()).find("[link.64]") == 0);
    }

    TEST_CASE("Devices past the limit are rejected") {
        std::string content = "[namespace.0]\nname = ns-a\n";
        for (usize i = 0; i <= MAX_CONFIG_ENTRIES; ++i) {
            content += "[namespace.0.device." + std::to_string(i) + "]\nname = link0\ncidr = 10.0.0.1/24\n";
        }

        auto res = cfg::parse_config(String(content.c_str()));
        REQUIRE(res.is_err());
        CHECK(std::string(res.error().message.c_str()).find("[namespace.0.device.64]") == 0);
    }

    TEST_CASE("Device without cidr is rejected") {
        auto res = cfg::parse_config("[namespace.0]\nname = ns-a\n[namespace.0.device.0]\nname = link0\n");
        CHECK(res.is_err());
    }

    TEST_CASE("Namespace without devices") {
        auto res = cfg::parse_config("[namespace.0]\nname = lonely\n");
        REQUIRE(res.is_ok());
        CHECK(res.value().namespaces[0].devices.empty());
    }

    TEST_CASE("Validation runs after parsing") {
        auto res = cfg::parse_config("[link.0]\nname = dup\n[link.1]\nname = dup\n");
        CHECK(res.is_err());
    }

    TEST_CASE("Logging section") {
        auto res = cfg::parse_config("[logging]\nlevel = debug\n");
        REQUIRE(res.is_ok());
        CHECK(res.value().logging.level == "debug");
    }

}

TEST_SUITE("ConfigFile - Generation") {

    TEST_CASE("Template parses into a valid topology") {
        for (boolean with_comments : {true, false}) {
            auto res = cfg::parse_config(cfg::generate_config_template(with_comments));
            REQUIRE(res.is_ok());
            CHECK(res.value().links.size() == 1);
            CHECK(res.value().namespaces.size() == 2);
        }
    }

    TEST_CASE("Serialized config parses back") {
        Config config = cfg::default_config();
        config.links.push_back(LinkConfig("lan", LinkMode::Bridge));
        NamespaceConfig ns;
        ns.name = "ns-a";
        ns.devices.push_back(DeviceConfig("lan", "192.168.0.1/24"));
        ns.devices.push_back(DeviceConfig("lan", "192.168.1.1/24"));
        config.namespaces.push_back(ns);

        auto res = cfg::parse_config(cfg::serialize_config(config));
        REQUIRE(res.is_ok());
        CHECK(res.value().links[0].is_bridge());
        REQUIRE(res.value().namespaces[0].devices.size() == 2);
        CHECK(res.value().namespaces[0].devices[1].cidr == "192.168.1.1/24");
    }

    TEST_CASE("Save and load file") {
        String path = "/tmp/netweave_test_config.conf";
        Config config = cfg::default_config();
        config.links.push_back(LinkConfig("link0", LinkMode::DirectLink));

        REQUIRE(cfg::save_config(config, path).is_ok());
        auto res = cfg::load_config_file(path);
        REQUIRE(res.is_ok());
        CHECK(res.value().links[0].name == "link0");

        std::remove(path.c_str());
    }

    TEST_CASE("Missing file") {
        auto res = cfg::load_config_file("/nonexistent/netweave.conf");
        REQUIRE(res.is_err());
        CHECK(res.error().code == Error::IO_ERROR);
    }

}
