/* SPDX-License-Identifier: MIT */
/*
 * Netweave Config File Parser
 * Sectioned key=value topology files: [link.N], [namespace.N], [namespace.N.device.M]
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <fstream>
#include <netweave/cfg/config.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <sstream>

namespace netweave {

    using namespace dp;

    namespace cfg {

        // =============================================================================
        // Config File Parser - Simple key=value with [sections]
        // =============================================================================

        class ConfigParser {
          private:
            Map<String, Map<String, String>> sections_;
            String current_section_;
            Vector<String> errors_;

          public:
            ConfigParser() = default;

            auto parse(const String &content) -> VoidRes {
                errors_.clear();
                sections_.clear();
                current_section_ = "global";

                std::istringstream stream(std::string(content.c_str()));
                std::string line;
                usize line_num = 0;

                while (std::getline(stream, line)) {
                    ++line_num;
                    parse_line(line, line_num);
                }

                if (!errors_.empty()) {
                    String err_msg = "Config parse errors:\n";
                    for (const auto &e : errors_) {
                        err_msg = err_msg + "  " + e + "\n";
                    }
                    return result::err(err::config(err_msg.c_str()));
                }

                return result::ok();
            }

            [[nodiscard]] auto get(const String &section, const String &key) const -> Optional<String> {
                auto sec_it = sections_.find(section);
                if (sec_it == sections_.end()) {
                    return nullopt;
                }
                auto key_it = sec_it->second.find(key);
                if (key_it == sec_it->second.end()) {
                    return nullopt;
                }
                return key_it->second;
            }

            [[nodiscard]] auto get_or(const String &section, const String &key, const String &def) const -> String {
                auto val = get(section, key);
                return val.has_value() ? val.value() : def;
            }

            // Missing or empty values are reported with their section
            [[nodiscard]] auto require(const String &section, const String &key) const -> Res<String> {
                auto val = get(section, key);
                if (!val.has_value() || val->empty()) {
                    String msg = String("[") + section + "] is missing required key '" + key + "'";
                    return result::err(err::config(msg.c_str()));
                }
                return result::ok(val.value());
            }

            [[nodiscard]] auto has_section(const String &section) const -> boolean {
                return sections_.find(section) != sections_.end();
            }

            [[nodiscard]] auto section_count() const -> usize { return sections_.size(); }

          private:
            auto parse_line(const std::string &line, usize line_num) -> void {
                auto start = line.find_first_not_of(" \t\r\n");
                if (start == std::string::npos) {
                    return;
                }
                auto end = line.find_last_not_of(" \t\r\n");
                std::string trimmed = line.substr(start, end - start + 1);

                if (trimmed[0] == '#' || trimmed[0] == ';') {
                    return;
                }

                if (trimmed[0] == '[') {
                    auto close = trimmed.find(']');
                    if (close == std::string::npos) {
                        errors_.push_back(String("Line ") + to_str(static_cast<u64>(line_num)) +
                                          ": Unclosed section bracket");
                        return;
                    }
                    std::string name = trimmed.substr(1, close - 1);
                    if (name.empty()) {
                        errors_.push_back(String("Line ") + to_str(static_cast<u64>(line_num)) +
                                          ": Empty section name");
                        return;
                    }
                    current_section_ = String(name.c_str());
                    // Register the section even if it stays empty
                    sections_[current_section_];
                    return;
                }

                auto eq_pos = trimmed.find('=');
                if (eq_pos == std::string::npos) {
                    errors_.push_back(String("Line ") + to_str(static_cast<u64>(line_num)) +
                                      ": Expected '=' in key=value");
                    return;
                }

                std::string key = trimmed.substr(0, eq_pos);
                std::string value = trimmed.substr(eq_pos + 1);

                auto key_end = key.find_last_not_of(" \t");
                if (key_end == std::string::npos) {
                    errors_.push_back(String("Line ") + to_str(static_cast<u64>(line_num)) + ": Empty key");
                    return;
                }
                key = key.substr(0, key_end + 1);

                auto val_start = value.find_first_not_of(" \t");
                value = (val_start == std::string::npos) ? std::string() : value.substr(val_start);

                if (value.size() >= 2) {
                    if ((value.front() == '"' && value.back() == '"') ||
                        (value.front() == '\'' && value.back() == '\'')) {
                        value = value.substr(1, value.size() - 2);
                    }
                }

                sections_[current_section_][String(key.c_str())] = String(value.c_str());
            }
        };

        // =============================================================================
        // Topology Loader
        // =============================================================================

        namespace detail {

            inline auto link_section(usize i) -> String { return String("link.") + to_str(static_cast<u64>(i)); }

            inline auto namespace_section(usize i) -> String {
                return String("namespace.") + to_str(static_cast<u64>(i));
            }

            inline auto device_section(usize ns, usize dev) -> String {
                return namespace_section(ns) + ".device." + to_str(static_cast<u64>(dev));
            }

            // Entries are read up to MAX_CONFIG_ENTRIES; one more is an error, not a silent drop
            inline auto check_entry_limit(const ConfigParser &parser, const String &first_unread) -> VoidRes {
                if (parser.has_section(first_unread)) {
                    String msg = String("[") + first_unread + "] exceeds the limit of " +
                                 to_str(static_cast<u64>(MAX_CONFIG_ENTRIES)) + " entries";
                    return result::err(err::config(msg.c_str()));
                }
                return result::ok();
            }

        } // namespace detail

        // Parse topology text and validate the result
        [[nodiscard]] inline auto parse_config(const String &content) -> Res<Config> {
            ConfigParser parser;
            auto parse_res = parser.parse(content);
            if (parse_res.is_err()) {
                return result::err(parse_res.error());
            }

            Config config = default_config();

            if (parser.has_section("logging")) {
                config.logging.level = parser.get_or("logging", "level", "info");
            }

            for (usize i = 0; i < MAX_CONFIG_ENTRIES; ++i) {
                String section = detail::link_section(i);
                if (!parser.has_section(section)) {
                    break;
                }

                auto name = parser.require(section, "name");
                if (name.is_err()) {
                    return result::err(name.error());
                }

                auto mode_str = parser.get_or(section, "mode", "direct-link");
                auto mode = link_mode_from_string(mode_str);
                if (!mode.has_value()) {
                    String msg = String("[") + section + "] has unknown mode '" + mode_str + "'";
                    return result::err(err::config(msg.c_str()));
                }

                config.links.push_back(LinkConfig(name.value(), mode.value()));
            }

            auto links_fit = detail::check_entry_limit(parser, detail::link_section(MAX_CONFIG_ENTRIES));
            if (links_fit.is_err()) {
                return result::err(links_fit.error());
            }

            for (usize i = 0; i < MAX_CONFIG_ENTRIES; ++i) {
                String section = detail::namespace_section(i);
                if (!parser.has_section(section)) {
                    break;
                }

                auto name = parser.require(section, "name");
                if (name.is_err()) {
                    return result::err(name.error());
                }

                NamespaceConfig ns;
                ns.name = name.value();

                for (usize j = 0; j < MAX_CONFIG_ENTRIES; ++j) {
                    String dev_section = detail::device_section(i, j);
                    if (!parser.has_section(dev_section)) {
                        break;
                    }

                    auto dev_name = parser.require(dev_section, "name");
                    if (dev_name.is_err()) {
                        return result::err(dev_name.error());
                    }
                    auto cidr = parser.require(dev_section, "cidr");
                    if (cidr.is_err()) {
                        return result::err(cidr.error());
                    }

                    ns.devices.push_back(DeviceConfig(dev_name.value(), cidr.value()));
                }

                auto devices_fit = detail::check_entry_limit(parser, detail::device_section(i, MAX_CONFIG_ENTRIES));
                if (devices_fit.is_err()) {
                    return result::err(devices_fit.error());
                }

                config.namespaces.push_back(ns);
            }

            auto namespaces_fit = detail::check_entry_limit(parser, detail::namespace_section(MAX_CONFIG_ENTRIES));
            if (namespaces_fit.is_err()) {
                return result::err(namespaces_fit.error());
            }

            auto valid = validate(config);
            if (valid.is_err()) {
                return result::err(valid.error());
            }

            echo::debug("Loaded topology: ", config.links.size(), " links, ", config.namespaces.size(),
                        " namespaces");
            return result::ok(config);
        }

        [[nodiscard]] inline auto load_config_file(const String &path) -> Res<Config> {
            std::ifstream file(path.c_str());
            if (!file.is_open()) {
                String msg = String("Failed to open config file ") + path;
                return result::err(err::io(msg.c_str()));
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            return parse_config(String(buffer.str().c_str()));
        }

        // =============================================================================
        // Config Template Generator
        // =============================================================================

        [[nodiscard]] inline auto generate_config_template(boolean with_comments = true) -> String {
            std::ostringstream ss;

            if (with_comments) {
                ss << "# Netweave Topology File\n";
                ss << "# Two namespaces joined by one direct link\n\n";
            }

            ss << "[logging]\n";
            if (with_comments)
                ss << "# Log level: trace, debug, info, warn, error, critical\n";
            ss << "level = \"info\"\n\n";

            ss << "[link.0]\n";
            if (with_comments) {
                ss << "# Link name, also the device name prefix inside namespaces\n";
            }
            ss << "name = \"link0\"\n";
            if (with_comments)
                ss << "# Mode: direct-link or bridge\n";
            ss << "mode = \"direct-link\"\n\n";

            ss << "[namespace.0]\n";
            ss << "name = \"ns-a\"\n\n";
            ss << "[namespace.0.device.0]\n";
            if (with_comments)
                ss << "# Link this namespace connects to and the address it gets\n";
            ss << "name = \"link0\"\n";
            ss << "cidr = \"10.0.0.1/24\"\n\n";

            ss << "[namespace.1]\n";
            ss << "name = \"ns-b\"\n\n";
            ss << "[namespace.1.device.0]\n";
            ss << "name = \"link0\"\n";
            ss << "cidr = \"10.0.0.2/24\"\n";

            return String(ss.str().c_str());
        }

        // Serialize config to file format
        [[nodiscard]] inline auto serialize_config(const Config &config) -> String {
            std::ostringstream ss;

            ss << "[logging]\n";
            ss << "level = \"" << config.logging.level.c_str() << "\"\n";

            for (usize i = 0; i < config.links.size(); ++i) {
                const auto &link = config.links[i];
                ss << "\n[" << detail::link_section(i).c_str() << "]\n";
                ss << "name = \"" << link.name.c_str() << "\"\n";
                ss << "mode = \"" << link_mode_to_string(link.mode) << "\"\n";
            }

            for (usize i = 0; i < config.namespaces.size(); ++i) {
                const auto &ns = config.namespaces[i];
                ss << "\n[" << detail::namespace_section(i).c_str() << "]\n";
                ss << "name = \"" << ns.name.c_str() << "\"\n";

                for (usize j = 0; j < ns.devices.size(); ++j) {
                    ss << "\n[" << detail::device_section(i, j).c_str() << "]\n";
                    ss << "name = \"" << ns.devices[j].name.c_str() << "\"\n";
                    ss << "cidr = \"" << ns.devices[j].cidr.c_str() << "\"\n";
                }
            }

            return String(ss.str().c_str());
        }

        [[nodiscard]] inline auto save_config(const Config &config, const String &path) -> VoidRes {
            std::ofstream file(path.c_str());
            if (!file.is_open()) {
                String msg = String("Failed to create config file ") + path;
                return result::err(err::io(msg.c_str()));
            }

            String content = serialize_config(config);
            file << content.c_str();
            file.close();

            return result::ok();
        }

    } // namespace cfg

} // namespace netweave
