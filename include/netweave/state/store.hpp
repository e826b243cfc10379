/* SPDX-License-Identifier: MIT */
/*
 * Netweave State Store
 * Location and file handling of the persisted topology snapshot
 */

#pragma once

#include <cstdio>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <filesystem>
#include <fstream>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <sstream>
#include <system_error>

namespace netweave {

    using namespace dp;

    namespace state {

        // Single writer only: there is no locking around the file
        class StateStore {
          private:
            String dir_;

          public:
            explicit StateStore(String dir) : dir_(std::move(dir)) {}

            // $HOME/.netweave
            [[nodiscard]] static auto default_dir() -> Res<String> {
                const char *home = std::getenv("HOME");
                if (home == nullptr || home[0] == '\0') {
                    return result::err(err::not_found("HOME is not set"));
                }
                return result::ok(String(home) + "/" + STATE_DIR_NAME);
            }

            [[nodiscard]] auto dir() const -> const String & { return dir_; }

            [[nodiscard]] auto path() const -> String { return dir_ + "/" + STATE_FILE_NAME; }

            [[nodiscard]] auto exists() const -> boolean {
                std::error_code ec;
                return std::filesystem::exists(std::filesystem::path(path().c_str()), ec);
            }

            // Empty when nothing has been saved
            [[nodiscard]] auto read() const -> Res<Optional<String>> {
                if (!exists()) {
                    return result::ok(Optional<String>());
                }

                std::ifstream file(path().c_str());
                if (!file.is_open()) {
                    String msg = String("Failed to open ") + path();
                    return result::err(err::io(msg.c_str()));
                }

                std::stringstream buffer;
                buffer << file.rdbuf();
                return result::ok(Optional<String>(String(buffer.str().c_str())));
            }

            // Writes a sibling temp file and renames it over the state file
            [[nodiscard]] auto write(const String &content) -> VoidRes {
                std::error_code ec;
                std::filesystem::create_directories(std::filesystem::path(dir_.c_str()), ec);
                if (ec) {
                    String msg = String("failed to create ") + dir_ + ": " + String(ec.message().c_str());
                    return result::err(err::io(msg.c_str()));
                }

                String tmp = path() + ".tmp";
                {
                    std::ofstream file(tmp.c_str(), std::ios::out | std::ios::trunc);
                    if (!file.is_open()) {
                        String msg = String("Failed to create ") + tmp;
                        return result::err(err::io(msg.c_str()));
                    }
                    file << content.c_str();
                    file.flush();
                    if (!file) {
                        String msg = String("Failed to write ") + tmp;
                        return result::err(err::io(msg.c_str()));
                    }
                }

                if (std::rename(tmp.c_str(), path().c_str()) != 0) {
                    std::remove(tmp.c_str());
                    String msg = String("Failed to replace ") + path();
                    return result::err(err::io(msg.c_str()));
                }

                echo::debug("state saved to ", path().c_str());
                return result::ok();
            }

            // A missing file is already the desired outcome
            [[nodiscard]] auto remove() -> VoidRes {
                std::error_code ec;
                boolean removed = std::filesystem::remove(std::filesystem::path(path().c_str()), ec);
                if (ec) {
                    String msg = String("failed to remove ") + path() + ": " + String(ec.message().c_str());
                    return result::err(err::io(msg.c_str()));
                }
                if (removed) {
                    echo::debug("state file ", path().c_str(), " removed");
                }
                return result::ok();
            }
        };

    } // namespace state

} // namespace netweave
