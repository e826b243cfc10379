/* SPDX-License-Identifier: MIT */
/*
 * Netweave Command Runners
 * Abstract command execution with a process backend and a recording backend
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>
#include <netweave/exec/command.hpp>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace netweave {

    using namespace dp;

    namespace exec {

        // =============================================================================
        // Command Runner Interface (Abstract)
        // =============================================================================

        class CommandRunner {
          public:
            virtual ~CommandRunner() = default;

            // Run to completion; a non-zero exit is an error
            virtual auto run(const Command &cmd) -> VoidRes = 0;
        };

        // =============================================================================
        // Process Runner - fork/execvp, output captured for error reports
        // =============================================================================

        class ProcessRunner : public CommandRunner {
          public:
            ProcessRunner() = default;

            auto run(const Command &cmd) -> VoidRes override {
                if (cmd.empty()) {
                    return result::err(err::invalid("Empty command"));
                }

                int pipefd[2];
                if (pipe(pipefd) < 0) {
                    return result::err(err::command(std::strerror(errno)));
                }

                pid_t pid = fork();
                if (pid < 0) {
                    close(pipefd[0]);
                    close(pipefd[1]);
                    return result::err(err::command(std::strerror(errno)));
                }

                if (pid == 0) {
                    dup2(pipefd[1], STDOUT_FILENO);
                    dup2(pipefd[1], STDERR_FILENO);
                    close(pipefd[0]);
                    close(pipefd[1]);

                    std::vector<char *> args;
                    args.reserve(cmd.argv.size() + 1);
                    for (const auto &a : cmd.argv) {
                        args.push_back(const_cast<char *>(a.c_str()));
                    }
                    args.push_back(nullptr);

                    execvp(args[0], args.data());
                    _exit(127);
                }

                close(pipefd[1]);

                std::string output;
                char buf[256];
                for (;;) {
                    ssize_t n = read(pipefd[0], buf, sizeof(buf));
                    if (n > 0) {
                        output.append(buf, static_cast<usize>(n));
                    } else if (n < 0 && errno == EINTR) {
                        continue;
                    } else {
                        break;
                    }
                }
                close(pipefd[0]);

                int status = 0;
                while (waitpid(pid, &status, 0) < 0) {
                    if (errno != EINTR) {
                        return result::err(err::command(std::strerror(errno)));
                    }
                }

                if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
                    return result::ok();
                }

                auto last = output.find_last_not_of(" \t\r\n");
                output = (last == std::string::npos) ? std::string() : output.substr(0, last + 1);

                String msg = String("`") + cmd.to_string() + "` ";
                if (WIFEXITED(status)) {
                    msg = msg + "exited with status " + to_str(static_cast<i32>(WEXITSTATUS(status)));
                } else {
                    msg = msg + "terminated abnormally";
                }
                if (!output.empty()) {
                    msg = msg + ": " + String(output.c_str());
                }
                return result::err(err::command(msg.c_str()));
            }
        };

        // =============================================================================
        // Recording Runner (for testing without privileges)
        // =============================================================================

        class RecordingRunner : public CommandRunner {
          private:
            Vector<Command> commands_;
            Vector<String> fail_fragments_;

          public:
            RecordingRunner() = default;

            // Every command is recorded, including the ones made to fail
            auto run(const Command &cmd) -> VoidRes override {
                commands_.push_back(cmd);
                for (const auto &fragment : fail_fragments_) {
                    if (cmd.contains(fragment)) {
                        echo::debug("RecordingRunner: failing ", cmd.to_string().c_str());
                        String msg = String("`") + cmd.to_string() + "` failed (injected)";
                        return result::err(err::command(msg.c_str()));
                    }
                }
                return result::ok();
            }

            // Test helpers
            auto fail_when(const String &fragment) -> void { fail_fragments_.push_back(fragment); }

            auto clear_failures() -> void { fail_fragments_.clear(); }

            auto clear() -> void { commands_.clear(); }

            [[nodiscard]] auto commands() const -> const Vector<Command> & { return commands_; }

            [[nodiscard]] auto count(const String &fragment) const -> usize {
                usize n = 0;
                for (const auto &cmd : commands_) {
                    if (cmd.contains(fragment)) {
                        ++n;
                    }
                }
                return n;
            }
        };

    } // namespace exec

} // namespace netweave
