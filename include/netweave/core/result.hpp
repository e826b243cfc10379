/* SPDX-License-Identifier: MIT */
/*
 * Netweave Result Types
 * Convenience aliases for datapod Result types, error helpers and aggregation
 */

#pragma once

#include <datapod/datapod.hpp>

namespace netweave {

    using namespace dp;

    // =============================================================================
    // Result Type Aliases
    // =============================================================================

    // Generic result with custom error type
    template <typename T, typename E = Error> using Result = dp::Result<T, E>;

    // Result with default Error type
    template <typename T> using Res = dp::Res<T>;

    // Void result (operations that don't return a value)
    using VoidRes = dp::VoidRes;

    // =============================================================================
    // Result Factory Functions
    // =============================================================================

    namespace result {

        using dp::result::err;
        using dp::result::Err;
        using dp::result::ok;
        using dp::result::Ok;

    } // namespace result

    // =============================================================================
    // Error Creation Helpers
    // =============================================================================

    namespace err {

        inline auto io(const char *msg) -> Error { return Error::io_error(msg); }

        inline auto invalid(const char *msg) -> Error { return Error::invalid_argument(msg); }

        inline auto not_found(const char *msg) -> Error { return Error::not_found(msg); }

        inline auto permission(const char *msg) -> Error { return Error::permission_denied(msg); }

        // Resource is in the wrong lifecycle state for the requested operation
        inline auto precondition(const char *msg) -> Error { return Error::invalid_argument(msg); }

        // External command failed or could not be started
        inline auto command(const char *msg) -> Error { return Error::io_error(msg); }

        inline auto config(const char *msg) -> Error { return Error::invalid_argument(msg); }

        // Prefix an error with the resource it concerns, keeping its code
        inline auto context(const String &what, const Error &e) -> Error {
            Error wrapped = e;
            wrapped.message = what + ": " + e.message;
            return wrapped;
        }

    } // namespace err

    // =============================================================================
    // Error List - collects failures of operations that must not stop early
    // =============================================================================

    class ErrorList {
      private:
        Vector<Error> errors_;

      public:
        ErrorList() = default;

        auto append(const Error &e) -> void { errors_.push_back(e); }

        auto append(const VoidRes &res) -> void {
            if (res.is_err()) {
                errors_.push_back(res.error());
            }
        }

        [[nodiscard]] auto empty() const -> boolean { return errors_.empty(); }
        [[nodiscard]] auto size() const -> usize { return errors_.size(); }
        [[nodiscard]] auto errors() const -> const Vector<Error> & { return errors_; }

        // All messages joined with "; "
        [[nodiscard]] auto message() const -> String {
            String joined;
            for (usize i = 0; i < errors_.size(); ++i) {
                if (i > 0) {
                    joined = joined + "; ";
                }
                joined = joined + errors_[i].message;
            }
            return joined;
        }

        // Collapse into a single error carrying the code of the first failure
        [[nodiscard]] auto to_result() const -> VoidRes {
            if (errors_.empty()) {
                return result::ok();
            }
            Error combined = errors_[0];
            combined.message = message();
            return result::err(combined);
        }
    };

} // namespace netweave
