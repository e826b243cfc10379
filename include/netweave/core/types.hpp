/* SPDX-License-Identifier: MIT */
/*
 * Netweave Core Types
 * Shared constants, link modes and string helpers on datapod primitives
 */

#pragma once

#include <datapod/datapod.hpp>

namespace netweave {

    using namespace dp;

    // =============================================================================
    // Number to String Helpers (avoid std::to_string)
    // =============================================================================

    namespace detail {
        template <typename T> inline auto num_to_string(T value) -> String {
            if (value == 0) {
                return String("0");
            }

            boolean negative = false;
            if constexpr (std::is_signed_v<T>) {
                if (value < 0) {
                    negative = true;
                    value = -value;
                }
            }

            char buf[32];
            usize idx = 31;
            buf[idx] = '\0';

            while (value > 0 && idx > 0) {
                --idx;
                buf[idx] = '0' + static_cast<char>(value % 10);
                value /= 10;
            }

            if (negative && idx > 0) {
                --idx;
                buf[idx] = '-';
            }

            return String(&buf[idx]);
        }
    } // namespace detail

    inline auto to_str(u8 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u16 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u32 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u64 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(i32 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(i64 v) -> String { return detail::num_to_string(v); }

    // True when `prefix` is a prefix of `s` (an empty prefix matches everything)
    inline auto has_prefix(const String &s, const String &prefix) -> boolean {
        if (prefix.size() > s.size()) {
            return false;
        }
        for (usize i = 0; i < prefix.size(); ++i) {
            if (s[i] != prefix[i]) {
                return false;
            }
        }
        return true;
    }

    // =============================================================================
    // Constants
    // =============================================================================

    // IFNAMSIZ includes the terminating NUL
    inline constexpr usize MAX_IFNAME_LEN = 15;
    inline constexpr usize MAX_BRIDGE_PORTS = 100;
    inline constexpr usize MAX_CONFIG_ENTRIES = 64;

    inline constexpr const char *VETH_LEFT_SUFFIX = "-left";
    inline constexpr const char *VETH_RIGHT_SUFFIX = "-right";

    inline constexpr const char *STATE_DIR_NAME = ".netweave";
    inline constexpr const char *STATE_FILE_NAME = "state.json";

    // Longest link names that still leave room for the generated interface names
    inline constexpr usize MAX_DIRECT_LINK_NAME_LEN = MAX_IFNAME_LEN - 6; // "-right"
    inline constexpr usize MAX_BRIDGE_NAME_LEN = MAX_IFNAME_LEN - 6 - 2;  // port index + "-right"

    // =============================================================================
    // Link Mode
    // =============================================================================

    enum class LinkMode : u8 {
        DirectLink = 0, // veth pair between exactly two namespaces
        Bridge = 1,     // bridge device with one veth port per namespace
    };

    [[nodiscard]] inline auto link_mode_to_string(LinkMode mode) -> const char * {
        switch (mode) {
        case LinkMode::DirectLink:
            return "direct-link";
        case LinkMode::Bridge:
            return "bridge";
        default:
            return "unknown";
        }
    }

    [[nodiscard]] inline auto link_mode_from_string(const String &s) -> Optional<LinkMode> {
        if (s == "direct-link") {
            return LinkMode::DirectLink;
        }
        if (s == "bridge") {
            return LinkMode::Bridge;
        }
        return nullopt;
    }

} // namespace netweave
