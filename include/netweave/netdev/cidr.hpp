/* SPDX-License-Identifier: MIT */
/*
 * Netweave CIDR
 * Address-plus-prefix parsing for device subnets (IPv4 and IPv6)
 */

#pragma once

#include <arpa/inet.h>
#include <datapod/datapod.hpp>
#include <netinet/in.h>
#include <netweave/core/result.hpp>
#include <netweave/core/types.hpp>

namespace netweave {

    using namespace dp;

    namespace netdev {

        struct Cidr {
            String addr;
            u8 prefix_len = 0;
            boolean ipv6 = false;

            Cidr() = default;

            [[nodiscard]] auto is_ipv4() const -> boolean { return !ipv6; }
            [[nodiscard]] auto is_ipv6() const -> boolean { return ipv6; }

            [[nodiscard]] auto to_string() const -> String { return addr + "/" + to_str(prefix_len); }

            auto members() noexcept { return std::tie(addr, prefix_len, ipv6); }
            auto members() const noexcept { return std::tie(addr, prefix_len, ipv6); }
        };

        // Strict parse: "<address>/<prefix>", prefix bounded by the address family
        [[nodiscard]] inline auto parse_cidr(const String &text) -> Res<Cidr> {
            auto slash_pos = text.find('/');
            if (slash_pos == String::npos) {
                String msg = String("invalid CIDR address: ") + text;
                return result::err(err::invalid(msg.c_str()));
            }

            Cidr cidr;
            cidr.addr = String(text.c_str(), slash_pos);

            unsigned char buf[sizeof(struct in6_addr)];
            if (inet_pton(AF_INET, cidr.addr.c_str(), buf) == 1) {
                cidr.ipv6 = false;
            } else if (inet_pton(AF_INET6, cidr.addr.c_str(), buf) == 1) {
                cidr.ipv6 = true;
            } else {
                String msg = String("invalid CIDR address: ") + text;
                return result::err(err::invalid(msg.c_str()));
            }

            usize digits = text.size() - slash_pos - 1;
            if (digits == 0 || digits > 3) {
                String msg = String("invalid CIDR address: ") + text;
                return result::err(err::invalid(msg.c_str()));
            }

            u32 prefix = 0;
            for (usize i = slash_pos + 1; i < text.size(); ++i) {
                char c = text[i];
                if (c < '0' || c > '9') {
                    String msg = String("invalid CIDR address: ") + text;
                    return result::err(err::invalid(msg.c_str()));
                }
                prefix = prefix * 10 + static_cast<u32>(c - '0');
            }

            u32 max_prefix = cidr.ipv6 ? 128 : 32;
            if (prefix > max_prefix) {
                String msg = String("invalid CIDR address: ") + text;
                return result::err(err::invalid(msg.c_str()));
            }

            cidr.prefix_len = static_cast<u8>(prefix);
            return result::ok(cidr);
        }

    } // namespace netdev

} // namespace netweave
