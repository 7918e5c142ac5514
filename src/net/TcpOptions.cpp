// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/net/TcpOptions.h"

namespace pathspider::net {

FastOpenOption parse_fast_open(const uint8_t* options, std::size_t length) noexcept {
    if (!options) return FastOpenOption::Absent;

    std::size_t i = 0;
    while (i < length) {
        const uint8_t kind = options[i];
        if (kind == kTcpOptEol) {
            return FastOpenOption::Absent;
        }
        if (kind == kTcpOptNop) {
            ++i;
            continue;
        }

        // Everything else has a length byte.
        if (i + 1 >= length) {
            return FastOpenOption::Absent;
        }
        const std::size_t opt_len = options[i + 1];
        if (opt_len < 2 || i + opt_len > length) {
            return FastOpenOption::Absent;
        }

        if (kind == kTcpOptFastOpen) {
            return opt_len == 2 ? FastOpenOption::Request : FastOpenOption::Cookie;
        }

        if ((kind == kTcpOptExpA || kind == kTcpOptExpB) && opt_len >= 4) {
            const uint16_t magic = static_cast<uint16_t>((options[i + 2] << 8) | options[i + 3]);
            if (magic == kFastOpenExpMagic) {
                return opt_len == 4 ? FastOpenOption::Request : FastOpenOption::Cookie;
            }
        }

        i += opt_len;
    }
    return FastOpenOption::Absent;
}

const char* to_string(FastOpenOption opt) noexcept {
    switch (opt) {
        case FastOpenOption::Absent:  return "absent";
        case FastOpenOption::Request: return "request";
        case FastOpenOption::Cookie:  return "cookie";
    }
    return "?";
}

} // namespace pathspider::net
