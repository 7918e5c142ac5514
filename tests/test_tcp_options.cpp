// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/net/TcpOptions.h"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <vector>

using pathspider::net::FastOpenOption;
using pathspider::net::parse_fast_open;

static FastOpenOption parse(const std::vector<uint8_t>& opts) {
    return parse_fast_open(opts.data(), opts.size());
}

int main() {
    // Padding only.
    assert(parse({1, 1, 0}) == FastOpenOption::Absent);
    assert(parse({}) == FastOpenOption::Absent);
    assert(parse_fast_open(nullptr, 4) == FastOpenOption::Absent);

    // Kind 34 with length 2 is a cookie request.
    assert(parse({34, 2}) == FastOpenOption::Request);
    assert(parse({1, 1, 34, 2}) == FastOpenOption::Request);

    // Kind 34 with an 8 byte cookie.
    assert(parse({34, 10, 1, 2, 3, 4, 5, 6, 7, 8}) == FastOpenOption::Cookie);
    assert(pathspider::net::has_fast_open_cookie(
        std::vector<uint8_t>{34, 10, 1, 2, 3, 4, 5, 6, 7, 8}.data(), 10));

    // Fast Open after MSS, SACK permitted and timestamps.
    std::vector<uint8_t> syn_opts{
        2, 4, 0x05, 0xb4,                 // MSS 1460
        4, 2,                             // SACK permitted
        8, 10, 0, 0, 0, 1, 0, 0, 0, 0,    // timestamps
        34, 6, 0xde, 0xad, 0xbe, 0xef,    // cookie
    };
    assert(parse(syn_opts) == FastOpenOption::Cookie);

    // Experimental option with the Fast Open magic, request and cookie forms.
    assert(parse({253, 4, 0xF9, 0x89}) == FastOpenOption::Request);
    assert(parse({254, 8, 0xF9, 0x89, 1, 2, 3, 4}) == FastOpenOption::Cookie);
    // Experimental option carrying some other magic is not Fast Open.
    assert(parse({253, 4, 0x12, 0x34}) == FastOpenOption::Absent);

    // Truncated: length byte missing, or length overruns the buffer.
    assert(parse({34}) == FastOpenOption::Absent);
    assert(parse({2, 4, 0x05}) == FastOpenOption::Absent);
    assert(parse({34, 10, 1, 2}) == FastOpenOption::Absent);
    // A length below 2 would never advance.
    assert(parse({2, 0, 34, 2}) == FastOpenOption::Absent);
    assert(parse({2, 1, 34, 2}) == FastOpenOption::Absent);

    // Nothing is read past an end-of-list marker.
    assert(parse({0, 34, 2}) == FastOpenOption::Absent);

    assert(std::strcmp(pathspider::net::to_string(FastOpenOption::Cookie), "cookie") == 0);
    assert(std::strcmp(pathspider::net::to_string(FastOpenOption::Request), "request") == 0);

    return 0;
}
