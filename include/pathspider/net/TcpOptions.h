// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file TcpOptions.h
 * @brief Bounds-checked decoder for the TCP Fast Open option.
 */
#include <cstddef>
#include <cstdint>

namespace pathspider::net {

constexpr uint8_t kTcpOptEol = 0;
constexpr uint8_t kTcpOptNop = 1;
constexpr uint8_t kTcpOptFastOpen = 34;
constexpr uint8_t kTcpOptExpA = 253;
constexpr uint8_t kTcpOptExpB = 254;
constexpr uint16_t kFastOpenExpMagic = 0xF989;

/**
 * @brief What the options region says about Fast Open.
 */
enum class FastOpenOption {
    Absent,    ///< No Fast Open option, or the options were malformed.
    Request,   ///< Cookie-less marker: the sender asks for a cookie.
    Cookie     ///< A cookie is present.
};

/**
 * @brief Scan a TCP options region for the Fast Open option.
 *
 * Recognises kind 34 and the experimental kinds 253/254 followed by the
 * 0xF989 magic. Never reads outside [options, options + length); a truncated
 * or malformed option yields Absent.
 */
FastOpenOption parse_fast_open(const uint8_t* options, std::size_t length) noexcept;

inline bool has_fast_open_cookie(const uint8_t* options, std::size_t length) noexcept {
    return parse_fast_open(options, length) == FastOpenOption::Cookie;
}

const char* to_string(FastOpenOption opt) noexcept;

} // namespace pathspider::net
