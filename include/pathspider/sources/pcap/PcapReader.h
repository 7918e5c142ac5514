// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/config/Config.h"
#include "pathspider/net/Packet.h"
#include "pathspider/net/PacketParser.h"

#include <pcap/pcap.h>

#include <cstdint>
#include <string>

namespace pathspider::net {

/**
 * @brief libpcap-backed PacketSource for live interfaces and recorded traces.
 *
 * Locators:
 *   int:<ifname>       live capture
 *   pcapfile:<path>    offline trace; exhausted() turns true at end of file
 *   <ifname>           shorthand for int:<ifname>
 */
class PcapReader : public PacketSource {
public:
    PcapReader() = default;
    ~PcapReader() override;

    PcapReader(const PcapReader&) = delete;
    PcapReader& operator=(const PcapReader&) = delete;

    void configure_from_config(const Config& cfg);

    bool open(const std::string& locator) override;
    void close() override;
    bool poll(const PacketHandler& handler, std::size_t budget = 32) override;
    bool exhausted() const override { return exhausted_; }

    std::uint64_t packets_seen() const noexcept { return packets_seen_; }
    std::uint64_t packets_undecodable() const noexcept { return packets_undecodable_; }

private:
    bool open_live(const std::string& ifname);
    bool open_offline(const std::string& path);
    bool apply_filter();
    bool resolve_link_type();

    static void on_packet(u_char* user, const struct pcap_pkthdr* hdr, const u_char* bytes);

    pcap_t* handle_{nullptr};
    LinkType link_{LinkType::Ethernet};
    bool offline_{false};
    bool exhausted_{false};

    std::string bpf_filter_;
    int snaplen_{262144};
    int timeout_ms_{100};

    const PacketHandler* current_handler_{nullptr};
    std::uint64_t packets_seen_{0};
    std::uint64_t packets_undecodable_{0};
};

} // namespace pathspider::net
