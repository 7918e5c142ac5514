// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/sources/pcap/PcapReader.h"

#include "pathspider/log/Log.h"

namespace pathspider::net {

namespace {

constexpr const char* kLivePrefix = "int:";
constexpr const char* kFilePrefix = "pcapfile:";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // namespace

PcapReader::~PcapReader() {
    close();
}

void PcapReader::configure_from_config(const Config& cfg) {
    bpf_filter_ = cfg.observer.bpf_filter;
    snaplen_ = static_cast<int>(cfg.observer.snaplen);
    timeout_ms_ = static_cast<int>(cfg.observer.read_timeout_ms);
}

bool PcapReader::open(const std::string& locator) {
    close();
    exhausted_ = false;

    bool ok = false;
    if (starts_with(locator, kFilePrefix)) {
        ok = open_offline(locator.substr(std::char_traits<char>::length(kFilePrefix)));
    } else if (starts_with(locator, kLivePrefix)) {
        ok = open_live(locator.substr(std::char_traits<char>::length(kLivePrefix)));
    } else {
        ok = open_live(locator);
    }
    if (!ok) {
        close();
        return false;
    }
    if (!resolve_link_type() || !apply_filter()) {
        close();
        return false;
    }
    PSLOG_INFO("Capture source %s opened (filter: %s)",
               locator.c_str(), bpf_filter_.empty() ? "none" : bpf_filter_.c_str());
    return true;
}

bool PcapReader::open_live(const std::string& ifname) {
    if (ifname.empty()) {
        PSLOG_ERROR("Empty interface name in capture locator");
        return false;
    }
    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_create(ifname.c_str(), errbuf);
    if (!handle_) {
        PSLOG_ERROR("pcap_create(%s) failed: %s", ifname.c_str(), errbuf);
        return false;
    }
    if (pcap_set_snaplen(handle_, snaplen_) != 0 ||
        pcap_set_promisc(handle_, 0) != 0 ||
        pcap_set_timeout(handle_, timeout_ms_) != 0 ||
        pcap_set_immediate_mode(handle_, 1) != 0) {
        PSLOG_ERROR("Failed to configure capture on %s", ifname.c_str());
        return false;
    }

    const int status = pcap_activate(handle_);
    if (status < 0) {
        PSLOG_ERROR("pcap_activate(%s) failed: %s", ifname.c_str(), pcap_geterr(handle_));
        return false;
    }
    if (status > 0) {
        PSLOG_WARN("pcap_activate(%s) warning: %s", ifname.c_str(), pcap_geterr(handle_));
    }
    offline_ = false;
    return true;
}

bool PcapReader::open_offline(const std::string& path) {
    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_open_offline(path.c_str(), errbuf);
    if (!handle_) {
        PSLOG_ERROR("pcap_open_offline(%s) failed: %s", path.c_str(), errbuf);
        return false;
    }
    offline_ = true;
    return true;
}

bool PcapReader::resolve_link_type() {
    switch (pcap_datalink(handle_)) {
        case DLT_EN10MB:
            link_ = LinkType::Ethernet;
            return true;
        case DLT_LINUX_SLL:
            link_ = LinkType::LinuxSll;
            return true;
        case DLT_RAW:
        case DLT_IPV4:
        case DLT_IPV6:
            link_ = LinkType::RawIp;
            return true;
        default:
            PSLOG_ERROR("Unsupported capture link type %d", pcap_datalink(handle_));
            return false;
    }
}

bool PcapReader::apply_filter() {
    if (bpf_filter_.empty()) return true;

    struct bpf_program program {};
    if (pcap_compile(handle_, &program, bpf_filter_.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
        PSLOG_ERROR("Invalid BPF filter '%s': %s", bpf_filter_.c_str(), pcap_geterr(handle_));
        return false;
    }
    const int rc = pcap_setfilter(handle_, &program);
    pcap_freecode(&program);
    if (rc != 0) {
        PSLOG_ERROR("pcap_setfilter failed: %s", pcap_geterr(handle_));
        return false;
    }
    return true;
}

void PcapReader::close() {
    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
}

void PcapReader::on_packet(u_char* user, const struct pcap_pkthdr* hdr, const u_char* bytes) {
    auto* self = reinterpret_cast<PcapReader*>(user);
    ++self->packets_seen_;

    PacketView view{};
    if (!PacketParser::decode(bytes, hdr->caplen, view, self->link_)) {
        ++self->packets_undecodable_;
        return;
    }
    view.timestamp_ns = static_cast<uint64_t>(hdr->ts.tv_sec) * 1000000000ULL +
                        static_cast<uint64_t>(hdr->ts.tv_usec) * 1000ULL;
    (*self->current_handler_)(view);
}

bool PcapReader::poll(const PacketHandler& handler, std::size_t budget) {
    if (!handle_) return false;
    if (exhausted_) return true;

    current_handler_ = &handler;
    const int rc = pcap_dispatch(handle_, static_cast<int>(budget), &PcapReader::on_packet,
                                 reinterpret_cast<u_char*>(this));
    current_handler_ = nullptr;

    if (rc == PCAP_ERROR) {
        PSLOG_ERROR("pcap_dispatch failed: %s", pcap_geterr(handle_));
        return false;
    }
    if (rc == 0 && offline_) {
        exhausted_ = true;
    }
    return true;
}

} // namespace pathspider::net
