// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/net/PacketSourceFactory.h"

#include "pathspider/sources/pcap/PcapReader.h"

namespace pathspider::net {
namespace {
const IPacketSourceFactory* g_factory_override = nullptr;
}

PacketSourcePtr DefaultPacketSourceFactory::create(const Config& cfg) const {
    auto reader = std::make_unique<PcapReader>();
    reader->configure_from_config(cfg);
    return reader;
}

const IPacketSourceFactory& default_packet_source_factory() {
    static DefaultPacketSourceFactory factory;
    return factory;
}

PacketSourcePtr create_packet_source(const Config& cfg) {
    if (g_factory_override) {
        return g_factory_override->create(cfg);
    }
    return default_packet_source_factory().create(cfg);
}

void set_packet_source_factory_for_tests(const IPacketSourceFactory* factory) {
    g_factory_override = factory;
}

} // namespace pathspider::net
