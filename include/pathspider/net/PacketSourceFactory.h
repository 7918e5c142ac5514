// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/config/Config.h"
#include "pathspider/net/Packet.h"

namespace pathspider::net {

class IPacketSourceFactory {
public:
    virtual ~IPacketSourceFactory() = default;
    virtual PacketSourcePtr create(const Config& cfg) const = 0;
};

/// Creates a PcapReader configured from the observer section.
class DefaultPacketSourceFactory : public IPacketSourceFactory {
public:
    PacketSourcePtr create(const Config& cfg) const override;
};

// Uses the default factory, or the test override when one is installed.
PacketSourcePtr create_packet_source(const Config& cfg);

const IPacketSourceFactory& default_packet_source_factory();

// For tests: override the factory used by create_packet_source.
void set_packet_source_factory_for_tests(const IPacketSourceFactory* factory);

} // namespace pathspider::net
