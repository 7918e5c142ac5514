// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/observer/PortFilter.h"

namespace pathspider::observer {

PortFilter::PortFilter(const std::vector<std::pair<uint16_t, uint16_t>>& ranges) {
    for (const auto& [lo, hi] : ranges) {
        add(lo, hi);
    }
}

void PortFilter::add(uint16_t lo, uint16_t hi) {
    ports_.add(boost::icl::interval<uint16_t>::closed(lo, hi));
}

bool PortFilter::contains(uint16_t port) const {
    return boost::icl::contains(ports_, port);
}

bool PortFilter::matches(uint16_t src_port, uint16_t dst_port) const {
    if (ports_.empty()) return true;
    return contains(src_port) || contains(dst_port);
}

} // namespace pathspider::observer
