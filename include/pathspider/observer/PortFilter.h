// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <boost/icl/interval_set.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace pathspider::observer {

/**
 * @brief Set of transport port ranges the observer cares about.
 *
 * An empty filter accepts every port. A packet matches when either its
 * source or destination port is in the set.
 */
class PortFilter {
public:
    PortFilter() = default;
    explicit PortFilter(const std::vector<std::pair<uint16_t, uint16_t>>& ranges);

    void add(uint16_t lo, uint16_t hi);
    bool empty() const { return ports_.empty(); }
    bool contains(uint16_t port) const;
    bool matches(uint16_t src_port, uint16_t dst_port) const;

private:
    boost::icl::interval_set<uint16_t> ports_;
};

} // namespace pathspider::observer
