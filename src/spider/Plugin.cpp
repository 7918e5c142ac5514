// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Plugin.h"

namespace pathspider::spider {

nlohmann::json Plugin::flow_features(const observer::FlowRecord&) const {
    return nlohmann::json::object();
}

MergedRecord Plugin::merge(const observer::FlowObservation& flow, const ActiveRecord& active) const {
    MergedRecord merged;
    merged.active = active;
    if (const auto* rec = std::get_if<observer::FlowRecord>(&flow)) {
        merged.flow = *rec;
        merged.features = flow_features(*rec);
    }
    return merged;
}

} // namespace pathspider::spider
