// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/plugins/PluginRegistry.h"

#include "pathspider/plugins/EcnSpider.h"
#include "pathspider/plugins/TfoSpider.h"

namespace pathspider::plugins {

PluginRegistry PluginRegistry::builtin() {
    PluginRegistry reg;
    reg.add("tfo", [] { return std::make_unique<TfoSpider>(); });
    reg.add("ecn", [] { return std::make_unique<EcnSpider>(); });
    return reg;
}

void PluginRegistry::add(const std::string& name, Factory factory) {
    factories_[name] = std::move(factory);
}

std::unique_ptr<spider::Plugin> PluginRegistry::create(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) return nullptr;
    return it->second();
}

std::vector<std::string> PluginRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
}

} // namespace pathspider::plugins
