// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Plugin.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pathspider::plugins {

/**
 * @brief Name -> factory map of the measurement plugins.
 */
class PluginRegistry {
public:
    using Factory = std::function<std::unique_ptr<spider::Plugin>()>;

    /// Registry preloaded with the built-in plugins.
    static PluginRegistry builtin();

    void add(const std::string& name, Factory factory);

    /// nullptr when @p name is unknown.
    std::unique_ptr<spider::Plugin> create(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, Factory> factories_;
};

} // namespace pathspider::plugins
