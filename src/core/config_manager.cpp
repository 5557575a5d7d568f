/*
 * <Configuration manager merging registered defaults with user input>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "config_manager.h"

#include "src/core/geomval_logger.h"
#include "src/core/global.h"
#include "src/core/parameter_registry.h"

ConfigManager::ConfigManager(const std::string& module, const json& user_input)
    : m_module(module)
{
    auto& registry = ParameterRegistry::getInstance();
    m_config = registry.getDefaultJson(module);

    if (user_input.is_null())
        return;
    if (!user_input.is_object())
        throw std::runtime_error("ConfigManager: configuration for module '" + module + "' must be a JSON object");

    json patch = json::object();
    for (const auto& item : user_input.items()) {
        std::string resolved_key = registry.resolveAlias(module, item.key());

        if (!resolved_key.empty() && m_config.contains(resolved_key)) {
            m_config[resolved_key] = item.value();
#ifdef GEOMVAL_DEBUG
            GeomvalLogger::debug(3, fmt::format("[ConfigManager] Alias resolved: {} -> {}", item.key(), resolved_key));
#endif
            continue;
        }
        GeomvalLogger::warn_fmt("Unknown parameter '{}' for module '{}' is ignored", item.key(), module);
        patch[item.key()] = item.value();
    }
    m_config = MergeJson(m_config, patch);
}

bool ConfigManager::has(const std::string& key) const
{
    try {
        findKey(key);
    } catch (const std::runtime_error&) {
        return false;
    }
    return true;
}

json ConfigManager::findKey(const std::string& key) const
{
    std::string lookup = ParameterRegistry::getInstance().resolveAlias(m_module, key);
    if (lookup.empty())
        lookup = key;

    const std::string lookup_lower = ToLower(lookup);
    for (const auto& item : m_config.items()) {
        if (ToLower(item.key()) == lookup_lower)
            return item.value();
    }

    throw std::runtime_error("ConfigManager: Parameter '" + key + "' not found in module '" + m_module + "'");
}
