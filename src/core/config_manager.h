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

#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Configuration manager for geomval modules
 *
 * Loads the defaults of a module from the ParameterRegistry and merges the
 * user-provided configuration on top of them. Keys are matched
 * case-insensitively and registered aliases are resolved to their canonical
 * name.
 *
 * ```cpp
 * ConfigManager config("geometryloss", user_json);
 * double threshold = config.get<double>("clash_threshold");
 * int verbosity = config.get<int>("verbosity", 1);
 * ```
 */
class ConfigManager {
public:
    /*! \brief Load defaults for module and merge with user input
     *
     * @param module Module name (e.g. "geometryloss")
     * @param user_input User-provided configuration
     */
    ConfigManager(const std::string& module, const json& user_input);

    /*! \brief Type-safe parameter access
     *
     * @throws std::runtime_error if the parameter is not found or has the wrong type
     */
    template <typename T>
    T get(const std::string& key) const;

    /*! \brief Type-safe parameter access returning default_value if key is missing
     */
    template <typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;

    json exportConfig() const { return m_config; }

    std::string getModule() const { return m_module; }

private:
    std::string m_module;
    json m_config;

    /*! \brief Case-insensitive, alias-aware key lookup
     *
     * @throws std::runtime_error if not found
     */
    json findKey(const std::string& key) const;
};

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    json value = findKey(key);
    try {
        return value.get<T>();
    } catch (const json::type_error& error) {
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' in module '" + m_module + "' has unexpected type: " + error.what());
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key))
        return default_value;
    return get<T>(key);
}
