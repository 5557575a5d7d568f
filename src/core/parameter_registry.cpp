/*
 * <Parameter registry for default values, help and alias resolution>
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

#include "parameter_registry.h"

#include "src/core/geomval_logger.h"
#include "src/core/global.h"

#include <fmt/format.h>

ParameterRegistry& ParameterRegistry::getInstance()
{
    static ParameterRegistry instance;
    static bool initialized = false;
    if (!initialized) {
        initialized = true;
        initialize_parameter_definitions(instance);
    }
    return instance;
}

void ParameterRegistry::addDefinition(const std::string& module, ParameterDefinition&& def)
{
    std::string canonical_name = def.name;
    def.module = module;
    registry[module].push_back(std::move(def));

    alias_to_name_map[module][ToLower(canonical_name)] = canonical_name;
    const auto& added_def = registry[module].back();
    for (const auto& alias : added_def.aliases) {
        alias_to_name_map[module][ToLower(alias)] = canonical_name;
    }
}

const ParameterDefinition* ParameterRegistry::findDefinition(const std::string& module, const std::string& alias) const
{
    const std::string canonical_name = resolveAlias(module, alias);
    if (canonical_name.empty())
        return nullptr;

    auto registry_it = registry.find(module);
    if (registry_it != registry.end()) {
        for (const auto& def : registry_it->second) {
            if (def.name == canonical_name) {
                return &def;
            }
        }
    }

    return nullptr;
}

std::vector<ParameterDefinition> ParameterRegistry::getForModule(const std::string& module) const
{
    auto it = registry.find(module);
    if (it != registry.end()) {
        return it->second;
    }
    return {};
}

void ParameterRegistry::printHelp(const std::string& module) const
{
    auto it = registry.find(module);
    if (it == registry.end()) {
        GeomvalLogger::warn_fmt("No parameters registered for module: {}", module);
        return;
    }

    GeomvalLogger::header("Parameters for module: " + module);

    std::map<std::string, std::vector<const ParameterDefinition*>> by_category;
    for (const auto& param : it->second) {
        by_category[param.category].push_back(&param);
    }

    const json defaults = getDefaultJson(module);
    for (const auto& [category, params] : by_category) {
        GeomvalLogger::result_raw(fmt::format("\n[{}]", category));

        for (const auto* param : params) {
            std::string type;
            switch (param->type) {
            case ParamType::String:
                type = "string";
                break;
            case ParamType::Int:
                type = "int";
                break;
            case ParamType::Double:
                type = "double";
                break;
            case ParamType::Bool:
                type = "bool";
                break;
            }
            std::string line = fmt::format("  -{} <{}> (default: {})", param->name, type, defaults.value(param->name, json()).dump());
            if (!param->aliases.empty()) {
                line += " aliases:";
                for (const auto& alias : param->aliases)
                    line += " -" + alias;
            }
            GeomvalLogger::result_raw(line);
            GeomvalLogger::result_raw("      " + param->helpText);
        }
    }
}

json ParameterRegistry::getDefaultJson(const std::string& module) const
{
    json result = json::object();

    auto it = registry.find(module);
    if (it == registry.end()) {
        return result;
    }

    for (const auto& param : it->second) {
        try {
            switch (param.type) {
            case ParamType::String:
                result[param.name] = std::any_cast<std::string>(param.defaultValue);
                break;
            case ParamType::Int:
                result[param.name] = std::any_cast<int>(param.defaultValue);
                break;
            case ParamType::Double:
                result[param.name] = std::any_cast<double>(param.defaultValue);
                break;
            case ParamType::Bool:
                result[param.name] = std::any_cast<bool>(param.defaultValue);
                break;
            }
        } catch (const std::bad_any_cast&) {
            GeomvalLogger::warn_fmt("Failed to cast default value for parameter {} in module {}", param.name, module);
        }
    }

    return result;
}

bool ParameterRegistry::validateRegistry() const
{
    bool valid = true;

    for (const auto& [module, params] : registry) {
        std::map<std::string, int> name_counts;

        for (const auto& param : params) {
            if (++name_counts[ToLower(param.name)] > 1) {
                GeomvalLogger::error_fmt("Duplicate parameter '{}' in module '{}'", param.name, module);
                valid = false;
            }

            for (const auto& alias : param.aliases) {
                if (++name_counts[ToLower(alias)] > 1) {
                    GeomvalLogger::error_fmt("Alias '{}' conflicts with another name/alias in module '{}'", alias, module);
                    valid = false;
                }
            }
        }
    }

    return valid;
}

std::string ParameterRegistry::resolveAlias(const std::string& module, const std::string& alias) const
{
    auto module_it = alias_to_name_map.find(module);
    if (module_it == alias_to_name_map.end()) {
        return "";
    }

    auto alias_it = module_it->second.find(ToLower(alias));
    if (alias_it == module_it->second.end()) {
        return "";
    }

    return alias_it->second;
}
