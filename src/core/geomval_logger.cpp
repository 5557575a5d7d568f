/*
 * <Geomval Logging System Implementation>
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

#include "geomval_logger.h"

#include <cstdlib>
#include <unistd.h>

int GeomvalLogger::m_verbosity = 1;
bool GeomvalLogger::m_use_colors = true;
std::FILE* GeomvalLogger::m_output = stdout;
std::chrono::high_resolution_clock::time_point GeomvalLogger::m_start_time = std::chrono::high_resolution_clock::now();

void GeomvalLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;

    if (auto_detect_colors)
        m_use_colors = isatty(STDOUT_FILENO) && (std::getenv("GEOMVAL_NO_COLOR") == nullptr);

    m_start_time = std::chrono::high_resolution_clock::now();
}

void GeomvalLogger::error(const std::string& msg)
{
    // Errors always visible
    log_colored(fmt::color::red, "[ERROR] ", msg, true);
}

void GeomvalLogger::warn(const std::string& msg)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::orange, "[WARN]  ", msg);
}

void GeomvalLogger::param(const std::string& key, int value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + std::to_string(value));
}

void GeomvalLogger::param_table(const json& parameters, const std::string& title)
{
    if (m_verbosity < 1 || parameters.empty())
        return;

    log_colored(fmt::color::cyan, "[TABLE] ", title);
    log_plain("        " + std::string(title.length() + 8, '-'));

    size_t max_key_length = 0;
    for (const auto& item : parameters.items())
        max_key_length = std::max(max_key_length, item.key().length());

    for (const auto& item : parameters.items()) {
        std::string padded_key = item.key();
        padded_key.resize(max_key_length, ' ');
        log_colored(fmt::color::cornflower_blue, "        ", padded_key + " : " + format_json_value(item.value()));
    }
    log_plain("");
}

void GeomvalLogger::result_raw(const std::string& data)
{
    // Raw results bypass the verbosity levels
    fmt::print(m_output, "{}\n", data);
}

void GeomvalLogger::header(const std::string& title)
{
    if (m_verbosity >= 1) {
        std::string separator(title.length() + 4, '=');
        log_colored(fmt::color::cyan, "", separator);
        log_colored(fmt::color::cyan, "", "  " + title);
        log_colored(fmt::color::cyan, "", separator);
    }
}

#ifdef GEOMVAL_DEBUG
void GeomvalLogger::debug(int level, const std::string& msg)
{
    if (m_verbosity >= level)
        log_colored(fmt::color::gray, fmt::format("[DEBUG {}] ", get_elapsed_time()), msg);
}
#endif

void GeomvalLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_visible)
{
    if (m_use_colors && !force_visible) {
        fmt::print(m_output, fmt::fg(color), "{}{}\n", prefix, msg);
    } else {
        fmt::print(m_output, "{}{}\n", prefix, msg);
    }
}

void GeomvalLogger::log_plain(const std::string& msg)
{
    fmt::print(m_output, "{}\n", msg);
}

std::string GeomvalLogger::format_json_value(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    else if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    else if (value.is_number_integer())
        return std::to_string(value.get<int>());
    else if (value.is_number_float())
        return fmt::format("{:.6g}", value.get<double>());
    return value.dump();
}

std::string GeomvalLogger::get_elapsed_time()
{
    auto now = std::chrono::high_resolution_clock::now();
    double seconds = std::chrono::duration<double>(now - m_start_time).count();
    return fmt::format("{:.3f}s", seconds);
}
