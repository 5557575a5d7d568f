/*
 * <Geomval Logging System>
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

#include "src/core/global.h"

#include <chrono>
#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>

/*! \brief Process-wide console logger
 *
 * error is always printed, warn from verbosity 1 and param from verbosity 2.
 * result_raw bypasses the verbosity levels.
 */
class GeomvalLogger {
private:
    static int m_verbosity;
    static bool m_use_colors;
    static std::FILE* m_output;
    static std::chrono::high_resolution_clock::time_point m_start_time;

public:
    static void set_verbosity(int level) { m_verbosity = level; }
    static void set_colors(bool enable) { m_use_colors = enable; }
    static void set_output(std::FILE* output) { m_output = output; }
    static int get_verbosity() { return m_verbosity; }
    static bool colors_enabled() { return m_use_colors; }

    // Initialize logger with environment detection
    static void initialize(int verbosity = 1, bool auto_detect_colors = true);

    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void param(const std::string& key, int value);

    // JSON parameter table printing
    static void param_table(const json& parameters, const std::string& title = "Parameters");

    static void result_raw(const std::string& data);
    static void header(const std::string& title);

#ifdef GEOMVAL_DEBUG
    static void debug(int level, const std::string& msg);
#endif

    template <typename... Args>
    static void error_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        error(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        warn(fmt::format(format_str, std::forward<Args>(args)...));
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_visible = false);
    static void log_plain(const std::string& msg);
    static std::string format_json_value(const json& value);
    static std::string get_elapsed_time();
};
