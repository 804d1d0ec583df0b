/*
 * <ConfSieve Logging System>
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

#include <fstream>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "src/core/global.h"

/**
 * @brief Unified console logging with verbosity levels and colours.
 *
 * Every line is flushed as soon as it is written. While a mirror file is open,
 * errors and warnings are appended to it as well, so that problems show up in
 * the report a run is currently writing.
 */
class ConfSieveLogger {
public:
    // Configuration methods
    static void set_verbosity(int level) { m_verbosity = level; }
    static void set_colors(bool enable) { m_use_colors = enable; }
    static int get_verbosity() { return m_verbosity; }

    static void initialize(int verbosity = 1, bool auto_detect_colors = true);

    // Core logging functions with verbosity control
    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void success(const std::string& msg);
    static void info(const std::string& msg);

    static void param(const std::string& key, const std::string& value);
    static void param(const std::string& key, int value);
    static void param(const std::string& key, double value);
    static void param(const std::string& key, bool value);

    static void param_table(const json& parameters, const std::string& title = "Parameters");

    static void result_raw(const std::string& data);
    static void header(const std::string& title);

    // Mirror of warnings and errors into a file
    static bool open_mirror(const std::string& path);
    static void close_mirror();

    // Errors that are summarised at the end of a run
    static void record_error(const std::string& msg);
    static const StringList& errors() { return m_errors; }
    static void clear_errors() { m_errors.clear(); }

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

    template <typename... Args>
    static void success_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        success(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        info(fmt::format(format_str, std::forward<Args>(args)...));
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain = false);
    static void log_plain(const std::string& msg);
    static void mirror(const std::string& prefix, const std::string& msg);
    static std::string format_json_value(const json& value);

    static int m_verbosity;
    static bool m_use_colors;
    static bool m_flush;
    static std::ofstream m_mirror;
    static StringList m_errors;
};
