/*
 * <ConfSieve Logging System Implementation>
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

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include <unistd.h>

#include "confsieve_logger.h"

int ConfSieveLogger::m_verbosity = 1;
bool ConfSieveLogger::m_use_colors = false;
bool ConfSieveLogger::m_flush = true;
std::ofstream ConfSieveLogger::m_mirror;
StringList ConfSieveLogger::m_errors;

void ConfSieveLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;
    m_flush = true;

    if (auto_detect_colors)
        m_use_colors = isatty(STDOUT_FILENO) && (std::getenv("CONFSIEVE_NO_COLOR") == nullptr);
    else
        m_use_colors = false;

#ifdef CONFSIEVE_COLOR_DEFAULT
    if (std::getenv("CONFSIEVE_NO_COLOR") == nullptr) {
        m_use_colors = true;
    }
#endif
}

void ConfSieveLogger::error(const std::string& msg)
{
    // Errors always visible
    log_colored(fmt::color::red, "[ERROR] ", msg, true);
    mirror("ERROR: ", msg);
}

void ConfSieveLogger::warn(const std::string& msg)
{
    if (m_verbosity >= 1) {
        log_colored(fmt::color::orange, "[WARN]  ", msg);
    }
    mirror("WARNING: ", msg);
}

void ConfSieveLogger::success(const std::string& msg)
{
    if (m_verbosity >= 1) {
        log_colored(fmt::color::lime_green, "[OK]    ", msg);
    }
}

void ConfSieveLogger::info(const std::string& msg)
{
    if (m_verbosity >= 2) {
        log_plain("        " + msg);
    }
}

void ConfSieveLogger::param(const std::string& key, const std::string& value)
{
    if (m_verbosity >= 2) {
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + value);
    }
}

void ConfSieveLogger::param(const std::string& key, int value)
{
    if (m_verbosity >= 2) {
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + std::to_string(value));
    }
}

void ConfSieveLogger::param(const std::string& key, double value)
{
    if (m_verbosity >= 2) {
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", fmt::format("{}: {:.6g}", key, value));
    }
}

void ConfSieveLogger::param(const std::string& key, bool value)
{
    if (m_verbosity >= 2) {
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + (value ? "true" : "false"));
    }
}

void ConfSieveLogger::param_table(const json& parameters, const std::string& title)
{
    if (m_verbosity < 1 || parameters.empty())
        return;

    log_colored(fmt::color::cyan, "[TABLE] ", title);
    log_plain("        " + std::string(title.length() + 8, '-'));

    size_t max_key_length = 0;
    for (const auto& item : parameters.items()) {
        max_key_length = std::max(max_key_length, item.key().length());
    }

    for (const auto& item : parameters.items()) {
        std::string padded_key = item.key();
        padded_key.resize(max_key_length, ' ');
        log_colored(fmt::color::cornflower_blue, "        ", padded_key + " : " + format_json_value(item.value()));
    }
    log_plain("");
}

void ConfSieveLogger::result_raw(const std::string& data)
{
    // Raw results for scripting - no colors, no prefix
    fmt::print("{}\n", data);
    if (m_flush)
        std::fflush(stdout);
}

void ConfSieveLogger::header(const std::string& title)
{
    if (m_verbosity >= 2) {
        std::string separator(title.length() + 4, '=');
        log_colored(fmt::color::cyan, "", separator);
        log_colored(fmt::color::cyan, "", "  " + title);
        log_colored(fmt::color::cyan, "", separator);
    }
}

bool ConfSieveLogger::open_mirror(const std::string& path)
{
    close_mirror();
    m_mirror.open(path, std::ios::app);
    return m_mirror.is_open();
}

void ConfSieveLogger::close_mirror()
{
    if (m_mirror.is_open())
        m_mirror.close();
}

void ConfSieveLogger::record_error(const std::string& msg)
{
    error(msg);
    m_errors.push_back(msg);
}

void ConfSieveLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain)
{
    if (m_use_colors && !force_plain) {
        fmt::print(fmt::fg(color), "{}{}\n", prefix, msg);
    } else {
        fmt::print("{}{}\n", prefix, msg);
    }
    if (m_flush)
        std::fflush(stdout);
}

void ConfSieveLogger::log_plain(const std::string& msg)
{
    fmt::print("{}\n", msg);
    if (m_flush)
        std::fflush(stdout);
}

void ConfSieveLogger::mirror(const std::string& prefix, const std::string& msg)
{
    if (!m_mirror.is_open())
        return;
    m_mirror << prefix << msg << "\n";
    m_mirror.flush();
}

std::string ConfSieveLogger::format_json_value(const json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int>());
    } else if (value.is_number_float()) {
        return fmt::format("{:.6g}", value.get<double>());
    } else if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    } else if (value.is_array()) {
        return fmt::format("[{} items]", value.size());
    } else if (value.is_object()) {
        return fmt::format("{{{} keys}}", value.size());
    }
    return value.dump();
}
