/*
 * <General tools for conformer handling.>
 * Copyright (C) 2020 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "src/core/global.h"

namespace fs = std::filesystem;

class RunTimer {
public:
    RunTimer(bool print = false)
        : m_print(print)
    {
        m_start = std::chrono::system_clock::now();
        if (m_print) {
            std::time_t start_time = std::chrono::system_clock::to_time_t(m_start);
            std::cout << "Started computation at " << std::ctime(&start_time) << std::endl;
        }
    }

    ~RunTimer()
    {
        if (m_print) {
            std::cout << "\n\nFinished after " << Elapsed() / 1000.0 << " seconds!" << std::endl;
            std::time_t end_time = std::chrono::system_clock::to_time_t(m_end);
            std::cout << "Finished computation at " << std::ctime(&end_time) << std::endl;
        }
    }

    inline int Elapsed()
    {
        m_end = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(m_end - m_start).count();
    }

private:
    std::chrono::time_point<std::chrono::system_clock> m_start, m_end;
    bool m_print;
};

namespace Tools {

/* Splits at runs of blanks, tabs and carriage returns, empty tokens are dropped */
inline StringList SplitString(const std::string& string)
{
    StringList elements;
    std::string element;
    for (const char& c : string) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
            element.push_back(c);
        else if (element.size()) {
            elements.push_back(element);
            element.clear();
        }
    }
    if (element.size())
        elements.push_back(element);
    return elements;
}

inline bool StringContains(const std::string& string, const std::string& search)
{
    return string.find(search) != std::string::npos;
}

/* Strict conversion, the complete token has to be a number */
inline std::optional<double> ToDouble(const std::string& input)
{
    try {
        std::size_t consumed = 0;
        double value = std::stod(input, &consumed);
        if (consumed != input.size())
            return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

inline bool isInt(const std::string& input)
{
    return !input.empty() && std::all_of(input.begin(), input.end(), [](unsigned char c) { return std::isdigit(c); });
}

/* Non-negative integer token, empty if it is not one or does not fit into int */
inline std::optional<int> ToInt(const std::string& input)
{
    if (!isInt(input))
        return std::nullopt;
    try {
        return std::stoi(input);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/* Go through line and return the first token that is a float */
inline std::optional<double> CheckForFloat(const std::string& line)
{
    for (const auto& element : SplitString(line)) {
        auto value = ToDouble(element);
        if (value)
            return value;
    }
    return std::nullopt;
}

/* Last one, two or three components of a path, e.g. "CONF3/GFNFF" */
inline std::string LastFolders(const std::string& path, int number = 1)
{
    if (number < 1 || number > 3)
        number = 1;
    fs::path p(path);
    fs::path result = p.filename();
    fs::path parent = p.parent_path();
    for (int i = 1; i < number; ++i) {
        result = parent.filename() / result;
        parent = parent.parent_path();
    }
    return result.string();
}

/* Right aligned block print of items, wrapped at width characters */
inline std::string PrintBlock(const StringList& items, int width = 80)
{
    std::string block;
    if (items.empty())
        return block;

    std::size_t maxlen = 0;
    for (const auto& item : items)
        maxlen = std::max(maxlen, item.size());

    std::size_t length = 0;
    for (std::size_t i = 0; i < items.size(); ++i) {
        length += maxlen + 2;
        if (length <= static_cast<std::size_t>(width)) {
            block += fmt::format("{:>{}}", items[i], maxlen);
            if (i + 1 < items.size())
                block += ", ";
        } else {
            block += fmt::format("{:>{}}", items[i], maxlen) + "\n";
            length = 0;
        }
    }
    if (length != 0)
        block += "\n";
    return block;
}

/* "key: value   # [options]" line for parameter listings */
inline std::string FormatLine(const std::string& key, const std::string& value, const StringList& options, std::size_t optionlength = 70, std::size_t dist_to_options = 30)
{
    StringList shown = options;
    std::size_t total = 0;
    for (const auto& option : options)
        total += option.size() + 4;

    if (total > optionlength) {
        shown.clear();
        std::size_t length = 0;
        for (const auto& item : options) {
            length += item.size() + 2;
            if (length < optionlength)
                shown.push_back(item);
        }
        shown.push_back("...");
    }

    std::string list = "[";
    for (std::size_t i = 0; i < shown.size(); ++i) {
        list += "'" + shown[i] + "'";
        if (i + 1 < shown.size())
            list += ", ";
    }
    list += "]";

    std::size_t digits = dist_to_options > key.size() ? dist_to_options - key.size() : 1;
    return fmt::format("{}: {:<{}} # {} \n", key, value, digits, list);
}

}
