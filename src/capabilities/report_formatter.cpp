/*
 * <Column aligned result tables for stdout and file.>
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

#include <algorithm>
#include <fstream>

#include <fmt/format.h>

#include "src/core/confsieve_logger.h"

#include "report_formatter.h"

using confsieve::Conformer;
using confsieve::EnergyProperty;

namespace {
const int FallbackWidth = 12;

std::string Join(const StringList& items)
{
    std::string line;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i)
            line += " ";
        line += items[i];
    }
    return line;
}
}

ReportFormatter::ReportFormatter(std::ostream& stream)
    : m_stream(stream)
{
}

std::string ReportFormatter::FormatValue(const json& value, const std::string& format)
{
    if (value.is_null())
        return "-";
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    if (format.empty())
        return value.is_number_integer() ? fmt::format("{}", value.get<long long>()) : fmt::format("{}", value.get<double>());
    if (value.is_number_integer() && format.back() == 'd')
        return fmt::format(fmt::runtime("{:" + format + "}"), value.get<long long>());
    return fmt::format(fmt::runtime("{:" + format + "}"), value.get<double>());
}

void ReportFormatter::SplitDescriptions(StringList& descriptions, StringList& descriptions2)
{
    descriptions2.resize(descriptions.size());
    for (std::size_t i = 0; i < descriptions.size(); ++i) {
        const std::string& description = descriptions[i];
        if (description == "[Eh]" || description == "[kcal/mol]" || description == "[a.u.]")
            continue;
        const auto bracket = description.find('[');
        if (bracket == std::string::npos)
            continue;
        descriptions2[i] = description.substr(bracket);
        descriptions[i] = description.substr(0, bracket);
    }
}

void ReportFormatter::emit(std::ostream* file, const std::string& line)
{
    m_stream << line << std::endl;
    if (file)
        *file << line << "\n";
    m_lines.push_back(line);
}

bool ReportFormatter::render(const std::string& path,
    const std::vector<Accessor>& columns,
    const StringList& headers,
    const StringList& descriptions,
    const StringList& formats,
    std::vector<const Conformer*> rows,
    std::optional<double> minfree,
    StringList descriptions2)
{
    m_lines.clear();
    m_widths.clear();

    std::sort(rows.begin(), rows.end(), [](const Conformer* a, const Conformer* b) { return a->Id() < b->Id(); });

    const std::size_t ncol = columns.size();
    bool fallback = false;
    if (headers.size() != ncol || descriptions.size() != ncol || formats.size() != ncol
        || (!descriptions2.empty() && descriptions2.size() != ncol)) {
        ConfSieveLogger::error("Lists of unequal length!");
        fallback = true;
    }

    StringList header = headers, description = descriptions, format = formats;
    header.resize(ncol);
    description.resize(ncol);
    format.resize(ncol);
    descriptions2.resize(ncol);
    SplitDescriptions(description, descriptions2);

    if (!fallback) {
        try {
            for (std::size_t j = 0; j < ncol; ++j) {
                std::size_t width = 0;
                for (const auto* conformer : rows)
                    width = std::max(width, FormatValue(columns[j](*conformer), format[j]).size());
                width = std::max({ width, header[j].size(), description[j].size(), descriptions2[j].size() });
                m_widths.push_back(static_cast<int>(width));
            }
        } catch (const fmt::format_error& error) {
            ConfSieveLogger::error_fmt("Formatting the table failed: {}", error.what());
            fallback = true;
        } catch (const json::exception& error) {
            ConfSieveLogger::error_fmt("Formatting the table failed: {}", error.what());
            fallback = true;
        }
    }
    if (fallback)
        m_widths.assign(ncol, FallbackWidth);

    std::ofstream out(path);
    std::ostream* file = nullptr;
    if (out.is_open())
        file = &out;
    else
        ConfSieveLogger::error_fmt("Could not write {}", path);

    StringList line_header, line_description, line_unit;
    bool has_unit = false;
    for (std::size_t j = 0; j < ncol; ++j) {
        line_header.push_back(fmt::format("{:>{}}", header[j], m_widths[j]));
        line_description.push_back(fmt::format("{:>{}}", description[j], m_widths[j]));
        line_unit.push_back(fmt::format("{:>{}}", descriptions2[j], m_widths[j]));
        has_unit = has_unit || !descriptions2[j].empty();
    }
    emit(file, Join(line_header));
    emit(file, Join(line_description));
    if (has_unit)
        emit(file, Join(line_unit));

    for (const auto* conformer : rows) {
        StringList cells;
        for (std::size_t j = 0; j < ncol; ++j) {
            std::string cell;
            try {
                cell = FormatValue(columns[j](*conformer), format[j]);
            } catch (const fmt::format_error&) {
                cell = columns[j](*conformer).dump();
            } catch (const json::exception&) {
                cell = columns[j](*conformer).dump();
            }
            cells.push_back(fmt::format("{:>{}}", cell, m_widths[j]));
        }
        auto energy = conformer->Property(EnergyProperty::FreeEnergy);
        if (minfree && energy && *energy == *minfree)
            cells.push_back("    <------");
        emit(file, Join(cells));
    }
    return file != nullptr;
}
