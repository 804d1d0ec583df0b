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

#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "src/core/conformer.h"
#include "src/core/global.h"

class ReportFormatter {
public:
    typedef std::function<json(const confsieve::Conformer&)> Accessor;

    explicit ReportFormatter(std::ostream& stream = std::cout);

    /*! \brief Renders header, description, optional unit line and one line per conformer
     *
     * formats holds fmt specs without braces (".7f", "d", ...) or an empty string.
     * The row whose free energy equals minfree is marked with an arrow.
     * Lists of unequal length or unusable formats fall back to width 12.
     * Returns false if the file could not be written, the stream output is produced anyway.
     */
    bool render(const std::string& path,
        const std::vector<Accessor>& columns,
        const StringList& headers,
        const StringList& descriptions,
        const StringList& formats,
        std::vector<const confsieve::Conformer*> rows,
        std::optional<double> minfree,
        StringList descriptions2 = StringList());

    /*! \brief Lines of the last render call */
    inline const StringList& Lines() const { return m_lines; }
    inline const std::vector<int>& Widths() const { return m_widths; }

    /*! \brief Formats one cell, throws fmt::format_error for unusable specs */
    static std::string FormatValue(const json& value, const std::string& format);

    /*! \brief Moves a bracketed unit like "COSMORS[B97-3c]" into the second description */
    static void SplitDescriptions(StringList& descriptions, StringList& descriptions2);

private:
    void emit(std::ostream* file, const std::string& line);

    std::ostream& m_stream;
    StringList m_lines;
    std::vector<int> m_widths;
};
