/*
 * <Conversion between coord files, xyz blocks and ensemble files.>
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

#include <cctype>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include "src/core/confsieve_logger.h"
#include "src/core/units.h"
#include "src/tools/general.h"

#include "coordinate_codec.h"

namespace confsieve {
namespace CoordinateCodec {

std::string CoordPath(const std::string& path)
{
    if (fs::path(path).filename() == "coord")
        return path;
    return (fs::path(path) / "coord").string();
}

std::string TitleCase(const std::string& element)
{
    std::string result = LowerCase(element);
    if (!result.empty())
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

std::string FormatXYZLine(const std::string& element, double x, double y, double z)
{
    return fmt::format("{:3} {: .10f}  {: .10f}  {: .10f}", element, x, y, z);
}

std::optional<StringList> ReadLines(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return std::nullopt;
    StringList lines;
    for (std::string line; std::getline(file, line);) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

CoordBlock decode(const std::string& path)
{
    const std::string coord = CoordPath(path);
    auto lines = ReadLines(coord);
    if (!lines)
        throw std::runtime_error(fmt::format("Can not read {}", coord));

    CoordBlock block;
    bool readblock = false;
    for (const auto& line : *lines) {
        if (!readblock) {
            if (Tools::StringContains(line, "$coord"))
                readblock = true;
            continue;
        }
        if (Tools::StringContains(line, "$"))
            break;
        StringList tokens = Tools::SplitString(line);
        if (tokens.empty())
            continue;
        if (tokens.size() < 4)
            throw std::invalid_argument(fmt::format("Malformed line in {}: {}", Tools::LastFolders(coord, 3), line));

        Position position;
        for (int i = 0; i < 3; ++i) {
            auto value = Tools::ToDouble(tokens[i]);
            if (!value)
                throw std::invalid_argument(fmt::format("Non numeric coordinate in {}: {}", Tools::LastFolders(coord, 3), line));
            position(i) = ConfSieveUnit::Length::bohr_to_angstrom(*value);
        }
        const std::string element = TitleCase(tokens[3]);
        block.elements.push_back(element);
        block.geometry.conservativeResize(block.elements.size(), 3);
        block.geometry.row(block.elements.size() - 1) = position;
        block.lines.push_back(FormatXYZLine(element, position(0), position(1), position(2)));
    }
    if (!readblock)
        throw std::runtime_error(fmt::format("No $coord block found in {}", coord));

    block.atoms = block.elements.size();
    return block;
}

bool encode(const std::string& path, const StringList& elements, const Geometry& geometry)
{
    const std::string coord = CoordPath(path);
    std::ofstream file(coord);
    if (!file.is_open()) {
        ConfSieveLogger::error_fmt("Could not write {}", coord);
        return false;
    }
    file << "$coord" << std::endl;
    for (int i = 0; i < static_cast<int>(elements.size()) && i < geometry.rows(); ++i) {
        const std::string element = LowerCase(elements[i]);
        file << fmt::format("{: .14f} {: .14f}  {: .14f}  {}",
            ConfSieveUnit::Length::angstrom_to_bohr(geometry(i, 0)),
            ConfSieveUnit::Length::angstrom_to_bohr(geometry(i, 1)),
            ConfSieveUnit::Length::angstrom_to_bohr(geometry(i, 2)),
            element)
             << std::endl;
    }
    file << "$end" << std::endl;
    return true;
}

CoordBlock writeXYZ(const std::string& path, const std::string& outfile)
{
    CoordBlock block = decode(path);
    fs::path target = fs::path(CoordPath(path)).parent_path() / outfile;
    std::ofstream out(target);
    if (!out.is_open()) {
        ConfSieveLogger::error_fmt("Could not write {}", target.string());
        return block;
    }
    out << block.atoms << std::endl
        << std::endl;
    for (const auto& line : block.lines)
        out << line << std::endl;
    return block;
}

std::pair<StringList, Geometry> ParseXYZLines(const StringList& lines)
{
    StringList elements;
    Geometry geometry = Geometry::Zero(lines.size(), 3);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        StringList tokens = Tools::SplitString(lines[i]);
        if (tokens.size() < 4)
            throw std::invalid_argument(fmt::format("Malformed xyz line: {}", lines[i]));
        for (int j = 0; j < 3; ++j) {
            auto value = Tools::ToDouble(tokens[j + 1]);
            if (!value)
                throw std::invalid_argument(fmt::format("Non numeric coordinate: {}", lines[i]));
            geometry(i, j) = *value;
        }
        elements.push_back(TitleCase(tokens[0]));
    }
    return { elements, geometry };
}

bool xyzToCoord(const std::string& path, const std::string& infile)
{
    fs::path xyz(path);
    if (!Tools::StringContains(xyz.filename().string(), ".xyz"))
        xyz /= infile;

    auto lines = ReadLines(xyz.string());
    if (!lines) {
        ConfSieveLogger::error_fmt("Can not read {}", xyz.string());
        return false;
    }
    StringList body;
    for (std::size_t i = 2; i < lines->size(); ++i) {
        if (!Tools::SplitString((*lines)[i]).empty())
            body.push_back((*lines)[i]);
    }
    try {
        auto [elements, geometry] = ParseXYZLines(body);
        return encode((xyz.parent_path() / "coord").string(), elements, geometry);
    } catch (const std::invalid_argument& error) {
        ConfSieveLogger::error(error.what());
        return false;
    }
}

StringList EnsembleBlock(const StringList& ensemble, int id, int nat)
{
    StringList block;
    if (id < 1 || nat < 1)
        return block;
    const std::size_t start = static_cast<std::size_t>(id - 1) * (nat + 2) + 2;
    const std::size_t end = static_cast<std::size_t>(id) * (nat + 2);
    for (std::size_t i = start; i < end && i < ensemble.size(); ++i)
        block.push_back(ensemble[i]);
    return block;
}

bool ensembleToCoord(const StringList& ensemble, int id, int nat, const std::string& outpath)
{
    const std::string coord = CoordPath(outpath);
    if (fs::exists(coord))
        return true;

    StringList block = EnsembleBlock(ensemble, id, nat);
    if (static_cast<int>(block.size()) != nat) {
        ConfSieveLogger::error_fmt("Block of CONF{} in the ensemble is incomplete ({} of {} atoms)", id, block.size(), nat);
        return false;
    }
    try {
        auto [elements, geometry] = ParseXYZLines(block);
        return encode(coord, elements, geometry);
    } catch (const std::invalid_argument& error) {
        ConfSieveLogger::error_fmt("CONF{}: {}", id, error.what());
        return false;
    }
}

bool writeTrajectory(const std::string& path, const std::vector<TrajectoryFrame>& frames, bool overwrite,
    const std::string& label, const std::string& second_label)
{
    std::error_code ec;
    if (overwrite && fs::exists(path))
        fs::remove(path, ec);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open() || ec) {
        ConfSieveLogger::error_fmt("Could not write trajectory: {}.", Tools::LastFolders(path, 1));
        return false;
    }
    for (const auto& frame : frames) {
        std::string second = frame.second_energy ? fmt::format("{:20.8f}", *frame.second_energy) : std::string("n/a");
        out << fmt::format("  {}\n", frame.lines.size());
        out << fmt::format("{}= {:20.8f}  {}= {}        !CONF{}\n", label, frame.energy, second_label, second, frame.id);
        for (const auto& line : frame.lines)
            out << line << "\n";
    }
    return true;
}
}
} // namespace confsieve
