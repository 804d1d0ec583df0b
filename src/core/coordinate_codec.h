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

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/core/global.h"

namespace confsieve {
namespace CoordinateCodec {

/* coord files are written in bohr, everything else is Angstrom */

struct CoordBlock {
    StringList lines; // "El  x  y  z" in Angstrom, ready to be written into an xyz file
    StringList elements;
    Geometry geometry = Geometry::Zero(0, 3);
    int atoms = 0;
};

struct TrajectoryFrame {
    int id = 0;
    StringList lines;
    double energy = 0;
    std::optional<double> second_energy;
};

/*! \brief Path of the coord file, "coord" is appended if path is a folder */
std::string CoordPath(const std::string& path);

/*! \brief Title case element symbol, "CL" -> "Cl" */
std::string TitleCase(const std::string& element);

/*! \brief Reads the $coord block of a coord file
 *
 * Throws std::runtime_error if the file can not be read or has no $coord block,
 * std::invalid_argument if a coordinate line is malformed.
 */
CoordBlock decode(const std::string& path);

/*! \brief One formatted xyz line, {:3} {: .10f}  {: .10f}  {: .10f} */
std::string FormatXYZLine(const std::string& element, double x, double y, double z);

/*! \brief Writes a coord file (bohr, lower case elements) from Angstrom coordinates */
bool encode(const std::string& path, const StringList& elements, const Geometry& geometry);

/*! \brief decode() and write the result as xyz file next to the coord file */
CoordBlock writeXYZ(const std::string& path, const std::string& outfile = "original.xyz");

/*! \brief Converts an xyz file into a coord file in the same folder */
bool xyzToCoord(const std::string& path, const std::string& infile = "inp.xyz");

/*! \brief Parses "El x y z" lines into elements and geometry, throws std::invalid_argument */
std::pair<StringList, Geometry> ParseXYZLines(const StringList& lines);

/*! \brief Reads all lines of a text file, CRLF is normalised */
std::optional<StringList> ReadLines(const std::string& path);

/*! \brief Coordinate lines of block id (1-based) of an ensemble
 *
 * Fewer lines than expected are returned if the ensemble is too short.
 */
StringList EnsembleBlock(const StringList& ensemble, int id, int nat);

/*! \brief Writes block id of the ensemble as coord file to outpath, unless it already exists */
bool ensembleToCoord(const StringList& ensemble, int id, int nat, const std::string& outpath);

/*! \brief Appends (or overwrites) a trajectory with "  nat", two energies plus !CONF<id> and the coordinates */
bool writeTrajectory(const std::string& path, const std::vector<TrajectoryFrame>& frames, bool overwrite = false,
    const std::string& label = "G(CONFSIEVE)", const std::string& second_label = "G(xTB)");
}
} // namespace confsieve
