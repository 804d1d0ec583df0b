/*
 * <Tests for coord, xyz and trajectory conversion.>
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

#include "src/core/coordinate_codec.h"
#include "src/core/units.h"
#include "src/tools/general.h"

#include "test_helpers.h"

using namespace confsieve;

void test_decode_converts_units()
{
    const std::string dir = freshDirectory("codec_decode");
    writeFile(dir + "/coord",
        "$coord\n"
        "  0.00000000000000  0.00000000000000  1.00000000000000  o\n"
        "  1.88972612456506  0.00000000000000  0.00000000000000  cl\n"
        "$redundant\n"
        "  9.0 9.0 9.0 h\n"
        "$end\n");

    auto block = CoordinateCodec::decode(dir);
    check(block.atoms == 2, "block.atoms == 2");
    check(block.elements == StringList({ "O", "Cl" }), "block.elements == StringList({ \"O\", \"Cl\" })");
    check(isClose(block.geometry(0, 2), ConfSieveUnit::Length::bohr_to_angstrom(1.0)), "isClose(block.geometry(0, 2), ConfSieveUnit::Length::bohr_to_angstrom(1.0))");
    check(isClose(block.geometry(1, 0), 1.0, 1e-6), "isClose(block.geometry(1, 0), 1.0, 1e-6)");
    check(block.lines.size() == 2, "block.lines.size() == 2");
    check(Tools::SplitString(block.lines[1])[0] == "Cl", "Tools::SplitString(block.lines[1])[0] == \"Cl\"");
}

void test_decode_rejects_malformed_lines()
{
    const std::string dir = freshDirectory("codec_malformed");
    writeFile(dir + "/coord", "$coord\n 0.0 0.0 c\n$end\n");
    bool thrown = false;
    try {
        CoordinateCodec::decode(dir + "/coord");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "thrown");

    writeFile(dir + "/coord", "$coord\n 0.0 x 0.0 c\n$end\n");
    thrown = false;
    try {
        CoordinateCodec::decode(dir + "/coord");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "thrown");

    thrown = false;
    try {
        CoordinateCodec::decode(dir + "/missing");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    check(thrown, "thrown");
}

void test_roundtrip()
{
    const std::string dir = freshDirectory("codec_roundtrip");
    Geometry geometry(3, 3);
    geometry << 0.0, 0.0, 0.1173,
        0.0, 0.7572, -0.4692,
        0.0, -0.7572, -0.4692;
    check(CoordinateCodec::encode(dir, { "O", "H", "H" }, geometry), "CoordinateCodec::encode(dir, { \"O\", \"H\", \"H\" }, geometry)");

    const std::string content = readFile(dir + "/coord");
    check(content.rfind("$coord", 0) == 0, "content.rfind(\"$coord\", 0) == 0");
    check(Tools::StringContains(content, "$end"), "Tools::StringContains(content, \"$end\")");
    check(Tools::StringContains(content, "  h\n"), "hydrogen written in lower case");

    auto first = CoordinateCodec::decode(dir);
    check(first.elements == StringList({ "O", "H", "H" }), "first.elements == StringList({ \"O\", \"H\", \"H\" })");
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            check(std::abs(first.geometry(i, j) - geometry(i, j)) < 1e-10, "std::abs(first.geometry(i, j) - geometry(i, j)) < 1e-10");

    check(CoordinateCodec::encode(dir, first.elements, first.geometry), "CoordinateCodec::encode(dir, first.elements, first.geometry)");
    auto second = CoordinateCodec::decode(dir);
    check(second.lines == first.lines, "second.lines == first.lines");
}

void test_xyz_to_coord()
{
    const std::string dir = freshDirectory("codec_xyz");
    writeFile(dir + "/inp.xyz", "2\ncomment\nC 0.0 0.0 0.0\nO 0.0 0.0 1.2\n");
    check(CoordinateCodec::xyzToCoord(dir), "CoordinateCodec::xyzToCoord(dir)");

    auto block = CoordinateCodec::writeXYZ(dir);
    check(block.atoms == 2, "block.atoms == 2");
    check(isClose(block.geometry(1, 2), 1.2, 1e-10), "isClose(block.geometry(1, 2), 1.2, 1e-10)");
    check(std::filesystem::exists(dir + "/original.xyz"), "std::filesystem::exists(dir + \"/original.xyz\")");
    auto lines = CoordinateCodec::ReadLines(dir + "/original.xyz");
    check(lines && lines->size() == 4, "lines && lines->size() == 4");
    check((*lines)[0] == "2", "(*lines)[0] == \"2\"");
}

void test_ensemble_blocks()
{
    const std::string dir = freshDirectory("codec_ensemble");
    writeFile(dir + "/ensemble.xyz", makeEnsemble({ -10.0, -10.5 }, 3));
    auto lines = CoordinateCodec::ReadLines(dir + "/ensemble.xyz");
    check(lines && lines->size() == 10, "lines && lines->size() == 10");

    StringList block = CoordinateCodec::EnsembleBlock(*lines, 2, 3);
    check(block.size() == 3, "block.size() == 3");
    check(block[0] == (*lines)[7], "block[0] == (*lines)[7]");
    check(CoordinateCodec::EnsembleBlock(*lines, 3, 3).empty(), "CoordinateCodec::EnsembleBlock(*lines, 3, 3).empty()");

    std::filesystem::create_directories(dir + "/CONF2");
    check(CoordinateCodec::ensembleToCoord(*lines, 2, 3, dir + "/CONF2"), "CoordinateCodec::ensembleToCoord(*lines, 2, 3, dir + \"/CONF2\")");
    auto decoded = CoordinateCodec::decode(dir + "/CONF2");
    auto [elements, geometry] = CoordinateCodec::ParseXYZLines(block);
    check(decoded.elements == elements, "decoded.elements == elements");
    check(std::abs(decoded.geometry(2, 1) - geometry(2, 1)) < 1e-10, "std::abs(decoded.geometry(2, 1) - geometry(2, 1)) < 1e-10");

    /* an existing coord file is kept */
    writeFile(dir + "/CONF2/coord", "$coord\n$end\n");
    check(CoordinateCodec::ensembleToCoord(*lines, 2, 3, dir + "/CONF2"), "CoordinateCodec::ensembleToCoord(*lines, 2, 3, dir + \"/CONF2\")");
    check(readFile(dir + "/CONF2/coord") == "$coord\n$end\n", "empty coord block for CONF2");

    std::filesystem::create_directories(dir + "/CONF3");
    check(!CoordinateCodec::ensembleToCoord(*lines, 3, 3, dir + "/CONF3"), "!CoordinateCodec::ensembleToCoord(*lines, 3, 3, dir + \"/CONF3\")");
}

void test_crlf_is_normalised()
{
    const std::string dir = freshDirectory("codec_crlf");
    writeFile(dir + "/file.txt", "first\r\nsecond\r\n");
    auto lines = CoordinateCodec::ReadLines(dir + "/file.txt");
    check(lines && lines->size() == 2, "lines && lines->size() == 2");
    check((*lines)[0] == "first", "(*lines)[0] == \"first\"");
    check((*lines)[1] == "second", "(*lines)[1] == \"second\"");
    check(!CoordinateCodec::ReadLines(dir + "/nothing.txt").has_value(), "!CoordinateCodec::ReadLines(dir + \"/nothing.txt\").has_value()");
}

void test_element_case()
{
    using namespace confsieve::CoordinateCodec;
    check(TitleCase("CL") == "Cl", "TitleCase(\"CL\")");
    check(TitleCase("h") == "H", "TitleCase(\"h\")");
    check(TitleCase("").empty(), "TitleCase of an empty token");
    /* bytes above 0x7f are left alone */
    const std::string latin = std::string("\xC4") + "U";
    check(TitleCase(latin) == std::string("\xC4") + "u", "TitleCase keeps non-ASCII bytes");
    check(UpperCase("orca") == "ORCA", "UpperCase(\"orca\")");
    check(LowerCase("Co\xFF") == "co\xFF", "LowerCase keeps non-ASCII bytes");
}

void test_trajectory()
{
    const std::string dir = freshDirectory("codec_trajectory");
    CoordinateCodec::TrajectoryFrame frame;
    frame.id = 7;
    frame.energy = -10.5;
    frame.second_energy = -10.25;
    frame.lines = { CoordinateCodec::FormatXYZLine("O", 0, 0, 0), CoordinateCodec::FormatXYZLine("H", 0, 0, 0.96) };

    CoordinateCodec::TrajectoryFrame other = frame;
    other.id = 8;
    other.second_energy.reset();

    const std::string path = dir + "/sorted.xyz";
    check(CoordinateCodec::writeTrajectory(path, { frame }), "CoordinateCodec::writeTrajectory(path, { frame })");
    check(CoordinateCodec::writeTrajectory(path, { other }), "CoordinateCodec::writeTrajectory(path, { other })");
    auto lines = CoordinateCodec::ReadLines(path);
    check(lines && lines->size() == 8, "lines && lines->size() == 8");
    check((*lines)[0] == "  2", "(*lines)[0] == \"  2\"");
    check(Tools::StringContains((*lines)[1], "!CONF7"), "Tools::StringContains((*lines)[1], \"!CONF7\")");
    check(Tools::StringContains((*lines)[1], "-10.50000000"), "Tools::StringContains((*lines)[1], \"-10.50000000\")");
    check(Tools::StringContains((*lines)[5], "n/a"), "Tools::StringContains((*lines)[5], \"n/a\")");

    check(CoordinateCodec::writeTrajectory(path, { frame }, true), "CoordinateCodec::writeTrajectory(path, { frame }, true)");
    lines = CoordinateCodec::ReadLines(path);
    check(lines && lines->size() == 4, "lines && lines->size() == 4");
}

int main()
{
    ConfSieveLogger::initialize(0, false);
    TestRunner runner;

    runner.run_test("Decode Converts Units", test_decode_converts_units);
    runner.run_test("Decode Rejects Malformed Lines", test_decode_rejects_malformed_lines);
    runner.run_test("Roundtrip", test_roundtrip);
    runner.run_test("Xyz To Coord", test_xyz_to_coord);
    runner.run_test("Ensemble Blocks", test_ensemble_blocks);
    runner.run_test("CRLF Is Normalised", test_crlf_is_normalised);
    runner.run_test("Element Case", test_element_case);
    runner.run_test("Trajectory", test_trajectory);

    runner.summary();
    return runner.get_exit_code();
}
