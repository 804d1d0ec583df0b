/*
 * <Tests for the column aligned result tables.>
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

#include <sstream>

#include "src/capabilities/report_formatter.h"
#include "src/tools/general.h"

#include "test_helpers.h"

using namespace confsieve;

struct Table {
    std::vector<Conformer> conformers;
    std::vector<ReportFormatter::Accessor> columns;

    Table()
    {
        for (int id : { 3, 1, 2 })
            conformers.emplace_back(id);
        conformers[1].setProperty(EnergyProperty::FreeEnergy, -10.0);
        conformers[1].setProperty(EnergyProperty::RelFreeEnergy, 313.75);
        conformers[2].setProperty(EnergyProperty::FreeEnergy, -10.5);
        conformers[2].setProperty(EnergyProperty::RelFreeEnergy, 0.0);

        auto property = [](EnergyProperty p) {
            return [p](const Conformer& conformer) -> json {
                auto value = conformer.Property(p);
                return value ? json(*value) : json();
            };
        };
        columns = {
            [](const Conformer& conformer) -> json { return conformer.Tag(); },
            property(EnergyProperty::FreeEnergy),
            property(EnergyProperty::RelFreeEnergy)
        };
    }

    std::vector<const Conformer*> rows() const
    {
        std::vector<const Conformer*> result;
        for (const auto& conformer : conformers)
            result.push_back(&conformer);
        return result;
    }
};

void test_layout()
{
    const std::string dir = freshDirectory("report_layout");
    Table table;
    std::ostringstream stream;
    ReportFormatter formatter(stream);

    const bool written = formatter.render(dir + "/report.dat", table.columns,
        { "CONF#", "G", "dG" },
        { "", "[Eh]", "COSMORS[B97-3c]" },
        { "", ".7f", ".2f" },
        table.rows(), -10.5);
    check(written, "report file written");

    check(formatter.Widths() == std::vector<int>({ 5, 11, 8 }), "formatter.Widths() == std::vector<int>({ 5, 11, 8 })");
    const StringList& lines = formatter.Lines();
    check(lines.size() == 6, "lines.size() == 6");
    check(lines[0] == fmt::format("{:>5} {:>11} {:>8}", "CONF#", "G", "dG"), "lines[0] == fmt::format(\"{:>5} {:>11} {:>8}\", \"CONF#\", \"G\", \"dG\")");
    check(lines[1] == fmt::format("{:>5} {:>11} {:>8}", "", "[Eh]", "COSMORS"), "lines[1] == fmt::format(\"{:>5} {:>11} {:>8}\", \"\", \"[Eh]\", \"COSMORS\")");
    check(lines[2] == fmt::format("{:>5} {:>11} {:>8}", "", "", "[B97-3c]"), "lines[2] == fmt::format(\"{:>5} {:>11} {:>8}\", \"\", \"\", \"[B97-3c]\")");
    check(lines[3] == fmt::format("{:>5} {:>11} {:>8}", "CONF1", "-10.0000000", "313.75"), "lines[3] == fmt::format(\"{:>5} {:>11} {:>8}\", \"CONF1\", \"-10.0000000\", \"313.75\")");
    check(lines[4] == fmt::format("{:>5} {:>11} {:>8}     <------", "CONF2", "-10.5000000", "0.00"), "lines[4] == fmt::format(\"{:>5} {:>11} {:>8}     <------\", \"CONF2\", \"-10.5000000\", \"0.00\")");
    check(lines[5] == fmt::format("{:>5} {:>11} {:>8}", "CONF3", "-", "-"), "lines[5] == fmt::format(\"{:>5} {:>11} {:>8}\", \"CONF3\", \"-\", \"-\")");

    std::string expected;
    for (const auto& line : lines)
        expected += line + "\n";
    check(readFile(dir + "/report.dat") == expected, "readFile(dir + \"/report.dat\") == expected");
    check(stream.str() == expected, "stream.str() == expected");
}

void test_no_unit_line()
{
    const std::string dir = freshDirectory("report_units");
    Table table;
    std::ostringstream stream;
    ReportFormatter formatter(stream);
    formatter.render(dir + "/report.dat", table.columns,
        { "CONF#", "G", "dG" },
        { "", "[Eh]", "[kcal/mol]" },
        { "", ".7f", ".2f" },
        table.rows(), std::nullopt);

    check(formatter.Lines().size() == 5, "formatter.Lines().size() == 5");
    check(formatter.Widths()[2] == 10, "formatter.Widths()[2] == 10");
    for (const auto& line : formatter.Lines())
        check(!Tools::StringContains(line, "<------"), "!Tools::StringContains(line, \"<------\")");
}

void test_unequal_lists_fall_back()
{
    const std::string dir = freshDirectory("report_unequal");
    Table table;
    std::ostringstream stream;
    ReportFormatter formatter(stream);
    formatter.render(dir + "/report.dat", table.columns,
        { "CONF#", "G" },
        { "", "[Eh]", "" },
        { "", ".7f", ".2f" },
        table.rows(), -10.5);

    check(formatter.Widths() == std::vector<int>({ 12, 12, 12 }), "formatter.Widths() == std::vector<int>({ 12, 12, 12 })");
    check(formatter.Lines().size() == 5, "formatter.Lines().size() == 5");
    check(formatter.Lines()[0].size() == 3 * 12 + 2, "formatter.Lines()[0].size() == 3 * 12 + 2");
}

void test_bad_format_falls_back()
{
    const std::string dir = freshDirectory("report_format");
    Table table;
    std::ostringstream stream;
    ReportFormatter formatter(stream);
    formatter.render(dir + "/report.dat", table.columns,
        { "CONF#", "G", "dG" },
        { "", "[Eh]", "[kcal/mol]" },
        { "", ".7q", ".2f" },
        table.rows(), -10.5);

    check(formatter.Widths() == std::vector<int>({ 12, 12, 12 }), "formatter.Widths() == std::vector<int>({ 12, 12, 12 })");
    check(Tools::StringContains(formatter.Lines()[2], "-10.0"), "Tools::StringContains(formatter.Lines()[2], \"-10.0\")");
    check(Tools::StringContains(formatter.Lines()[3], "-10.5"), "Tools::StringContains(formatter.Lines()[3], \"-10.5\")");
}

void test_unwritable_file()
{
    Table table;
    std::ostringstream stream;
    ReportFormatter formatter(stream);
    const bool written = formatter.render("does/not/exist/report.dat", table.columns,
        { "CONF#", "G", "dG" },
        { "", "[Eh]", "[kcal/mol]" },
        { "", ".7f", ".2f" },
        table.rows(), -10.5);
    check(!written, "render reports the unwritable file");
    check(formatter.Lines().size() == 5, "formatter.Lines().size() == 5");
    check(!stream.str().empty(), "!stream.str().empty()");
}

void test_format_value()
{
    check(ReportFormatter::FormatValue(json(), ".2f") == "-", "ReportFormatter::FormatValue(json(), \".2f\") == \"-\"");
    check(ReportFormatter::FormatValue("pass", ".2f") == "pass", "ReportFormatter::FormatValue(\"pass\", \".2f\") == \"pass\"");
    check(ReportFormatter::FormatValue(true, "") == "true", "ReportFormatter::FormatValue(true, \"\") == \"true\"");
    check(ReportFormatter::FormatValue(42, "d") == "42", "ReportFormatter::FormatValue(42, \"d\") == \"42\"");
    check(ReportFormatter::FormatValue(3.14159, ".3f") == "3.142", "ReportFormatter::FormatValue(3.14159, \".3f\") == \"3.142\"");
    check(ReportFormatter::FormatValue(2.5, "") == "2.5", "ReportFormatter::FormatValue(2.5, \"\") == \"2.5\"");

    StringList descriptions = { "[Eh]", "COSMORS[B97-3c]", "plain", "[a.u.]" };
    StringList second;
    ReportFormatter::SplitDescriptions(descriptions, second);
    check(descriptions == StringList({ "[Eh]", "COSMORS", "plain", "[a.u.]" }), "descriptions == StringList({ \"[Eh]\", \"COSMORS\", \"plain\", \"[a.u.]\" })");
    check(second == StringList({ "", "[B97-3c]", "", "" }), "second == StringList({ \"\", \"[B97-3c]\", \"\", \"\" })");
}

int main()
{
    ConfSieveLogger::initialize(0, false);
    TestRunner runner;

    runner.run_test("Layout", test_layout);
    runner.run_test("No Unit Line", test_no_unit_line);
    runner.run_test("Unequal Lists Fall Back", test_unequal_lists_fall_back);
    runner.run_test("Bad Format Falls Back", test_bad_format_falls_back);
    runner.run_test("Unwritable File", test_unwritable_file);
    runner.run_test("Format Value", test_format_value);

    runner.summary();
    return runner.get_exit_code();
}
