/*
 * <Tests for reading energies from an ensemble.>
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

#include "src/core/energy_extractor.h"
#include "src/core/units.h"

#include "test_helpers.h"

using namespace confsieve;

void test_three_blocks_two_minima()
{
    const std::string dir = freshDirectory("energy_minima");
    writeFile(dir + "/ensemble.xyz", makeEnsemble({ -10.0, -10.5, -10.5 }, 2));

    auto energies = EnergyExtractor::extract(dir + "/ensemble.xyz", 3, 2, { 3, 1, 2 });
    check(energies.size() == 3, "energies.size() == 3");
    check(energies.at(1).value() == -10.0, "energies.at(1).value() == -10.0");
    check(energies.at(2).value() == -10.5, "energies.at(2).value() == -10.5");
    check(energies.at(3).value() == -10.5, "energies.at(3).value() == -10.5");

    auto relative = EnergyExtractor::relative(energies);
    check(relative.has_value(), "relative.has_value()");
    check(isClose(relative->at(1), 0.5 * ConfSieveUnit::Energy::HARTREE_TO_KCALMOL), "isClose(relative->at(1), 0.5 * ConfSieveUnit::Energy::HARTREE_TO_KCALMOL)");
    check(relative->at(2) == 0.0, "relative->at(2) == 0.0");
    check(relative->at(3) == 0.0, "relative->at(3) == 0.0");

    check(EnergyExtractor::lowestIds(energies) == std::vector<int>({ 2, 3 }), "EnergyExtractor::lowestIds(energies) == std::vector<int>({ 2, 3 })");
}

void test_labels_are_skipped()
{
    StringList ensemble = {
        "1", "  SCF done -5.25 Eh", "H 0 0 0",
        "1", "no energy here", "H 0 0 0"
    };
    auto energies = EnergyExtractor::extract(ensemble, 2, 1, { 1, 2 });
    check(energies.at(1).value() == -5.25, "energies.at(1).value() == -5.25");
    check(!energies.at(2).has_value(), "!energies.at(2).has_value()");

    auto relative = EnergyExtractor::relative(energies);
    check(relative && relative->size() == 1, "relative && relative->size() == 1");
    check(relative->at(1) == 0.0, "relative->at(1) == 0.0");
}

void test_short_ensemble_is_best_effort()
{
    StringList ensemble = { "1", "-1.0", "H 0 0 0", "1", "-2.0" };
    /* three conformers were announced, the file only holds one and a half */
    auto energies = EnergyExtractor::extract(ensemble, 3, 1, { 1, 2, 3 });
    check(energies.at(1).value() == -1.0, "energies.at(1).value() == -1.0");
    check(energies.at(2).value() == -2.0, "energies.at(2).value() == -2.0");
    check(!energies.at(3).has_value(), "!energies.at(3).has_value()");
}

void test_no_energy_at_all()
{
    EnergyMap energies = { { 1, std::nullopt }, { 2, std::nullopt } };
    check(!EnergyExtractor::relative(energies).has_value(), "!EnergyExtractor::relative(energies).has_value()");
    check(EnergyExtractor::lowestIds(energies).empty(), "EnergyExtractor::lowestIds(energies).empty()");

    ConformerSet set;
    set.add(Conformer(1));
    set.add(Conformer(2));
    check(!EnergyExtractor::assign(set, energies), "!EnergyExtractor::assign(set, energies)");
    check(!set.at(1).hasProperty(EnergyProperty::RelXtbEnergy), "!set.at(1).hasProperty(EnergyProperty::RelXtbEnergy)");

    auto missing = EnergyExtractor::extract(std::string("does_not_exist.xyz"), 2, 1, { 1, 2 });
    check(missing.size() == 2, "missing.size() == 2");
    check(!missing.at(1).has_value(), "!missing.at(1).has_value()");
}

void test_assign()
{
    ConformerSet set;
    for (int id = 1; id <= 3; ++id)
        set.add(Conformer(id));
    set.at(3).setProperty(EnergyProperty::XtbEnergy, 1.0);

    EnergyMap energies = { { 1, -3.0 }, { 2, -2.0 }, { 3, std::nullopt }, { 9, -4.0 } };
    check(EnergyExtractor::assign(set, energies), "EnergyExtractor::assign(set, energies)");
    check(set.at(1).Property(EnergyProperty::XtbEnergy).value() == -3.0, "set.at(1).Property(EnergyProperty::XtbEnergy).value() == -3.0");
    /* the unknown id 9 still defines the minimum */
    check(isClose(set.at(1).Property(EnergyProperty::RelXtbEnergy).value(), ConfSieveUnit::Energy::HARTREE_TO_KCALMOL), "isClose(set.at(1).Property(EnergyProperty::RelXtbEnergy).value(), ConfSieveUnit::Energy::HARTREE_TO_KCALMOL)");
    check(!set.at(3).hasProperty(EnergyProperty::XtbEnergy), "!set.at(3).hasProperty(EnergyProperty::XtbEnergy)");
    check(!set.at(3).hasProperty(EnergyProperty::RelXtbEnergy), "!set.at(3).hasProperty(EnergyProperty::RelXtbEnergy)");
}

int main()
{
    ConfSieveLogger::initialize(0, false);
    TestRunner runner;

    runner.run_test("Three Blocks Two Minima", test_three_blocks_two_minima);
    runner.run_test("Labels Are Skipped", test_labels_are_skipped);
    runner.run_test("Short Ensemble Is Best Effort", test_short_ensemble_is_best_effort);
    runner.run_test("No Energy At All", test_no_energy_at_all);
    runner.run_test("Assign", test_assign);

    runner.summary();
    return runner.get_exit_code();
}
