/*
 * <Tests for the Boltzmann population.>
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

#include "src/core/boltzmann.h"
#include "src/core/units.h"

#include "test_helpers.h"

using namespace confsieve;

std::vector<Conformer> makeConformers(const std::vector<double>& energies)
{
    std::vector<Conformer> conformers;
    for (std::size_t i = 0; i < energies.size(); ++i) {
        conformers.emplace_back(i + 1);
        conformers.back().setProperty(EnergyProperty::FreeEnergy, energies[i]);
    }
    return conformers;
}

std::vector<Conformer*> pointers(std::vector<Conformer>& conformers)
{
    std::vector<Conformer*> result;
    for (auto& conformer : conformers)
        result.push_back(&conformer);
    return result;
}

void test_singleton()
{
    auto conformers = makeConformers({ 123.4 });
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::FreeEnergy, 298.15);
    check(weights.size() == 1, "weights.size() == 1");
    check(weights.at(1) == 1.0, "weights.at(1) == 1.0");
    check(conformers[0].Property(EnergyProperty::BoltzmannWeight).value() == 1.0, "conformers[0].Property(EnergyProperty::BoltzmannWeight).value() == 1.0");
}

void test_two_states()
{
    const double delta = 0.001;
    auto conformers = makeConformers({ -100.0, -100.0 + delta });
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::FreeEnergy, 298.15);

    const double x = ConfSieveUnit::Energy::hartree_to_joule(delta) / (ConfSieveUnit::Constants::BOLTZMANN_SI * 298.15);
    const double expected = 1.0 / (1.0 + std::exp(-x));
    check(isClose(weights.at(1), expected, 1e-9), "isClose(weights.at(1), expected, 1e-9)");
    check(isClose(weights.at(1) + weights.at(2), 1.0, 1e-12), "isClose(weights.at(1) + weights.at(2), 1.0, 1e-12)");
    check(weights.at(1) > weights.at(2), "weights.at(1) > weights.at(2)");
}

void test_degeneracy()
{
    auto conformers = makeConformers({ -50.0, -50.0 });
    conformers[1].setDegeneracy(3.0);
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::FreeEnergy, 298.15);
    check(isClose(weights.at(1), 0.25), "isClose(weights.at(1), 0.25)");
    check(isClose(weights.at(2), 0.75), "isClose(weights.at(2), 0.75)");
}

void test_temperature_dependence()
{
    auto low = makeConformers({ -100.0, -99.999 });
    auto high = makeConformers({ -100.0, -99.999 });
    auto wlow = BoltzmannWeighting::Weights(pointers(low), EnergyProperty::FreeEnergy, 100.0);
    auto whigh = BoltzmannWeighting::Weights(pointers(high), EnergyProperty::FreeEnergy, "1000");
    check(std::abs(wlow.at(1) - wlow.at(2)) > std::abs(whigh.at(1) - whigh.at(2)), "std::abs(wlow.at(1) - wlow.at(2)) > std::abs(whigh.at(1) - whigh.at(2))");
}

void test_temperature_coercion()
{
    check(BoltzmannWeighting::Temperature(310.0) == 310.0, "BoltzmannWeighting::Temperature(310.0) == 310.0");
    check(BoltzmannWeighting::Temperature("273.15") == 273.15, "BoltzmannWeighting::Temperature(\"273.15\") == 273.15");
    check(BoltzmannWeighting::Temperature("warm") == 298.15, "BoltzmannWeighting::Temperature(\"warm\") == 298.15");
    check(BoltzmannWeighting::Temperature(json()) == 298.15, "BoltzmannWeighting::Temperature(json()) == 298.15");
    check(BoltzmannWeighting::Temperature(0) > 0.0, "BoltzmannWeighting::Temperature(0) > 0.0");

    /* T = 0 puts everything into the minimum */
    auto conformers = makeConformers({ -1.0, -0.99 });
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::FreeEnergy, 0);
    check(isClose(weights.at(1), 1.0), "isClose(weights.at(1), 1.0)");
    check(weights.at(2) == 0.0, "weights.at(2) == 0.0");
}

void test_missing_property_aborts()
{
    auto conformers = makeConformers({ -1.0, -2.0 });
    conformers.emplace_back(3);
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::FreeEnergy, 298.15);
    check(weights.empty(), "weights.empty()");
    check(!conformers[0].hasProperty(EnergyProperty::BoltzmannWeight), "!conformers[0].hasProperty(EnergyProperty::BoltzmannWeight)");

    check(BoltzmannWeighting::Weights({}, EnergyProperty::FreeEnergy, 298.15).empty(), "BoltzmannWeighting::Weights({}, EnergyProperty::FreeEnergy, 298.15).empty()");
}

void test_other_property()
{
    std::vector<Conformer> conformers(2);
    conformers[0] = Conformer(1);
    conformers[1] = Conformer(2);
    conformers[0].setProperty(EnergyProperty::XtbEnergy, -5.0);
    conformers[1].setProperty(EnergyProperty::XtbEnergy, -5.0);
    auto weights = BoltzmannWeighting::Weights(pointers(conformers), EnergyProperty::XtbEnergy, 298.15);
    check(isClose(weights.at(1), 0.5), "isClose(weights.at(1), 0.5)");
    check(isClose(conformers[1].Property(EnergyProperty::BoltzmannWeight).value(), 0.5), "isClose(conformers[1].Property(EnergyProperty::BoltzmannWeight).value(), 0.5)");
}

int main()
{
    ConfSieveLogger::initialize(0, false);
    TestRunner runner;

    runner.run_test("Singleton", test_singleton);
    runner.run_test("Two States", test_two_states);
    runner.run_test("Degeneracy", test_degeneracy);
    runner.run_test("Temperature Dependence", test_temperature_dependence);
    runner.run_test("Temperature Coercion", test_temperature_coercion);
    runner.run_test("Missing Property Aborts", test_missing_property_aborts);
    runner.run_test("Other Property", test_other_property);

    runner.summary();
    return runner.get_exit_code();
}
