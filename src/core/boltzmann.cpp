/*
 * <Boltzmann population of conformers.>
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

#include <cmath>
#include <optional>

#include "src/core/confsieve_logger.h"
#include "src/core/units.h"
#include "src/tools/general.h"

#include "boltzmann.h"

namespace confsieve {

double BoltzmannWeighting::Temperature(const json& temperature)
{
    double T = ConfSieveUnit::Constants::DEFAULT_TEMPERATURE;
    bool converted = false;
    if (temperature.is_number()) {
        T = temperature.get<double>();
        converted = true;
    } else if (temperature.is_string()) {
        auto value = Tools::ToDouble(temperature.get<std::string>());
        if (value) {
            T = *value;
            converted = true;
        }
    }
    if (!converted) {
        T = ConfSieveUnit::Constants::DEFAULT_TEMPERATURE;
        ConfSieveLogger::warn_fmt("Temperature can not be converted and is therefore set to T = {} K.", T);
    }
    if (T == 0)
        T += ConfSieveUnit::Constants::ZERO_TEMPERATURE_SHIFT;
    return T;
}

std::map<int, double> BoltzmannWeighting::Weights(const std::vector<Conformer*>& conformers, EnergyProperty property, const json& temperature)
{
    std::map<int, double> weights;
    if (conformers.empty()) {
        ConfSieveLogger::warn("No conformers to calculate Boltzmann weights for.");
        return weights;
    }
    if (conformers.size() == 1) {
        conformers[0]->setProperty(EnergyProperty::BoltzmannWeight, 1.0);
        weights[conformers[0]->Id()] = 1.0;
        return weights;
    }

    const double T = Temperature(temperature);

    std::optional<double> minimum;
    for (const auto* conformer : conformers) {
        auto energy = conformer->Property(property);
        if (!energy) {
            ConfSieveLogger::error_fmt("Boltzmann weight can not be calculated, {} of CONF{} is not set!", PropertyName(property), conformer->Id());
            return std::map<int, double>();
        }
        if (!minimum || *energy < *minimum)
            minimum = energy;
    }

    const double kT = ConfSieveUnit::Constants::BOLTZMANN_SI * T;
    double bsum = 0.0;
    std::map<int, double> terms;
    for (const auto* conformer : conformers) {
        const double delta = ConfSieveUnit::Energy::hartree_to_joule(*conformer->Property(property) - *minimum);
        const double term = conformer->Degeneracy() * std::exp(-delta / kT);
        terms[conformer->Id()] = term;
        bsum += term;
    }
    if (bsum <= 0.0) {
        ConfSieveLogger::error("Boltzmann weight can not be calculated, the partition sum vanishes!");
        return std::map<int, double>();
    }

    for (auto* conformer : conformers) {
        const double weight = terms[conformer->Id()] / bsum;
        conformer->setProperty(EnergyProperty::BoltzmannWeight, weight);
        weights[conformer->Id()] = weight;
    }
    return weights;
}

} // namespace confsieve
