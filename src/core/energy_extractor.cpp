/*
 * <Energies of ensemble blocks and their relative values.>
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

#include "src/core/confsieve_logger.h"
#include "src/core/coordinate_codec.h"
#include "src/core/units.h"
#include "src/tools/general.h"

#include "energy_extractor.h"

namespace confsieve {

EnergyMap EnergyExtractor::extract(const std::string& ensemble, int maxconf, int nat, const std::vector<int>& ids)
{
    auto lines = CoordinateCodec::ReadLines(ensemble);
    if (!lines) {
        ConfSieveLogger::error_fmt("File {} does not exist!", Tools::LastFolders(ensemble, 1));
        EnergyMap energies;
        for (int id : ids)
            energies[id] = std::nullopt;
        return energies;
    }
    return extract(*lines, maxconf, nat, ids);
}

EnergyMap EnergyExtractor::extract(const StringList& ensemble, int maxconf, int nat, const std::vector<int>& ids)
{
    if (static_cast<std::size_t>(maxconf) * (nat + 2) > ensemble.size())
        ConfSieveLogger::error_fmt("Either the number of conformers ({}) or the number of atoms ({}) is wrong!", maxconf, nat);

    std::vector<int> sorted = ids;
    std::sort(sorted.begin(), sorted.end());

    EnergyMap energies;
    for (int id : sorted) {
        energies[id] = std::nullopt;
        if (id < 1)
            continue;
        const std::size_t line = static_cast<std::size_t>(id - 1) * (nat + 2) + 1;
        if (line >= ensemble.size()) {
            ConfSieveLogger::warn_fmt("No energy line for CONF{} in the ensemble", id);
            continue;
        }
        energies[id] = Tools::CheckForFloat(ensemble[line]);
        if (!energies[id])
            ConfSieveLogger::warn_fmt("Could not read the energy of CONF{}", id);
    }
    return energies;
}

std::optional<std::map<int, double>> EnergyExtractor::relative(const EnergyMap& energies)
{
    std::optional<double> lowest;
    for (const auto& [id, energy] : energies) {
        if (energy && (!lowest || *energy < *lowest))
            lowest = energy;
    }
    if (!lowest) {
        ConfSieveLogger::warn("Can't calculate rel_xtb_energy!");
        return std::nullopt;
    }

    std::map<int, double> result;
    for (const auto& [id, energy] : energies) {
        if (energy)
            result[id] = ConfSieveUnit::Energy::hartree_to_kcalmol(*energy - *lowest);
    }
    return result;
}

std::vector<int> EnergyExtractor::lowestIds(const EnergyMap& energies)
{
    std::optional<double> lowest;
    for (const auto& [id, energy] : energies) {
        if (energy && (!lowest || *energy < *lowest))
            lowest = energy;
    }
    std::vector<int> ids;
    if (!lowest)
        return ids;
    for (const auto& [id, energy] : energies) {
        if (energy && *energy == *lowest)
            ids.push_back(id);
    }
    return ids;
}

bool EnergyExtractor::assign(ConformerSet& set, const EnergyMap& energies)
{
    auto rel = relative(energies);
    if (!rel)
        return false;

    for (const auto& [id, energy] : energies) {
        if (!set.contains(id))
            continue;
        Conformer& conformer = set.at(id);
        if (energy) {
            conformer.setProperty(EnergyProperty::XtbEnergy, *energy);
            conformer.setProperty(EnergyProperty::RelXtbEnergy, rel->at(id));
        } else {
            conformer.clearProperty(EnergyProperty::XtbEnergy);
            conformer.clearProperty(EnergyProperty::RelXtbEnergy);
        }
    }
    return true;
}

} // namespace confsieve
