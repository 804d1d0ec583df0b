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

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/core/conformer_set.h"
#include "src/core/global.h"

namespace confsieve {

typedef std::map<int, std::optional<double>> EnergyMap;

class EnergyExtractor {
public:
    /*! \brief First float on the comment line of each requested block
     *
     * An unreadable file or an unparsable comment line leaves the energy unset.
     * A file shorter than maxconf * (nat + 2) lines is reported, the blocks
     * that can be addressed are still read.
     */
    static EnergyMap extract(const std::string& ensemble, int maxconf, int nat, const std::vector<int>& ids);
    static EnergyMap extract(const StringList& ensemble, int maxconf, int nat, const std::vector<int>& ids);

    /*! \brief (e - min) in kcal/mol for all set energies, empty if no energy is set */
    static std::optional<std::map<int, double>> relative(const EnergyMap& energies);

    /*! \brief Ids sharing the minimum energy */
    static std::vector<int> lowestIds(const EnergyMap& energies);

    /*! \brief Writes XtbEnergy and RelXtbEnergy into the conformers of set
     *
     * Returns false if no energy could be assigned.
     */
    static bool assign(ConformerSet& set, const EnergyMap& energies);
};

} // namespace confsieve
