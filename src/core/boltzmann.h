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

#pragma once

#include <map>
#include <vector>

#include "src/core/conformer.h"
#include "src/core/global.h"

namespace confsieve {

class BoltzmannWeighting {
public:
    /*! \brief Temperature in K from a number or a numeric string, 298.15 otherwise
     *
     * T = 0 is shifted to a small positive value.
     */
    static double Temperature(const json& temperature);

    /*! \brief Normalised weights g_i exp(-(E_i - E_min) / kT), stored as BoltzmannWeight
     *
     * A single conformer always gets 1.0. Every conformer passed in needs the
     * property, otherwise nothing is assigned and an empty map is returned.
     */
    static std::map<int, double> Weights(const std::vector<Conformer*>& conformers, EnergyProperty property, const json& temperature);
};

} // namespace confsieve
