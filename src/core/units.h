/*
 * <Unit system and physical constants for confsieve>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * All constants follow the values used by the ensemble sorting workflow
 * (CODATA-2014 for Hartree, Bohr and k_B), so that relative energies and
 * populations agree with previously written reports.
 */

#pragma once

#include "src/global_config.h"

namespace ConfSieveUnit {

namespace Constants {
    constexpr double BOLTZMANN_SI = CONFSIEVE_BOLTZMANN_SI; // J/K
    constexpr double DEFAULT_TEMPERATURE = 298.15; // K
    constexpr double ZERO_TEMPERATURE_SHIFT = 0.00001; // K
}

namespace Energy {
    constexpr double HARTREE_TO_KCALMOL = CONFSIEVE_EH_TO_KCALMOL;
    constexpr double HARTREE_TO_JOULE = CONFSIEVE_EH_TO_JOULE; // per particle

    inline constexpr double hartree_to_kcalmol(double eh) { return eh * HARTREE_TO_KCALMOL; }
    inline constexpr double hartree_to_joule(double eh) { return eh * HARTREE_TO_JOULE; }
}

namespace Length {
    constexpr double BOHR_TO_ANGSTROM = CONFSIEVE_BOHR_TO_ANGSTROM;

    inline constexpr double bohr_to_angstrom(double bohr) { return bohr * BOHR_TO_ANGSTROM; }
    inline constexpr double angstrom_to_bohr(double ang) { return ang / BOHR_TO_ANGSTROM; }
}

} // namespace ConfSieveUnit
