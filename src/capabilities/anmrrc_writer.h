/*
 * <Writer for the .anmrrc reference shielding file.>
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

#include "src/core/global.h"

/* Reference table layout:
 * { "tm": { "h": { "TMS": { "<opt func>": { "<nmr func>": { "<solvent>": shielding } } } } }, "orca": {...} }
 */
static const json AnmrrcJson = {
    { "anmrrc_table", "" },
    { "prog4_s", "tm" },
    { "func", "r2scan-3c" },
    { "basis", "def2-mTZVPP" },
    { "func_s", "pbe0" },
    { "basis_s", "def2-TZVP" },
    { "sm2", "default" },
    { "sm4_s", "default" },
    { "solvent", "gas" },
    { "h_ref", "TMS" },
    { "c_ref", "TMS" },
    { "f_ref", "CFCl3" },
    { "p_ref", "TMP" },
    { "si_ref", "TMS" },
    { "h_active", true },
    { "c_active", true },
    { "f_active", false },
    { "p_active", false },
    { "si_active", false },
    { "resonance_frequency", nullptr },
    { "couplings", true },
    { "shieldings", true },
    { "temperature", 298.15 }
};

class AnmrrcWriter {
public:
    explicit AnmrrcWriter(const json& controller = json());

    /*! \brief Reads the reference table from a json file */
    bool LoadTable(const std::string& path);
    inline void setTable(const json& table) { m_table = table; }

    /*! \brief Writes directory/.anmrrc, missing shieldings are written as 0 */
    bool write(const std::string& directory = ".");

    /*! \brief Reference shieldings of the last write, keyed "h", "c", "f", "p", "si" */
    inline const std::map<std::string, double>& ReferenceShieldings() const { return m_shieldings; }
    inline const StringList& Lines() const { return m_lines; }

    /*! \brief Functional the reference geometries were optimised with */
    std::string OptimisationFunctional() const;

private:
    std::optional<double> lookup(const std::string& element, const std::string& reference, const std::string& opt_func) const;

    json m_defaults, m_table;
    std::map<std::string, double> m_shieldings;
    StringList m_lines;
};
