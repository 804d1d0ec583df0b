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

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>

#include <fmt/format.h>

#include "src/core/confsieve_logger.h"
#include "src/tools/general.h"

#include "anmrrc_writer.h"

AnmrrcWriter::AnmrrcWriter(const json& controller)
{
    m_defaults = MergeJson(AnmrrcJson, controller.is_object() ? controller : json::object());
    const std::string table = Json2KeyWord<std::string>(m_defaults, "anmrrc_table");
    if (!table.empty())
        LoadTable(table);
}

bool AnmrrcWriter::LoadTable(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        ConfSieveLogger::error_fmt("Reference shielding table {} can not be opened", path);
        return false;
    }
    try {
        file >> m_table;
    } catch (const json::parse_error& error) {
        ConfSieveLogger::error_fmt("Reference shielding table {} is not valid json: {}", path, error.what());
        m_table = json();
        return false;
    }
    return true;
}

std::string AnmrrcWriter::OptimisationFunctional() const
{
    const std::string func = Json2KeyWord<std::string>(m_defaults, "func");
    if (func == "r2scan-3c")
        return "b97-3c";
    return func;
}

std::optional<double> AnmrrcWriter::lookup(const std::string& element, const std::string& reference, const std::string& opt_func) const
{
    const std::string prog = Json2KeyWord<std::string>(m_defaults, "prog4_s");
    const std::string func_s = Json2KeyWord<std::string>(m_defaults, "func_s");
    const std::string solvent = Json2KeyWord<std::string>(m_defaults, "solvent");

    const json* node = &m_table;
    for (const auto& key : { prog, element, reference, opt_func, func_s, solvent }) {
        if (!node->is_object())
            return std::nullopt;
        auto it = node->find(key);
        if (it == node->end())
            return std::nullopt;
        node = &(*it);
    }
    if (!node->is_number())
        return std::nullopt;
    return node->get<double>();
}

bool AnmrrcWriter::write(const std::string& directory)
{
    m_lines.clear();
    m_shieldings.clear();

    const std::string prog = Json2KeyWord<std::string>(m_defaults, "prog4_s");
    const std::string solvent = Json2KeyWord<std::string>(m_defaults, "solvent");
    const std::string sm2 = Json2KeyWord<std::string>(m_defaults, "sm2");
    const std::string sm4_s = Json2KeyWord<std::string>(m_defaults, "sm4_s");
    const std::string func_s = Json2KeyWord<std::string>(m_defaults, "func_s");
    const std::string basis_s = Json2KeyWord<std::string>(m_defaults, "basis_s");

    if (solvent != "gas") {
        if (prog == "tm" && sm2 == "cosmo")
            ConfSieveLogger::warn("The geometry optimization of the reference molecule was calculated with DCOSMO-RS instead of COSMO as solvent model (sm2)!");
        else if (prog == "orca" && sm2 == "cpcm")
            ConfSieveLogger::warn("The geometry optimization of the reference molecule was calculated with SMD instead of CPCM as solvent model (sm2)!");
    }

    std::string lsm, lsm4, lbasis_s = "def2-TZVP";
    if (prog == "tm") {
        lsm = lsm4 = "DCOSMO-RS";
        if (sm4_s == "cosmo")
            ConfSieveLogger::warn("The reference shielding constant was calculated with DCOSMORS instead of COSMO as solvent model (sm4_s)!");
    } else if (prog == "orca") {
        lsm = lsm4 = "SMD";
        if (sm4_s == "cpcm")
            ConfSieveLogger::warn("The reference shielding was calculated with SMD instead of CPCM as solvent model (sm4_s)!");
    } else {
        ConfSieveLogger::error_fmt("No reference shieldings for the program {}, use tm or orca.", prog);
        return false;
    }
    if (func_s == "pbeh-3c")
        lbasis_s = "def2-mSVP";
    if (basis_s != "def2-TZVP" && func_s != "pbeh-3c")
        ConfSieveLogger::warn("The reference shielding constant was calculated with the basis def2-TZVP (basisS)!");

    const std::string opt_func = OptimisationFunctional();
    if (opt_func != Json2KeyWord<std::string>(m_defaults, "func"))
        ConfSieveLogger::warn_fmt("The reference shielding constants is not available for {} and {} is used instead!",
            Json2KeyWord<std::string>(m_defaults, "func"), opt_func);

    /* atomic number, element key */
    const std::array<std::pair<int, std::string>, 5> elements = { { { 1, "h" }, { 6, "c" }, { 9, "f" }, { 14, "si" }, { 15, "p" } } };

    std::map<std::string, std::string> printed;
    bool missing = false;
    for (const auto& [number, element] : elements) {
        auto shielding = lookup(element, Json2KeyWord<std::string>(m_defaults, element + "_ref"), opt_func);
        if (shielding) {
            m_shieldings[element] = *shielding;
            printed[element] = fmt::format("{:4.3f}", *shielding);
        } else {
            m_shieldings[element] = 0.0;
            printed[element] = std::string();
            missing = true;
        }
    }
    if (missing)
        ConfSieveLogger::record_error("The reference absolute shielding constant could not be found! You have to edit the file .anmrrc by hand!");

    std::size_t length = 6;
    if (!missing) {
        length = 0;
        for (const auto& [element, value] : printed)
            length = std::max(length, value.size());
    }

    const std::string qm = UpperCase(prog);

    m_lines.push_back("7 8 XH acid atoms");
    const json& frequency = m_defaults["resonance_frequency"];
    if (!frequency.is_null()) {
        std::string mf = frequency.dump();
        if (frequency.is_number_integer())
            mf = fmt::format("{}", frequency.get<long long>());
        else if (frequency.is_number())
            mf = fmt::format("{}", frequency.get<double>());
        else if (frequency.is_string())
            mf = frequency.get<std::string>();
        auto onoff = [](bool value) { return value ? "on" : "off"; };
        m_lines.push_back(fmt::format("ENSO qm= {} mf= {} lw= 1.0  J= {} S= {} T= {:6.2f} ",
            qm, mf,
            onoff(Json2KeyWord<bool>(m_defaults, "couplings")),
            onoff(Json2KeyWord<bool>(m_defaults, "shieldings")),
            Json2KeyWord<double>(m_defaults, "temperature")));
    } else {
        m_lines.push_back(fmt::format("ENSO qm= {} lw= 1.2", qm));
    }
    m_lines.push_back(fmt::format("{}[{}] {}[{}]/{}//{}[{}]/{}",
        Json2KeyWord<std::string>(m_defaults, "h_ref"), solvent,
        func_s, lsm4, lbasis_s,
        opt_func, lsm, Json2KeyWord<std::string>(m_defaults, "basis")));

    for (const auto& [number, element] : elements) {
        const int active = Json2KeyWord<bool>(m_defaults, element + "_active") ? 1 : 0;
        /* a missing constant is a number column, printed right-aligned */
        const std::string cell = printed[element].empty() ? fmt::format("{:>{}}", 0, length) : fmt::format("{:<{}}", printed[element], length);
        m_lines.push_back(fmt::format("{:<3}{}    0.0    {}", number, cell, active));
    }

    const std::string path = (fs::path(directory) / ".anmrrc").string();
    std::ofstream out(path);
    if (!out.is_open()) {
        ConfSieveLogger::error_fmt("Could not write {}", path);
        return false;
    }
    for (const auto& line : m_lines)
        out << line << "\n";
    ConfSieveLogger::success_fmt("Wrote {}", Tools::LastFolders(path, 2));
    return true;
}
