/*
 * <Conformer record tracked through the sorting stages.>
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

#include <array>

#include "conformer.h"

namespace confsieve {

namespace {
const std::array<std::pair<EnergyProperty, const char*>, 6> PropertyNames = { {
    { EnergyProperty::XtbEnergy, "xtb_energy" },
    { EnergyProperty::RelXtbEnergy, "rel_xtb_energy" },
    { EnergyProperty::OptimizationEnergy, "optimization_energy" },
    { EnergyProperty::FreeEnergy, "free_energy" },
    { EnergyProperty::RelFreeEnergy, "rel_free_energy" },
    { EnergyProperty::BoltzmannWeight, "bm_weight" },
} };
}

std::string PropertyName(EnergyProperty property)
{
    for (const auto& [key, name] : PropertyNames) {
        if (key == property)
            return name;
    }
    return "unknown";
}

std::optional<EnergyProperty> PropertyFromName(const std::string& name)
{
    for (const auto& [key, str] : PropertyNames) {
        if (name == str)
            return key;
    }
    return std::nullopt;
}

Conformer::Conformer(int id)
    : m_id(id)
{
}

std::optional<double> Conformer::Property(EnergyProperty property) const
{
    if (property == EnergyProperty::OptimizationEnergy) {
        auto energy = m_optimization_info.find("energy");
        if (energy != m_optimization_info.end() && energy->is_number())
            return energy->get<double>();
        return std::nullopt;
    }
    auto it = m_properties.find(property);
    if (it == m_properties.end())
        return std::nullopt;
    return it->second;
}

void Conformer::setProperty(EnergyProperty property, double value)
{
    if (property == EnergyProperty::OptimizationEnergy)
        m_optimization_info["energy"] = value;
    else
        m_properties[property] = value;
}

void Conformer::clearProperty(EnergyProperty property)
{
    if (property == EnergyProperty::OptimizationEnergy)
        m_optimization_info["energy"] = nullptr;
    else
        m_properties.erase(property);
}

void Conformer::setOptimizationInfo(const std::string& key, const json& value)
{
    m_optimization_info[key] = value;
}

void Conformer::setGeometry(const StringList& elements, const Geometry& geometry)
{
    m_elements = elements;
    m_geometry = geometry;
}

json Conformer::toJson() const
{
    json data;
    data["id"] = m_id;
    data["gi"] = m_degeneracy;
    data["job_success"] = m_job_success;
    data["optimization_info"] = m_optimization_info;
    for (const auto& [property, value] : m_properties)
        data[PropertyName(property)] = value;
    if (!m_elements.empty()) {
        json atoms = json::array();
        for (int i = 0; i < static_cast<int>(m_elements.size()); ++i)
            atoms.push_back({ m_elements[i], m_geometry(i, 0), m_geometry(i, 1), m_geometry(i, 2) });
        data["geometry"] = atoms;
    }
    return data;
}

Conformer Conformer::fromJson(const json& data)
{
    Conformer conformer(data.at("id").get<int>());
    if (data.contains("gi"))
        conformer.m_degeneracy = data["gi"].get<double>();
    if (data.contains("job_success"))
        conformer.m_job_success = data["job_success"].get<bool>();
    if (data.contains("optimization_info") && data["optimization_info"].is_object()) {
        for (const auto& item : data["optimization_info"].items())
            conformer.m_optimization_info[item.key()] = item.value();
    }
    for (const auto& [property, name] : PropertyNames) {
        if (property == EnergyProperty::OptimizationEnergy)
            continue;
        if (data.contains(name) && data[name].is_number())
            conformer.m_properties[property] = data[name].get<double>();
    }
    if (data.contains("geometry") && data["geometry"].is_array()) {
        const json& atoms = data["geometry"];
        StringList elements;
        Geometry geometry = Geometry::Zero(atoms.size(), 3);
        for (std::size_t i = 0; i < atoms.size(); ++i) {
            elements.push_back(atoms[i][0].get<std::string>());
            for (int j = 0; j < 3; ++j)
                geometry(i, j) = atoms[i][j + 1].get<double>();
        }
        conformer.setGeometry(elements, geometry);
    }
    return conformer;
}

} // namespace confsieve
