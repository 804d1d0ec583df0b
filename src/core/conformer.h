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

#pragma once

#include <map>
#include <optional>
#include <string>

#include "src/core/global.h"

namespace confsieve {

/*! \brief Scalar properties a conformer accumulates across the stages */
enum class EnergyProperty {
    XtbEnergy, // energy from the ensemble file, Eh
    RelXtbEnergy, // relative to the ensemble minimum, kcal/mol
    OptimizationEnergy, // energy recorded in optimization_info, Eh
    FreeEnergy, // free energy of the current stage, Eh
    RelFreeEnergy, // kcal/mol
    BoltzmannWeight
};

std::string PropertyName(EnergyProperty property);
std::optional<EnergyProperty> PropertyFromName(const std::string& name);

class Conformer {
public:
    Conformer() = default;
    explicit Conformer(int id);

    inline int Id() const { return m_id; }
    inline std::string Tag() const { return "CONF" + std::to_string(m_id); }

    /*! \brief Typed access to a property, empty if it was never set */
    std::optional<double> Property(EnergyProperty property) const;
    void setProperty(EnergyProperty property, double value);
    void clearProperty(EnergyProperty property);
    inline bool hasProperty(EnergyProperty property) const { return Property(property).has_value(); }

    /*! \brief Degeneracy factor g_i, 1.0 unless set explicitly */
    inline double Degeneracy() const { return m_degeneracy; }
    inline void setDegeneracy(double gi) { m_degeneracy = gi; }

    /*! \brief {energy, info, cregen_sort} provenance of the optimisation stage */
    inline const json& OptimizationInfo() const { return m_optimization_info; }
    void setOptimizationInfo(const std::string& key, const json& value);

    inline bool JobSuccess() const { return m_job_success; }
    inline void setJobSuccess(bool success) { m_job_success = success; }

    inline const StringList& Elements() const { return m_elements; }
    inline const Geometry& getGeometry() const { return m_geometry; }
    void setGeometry(const StringList& elements, const Geometry& geometry);
    inline int AtomCount() const { return m_elements.size(); }

    json toJson() const;
    static Conformer fromJson(const json& data);

private:
    int m_id = 0;
    std::map<EnergyProperty, double> m_properties;
    double m_degeneracy = 1.0;
    bool m_job_success = true;

    json m_optimization_info = {
        { "energy", nullptr },
        { "info", "not_calculated" },
        { "cregen_sort", "pass" }
    };

    StringList m_elements;
    Geometry m_geometry = Geometry::Zero(0, 3);
};

} // namespace confsieve
