/*
 * <Owned set of conformers with disjoint candidate lists.>
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
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "src/core/conformer.h"
#include "src/core/global.h"

namespace confsieve {

enum class ConformerList {
    Active, // iterated by the current stage
    Processed, // calculated in a previous run, still part of the ensemble
    Removed // sorted out, kept for bookkeeping
};

/*! \brief Arena of conformers keyed by id
 *
 * Every conformer that was ever added is owned by exactly one of the three
 * lists. Moving between the lists is the only way to change membership,
 * ids are never reused and conformers are never erased.
 */
class ConformerSet {
public:
    ConformerSet() = default;
    ConformerSet(const ConformerSet& other);
    ConformerSet& operator=(const ConformerSet& other);

    /*! \brief Adds a new conformer, false if the id is already known */
    bool add(const Conformer& conformer, ConformerList list = ConformerList::Active);

    /*! \brief Moves id into the list "to", records the reason in the error log if given
     *
     * Returns false if the id is unknown. Moving into the current list is a no-op.
     */
    bool move(int id, ConformerList to, const std::string& reason = std::string());

    bool contains(int id) const;
    ConformerList listOf(int id) const;

    Conformer& at(int id);
    const Conformer& at(int id) const;

    /*! \brief Ids of a list in ascending order */
    std::vector<int> ids(ConformerList list) const;
    std::vector<int> allIds() const;
    int size(ConformerList list) const;
    inline int size() const { return m_conformers.size(); }

    /*! \brief Pointers to the conformers of a list, sorted by id */
    std::vector<Conformer*> members(ConformerList list);
    std::vector<const Conformer*> members(ConformerList list) const;

    /*! \brief Every known id is in exactly one list and the lists cover all ids */
    bool isConsistent() const;

    inline const StringList& Reasons() const { return m_reasons; }

    json toJson() const;
    static ConformerSet fromJson(const json& data);

private:
    std::set<int>& listSet(ConformerList list);
    const std::set<int>& listSet(ConformerList list) const;

    std::map<int, Conformer> m_conformers;
    std::set<int> m_active, m_processed, m_removed;
    StringList m_reasons;
    mutable std::mutex m_mutex;
};

} // namespace confsieve
