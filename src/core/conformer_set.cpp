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

#include <stdexcept>

#include <fmt/format.h>

#include "conformer_set.h"

namespace confsieve {

ConformerSet::ConformerSet(const ConformerSet& other)
{
    std::lock_guard<std::mutex> lock(other.m_mutex);
    m_conformers = other.m_conformers;
    m_active = other.m_active;
    m_processed = other.m_processed;
    m_removed = other.m_removed;
    m_reasons = other.m_reasons;
}

ConformerSet& ConformerSet::operator=(const ConformerSet& other)
{
    if (this == &other)
        return *this;
    std::scoped_lock lock(m_mutex, other.m_mutex);
    m_conformers = other.m_conformers;
    m_active = other.m_active;
    m_processed = other.m_processed;
    m_removed = other.m_removed;
    m_reasons = other.m_reasons;
    return *this;
}

std::set<int>& ConformerSet::listSet(ConformerList list)
{
    switch (list) {
    case ConformerList::Processed:
        return m_processed;
    case ConformerList::Removed:
        return m_removed;
    default:
        return m_active;
    }
}

const std::set<int>& ConformerSet::listSet(ConformerList list) const
{
    switch (list) {
    case ConformerList::Processed:
        return m_processed;
    case ConformerList::Removed:
        return m_removed;
    default:
        return m_active;
    }
}

bool ConformerSet::add(const Conformer& conformer, ConformerList list)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_conformers.count(conformer.Id()))
        return false;
    m_conformers.emplace(conformer.Id(), conformer);
    listSet(list).insert(conformer.Id());
    return true;
}

bool ConformerSet::move(int id, ConformerList to, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_conformers.count(id))
        return false;

    for (auto list : { ConformerList::Active, ConformerList::Processed, ConformerList::Removed }) {
        if (list != to)
            listSet(list).erase(id);
    }
    listSet(to).insert(id);

    if (!reason.empty())
        m_reasons.push_back(reason);
    return true;
}

bool ConformerSet::contains(int id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conformers.count(id) > 0;
}

ConformerList ConformerSet::listOf(int id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_processed.count(id))
        return ConformerList::Processed;
    if (m_removed.count(id))
        return ConformerList::Removed;
    if (m_active.count(id))
        return ConformerList::Active;
    throw std::out_of_range(fmt::format("CONF{} is not part of the ensemble", id));
}

Conformer& ConformerSet::at(int id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conformers.at(id);
}

const Conformer& ConformerSet::at(int id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conformers.at(id);
}

std::vector<int> ConformerSet::ids(ConformerList list) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& set = listSet(list);
    return std::vector<int>(set.begin(), set.end());
}

std::vector<int> ConformerSet::allIds() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<int> result;
    for (const auto& [id, conformer] : m_conformers)
        result.push_back(id);
    return result;
}

int ConformerSet::size(ConformerList list) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return listSet(list).size();
}

std::vector<Conformer*> ConformerSet::members(ConformerList list)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Conformer*> result;
    for (int id : listSet(list))
        result.push_back(&m_conformers.at(id));
    return result;
}

std::vector<const Conformer*> ConformerSet::members(ConformerList list) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<const Conformer*> result;
    for (int id : listSet(list))
        result.push_back(&m_conformers.at(id));
    return result;
}

bool ConformerSet::isConsistent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active.size() + m_processed.size() + m_removed.size() != m_conformers.size())
        return false;
    for (const auto& [id, conformer] : m_conformers) {
        int owners = m_active.count(id) + m_processed.count(id) + m_removed.count(id);
        if (owners != 1 || conformer.Id() != id)
            return false;
    }
    return true;
}

json ConformerSet::toJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    json data;
    json conformers = json::array();
    for (const auto& [id, conformer] : m_conformers)
        conformers.push_back(conformer.toJson());
    data["conformers"] = conformers;
    data["active"] = m_active;
    data["processed"] = m_processed;
    data["removed"] = m_removed;
    data["reasons"] = m_reasons;
    return data;
}

ConformerSet ConformerSet::fromJson(const json& data)
{
    ConformerSet set;
    std::map<int, ConformerList> owner;
    for (int id : data.value("processed", std::vector<int>()))
        owner[id] = ConformerList::Processed;
    for (int id : data.value("removed", std::vector<int>()))
        owner[id] = ConformerList::Removed;

    for (const auto& entry : data.at("conformers")) {
        Conformer conformer = Conformer::fromJson(entry);
        auto it = owner.find(conformer.Id());
        set.add(conformer, it == owner.end() ? ConformerList::Active : it->second);
    }
    set.m_reasons = data.value("reasons", StringList());
    return set;
}

} // namespace confsieve
