/*
 * <Per conformer folder tree CONF<id>/<stage>.>
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

#include <set>
#include <string>
#include <vector>

#include "src/core/conformer_set.h"
#include "src/core/global.h"

namespace confsieve {

class ConformerStore {
public:
    explicit ConformerStore(const std::string& workdir = ".");

    /*! \brief workdir/CONF<id>/<stage> */
    std::string Folder(int id, const std::string& stage) const;
    std::string CoordFile(int id, const std::string& stage) const;

    /*! \brief Creates CONF<id>/<stage>, an existing folder is fine
     *
     * If the folder can not be created, the conformer is moved to the removed
     * list of set and false is returned. Other conformers are not affected.
     */
    bool ensureFolder(ConformerSet& set, int id, const std::string& stage) const;

    /*! \brief ensureFolder for all members of list, returns the number of evicted conformers */
    int ensureFolders(ConformerSet& set, ConformerList list, const std::string& stage) const;

    bool verifyFolder(int id, const std::string& stage) const;

    /*! \brief Ids whose stage folder is missing, each one is reported */
    std::set<int> verifyFolders(const std::vector<int>& ids, const std::string& stage) const;

    /*! \brief Writes coord files of list members from the ensemble, returns ids that failed */
    std::set<int> writeCoords(const ConformerSet& set, ConformerList list, const StringList& ensemble, int nat, const std::string& stage) const;

    /*! \brief file -> file.1, file.n -> file.n+1, highest suffix first
     *
     * Suffixes that are not integers are left alone.
     */
    static bool rotateBackup(const std::string& directory, const std::string& filename);

private:
    std::string m_workdir;
};

} // namespace confsieve
