/*
 * <Removal of rotamers and duplicate structures with CREGEN.>
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

static const json DuplicateDetectorJson = {
    { "crest", "crest" },
    { "ethr", 0.15 },
    { "rthr", 0.175 },
    { "bthr", 0.03 },
    { "crestcheck", false },
    { "scratch", "conformer_rotamer_check" },
    { "trajectory", "conformers.xyz" },
    { "tags", "enso.tags" },
    { "log", "crest.out" },
    { "duplicate_blocks", true },
    { "stage", "GFNFF" },
    { "workdir", "." }
};

struct DuplicateResult {
    bool ran = false; // tool exited cleanly
    bool tags_found = false;
    std::set<std::string> survivors;
    std::vector<int> candidates; // sorted by optimisation energy
    std::vector<int> duplicates; // candidates missing in the survivor set
    std::vector<int> removed;
};

class DuplicateDetector {
public:
    explicit DuplicateDetector(const json& controller = json());

    /*! \brief Runs CREGEN on active and processed conformers of set
     *
     * Duplicates are moved to the removed list only if crestcheck is set and
     * the tags file could be read.
     */
    DuplicateResult run(confsieve::ConformerSet& set);

    /*! \brief Command line of the external tool, executed inside the scratch folder */
    std::string Command() const;

    /*! \brief Second token of every non-empty line without its first character */
    static std::set<std::string> ParseTags(const StringList& lines);

    std::string ScratchDirectory() const;

private:
    bool prepareScratch() const;
    bool writeCandidates(const std::vector<int>& ids, const std::vector<StringList>& blocks, const std::vector<double>& energies) const;

    json m_defaults;
    std::string m_crest, m_scratch, m_trajectory, m_tags, m_log, m_stage, m_workdir;
    double m_ethr, m_rthr, m_bthr;
    bool m_remove = false, m_duplicate_blocks = true;
};
