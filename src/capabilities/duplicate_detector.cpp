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

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <numeric>
#include <sstream>

#include <fmt/format.h>

#include "src/core/confsieve_logger.h"
#include "src/core/conformer_store.h"
#include "src/core/coordinate_codec.h"
#include "src/tools/general.h"

#include "duplicate_detector.h"

using confsieve::ConformerList;
using confsieve::EnergyProperty;

DuplicateDetector::DuplicateDetector(const json& controller)
{
    m_defaults = MergeJson(DuplicateDetectorJson, controller.is_object() ? controller : json::object());
    m_crest = Json2KeyWord<std::string>(m_defaults, "crest");
    m_ethr = Json2KeyWord<double>(m_defaults, "ethr");
    m_rthr = Json2KeyWord<double>(m_defaults, "rthr");
    m_bthr = Json2KeyWord<double>(m_defaults, "bthr");
    m_remove = Json2KeyWord<bool>(m_defaults, "crestcheck");
    m_scratch = Json2KeyWord<std::string>(m_defaults, "scratch");
    m_trajectory = Json2KeyWord<std::string>(m_defaults, "trajectory");
    m_tags = Json2KeyWord<std::string>(m_defaults, "tags");
    m_log = Json2KeyWord<std::string>(m_defaults, "log");
    m_duplicate_blocks = Json2KeyWord<bool>(m_defaults, "duplicate_blocks");
    m_stage = Json2KeyWord<std::string>(m_defaults, "stage");
    m_workdir = Json2KeyWord<std::string>(m_defaults, "workdir");

    /* the tool is started from inside the scratch folder */
    if (Tools::StringContains(m_crest, "/"))
        m_crest = fs::absolute(m_crest).string();
}

std::string DuplicateDetector::ScratchDirectory() const
{
    return (fs::path(m_workdir) / m_scratch).string();
}

std::string DuplicateDetector::Command() const
{
    std::stringstream command;
    command << "cd \"" << ScratchDirectory() << "\" && \"" << m_crest << "\" coord -cregen " << m_trajectory
            << fmt::format(" -ethr {} -rthr {} -bthr {} -enso", m_ethr, m_rthr, m_bthr)
            << " > " << m_log << " 2>&1";
    return command.str();
}

std::set<std::string> DuplicateDetector::ParseTags(const StringList& lines)
{
    std::set<std::string> tags;
    for (const auto& line : lines) {
        StringList tokens = Tools::SplitString(line);
        if (tokens.size() < 2 || tokens[1].size() < 2)
            continue;
        tags.insert(tokens[1].substr(1));
    }
    return tags;
}

bool DuplicateDetector::prepareScratch() const
{
    const fs::path scratch(ScratchDirectory());
    std::error_code ec;
    fs::create_directories(scratch, ec);
    if (ec && !fs::is_directory(scratch)) {
        ConfSieveLogger::error_fmt("Could not create {}: {}", scratch.string(), ec.message());
        return false;
    }
    for (const auto& file : { m_trajectory, std::string("coord"), m_tags }) {
        fs::remove(scratch / file, ec);
        if (ec)
            ConfSieveLogger::warn_fmt("Could not remove old {}: {}", file, ec.message());
    }
    return true;
}

bool DuplicateDetector::writeCandidates(const std::vector<int>& ids, const std::vector<StringList>& blocks, const std::vector<double>& energies) const
{
    const fs::path target = fs::path(ScratchDirectory()) / m_trajectory;
    std::ofstream out(target);
    if (!out.is_open()) {
        ConfSieveLogger::error_fmt("Could not write {}", target.string());
        return false;
    }

    /* the candidate loop is written twice, CREGEN has always been fed with the doubled trajectory */
    const int passes = m_duplicate_blocks ? 2 : 1;
    for (int pass = 0; pass < passes; ++pass) {
        for (std::size_t i = 0; i < ids.size(); ++i) {
            out << fmt::format("  {}\n", blocks[i].size());
            out << fmt::format("{:20.8f}        !CONF{}\n", energies[i], ids[i]);
            for (const auto& line : blocks[i])
                out << line << "\n";
        }
    }
    return true;
}

DuplicateResult DuplicateDetector::run(confsieve::ConformerSet& set)
{
    DuplicateResult result;
    ConfSieveLogger::header("Checking for identical structures in ensemble with CREGEN!");

    confsieve::ConformerStore store(m_workdir);

    struct Candidate {
        int id;
        double energy;
        StringList block;
    };
    std::vector<Candidate> candidates;
    for (auto list : { ConformerList::Active, ConformerList::Processed }) {
        for (const auto* conformer : set.members(list)) {
            auto energy = conformer->Property(EnergyProperty::OptimizationEnergy);
            if (!energy) {
                ConfSieveLogger::warn_fmt("CONF{} has no optimization energy and is not checked by CREGEN.", conformer->Id());
                continue;
            }
            try {
                auto block = confsieve::CoordinateCodec::decode(store.CoordFile(conformer->Id(), m_stage));
                candidates.push_back({ conformer->Id(), *energy, block.lines });
            } catch (const std::exception& error) {
                ConfSieveLogger::error_fmt("CONF{} is not checked by CREGEN: {}", conformer->Id(), error.what());
            }
        }
    }
    if (candidates.empty()) {
        ConfSieveLogger::warn("No conformers to be checked by CREGEN.");
        return result;
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.energy < b.energy; });

    std::vector<int> ids;
    std::vector<StringList> blocks;
    std::vector<double> energies;
    for (const auto& candidate : candidates) {
        ids.push_back(candidate.id);
        blocks.push_back(candidate.block);
        energies.push_back(candidate.energy);
    }
    result.candidates = ids;

    if (!prepareScratch())
        return result;

    std::error_code ec;
    fs::copy_file(store.CoordFile(ids.front(), m_stage), fs::path(ScratchDirectory()) / "coord", fs::copy_options::overwrite_existing, ec);
    if (ec)
        ConfSieveLogger::record_error(fmt::format("Could not copy the coord file of CONF{}: {}", ids.front(), ec.message()));

    if (!writeCandidates(ids, blocks, energies))
        return result;

    const std::string command = Command();
    ConfSieveLogger::info_fmt("Running: {}", command);
    const int status = std::system(command.c_str());
    result.ran = status == 0;
    if (!result.ran)
        ConfSieveLogger::record_error(fmt::format("CREGEN terminated with status {}, see {}", status, Tools::LastFolders(ScratchDirectory() + "/" + m_log, 2)));

    auto tags = confsieve::CoordinateCodec::ReadLines(ScratchDirectory() + "/" + m_tags);
    if (!tags) {
        ConfSieveLogger::record_error(fmt::format("output file ({}) of CREST routine does not exist!", m_tags));
        return result;
    }
    result.tags_found = true;
    result.survivors = ParseTags(*tags);

    for (int id : ids) {
        if (!result.survivors.count("CONF" + std::to_string(id)))
            result.duplicates.push_back(id);
    }
    ConfSieveLogger::info_fmt("CREGEN kept {} of {} conformers.", ids.size() - result.duplicates.size(), ids.size());

    if (!result.ran) {
        ConfSieveLogger::warn("No conformer is removed, the CREGEN run was not successful.");
        return result;
    }
    if (!m_remove) {
        if (!result.duplicates.empty())
            ConfSieveLogger::info_fmt("{} duplicate(s) found, but removal is switched off.", result.duplicates.size());
        return result;
    }

    for (int id : result.duplicates) {
        confsieve::Conformer& conformer = set.at(id);
        conformer.setOptimizationInfo("info", "calculated");
        conformer.setOptimizationInfo("cregen_sort", "removed");
        ConfSieveLogger::warn_fmt("!!!! Removing CONF{} because it is sorted out by CREGEN.", id);
        set.move(id, ConformerList::Removed, fmt::format("CONF{} sorted out by CREGEN", id));
        result.removed.push_back(id);
    }
    return result;
}
