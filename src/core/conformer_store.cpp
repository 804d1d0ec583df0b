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

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "src/core/confsieve_logger.h"
#include "src/core/coordinate_codec.h"
#include "src/tools/general.h"

#include "conformer_store.h"

namespace confsieve {

ConformerStore::ConformerStore(const std::string& workdir)
    : m_workdir(workdir)
{
}

std::string ConformerStore::Folder(int id, const std::string& stage) const
{
    return (fs::path(m_workdir) / ("CONF" + std::to_string(id)) / stage).string();
}

std::string ConformerStore::CoordFile(int id, const std::string& stage) const
{
    return (fs::path(Folder(id, stage)) / "coord").string();
}

bool ConformerStore::ensureFolder(ConformerSet& set, int id, const std::string& stage) const
{
    const std::string folder = Folder(id, stage);
    std::error_code ec;
    fs::create_directories(folder, ec);
    std::error_code status;
    if (!ec || fs::is_directory(folder, status))
        return true;

    const std::string reason = fmt::format("CONF{} was removed, because IO failed!", id);
    ConfSieveLogger::record_error(fmt::format("{} ({})", reason, ec.message()));
    set.move(id, ConformerList::Removed, reason);
    return false;
}

int ConformerStore::ensureFolders(ConformerSet& set, ConformerList list, const std::string& stage) const
{
    int evicted = 0;
    for (int id : set.ids(list)) {
        if (!ensureFolder(set, id, stage))
            evicted++;
    }
    ConfSieveLogger::info("Constructed folders!");
    return evicted;
}

bool ConformerStore::verifyFolder(int id, const std::string& stage) const
{
    std::error_code ec;
    return fs::is_directory(Folder(id, stage), ec);
}

std::set<int> ConformerStore::verifyFolders(const std::vector<int>& ids, const std::string& stage) const
{
    std::set<int> missing;
    for (int id : ids) {
        if (!verifyFolder(id, stage)) {
            ConfSieveLogger::error_fmt("directory of {} does not exist, although it was calculated before!",
                Tools::LastFolders(Folder(id, stage), 2));
            missing.insert(id);
        }
    }
    if (!missing.empty())
        ConfSieveLogger::error("One or multiple directories are missing.");
    return missing;
}

std::set<int> ConformerStore::writeCoords(const ConformerSet& set, ConformerList list, const StringList& ensemble, int nat, const std::string& stage) const
{
    std::set<int> failed;
    for (int id : set.ids(list)) {
        if (!CoordinateCodec::ensembleToCoord(ensemble, id, nat, CoordFile(id, stage)))
            failed.insert(id);
    }
    return failed;
}

bool ConformerStore::rotateBackup(const std::string& directory, const std::string& filename)
{
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        ConfSieveLogger::error_fmt("Can not back up {}, {} is not a directory", filename, directory);
        return false;
    }

    const std::string prefix = filename + ".";
    std::vector<std::pair<int, std::string>> chain;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file())
            continue;
        const std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
            continue;
        auto number = Tools::ToInt(name.substr(prefix.size()));
        if (number)
            chain.emplace_back(*number, name);
    }
    std::sort(chain.begin(), chain.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

    /* a failed rename ends the rotation, the lower files would overwrite the one that did not move */
    for (const auto& [number, name] : chain) {
        const fs::path from = fs::path(directory) / name;
        const fs::path to = fs::path(directory) / (prefix + std::to_string(number + 1));
        if (fs::exists(to, ec)) {
            ConfSieveLogger::error_fmt("Could not move {} to {}, the target is in the way", from.string(), to.string());
            return false;
        }
        fs::rename(from, to, ec);
        if (ec) {
            ConfSieveLogger::error_fmt("Could not move {} to {}: {}", from.string(), to.string(), ec.message());
            return false;
        }
    }

    const fs::path bare = fs::path(directory) / filename;
    if (fs::is_regular_file(bare, ec)) {
        const fs::path first = fs::path(directory) / (prefix + "1");
        if (fs::exists(first, ec)) {
            ConfSieveLogger::error_fmt("Could not back up {}, {} is in the way", bare.string(), first.string());
            return false;
        }
        ConfSieveLogger::info_fmt("Backing up {} to {}.", filename, prefix + "1");
        fs::rename(bare, first, ec);
        if (ec) {
            ConfSieveLogger::error_fmt("Could not back up {}: {}", bare.string(), ec.message());
            return false;
        }
    }
    return true;
}

} // namespace confsieve
