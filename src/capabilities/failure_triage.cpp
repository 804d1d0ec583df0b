/*
 * <Failure rate of the external calculations.>
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

#include <cstdlib>
#include <fstream>

#include "src/core/confsieve_logger.h"

#include "failure_triage.h"

std::optional<double> FailureTriage::FailRate(const std::vector<JobResult>& results)
{
    if (results.empty())
        return std::nullopt;
    int failed = 0;
    for (const auto& result : results) {
        if (!result.success)
            failed++;
    }
    return double(failed) / double(results.size());
}

TriageVerdict FailureTriage::check(const std::vector<JobResult>& results, bool hardstop, double threshold)
{
    auto rate = FailRate(results);
    if (!rate) {
        ConfSieveLogger::error("Too many calculations failed! Going to exit!");
        return TriageVerdict::Fatal;
    }
    if (*rate >= threshold && hardstop) {
        ConfSieveLogger::error_fmt("{} % of the calculations failed! Going to exit!", *rate * 100);
        return TriageVerdict::Fatal;
    }
    if (*rate >= threshold) {
        ConfSieveLogger::warn_fmt("{} % of the calculations failed!", *rate * 100);
        return TriageVerdict::Warning;
    }
    return TriageVerdict::Silent;
}

void FailureTriage::enforce(TriageVerdict verdict)
{
    if (verdict == TriageVerdict::Fatal) {
        ConfSieveLogger::close_mirror();
        std::exit(1);
    }
}

JobResult FailureTriage::ReadResult(const std::string& path, int id, const std::string& stage)
{
    JobResult result;
    result.id = id;
    result.stage = stage;

    std::ifstream file(path);
    if (!file.is_open()) {
        ConfSieveLogger::warn_fmt("No result of CONF{} in {}", id, stage);
        return result;
    }
    json data;
    try {
        file >> data;
        result.success = data.value("success", false);
        if (data.contains("energy") && data["energy"].is_number())
            result.energy = data["energy"].get<double>();
        if (data.contains("free_energy") && data["free_energy"].is_number())
            result.free_energy = data["free_energy"].get<double>();
    } catch (const json::exception& error) {
        ConfSieveLogger::warn_fmt("Result of CONF{} can not be read: {}", id, error.what());
        result.success = false;
    }
    if (result.success && !result.energy) {
        ConfSieveLogger::warn_fmt("CONF{} reports success, but no energy", id);
        result.success = false;
    }
    return result;
}
