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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "src/core/global.h"

struct JobResult {
    int id = 0;
    bool success = false;
    std::optional<double> energy;
    std::optional<double> free_energy;
    std::string stage;
};

enum class TriageVerdict {
    Silent,
    Warning,
    Fatal
};

class FailureTriage {
public:
    /*! \brief Fraction of failed jobs, empty for an empty result list */
    static std::optional<double> FailRate(const std::vector<JobResult>& results);

    /*! \brief No results or a fail rate >= threshold with hardstop is fatal,
     * without hardstop it is only a warning */
    static TriageVerdict check(const std::vector<JobResult>& results, bool hardstop, double threshold = 0.25);

    /*! \brief Terminates the process with status 1 on a fatal verdict */
    static void enforce(TriageVerdict verdict);

    /*! \brief Reads {"success", "energy", "free_energy"} of one job, a missing or broken file is a failed job */
    static JobResult ReadResult(const std::string& path, int id, const std::string& stage);
};
