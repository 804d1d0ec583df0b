/*
 * <Abstract base for the confsieve capabilities.>
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

#include <string>

#include "src/core/global.h"
#include "src/tools/general.h"

struct RestartValidationResult {
    bool valid;
    std::string error_message;
};

class ConfSieveMethod {
public:
    ConfSieveMethod(const json& defaults, const json& controller);
    virtual ~ConfSieveMethod() = default;

    inline void setRestart(bool restart) { m_restart = restart; }
    inline bool Restart() const { return m_restart; }

    /*! \brief Merges the block of this method (or the whole controller) into the defaults */
    void UpdateController(const json& controller);

    virtual void start() = 0;
    virtual void printHelp() const { fmt::print("No help available for this method.\n"); }

    inline bool HelpRequested() const { return m_help; }

    /*! \brief Name of the restart file written by TriggerWriteRestart */
    inline void setRestartFile(const std::string& file) { m_restart_file = file; }
    inline const std::string& RestartFile() const { return m_restart_file; }

protected:
    void checkHelp();

    /*! \brief Writes WriteRestartInformation() with version and checksum metadata */
    bool TriggerWriteRestart();

    /*! \brief Block of this method from the restart file, null if absent or unreadable */
    json ReadRestartFile() const;

    std::size_t computeRestartChecksum(const std::string& data) const;
    RestartValidationResult validateRestartData(const json& state, const StringList& required_fields) const;

    void setVerbosity(int level);

    json m_defaults, m_controller;
    bool m_restart = true;
    bool m_help = false;
    int m_verbosity = 1;

private:
    virtual json WriteRestartInformation() = 0;
    virtual bool LoadRestartInformation() = 0;
    virtual StringList MethodName() const = 0;
    virtual void LoadControlJson() = 0;

    std::string m_restart_file = "confsieve_restart.json";
};
