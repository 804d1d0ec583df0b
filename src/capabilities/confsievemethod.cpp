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

#include <ctime>
#include <fstream>
#include <functional>

#include "src/core/confsieve_logger.h"
#include "src/global_config.h"

#include "confsievemethod.h"

ConfSieveMethod::ConfSieveMethod(const json& defaults, const json& controller)
    : m_defaults(defaults)
    , m_controller(controller)
{
    m_verbosity = ConfSieveLogger::get_verbosity();
    if (controller.count("verbose") > 0)
        m_verbosity = 3;

    if (controller.count("verbosity") > 0) {
        try {
            m_verbosity = std::max(0, std::min(3, controller["verbosity"].get<int>()));
        } catch (const json::type_error&) {
            ConfSieveLogger::warn("verbosity has to be an integer between 0 and 3, keeping the current level");
        }
    }
    setVerbosity(m_verbosity);

    m_help = controller.count("help") > 0;
}

void ConfSieveMethod::setVerbosity(int level)
{
    m_verbosity = level;
    ConfSieveLogger::set_verbosity(level);
}

void ConfSieveMethod::UpdateController(const json& controller)
{
    json method;
    for (const auto& s : MethodName()) {
        try {
            method = Json2KeyWord<json>(controller, s);
        } catch (int) {
            method = controller;
        }
        /* "confsieve -sieve -help" ends up in the block of the method */
        if (method.is_object() && method.contains("help"))
            m_help = true;
        m_defaults = MergeJson(m_defaults, method);
    }
    if (m_verbosity >= 3)
        ConfSieveLogger::param_table(m_defaults, MethodName()[0] + " parameters");
    LoadControlJson();
}

void ConfSieveMethod::checkHelp()
{
    if (m_help) {
        printHelp();
        exit(0);
    }
}

bool ConfSieveMethod::TriggerWriteRestart()
{
    json restart;
    try {
        json state = WriteRestartInformation();
        state["format_version"] = "1.0";
        state["program_version"] = CONFSIEVE_VERSION;
        state["timestamp"] = std::time(nullptr);
        restart[MethodName()[0]] = state;
    } catch (const json::exception& e) {
        ConfSieveLogger::error_fmt("Could not collect restart information: {}", e.what());
        return false;
    }

    std::ofstream restart_file(m_restart_file);
    if (!restart_file.is_open()) {
        ConfSieveLogger::error_fmt("Could not write {}", m_restart_file);
        return false;
    }
    restart_file << restart.dump(2) << std::endl;
    return true;
}

json ConfSieveMethod::ReadRestartFile() const
{
    std::ifstream restart_file(m_restart_file);
    if (!restart_file.is_open())
        return json();

    json restart;
    try {
        restart_file >> restart;
    } catch (const json::parse_error& e) {
        ConfSieveLogger::warn_fmt("Restart file {} is corrupted: {}", m_restart_file, e.what());
        return json();
    }
    try {
        return Json2KeyWord<json>(restart, MethodName()[0]);
    } catch (int) {
        return json();
    }
}

std::size_t ConfSieveMethod::computeRestartChecksum(const std::string& data) const
{
    return std::hash<std::string>{}(data);
}

RestartValidationResult ConfSieveMethod::validateRestartData(const json& state, const StringList& required_fields) const
{
    RestartValidationResult result{ true, "" };
    if (!state.is_object()) {
        result.valid = false;
        result.error_message = "Restart state is not an object";
        return result;
    }
    for (const auto& field : required_fields) {
        if (!state.contains(field)) {
            result.valid = false;
            result.error_message = "Missing required field: " + field;
            return result;
        }
    }
    return result;
}
