/*
 * <confsieve main file.>
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

#include "src/core/boltzmann.h"
#include "src/core/conformer_set.h"
#include "src/core/conformer_store.h"
#include "src/core/coordinate_codec.h"
#include "src/core/confsieve_logger.h"
#include "src/core/energy_extractor.h"
#include "src/core/global.h"

#include "src/capabilities/anmrrc_writer.h"
#include "src/capabilities/confsieve.h"
#include "src/capabilities/failure_triage.h"
#include "src/capabilities/report_formatter.h"

#include "src/tools/general.h"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#ifndef _WIN32
#if __GNUC__
#include <execinfo.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

void bt_handler(int sig)
{
    void* array[10];
    size_t size;

    size = backtrace(array, 10);

    fprintf(stderr, "confsieve crashed. Although this is probably unintended, it happened anyway.\n Some kind of backtrace will be printed out!\n\n");
    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(array, size, STDERR_FILENO);
    fprintf(stderr, "Good-By\n");
    exit(1);
}
#endif
#endif

namespace {

void showHelp()
{
    fmt::print("confsieve {} - sorting of conformer ensembles\n\n", CONFSIEVE_VERSION);
    fmt::print("{}", Tools::FormatLine("-sieve ensemble.xyz", "full sorting run, see confsieve -sieve -help", StringList()));
    fmt::print("{}", Tools::FormatLine("-weights ensemble.xyz", "Boltzmann weights of the ensemble energies (-temperature T)", StringList()));
    fmt::print("{}", Tools::FormatLine("-anmrrc", "writes .anmrrc from a reference table (-anmrrc_table file.json)", StringList()));
    fmt::print("{}", Tools::FormatLine("-backup dir file", "rotates file, file.1, ... in dir", StringList()));
    fmt::print("{}", Tools::FormatLine("-import_config file.json", "merges a json configuration, command line wins", StringList()));
    fmt::print("{}", Tools::FormatLine("-verbosity 0..3", "0 silent, 1 default, 3 everything", StringList()));
}

/* Keys given on the command line win over the imported ones */
int importConfig(json& controller)
{
    const std::string config_file = controller["import_config"].get<std::string>();
    std::ifstream file(config_file);
    if (!file.is_open()) {
        ConfSieveLogger::error_fmt("Could not open config file: {}", config_file);
        return 1;
    }

    json imported_config;
    try {
        file >> imported_config;
    } catch (const json::parse_error& e) {
        ConfSieveLogger::error_fmt("Failed to parse JSON from {}: {}", config_file, e.what());
        return 1;
    }

    for (auto it = imported_config.begin(); it != imported_config.end(); ++it) {
        if (!controller.contains(it.key())) {
            controller[it.key()] = it.value();
        } else if (controller[it.key()].is_object() && it.value().is_object()) {
            controller[it.key()] = MergeJson(it.value(), controller[it.key()]);
        }
    }
    ConfSieveLogger::info_fmt("Loaded configuration from: {}", config_file);
    return 0;
}

int executeSieve(const json& controller, int argc, char** argv)
{
    ConfSieve sieve(controller);
    if (argc >= 3 && argv[2][0] != '-')
        sieve.setFile(argv[2]);
    sieve.start();
    FailureTriage::enforce(sieve.Verdict());
    return 0;
}

int executeWeights(const json& controller, int argc, char** argv)
{
    if (argc < 3 || argv[2][0] == '-') {
        ConfSieveLogger::error("Please use confsieve -weights ensemble.xyz [-temperature 298.15]");
        return 1;
    }
    json weights = controller.value("weights", json::object());
    const json temperature = weights.value("temperature", json(298.15));
    const std::string output = weights.value("output", std::string("confsieve_weights.dat"));

    auto lines = confsieve::CoordinateCodec::ReadLines(argv[2]);
    if (!lines || lines->empty()) {
        ConfSieveLogger::error_fmt("File {} does not exist or is empty!", argv[2]);
        return 1;
    }
    StringList tokens = Tools::SplitString((*lines)[0]);
    std::optional<int> atoms = tokens.empty() ? std::optional<int>() : Tools::ToInt(tokens[0]);
    if (!atoms || *atoms <= 0) {
        ConfSieveLogger::error_fmt("The number of atoms can not be read from {}!", argv[2]);
        return 1;
    }
    const int nat = *atoms;
    const int maxconf = lines->size() / (nat + 2);

    confsieve::ConformerSet set;
    std::vector<int> ids;
    for (int id = 1; id <= maxconf; ++id) {
        set.add(confsieve::Conformer(id));
        ids.push_back(id);
    }
    auto energies = confsieve::EnergyExtractor::extract(*lines, maxconf, nat, ids);
    if (!confsieve::EnergyExtractor::assign(set, energies)) {
        ConfSieveLogger::error("No energy could be read from the ensemble!");
        return 1;
    }

    std::vector<confsieve::Conformer*> members;
    for (auto* conformer : set.members(confsieve::ConformerList::Active)) {
        if (conformer->hasProperty(confsieve::EnergyProperty::XtbEnergy))
            members.push_back(conformer);
    }
    if (confsieve::BoltzmannWeighting::Weights(members, confsieve::EnergyProperty::XtbEnergy, temperature).empty())
        return 1;

    auto property = [](confsieve::EnergyProperty p) {
        return [p](const confsieve::Conformer& conformer) -> json {
            auto value = conformer.Property(p);
            return value ? json(*value) : json();
        };
    };
    std::vector<ReportFormatter::Accessor> columns = {
        [](const confsieve::Conformer& conformer) -> json { return conformer.Tag(); },
        property(confsieve::EnergyProperty::XtbEnergy),
        property(confsieve::EnergyProperty::RelXtbEnergy),
        [](const confsieve::Conformer& conformer) -> json {
            auto weight = conformer.Property(confsieve::EnergyProperty::BoltzmannWeight);
            return weight ? json(*weight * 100) : json();
        }
    };
    const double T = confsieve::BoltzmannWeighting::Temperature(temperature);
    std::vector<const confsieve::Conformer*> rows(members.begin(), members.end());
    ReportFormatter formatter(std::cout);
    formatter.render(output, columns,
        { "CONF#", "E", "dE", "Boltzmannweight" },
        { "", "[Eh]", "[kcal/mol]", fmt::format("% at {:.2f} K", T) },
        { "", ".7f", ".2f", ".2f" },
        rows, std::nullopt);
    return 0;
}

int executeAnmrrc(const json& controller, int argc, char** argv)
{
    json anmrrc = controller.value("anmrrc", json::object());
    std::string directory = ".";
    if (argc >= 3 && argv[2][0] != '-')
        directory = argv[2];
    AnmrrcWriter writer(anmrrc);
    return writer.write(directory) ? 0 : 1;
}

int executeBackup(int argc, char** argv)
{
    if (argc < 4) {
        ConfSieveLogger::error("Please use confsieve -backup directory file");
        return 1;
    }
    return confsieve::ConformerStore::rotateBackup(argv[2], argv[3]) ? 0 : 1;
}
}

int main(int argc, char** argv)
{
#ifndef _WIN32
#if __GNUC__
    signal(SIGSEGV, bt_handler);
    signal(SIGABRT, bt_handler);
#endif
#endif

    ConfSieveLogger::initialize(1);
    RunTimer timer(false);

    if (argc < 2) {
        showHelp();
        exit(1);
    }

    std::string command = argv[1] + 1;

    if (command == "help" || command == "h") {
        showHelp();
        return 0;
    }

    json controller = CLI2Json(argc, argv);
    if (controller.contains("verbosity") && controller["verbosity"].is_number())
        ConfSieveLogger::set_verbosity(controller["verbosity"].get<int>());
    if (controller.contains("colors") && controller["colors"].is_boolean())
        ConfSieveLogger::set_colors(controller["colors"].get<bool>());

    if (controller.contains("import_config") && importConfig(controller) != 0)
        return 1;

    int status = 0;
    try {
        if (command == "sieve")
            status = executeSieve(controller, argc, argv);
        else if (command == "weights")
            status = executeWeights(controller, argc, argv);
        else if (command == "anmrrc")
            status = executeAnmrrc(controller, argc, argv);
        else if (command == "backup")
            status = executeBackup(argc, argv);
        else {
            ConfSieveLogger::error_fmt("Unknown command -{}", command);
            showHelp();
            return 1;
        }
    } catch (int) {
        ConfSieveLogger::error("A required keyword is missing in the configuration");
        return 1;
    } catch (const json::exception& e) {
        ConfSieveLogger::error_fmt("Invalid configuration: {}", e.what());
        return 1;
    }

    if (ConfSieveLogger::get_verbosity() >= 2)
        ConfSieveLogger::info_fmt("Finished after {} seconds", timer.Elapsed() / 1000.0);
    return status;
}
