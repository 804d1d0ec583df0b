/*
 * <Sorting pipeline for conformer ensembles.>
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
#include <iostream>

#include <fmt/format.h>

#include "src/core/boltzmann.h"
#include "src/core/confsieve_logger.h"
#include "src/core/coordinate_codec.h"
#include "src/core/energy_extractor.h"
#include "src/core/units.h"

#include "src/tools/general.h"
#include "src/tools/statistics.h"

#include "anmrrc_writer.h"
#include "report_formatter.h"

#include "confsieve.h"

using confsieve::Conformer;
using confsieve::ConformerList;
using confsieve::ConformerStore;
using confsieve::EnergyProperty;

ConfSieve::ConfSieve(const json& controller)
    : ConfSieveMethod(ConfSieveJson, controller)
{
    UpdateController(controller);
}

void ConfSieve::LoadControlJson()
{
    m_ensemble = Json2KeyWord<std::string>(m_defaults, "ensemble");
    m_workdir = Json2KeyWord<std::string>(m_defaults, "workdir");
    m_nat = Json2KeyWord<int>(m_defaults, "nat");
    m_nconf = Json2KeyWord<int>(m_defaults, "nconf");
    m_maxconf = Json2KeyWord<int>(m_defaults, "maxconf");
    m_stage = Json2KeyWord<std::string>(m_defaults, "stage");
    m_temperature = Json2KeyWord<json>(m_defaults, "temperature");
    m_cregen = Json2KeyWord<bool>(m_defaults, "cregen");
    m_results = Json2KeyWord<bool>(m_defaults, "results");
    m_result_file = Json2KeyWord<std::string>(m_defaults, "result_file");
    m_hardstop = Json2KeyWord<bool>(m_defaults, "hardstop");
    m_fail_threshold = Json2KeyWord<double>(m_defaults, "fail_threshold");
    m_report = Json2KeyWord<std::string>(m_defaults, "report");
    m_trajectory = Json2KeyWord<std::string>(m_defaults, "trajectory");
    m_log = Json2KeyWord<std::string>(m_defaults, "log");
    m_anmrrc = Json2KeyWord<bool>(m_defaults, "anmrrc");
    setRestart(Json2KeyWord<bool>(m_defaults, "restart"));
    setRestartFile(inWorkdir("confsieve_restart.json"));
}

void ConfSieve::setFile(const std::string& filename)
{
    m_ensemble = filename;
    m_defaults["ensemble"] = filename;
}

void ConfSieve::printHelp() const
{
    fmt::print("confsieve -sieve ensemble.xyz [options]\n\n");
    fmt::print("Sorts a conformer ensemble: per conformer folders, energies, Boltzmann weights,\n");
    fmt::print("duplicate removal with CREGEN and a ranked result table.\n\n");
    for (const auto& item : ConfSieveJson.items())
        fmt::print("{}", Tools::FormatLine(item.key(), item.value().dump(), StringList()));
}

std::string ConfSieve::inWorkdir(const std::string& file) const
{
    return (fs::path(m_workdir) / file).string();
}

std::vector<Conformer*> ConfSieve::ensemble()
{
    std::vector<Conformer*> members = m_set.members(ConformerList::Active);
    for (auto* conformer : m_set.members(ConformerList::Processed))
        members.push_back(conformer);
    return members;
}

std::vector<const Conformer*> ConfSieve::ensemble() const
{
    std::vector<const Conformer*> members = m_set.members(ConformerList::Active);
    for (const auto* conformer : m_set.members(ConformerList::Processed))
        members.push_back(conformer);
    return members;
}

bool ConfSieve::readEnsemble()
{
    auto lines = confsieve::CoordinateCodec::ReadLines(m_ensemble);
    if (!lines || lines->empty()) {
        ConfSieveLogger::record_error(fmt::format("File {} does not exist or is empty!", Tools::LastFolders(m_ensemble, 1)));
        return false;
    }
    m_ensemble_lines = *lines;

    std::string content;
    for (const auto& line : m_ensemble_lines)
        content += line + "\n";
    m_checksum = computeRestartChecksum(content);

    if (m_nat <= 0) {
        StringList tokens = Tools::SplitString(m_ensemble_lines[0]);
        std::optional<int> nat = tokens.empty() ? std::optional<int>() : Tools::ToInt(tokens[0]);
        if (!nat) {
            ConfSieveLogger::record_error(fmt::format("The number of atoms can not be read from {}!", Tools::LastFolders(m_ensemble, 1)));
            return false;
        }
        m_nat = *nat;
    }
    if (m_nat <= 0) {
        ConfSieveLogger::record_error("The number of atoms has to be positive!");
        return false;
    }

    const int blocks = m_ensemble_lines.size() / (m_nat + 2);
    if (m_maxconf <= 0)
        m_maxconf = blocks;
    if (m_nconf <= 0 || m_nconf > m_maxconf)
        m_nconf = m_maxconf;
    if (m_nconf <= 0) {
        ConfSieveLogger::record_error(fmt::format("No complete conformer block in {}!", Tools::LastFolders(m_ensemble, 1)));
        return false;
    }

    ConfSieveLogger::param("ensemble", m_ensemble);
    ConfSieveLogger::param("nat", m_nat);
    ConfSieveLogger::param("nconf", m_nconf);
    ConfSieveLogger::param("maxconf", m_maxconf);
    ConfSieveLogger::param("temperature", confsieve::BoltzmannWeighting::Temperature(m_temperature));
    ConfSieveLogger::param("cregen", m_cregen);
    ConfSieveLogger::param("restart", Restart());
    return true;
}

void ConfSieve::initialiseConformers()
{
    m_restarted = Restart() && LoadRestartInformation();

    for (int id = 1; id <= m_nconf; ++id) {
        if (m_set.contains(id))
            continue;
        Conformer conformer(id);
        try {
            auto [elements, geometry] = confsieve::CoordinateCodec::ParseXYZLines(confsieve::CoordinateCodec::EnsembleBlock(m_ensemble_lines, id, m_nat));
            conformer.setGeometry(elements, geometry);
        } catch (const std::invalid_argument& error) {
            ConfSieveLogger::warn_fmt("Geometry of CONF{} can not be read: {}", id, error.what());
        }
        m_set.add(conformer, ConformerList::Active);
    }
}

void ConfSieve::prepareFolders()
{
    ConformerStore store(m_workdir);
    store.ensureFolders(m_set, ConformerList::Active, m_stage);

    for (int id : store.writeCoords(m_set, ConformerList::Active, m_ensemble_lines, m_nat, m_stage)) {
        const std::string reason = fmt::format("CONF{} was removed, because the coord file could not be written!", id);
        ConfSieveLogger::record_error(reason);
        m_set.move(id, ConformerList::Removed, reason);
    }

    for (int id : store.verifyFolders(m_set.ids(ConformerList::Processed), m_stage)) {
        const std::string reason = fmt::format("CONF{} was removed, because its {} folder is missing!", id, m_stage);
        ConfSieveLogger::record_error(reason);
        m_set.move(id, ConformerList::Removed, reason);
    }
}

bool ConfSieve::loadEnergies()
{
    std::vector<int> ids = m_set.ids(ConformerList::Active);
    for (int id : m_set.ids(ConformerList::Processed))
        ids.push_back(id);

    auto energies = confsieve::EnergyExtractor::extract(m_ensemble_lines, m_maxconf, m_nat, ids);
    if (!confsieve::EnergyExtractor::assign(m_set, energies)) {
        ConfSieveLogger::record_error("No energy could be read from the ensemble, going to exit!");
        m_verdict = TriageVerdict::Fatal;
        return false;
    }
    return true;
}

bool ConfSieve::readResults()
{
    ConformerStore store(m_workdir);
    std::vector<JobResult> results;
    for (int id : m_set.ids(ConformerList::Active))
        results.push_back(FailureTriage::ReadResult((fs::path(store.Folder(id, m_stage)) / m_result_file).string(), id, m_stage));

    m_verdict = FailureTriage::check(results, m_hardstop, m_fail_threshold);
    if (m_verdict == TriageVerdict::Fatal)
        return false;

    for (const auto& result : results) {
        Conformer& conformer = m_set.at(result.id);
        conformer.setJobSuccess(result.success);
        if (!result.success) {
            const std::string reason = fmt::format("CONF{} was removed, because the {} calculation failed!", result.id, m_stage);
            ConfSieveLogger::warn(reason);
            m_set.move(result.id, ConformerList::Removed, reason);
            continue;
        }
        conformer.setProperty(EnergyProperty::OptimizationEnergy, *result.energy);
        conformer.setProperty(EnergyProperty::FreeEnergy, result.free_energy.value_or(*result.energy));
        conformer.setOptimizationInfo("info", "calculated");
    }
    return true;
}

void ConfSieve::adoptEnsembleEnergies()
{
    for (auto* conformer : ensemble()) {
        if (conformer->hasProperty(EnergyProperty::FreeEnergy))
            continue;
        auto energy = conformer->Property(EnergyProperty::XtbEnergy);
        if (!energy) {
            const std::string reason = fmt::format("CONF{} was removed, because it has no energy!", conformer->Id());
            ConfSieveLogger::record_error(reason);
            m_set.move(conformer->Id(), ConformerList::Removed, reason);
            continue;
        }
        conformer->setProperty(EnergyProperty::OptimizationEnergy, *energy);
        conformer->setProperty(EnergyProperty::FreeEnergy, *energy);
        conformer->setOptimizationInfo("info", "calculated");
    }
}

bool ConfSieve::weight()
{
    std::vector<Conformer*> members;
    for (auto* conformer : ensemble()) {
        if (conformer->hasProperty(EnergyProperty::FreeEnergy))
            members.push_back(conformer);
        else
            ConfSieveLogger::warn_fmt("CONF{} has no free energy and is not weighted.", conformer->Id());
    }
    if (members.empty())
        return false;

    double minimum = *members.front()->Property(EnergyProperty::FreeEnergy);
    for (const auto* conformer : members)
        minimum = std::min(minimum, *conformer->Property(EnergyProperty::FreeEnergy));
    for (auto* conformer : members)
        conformer->setProperty(EnergyProperty::RelFreeEnergy,
            ConfSieveUnit::Energy::hartree_to_kcalmol(*conformer->Property(EnergyProperty::FreeEnergy) - minimum));

    auto weights = confsieve::BoltzmannWeighting::Weights(members, EnergyProperty::FreeEnergy, m_temperature);
    if (weights.empty()) {
        ConfSieveLogger::record_error("Boltzmann weights could not be calculated!");
        return false;
    }
    double sum = 0.0;
    for (const auto& [id, value] : weights)
        sum += value;
    if (!Statistics::IsClose(sum, 1.0, 1e-9)) {
        ConfSieveLogger::record_error(fmt::format("Boltzmann weights sum up to {:.6f} instead of 1!", sum));
        return false;
    }
    return true;
}

void ConfSieve::correlate()
{
    std::vector<double> ensemble_energies, stage_energies;
    for (const auto* conformer : ensemble()) {
        auto xtb = conformer->Property(EnergyProperty::XtbEnergy);
        auto free_energy = conformer->Property(EnergyProperty::FreeEnergy);
        if (xtb && free_energy) {
            ensemble_energies.push_back(*xtb);
            stage_energies.push_back(*free_energy);
        }
    }
    if (ensemble_energies.size() < 2)
        return;
    m_spearman = Statistics::Spearman(ensemble_energies, stage_energies);
    ConfSieveLogger::info_fmt("Spearman coefficient between ensemble and {} energies: {:.3f}", m_stage, *m_spearman);
}

void ConfSieve::removeDuplicates()
{
    if (!m_cregen)
        return;

    json detector = json::object();
    for (const auto& key : { "crest", "ethr", "rthr", "bthr", "crestcheck", "duplicate_blocks", "stage", "workdir" })
        detector[key] = m_defaults[key];

    DuplicateDetector cregen(detector);
    m_duplicates = cregen.run(m_set);
    if (!m_duplicates.removed.empty())
        weight();
}

void ConfSieve::writeReport()
{
    const double T = confsieve::BoltzmannWeighting::Temperature(m_temperature);
    auto property = [](EnergyProperty p) {
        return [p](const Conformer& conformer) -> json {
            auto value = conformer.Property(p);
            return value ? json(*value) : json();
        };
    };

    std::vector<ReportFormatter::Accessor> columns = {
        [](const Conformer& conformer) -> json { return conformer.Tag(); },
        property(EnergyProperty::XtbEnergy),
        property(EnergyProperty::RelXtbEnergy),
        property(EnergyProperty::FreeEnergy),
        property(EnergyProperty::RelFreeEnergy),
        [](const Conformer& conformer) -> json {
            auto weight = conformer.Property(EnergyProperty::BoltzmannWeight);
            return weight ? json(*weight * 100) : json();
        },
        [](const Conformer& conformer) -> json { return conformer.OptimizationInfo().value("cregen_sort", "pass"); }
    };
    StringList headers = { "CONF#", "E(ensemble)", "dE(ensemble)", fmt::format("G({})", m_stage), "dG", "Boltzmannweight", "CREGEN" };
    StringList descriptions = { "", "[Eh]", "[kcal/mol]", "[Eh]", "[kcal/mol]", fmt::format("% at {:.2f} K", T), "" };
    StringList formats = { "", ".7f", ".2f", ".7f", ".2f", ".2f", "" };

    std::optional<double> minfree;
    auto rows = ensemble();
    std::vector<const Conformer*> table;
    for (const auto* conformer : rows) {
        table.push_back(conformer);
        auto free_energy = conformer->Property(EnergyProperty::FreeEnergy);
        if (free_energy && (!minfree || *free_energy < *minfree))
            minfree = free_energy;
    }

    ConfSieveLogger::header("Ranking of the ensemble");
    ReportFormatter formatter(std::cout);
    formatter.render(inWorkdir(m_report), columns, headers, descriptions, formats, table, minfree);
}

void ConfSieve::writeSortedTrajectory()
{
    ConformerStore store(m_workdir);
    auto rows = ensemble();
    std::stable_sort(rows.begin(), rows.end(), [](const Conformer* a, const Conformer* b) {
        return a->Property(EnergyProperty::FreeEnergy).value_or(0.0) < b->Property(EnergyProperty::FreeEnergy).value_or(0.0);
    });

    std::vector<confsieve::CoordinateCodec::TrajectoryFrame> frames;
    for (const auto* conformer : rows) {
        auto free_energy = conformer->Property(EnergyProperty::FreeEnergy);
        if (!free_energy)
            continue;
        confsieve::CoordinateCodec::TrajectoryFrame frame;
        frame.id = conformer->Id();
        frame.energy = *free_energy;
        frame.second_energy = conformer->Property(EnergyProperty::XtbEnergy);
        try {
            frame.lines = confsieve::CoordinateCodec::decode(store.CoordFile(conformer->Id(), m_stage)).lines;
        } catch (const std::exception& error) {
            ConfSieveLogger::warn_fmt("Using the ensemble geometry of CONF{}: {}", conformer->Id(), error.what());
            const Geometry& geometry = conformer->getGeometry();
            for (int i = 0; i < conformer->AtomCount(); ++i)
                frame.lines.push_back(confsieve::CoordinateCodec::FormatXYZLine(conformer->Elements()[i], geometry(i, 0), geometry(i, 1), geometry(i, 2)));
        }
        if (frame.lines.empty())
            continue;
        frames.push_back(frame);
    }
    if (confsieve::CoordinateCodec::writeTrajectory(inWorkdir(m_trajectory), frames, true))
        ConfSieveLogger::success_fmt("Sorted ensemble written to {}", m_trajectory);
}

void ConfSieve::finish()
{
    if (!m_set.isConsistent())
        ConfSieveLogger::record_error("The conformer lists are inconsistent!");

    TriggerWriteRestart();

    StringList remaining;
    for (const auto* conformer : ensemble())
        remaining.push_back(conformer->Tag());
    ConfSieveLogger::header(fmt::format("{} conformers remain in the ensemble, {} were removed", remaining.size(), m_set.size(ConformerList::Removed)));
    ConfSieveLogger::result_raw(Tools::PrintBlock(remaining));

    if (!ConfSieveLogger::errors().empty()) {
        ConfSieveLogger::header("Errors collected during the run");
        for (const auto& error : ConfSieveLogger::errors())
            ConfSieveLogger::result_raw(error + "\n");
    }
    ConfSieveLogger::close_mirror();
}

void ConfSieve::start()
{
    checkHelp();
    ConfSieveLogger::header(fmt::format("confsieve {} - sorting conformer ensembles", CONFSIEVE_VERSION));

    std::error_code ec;
    fs::create_directories(m_workdir, ec);
    if (!ConfSieveLogger::open_mirror(inWorkdir(m_log)))
        ConfSieveLogger::warn_fmt("Could not open {}, errors are only printed to the terminal", m_log);

    if (!readEnsemble()) {
        m_verdict = TriageVerdict::Fatal;
        ConfSieveLogger::close_mirror();
        return;
    }
    initialiseConformers();
    ConformerStore::rotateBackup(m_workdir, m_report);
    prepareFolders();

    if (!loadEnergies()) {
        ConfSieveLogger::close_mirror();
        return;
    }
    if (m_results) {
        if (m_set.size(ConformerList::Active) > 0 && !readResults()) {
            ConfSieveLogger::close_mirror();
            return;
        }
    } else {
        adoptEnsembleEnergies();
    }

    weight();
    correlate();
    removeDuplicates();
    writeReport();
    writeSortedTrajectory();

    if (m_anmrrc) {
        AnmrrcWriter anmrrc(m_defaults);
        anmrrc.write(m_workdir);
    }
    finish();
}

json ConfSieve::WriteRestartInformation()
{
    json state;
    state["conformers"] = m_set.toJson();
    state["checksum"] = m_checksum;
    state["stage"] = m_stage;
    state["nat"] = m_nat;
    state["ensemble"] = m_ensemble;
    return state;
}

bool ConfSieve::LoadRestartInformation()
{
    json state = ReadRestartFile();
    if (state.is_null())
        return false;

    auto validation = validateRestartData(state, { "conformers", "checksum", "stage", "nat" });
    if (!validation.valid) {
        ConfSieveLogger::warn_fmt("Restart file is not usable: {}", validation.error_message);
        return false;
    }
    try {
        if (state["checksum"].get<std::size_t>() != m_checksum) {
            ConfSieveLogger::warn("The restart file belongs to a different ensemble, starting from scratch.");
            return false;
        }
        if (state["stage"].get<std::string>() != m_stage || state["nat"].get<int>() != m_nat) {
            ConfSieveLogger::info("The restart file belongs to a different stage, starting from scratch.");
            return false;
        }
        m_set = confsieve::ConformerSet::fromJson(state["conformers"]);
    } catch (const json::exception& error) {
        ConfSieveLogger::warn_fmt("Restart file can not be read: {}", error.what());
        m_set = confsieve::ConformerSet();
        return false;
    }

    for (int id : m_set.ids(ConformerList::Active))
        m_set.move(id, ConformerList::Processed);
    ConfSieveLogger::success_fmt("Restarting with {} conformers from {}", m_set.size(ConformerList::Processed), Tools::LastFolders(RestartFile(), 1));
    return true;
}
