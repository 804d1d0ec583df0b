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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "src/core/conformer_set.h"
#include "src/core/conformer_store.h"
#include "src/core/global.h"

#include "duplicate_detector.h"
#include "failure_triage.h"

#include "confsievemethod.h"

static const json ConfSieveJson = {
    { "ensemble", "" },
    { "workdir", "." },
    { "nat", 0 },
    { "nconf", 0 },
    { "maxconf", 0 },
    { "stage", "GFNFF" },
    { "temperature", 298.15 },
    { "cregen", true },
    { "crestcheck", false },
    { "crest", "crest" },
    { "ethr", 0.15 },
    { "rthr", 0.175 },
    { "bthr", 0.03 },
    { "duplicate_blocks", true },
    { "results", false },
    { "result_file", "result.json" },
    { "hardstop", false },
    { "fail_threshold", 0.25 },
    { "report", "confsieve_results.dat" },
    { "trajectory", "confsieve_sorted.xyz" },
    { "log", "confsieve.log" },
    { "restart", true },
    { "anmrrc", false },
    { "anmrrc_table", "" }
};

class ConfSieve : public ConfSieveMethod {
public:
    explicit ConfSieve(const json& controller = json());

    void setFile(const std::string& filename);

    void start() override;
    void printHelp() const override;

    /*! \brief Fatal if the run was aborted, the caller decides about termination */
    inline TriageVerdict Verdict() const { return m_verdict; }

    inline const confsieve::ConformerSet& Conformers() const { return m_set; }
    inline const DuplicateResult& Duplicates() const { return m_duplicates; }
    inline std::optional<double> Correlation() const { return m_spearman; }
    inline int Atoms() const { return m_nat; }
    inline int MaxConf() const { return m_maxconf; }
    inline bool Restarted() const { return m_restarted; }

private:
    bool readEnsemble();
    void initialiseConformers();
    void prepareFolders();
    bool loadEnergies();
    bool readResults();
    void adoptEnsembleEnergies();
    bool weight();
    void correlate();
    void removeDuplicates();
    void writeReport();
    void writeSortedTrajectory();
    void finish();

    std::vector<confsieve::Conformer*> ensemble();
    std::vector<const confsieve::Conformer*> ensemble() const;
    std::string inWorkdir(const std::string& file) const;

    json WriteRestartInformation() override;
    bool LoadRestartInformation() override;
    StringList MethodName() const override { return { "sieve" }; }
    void LoadControlJson() override;

    confsieve::ConformerSet m_set;
    DuplicateResult m_duplicates;
    TriageVerdict m_verdict = TriageVerdict::Silent;
    std::optional<double> m_spearman;

    StringList m_ensemble_lines;
    std::size_t m_checksum = 0;

    std::string m_ensemble, m_workdir, m_stage, m_result_file, m_report, m_trajectory, m_log;
    int m_nat = 0, m_nconf = 0, m_maxconf = 0;
    json m_temperature = 298.15;
    double m_fail_threshold = 0.25;
    bool m_cregen = true, m_results = false, m_hardstop = false, m_anmrrc = false;
    bool m_restarted = false;
};
