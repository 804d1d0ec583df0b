/*
 * <Rank correlation and small statistics helpers.>
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

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

#include <Eigen/Dense>

#include "src/core/confsieve_logger.h"
#include "src/core/global.h"

namespace Statistics {

/* Indices that sort the vector ascending, equal values keep their order */
inline std::vector<int> RankSimple(const std::vector<double>& vector)
{
    std::vector<int> indices(vector.size());
    std::iota(indices.begin(), indices.end(), 0);
    std::stable_sort(indices.begin(), indices.end(),
        [&vector](int a, int b) { return vector[a] < vector[b]; });
    return indices;
}

/* 1-based ranks, ties get the average rank of the tied positions */
inline std::vector<double> RankData(const std::vector<double>& a)
{
    const int n = a.size();
    std::vector<int> ivec = RankSimple(a);
    std::vector<double> ranks(n, 0.0);

    double sumranks = 0;
    int dupcount = 0;
    for (int i = 0; i < n; ++i) {
        sumranks += i;
        dupcount++;
        if (i == n - 1 || a[ivec[i]] != a[ivec[i + 1]]) {
            double averank = sumranks / double(dupcount) + 1;
            for (int j = i - dupcount + 1; j < i + 1; ++j)
                ranks[ivec[j]] = averank;
            sumranks = 0;
            dupcount = 0;
        }
    }
    return ranks;
}

/* Pearson correlation coefficient with sample standard deviations.
 * Series of different length are truncated to the shorter one. */
inline double Pearson(const std::vector<double>& A, const std::vector<double>& B)
{
    if (A.size() != B.size())
        ConfSieveLogger::error_fmt("Pearson correlation: series are not of equal length ({} vs {})!", A.size(), B.size());

    const int n = std::min(A.size(), B.size());
    if (n < 2) {
        ConfSieveLogger::warn("Pearson correlation: at least two values are needed, returning 0.0");
        return 0.0;
    }

    Vector a = Eigen::Map<const Vector>(A.data(), n);
    Vector b = Eigen::Map<const Vector>(B.data(), n);

    const double muA = a.mean();
    const double muB = b.mean();
    const double stdA = std::sqrt((a.array() - muA).square().sum() / (n - 1));
    const double stdB = std::sqrt((b.array() - muB).square().sum() / (n - 1));

    if (stdA == 0.0 || stdB == 0.0) {
        ConfSieveLogger::warn("Pearson correlation: zero variance in series, returning 0.0");
        return 0.0;
    }

    return (a.dot(b) - n * muA * muB) / ((n - 1) * stdA * stdB);
}

inline double Spearman(const std::vector<double>& A, const std::vector<double>& B)
{
    return Pearson(RankData(A), RankData(B));
}

inline double StdDev(const std::vector<double>& data)
{
    const int n = data.size();
    if (n < 2)
        return 0.0;
    double mean = std::accumulate(data.begin(), data.end(), 0.0) / n;
    double variance = 0.0;
    for (double x : data)
        variance += (x - mean) * (x - mean);
    return std::sqrt(variance / (n - 1));
}

/* Weighted standard deviation, zero weights do not count as observations.
 * Missing or incomplete weights fall back to equal weights. */
inline double WeightedStdDev(const std::vector<double>& data, std::vector<double> weights = {})
{
    const int n = data.size();
    if (n == 0)
        return 0.0;
    if (weights.size() < data.size())
        weights = std::vector<double>(n, 1.0);

    double wsum = 0.0;
    double wmean = 0.0;
    int m = 0;
    for (int i = 0; i < n; ++i) {
        wsum += weights[i];
        wmean += data[i] * weights[i];
        if (weights[i] != 0.0)
            m++;
    }
    if (wsum == 0.0 || m < 2)
        return 0.0;
    wmean /= wsum;

    double variance = 0.0;
    for (int i = 0; i < n; ++i)
        variance += weights[i] * (data[i] - wmean) * (data[i] - wmean);
    variance /= (m - 1) * wsum / m;
    return std::sqrt(variance);
}

inline bool IsClose(double a, double b, double rel_tol = 1e-9, double abs_tol = 0.0)
{
    return std::abs(a - b) <= std::max(rel_tol * std::max(std::abs(a), std::abs(b)), abs_tol);
}

}
