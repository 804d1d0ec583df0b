/*
 * <Some global definitions for conformer ensembles.>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "src/global_config.h"

#include <nlohmann/json.hpp>

// for convenience
using json = nlohmann::json;

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Geometry;
typedef Eigen::Vector3d Position;
typedef Eigen::VectorXd Vector;
typedef std::vector<std::string> StringList;

/* <cctype> is undefined for negative char values */
inline std::string LowerCase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

inline std::string UpperCase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

template <class T>
inline T Json2KeyWord(const json& controller, std::string name)
{
    T temp;
    bool found = false;
    name = LowerCase(name);
    for (auto& el : controller.items()) {
        const std::string key = LowerCase(el.key());
        if (key.compare(name) == 0) {
            temp = el.value();
            found = true;
        }
    }
    if (found)
        return temp;
    else
        throw -1;
}

inline json MergeJson(const json& reference, const json& patch)
{
    json result = reference;
    for (const auto& object : patch.items()) {
        bool found = false;
        const std::string outer = LowerCase(object.key());
        for (const auto& local : reference.items()) {
            const std::string inner = LowerCase(local.key());
            if (outer.compare(inner) == 0) {
                result[local.key()] = object.value();
                found = true;
            }
        }
        if (!found) {
            result[outer] = object.value();
        }
    }
    return result;
}

inline void setNestedJsonValue(json& target, const std::string& dotKey, const json& value)
{
    if (dotKey.find('.') == std::string::npos) {
        target[dotKey] = value;
        return;
    }

    std::vector<std::string> keys;
    std::stringstream ss(dotKey);
    std::string key;

    while (std::getline(ss, key, '.')) {
        keys.push_back(key);
    }

    json* current = &target;
    for (size_t i = 0; i < keys.size() - 1; ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = json::object();
        }
        current = &(*current)[keys[i]];
    }

    (*current)[keys.back()] = value;
}

/* Converts "confsieve -keyword [file] -key value -flag ..." into
 * controller[keyword] = { key: value, flag: true, ... }.
 * Global parameters are additionally copied to the top level. */
inline json CLI2Json(int argc, char** argv)
{
    json controller;
    json key = json::object();
    if (argc < 2)
        return controller;

    std::string keyword = argv[1];
    keyword.erase(0, 1);

    const std::set<std::string> global_params = {
        "verbosity", "import_config", "colors"
    };

    for (int i = 2; i < argc; ++i) {
        std::string current = argv[i];
        std::string sub = current.substr(0, 1);

        if (sub != "-")
            continue;

        current.erase(0, 1);

        if (current == "silent" || current == "quiet") {
            key["verbosity"] = 0;
            continue;
        } else if (current == "verbose") {
            key["verbosity"] = 3;
            continue;
        } else if (current == "v" && (i + 1) < argc) {
            try {
                int verbosity_level = std::stoi(argv[i + 1]);
                if (verbosity_level >= 0 && verbosity_level <= 3) {
                    key["verbosity"] = verbosity_level;
                    ++i;
                    continue;
                }
            } catch (const std::exception&) {
            }
        }

        if ((i + 1) >= argc || argv[i + 1][0] == '-' || argv[i + 1] == std::string("true") || argv[i + 1] == std::string("+")) {
            setNestedJsonValue(key, current, true);
            if ((i + 1) < argc && (argv[i + 1] == std::string("true") || argv[i + 1] == std::string("+")))
                ++i;
        } else if (argv[i + 1] == std::string("false")) {
            setNestedJsonValue(key, current, false);
            ++i;
        } else {
            std::string next = argv[i + 1];
            bool isNumber = true;
            bool isVector = next.find("|") != std::string::npos || next.find(",") != std::string::npos || next.find(":") != std::string::npos;
            if (isVector) {
                isNumber = false;
            } else {
                try {
                    std::size_t consumed = 0;
                    std::stod(next, &consumed);
                    isNumber = consumed == next.size();
                } catch (const std::invalid_argument&) {
                    isNumber = false;
                } catch (const std::out_of_range&) {
                    isNumber = false;
                }
            }
            if (isNumber)
                setNestedJsonValue(key, current, std::stod(next));
            else
                setNestedJsonValue(key, current, next);
            ++i;
        }
    }

    for (const auto& param : global_params) {
        if (key.contains(param))
            controller[param] = key[param];
    }

    controller[keyword] = key;
    return controller;
}
