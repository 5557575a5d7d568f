/*
 * <Some global definitions for geometry penalties.>
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
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

// for convenience
using json = nlohmann::json;

const double pi = 3.14159265359;

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Geometry;
typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Matrix;
typedef Eigen::Vector3d Position;

typedef Eigen::VectorXd Vector;

inline double degreesToRadians(double angleDegrees) { return angleDegrees * pi / 180.0; }

inline double radiansToDegrees(double angleRadians) { return angleRadians * 180.0 / pi; }

inline std::string ToLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

inline json MergeJson(const json& reference, const json& patch)
{
    json result = reference;
    for (const auto& object : patch.items()) {
        bool found = false;
        std::string outer = ToLower(object.key());
        for (const auto& local : reference.items()) {
            std::string inner = ToLower(local.key());
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
