/*
 * <Error types raised by the geometry penalties>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <stdexcept>
#include <string>

namespace geomval {

/*! \brief Raised before any computation when topology and coordinates disagree
 *
 * Covers atom indices outside [0, N), topology rows of the wrong arity and
 * per-atom arrays whose length differs from the atom count.
 */
class ShapeMismatch : public std::runtime_error {
public:
    explicit ShapeMismatch(const std::string& what)
        : std::runtime_error("ShapeMismatch: " + what)
    {
    }
};

} // namespace geomval
