/*
 * <Topology containers for the geometry penalties.>
 * Copyright (C) 2023 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include "src/core/global.h"

#include <array>
#include <vector>

namespace geomval {

struct BondTerm {
    int i = 0, j = 0;
    double r0_ij = 0; // ideal length in Angstrom
};

struct AngleTerm {
    int i = 0, j = 0, k = 0; // j is the vertex
    double theta0_ijk = 0; // ideal angle in radians
};

/*! \brief Tetrahedral stereocenter
 *
 * Only the first three neighbours enter the signed volume, their order
 * fixes the handedness. The fourth neighbour completes the chemical
 * definition of the center.
 */
struct ChiralCenter {
    int center = 0;
    std::array<int, 4> neighbours{ { 0, 0, 0, 0 } };
};

typedef std::vector<BondTerm> BondList;
typedef std::vector<AngleTerm> AngleList;
typedef std::vector<std::vector<int>> RingList;
typedef std::vector<ChiralCenter> ChiralList;

/*! \brief Precomputed topology of one molecule
 *
 * Everything the penalties need besides the coordinates. Empty lists are
 * valid and switch the corresponding term off.
 */
struct GeometryTopology {
    BondList bonds;
    AngleList angles;
    RingList rings;
    Vector vdw_radii;
    ChiralList chiral_centers;

    /*! \brief Check all indices against natoms and all rows for their arity
     * \throws ShapeMismatch on the first violation
     */
    void Validate(int natoms) const;

    /*! \brief Build from the json layout
     *
     * {"bonds": [{"i", "j", "r0_ij"}], "angles": [{"i", "j", "k", "theta0_ijk"}],
     *  "rings": [[...]], "vdw_radii": [...], "chiral_centers": [{"center", "neighbours"}]}
     * Missing sections are left empty.
     */
    static GeometryTopology fromJson(const json& topology);
    json toJson() const;
};

void ValidateGeometry(const Geometry& geometry);
void ValidateBonds(const BondList& bonds, int natoms);
void ValidateAngles(const AngleList& angles, int natoms);
void ValidateRings(const RingList& rings, int natoms);
void ValidateRadii(const Vector& vdw_radii, int natoms);
void ValidateChiralCenters(const ChiralList& centers, int natoms);

} // namespace geomval
