/*
 * <Steric clash penalty for non-bonded atom pairs.>
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

#include "geometrylosses.h"

#include "geometryfunctions.h"

namespace geomval {

namespace {

double StericClashContribution(const Geometry& geometry, const Vector& vdw_radii, const BondList& bonds, double threshold, Matrix* gradient, double epsilon)
{
    ValidateGeometry(geometry);
    const int natoms = geometry.rows();
    ValidateRadii(vdw_radii, natoms);
    ValidateBonds(bonds, natoms);
    if (gradient)
        *gradient = Matrix::Zero(natoms, 3);
    if (natoms < 2)
        return 0.0;

    const ExclusionMask excluded = GeometryFunctions::BondedExclusionMask(natoms, bonds);
    const Matrix distances = GeometryFunctions::PairwiseDistances(geometry);

    double loss = 0.0;
    for (int i = 0; i < natoms; ++i) {
        for (int j = i + 1; j < natoms; ++j) {
            if (excluded(i, j))
                continue;

            double clash = threshold * (vdw_radii(i) + vdw_radii(j)) - distances(i, j);
            if (clash <= 0)
                continue;

            loss += clash * clash;
            if (gradient && distances(i, j) >= epsilon) {
                Position direction = (geometry.row(i) - geometry.row(j)).transpose() / distances(i, j);
                gradient->row(i) -= (2.0 * clash * direction).transpose();
                gradient->row(j) += (2.0 * clash * direction).transpose();
            }
        }
    }
    return loss;
}
}

double StericClashLoss(const Geometry& geometry, const Vector& vdw_radii, const BondList& bonds, double threshold, double epsilon)
{
    return StericClashContribution(geometry, vdw_radii, bonds, threshold, nullptr, epsilon);
}

double StericClashLoss(const Geometry& geometry, const Vector& vdw_radii, const BondList& bonds, double threshold, Matrix& gradient, double epsilon)
{
    return StericClashContribution(geometry, vdw_radii, bonds, threshold, &gradient, epsilon);
}

} // namespace geomval
