/*
 * <Bond length and bond angle penalties.>
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

double BondLengthContribution(const Geometry& geometry, const BondList& bonds, Matrix* gradient, double epsilon)
{
    ValidateGeometry(geometry);
    ValidateBonds(bonds, geometry.rows());
    if (gradient)
        *gradient = Matrix::Zero(geometry.rows(), 3);
    if (bonds.empty())
        return 0.0;

    const double factor = 1.0 / bonds.size();
    double loss = 0.0;
    for (const auto& bond : bonds) {
        Position i = geometry.row(bond.i).transpose();
        Position j = geometry.row(bond.j).transpose();
        Matrix derivate;
        double rij = GeometryFunctions::BondStretching(i, j, derivate, gradient != nullptr, epsilon);

        loss += (rij - bond.r0_ij) * (rij - bond.r0_ij) * factor;
        if (gradient) {
            double diff = 2.0 * (rij - bond.r0_ij) * factor;
            gradient->row(bond.i) += diff * derivate.row(0);
            gradient->row(bond.j) += diff * derivate.row(1);
        }
    }
    return loss;
}

double BondAngleContribution(const Geometry& geometry, const AngleList& angles, Matrix* gradient, double norm_epsilon, double cos_epsilon)
{
    ValidateGeometry(geometry);
    ValidateAngles(angles, geometry.rows());
    if (gradient)
        *gradient = Matrix::Zero(geometry.rows(), 3);
    if (angles.empty())
        return 0.0;

    const double factor = 1.0 / angles.size();
    double loss = 0.0;
    for (const auto& angle : angles) {
        Position i = geometry.row(angle.i).transpose();
        Position j = geometry.row(angle.j).transpose();
        Position k = geometry.row(angle.k).transpose();
        Matrix derivate;
        double theta = GeometryFunctions::AngleBending(i, j, k, derivate, gradient != nullptr, norm_epsilon, cos_epsilon);

        loss += (theta - angle.theta0_ijk) * (theta - angle.theta0_ijk) * factor;
        if (gradient) {
            double dEdtheta = 2.0 * (theta - angle.theta0_ijk) * factor;
            gradient->row(angle.i) += dEdtheta * derivate.row(0);
            gradient->row(angle.j) += dEdtheta * derivate.row(1);
            gradient->row(angle.k) += dEdtheta * derivate.row(2);
        }
    }
    return loss;
}
}

double BondLengthLoss(const Geometry& geometry, const BondList& bonds, double epsilon)
{
    return BondLengthContribution(geometry, bonds, nullptr, epsilon);
}

double BondLengthLoss(const Geometry& geometry, const BondList& bonds, Matrix& gradient, double epsilon)
{
    return BondLengthContribution(geometry, bonds, &gradient, epsilon);
}

double BondAngleLoss(const Geometry& geometry, const AngleList& angles, double norm_epsilon, double cos_epsilon)
{
    return BondAngleContribution(geometry, angles, nullptr, norm_epsilon, cos_epsilon);
}

double BondAngleLoss(const Geometry& geometry, const AngleList& angles, Matrix& gradient, double norm_epsilon, double cos_epsilon)
{
    return BondAngleContribution(geometry, angles, &gradient, norm_epsilon, cos_epsilon);
}

} // namespace geomval
