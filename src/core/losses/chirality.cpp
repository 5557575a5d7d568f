/*
 * <Tetrahedral chirality penalty.>
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

double ChiralityContribution(const Geometry& geometry, const ChiralList& centers, Matrix* gradient)
{
    ValidateGeometry(geometry);
    ValidateChiralCenters(centers, geometry.rows());
    if (gradient)
        *gradient = Matrix::Zero(geometry.rows(), 3);

    double loss = 0.0;
    for (const auto& chiral : centers) {
        Position center = geometry.row(chiral.center).transpose();
        Position a = geometry.row(chiral.neighbours[0]).transpose();
        Position b = geometry.row(chiral.neighbours[1]).transpose();
        Position c = geometry.row(chiral.neighbours[2]).transpose();
        Matrix derivate;
        double volume = GeometryFunctions::SignedVolume(center, a, b, c, derivate, gradient != nullptr);

        // correct handedness costs nothing
        if (volume >= 0)
            continue;

        loss -= volume;
        if (gradient) {
            gradient->row(chiral.center) -= derivate.row(0);
            gradient->row(chiral.neighbours[0]) -= derivate.row(1);
            gradient->row(chiral.neighbours[1]) -= derivate.row(2);
            gradient->row(chiral.neighbours[2]) -= derivate.row(3);
        }
    }
    return loss;
}
}

double ChiralityLoss(const Geometry& geometry, const ChiralList& centers)
{
    return ChiralityContribution(geometry, centers, nullptr);
}

double ChiralityLoss(const Geometry& geometry, const ChiralList& centers, Matrix& gradient)
{
    return ChiralityContribution(geometry, centers, &gradient);
}

} // namespace geomval
