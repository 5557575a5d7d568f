/*
 * <Aromatic ring planarity penalty.>
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

#include "src/core/geomval_error.h"

#include "geometryfunctions.h"

#include <fmt/format.h>

namespace geomval {

namespace {

/* Sum of squared plane distances of one ring equals the smallest eigenvalue
 * of its scatter matrix. Its derivative with respect to ring atom b is
 * 2 (n . c_b) n, the centroid terms cancel. */
double RingContribution(const Geometry& ring, Matrix* gradient, double scale)
{
    GeometryFunctions::PlaneFit fit = GeometryFunctions::BestFitPlane(ring);
    const double factor = 1.0 / ring.rows();

    double loss = 0.0;
    for (int atom = 0; atom < ring.rows(); ++atom) {
        Position centered = ring.row(atom).transpose() - fit.centroid;
        double distance = centered.dot(fit.normal);
        loss += distance * distance * factor;
        if (gradient)
            gradient->row(atom) = (2.0 * distance * factor * scale * fit.normal).transpose();
    }
    return loss;
}

double RingPlanarityContribution(const Geometry& geometry, const RingList& rings, Matrix* gradient)
{
    ValidateGeometry(geometry);
    ValidateRings(rings, geometry.rows());
    if (gradient)
        *gradient = Matrix::Zero(geometry.rows(), 3);
    if (rings.empty())
        return 0.0;

    const double scale = 1.0 / rings.size();
    double loss = 0.0;
    for (const auto& ring : rings) {
        Geometry coordinates(ring.size(), 3);
        for (std::size_t atom = 0; atom < ring.size(); ++atom)
            coordinates.row(atom) = geometry.row(ring[atom]);

        Matrix ring_gradient;
        if (gradient)
            ring_gradient = Matrix::Zero(ring.size(), 3);

        loss += RingContribution(coordinates, gradient ? &ring_gradient : nullptr, scale) * scale;

        if (gradient) {
            for (std::size_t atom = 0; atom < ring.size(); ++atom)
                gradient->row(ring[atom]) += ring_gradient.row(atom);
        }
    }
    return loss;
}

double RingBatchContribution(const std::vector<Geometry>& ring_coordinates, std::vector<Matrix>* gradients)
{
    for (std::size_t index = 0; index < ring_coordinates.size(); ++index) {
        const Geometry& ring = ring_coordinates[index];
        if (ring.cols() != 3)
            throw ShapeMismatch(fmt::format("ring {} coordinates must have 3 columns, got {}", index, ring.cols()));
        if (ring.rows() < 3)
            throw ShapeMismatch(fmt::format("ring {} has {} atoms, at least 3 are required", index, ring.rows()));
    }
    if (gradients)
        gradients->clear();
    if (ring_coordinates.empty())
        return 0.0;

    const double scale = 1.0 / ring_coordinates.size();
    double loss = 0.0;
    for (const auto& ring : ring_coordinates) {
        Matrix ring_gradient = Matrix::Zero(ring.rows(), 3);
        loss += RingContribution(ring, gradients ? &ring_gradient : nullptr, scale) * scale;
        if (gradients)
            gradients->push_back(ring_gradient);
    }
    return loss;
}
}

double RingPlanarityLoss(const Geometry& geometry, const RingList& rings)
{
    return RingPlanarityContribution(geometry, rings, nullptr);
}

double RingPlanarityLoss(const Geometry& geometry, const RingList& rings, Matrix& gradient)
{
    return RingPlanarityContribution(geometry, rings, &gradient);
}

double RingPlanarityLoss(const std::vector<Geometry>& ring_coordinates)
{
    return RingBatchContribution(ring_coordinates, nullptr);
}

double RingPlanarityLoss(const std::vector<Geometry>& ring_coordinates, std::vector<Matrix>& gradients)
{
    return RingBatchContribution(ring_coordinates, &gradients);
}

} // namespace geomval
