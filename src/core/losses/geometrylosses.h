/*
 * <Differentiable geometry penalties for molecular structures.>
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

#include "src/core/global.h"
#include "src/core/topology.h"

#include "geometryfunctions.h"

#include <vector>

class ConfigManager;

namespace geomval {

/* Every penalty comes as a value-only call and as a call that also writes
 * d(loss)/d(coordinates) into gradient. The gradient is resized to N x 3
 * and overwritten. Index errors throw ShapeMismatch before any work is done. */

/*! \brief Mean of (d_ij - r0_ij)^2 over all bonds, 0 without bonds */
double BondLengthLoss(const Geometry& geometry, const BondList& bonds, double epsilon = GeometryFunctions::NormEpsilon);
double BondLengthLoss(const Geometry& geometry, const BondList& bonds, Matrix& gradient, double epsilon = GeometryFunctions::NormEpsilon);

/*! \brief Mean of (theta_ijk - theta0_ijk)^2 over all angles, 0 without angles */
double BondAngleLoss(const Geometry& geometry, const AngleList& angles,
    double norm_epsilon = GeometryFunctions::NormEpsilon, double cos_epsilon = GeometryFunctions::CosEpsilon);
double BondAngleLoss(const Geometry& geometry, const AngleList& angles, Matrix& gradient,
    double norm_epsilon = GeometryFunctions::NormEpsilon, double cos_epsilon = GeometryFunctions::CosEpsilon);

/*! \brief Mean squared distance of ring atoms from the best-fit plane of their ring
 *
 * Averaged within each ring and then across rings. Rings may differ in size.
 */
double RingPlanarityLoss(const Geometry& geometry, const RingList& rings);
double RingPlanarityLoss(const Geometry& geometry, const RingList& rings, Matrix& gradient);

/*! \brief Ring planarity for rings given directly as coordinate blocks
 *
 * Each entry holds the M x 3 coordinates of one ring. gradients receives one
 * M x 3 block per ring.
 */
double RingPlanarityLoss(const std::vector<Geometry>& ring_coordinates);
double RingPlanarityLoss(const std::vector<Geometry>& ring_coordinates, std::vector<Matrix>& gradients);

/*! \brief Sum of max(0, threshold (R_i + R_j) - d_ij)^2 over non-bonded pairs i < j
 *
 * Self pairs and the pairs in bonds are excluded regardless of distance.
 */
double StericClashLoss(const Geometry& geometry, const Vector& vdw_radii, const BondList& bonds = BondList(), double threshold = 0.75,
    double epsilon = GeometryFunctions::NormEpsilon);
double StericClashLoss(const Geometry& geometry, const Vector& vdw_radii, const BondList& bonds, double threshold, Matrix& gradient,
    double epsilon = GeometryFunctions::NormEpsilon);

/*! \brief Sum of relu(-V) over chiral centers
 *
 * V is the signed volume spanned by the first three neighbours relative to
 * the center. Swapping two of them flips the sign of V.
 */
double ChiralityLoss(const Geometry& geometry, const ChiralList& centers);
double ChiralityLoss(const Geometry& geometry, const ChiralList& centers, Matrix& gradient);

struct LossWeights {
    double bond_length = 1.0;
    double bond_angle = 0.5;
    double ring_planarity = 0.3;
    double steric_clash = 0.2;
    double chirality = 0.2;

    /*! \throws std::invalid_argument if any weight is negative or NaN */
    void Validate() const;

    static LossWeights fromConfig(const ConfigManager& config);
    json toJson() const;
};

struct LossParameters {
    LossWeights weights;
    double clash_threshold = 0.75;
    bool exclude_bonded = true;
    double norm_epsilon = GeometryFunctions::NormEpsilon;
    double cos_epsilon = GeometryFunctions::CosEpsilon;

    static LossParameters fromConfig(const ConfigManager& config);
};

/*! \brief Unweighted value of every term and the weighted total */
struct LossTerms {
    double bond_length = 0;
    double bond_angle = 0;
    double ring_planarity = 0;
    double steric_clash = 0;
    double chirality = 0;
    double total = 0;
};

/*! \brief Evaluate all applicable terms
 *
 * Terms without topology (no bonds, angles, rings, radii or chiral centers)
 * are skipped and contribute exactly zero. If gradient is not null it
 * receives the gradient of the weighted total.
 */
LossTerms EvaluateLossTerms(const Geometry& geometry, const GeometryTopology& topology, const LossParameters& parameters, Matrix* gradient = nullptr);

double TotalLoss(const Geometry& geometry, const GeometryTopology& topology, const LossWeights& weights = LossWeights());
double TotalLoss(const Geometry& geometry, const GeometryTopology& topology, const LossWeights& weights, Matrix& gradient);

} // namespace geomval
