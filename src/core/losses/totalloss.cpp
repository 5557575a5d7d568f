/*
 * <Weighted combination of the geometry penalties.>
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

#include "src/core/config_manager.h"

#include <fmt/format.h>

#include <stdexcept>

namespace geomval {

void LossWeights::Validate() const
{
    const std::pair<const char*, double> weights[] = {
        { "bond_length", bond_length },
        { "bond_angle", bond_angle },
        { "ring_planarity", ring_planarity },
        { "steric_clash", steric_clash },
        { "chirality", chirality }
    };
    for (const auto& weight : weights) {
        if (!(weight.second >= 0))
            throw std::invalid_argument(fmt::format("weight {} must be a non-negative number, got {}", weight.first, weight.second));
    }
}

LossWeights LossWeights::fromConfig(const ConfigManager& config)
{
    LossWeights weights;
    weights.bond_length = config.get<double>("bond_length");
    weights.bond_angle = config.get<double>("bond_angle");
    weights.ring_planarity = config.get<double>("ring_planarity");
    weights.steric_clash = config.get<double>("steric_clash");
    weights.chirality = config.get<double>("chirality");
    weights.Validate();
    return weights;
}

json LossWeights::toJson() const
{
    return json{
        { "bond_length", bond_length },
        { "bond_angle", bond_angle },
        { "ring_planarity", ring_planarity },
        { "steric_clash", steric_clash },
        { "chirality", chirality }
    };
}

LossParameters LossParameters::fromConfig(const ConfigManager& config)
{
    LossParameters parameters;
    parameters.weights = LossWeights::fromConfig(config);
    parameters.clash_threshold = config.get<double>("clash_threshold");
    parameters.exclude_bonded = config.get<bool>("exclude_bonded");
    parameters.norm_epsilon = config.get<double>("norm_epsilon");
    parameters.cos_epsilon = config.get<double>("cos_epsilon");
    return parameters;
}

LossTerms EvaluateLossTerms(const Geometry& geometry, const GeometryTopology& topology, const LossParameters& parameters, Matrix* gradient)
{
    ValidateGeometry(geometry);
    const int natoms = geometry.rows();
    topology.Validate(natoms);
    parameters.weights.Validate();

    LossTerms terms;
    Matrix term_gradient;
    const bool calculate_gradient = gradient != nullptr;
    if (calculate_gradient)
        *gradient = Matrix::Zero(natoms, 3);

    const LossWeights& weights = parameters.weights;

    if (!topology.bonds.empty()) {
        terms.bond_length = calculate_gradient
            ? BondLengthLoss(geometry, topology.bonds, term_gradient, parameters.norm_epsilon)
            : BondLengthLoss(geometry, topology.bonds, parameters.norm_epsilon);
        terms.total += weights.bond_length * terms.bond_length;
        if (calculate_gradient)
            *gradient += weights.bond_length * term_gradient;
    }

    if (!topology.angles.empty()) {
        terms.bond_angle = calculate_gradient
            ? BondAngleLoss(geometry, topology.angles, term_gradient, parameters.norm_epsilon, parameters.cos_epsilon)
            : BondAngleLoss(geometry, topology.angles, parameters.norm_epsilon, parameters.cos_epsilon);
        terms.total += weights.bond_angle * terms.bond_angle;
        if (calculate_gradient)
            *gradient += weights.bond_angle * term_gradient;
    }

    if (!topology.rings.empty()) {
        terms.ring_planarity = calculate_gradient
            ? RingPlanarityLoss(geometry, topology.rings, term_gradient)
            : RingPlanarityLoss(geometry, topology.rings);
        terms.total += weights.ring_planarity * terms.ring_planarity;
        if (calculate_gradient)
            *gradient += weights.ring_planarity * term_gradient;
    }

    if (topology.vdw_radii.size()) {
        const BondList& excluded = parameters.exclude_bonded ? topology.bonds : BondList();
        terms.steric_clash = calculate_gradient
            ? StericClashLoss(geometry, topology.vdw_radii, excluded, parameters.clash_threshold, term_gradient, parameters.norm_epsilon)
            : StericClashLoss(geometry, topology.vdw_radii, excluded, parameters.clash_threshold, parameters.norm_epsilon);
        terms.total += weights.steric_clash * terms.steric_clash;
        if (calculate_gradient)
            *gradient += weights.steric_clash * term_gradient;
    }

    if (!topology.chiral_centers.empty()) {
        terms.chirality = calculate_gradient
            ? ChiralityLoss(geometry, topology.chiral_centers, term_gradient)
            : ChiralityLoss(geometry, topology.chiral_centers);
        terms.total += weights.chirality * terms.chirality;
        if (calculate_gradient)
            *gradient += weights.chirality * term_gradient;
    }

    return terms;
}

double TotalLoss(const Geometry& geometry, const GeometryTopology& topology, const LossWeights& weights)
{
    LossParameters parameters;
    parameters.weights = weights;
    return EvaluateLossTerms(geometry, topology, parameters).total;
}

double TotalLoss(const Geometry& geometry, const GeometryTopology& topology, const LossWeights& weights, Matrix& gradient)
{
    LossParameters parameters;
    parameters.weights = weights;
    return EvaluateLossTerms(geometry, topology, parameters, &gradient).total;
}

} // namespace geomval
