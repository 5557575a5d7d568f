/*
 * <Geometry penalty evaluator for structure refinement.>
 * Copyright (C) 2024 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include "geometrylosses.h"

namespace geomval {

/*! \brief Stateful front end of the geometry penalties
 *
 * Set the topology once, then update the geometry and call Calculate() in
 * each step of an external optimizer. Configuration keys are those of the
 * "geometryloss" module of the ParameterRegistry.
 */
class GeometryLoss {
public:
    GeometryLoss(const json& controller = json::object());

    void setTopology(const GeometryTopology& topology);
    void setTopology(const json& topology);
    const GeometryTopology& Topology() const { return m_topology; }

    void UpdateGeometry(const Geometry& geometry);
    void UpdateGeometry(const double* coord);

    double Calculate(bool gradient = true);

    Matrix Gradient() const { return m_gradient; }

    inline double BondLengthValue() const { return m_terms.bond_length; }
    inline double BondAngleValue() const { return m_terms.bond_angle; }
    inline double RingPlanarityValue() const { return m_terms.ring_planarity; }
    inline double StericClashValue() const { return m_terms.steric_clash; }
    inline double ChiralityValue() const { return m_terms.chirality; }
    inline const LossTerms& Terms() const { return m_terms; }

    const LossParameters& Parameters() const { return m_parameters; }
    json exportParameters() const { return m_config; }

    /*! \brief Central finite-difference gradient of the weighted total */
    Matrix NumGrad(double dx = 1e-6);

    void printSummary() const;

private:
    json m_config;
    LossParameters m_parameters;
    GeometryTopology m_topology;
    Geometry m_geometry;
    Matrix m_gradient;
    LossTerms m_terms;
    int m_natoms = 0;
};

} // namespace geomval
