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

#include "geometryloss.h"

#include "src/core/config_manager.h"
#include "src/core/geomval_error.h"
#include "src/core/geomval_logger.h"

#include <fmt/format.h>

namespace geomval {

GeometryLoss::GeometryLoss(const json& controller)
{
    ConfigManager config("geometryloss", controller);
    m_config = config.exportConfig();
    m_parameters = LossParameters::fromConfig(config);

    GeomvalLogger::set_verbosity(config.get<int>("verbosity"));
    if (GeomvalLogger::get_verbosity() >= 2)
        GeomvalLogger::param_table(m_config, "Geometry loss parameters");
}

void GeometryLoss::setTopology(const GeometryTopology& topology)
{
    if (m_natoms)
        topology.Validate(m_natoms);
    m_topology = topology;

    if (GeomvalLogger::get_verbosity() >= 2) {
        GeomvalLogger::param("bonds", static_cast<int>(m_topology.bonds.size()));
        GeomvalLogger::param("angles", static_cast<int>(m_topology.angles.size()));
        GeomvalLogger::param("rings", static_cast<int>(m_topology.rings.size()));
        GeomvalLogger::param("chiral_centers", static_cast<int>(m_topology.chiral_centers.size()));
    }
    if (GeomvalLogger::get_verbosity() >= 3) {
        if (m_topology.rings.empty())
            GeomvalLogger::warn("No rings given, ring planarity term is skipped");
        if (m_topology.chiral_centers.empty())
            GeomvalLogger::warn("No chiral centers given, chirality term is skipped");
        if (m_topology.vdw_radii.size() == 0)
            GeomvalLogger::warn("No van der Waals radii given, steric clash term is skipped");
    }
}

void GeometryLoss::setTopology(const json& topology)
{
    setTopology(GeometryTopology::fromJson(topology));
}

void GeometryLoss::UpdateGeometry(const Geometry& geometry)
{
    ValidateGeometry(geometry);
    if (m_natoms != geometry.rows()) {
        m_topology.Validate(geometry.rows());
        m_natoms = static_cast<int>(geometry.rows());
    }
    m_geometry = geometry;
}

void GeometryLoss::UpdateGeometry(const double* coord)
{
    if (m_natoms == 0)
        throw ShapeMismatch("raw coordinates need a geometry of known size, call UpdateGeometry(const Geometry&) first");
    for (int i = 0; i < m_natoms; ++i) {
        m_geometry(i, 0) = coord[3 * i + 0];
        m_geometry(i, 1) = coord[3 * i + 1];
        m_geometry(i, 2) = coord[3 * i + 2];
    }
}

double GeometryLoss::Calculate(bool gradient)
{
    if (gradient) {
        m_terms = EvaluateLossTerms(m_geometry, m_topology, m_parameters, &m_gradient);
    } else {
        m_terms = EvaluateLossTerms(m_geometry, m_topology, m_parameters);
    }

#ifdef GEOMVAL_DEBUG
    GeomvalLogger::debug(3, fmt::format("total loss {:.10f}", m_terms.total));
#endif
    return m_terms.total;
}

Matrix GeometryLoss::NumGrad(double dx)
{
    Matrix gradient = Matrix::Zero(m_natoms, 3);
    const LossTerms stored = m_terms;

    double E1, E2;
    for (int i = 0; i < m_natoms; ++i) {
        for (int j = 0; j < 3; ++j) {
            m_geometry(i, j) += dx;
            E1 = Calculate(false);
            m_geometry(i, j) -= 2 * dx;
            E2 = Calculate(false);
            gradient(i, j) = (E1 - E2) / (2 * dx);
            m_geometry(i, j) += dx;
        }
    }
    m_terms = stored;
    return gradient;
}

void GeometryLoss::printSummary() const
{
    const LossWeights& weights = m_parameters.weights;
    GeomvalLogger::header("Geometry loss");
    GeomvalLogger::result_raw(fmt::format("  {:<16} {:>14} {:>8} {:>14}", "Term", "Value", "Weight", "Contribution"));
    auto line = [](const std::string& name, double value, double weight) {
        GeomvalLogger::result_raw(fmt::format("  {:<16} {:>14.8f} {:>8.3f} {:>14.8f}", name, value, weight, value * weight));
    };
    line("bond length", m_terms.bond_length, weights.bond_length);
    line("bond angle", m_terms.bond_angle, weights.bond_angle);
    line("ring planarity", m_terms.ring_planarity, weights.ring_planarity);
    line("steric clash", m_terms.steric_clash, weights.steric_clash);
    line("chirality", m_terms.chirality, weights.chirality);
    GeomvalLogger::result_raw(fmt::format("  {:<16} {:>14.8f}", "total", m_terms.total));
}

} // namespace geomval
