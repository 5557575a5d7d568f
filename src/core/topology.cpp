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

#include "topology.h"

#include "src/core/geomval_error.h"

#include <fmt/format.h>

#include <algorithm>

namespace geomval {

namespace {
void CheckIndex(int index, int natoms, const char* term, std::size_t row)
{
    if (index < 0 || index >= natoms)
        throw ShapeMismatch(fmt::format("{} {} references atom {} outside [0, {})", term, row, index, natoms));
}
}

void ValidateGeometry(const Geometry& geometry)
{
    if (geometry.cols() != 3)
        throw ShapeMismatch(fmt::format("coordinates must have 3 columns, got {}", geometry.cols()));
}

void ValidateBonds(const BondList& bonds, int natoms)
{
    for (std::size_t index = 0; index < bonds.size(); ++index) {
        const auto& bond = bonds[index];
        CheckIndex(bond.i, natoms, "bond", index);
        CheckIndex(bond.j, natoms, "bond", index);
        if (bond.i == bond.j)
            throw ShapeMismatch(fmt::format("bond {} connects atom {} to itself", index, bond.i));
    }
}

void ValidateAngles(const AngleList& angles, int natoms)
{
    for (std::size_t index = 0; index < angles.size(); ++index) {
        const auto& angle = angles[index];
        CheckIndex(angle.i, natoms, "angle", index);
        CheckIndex(angle.j, natoms, "angle", index);
        CheckIndex(angle.k, natoms, "angle", index);
        if (angle.i == angle.j || angle.k == angle.j)
            throw ShapeMismatch(fmt::format("angle {} uses its vertex {} as an end point", index, angle.j));
    }
}

void ValidateRings(const RingList& rings, int natoms)
{
    for (std::size_t index = 0; index < rings.size(); ++index) {
        if (rings[index].size() < 3)
            throw ShapeMismatch(fmt::format("ring {} has {} atoms, at least 3 are required", index, rings[index].size()));
        for (int atom : rings[index])
            CheckIndex(atom, natoms, "ring", index);
    }
}

void ValidateRadii(const Vector& vdw_radii, int natoms)
{
    if (vdw_radii.size() != natoms)
        throw ShapeMismatch(fmt::format("{} van der Waals radii given for {} atoms", vdw_radii.size(), natoms));
}

void ValidateChiralCenters(const ChiralList& centers, int natoms)
{
    for (std::size_t index = 0; index < centers.size(); ++index) {
        const ChiralCenter& chiral = centers[index];
        CheckIndex(chiral.center, natoms, "chiral center", index);
        for (std::size_t n = 0; n < chiral.neighbours.size(); ++n) {
            CheckIndex(chiral.neighbours[n], natoms, "chiral center", index);
            if (chiral.neighbours[n] == chiral.center)
                throw ShapeMismatch(fmt::format("chiral center {} lists atom {} as its own neighbour", index, chiral.center));
            for (std::size_t m = 0; m < n; ++m) {
                if (chiral.neighbours[m] == chiral.neighbours[n])
                    throw ShapeMismatch(fmt::format("chiral center {} lists neighbour {} twice", index, chiral.neighbours[n]));
            }
        }
    }
}

void GeometryTopology::Validate(int natoms) const
{
    ValidateBonds(bonds, natoms);
    ValidateAngles(angles, natoms);
    ValidateRings(rings, natoms);
    if (vdw_radii.size())
        ValidateRadii(vdw_radii, natoms);
    ValidateChiralCenters(chiral_centers, natoms);
}

GeometryTopology GeometryTopology::fromJson(const json& topology)
{
    GeometryTopology result;

    if (topology.contains("bonds")) {
        for (const auto& bond : topology["bonds"]) {
            BondTerm b;
            b.i = bond.at("i");
            b.j = bond.at("j");
            b.r0_ij = bond.at("r0_ij");
            result.bonds.push_back(b);
        }
    }

    if (topology.contains("angles")) {
        for (const auto& angle : topology["angles"]) {
            AngleTerm a;
            a.i = angle.at("i");
            a.j = angle.at("j");
            a.k = angle.at("k");
            a.theta0_ijk = angle.at("theta0_ijk");
            result.angles.push_back(a);
        }
    }

    if (topology.contains("rings")) {
        for (const auto& ring : topology["rings"])
            result.rings.push_back(ring.get<std::vector<int>>());
    }

    if (topology.contains("vdw_radii")) {
        std::vector<double> radii = topology["vdw_radii"].get<std::vector<double>>();
        result.vdw_radii = Eigen::Map<const Vector>(radii.data(), radii.size());
    }

    if (topology.contains("chiral_centers")) {
        for (std::size_t index = 0; index < topology["chiral_centers"].size(); ++index) {
            const json& center = topology["chiral_centers"][index];
            std::vector<int> neighbours = center.at("neighbours").get<std::vector<int>>();
            if (neighbours.size() != 4)
                throw ShapeMismatch(fmt::format("chiral center {} needs exactly 4 neighbours, got {}", index, neighbours.size()));
            ChiralCenter c;
            c.center = center.at("center");
            std::copy(neighbours.begin(), neighbours.end(), c.neighbours.begin());
            result.chiral_centers.push_back(c);
        }
    }

    return result;
}

json GeometryTopology::toJson() const
{
    json topology;
    topology["bonds"] = json::array();
    for (const auto& bond : bonds)
        topology["bonds"].push_back({ { "i", bond.i }, { "j", bond.j }, { "r0_ij", bond.r0_ij } });

    topology["angles"] = json::array();
    for (const auto& angle : angles)
        topology["angles"].push_back({ { "i", angle.i }, { "j", angle.j }, { "k", angle.k }, { "theta0_ijk", angle.theta0_ijk } });

    topology["rings"] = rings;
    topology["vdw_radii"] = std::vector<double>(vdw_radii.data(), vdw_radii.data() + vdw_radii.size());

    topology["chiral_centers"] = json::array();
    for (const auto& center : chiral_centers)
        topology["chiral_centers"].push_back({ { "center", center.center }, { "neighbours", center.neighbours } });

    return topology;
}

} // namespace geomval
