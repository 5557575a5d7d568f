/*
 * Unit Tests for the aromatic ring planarity penalty
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * Planar and puckered benzene, rings of different size, batched rings.
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "src/core/geomval_error.h"
#include "src/core/global.h"
#include "src/core/losses/geometrylosses.h"

#include "core/test_molecule_registry.h"

#include <cmath>
#include <vector>

using Approx = Catch::Approx;
using namespace geomval;
using namespace TestMolecules;

namespace {

Geometry regularPolygon(int size, double radius)
{
    Geometry ring(size, 3);
    for (int i = 0; i < size; ++i)
        ring.row(i) << radius * std::cos(2.0 * pi * i / size), radius * std::sin(2.0 * pi * i / size), 0.0;
    return ring;
}
}

TEST_CASE("RingPlanarityLoss - planar benzene gives zero", "[ring][benzene]")
{
    Geometry geometry = TestMoleculeRegistry::createGeometry("C6H6");
    const GeometryTopology& topology = TestMoleculeRegistry::getTopology("C6H6");

    REQUIRE(topology.rings.size() == 1);
    CHECK(RingPlanarityLoss(geometry, topology.rings) == Approx(0.0).margin(1e-14));

    // tilting the whole molecule keeps it planar
    Eigen::Matrix3d rotation = Eigen::AngleAxisd(0.7, Eigen::Vector3d(1.0, 2.0, -0.5).normalized()).toRotationMatrix();
    Geometry rotated = geometry * rotation.transpose();
    CHECK(RingPlanarityLoss(rotated, topology.rings) == Approx(0.0).margin(1e-14));
}

TEST_CASE("RingPlanarityLoss - one atom out of plane", "[ring][benzene]")
{
    const RingList& rings = TestMoleculeRegistry::getTopology("C6H6").rings;
    const double delta = 1e-3;

    Geometry geometry = TestMoleculeRegistry::createGeometry("C6H6");
    geometry(0, 2) = delta;
    double loss = RingPlanarityLoss(geometry, rings);

    Geometry twice = TestMoleculeRegistry::createGeometry("C6H6");
    twice(0, 2) = 2.0 * delta;
    double loss_twice = RingPlanarityLoss(twice, rings);

    CHECK(loss > 0.0);
    // the fitted plane tilts towards the displaced atom, half of delta^2 is left over six atoms
    CHECK(loss == Approx(delta * delta / 12.0).epsilon(1e-4));
    CHECK(loss_twice / loss == Approx(4.0).epsilon(1e-4));
}

TEST_CASE("RingPlanarityLoss - no rings", "[ring][empty]")
{
    Geometry geometry = TestMoleculeRegistry::createGeometry("C6H6");
    Matrix gradient;

    CHECK(RingPlanarityLoss(geometry, RingList()) == 0.0);
    CHECK(RingPlanarityLoss(geometry, RingList(), gradient) == 0.0);
    CHECK(gradient.rows() == 12);
    CHECK(gradient.isZero());

    std::vector<Matrix> gradients(3);
    CHECK(RingPlanarityLoss(std::vector<Geometry>()) == 0.0);
    CHECK(RingPlanarityLoss(std::vector<Geometry>(), gradients) == 0.0);
    CHECK(gradients.empty());
}

TEST_CASE("RingPlanarityLoss - rings of different size are averaged", "[ring][mixed]")
{
    Geometry geometry(11, 3);
    geometry.topRows(5) = regularPolygon(5, 1.19);
    geometry.bottomRows(6) = regularPolygon(6, 1.39);
    geometry.bottomRows(6).col(2).setConstant(3.5);

    RingList rings = { { 0, 1, 2, 3, 4 }, { 5, 6, 7, 8, 9, 10 } };
    CHECK(RingPlanarityLoss(geometry, rings) == Approx(0.0).margin(1e-14));

    geometry(7, 2) += 0.05;
    double both = RingPlanarityLoss(geometry, rings);
    double hexagon = RingPlanarityLoss(geometry, { { 5, 6, 7, 8, 9, 10 } });
    CHECK(both > 0.0);
    CHECK(both == Approx(hexagon / 2.0).epsilon(1e-10));
}

TEST_CASE("RingPlanarityLoss - batched coordinates match indexed rings", "[ring][batch]")
{
    Geometry geometry = TestMoleculeRegistry::createGeometry("C6H6");
    geometry(1, 2) = 0.04;
    geometry(4, 2) = -0.03;
    const RingList& rings = TestMoleculeRegistry::getTopology("C6H6").rings;

    Matrix gradient;
    double indexed = RingPlanarityLoss(geometry, rings, gradient);

    std::vector<Geometry> coordinates = { geometry.topRows(6) };
    std::vector<Matrix> gradients;
    double batched = RingPlanarityLoss(coordinates, gradients);

    CHECK(batched == Approx(indexed).epsilon(1e-12));
    REQUIRE(gradients.size() == 1);
    REQUIRE(gradients[0].rows() == 6);
    CHECK((gradients[0] - gradient.topRows(6)).norm() == Approx(0.0).margin(1e-12));
    CHECK(gradient.bottomRows(6).isZero());
}

TEST_CASE("RingPlanarityLoss - collinear ring stays finite", "[ring][degenerate]")
{
    Geometry geometry(4, 3);
    geometry << 0.0, 0.0, 0.0,
        1.0, 0.0, 0.0,
        2.0, 0.0, 0.0,
        3.0, 0.0, 0.0;

    Matrix gradient;
    double loss = RingPlanarityLoss(geometry, { { 0, 1, 2, 3 } }, gradient);
    CHECK(std::isfinite(loss));
    CHECK(loss == Approx(0.0).margin(1e-14));
    CHECK(gradient.allFinite());
}

TEST_CASE("RingPlanarityLoss - invalid rings", "[ring][validation]")
{
    Geometry geometry = TestMoleculeRegistry::createGeometry("C6H6");

    CHECK_THROWS_AS(RingPlanarityLoss(geometry, { { 0, 1 } }), ShapeMismatch);
    CHECK_THROWS_AS(RingPlanarityLoss(geometry, { { 0, 1, 2, 3, 4, 12 } }), ShapeMismatch);

    std::vector<Geometry> coordinates = { Geometry::Zero(2, 3) };
    CHECK_THROWS_AS(RingPlanarityLoss(coordinates), ShapeMismatch);
    coordinates = { Geometry::Zero(6, 2) };
    CHECK_THROWS_AS(RingPlanarityLoss(coordinates), ShapeMismatch);
}
