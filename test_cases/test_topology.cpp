/*
 * Unit Tests for GeometryTopology
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * JSON layout and index validation.
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "src/core/geomval_error.h"
#include "src/core/global.h"
#include "src/core/topology.h"

#include "core/test_molecule_registry.h"

#include <stdexcept>
#include <string>

using Approx = Catch::Approx;
using namespace geomval;
using namespace TestMolecules;

TEST_CASE("GeometryTopology - json layout", "[topology][json]")
{
    json input = {
        { "bonds", { { { "i", 0 }, { "j", 1 }, { "r0_ij", 0.9572 } }, { { "i", 0 }, { "j", 2 }, { "r0_ij", 0.9572 } } } },
        { "angles", json::array({ { { "i", 1 }, { "j", 0 }, { "k", 2 }, { "theta0_ijk", 1.824 } } }) },
        { "vdw_radii", { 1.52, 1.2, 1.2 } }
    };

    GeometryTopology topology = GeometryTopology::fromJson(input);
    REQUIRE(topology.bonds.size() == 2);
    CHECK(topology.bonds[1].j == 2);
    CHECK(topology.bonds[1].r0_ij == 0.9572);
    REQUIRE(topology.angles.size() == 1);
    CHECK(topology.angles[0].j == 0);
    CHECK(topology.angles[0].theta0_ijk == 1.824);
    CHECK(topology.rings.empty());
    CHECK(topology.chiral_centers.empty());
    REQUIRE(topology.vdw_radii.size() == 3);
    CHECK(topology.vdw_radii(0) == 1.52);
    CHECK_NOTHROW(topology.Validate(3));
}

TEST_CASE("GeometryTopology - export keeps every section", "[topology][json]")
{
    const GeometryTopology& benzene = TestMoleculeRegistry::getTopology("C6H6");
    json exported = benzene.toJson();

    CHECK(exported["bonds"].size() == 12);
    CHECK(exported["angles"].size() == 18);
    CHECK(exported["rings"][0].size() == 6);
    CHECK(exported["vdw_radii"].size() == 12);

    GeometryTopology restored = GeometryTopology::fromJson(exported);
    CHECK(restored.toJson() == exported);

    json chiral = TestMoleculeRegistry::getTopology("CHFClBr").toJson();
    CHECK(chiral["chiral_centers"][0]["neighbours"] == json({ 1, 2, 3, 4 }));
}

TEST_CASE("GeometryTopology - validation against the atom count", "[topology][validation]")
{
    GeometryTopology topology = TestMoleculeRegistry::getTopology("CHFClBr");
    CHECK_NOTHROW(topology.Validate(5));
    CHECK_THROWS_AS(topology.Validate(4), ShapeMismatch);

    topology.rings = { { 1, 2, 3 } };
    CHECK_NOTHROW(topology.Validate(5));
    topology.rings = { { 1, 2 } };
    CHECK_THROWS_AS(topology.Validate(5), ShapeMismatch);

    GeometryTopology radii_only;
    radii_only.vdw_radii = Vector::Constant(4, 1.5);
    CHECK_THROWS_AS(radii_only.Validate(5), ShapeMismatch);

    CHECK_THROWS_AS(ValidateGeometry(Geometry::Zero(4, 4)), ShapeMismatch);
}

TEST_CASE("ShapeMismatch - runtime error with prefix", "[topology][error]")
{
    try {
        ValidateBonds({ BondTerm{ 0, 9, 1.0 } }, 3);
        FAIL("no exception");
    } catch (const std::runtime_error& error) {
        CHECK(std::string(error.what()).find("ShapeMismatch") == 0);
    }
}
