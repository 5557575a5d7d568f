/*
 * Unit Tests for the parameter registry and ConfigManager
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * Defaults, aliases and typed access of the geometryloss module.
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "src/core/config_manager.h"
#include "src/core/geomval_logger.h"
#include "src/core/losses/geometrylosses.h"
#include "src/core/parameter_registry.h"

#include <cstdio>
#include <stdexcept>
#include <string>

using Approx = Catch::Approx;

namespace {

// Redirects the logger into a temporary file for the lifetime of the object
class CapturedLog {
public:
    CapturedLog()
        : m_file(std::tmpfile())
        , m_verbosity(GeomvalLogger::get_verbosity())
    {
        REQUIRE(m_file != nullptr);
        GeomvalLogger::set_output(m_file);
    }

    ~CapturedLog()
    {
        GeomvalLogger::set_output(stdout);
        GeomvalLogger::set_verbosity(m_verbosity);
        std::fclose(m_file);
    }

    std::string text() const
    {
        std::fflush(m_file);
        std::rewind(m_file);
        std::string content;
        char buffer[256];
        while (std::fgets(buffer, sizeof(buffer), m_file))
            content += buffer;
        std::fseek(m_file, 0, SEEK_END);
        return content;
    }

private:
    std::FILE* m_file;
    int m_verbosity;
};
}

TEST_CASE("ParameterRegistry - geometryloss defaults", "[config][registry]")
{
    auto& registry = ParameterRegistry::getInstance();
    REQUIRE(registry.validateRegistry());

    json defaults = registry.getDefaultJson("geometryloss");
    CHECK(defaults.size() == 10);
    CHECK(defaults["bond_length"] == 1.0);
    CHECK(defaults["bond_angle"] == 0.5);
    CHECK(defaults["ring_planarity"] == 0.3);
    CHECK(defaults["steric_clash"] == 0.2);
    CHECK(defaults["chirality"] == 0.2);
    CHECK(defaults["clash_threshold"] == 0.75);
    CHECK(defaults["exclude_bonded"] == true);
    CHECK(defaults["norm_epsilon"] == 1e-8);
    CHECK(defaults["cos_epsilon"] == 1e-7);
    CHECK(defaults["verbosity"] == 1);

    CHECK(registry.getDefaultJson("unknown_module").empty());
    CHECK(registry.resolveAlias("geometryloss", "W_RING") == "ring_planarity");
    CHECK(registry.resolveAlias("geometryloss", "no_such_key").empty());

    CHECK(registry.getForModule("geometryloss").size() == 10);
    const ParameterDefinition* threshold = registry.findDefinition("geometryloss", "Threshold");
    REQUIRE(threshold != nullptr);
    CHECK(threshold->name == "clash_threshold");
    CHECK(threshold->type == ParamType::Double);
    CHECK(registry.findDefinition("geometryloss", "no_such_key") == nullptr);
    CHECK_NOTHROW(registry.printHelp("geometryloss"));
}

TEST_CASE("ConfigManager - aliases and case-insensitive keys", "[config]")
{
    json input = { { "W_Bond", 3.0 }, { "threshold", 0.6 }, { "Exclude_Bonded", false } };
    ConfigManager config("geometryloss", input);

    CHECK(config.get<double>("bond_length") == 3.0);
    CHECK(config.get<double>("w_bond") == 3.0);
    CHECK(config.get<double>("clash_threshold") == 0.6);
    CHECK_FALSE(config.get<bool>("exclude_bonded"));
    CHECK(config.get<double>("chirality") == 0.2);
    CHECK(config.get<int>("verbose") == 1);
}

TEST_CASE("ConfigManager - missing and mistyped parameters", "[config][validation]")
{
    ConfigManager config("geometryloss", json{ { "bond_angle", "large" } });

    CHECK_FALSE(config.has("no_such_key"));
    CHECK(config.get<double>("no_such_key", 4.2) == 4.2);
    CHECK_THROWS_AS(config.get<double>("no_such_key"), std::runtime_error);
    CHECK_THROWS_AS(config.get<double>("bond_angle"), std::runtime_error);

    CHECK_THROWS_AS(ConfigManager("geometryloss", json::array({ 1, 2 })), std::runtime_error);
    CHECK_NOTHROW(ConfigManager("geometryloss", json()));
}

TEST_CASE("LossWeights - configuration round trip", "[config][weights]")
{
    geomval::LossWeights weights;
    weights.ring_planarity = 0.9;
    weights.chirality = 0.0;

    ConfigManager config("geometryloss", weights.toJson());
    geomval::LossWeights restored = geomval::LossWeights::fromConfig(config);
    CHECK(restored.ring_planarity == 0.9);
    CHECK(restored.chirality == 0.0);
    CHECK(restored.bond_length == 1.0);

    geomval::LossParameters parameters = geomval::LossParameters::fromConfig(ConfigManager("geometryloss", json{ { "cos_epsilon", 1e-6 } }));
    CHECK(parameters.cos_epsilon == 1e-6);
    CHECK(parameters.norm_epsilon == 1e-8);
    CHECK(parameters.clash_threshold == 0.75);
    CHECK(parameters.exclude_bonded);

    CHECK_THROWS_AS(geomval::LossWeights::fromConfig(ConfigManager("geometryloss", json{ { "w_clash", -1.0 } })), std::invalid_argument);
}

TEST_CASE("GeomvalLogger - warnings follow the verbosity", "[config][logger]")
{
    CapturedLog log;
    GeomvalLogger::initialize(0, false);
    GeomvalLogger::set_colors(false);
    CHECK_FALSE(GeomvalLogger::colors_enabled());

    GeomvalLogger::warn("suppressed at verbosity 0");
    GeomvalLogger::param("suppressed", 1);
    CHECK(log.text().empty());

    GeomvalLogger::error("errors are always shown");
    CHECK(log.text().find("[ERROR] errors are always shown") != std::string::npos);

    GeomvalLogger::set_verbosity(1);
    GeomvalLogger::warn("visible at verbosity 1");
    GeomvalLogger::param("hidden_below_two", 1);
    std::string text = log.text();
    CHECK(text.find("[WARN]  visible at verbosity 1") != std::string::npos);
    CHECK(text.find("hidden_below_two") == std::string::npos);

    GeomvalLogger::set_verbosity(2);
    GeomvalLogger::param("shown_at_two", 7);
    CHECK(log.text().find("[PARAM] shown_at_two: 7") != std::string::npos);
}

TEST_CASE("ConfigManager - unknown keys are reported", "[config][logger]")
{
    CapturedLog log;
    GeomvalLogger::set_verbosity(1);
    GeomvalLogger::set_colors(false);

    ConfigManager config("geometryloss", json{ { "bond_lenght", 5.0 } });
    CHECK(config.get<double>("bond_length") == 1.0);
    CHECK(log.text().find("bond_lenght") != std::string::npos);
}
