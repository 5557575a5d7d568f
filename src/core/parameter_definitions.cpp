/*
 * <Parameter definitions of all geomval modules>
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

#include "parameter_registry.h"

#include <string>

void initialize_parameter_definitions(ParameterRegistry& registry)
{
    const std::string module = "geometryloss";

    registry.addDefinition(module, { "bond_length", module, ParamType::Double, 1.0, "Weight of the bond length term", "Weights", { "w_bond" } });
    registry.addDefinition(module, { "bond_angle", module, ParamType::Double, 0.5, "Weight of the bond angle term", "Weights", { "w_angle" } });
    registry.addDefinition(module, { "ring_planarity", module, ParamType::Double, 0.3, "Weight of the aromatic ring planarity term", "Weights", { "w_ring" } });
    registry.addDefinition(module, { "steric_clash", module, ParamType::Double, 0.2, "Weight of the steric clash term", "Weights", { "w_clash" } });
    registry.addDefinition(module, { "chirality", module, ParamType::Double, 0.2, "Weight of the chirality term", "Weights", { "w_chiral" } });

    registry.addDefinition(module, { "clash_threshold", module, ParamType::Double, 0.75, "Fraction of the summed van der Waals radii below which a pair clashes", "Steric clash", { "threshold" } });
    registry.addDefinition(module, { "exclude_bonded", module, ParamType::Bool, true, "Ignore bonded pairs in the steric clash term", "Steric clash", {} });

    registry.addDefinition(module, { "norm_epsilon", module, ParamType::Double, 1e-8, "Lower bound for vector norms and distances", "Numerics", {} });
    registry.addDefinition(module, { "cos_epsilon", module, ParamType::Double, 1e-7, "Distance of the clamped cosine from +-1 before acos", "Numerics", {} });

    registry.addDefinition(module, { "verbosity", module, ParamType::Int, 1, "0 silent, 1 warnings, 2 parameters and results, 3 details", "Output", { "verbose" } });
}
