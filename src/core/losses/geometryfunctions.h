/*
 * <Geometric primitives with analytic derivatives.>
 * Copyright (C) 2022 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace geomval {

typedef Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> ExclusionMask;

namespace GeometryFunctions {

const double NormEpsilon = 1e-8;
const double CosEpsilon = 1e-7;

inline double SafeNorm(const Position& vector, double epsilon = NormEpsilon)
{
    return std::max(vector.norm(), epsilon);
}

inline Position SafeNormalize(const Position& vector, double epsilon = NormEpsilon)
{
    return vector / SafeNorm(vector, epsilon);
}

/*! \brief Distance between i and j, floored at epsilon
 *
 * derivate rows hold d(distance)/dr_i and d(distance)/dr_j. A floored
 * distance has no direction, its derivative is zero.
 */
inline double BondStretching(const Position& i, const Position& j, Matrix& derivate, bool gradient, double epsilon = NormEpsilon)
{
    Position ij = i - j;
    double norm = ij.norm();
    double distance = std::max(norm, epsilon);
    if (!gradient)
        return distance;
    derivate = Matrix::Zero(2, 3);
    if (norm < epsilon)
        return distance;
    derivate.row(0) = (ij / distance).transpose();
    derivate.row(1) = -(ij / distance).transpose();
    return distance;
}

/*! \brief Angle i-j-k in radians, j is the vertex
 *
 * The cosine is clamped to [-1 + cos_epsilon, 1 - cos_epsilon] before acos.
 * derivate rows hold d(theta)/dr_i, d(theta)/dr_j and d(theta)/dr_k; they
 * vanish where the cosine is clamped or an arm is shorter than norm_epsilon.
 */
inline double AngleBending(const Position& i, const Position& j, const Position& k, Matrix& derivate, bool gradient,
    double norm_epsilon = NormEpsilon, double cos_epsilon = CosEpsilon)
{
    Position rij = i - j;
    Position rkj = k - j;
    double nrij = SafeNorm(rij, norm_epsilon);
    double nrkj = SafeNorm(rkj, norm_epsilon);
    Position eij = rij / nrij;
    Position ekj = rkj / nrkj;

    double raw = eij.dot(ekj);
    double costheta = std::min(std::max(raw, -1.0 + cos_epsilon), 1.0 - cos_epsilon);
    double theta = std::acos(costheta);

    if (!gradient)
        return theta;

    derivate = Matrix::Zero(3, 3);
    if (raw != costheta || rij.norm() < norm_epsilon || rkj.norm() < norm_epsilon)
        return theta;

    double dThetadCosTheta = -1.0 / std::sqrt(1.0 - costheta * costheta);
    derivate.row(0) = (dThetadCosTheta * (ekj - eij * costheta) / nrij).transpose();
    derivate.row(2) = (dThetadCosTheta * (eij - ekj * costheta) / nrkj).transpose();
    derivate.row(1) = -derivate.row(0) - derivate.row(2);

    return theta;
}

/*! \brief Signed volume det[a - center; b - center; c - center]
 *
 * derivate rows hold dV/dr for center, a, b and c.
 */
inline double SignedVolume(const Position& center, const Position& a, const Position& b, const Position& c, Matrix& derivate, bool gradient)
{
    Position v1 = a - center;
    Position v2 = b - center;
    Position v3 = c - center;
    double volume = v1.dot(v2.cross(v3));

    if (!gradient)
        return volume;

    derivate = Matrix::Zero(4, 3);
    derivate.row(1) = v2.cross(v3).transpose();
    derivate.row(2) = v3.cross(v1).transpose();
    derivate.row(3) = v1.cross(v2).transpose();
    derivate.row(0) = -derivate.row(1) - derivate.row(2) - derivate.row(3);
    return volume;
}

/*! \brief Eigen-decomposition of a symmetric 3x3 matrix, eigenvalues ascending
 */
inline void SymmetricEigen3(const Eigen::Matrix3d& matrix, Eigen::Vector3d& eigenvalues, Eigen::Matrix3d& eigenvectors)
{
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(matrix);
    eigenvalues = solver.eigenvalues();
    eigenvectors = solver.eigenvectors();
}

struct PlaneFit {
    Position centroid = Position::Zero();
    Position normal = Position::UnitZ();
    Eigen::Vector3d eigenvalues = Eigen::Vector3d::Zero();
};

/*! \brief Least-squares plane through the rows of points
 *
 * The normal is the eigenvector of the smallest eigenvalue of the scatter
 * matrix of the centered points. Collinear or coincident points give an
 * arbitrary, but finite, normal.
 */
inline PlaneFit BestFitPlane(const Geometry& points)
{
    PlaneFit fit;
    fit.centroid = points.colwise().mean().transpose();

    Geometry centered = points.rowwise() - fit.centroid.transpose();
    Eigen::Matrix3d covariance = centered.transpose() * centered;

    Eigen::Matrix3d eigenvectors;
    SymmetricEigen3(covariance, fit.eigenvalues, eigenvectors);
    fit.normal = eigenvectors.col(0);
    return fit;
}

inline Matrix PairwiseDistances(const Geometry& geometry)
{
    const int natoms = geometry.rows();
    Matrix distances = Matrix::Zero(natoms, natoms);
    for (int i = 0; i < natoms; ++i) {
        for (int j = i + 1; j < natoms; ++j) {
            double distance = (geometry.row(i) - geometry.row(j)).norm();
            distances(i, j) = distance;
            distances(j, i) = distance;
        }
    }
    return distances;
}

/*! \brief Pairs that never count as non-bonded contacts: self pairs and bonds
 */
inline ExclusionMask BondedExclusionMask(int natoms, const BondList& bonds)
{
    ExclusionMask mask = ExclusionMask::Constant(natoms, natoms, false);
    for (int i = 0; i < natoms; ++i)
        mask(i, i) = true;
    for (const auto& bond : bonds) {
        mask(bond.i, bond.j) = true;
        mask(bond.j, bond.i) = true;
    }
    return mask;
}
} // namespace GeometryFunctions
} // namespace geomval
