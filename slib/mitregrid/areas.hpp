/*
 * MITRegrid: Great-Circle Refinement of MITgcm Corner-Point Grids
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef MITREGRID_AREAS_HPP
#define MITREGRID_AREAS_HPP

#include <vector>
#include <Eigen/Dense>
#include <blitz/array.h>
#include <mitregrid/ComputeGrid.hpp>

namespace mitregrid {

/** Area of the spherical triangle abc on the unit sphere (its
spherical excess), by the Van Oosterom-Strackee formula.  a, b, c are
unit vectors.  Always >= 0. */
extern double sph_triangle_uarea(
    Eigen::Vector3d const &a,
    Eigen::Vector3d const &b,
    Eigen::Vector3d const &c);

/** Area of the spherical quadrilateral p00-p10-p11-p01 on the unit
sphere, as two triangles split along the p00-p11 diagonal. */
inline double squad_uarea(
    Eigen::Vector3d const &p00,
    Eigen::Vector3d const &p10,
    Eigen::Vector3d const &p11,
    Eigen::Vector3d const &p01)
{
    return sph_triangle_uarea(p00, p10, p11)
        + sph_triangle_uarea(p00, p11, p01);
}

/** Unit vectors for every point of a lon/lat lattice.
@return Vectors in row-major (i outer) order. */
extern std::vector<Eigen::Vector3d> lattice_to_cart(
    blitz::Array<double,2> const &lon,
    blitz::Array<double,2> const &lat);

/** Physical area (m^2) of every minimal quadrilateral of the lattice,
on a sphere of radius eq_rad.
@return Array one smaller than the lattice in each dimension; element
    (i,j) is bounded by lattice points (i,j), (i+1,j), (i+1,j+1), (i,j+1). */
extern blitz::Array<double,2> compute_areas(
    ComputeGrid const &cg, double eq_rad);

}   // namespace mitregrid
#endif  // Guard
