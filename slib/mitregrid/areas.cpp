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

#include <cmath>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/areas.hpp>

namespace mitregrid {

double sph_triangle_uarea(
    Eigen::Vector3d const &a,
    Eigen::Vector3d const &b,
    Eigen::Vector3d const &c)
{
    // tan(E/2) = |a.(b x c)| / (1 + a.b + b.c + c.a)
    double const numer = std::abs(a.dot(b.cross(c)));
    double const denom = 1.0 + a.dot(b) + b.dot(c) + c.dot(a);
    double excess = 2.0 * atan2(numer, denom);

    // Degenerate triangles (repeated or collinear vertices) give
    // numer=0, and a rounding-negative denom would turn that into 2*pi.
    if (numer == 0) excess = 0;
    return excess;
}

std::vector<Eigen::Vector3d> lattice_to_cart(
    blitz::Array<double,2> const &lon,
    blitz::Array<double,2> const &lat)
{
    std::vector<Eigen::Vector3d> ret;
    ret.reserve(lon.extent(0) * lon.extent(1));
    for (int i=0; i<lon.extent(0); ++i) {
    for (int j=0; j<lon.extent(1); ++j) {
        ret.push_back(lonlat_to_cart(lon(i,j), lat(i,j)));
    }}
    return ret;
}

blitz::Array<double,2> compute_areas(
    ComputeGrid const &cg, double eq_rad)
{
    int const ni = cg.extent(0);
    int const nj = cg.extent(1);
    std::vector<Eigen::Vector3d> const p(lattice_to_cart(cg.xg, cg.yg));
    auto P = [&p, nj](int i, int j) -> Eigen::Vector3d const &
        { return p[i*nj + j]; };

    double const R2 = eq_rad * eq_rad;
    blitz::Array<double,2> areas(ni-1, nj-1);
    for (int i=0; i<ni-1; ++i) {
    for (int j=0; j<nj-1; ++j) {
        areas(i,j) = R2 * squad_uarea(
            P(i,j), P(i+1,j), P(i+1,j+1), P(i,j+1));
    }}

    return areas;
}

}   // namespace mitregrid
