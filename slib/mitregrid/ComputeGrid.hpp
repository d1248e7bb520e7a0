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

#ifndef MITREGRID_COMPUTEGRID_HPP
#define MITREGRID_COMPUTEGRID_HPP

#include <blitz/array.h>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/MitGrid.hpp>
#include <mitregrid/nearest.hpp>

namespace mitregrid {

/** Raises INVALID_SUBSCALE unless both subscale factors are >= 1. */
extern void check_subscale(int lon_subscale, int lat_subscale);

/** Corner points of the selected region plus a one-cell ring, at twice
the requested resolution.  Cell centers, edge midpoints and corners of
the refined grid are all points of this lattice.

Index notation: source grid corner (i,j) of the ring-padded region
lands at lattice index (i*lon_subscale*2, j*lat_subscale*2). */
class ComputeGrid {
public:
    int const lon_subscale;
    int const lat_subscale;

    /** Longitude and latitude (degrees) of lattice points */
    blitz::Array<double,2> xg;
    blitz::Array<double,2> yg;

    /** Allocates a lattice covering ncells_i x ncells_j source cells
    (ring included). */
    ComputeGrid(int ncells_i, int ncells_j, int _lon_subscale, int _lat_subscale);

    int extent(int dim) const { return xg.extent(dim); }

    /** Stride (in lattice points) between seeded source corners */
    int istride() const { return lon_subscale*2; }
    int jstride() const { return lat_subscale*2; }

    /** Copies source corners [iLB..iUB] x [jLB..jUB] onto the lattice. */
    void seed(SourceGrid const &src, int iLB, int jLB, int iUB, int jUB);

    /** Fills the seeded rows between seeded points along geodesics
    (east-west). */
    void fill_rows(Geod const &geod);

    /** Fills every column between seeded rows along geodesics
    (north-south).  Reads points written by fill_rows(), so it must run
    after it. */
    void fill_cols(Geod const &geod);
};

/** Builds the fully-populated lattice for region rb: seeds the ring
padded region, then fills east-west, then north-south. */
extern ComputeGrid make_compute_grid(
    SourceGrid const &src, RegionBounds const &rb,
    int lon_subscale, int lat_subscale,
    Geod const &geod, bool verbose=false);

}   // namespace mitregrid
#endif  // Guard
