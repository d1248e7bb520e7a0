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

#ifndef MITREGRID_NEAREST_HPP
#define MITREGRID_NEAREST_HPP

#include <mitregrid/geodesy.hpp>
#include <mitregrid/MitGrid.hpp>

namespace mitregrid {

/** Index of a source grid corner point, and its distance (m) from the
point that was searched for. */
struct NearestPoint {
    int i;
    int j;
    double dist;
};

/** Finds the corner of the source grid geodesically nearest to
(lon,lat).  Scans every corner, i outer and j inner; ties go to the
first corner scanned. */
extern NearestPoint nearest(
    double lon, double lat,
    SourceGrid const &src, Geod const &geod);

/** Corner index rectangle of the source grid selected by the user. */
struct RegionBounds {
    int ilb, jlb;    // Lower bounds (inclusive)
    int iub, jub;    // Upper bounds (inclusive)

    /** The located corners the bounds were derived from */
    NearestPoint p1, p2;

    int ncells_i() const { return iub - ilb; }
    int ncells_j() const { return jub - jlb; }
};

/** Locates the source grid rectangle whose corners are nearest to
(lon1,lat1) and (lon2,lat2).  The rectangle, grown by a one-cell ring
(needed to compute edge quantities on its boundary), must fit inside
the source grid.  Raises INVALID_REGION if the two corners resolve to
the same i or the same j, or if the ring falls off the grid. */
extern RegionBounds locate_region(
    double lon1, double lat1, double lon2, double lat2,
    SourceGrid const &src, Geod const &geod);

}   // namespace mitregrid
#endif  // Guard
