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

#include <algorithm>
#include <limits>
#include <mitregrid/error.hpp>
#include <mitregrid/nearest.hpp>

namespace mitregrid {

NearestPoint nearest(
    double lon, double lat,
    SourceGrid const &src, Geod const &geod)
{
    NearestPoint ret;
    ret.i = -1;
    ret.j = -1;
    ret.dist = std::numeric_limits<double>::infinity();

    for (int i=0; i<src.xg.extent(0); ++i) {
    for (int j=0; j<src.xg.extent(1); ++j) {
        double const dist = geod.inv(lon, lat, src.xg(i,j), src.yg(i,j)).dist;
        if (dist < ret.dist) {
            ret.i = i;
            ret.j = j;
            ret.dist = dist;
        }
    }}

    return ret;
}

RegionBounds locate_region(
    double lon1, double lat1, double lon2, double lat2,
    SourceGrid const &src, Geod const &geod)
{
    RegionBounds rb;
    rb.p1 = nearest(lon1, lat1, src, geod);
    rb.p2 = nearest(lon2, lat2, src, geod);

    if (rb.p1.i == rb.p2.i) (*mitregrid_error)(INVALID_REGION,
        "Corners (%g,%g) and (%g,%g) both resolve to i=%d: region has zero width",
        lon1, lat1, lon2, lat2, rb.p1.i);
    if (rb.p1.j == rb.p2.j) (*mitregrid_error)(INVALID_REGION,
        "Corners (%g,%g) and (%g,%g) both resolve to j=%d: region has zero height",
        lon1, lat1, lon2, lat2, rb.p1.j);

    rb.ilb = std::min(rb.p1.i, rb.p2.i);
    rb.jlb = std::min(rb.p1.j, rb.p2.j);
    rb.iub = std::max(rb.p1.i, rb.p2.i);
    rb.jub = std::max(rb.p1.j, rb.p2.j);

    // The one-cell ring around the region must exist in the source grid
    if (rb.ilb < 1) (*mitregrid_error)(INVALID_REGION,
        "Region lower i bound %d (from corner (%g,%g)) leaves no room for a boundary ring",
        rb.ilb, (rb.p1.i == rb.ilb ? lon1 : lon2), (rb.p1.i == rb.ilb ? lat1 : lat2));
    if (rb.jlb < 1) (*mitregrid_error)(INVALID_REGION,
        "Region lower j bound %d (from corner (%g,%g)) leaves no room for a boundary ring",
        rb.jlb, (rb.p1.j == rb.jlb ? lon1 : lon2), (rb.p1.j == rb.jlb ? lat1 : lat2));
    if (rb.iub > src.ni()-1) (*mitregrid_error)(INVALID_REGION,
        "Region upper i bound %d (from corner (%g,%g)) leaves no room for a boundary ring (ni=%d)",
        rb.iub, (rb.p1.i == rb.iub ? lon1 : lon2), (rb.p1.i == rb.iub ? lat1 : lat2), src.ni());
    if (rb.jub > src.nj()-1) (*mitregrid_error)(INVALID_REGION,
        "Region upper j bound %d (from corner (%g,%g)) leaves no room for a boundary ring (nj=%d)",
        rb.jub, (rb.p1.j == rb.jub ? lon1 : lon2), (rb.p1.j == rb.jub ? lat1 : lat2), src.nj());

    return rb;
}

}   // namespace mitregrid
