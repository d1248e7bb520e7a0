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

#ifndef MITREGRID_REGRID_HPP
#define MITREGRID_REGRID_HPP

#include <string>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/MitGrid.hpp>

namespace mitregrid {

/** Parameters controlling a regrid: the region to refine and how
finely to refine it. */
struct RegridParams {
    /** First and second range-defining corner points (degrees) */
    double lon1, lat1;
    double lon2, lat2;

    /** Subscale factor applied to each cell in the nominal east-west
    direction (e.g., 2 doubles the number of x-direction cells).  >= 1 */
    int lon_subscale;

    /** Subscale factor in the nominal north-south direction.  >= 1 */
    int lat_subscale;

    /** Print diagnostic output to STDOUT */
    bool verbose;

    RegridParams() : lon1(0), lat1(0), lon2(0), lat2(0),
        lon_subscale(1), lat_subscale(1), verbose(false) {}

    RegridParams(
        double _lon1, double _lat1, double _lon2, double _lat2,
        int _lon_subscale, int _lat_subscale, bool _verbose=false) :
        lon1(_lon1), lat1(_lat1), lon2(_lon2), lat2(_lat2),
        lon_subscale(_lon_subscale), lat_subscale(_lat_subscale),
        verbose(_verbose) {}
};

/** Regrids a rectangular lon/lat region of src using great circle
subdivision, preserving the corner points that already exist within
the region.
@return The sixteen mitgrid arrays of the refined region.  Its ni, nj
    are the refined cell counts, needed to write (and later read) the
    grid as a mitgrid file. */
extern MitGrid regrid(
    SourceGrid const &src, RegridParams const &params, Geod const &geod);

/** Reads a mitgrid file of ni x nj cells, then regrids it. */
extern MitGrid regrid(
    std::string const &mitgridfile, int ni, int nj,
    RegridParams const &params, Geod const &geod);

/** Corner points of a 3x3-cell grid whose center cell spans the
rectangle with corners (lon1,lat1) and (lon2,lat2).  The outer ring of
cells is one cell-width (resp. height) wide. */
extern SourceGrid mkgrid_source(
    double lon1, double lat1, double lon2, double lat2);

/** Creates a new grid over the rectangle with corners
(params.lon1,params.lat1) and (params.lon2,params.lat2), subdivided by
the subscale factors. */
extern MitGrid mkgrid(RegridParams const &params, Geod const &geod);

}   // namespace mitregrid
#endif  // Guard
