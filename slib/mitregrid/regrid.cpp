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

#include <cstdio>
#include <iostream>
#include <algorithm>
#include <ibmisc/stdio.hpp>
#include <mitregrid/error.hpp>
#include <mitregrid/nearest.hpp>
#include <mitregrid/ComputeGrid.hpp>
#include <mitregrid/areas.hpp>
#include <mitregrid/stagger.hpp>
#include <mitregrid/mitgridfile.hpp>
#include <mitregrid/regrid.hpp>

using namespace ibmisc;

namespace mitregrid {

static std::string corner_str(char const *label,
    double lon, double lat, NearestPoint const &np,
    SourceGrid const &src)
{
    return strprintf("%s (%g,%g) -> (i,j)=(%d,%d) at (%g,%g), %g m away",
        label, lon, lat, np.i, np.j,
        src.xg(np.i, np.j), src.yg(np.i, np.j), np.dist);
}

MitGrid regrid(
    SourceGrid const &src, RegridParams const &params, Geod const &geod)
{
    check_subscale(params.lon_subscale, params.lat_subscale);

    RegionBounds const rb(locate_region(
        params.lon1, params.lat1, params.lon2, params.lat2, src, geod));

    if (params.verbose) {
        printf("remeshing %d x %d cell region of %d x %d cell grid\n",
            rb.ncells_i(), rb.ncells_j(), src.ni(), src.nj());
        printf("located corner points:\n");
        printf("    %s\n", corner_str("corner 1",
            params.lon1, params.lat1, rb.p1, src).c_str());
        printf("    %s\n", corner_str("corner 2",
            params.lon2, params.lat2, rb.p2, src).c_str());
    }

    int const M = rb.ncells_i() * params.lon_subscale;
    int const N = rb.ncells_j() * params.lat_subscale;
    if (params.verbose)
        printf("resulting grid will be %d x %d cells (lon/lat subscale = %d/%d)\n",
            M, N, params.lon_subscale, params.lat_subscale);

    ComputeGrid const cg(make_compute_grid(src, rb,
        params.lon_subscale, params.lat_subscale, geod, params.verbose));

    blitz::Array<double,2> const areas(compute_areas(cg, geod.a()));
    if (params.verbose) {
        printf("compute grid areas:\n");
        std::cout << areas << std::endl;
    }

    return assemble_grid(cg, areas, geod, M, N, params.verbose);
}

MitGrid regrid(
    std::string const &mitgridfile, int ni, int nj,
    RegridParams const &params, Geod const &geod)
{
    MitGrid const grid(read_mitgridfile(mitgridfile, ni, nj, params.verbose));
    SourceGrid const src(grid);
    return regrid(src, params, geod);
}

// ---------------------------------------------------------
SourceGrid mkgrid_source(
    double lon1, double lat1, double lon2, double lat2)
{
    if (lon1 == lon2) (*mitregrid_error)(INVALID_REGION,
        "lon1=lon2=%g: region has zero width", lon1);
    if (lat1 == lat2) (*mitregrid_error)(INVALID_REGION,
        "lat1=lat2=%g: region has zero height", lat1);

    double const lon0 = std::min(lon1, lon2);
    double const lat0 = std::min(lat1, lat2);
    double const dlon = std::max(lon1, lon2) - lon0;
    double const dlat = std::max(lat1, lat2) - lat0;

    // Halo ring must stay on the sphere
    if (lat0 - dlat < -90.0 || lat0 + 2*dlat > 90.0)
        (*mitregrid_error)(INVALID_REGION,
            "Boundary ring of latitudes [%g..%g] extends beyond the poles",
            lat0 - dlat, lat0 + 2*dlat);

    blitz::Array<double,2> xg(4,4);
    blitz::Array<double,2> yg(4,4);
    for (int i=0; i<4; ++i) {
    for (int j=0; j<4; ++j) {
        xg(i,j) = lon0 + (i-1)*dlon;
        yg(i,j) = lat0 + (j-1)*dlat;
    }}

    return SourceGrid(xg, yg);
}

MitGrid mkgrid(RegridParams const &params, Geod const &geod)
{
    check_subscale(params.lon_subscale, params.lat_subscale);

    SourceGrid const src(mkgrid_source(
        params.lon1, params.lat1, params.lon2, params.lat2));
    if (params.verbose) {
        printf("synthesized source grid:\n");
        std::cout << "xg:" << std::endl << src.xg << std::endl;
        std::cout << "yg:" << std::endl << src.yg << std::endl;
    }

    return regrid(src, params, geod);
}

}   // namespace mitregrid
