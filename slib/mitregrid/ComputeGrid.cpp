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
#include <mitregrid/error.hpp>
#include <mitregrid/ComputeGrid.hpp>

namespace mitregrid {

void check_subscale(int lon_subscale, int lat_subscale)
{
    if (lon_subscale < 1) (*mitregrid_error)(INVALID_SUBSCALE,
        "lon_subscale=%d must be >= 1", lon_subscale);
    if (lat_subscale < 1) (*mitregrid_error)(INVALID_SUBSCALE,
        "lat_subscale=%d must be >= 1", lat_subscale);
}

ComputeGrid::ComputeGrid(int ncells_i, int ncells_j, int _lon_subscale, int _lat_subscale) :
    lon_subscale(_lon_subscale), lat_subscale(_lat_subscale)
{
    check_subscale(lon_subscale, lat_subscale);

    int const ni = ncells_i * istride() + 1;
    int const nj = ncells_j * jstride() + 1;
    xg.resize(ni, nj);
    yg.resize(ni, nj);
    xg = 0;
    yg = 0;
}

void ComputeGrid::seed(SourceGrid const &src, int iLB, int jLB, int iUB, int jUB)
{
    if (iLB < 0 || jLB < 0 || iUB > src.ni() || jUB > src.nj())
        (*mitregrid_error)(INVALID_REGION,
            "Padded region [%d..%d] x [%d..%d] exceeds source grid [0..%d] x [0..%d]",
            iLB, iUB, jLB, jUB, src.ni(), src.nj());
    if ((iUB-iLB)*istride()+1 != extent(0) || (jUB-jLB)*jstride()+1 != extent(1))
        (*mitregrid_error)(SHAPE_MISMATCH,
            "Padded region [%d..%d] x [%d..%d] does not match lattice of (%d,%d)",
            iLB, iUB, jLB, jUB, extent(0), extent(1));

    for (int i=iLB; i<=iUB; ++i) {
    for (int j=jLB; j<=jUB; ++j) {
        int const icg = (i-iLB) * istride();
        int const jcg = (j-jLB) * jstride();
        xg(icg, jcg) = src.xg(i,j);
        yg(icg, jcg) = src.yg(i,j);
    }}
}

void ComputeGrid::fill_rows(Geod const &geod)
{
    int const n = istride() - 1;    // Intermediate points per seeded pair
    for (int jcg=0; jcg < extent(1); jcg += jstride()) {
    for (int icg=0; icg+istride() < extent(0); icg += istride()) {
        std::vector<LonLat> const pts(geod.npts(
            xg(icg, jcg), yg(icg, jcg),
            xg(icg+istride(), jcg), yg(icg+istride(), jcg), n));

        for (int k=0; k<n; ++k) {
            xg(icg+1+k, jcg) = pts[k].lon;
            yg(icg+1+k, jcg) = pts[k].lat;
        }
    }}
}

void ComputeGrid::fill_cols(Geod const &geod)
{
    int const n = jstride() - 1;
    for (int icg=0; icg < extent(0); ++icg) {
    for (int jcg=0; jcg+jstride() < extent(1); jcg += jstride()) {
        std::vector<LonLat> const pts(geod.npts(
            xg(icg, jcg), yg(icg, jcg),
            xg(icg, jcg+jstride()), yg(icg, jcg+jstride()), n));

        for (int k=0; k<n; ++k) {
            xg(icg, jcg+1+k) = pts[k].lon;
            yg(icg, jcg+1+k) = pts[k].lat;
        }
    }}
}

// ---------------------------------------------------------
ComputeGrid make_compute_grid(
    SourceGrid const &src, RegionBounds const &rb,
    int lon_subscale, int lat_subscale,
    Geod const &geod, bool verbose)
{
    // "Plus one" extents: the region plus a one-cell ring
    int const iLB = rb.ilb - 1;
    int const iUB = rb.iub + 1;
    int const jLB = rb.jlb - 1;
    int const jUB = rb.jub + 1;

    ComputeGrid cg(iUB-iLB, jUB-jLB, lon_subscale, lat_subscale);
    cg.seed(src, iLB, jLB, iUB, jUB);
    if (verbose) {
        printf("user-selected range, plus one, mapped to compute grid:\n");
        std::cout << "compute grid xg:" << std::endl << cg.xg << std::endl;
        std::cout << "compute grid yg:" << std::endl << cg.yg << std::endl;
    }

    cg.fill_rows(geod);
    if (verbose) {
        printf("compute grid after x-edge subdivision:\n");
        std::cout << "compute grid xg:" << std::endl << cg.xg << std::endl;
        std::cout << "compute grid yg:" << std::endl << cg.yg << std::endl;
    }

    cg.fill_cols(geod);
    if (verbose) {
        printf("compute grid after y-direction subdivision fill-in:\n");
        std::cout << "compute grid xg:" << std::endl << cg.xg << std::endl;
        std::cout << "compute grid yg:" << std::endl << cg.yg << std::endl;
    }

    return cg;
}

}   // namespace mitregrid
