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

#include <gtest/gtest.h>
#include <vector>
#include <iostream>
#include <mitregrid/error.hpp>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/nearest.hpp>
#include <mitregrid/ComputeGrid.hpp>
#include "mitregrid_test.hpp"

using namespace std;
using namespace mitregrid;
using namespace mitregrid::test;

class ComputeGridTest : public ::testing::Test {
protected:
    SphereGeod const geod;
    SourceGrid const src;    // 3x3 cells, corners at integer lon/lat 0..3
    RegionBounds const rb;   // The center cell

    ComputeGridTest() :
        src(lonlat_grid(0., 1., 3, 0., 1., 3)),
        rb(locate_region(1., 1., 2., 2., src, geod)) {}
    virtual ~ComputeGridTest() {}
};

TEST_F(ComputeGridTest, check_subscale)
{
    EXPECT_EQ(0, error_code([]{ check_subscale(1, 1); }));
    EXPECT_EQ(INVALID_SUBSCALE, error_code([]{ check_subscale(0, 1); }));
    EXPECT_EQ(INVALID_SUBSCALE, error_code([]{ check_subscale(1, -2); }));
    EXPECT_EQ(INVALID_SUBSCALE, error_code([]{ ComputeGrid cg(3, 3, 0, 2); }));
    EXPECT_EQ(INVALID_SUBSCALE, error_code([&]{
        make_compute_grid(src, rb, 2, 0, geod); }));
}

TEST_F(ComputeGridTest, extent)
{
    ComputeGrid const cg(3, 3, 2, 3);
    EXPECT_EQ(13, cg.extent(0));
    EXPECT_EQ(19, cg.extent(1));
    EXPECT_EQ(4, cg.istride());
    EXPECT_EQ(6, cg.jstride());
}

TEST_F(ComputeGridTest, anchors)
{
    for (int ls : {1, 2, 5}) {
    for (int las : {1, 3}) {
        ComputeGrid const cg(make_compute_grid(src, rb, ls, las, geod));
        ASSERT_EQ(3*2*ls + 1, cg.extent(0));
        ASSERT_EQ(3*2*las + 1, cg.extent(1));

        // Every source corner of the ring-padded region, verbatim
        for (int i=0; i<=3; ++i) {
        for (int j=0; j<=3; ++j) {
            EXPECT_EQ(src.xg(i,j), cg.xg(i*2*ls, j*2*las));
            EXPECT_EQ(src.yg(i,j), cg.yg(i*2*ls, j*2*las));
        }}
    }}
}

TEST_F(ComputeGridTest, seed_bounds)
{
    ComputeGrid cg(3, 3, 1, 1);
    EXPECT_EQ(INVALID_REGION, error_code([&]{ cg.seed(src, -1, 0, 2, 3); }));
    EXPECT_EQ(INVALID_REGION, error_code([&]{ cg.seed(src, 0, 0, 3, 4); }));
    EXPECT_EQ(SHAPE_MISMATCH, error_code([&]{ cg.seed(src, 0, 0, 2, 3); }));
}

TEST_F(ComputeGridTest, fill_rows)
{
    int const ls = 2;
    ComputeGrid cg(3, 3, ls, 1);
    cg.seed(src, 0, 0, 3, 3);
    cg.fill_rows(geod);

    // Seeded row j=1, between corners (0,1) and (1,1)
    std::vector<LonLat> const pts(geod.npts(0., 1., 1., 1., 2*ls-1));
    for (int k=0; k<2*ls-1; ++k) {
        EXPECT_EQ(pts[k].lon, cg.xg(1+k, 2));
        EXPECT_EQ(pts[k].lat, cg.yg(1+k, 2));
    }

    // Great circle passes poleward of the parallel
    EXPECT_GT(cg.yg(ls, 2), 1.0);

    // Unseeded rows are still untouched
    EXPECT_EQ(0., cg.xg(1, 1));
    EXPECT_EQ(0., cg.yg(ls, 1));
}

TEST_F(ComputeGridTest, fill_cols_after_rows)
{
    int const ls = 2;
    int const las = 2;
    ComputeGrid const cg(make_compute_grid(src, rb, ls, las, geod));

    // Interior points interpolate between points the row fill produced
    for (int icg=0; icg<cg.extent(0); ++icg) {
        std::vector<LonLat> const pts(geod.npts(
            cg.xg(icg, 4), cg.yg(icg, 4),
            cg.xg(icg, 8), cg.yg(icg, 8), 2*las-1));
        for (int k=0; k<2*las-1; ++k) {
            EXPECT_EQ(pts[k].lon, cg.xg(icg, 5+k)) << "icg=" << icg;
            EXPECT_EQ(pts[k].lat, cg.yg(icg, 5+k)) << "icg=" << icg;
        }
    }
}

TEST_F(ComputeGridTest, seeded_columns_are_meridians)
{
    ComputeGrid const cg(make_compute_grid(src, rb, 3, 3, geod));

    // Source corners of a column share a longitude, so the great circle
    // joining them is a meridian.
    for (int j=0; j<cg.extent(1); ++j) {
        EXPECT_NEAR(1., cg.xg(6, j), 1e-12);
        EXPECT_NEAR(2., cg.xg(12, j), 1e-12);
    }
}


int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
