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

// https://github.com/google/googletest/blob/master/googletest/docs/Primer.md

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <iostream>
#include <mitregrid/error.hpp>
#include <mitregrid/geodesy.hpp>
#include "mitregrid_test.hpp"

using namespace std;
using namespace mitregrid;
using namespace mitregrid::test;

// The fixture for testing class SphereGeod.
class GeodesyTest : public ::testing::Test {
protected:
    SphereGeod const geod;

    GeodesyTest() {}
    virtual ~GeodesyTest() {}
};

TEST_F(GeodesyTest, inv_same_point)
{
    GeodInverse const gi(geod.inv(10., 20., 10., 20.));
    EXPECT_EQ(0., gi.dist);
}

TEST_F(GeodesyTest, inv_equator)
{
    GeodInverse const gi(geod.inv(0., 0., 1., 0.));
    EXPECT_NEAR(PROJ_SPHERE_RADIUS * D2R, gi.dist, 1e-6);
    EXPECT_NEAR(90., gi.az12, 1e-9);
    EXPECT_NEAR(-90., gi.az21, 1e-9);

    // Quarter of a great circle
    EXPECT_NEAR(PROJ_SPHERE_RADIUS * M_PI/2.,
        geod.inv(0., 0., 90., 0.).dist, 1e-6);
}

TEST_F(GeodesyTest, inv_meridian)
{
    GeodInverse const gi(geod.inv(0., 0., 0., 1.));
    EXPECT_NEAR(PROJ_SPHERE_RADIUS * D2R, gi.dist, 1e-6);
    EXPECT_NEAR(0., gi.az12, 1e-9);
    EXPECT_NEAR(180., std::abs(gi.az21), 1e-9);
}

TEST_F(GeodesyTest, inv_symmetric)
{
    double const d12 = geod.inv(1., 1., 2., 2.).dist;
    double const d21 = geod.inv(2., 2., 1., 1.).dist;
    EXPECT_NEAR(d12, d21, 1e-9 * d12);
}

TEST_F(GeodesyTest, radius)
{
    EXPECT_EQ(PROJ_SPHERE_RADIUS, geod.a());

    SphereGeod const unit(1.0);
    EXPECT_NEAR(M_PI, unit.inv(0., 0., 180., 0.).dist, 1e-12);

    EXPECT_EQ(GEODESY_FAILURE, error_code([]{ SphereGeod g(-1.0); }));
    EXPECT_EQ(GEODESY_FAILURE, error_code([]{ SphereGeod g(0.0); }));
}

TEST_F(GeodesyTest, npts_equator)
{
    std::vector<LonLat> const pts(geod.npts(0., 0., 4., 0., 3));
    ASSERT_EQ(3u, pts.size());
    for (int k=0; k<3; ++k) {
        EXPECT_NEAR(k+1, pts[k].lon, 1e-9);
        EXPECT_NEAR(0., pts[k].lat, 1e-9);
    }
}

TEST_F(GeodesyTest, npts_equally_spaced)
{
    std::vector<LonLat> const pts(geod.npts(1., 1., 2., 2., 4));
    ASSERT_EQ(4u, pts.size());

    double const total = geod.inv(1., 1., 2., 2.).dist;
    double lon0 = 1.;
    double lat0 = 1.;
    for (auto const &pt : pts) {
        EXPECT_NEAR(total / 5., geod.inv(lon0, lat0, pt.lon, pt.lat).dist, 1e-6);
        lon0 = pt.lon;
        lat0 = pt.lat;
    }
    EXPECT_NEAR(total / 5., geod.inv(lon0, lat0, 2., 2.).dist, 1e-6);
}

TEST_F(GeodesyTest, npts_parallel_bulges_poleward)
{
    // A great circle between two points on a parallel passes poleward of it
    std::vector<LonLat> const north(geod.npts(0., 45., 10., 45., 1));
    EXPECT_NEAR(5., north[0].lon, 1e-9);
    EXPECT_GT(north[0].lat, 45.);

    std::vector<LonLat> const south(geod.npts(0., -45., 10., -45., 1));
    EXPECT_LT(south[0].lat, -45.);
}

TEST_F(GeodesyTest, npts_unwraps_longitude)
{
    // Across the dateline
    std::vector<LonLat> const pts(geod.npts(179., 0., -179., 0., 1));
    EXPECT_NEAR(180., pts[0].lon, 1e-9);

    // Across the prime meridian, starting from a large longitude
    std::vector<LonLat> const pts2(geod.npts(350., 0., 10., 0., 1));
    EXPECT_NEAR(360., pts2[0].lon, 1e-9);
}

TEST_F(GeodesyTest, npts_degenerate)
{
    EXPECT_EQ(0u, geod.npts(1., 1., 2., 2., 0).size());

    std::vector<LonLat> const same(geod.npts(5., 5., 5., 5., 2));
    ASSERT_EQ(2u, same.size());
    for (auto const &pt : same) {
        EXPECT_EQ(5., pt.lon);
        EXPECT_EQ(5., pt.lat);
    }
}

TEST_F(GeodesyTest, npts_pole)
{
    // Different longitudes at the pole are the same point
    EXPECT_NEAR(0., geod.inv(-1., 90., 0., 90.).dist, 1e-6);
    std::vector<LonLat> const pole(geod.npts(-1., 90., 0., 90., 1));
    ASSERT_EQ(1u, pole.size());
    EXPECT_EQ(90., pole[0].lat);

    std::vector<LonLat> const near(
        geod.npts(10., 89.9999999, 10.0000001, 89.9999999, 3));
    ASSERT_EQ(3u, near.size());
    for (auto const &pt : near) {
        EXPECT_NEAR(10., pt.lon, 1e-6);
        EXPECT_NEAR(89.9999999, pt.lat, 1e-9);
    }

    // Meridian ending at the pole
    std::vector<LonLat> const merid(geod.npts(30., 80., 30., 90., 1));
    ASSERT_EQ(1u, merid.size());
    EXPECT_NEAR(85., merid[0].lat, 1e-9);
}

TEST_F(GeodesyTest, errors)
{
    double const nan = std::numeric_limits<double>::quiet_NaN();
    double const inf = std::numeric_limits<double>::infinity();
    SphereGeod const &g(geod);

    EXPECT_EQ(GEODESY_FAILURE, error_code([&]{ g.inv(nan, 0., 1., 1.); }));
    EXPECT_EQ(GEODESY_FAILURE, error_code([&]{ g.inv(0., 0., 1., inf); }));
    EXPECT_EQ(GEODESY_FAILURE, error_code([&]{ g.npts(0., nan, 1., 1., 2); }));
    EXPECT_EQ(GEODESY_FAILURE, error_code([&]{ g.npts(0., 0., 1., 1., -1); }));

    // Antipodes have no unique great circle
    EXPECT_EQ(GEODESY_FAILURE, error_code([&]{ g.npts(0., 0., 180., 0., 1); }));
}

TEST_F(GeodesyTest, loncorrect)
{
    EXPECT_EQ(10., loncorrect(370., -180.));
    EXPECT_EQ(-170., loncorrect(190., -180.));
    EXPECT_EQ(-180., loncorrect(180., -180.));
    EXPECT_EQ(350., loncorrect(-10., 0.));
}

TEST_F(GeodesyTest, cart)
{
    Eigen::Vector3d const p(lonlat_to_cart(90., 0.));
    EXPECT_NEAR(0., p[0], 1e-15);
    EXPECT_NEAR(1., p[1], 1e-15);
    EXPECT_NEAR(0., p[2], 1e-15);

    LonLat const ll(cart_to_lonlat(lonlat_to_cart(-30., 60.)));
    EXPECT_NEAR(-30., ll.lon, 1e-12);
    EXPECT_NEAR(60., ll.lat, 1e-12);
}


int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
