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

// Helpers shared by the mitregrid unit tests

#ifndef MITREGRID_TESTS_MITREGRID_TEST_HPP
#define MITREGRID_TESTS_MITREGRID_TEST_HPP

#include <cmath>
#include <string>
#include <gtest/gtest.h>
#include <blitz/array.h>
#include <mitregrid/error.hpp>
#include <mitregrid/MitGrid.hpp>

namespace mitregrid {
namespace test {

/** Runs fn; returns the retcode of the mitregrid::Exception it
throws, or 0 if it throws nothing. */
template<class FnT>
int error_code(FnT fn)
{
    try {
        fn();
    } catch(mitregrid::Exception const &exp) {
        return exp.retcode();
    }
    return 0;
}

/** Regular lon/lat corner grid of ni x nj cells:
xg(i,j) = lon0 + i*dlon, yg(i,j) = lat0 + j*dlat */
inline SourceGrid lonlat_grid(
    double lon0, double dlon, int ni,
    double lat0, double dlat, int nj)
{
    blitz::Array<double,2> xg(ni+1, nj+1);
    blitz::Array<double,2> yg(ni+1, nj+1);
    for (int i=0; i<=ni; ++i) {
    for (int j=0; j<=nj; ++j) {
        xg(i,j) = lon0 + i*dlon;
        yg(i,j) = lat0 + j*dlat;
    }}
    return SourceGrid(xg, yg);
}

inline double array_sum(blitz::Array<double,2> const &arr)
{
    double sum = 0;
    for (int i=0; i<arr.extent(0); ++i) {
    for (int j=0; j<arr.extent(1); ++j) {
        sum += arr(i,j);
    }}
    return sum;
}

/** Expects two arrays to have the same shape and bit-identical values. */
inline void expect_same_array(
    blitz::Array<double,2> const &expected,
    blitz::Array<double,2> const &actual,
    std::string const &msg = "")
{
    ASSERT_EQ(expected.extent(0), actual.extent(0)) << msg;
    ASSERT_EQ(expected.extent(1), actual.extent(1)) << msg;
    for (int i=0; i<expected.extent(0); ++i) {
    for (int j=0; j<expected.extent(1); ++j) {
        EXPECT_EQ(expected(i,j), actual(i,j))
            << msg << " (" << i << "," << j << ")";
    }}
}

}}    // namespace mitregrid::test
#endif  // Guard
