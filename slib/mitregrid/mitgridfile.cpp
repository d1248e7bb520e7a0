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
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <boost/endian/conversion.hpp>
#include <boost/filesystem.hpp>
#include <mitregrid/error.hpp>
#include <mitregrid/mitgridfile.hpp>

namespace mitregrid {

// Doubles go through uint64_t so that byte swapping never touches a
// floating point register.
static double big_to_double(uint64_t raw)
{
    uint64_t const native = boost::endian::big_to_native(raw);
    double ret;
    memcpy(&ret, &native, sizeof(ret));
    return ret;
}

static uint64_t double_to_big(double val)
{
    uint64_t native;
    memcpy(&native, &val, sizeof(native));
    return boost::endian::native_to_big(native);
}

// ----------------------------------------------------------
MitGrid read_mitgridfile(
    std::string const &fname, int ni, int nj, bool verbose)
{
    if (ni < 1 || nj < 1) (*mitregrid_error)(IO_ERROR,
        "read_mitgridfile(%s): ni=%d, nj=%d must be >= 1",
        fname.c_str(), ni, nj);

    boost::system::error_code ec;
    auto const fsize(boost::filesystem::file_size(fname, ec));
    if (ec) (*mitregrid_error)(IO_ERROR,
        "Cannot stat mitgrid file %s: %s", fname.c_str(), ec.message().c_str());

    long const expected = mitgridfile_size(ni, nj);
    if ((long)fsize != expected) (*mitregrid_error)(IO_ERROR,
        "mitgrid file %s has %ld bytes; ni=%d, nj=%d requires %ld",
        fname.c_str(), (long)fsize, ni, nj, expected);

    std::ifstream fin(fname, std::ios::in | std::ios::binary);
    if (!fin) (*mitregrid_error)(IO_ERROR,
        "Cannot open mitgrid file %s for reading", fname.c_str());

    MitGrid grid(ni, nj);
    std::vector<uint64_t> buf((ni+1) * (nj+1));
    for (auto const &name : mitgrid_fields) {
        if (verbose) printf("reading %s...\n", name.c_str());

        fin.read(reinterpret_cast<char *>(&buf[0]), buf.size() * sizeof(uint64_t));
        if (!fin) (*mitregrid_error)(IO_ERROR,
            "Short read of %s from mitgrid file %s", name.c_str(), fname.c_str());

        blitz::Array<double,2> arr(ni+1, nj+1);
        for (int j=0; j<nj+1; ++j) {
        for (int i=0; i<ni+1; ++i) {
            arr(i,j) = big_to_double(buf[j*(ni+1) + i]);
        }}
        grid.set(name, arr);
    }

    return grid;
}

// ----------------------------------------------------------
void write_mitgridfile(
    std::string const &fname, MitGrid const &grid, int ni, int nj,
    bool verbose)
{
    std::vector<uint64_t> buf((ni+1) * (nj+1));

    // Check everything before the file is created
    for (auto const &name : mitgrid_fields) {
        blitz::Array<double,2> const &arr(grid.at(name));
        if (arr.extent(0) > ni+1 || arr.extent(1) > nj+1) (*mitregrid_error)(IO_ERROR,
            "Array %s of shape (%d,%d) does not fit a mitgrid with ni=%d, nj=%d",
            name.c_str(), arr.extent(0), arr.extent(1), ni, nj);
    }

    std::ofstream fout(fname, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!fout) (*mitregrid_error)(IO_ERROR,
        "Cannot open mitgrid file %s for writing", fname.c_str());

    for (auto const &name : mitgrid_fields) {
        if (verbose) printf("writing %s...\n", name.c_str());
        blitz::Array<double,2> const &arr(grid.at(name));

        std::fill(buf.begin(), buf.end(), double_to_big(0.));
        for (int j=0; j<arr.extent(1); ++j) {
        for (int i=0; i<arr.extent(0); ++i) {
            buf[j*(ni+1) + i] = double_to_big(arr(i,j));
        }}

        fout.write(reinterpret_cast<char const *>(&buf[0]), buf.size() * sizeof(uint64_t));
        if (!fout) (*mitregrid_error)(IO_ERROR,
            "Error writing %s to mitgrid file %s", name.c_str(), fname.c_str());
    }
}

}   // namespace mitregrid
