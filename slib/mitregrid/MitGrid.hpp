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

#ifndef MITREGRID_MITGRID_HPP
#define MITREGRID_MITGRID_HPP

#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <blitz/array.h>

namespace mitregrid {

/** Names of the arrays stored in a mitgrid file, in file order:
<pre>
    XC, YC    - lon/lat of tracer cell centers
    DXF, DYF  - tracer cell widths through the center
    RAC       - tracer cell area
    XG, YG    - lon/lat of tracer cell southwest corners
    DXV, DYU  - separations between v-points, u-points
    RAZ       - vorticity cell area
    DXC, DYC  - separations between tracer cell centers
    RAW, RAS  - U and V cell areas
    DXG, DYG  - tracer cell south and west edge lengths
</pre> */
extern std::vector<std::string> const mitgrid_fields;

/** A set of named 2-D arrays describing (part of) a mitgrid, plus the
cell counts ni, nj that determine the on-disk layout.  Arrays are
indexed (i,j): i nominally east-west, j nominally north-south. */
class MitGrid {
public:
    int ni;    // Number of cells in the nominal east-west direction
    int nj;    // Number of cells in the nominal north-south direction

protected:
    std::map<std::string, blitz::Array<double,2>> _arrays;

public:
    MitGrid() : ni(0), nj(0) {}
    MitGrid(int _ni, int _nj) : ni(_ni), nj(_nj) {}

    bool has(std::string const &name) const
        { return _arrays.find(name) != _arrays.end(); }

    /** Adds (or replaces) an array; the MitGrid shares arr's data. */
    void set(std::string const &name, blitz::Array<double,2> const &arr);

    blitz::Array<double,2> const &at(std::string const &name) const;
    blitz::Array<double,2> &at(std::string const &name);

    size_t size() const { return _arrays.size(); }
};

std::ostream &operator<<(std::ostream &os, MitGrid const &grid);

// ----------------------------------------------------------
/** Corner-point geometry of an existing grid; the read-only input to
regridding. */
struct SourceGrid {
    /** Corner longitude and latitude (degrees), shape (ni+1, nj+1) */
    blitz::Array<double,2> const xg;
    blitz::Array<double,2> const yg;

    SourceGrid(
        blitz::Array<double,2> const &_xg,
        blitz::Array<double,2> const &_yg);

    /** Uses the XG and YG arrays of a grid read from disk. */
    explicit SourceGrid(MitGrid const &grid);

    int ni() const { return xg.extent(0) - 1; }
    int nj() const { return xg.extent(1) - 1; }
};

}   // namespace mitregrid
#endif  // Guard
