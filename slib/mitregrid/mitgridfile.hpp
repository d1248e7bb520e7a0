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

#ifndef MITREGRID_MITGRIDFILE_HPP
#define MITREGRID_MITGRIDFILE_HPP

#include <string>
#include <mitregrid/MitGrid.hpp>

namespace mitregrid {

/** Size (bytes) of a mitgrid file with ni x nj cells. */
inline long mitgridfile_size(int ni, int nj)
    { return (long)mitgrid_fields.size() * (ni+1) * (nj+1) * sizeof(double); }

/** Reads a mitgrid file: the arrays named in mitgrid_fields, in that
order, each (ni+1) x (nj+1) big-endian doubles with i varying fastest.
Cell counts are not stored in the file, so they must be supplied.
@return All arrays, each of shape (ni+1, nj+1). */
extern MitGrid read_mitgridfile(
    std::string const &fname, int ni, int nj, bool verbose=false);

/** Writes a mitgrid file in the layout read by read_mitgridfile().
Arrays smaller than (ni+1) x (nj+1) are zero-padded at the high
i and j ends. */
extern void write_mitgridfile(
    std::string const &fname, MitGrid const &grid, int ni, int nj,
    bool verbose=false);

}   // namespace mitregrid
#endif  // Guard
