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

#include <mitregrid/error.hpp>
#include <mitregrid/MitGrid.hpp>

namespace mitregrid {

std::vector<std::string> const mitgrid_fields {
    "XC", "YC", "DXF", "DYF", "RAC",
    "XG", "YG", "DXV", "DYU", "RAZ",
    "DXC", "DYC", "RAW", "RAS", "DXG", "DYG"
};

void MitGrid::set(std::string const &name, blitz::Array<double,2> const &arr)
{
    _arrays[name].reference(arr);
}

blitz::Array<double,2> const &MitGrid::at(std::string const &name) const
{
    auto ii(_arrays.find(name));
    if (ii == _arrays.end()) (*mitregrid_error)(IO_ERROR,
        "MitGrid has no array named %s", name.c_str());
    return ii->second;
}

blitz::Array<double,2> &MitGrid::at(std::string const &name)
{
    auto ii(_arrays.find(name));
    if (ii == _arrays.end()) (*mitregrid_error)(IO_ERROR,
        "MitGrid has no array named %s", name.c_str());
    return ii->second;
}

std::ostream &operator<<(std::ostream &os, MitGrid const &grid)
{
    os << "MitGrid(ni=" << grid.ni << ", nj=" << grid.nj << ")" << std::endl;
    for (auto const &name : mitgrid_fields) {
        if (!grid.has(name)) continue;
        os << name << ":" << std::endl << grid.at(name) << std::endl;
    }
    return os;
}

// ----------------------------------------------------------
SourceGrid::SourceGrid(
    blitz::Array<double,2> const &_xg,
    blitz::Array<double,2> const &_yg)
: xg(_xg), yg(_yg)
{
    if (xg.extent(0) != yg.extent(0) || xg.extent(1) != yg.extent(1))
        (*mitregrid_error)(SHAPE_MISMATCH,
            "SourceGrid: XG shape (%d,%d) differs from YG shape (%d,%d)",
            xg.extent(0), xg.extent(1), yg.extent(0), yg.extent(1));
    if (xg.extent(0) < 2 || xg.extent(1) < 2)
        (*mitregrid_error)(SHAPE_MISMATCH,
            "SourceGrid: need at least one cell, got corner arrays of (%d,%d)",
            xg.extent(0), xg.extent(1));
}

SourceGrid::SourceGrid(MitGrid const &grid)
    : SourceGrid(grid.at("XG"), grid.at("YG")) {}

}   // namespace mitregrid
