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

#ifndef MITREGRID_STAGGER_HPP
#define MITREGRID_STAGGER_HPP

#include <string>
#include <vector>
#include <blitz/array.h>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/MitGrid.hpp>
#include <mitregrid/ComputeGrid.hpp>

namespace mitregrid {

/** Arakawa C-grid locations */
enum class Staggering {
    TRACER_CENTER,    // XC, YC
    TRACER_CORNER,    // XG, YG, DXG, DYG, RAC
    VORTICITY,        // DXC, DYC, RAZ
    U_FACE,           // DXV, DYF, RAW
    V_FACE            // DXF, DYU, RAS
};

extern char const *to_string(Staggering stagger);

/** How a field's values are obtained from the compute grid */
enum class RuleKind {
    LON,      // Longitude of a lattice point
    LAT,      // Latitude of a lattice point
    XEDGE,    // Geodesic distance from lattice point (a,b) to (a+2,b)
    YEDGE,    // Geodesic distance from lattice point (a,b) to (a,b+2)
    AREA      // Sum of compute areas (a,b), (a+1,b), (a+1,b+1), (a,b+1)
};

/** Maps output index (m,n) of a field to compute grid (or compute
area) index (a,b):
<pre>
    a = 2*lon_subscale + oi + 2*m
    b = 2*lat_subscale + oj + 2*n
</pre>
The field has shape (M+di, N+dj), where M, N are the refined cell
counts of the region.  Offset 2*subscale is the lattice index of the
region's first corner, just inside the one-cell ring. */
struct StaggerRule {
    char const *name;
    Staggering stagger;
    RuleKind kind;
    int oi, oj;
    int di, dj;

    int a0(int lon_subscale) const { return 2*lon_subscale + oi; }
    int b0(int lat_subscale) const { return 2*lat_subscale + oj; }
};

/** One rule per mitgrid field, in mitgrid file order. */
extern std::vector<StaggerRule> const stagger_rules;

/** Looks up the rule for a field by name. */
extern StaggerRule const &stagger_rule(std::string const &name);

// ---------------------------------------------------------
// Pure per-kind transforms; M, N are the refined cell counts.

/** Copies strided lattice points (LON or LAT rules). */
extern blitz::Array<double,2> extract_position(
    StaggerRule const &rule, ComputeGrid const &cg, int M, int N);

/** Geodesic edge lengths between lattice points two steps apart
(XEDGE or YEDGE rules). */
extern blitz::Array<double,2> extract_edge(
    StaggerRule const &rule, ComputeGrid const &cg, Geod const &geod,
    int M, int N);

/** Sums of 2x2 blocks of compute areas (AREA rules). */
extern blitz::Array<double,2> extract_area(
    StaggerRule const &rule, blitz::Array<double,2> const &areas,
    int lon_subscale, int lat_subscale, int M, int N);

/** Dispatches on rule.kind, then checks the result's shape. */
extern blitz::Array<double,2> assemble_field(
    StaggerRule const &rule,
    ComputeGrid const &cg, blitz::Array<double,2> const &areas,
    Geod const &geod, int M, int N);

/** Produces all mitgrid fields for the refined region. */
extern MitGrid assemble_grid(
    ComputeGrid const &cg, blitz::Array<double,2> const &areas,
    Geod const &geod, int M, int N, bool verbose=false);

}   // namespace mitregrid
#endif  // Guard
