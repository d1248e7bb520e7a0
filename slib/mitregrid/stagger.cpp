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
#include <mitregrid/stagger.hpp>

namespace mitregrid {

char const *to_string(Staggering stagger)
{
    switch(stagger) {
        case Staggering::TRACER_CENTER: return "tracer-center";
        case Staggering::TRACER_CORNER: return "tracer-corner";
        case Staggering::VORTICITY: return "vorticity";
        case Staggering::U_FACE: return "u-face";
        case Staggering::V_FACE: return "v-face";
    }
    return "<unknown>";
}

//   XC, YC    - center of tracer cell
//   XG, YG    - southwest corner of tracer cell
//   DXG, DYG  - tracer cell south, west walls
//   RAC       - tracer cell area
//   DXC, DYC  - vorticity cell edges; join tracer cell centers
//   RAZ       - vorticity cell area
//   DXV, DYF  - U cell edges: between v-points, between tracer faces
//   RAW       - U cell area
//   DXF, DYU  - V cell edges: between u-points, western edge
//   RAS       - V cell area
std::vector<StaggerRule> const stagger_rules {
    // name   staggering                  kind             oi  oj  di  dj
    {"XC",  Staggering::TRACER_CENTER, RuleKind::LON,    +1, +1,  0,  0},
    {"YC",  Staggering::TRACER_CENTER, RuleKind::LAT,    +1, +1,  0,  0},
    {"DXF", Staggering::V_FACE,        RuleKind::XEDGE,   0, +1,  0,  0},
    {"DYF", Staggering::U_FACE,        RuleKind::YEDGE,  +1,  0,  0,  0},
    {"RAC", Staggering::TRACER_CORNER, RuleKind::AREA,    0,  0,  0,  0},
    {"XG",  Staggering::TRACER_CORNER, RuleKind::LON,     0,  0,  1,  1},
    {"YG",  Staggering::TRACER_CORNER, RuleKind::LAT,     0,  0,  1,  1},
    {"DXV", Staggering::U_FACE,        RuleKind::XEDGE,  -1,  0,  1,  1},
    {"DYU", Staggering::V_FACE,        RuleKind::YEDGE,   0, -1,  1,  1},
    {"RAZ", Staggering::VORTICITY,     RuleKind::AREA,   -1, -1,  1,  1},
    {"DXC", Staggering::VORTICITY,     RuleKind::XEDGE,  -1, +1,  1,  0},
    {"DYC", Staggering::VORTICITY,     RuleKind::YEDGE,  +1, -1,  0,  1},
    {"RAW", Staggering::U_FACE,        RuleKind::AREA,   -1,  0,  1,  0},
    {"RAS", Staggering::V_FACE,        RuleKind::AREA,    0, -1,  0,  1},
    {"DXG", Staggering::TRACER_CORNER, RuleKind::XEDGE,   0,  0,  0,  1},
    {"DYG", Staggering::TRACER_CORNER, RuleKind::YEDGE,   0,  0,  1,  0}
};

StaggerRule const &stagger_rule(std::string const &name)
{
    for (auto const &rule : stagger_rules)
        if (name == rule.name) return rule;

    (*mitregrid_error)(SHAPE_MISMATCH,
        "No staggering rule for field %s", name.c_str());
    return stagger_rules[0];    // not reached
}

// ---------------------------------------------------------
/** Checks that every index the rule will touch lies inside an array
of shape (ni, nj).  reach_i, reach_j: furthest offset read past the
start index of each output point. */
static void check_reach(StaggerRule const &rule,
    int lon_subscale, int lat_subscale, int M, int N,
    int reach_i, int reach_j, int ni, int nj)
{
    int const a0 = rule.a0(lon_subscale);
    int const b0 = rule.b0(lat_subscale);
    int const alast = a0 + 2*(M + rule.di - 1) + reach_i;
    int const blast = b0 + 2*(N + rule.dj - 1) + reach_j;

    if (M < 1 || N < 1 || a0 < 0 || b0 < 0 || alast >= ni || blast >= nj)
        (*mitregrid_error)(SHAPE_MISMATCH,
            "%s (%s): indices [%d..%d] x [%d..%d] fall outside (%d,%d) for M=%d, N=%d",
            rule.name, to_string(rule.stagger),
            a0, alast, b0, blast, ni, nj, M, N);
}

blitz::Array<double,2> extract_position(
    StaggerRule const &rule, ComputeGrid const &cg, int M, int N)
{
    check_reach(rule, cg.lon_subscale, cg.lat_subscale, M, N,
        0, 0, cg.extent(0), cg.extent(1));

    blitz::Array<double,2> const &lattice(
        rule.kind == RuleKind::LON ? cg.xg : cg.yg);
    int const a0 = rule.a0(cg.lon_subscale);
    int const b0 = rule.b0(cg.lat_subscale);

    blitz::Array<double,2> ret(M + rule.di, N + rule.dj);
    for (int m=0; m<ret.extent(0); ++m) {
    for (int n=0; n<ret.extent(1); ++n) {
        ret(m,n) = lattice(a0 + 2*m, b0 + 2*n);
    }}
    return ret;
}

blitz::Array<double,2> extract_edge(
    StaggerRule const &rule, ComputeGrid const &cg, Geod const &geod,
    int M, int N)
{
    int const step_i = (rule.kind == RuleKind::XEDGE ? 2 : 0);
    int const step_j = (rule.kind == RuleKind::YEDGE ? 2 : 0);
    check_reach(rule, cg.lon_subscale, cg.lat_subscale, M, N,
        step_i, step_j, cg.extent(0), cg.extent(1));

    int const a0 = rule.a0(cg.lon_subscale);
    int const b0 = rule.b0(cg.lat_subscale);

    blitz::Array<double,2> ret(M + rule.di, N + rule.dj);
    for (int m=0; m<ret.extent(0); ++m) {
    for (int n=0; n<ret.extent(1); ++n) {
        int const a = a0 + 2*m;
        int const b = b0 + 2*n;
        ret(m,n) = geod.inv(
            cg.xg(a,b), cg.yg(a,b),
            cg.xg(a+step_i, b+step_j), cg.yg(a+step_i, b+step_j)).dist;
    }}
    return ret;
}

blitz::Array<double,2> extract_area(
    StaggerRule const &rule, blitz::Array<double,2> const &areas,
    int lon_subscale, int lat_subscale, int M, int N)
{
    check_reach(rule, lon_subscale, lat_subscale, M, N,
        1, 1, areas.extent(0), areas.extent(1));

    int const a0 = rule.a0(lon_subscale);
    int const b0 = rule.b0(lat_subscale);

    blitz::Array<double,2> ret(M + rule.di, N + rule.dj);
    for (int m=0; m<ret.extent(0); ++m) {
    for (int n=0; n<ret.extent(1); ++n) {
        int const a = a0 + 2*m;
        int const b = b0 + 2*n;
        ret(m,n) = areas(a,b) + areas(a+1,b) + areas(a+1,b+1) + areas(a,b+1);
    }}
    return ret;
}

// ---------------------------------------------------------
blitz::Array<double,2> assemble_field(
    StaggerRule const &rule,
    ComputeGrid const &cg, blitz::Array<double,2> const &areas,
    Geod const &geod, int M, int N)
{
    blitz::Array<double,2> ret;
    switch(rule.kind) {
        case RuleKind::LON:
        case RuleKind::LAT:
            ret.reference(extract_position(rule, cg, M, N));
        break;
        case RuleKind::XEDGE:
        case RuleKind::YEDGE:
            ret.reference(extract_edge(rule, cg, geod, M, N));
        break;
        case RuleKind::AREA:
            ret.reference(extract_area(rule, areas,
                cg.lon_subscale, cg.lat_subscale, M, N));
        break;
    }

    if (ret.extent(0) != M + rule.di || ret.extent(1) != N + rule.dj)
        (*mitregrid_error)(SHAPE_MISMATCH,
            "%s (%s): assembled shape (%d,%d), expected (%d,%d)",
            rule.name, to_string(rule.stagger),
            ret.extent(0), ret.extent(1), M + rule.di, N + rule.dj);

    return ret;
}

MitGrid assemble_grid(
    ComputeGrid const &cg, blitz::Array<double,2> const &areas,
    Geod const &geod, int M, int N, bool verbose)
{
    MitGrid grid(M, N);
    for (auto const &rule : stagger_rules) {
        blitz::Array<double,2> arr(assemble_field(rule, cg, areas, geod, M, N));
        if (verbose) {
            printf("outgrid['%s'] (%s):\n", rule.name, to_string(rule.stagger));
            std::cout << arr << std::endl;
        }
        grid.set(rule.name, arr);
    }
    return grid;
}

}   // namespace mitregrid
