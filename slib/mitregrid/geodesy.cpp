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

#include <cmath>
#include <mitregrid/error.hpp>
#include <mitregrid/geodesy.hpp>

namespace mitregrid {

inline double sqr(double x) { return x*x; }

SphereGeod::SphereGeod(double radius) : _radius(radius)
{
    if (!std::isfinite(radius) || radius <= 0) (*mitregrid_error)(GEODESY_FAILURE,
        "Sphere radius must be positive and finite: %g", radius);
}

void SphereGeod::check_finite(char const *op,
    double lon1, double lat1, double lon2, double lat2) const
{
    if (std::isfinite(lon1) && std::isfinite(lat1)
        && std::isfinite(lon2) && std::isfinite(lat2)) return;

    (*mitregrid_error)(GEODESY_FAILURE,
        "%s: non-finite input (%g,%g) -> (%g,%g)",
        op, lon1, lat1, lon2, lat2);
}

/** Great-circle distance and azimuths, using the atan2 (Vincenty
sphere) form of the central angle. */
GeodInverse SphereGeod::inv(
    double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg) const
{
    check_finite("SphereGeod::inv", lon1_deg, lat1_deg, lon2_deg, lat2_deg);

    double const lat1 = lat1_deg * D2R;
    double const lat2 = lat2_deg * D2R;
    double const dlon = (lon2_deg - lon1_deg) * D2R;

    double const sin_lat1 = sin(lat1);
    double const cos_lat1 = cos(lat1);
    double const sin_lat2 = sin(lat2);
    double const cos_lat2 = cos(lat2);
    double const sin_dlon = sin(dlon);
    double const cos_dlon = cos(dlon);

    double const y = sqrt(
        sqr(cos_lat2 * sin_dlon) +
        sqr(cos_lat1 * sin_lat2 - sin_lat1 * cos_lat2 * cos_dlon));
    double const x = sin_lat1 * sin_lat2 + cos_lat1 * cos_lat2 * cos_dlon;

    GeodInverse ret;
    ret.dist = atan2(y, x) * _radius;
    ret.az12 = atan2(
        sin_dlon * cos_lat2,
        cos_lat1 * sin_lat2 - sin_lat1 * cos_lat2 * cos_dlon) * R2D;
    ret.az21 = atan2(
        -sin_dlon * cos_lat1,
        cos_lat2 * sin_lat1 - sin_lat2 * cos_lat1 * cos_dlon) * R2D;
    return ret;
}

/** Angular separation (radians) below which npts() treats two points
as coincident, or as antipodal when within it of pi. */
static double const npts_eps = 1e-14;

std::vector<LonLat> SphereGeod::npts(
    double lon1, double lat1, double lon2, double lat2, int n) const
{
    check_finite("SphereGeod::npts", lon1, lat1, lon2, lat2);
    if (n < 0) (*mitregrid_error)(GEODESY_FAILURE,
        "SphereGeod::npts: number of points must be >= 0: %d", n);

    std::vector<LonLat> ret;
    ret.reserve(n);
    if (n == 0) return ret;

    Eigen::Vector3d const p1(lonlat_to_cart(lon1, lat1));
    Eigen::Vector3d const p2(lonlat_to_cart(lon2, lat2));
    double const sigma = atan2(p1.cross(p2).norm(), p1.dot(p2));
    double const sin_sigma = sin(sigma);

    // Coincident points, including distinct longitudes at a pole
    if (sigma < npts_eps) {
        for (int k=0; k<n; ++k) ret.push_back(LonLat(lon1, lat1));
        return ret;
    }

    // Antipodal points do not determine a unique great circle
    if (M_PI - sigma < npts_eps) (*mitregrid_error)(GEODESY_FAILURE,
        "SphereGeod::npts: no unique geodesic between antipodal points "
        "(%g,%g) and (%g,%g)", lon1, lat1, lon2, lat2);

    for (int k=1; k<=n; ++k) {
        double const f = (double)k / (double)(n+1);
        Eigen::Vector3d const p(
            (sin((1.-f) * sigma) / sin_sigma) * p1 +
            (sin(f * sigma) / sin_sigma) * p2);

        LonLat ll(cart_to_lonlat(p));
        ll.lon = lon1 + loncorrect(ll.lon - lon1, -180.0);
        ret.push_back(ll);
    }
    return ret;
}

}   // namespace mitregrid
