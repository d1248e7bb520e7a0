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

#ifndef MITREGRID_GEODESY_HPP
#define MITREGRID_GEODESY_HPP

#include <cmath>
#include <vector>
#include <Eigen/Dense>

namespace mitregrid {

// Radians <--> Degrees
double const D2R = M_PI / 180.0;
double const R2D = 180.0 / M_PI;

/** Radius (m) of PROJ's "sphere" ellipsoid (ellps=sphere) */
double const PROJ_SPHERE_RADIUS = 6370997.0;

/** A (longitude, latitude) pair, in degrees. */
struct LonLat {
    double lon;
    double lat;

    LonLat() : lon(0), lat(0) {}
    LonLat(double _lon, double _lat) : lon(_lon), lat(_lat) {}
};

/** Result of the inverse geodesic problem.  Azimuths are in degrees
clockwise from north; az21 is the azimuth at point 2 looking back
toward point 1. */
struct GeodInverse {
    double az12;
    double az21;
    double dist;    // (m)
};

/** Geodesic computations on a reference surface.  The two operations
must follow the same geodesic between a pair of points. */
class Geod {
public:
    virtual ~Geod() {}

    /** Equatorial radius (m) of the reference surface */
    virtual double a() const = 0;

    /** Distance and azimuths between two points. */
    virtual GeodInverse inv(
        double lon1, double lat1, double lon2, double lat2) const = 0;

    /** Computes n points equally spaced along the geodesic from
    (lon1,lat1) to (lon2,lat2), not including the endpoints.
    Longitudes are returned within 180 degrees of lon1. */
    virtual std::vector<LonLat> npts(
        double lon1, double lat1, double lon2, double lat2, int n) const = 0;
};

/** Geodesics on a sphere are great circles. */
class SphereGeod : public Geod {
    double const _radius;

    void check_finite(char const *op,
        double lon1, double lat1, double lon2, double lat2) const;
public:
    explicit SphereGeod(double radius = PROJ_SPHERE_RADIUS);

    double a() const { return _radius; }

    GeodInverse inv(
        double lon1, double lat1, double lon2, double lat2) const;

    std::vector<LonLat> npts(
        double lon1, double lat1, double lon2, double lat2, int n) const;
};

// ----------------------------------------------------------

// Normalises a value of longitude to the range starting at min degrees.
// @return The normalised value of longitude.
inline double loncorrect(double lon, double min)
{
    double max = min + 360.0;

    while (lon >= max) lon -= 360.0;
    while (lon < min) lon += 360.0;

    return lon;
}

/** Unit vector on the sphere for a lon/lat point (degrees). */
inline Eigen::Vector3d lonlat_to_cart(double lon_deg, double lat_deg)
{
    double const lon = lon_deg * D2R;
    double const lat = lat_deg * D2R;
    return Eigen::Vector3d(
        cos(lat) * cos(lon),
        cos(lat) * sin(lon),
        sin(lat));
}

/** Inverse of lonlat_to_cart(); p need not be normalized. */
inline LonLat cart_to_lonlat(Eigen::Vector3d const &p)
{
    return LonLat(
        atan2(p[1], p[0]) * R2D,
        atan2(p[2], std::hypot(p[0], p[1])) * R2D);
}

}   // namespace mitregrid
#endif  // Guard
