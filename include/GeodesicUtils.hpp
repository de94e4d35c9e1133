#ifndef GEODESIC_UTILS_HPP
#define GEODESIC_UTILS_HPP

#include <array>
#include <vector>

namespace HAZCON {

/**
 * @brief Geographic position in decimal degrees
 *
 * Only the northern and eastern hemispheres are supported; both components
 * must be non-negative.
 */
struct GeoPoint {
    double longitude = 0.0;
    double latitude = 0.0;

    GeoPoint() = default;
    GeoPoint(double lon, double lat) : longitude(lon), latitude(lat) {}
};

/**
 * @brief Distance between two points on the reference ellipsoid
 *
 * Uses the Lambert formula for long lines on the ellipsoid with semi-axes
 * 6378.140 km and 6356.755 km: the great-circle angle between the reduced
 * latitudes is corrected by a flattening term.
 *
 * @param a First point
 * @param b Second point
 * @return Distance in metres; 0 for identical points
 * @throws ValidationError if a component is negative
 */
double geographicalDistance(const GeoPoint& a, const GeoPoint& b);

/**
 * @brief Discretize the bounding box of four corner points
 *
 * The metre interval is turned into longitude and latitude steps at the
 * box centre by a forward geodesic on the same ellipsoid. Each axis is then
 * sampled evenly from its minimum to its maximum, endpoints included. Points
 * are returned latitude-major: all longitudes of the southern row first.
 *
 * @param corners Four corners of the region
 * @param interval Target spacing between neighbouring grid points [m]
 * @throws ValidationError if a corner component is negative or interval <= 0
 */
std::vector<GeoPoint> areaGridding(const std::array<GeoPoint, 4>& corners,
                                   double interval = 100.0);

} // namespace HAZCON

#endif // GEODESIC_UTILS_HPP
