#include "GeodesicUtils.hpp"
#include "HAZCON.hpp"
#include "HazardErrors.hpp"
#include <geodesic.h>
#include <algorithm>
#include <cmath>

namespace HAZCON {

using namespace HazardConstants;

namespace {

void checkPoint(const GeoPoint& p, const std::string& name) {
    if (p.longitude < 0.0 || p.latitude < 0.0) {
        throw ValidationError(parameterError(name));
    }
}

std::vector<double> linspace(double lo, double hi, int n) {
    std::vector<double> values;
    if (n <= 1) {
        values.push_back(lo);
        return values;
    }
    values.reserve(n);
    double step = (hi - lo) / (n - 1);
    for (int i = 0; i < n; ++i) {
        values.push_back(i == n - 1 ? hi : lo + i * step);
    }
    return values;
}

int sampleCount(double range, double step) {
    if (range <= 0.0) return 1;
    int steps = static_cast<int>(std::lround(range / step));
    return std::max(steps, 1) + 1;
}

} // anonymous namespace

double geographicalDistance(const GeoPoint& a, const GeoPoint& b) {
    checkPoint(a, "gc1");
    checkPoint(b, "gc2");

    const double ra = ELLIPSOID_MAJOR_KM;
    const double rb = ELLIPSOID_MINOR_KM;
    const double flatten = (ra - rb) / ra;

    double lng_a = a.longitude * DEG_TO_RAD;
    double lat_a = a.latitude * DEG_TO_RAD;
    double lng_b = b.longitude * DEG_TO_RAD;
    double lat_b = b.latitude * DEG_TO_RAD;

    // Reduced latitudes
    double p_a = std::atan(rb / ra * std::tan(lat_a));
    double p_b = std::atan(rb / ra * std::tan(lat_b));

    double cos_x = std::sin(p_a) * std::sin(p_b) +
                   std::cos(p_a) * std::cos(p_b) * std::cos(lng_a - lng_b);
    cos_x = std::clamp(cos_x, -1.0, 1.0);
    double x = std::acos(cos_x);
    if (x == 0.0) return 0.0;

    double sum = std::sin(p_a) + std::sin(p_b);
    double diff = std::sin(p_a) - std::sin(p_b);
    double half_cos = std::cos(x / 2.0);
    double half_sin = std::sin(x / 2.0);

    double c1 = (std::sin(x) - x) * (sum * sum) / (half_cos * half_cos);
    double c2 = (std::sin(x) + x) * (diff * diff) / (half_sin * half_sin);
    double dr = flatten / 8.0 * (c1 - c2);

    return ra * (x + dr) * 1e3;
}

std::vector<GeoPoint> areaGridding(const std::array<GeoPoint, 4>& corners, double interval) {
    if (!(interval > 0.0)) {
        throw ValidationError(parameterError("interval"));
    }
    for (const auto& c : corners) {
        checkPoint(c, "gcs");
    }

    double xmin = corners[0].longitude, xmax = corners[0].longitude;
    double ymin = corners[0].latitude, ymax = corners[0].latitude;
    for (const auto& c : corners) {
        xmin = std::min(xmin, c.longitude);
        xmax = std::max(xmax, c.longitude);
        ymin = std::min(ymin, c.latitude);
        ymax = std::max(ymax, c.latitude);
    }

    struct geod_geodesic geod;
    geod_init(&geod, ELLIPSOID_MAJOR_KM * 1e3,
              (ELLIPSOID_MAJOR_KM - ELLIPSOID_MINOR_KM) / ELLIPSOID_MAJOR_KM);

    double ymid = 0.5 * (ymin + ymax);
    double xmid = 0.5 * (xmin + xmax);
    double lat2 = 0.0, lon2 = 0.0, azi2 = 0.0;

    // Degrees spanned by one interval eastwards and northwards of the centre
    geod_direct(&geod, ymid, xmid, 90.0, interval, &lat2, &lon2, &azi2);
    double lon_step = std::fabs(lon2 - xmid);
    geod_direct(&geod, ymid, xmid, 0.0, interval, &lat2, &lon2, &azi2);
    double lat_step = std::fabs(lat2 - ymid);

    std::vector<double> xs = linspace(xmin, xmax, sampleCount(xmax - xmin, lon_step));
    std::vector<double> ys = linspace(ymin, ymax, sampleCount(ymax - ymin, lat_step));

    std::vector<GeoPoint> grid;
    grid.reserve(xs.size() * ys.size());
    for (double y : ys) {
        for (double x : xs) {
            grid.emplace_back(x, y);
        }
    }
    return grid;
}

} // namespace HAZCON
