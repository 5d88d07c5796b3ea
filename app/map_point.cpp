/*---------------------------------------------------------*/
/*                                                         */
/*   map_point.cpp - Planar point + map projection         */
/*                                                         */
/*---------------------------------------------------------*/

#include "map_point.h"
#include "halfblock_errors.h"

#include <cmath>
#include <limits>
#include <string>

const char* const COORDINATE_SYSTEM_CARTESIAN = "cartesian";
const char* const COORDINATE_SYSTEM_SPHERICAL = "spherical";
const char* const PROJECTION_NONE = "none";
const char* const PROJECTION_KAVRAYSKIY_VII = "kavrayskiy-vii";

namespace {

// Tuned for the world-map raster the projection was fitted to.
const double MAP_SCALE_X = 1.42;
const double MAP_SCALE_Y = 1.25;
const double MAP_SHIFT_X = .17;
const double MAP_SHIFT_Y = .01;

const double PI = 3.14159265358979323846;

const double LATITUDE_LIMIT = 90.0;

bool truncatesTo(double v, int cell)
{
    const double lo = (double) std::numeric_limits<int>::min() - 1.0;
    const double hi = (double) std::numeric_limits<int>::max() + 1.0;
    if (!std::isfinite(v) || v <= lo || v >= hi)
        return false;
    return (int) v == cell;
}

inline double deg2rad(double d) { return d * PI / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / PI; }

} // namespace

Point projectKavrayskiyVII(double latitude, double longitude, int width, int height)
{
    double widthMap = width * MAP_SCALE_X;
    double heightMap = height * MAP_SCALE_Y;

    double xMove = -1 * widthMap * MAP_SHIFT_X;
    double yMove = -1 * heightMap * MAP_SHIFT_Y;

    double widthDegree = widthMap / 360;
    double heightDegree = heightMap / 180;

    double xMiddle = widthMap / 2 + xMove;
    double yMiddle = heightMap / 2 + yMove;

    double latRad = deg2rad(latitude);
    double lonRad = deg2rad(longitude);

    double lonProjected = rad2deg(3 * lonRad / 2 * std::sqrt(1.0 / 3 - std::pow(latRad / PI, 2)));

    return Point(std::round(xMiddle + lonProjected * widthDegree),
                 std::round(yMiddle - latitude * heightDegree));
}

Point Point::fromSpherical(double latitude, double longitude,
                           const std::string& projection,
                           std::optional<int> width,
                           std::optional<int> height)
{
    if (!width || !height)
        throw MissingDimensions("Spherical coordinates requires width and height.");

    if (projection != PROJECTION_KAVRAYSKIY_VII)
        throw UnsupportedProjection("Invalid projection \"" + projection + "\" given.");

    if (!std::isfinite(latitude) || std::fabs(latitude) > LATITUDE_LIMIT)
        throw UnsupportedProjection("Latitude " + std::to_string(latitude) + " is outside [-90, 90].");

    Point p = projectKavrayskiyVII(latitude, longitude, *width, *height);
    if (!std::isfinite(p.getX()) || !std::isfinite(p.getY()))
        throw UnsupportedProjection("Unable to project (" + std::to_string(latitude) + ", " +
                                    std::to_string(longitude) + ").");
    return p;
}

bool Point::hits(int cellX, int cellY) const
{
    return truncatesTo(x, cellX) && truncatesTo(y, cellY);
}

Point Point::make(double a, double b,
                  const std::string& coordinateSystem,
                  const std::string& projection,
                  std::optional<int> width,
                  std::optional<int> height)
{
    if (coordinateSystem == COORDINATE_SYSTEM_CARTESIAN)
        return Point(a, b);
    if (coordinateSystem == COORDINATE_SYSTEM_SPHERICAL)
        return fromSpherical(a, b, projection, width, height);

    throw UnsupportedProjection("Invalid coordinate system \"" + coordinateSystem + "\".");
}
