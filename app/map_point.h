/*---------------------------------------------------------*/
/*                                                         */
/*   map_point.h - Planar point + map projection           */
/*                                                         */
/*   A Point lives in (resized) image pixel space. It is   */
/*   built either directly or from latitude/longitude via  */
/*   the Kavrayskiy VII projection, scaled for a world-map  */
/*   raster of the given width/height.                     */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef MAP_POINT_H
#define MAP_POINT_H

#include <optional>
#include <string>

extern const char* const COORDINATE_SYSTEM_CARTESIAN;   // "cartesian"
extern const char* const COORDINATE_SYSTEM_SPHERICAL;   // "spherical"
extern const char* const PROJECTION_NONE;               // "none"
extern const char* const PROJECTION_KAVRAYSKIY_VII;     // "kavrayskiy-vii"

class Point {
public:
    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    // Generic constructor mirroring the coordinate-system selector:
    // cartesian uses (a,b) as (x,y); spherical treats them as (lat,lon).
    static Point make(double a, double b,
                      const std::string& coordinateSystem,
                      const std::string& projection = PROJECTION_NONE,
                      std::optional<int> width = std::nullopt,
                      std::optional<int> height = std::nullopt);

    // Throws MissingDimensions without width/height and
    // UnsupportedProjection for unknown projection names, latitudes
    // outside [-90, 90] and non-finite results.
    static Point fromSpherical(double latitude, double longitude,
                               const std::string& projection,
                               std::optional<int> width,
                               std::optional<int> height);

    double getX() const { return x; }
    double getY() const { return y; }
    Point& setX(double v) { x = v; return *this; }
    Point& setY(double v) { y = v; return *this; }

    // Cell coordinates are compared after truncation toward zero.
    // A non-finite coordinate, or one outside the int range, hits no cell.
    bool hits(int cellX, int cellY) const;

private:
    double x = 0;
    double y = 0;
};

// https://en.wikipedia.org/wiki/Kavrayskiy_VII_projection
Point projectKavrayskiyVII(double latitude, double longitude, int width, int height);

#endif // MAP_POINT_H
