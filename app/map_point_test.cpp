/*---------------------------------------------------------*/
/*   map_point_test.cpp - ctest for Point + projection     */
/*---------------------------------------------------------*/

#include "map_point.h"
#include "halfblock_errors.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

template <typename E, typename F>
static bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
    return false;
}

int main() {
    std::cout << "=== Point / Projection Tests ===\n\n";

    std::cout << "[cartesian]\n";
    {
        Point p(12.7, 3.2);
        check("x kept as float", p.getX() == 12.7);
        check("hits truncated cell", p.hits(12, 3));
        check("does not hit rounded cell", !p.hits(13, 3));

        Point q = Point::make(4.0, 5.0, COORDINATE_SYSTEM_CARTESIAN);
        check("make cartesian", q.getX() == 4.0 && q.getY() == 5.0);

        q.setX(9.5).setY(1.5);
        check("setters chain", q.getX() == 9.5 && q.getY() == 1.5);
    }

    std::cout << "\n[kavrayskiy-vii on an 80x40 raster]\n";
    {
        Point ny = Point::fromSpherical(40.71, -74.01, PROJECTION_KAVRAYSKIY_VII, 80, 40);
        check("New York x", ny.getX() == 19.0);
        check("New York y", ny.getY() == 13.0);

        Point oslo = Point::fromSpherical(59.91, 10.75, PROJECTION_KAVRAYSKIY_VII, 80, 40);
        check("Oslo x", oslo.getX() == 40.0);
        check("Oslo y", oslo.getY() == 8.0);

        // y = 24.5 exactly: rounds half away from zero.
        Point origin = Point::fromSpherical(0.0, 0.0, PROJECTION_KAVRAYSKIY_VII, 80, 40);
        check("origin x", origin.getX() == 37.0);
        check("origin y", origin.getY() == 25.0);

        Point viaMake = Point::make(0.0, 0.0, COORDINATE_SYSTEM_SPHERICAL, PROJECTION_KAVRAYSKIY_VII, 80, 40);
        check("make spherical == fromSpherical",
              viaMake.getX() == origin.getX() && viaMake.getY() == origin.getY());

        Point direct = projectKavrayskiyVII(40.71, -74.01, 80, 40);
        check("free function matches", direct.getX() == ny.getX() && direct.getY() == ny.getY());
    }

    std::cout << "\n[cells out of reach]\n";
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        check("NaN hits nothing", !Point(nan, 0).hits(0, 0));
        check("infinity hits nothing", !Point(0, inf).hits(0, 0));
        check("1e20 hits nothing", !Point(1e20, 0).hits(0, 0));
        check("below int range hits nothing", !Point(-3e9, 0).hits(0, 0));
        check("int max still hits",
              Point(2147483647.5, 0).hits(std::numeric_limits<int>::max(), 0));
        check("negative truncates toward zero", Point(-0.5, 0).hits(0, 0));
    }

    std::cout << "\n[errors]\n";
    {
        check("unknown projection throws UnsupportedProjection",
              throws<UnsupportedProjection>([] { Point::fromSpherical(1, 2, "mercator", 80, 40); }));
        check("no projection for spherical throws UnsupportedProjection",
              throws<UnsupportedProjection>([] {
                  Point::make(1, 2, COORDINATE_SYSTEM_SPHERICAL, PROJECTION_NONE, 80, 40);
              }));
        check("missing width throws MissingDimensions",
              throws<MissingDimensions>([] {
                  Point::fromSpherical(1, 2, PROJECTION_KAVRAYSKIY_VII, std::nullopt, 40);
              }));
        check("missing height throws MissingDimensions",
              throws<MissingDimensions>([] {
                  Point::make(1, 2, COORDINATE_SYSTEM_SPHERICAL, PROJECTION_KAVRAYSKIY_VII);
              }));
        check("latitude 120 throws UnsupportedProjection",
              throws<UnsupportedProjection>([] {
                  Point::fromSpherical(120, 10, PROJECTION_KAVRAYSKIY_VII, 80, 40);
              }));
        check("latitude -90.5 throws UnsupportedProjection",
              throws<UnsupportedProjection>([] {
                  Point::fromSpherical(-90.5, 0, PROJECTION_KAVRAYSKIY_VII, 80, 40);
              }));
        check("infinite longitude throws UnsupportedProjection",
              throws<UnsupportedProjection>([] {
                  Point::fromSpherical(0, std::numeric_limits<double>::infinity(),
                                       PROJECTION_KAVRAYSKIY_VII, 80, 40);
              }));
        Point pole = Point::fromSpherical(90, 180, PROJECTION_KAVRAYSKIY_VII, 80, 40);
        check("poles still project", std::isfinite(pole.getX()) && std::isfinite(pole.getY()));
        check("unknown coordinate system throws",
              throws<UnsupportedProjection>([] { Point::make(1, 2, "polar"); }));
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures == 0 ? 0 : 1;
}
