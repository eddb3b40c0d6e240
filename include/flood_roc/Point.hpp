#ifndef flood_roc_Point_hpp
#define flood_roc_Point_hpp

#include <sstream>
#include <string>
#include <vector>

namespace flood_roc {

struct Point {
    Point()
        : x(0)
        , y(0)
    {
    }

    Point(double x, double y)
        : x(x)
        , y(y)
    {
    }

    double x;
    double y;
};

/**
 * Observation points of one class, already expressed in the raster
 * coordinate reference system. An empty crs means the provider did not
 * declare one.
 */
struct PointSet {
    PointSet()
    {
    }

    PointSet(const std::vector<Point>& points, const std::string& crs = "")
        : points(points)
        , crs(crs)
    {
    }

    size_t size() const {
        return points.size();
    }

    bool empty() const {
        return points.empty();
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "crs: " << ((crs.empty()) ? "undeclared" : crs) << "\n";
        ss << "points: " << points.size() << "\n";
        return ss.str();
    }

    std::vector<Point> points;
    std::string crs;
};

} /* namespace flood_roc */

#endif /* flood_roc_Point_hpp */
