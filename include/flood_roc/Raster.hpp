#ifndef flood_roc_Raster_hpp
#define flood_roc_Raster_hpp

#include <string>
#include <vector>
#include <opencv2/core/core.hpp>
#include "flood_roc/Point.hpp"

namespace flood_roc {

/**
 * Affine pixel to world transform, same coefficient order as a GDAL
 * geotransform:
 *
 *   x = x0 + col * dx + row * rx
 *   y = y0 + col * ry + row * dy
 *
 * (x0, y0) is the outer corner of the upper left cell.
 */
struct GeoTransform {
    GeoTransform()
        : x0(0)
        , dx(1)
        , rx(0)
        , y0(0)
        , ry(0)
        , dy(-1)
    {
    }

    GeoTransform(double x0, double dx, double rx, double y0, double ry, double dy)
        : x0(x0)
        , dx(dx)
        , rx(rx)
        , y0(y0)
        , ry(ry)
        , dy(dy)
    {
    }

    // north-up grid whose upper left corner is (x0, y0)
    static GeoTransform north_up(double x0, double y0, double cell_width, double cell_height) {
        return GeoTransform(x0, cell_width, 0, y0, 0, -cell_height);
    }

    // from the six lines of an ESRI world file (A, D, B, E, C, F)
    static GeoTransform from_world_file(const std::vector<double>& lines);

    double determinant() const {
        return dx * dy - rx * ry;
    }

    bool invertible() const;

    void pixel_to_world(double col, double row, double& x, double& y) const {
        x = x0 + col * dx + row * rx;
        y = y0 + col * ry + row * dy;
    }

    // fractional pixel position of a world coordinate
    void world_to_pixel(double x, double y, double& col, double& row) const;

    std::string to_string() const;

    double x0;
    double dx;
    double rx;
    double y0;
    double ry;
    double dy;
};

/**
 * Source of susceptibility scores. Implementations map every point to the
 * value of the grid cell that contains it, or to missing_score() when the
 * point is outside the grid or the cell holds no data.
 */
class RasterProvider {
public:
    virtual ~RasterProvider() {}

    virtual std::string crs() const = 0;

    // one score per point, same order
    virtual std::vector<double> sample(const std::vector<Point>& points) const = 0;
};

class Raster : public RasterProvider {
public:

    Raster();

    Raster(const cv::Mat& values, const GeoTransform& transform, const std::string& crs);

    virtual ~Raster();

    std::string crs() const {
        return crs_;
    }

    void set_crs(const std::string& crs) {
        crs_ = crs;
    }

    const GeoTransform& transform() const {
        return transform_;
    }

    const cv::Mat& values() const {
        return values_;
    }

    int rows() const {
        return values_.rows;
    }

    int cols() const {
        return values_.cols;
    }

    bool empty() const {
        return values_.empty();
    }

    bool has_nodata() const {
        return has_nodata_;
    }

    double nodata() const {
        return nodata_;
    }

    void set_nodata(double nodata) {
        nodata_ = nodata;
        has_nodata_ = true;
    }

    void clear_nodata() {
        has_nodata_ = false;
    }

    std::vector<double> sample(const std::vector<Point>& points) const;

    double value_at(const Point& point) const;

    // grid cell containing the point, false when outside the grid
    bool cell_index(const Point& point, int& row, int& col) const;

    // world extent of the grid
    void bounds(double& min_x, double& min_y, double& max_x, double& max_y) const;

    std::string to_string() const;

private:

    bool is_nodata(double value) const;

    cv::Mat values_;
    GeoTransform transform_;
    std::string crs_;
    double nodata_;
    bool has_nodata_;
};

} /* namespace flood_roc */

#endif /* flood_roc_Raster_hpp */
