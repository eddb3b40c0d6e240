#include <algorithm>
#include <cmath>
#include <sstream>
#include "flood_roc/Errors.hpp"
#include "flood_roc/Raster.hpp"
#include "flood_roc/Score.hpp"

namespace flood_roc {

GeoTransform GeoTransform::from_world_file(const std::vector<double>& lines) {
    if (lines.size() != 6) {
        std::stringstream ss;
        ss << "a world file has 6 coefficients, got " << lines.size();
        throw RasterFormatError(ss.str());
    }

    double a = lines[0];
    double d = lines[1];
    double b = lines[2];
    double e = lines[3];
    double c = lines[4];
    double f = lines[5];

    // world files refer to the center of the upper left cell
    return GeoTransform(c - 0.5 * a - 0.5 * b, a, b, f - 0.5 * d - 0.5 * e, d, e);
}

bool GeoTransform::invertible() const {
    if (!std::isfinite(x0) || !std::isfinite(dx) || !std::isfinite(rx) ||
        !std::isfinite(y0) || !std::isfinite(ry) || !std::isfinite(dy)) {
        return false;
    }

    double det = determinant();
    return std::isfinite(det) && det != 0;
}

void GeoTransform::world_to_pixel(double x, double y, double& col, double& row) const {
    double det = determinant();
    double u = x - x0;
    double v = y - y0;
    col = (dy * u - rx * v) / det;
    row = (dx * v - ry * u) / det;
}

std::string GeoTransform::to_string() const {
    std::stringstream ss;
    ss.precision(12);
    ss << "[" << x0 << ", " << dx << ", " << rx << ", " << y0 << ", " << ry << ", " << dy << "]";
    return ss.str();
}

Raster::Raster()
    : nodata_(0)
    , has_nodata_(false)
{
}

Raster::Raster(const cv::Mat& values, const GeoTransform& transform, const std::string& crs)
    : transform_(transform)
    , crs_(crs)
    , nodata_(0)
    , has_nodata_(false)
{
    if (values.empty()) {
        throw MissingInputError("the raster has no cells");
    }

    if (!transform_.invertible()) {
        throw RasterFormatError("the raster geotransform " + transform_.to_string() + " is not invertible");
    }

    cv::Mat band = values;
    if (values.channels() > 1) {
        cv::extractChannel(values, band, 0);
    }

    band.convertTo(values_, CV_64F);
}

Raster::~Raster()
{
}

bool Raster::is_nodata(double value) const {
    if (!has_nodata_) return false;
    if (value == nodata_) return true;

    // float rasters carry the no-data value rounded to single precision
    return static_cast<float>(value) == static_cast<float>(nodata_);
}

bool Raster::cell_index(const Point& point, int& row, int& col) const {
    if (values_.empty()) return false;
    if (!std::isfinite(point.x) || !std::isfinite(point.y)) return false;

    double fcol, frow;
    transform_.world_to_pixel(point.x, point.y, fcol, frow);

    fcol = std::floor(fcol);
    frow = std::floor(frow);

    // NaN indices fail every comparison
    if (!(fcol >= 0 && fcol < values_.cols && frow >= 0 && frow < values_.rows)) {
        return false;
    }

    col = static_cast<int>(fcol);
    row = static_cast<int>(frow);
    return true;
}

double Raster::value_at(const Point& point) const {
    int row, col;
    if (!cell_index(point, row, col)) return missing_score();

    double value = values_.at<double>(row, col);
    if (is_missing(value) || is_nodata(value)) return missing_score();
    return value;
}

std::vector<double> Raster::sample(const std::vector<Point>& points) const {
    std::vector<double> scores(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        scores[i] = value_at(points[i]);
    }
    return scores;
}

void Raster::bounds(double& min_x, double& min_y, double& max_x, double& max_y) const {
    double corners[4][2] = {
        { 0, 0 },
        { static_cast<double>(values_.cols), 0 },
        { 0, static_cast<double>(values_.rows) },
        { static_cast<double>(values_.cols), static_cast<double>(values_.rows) }
    };

    double x, y;
    transform_.pixel_to_world(corners[0][0], corners[0][1], x, y);
    min_x = max_x = x;
    min_y = max_y = y;

    for (size_t i = 1; i < 4; i++) {
        transform_.pixel_to_world(corners[i][0], corners[i][1], x, y);
        min_x = std::min(min_x, x);
        max_x = std::max(max_x, x);
        min_y = std::min(min_y, y);
        max_y = std::max(max_y, y);
    }
}

std::string Raster::to_string() const {
    std::stringstream ss;
    ss << "crs: " << ((crs_.empty()) ? "undeclared" : crs_) << "\n";
    ss << "size: " << cols() << "x" << rows() << "\n";
    ss << "geotransform: " << transform_.to_string() << "\n";
    ss << "nodata: ";
    if (has_nodata_) ss << nodata_; else ss << "none";
    ss << "\n";

    if (!values_.empty()) {
        double min_x, min_y, max_x, max_y;
        bounds(min_x, min_y, max_x, max_y);
        ss.precision(12);
        ss << "bounds: [" << min_x << ", " << min_y << ", " << max_x << ", " << max_y << "]\n";
    }

    return ss.str();
}

} /* namespace flood_roc */
