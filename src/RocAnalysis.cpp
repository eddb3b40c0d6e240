#include <cmath>
#include <sstream>
#include "flood_roc/Errors.hpp"
#include "flood_roc/RocAnalysis.hpp"
#include "flood_roc/Score.hpp"
#include "Common.hpp"

namespace flood_roc {

namespace {

void validate_coordinates(const RasterProvider& raster, const PointSet& point_set, const std::string& class_name) {
    if (!same_crs(raster.crs(), point_set.crs)) {
        throw CoordinateMismatchError("the " + class_name + " points are in " + point_set.crs +
                                      " but the raster is in " + raster.crs());
    }

    for (size_t i = 0; i < point_set.points.size(); i++) {
        const Point& point = point_set.points[i];
        if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
            std::stringstream ss;
            ss << "the " << class_name << " point " << i << " has non-finite coordinates ("
               << point.x << ", " << point.y << ")";
            throw CoordinateMismatchError(ss.str());
        }
    }
}

std::vector<double> sample_points(const RasterProvider& raster, const PointSet& point_set, const std::string& class_name) {
    std::vector<double> scores = raster.sample(point_set.points);

    if (scores.size() != point_set.points.size()) {
        std::stringstream ss;
        ss << "the raster returned " << scores.size() << " values for "
           << point_set.points.size() << " " << class_name << " points";
        throw Error(ss.str());
    }

    if (scores.empty()) return scores;

    for (size_t i = 0; i < scores.size(); i++) {
        if (!is_missing(scores[i])) return scores;
    }

    std::stringstream ss;
    ss << "all " << scores.size() << " " << class_name << " points fall on no-data or outside the raster";
    throw NoDataFoundError(ss.str());
}

} /* namespace */

bool same_crs(const std::string& a, const std::string& b) {
    std::string lhs = common::to_lower(common::trim(a));
    std::string rhs = common::to_lower(common::trim(b));
    if (lhs.empty() || rhs.empty()) return true;
    return lhs == rhs;
}

RocAnalysisResult compute_roc_auc(
    const RasterProvider* raster,
    const PointSet* positive_points,
    const PointSet* negative_points,
    const RocOptions& options)
{
    if (!raster) {
        throw MissingInputError("the susceptibility raster was not supplied");
    }

    if (!positive_points) {
        throw MissingInputError("the flood points were not supplied");
    }

    if (!negative_points) {
        throw MissingInputError("the non-flood points were not supplied");
    }

    validate_coordinates(*raster, *positive_points, "flood");
    validate_coordinates(*raster, *negative_points, "non-flood");

    std::vector<double> positive_scores = sample_points(*raster, *positive_points, "flood");
    std::vector<double> negative_scores = sample_points(*raster, *negative_points, "non-flood");

    LabeledDataset dataset = assemble(positive_scores, negative_scores);
    ROC roc = compute_roc(dataset, options);

    return RocAnalysisResult(roc, dataset, mann_whitney_auc(dataset));
}

} /* namespace flood_roc */
