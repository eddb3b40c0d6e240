#ifndef flood_roc_RocAnalysis_hpp
#define flood_roc_RocAnalysis_hpp

#include <string>
#include "flood_roc/LabelAssembler.hpp"
#include "flood_roc/Point.hpp"
#include "flood_roc/Raster.hpp"
#include "flood_roc/ROC.hpp"

namespace flood_roc {

struct RocAnalysisResult {
    RocAnalysisResult(
        const ROC& roc,
        const LabeledDataset& dataset,
        double mann_whitney_auc)
        : roc(roc)
        , dataset(dataset)
        , mann_whitney_auc(mann_whitney_auc)
    {
    }

    double auc() const {
        return roc.auc();
    }

    ROC roc;
    LabeledDataset dataset;
    double mann_whitney_auc;
};

/**
 * Samples the raster at the flood (positive) and non-flood (negative) points
 * and computes the ROC curve of the raster scores.
 *
 * Throws MissingInputError when an argument is NULL, CoordinateMismatchError
 * when a point set declares another CRS than the raster or holds non-finite
 * coordinates, NoDataFoundError when every point of a non-empty class samples
 * no data, and the assemble() errors otherwise.
 */
RocAnalysisResult compute_roc_auc(
    const RasterProvider* raster,
    const PointSet* positive_points,
    const PointSet* negative_points,
    const RocOptions& options = RocOptions());

// true when both identifiers name the same CRS or one of them is undeclared
bool same_crs(const std::string& a, const std::string& b);

} /* namespace flood_roc */

#endif /* flood_roc_RocAnalysis_hpp */
