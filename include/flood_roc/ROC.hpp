#ifndef flood_roc_ROC_hpp
#define flood_roc_ROC_hpp

#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "flood_roc/LabelAssembler.hpp"

namespace flood_roc
{

struct RocPoint {
    RocPoint()
        : threshold(0)
        , false_positive_rate(0)
        , true_positive_rate(0)
        , true_positive(0)
        , false_positive(0)
    {
    }

    RocPoint(double threshold, double false_positive_rate, double true_positive_rate,
             size_t true_positive, size_t false_positive)
        : threshold(threshold)
        , false_positive_rate(false_positive_rate)
        , true_positive_rate(true_positive_rate)
        , true_positive(true_positive)
        , false_positive(false_positive)
    {
    }

    double threshold;
    double false_positive_rate;
    double true_positive_rate;

    // samples scored at or above the threshold
    size_t true_positive;
    size_t false_positive;
};

struct RocOptions {
    RocOptions()
        : drop_intermediate(false)
    {
    }

    std::string to_string() const
    {
        std::stringstream ss;
        ss << "drop_intermediate: " << drop_intermediate << "\n";
        return ss.str();
    }

    // drop thresholds lying on a straight segment of the curve
    bool drop_intermediate;
};

/**
 * ROC curve of a labeled dataset.
 *
 * Thresholds are the distinct observed scores from the highest to the lowest,
 * so samples sharing a score always move the curve together. The curve starts
 * at (+inf, 0, 0) and ends at (1, 1); the area is integrated with the
 * trapezoidal rule.
 */
class ROC
{

public:
    ROC(const LabeledDataset& dataset, const RocOptions& options = RocOptions());
    ~ROC();

    const std::vector<RocPoint>& points() const {
        return points_;
    }

    size_t size() const {
        return points_.size();
    }

    double auc() const {
        return auc_;
    }

    size_t positive_count() const {
        return positive_count_;
    }

    size_t negative_count() const {
        return negative_count_;
    }

    std::vector<double> thresholds() const;

    std::vector<double> false_positive_rates() const;

    std::vector<double> true_positive_rates() const;

    // (fpr, tpr) pairs in curve order
    std::vector<std::pair<double, double> > curve() const;

private:

    void Calculate(const LabeledDataset& dataset);

    void DropIntermediate(
        std::vector<double>& thresholds,
        std::vector<size_t>& true_positives,
        std::vector<size_t>& false_positives) const;

    RocOptions options_;
    std::vector<RocPoint> points_;
    size_t positive_count_;
    size_t negative_count_;
    double auc_;
};

ROC compute_roc(const LabeledDataset& dataset, const RocOptions& options = RocOptions());

// area under the polyline (x[i], y[i]), x non-decreasing
double trapezoid_area(const std::vector<double>& x, const std::vector<double>& y);

// probability that a positive outscores a negative, ties counting one half
double mann_whitney_auc(const LabeledDataset& dataset);

} // namespace flood_roc

#endif
