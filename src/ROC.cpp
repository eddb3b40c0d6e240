#include <cassert>
#include <limits>
#include "flood_roc/Errors.hpp"
#include "flood_roc/ROC.hpp"
#include "Common.hpp"

namespace flood_roc
{

ROC::ROC(const LabeledDataset& dataset, const RocOptions& options)
    : options_(options)
    , positive_count_(dataset.positive_count())
    , negative_count_(dataset.negative_count())
    , auc_(0)
{
    Calculate(dataset);
}

ROC::~ROC()
{
}

void ROC::Calculate(const LabeledDataset& dataset)
{
    if (positive_count_ == 0 || negative_count_ == 0) {
        throw InsufficientDataError("the ROC curve needs at least one positive and one negative sample");
    }

    const std::vector<ScoredSample>& samples = dataset.samples();

    std::vector<double> scores(samples.size());
    for (size_t i = 0; i < samples.size(); i++) scores[i] = samples[i].score;

    std::vector<size_t> indices = common::descending_indices(scores);

    // cumulative counts at each distinct score
    std::vector<double> thresholds;
    std::vector<size_t> true_positives;
    std::vector<size_t> false_positives;

    size_t tp = 0;
    size_t fp = 0;
    for (size_t i = 0; i < indices.size(); i++) {
        if (samples[indices[i]].label == kPositive) tp++; else fp++;

        if (i < indices.size()-1 && scores[indices[i+1]] == scores[indices[i]]) continue;

        thresholds.push_back(scores[indices[i]]);
        true_positives.push_back(tp);
        false_positives.push_back(fp);
    }

    assert(tp == positive_count_ && fp == negative_count_);

    if (options_.drop_intermediate) {
        DropIntermediate(thresholds, true_positives, false_positives);
    }

    double P = static_cast<double>(positive_count_);
    double N = static_cast<double>(negative_count_);

    points_.clear();
    points_.push_back(RocPoint(std::numeric_limits<double>::infinity(), 0, 0, 0, 0));

    for (size_t i = 0; i < thresholds.size(); i++) {
        points_.push_back(RocPoint(
            thresholds[i],
            false_positives[i] / N,
            true_positives[i] / P,
            true_positives[i],
            false_positives[i]));
    }

    const RocPoint& last = points_.back();
    if (last.true_positive != positive_count_ || last.false_positive != negative_count_) {
        points_.push_back(RocPoint(-std::numeric_limits<double>::infinity(), 1, 1, positive_count_, negative_count_));
    }

    auc_ = trapezoid_area(false_positive_rates(), true_positive_rates());
}

void ROC::DropIntermediate(
    std::vector<double>& thresholds,
    std::vector<size_t>& true_positives,
    std::vector<size_t>& false_positives) const
{
    if (thresholds.size() <= 2) return;

    std::vector<double> kept_thresholds;
    std::vector<size_t> kept_true_positives;
    std::vector<size_t> kept_false_positives;

    for (size_t i = 0; i < thresholds.size(); i++) {
        bool keep = (i == 0 || i == thresholds.size()-1);

        if (!keep) {
            // second differences of the counts, zero on a straight segment
            long fp_turn = static_cast<long>(false_positives[i+1]) - 2 * static_cast<long>(false_positives[i]) + static_cast<long>(false_positives[i-1]);
            long tp_turn = static_cast<long>(true_positives[i+1]) - 2 * static_cast<long>(true_positives[i]) + static_cast<long>(true_positives[i-1]);
            keep = (fp_turn != 0 || tp_turn != 0);
        }

        if (keep) {
            kept_thresholds.push_back(thresholds[i]);
            kept_true_positives.push_back(true_positives[i]);
            kept_false_positives.push_back(false_positives[i]);
        }
    }

    thresholds.swap(kept_thresholds);
    true_positives.swap(kept_true_positives);
    false_positives.swap(kept_false_positives);
}

std::vector<double> ROC::thresholds() const
{
    std::vector<double> values(points_.size());
    for (size_t i = 0; i < points_.size(); i++) values[i] = points_[i].threshold;
    return values;
}

std::vector<double> ROC::false_positive_rates() const
{
    std::vector<double> values(points_.size());
    for (size_t i = 0; i < points_.size(); i++) values[i] = points_[i].false_positive_rate;
    return values;
}

std::vector<double> ROC::true_positive_rates() const
{
    std::vector<double> values(points_.size());
    for (size_t i = 0; i < points_.size(); i++) values[i] = points_[i].true_positive_rate;
    return values;
}

std::vector<std::pair<double, double> > ROC::curve() const
{
    std::vector<std::pair<double, double> > values(points_.size());
    for (size_t i = 0; i < points_.size(); i++) {
        values[i] = std::make_pair(points_[i].false_positive_rate, points_[i].true_positive_rate);
    }
    return values;
}

ROC compute_roc(const LabeledDataset& dataset, const RocOptions& options)
{
    return ROC(dataset, options);
}

double trapezoid_area(const std::vector<double>& x, const std::vector<double>& y)
{
    assert(x.size() == y.size());

    double area = 0;
    for (size_t i = 1; i < x.size(); i++) {
        area += (x[i] - x[i-1]) * (y[i] + y[i-1]) * 0.5;
    }
    return area;
}

double mann_whitney_auc(const LabeledDataset& dataset)
{
    size_t positive_count = dataset.positive_count();
    size_t negative_count = dataset.negative_count();

    if (positive_count == 0 || negative_count == 0) {
        throw InsufficientDataError("the Mann-Whitney statistic needs at least one positive and one negative sample");
    }

    const std::vector<ScoredSample>& samples = dataset.samples();

    std::vector<double> scores(samples.size());
    for (size_t i = 0; i < samples.size(); i++) scores[i] = samples[i].score;

    std::vector<size_t> indices(scores.size());
    for (size_t i = 0; i < indices.size(); i++) indices[i]=i;
    std::sort(indices.begin(), indices.end(), common::IndexComparator<double>(scores));

    // sum of the positive ranks, tied scores share their mid rank
    double positive_rank_sum = 0;
    size_t first = 0;
    while (first < indices.size()) {
        size_t last = first;
        while (last+1 < indices.size() && scores[indices[last+1]] == scores[indices[first]]) last++;

        double mid_rank = 0.5 * (first + last) + 1.0;
        for (size_t k = first; k <= last; k++) {
            if (samples[indices[k]].label == kPositive) positive_rank_sum += mid_rank;
        }

        first = last+1;
    }

    double P = static_cast<double>(positive_count);
    double N = static_cast<double>(negative_count);
    double u = positive_rank_sum - P * (P + 1) * 0.5;
    return u / (P * N);
}

} // namespace flood_roc
