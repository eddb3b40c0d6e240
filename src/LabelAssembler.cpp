#include "flood_roc/Errors.hpp"
#include "flood_roc/LabelAssembler.hpp"
#include "flood_roc/Score.hpp"

namespace flood_roc {

void LabeledDataset::add(Label label, double score) {
    samples_.push_back(ScoredSample(label, score));
    if (label == kPositive) positive_count_++; else negative_count_++;
}

void LabeledDataset::add_dropped(Label label) {
    if (label == kPositive) dropped_positive_count_++; else dropped_negative_count_++;
}

void LabeledDataset::add_scores(const std::vector<double>& scores, Label label) {
    for (size_t i = 0; i < scores.size(); i++) {
        if (is_missing(scores[i])) {
            add_dropped(label);
            continue;
        }
        add(label, scores[i]);
    }
}

LabeledDataset assemble(
    const std::vector<double>& positive_scores,
    const std::vector<double>& negative_scores)
{
    if (positive_scores.empty() && negative_scores.empty()) {
        throw EmptyDatasetError("both the flood and the non-flood score sets are empty");
    }

    LabeledDataset dataset;
    dataset.add_scores(positive_scores, kPositive);
    dataset.add_scores(negative_scores, kNegative);

    if (dataset.positive_count() == 0) {
        std::stringstream ss;
        ss << "no valid flood score (" << positive_scores.size() << " given, "
           << dataset.dropped_positive_count() << " missing), the ROC curve is undefined";
        throw InsufficientDataError(ss.str());
    }

    if (dataset.negative_count() == 0) {
        std::stringstream ss;
        ss << "no valid non-flood score (" << negative_scores.size() << " given, "
           << dataset.dropped_negative_count() << " missing), the ROC curve is undefined";
        throw InsufficientDataError(ss.str());
    }

    return dataset;
}

} /* namespace flood_roc */
