#ifndef flood_roc_LabelAssembler_hpp
#define flood_roc_LabelAssembler_hpp

#include <sstream>
#include <string>
#include <vector>

namespace flood_roc {

enum Label {
    kNegative = 0,
    kPositive = 1
};

struct ScoredSample {
    ScoredSample()
        : label(kNegative)
        , score(0)
    {
    }

    ScoredSample(Label label, double score)
        : label(label)
        , score(score)
    {
    }

    Label label;
    double score;
};

/**
 * Valid scored samples of both classes. Holds at least one positive and one
 * negative sample when built by assemble().
 */
class LabeledDataset {
public:

    LabeledDataset()
        : positive_count_(0)
        , negative_count_(0)
        , dropped_positive_count_(0)
        , dropped_negative_count_(0)
    {
    }

    const std::vector<ScoredSample>& samples() const {
        return samples_;
    }

    size_t size() const {
        return samples_.size();
    }

    bool empty() const {
        return samples_.empty();
    }

    size_t positive_count() const {
        return positive_count_;
    }

    size_t negative_count() const {
        return negative_count_;
    }

    size_t dropped_positive_count() const {
        return dropped_positive_count_;
    }

    size_t dropped_negative_count() const {
        return dropped_negative_count_;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "positive_count: " << positive_count_ << "\n";
        ss << "negative_count: " << negative_count_ << "\n";
        ss << "dropped_positive_count: " << dropped_positive_count_ << "\n";
        ss << "dropped_negative_count: " << dropped_negative_count_ << "\n";
        return ss.str();
    }

private:

    friend LabeledDataset assemble(
        const std::vector<double>& positive_scores,
        const std::vector<double>& negative_scores);

    // only called by assemble() with valid scores
    void add(Label label, double score);

    void add_dropped(Label label);

    void add_scores(const std::vector<double>& scores, Label label);

    std::vector<ScoredSample> samples_;
    size_t positive_count_;
    size_t negative_count_;
    size_t dropped_positive_count_;
    size_t dropped_negative_count_;
};

/**
 * Labels the positive and negative scores and drops the missing ones.
 *
 * Throws EmptyDatasetError when both inputs are empty and
 * InsufficientDataError when one class has no valid score left.
 */
LabeledDataset assemble(
    const std::vector<double>& positive_scores,
    const std::vector<double>& negative_scores);

} /* namespace flood_roc */

#endif /* flood_roc_LabelAssembler_hpp */
