#define BOOST_TEST_MODULE test_ROC
#include <boost/test/unit_test.hpp>
#include <cmath>
#include <limits>

#include "flood_roc/Errors.hpp"
#include "flood_roc/LabelAssembler.hpp"
#include "flood_roc/ROC.hpp"

using namespace flood_roc;

namespace {

LabeledDataset make_dataset(const double* positive, size_t positive_count, const double* negative, size_t negative_count) {
    return assemble(
        std::vector<double>(positive, positive + positive_count),
        std::vector<double>(negative, negative + negative_count));
}

// pair counting definition of the area
double pair_count_auc(const LabeledDataset& dataset) {
    const std::vector<ScoredSample>& samples = dataset.samples();
    double concordant = 0;
    for (size_t i = 0; i < samples.size(); i++) {
        if (samples[i].label != kPositive) continue;
        for (size_t j = 0; j < samples.size(); j++) {
            if (samples[j].label != kNegative) continue;
            if (samples[i].score > samples[j].score) concordant += 1;
            else if (samples[i].score == samples[j].score) concordant += 0.5;
        }
    }
    return concordant / (dataset.positive_count() * dataset.negative_count());
}

// scores quantized to a few levels so the classes share ties
LabeledDataset random_dataset(unsigned int seed, size_t positive_count, size_t negative_count) {
    unsigned int state = seed;
    std::vector<double> positive(positive_count);
    std::vector<double> negative(negative_count);

    for (size_t i = 0; i < positive_count; i++) {
        state = state * 1103515245u + 12345u;
        positive[i] = ((state >> 16) % 20 + 2) / 20.0;
    }

    for (size_t i = 0; i < negative_count; i++) {
        state = state * 1103515245u + 12345u;
        negative[i] = ((state >> 16) % 20) / 20.0;
    }

    return assemble(positive, negative);
}

void check_curve_shape(const ROC& roc) {
    const std::vector<RocPoint>& points = roc.points();
    BOOST_REQUIRE(points.size() >= 2);

    BOOST_CHECK(std::isinf(points.front().threshold) && points.front().threshold > 0);
    BOOST_CHECK_EQUAL(points.front().false_positive_rate, 0.0);
    BOOST_CHECK_EQUAL(points.front().true_positive_rate, 0.0);
    BOOST_CHECK_EQUAL(points.back().false_positive_rate, 1.0);
    BOOST_CHECK_EQUAL(points.back().true_positive_rate, 1.0);

    for (size_t i = 1; i < points.size(); i++) {
        BOOST_CHECK(points[i].threshold < points[i-1].threshold);
        BOOST_CHECK(points[i].false_positive_rate >= points[i-1].false_positive_rate);
        BOOST_CHECK(points[i].true_positive_rate >= points[i-1].true_positive_rate);
        BOOST_CHECK(points[i].false_positive_rate >= 0 && points[i].false_positive_rate <= 1);
        BOOST_CHECK(points[i].true_positive_rate >= 0 && points[i].true_positive_rate <= 1);
    }

    BOOST_CHECK(roc.auc() >= 0 && roc.auc() <= 1);
}

} /* namespace */

BOOST_AUTO_TEST_CASE(flood_and_non_flood_scores)
{
    const double positive[] = { 0.9, 0.7, 0.4 };
    const double negative[] = { 0.6, 0.3, 0.1 };
    LabeledDataset dataset = make_dataset(positive, 3, negative, 3);

    ROC roc(dataset);

    const double expected[][3] = {
        { std::numeric_limits<double>::infinity(), 0, 0 },
        { 0.9, 0, 1.0 / 3 },
        { 0.7, 0, 2.0 / 3 },
        { 0.6, 1.0 / 3, 2.0 / 3 },
        { 0.4, 1.0 / 3, 1 },
        { 0.3, 2.0 / 3, 1 },
        { 0.1, 1, 1 }
    };

    BOOST_REQUIRE_EQUAL(roc.size(), 7u);
    for (size_t i = 0; i < roc.size(); i++) {
        BOOST_CHECK_EQUAL(roc.points()[i].threshold, expected[i][0]);
        BOOST_CHECK_CLOSE(roc.points()[i].false_positive_rate + 1, expected[i][1] + 1, 1e-9);
        BOOST_CHECK_CLOSE(roc.points()[i].true_positive_rate + 1, expected[i][2] + 1, 1e-9);
    }

    BOOST_CHECK_SMALL(roc.auc() - 8.0 / 9.0, 1e-12);
    BOOST_CHECK_SMALL(mann_whitney_auc(dataset) - 8.0 / 9.0, 1e-12);
    BOOST_CHECK_EQUAL(roc.positive_count(), 3u);
    BOOST_CHECK_EQUAL(roc.negative_count(), 3u);
    check_curve_shape(roc);
}

BOOST_AUTO_TEST_CASE(single_tied_pair)
{
    const double positive[] = { 0.5 };
    const double negative[] = { 0.5 };

    ROC roc = compute_roc(make_dataset(positive, 1, negative, 1));

    BOOST_CHECK_EQUAL(roc.size(), 2u);
    BOOST_CHECK_SMALL(roc.auc() - 0.5, 1e-12);
    check_curve_shape(roc);
}

BOOST_AUTO_TEST_CASE(tie_groups_share_one_point)
{
    const double positive[] = { 0.5, 0.5 };
    const double negative[] = { 0.5, 0.2 };

    ROC roc(make_dataset(positive, 2, negative, 2));

    BOOST_REQUIRE_EQUAL(roc.size(), 3u);
    BOOST_CHECK_EQUAL(roc.points()[1].threshold, 0.5);
    BOOST_CHECK_EQUAL(roc.points()[1].true_positive, 2u);
    BOOST_CHECK_EQUAL(roc.points()[1].false_positive, 1u);
    BOOST_CHECK_EQUAL(roc.points()[1].false_positive_rate, 0.5);
    BOOST_CHECK_EQUAL(roc.points()[1].true_positive_rate, 1.0);
    BOOST_CHECK_SMALL(roc.auc() - 0.75, 1e-12);
}

BOOST_AUTO_TEST_CASE(perfect_separation)
{
    const double positive[] = { 0.95, 0.8, 0.75, 0.6 };
    const double negative[] = { 0.55, 0.3, 0.2 };

    ROC roc(make_dataset(positive, 4, negative, 3));

    BOOST_CHECK_SMALL(roc.auc() - 1.0, 1e-12);
    check_curve_shape(roc);
}

BOOST_AUTO_TEST_CASE(inverted_separation)
{
    const double positive[] = { 0.1, 0.2 };
    const double negative[] = { 0.8, 0.9 };

    ROC roc(make_dataset(positive, 2, negative, 2));

    BOOST_CHECK_SMALL(roc.auc(), 1e-12);
}

BOOST_AUTO_TEST_CASE(identical_scores)
{
    const double positive[] = { 0.4, 0.4, 0.4 };
    const double negative[] = { 0.4, 0.4 };

    ROC roc(make_dataset(positive, 3, negative, 2));

    BOOST_CHECK_EQUAL(roc.size(), 2u);
    BOOST_CHECK_SMALL(roc.auc() - 0.5, 1e-12);
}

BOOST_AUTO_TEST_CASE(area_matches_pair_counting)
{
    for (unsigned int seed = 1; seed <= 25; seed++) {
        LabeledDataset dataset = random_dataset(seed, 10 + seed % 7, 5 + seed % 11);
        ROC roc(dataset);

        check_curve_shape(roc);
        BOOST_CHECK_SMALL(roc.auc() - mann_whitney_auc(dataset), 1e-9);
        BOOST_CHECK_SMALL(roc.auc() - pair_count_auc(dataset), 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(repeated_calls_are_identical)
{
    LabeledDataset dataset = random_dataset(7, 40, 30);

    ROC first(dataset);
    ROC second(dataset);

    BOOST_REQUIRE_EQUAL(first.size(), second.size());
    for (size_t i = 0; i < first.size(); i++) {
        BOOST_CHECK(first.points()[i].threshold == second.points()[i].threshold);
        BOOST_CHECK(first.points()[i].false_positive_rate == second.points()[i].false_positive_rate);
        BOOST_CHECK(first.points()[i].true_positive_rate == second.points()[i].true_positive_rate);
    }
    BOOST_CHECK(first.auc() == second.auc());
}

BOOST_AUTO_TEST_CASE(drop_intermediate_points)
{
    const double positive[] = { 0.9, 0.8, 0.7 };
    const double negative[] = { 0.1 };
    LabeledDataset dataset = make_dataset(positive, 3, negative, 1);

    RocOptions options;
    options.drop_intermediate = true;

    ROC full(dataset);
    ROC reduced(dataset, options);

    BOOST_CHECK_EQUAL(full.size(), 5u);
    BOOST_REQUIRE_EQUAL(reduced.size(), 4u);
    BOOST_CHECK_EQUAL(reduced.points()[1].threshold, 0.9);
    BOOST_CHECK_EQUAL(reduced.points()[2].threshold, 0.7);
    BOOST_CHECK_EQUAL(reduced.points()[3].threshold, 0.1);
    BOOST_CHECK_EQUAL(full.auc(), reduced.auc());
}

BOOST_AUTO_TEST_CASE(drop_intermediate_keeps_area)
{
    RocOptions options;
    options.drop_intermediate = true;

    for (unsigned int seed = 1; seed <= 10; seed++) {
        LabeledDataset dataset = random_dataset(seed, 30, 25);
        ROC full(dataset);
        ROC reduced(dataset, options);

        check_curve_shape(reduced);
        BOOST_CHECK(reduced.size() <= full.size());
        BOOST_CHECK_SMALL(full.auc() - reduced.auc(), 1e-12);
        BOOST_CHECK_EQUAL(reduced.points()[1].threshold, full.points()[1].threshold);
        BOOST_CHECK_EQUAL(reduced.points().back().threshold, full.points().back().threshold);
    }
}

BOOST_AUTO_TEST_CASE(curve_pairs_follow_points)
{
    const double positive[] = { 0.9, 0.4 };
    const double negative[] = { 0.6 };

    ROC roc(make_dataset(positive, 2, negative, 1));
    std::vector<std::pair<double, double> > curve = roc.curve();

    BOOST_REQUIRE_EQUAL(curve.size(), roc.size());
    BOOST_CHECK(roc.false_positive_rates().size() == curve.size());
    BOOST_CHECK(roc.true_positive_rates().size() == curve.size());
    BOOST_CHECK(roc.thresholds().size() == curve.size());
    for (size_t i = 0; i < curve.size(); i++) {
        BOOST_CHECK_EQUAL(curve[i].first, roc.points()[i].false_positive_rate);
        BOOST_CHECK_EQUAL(curve[i].second, roc.points()[i].true_positive_rate);
    }
}

BOOST_AUTO_TEST_CASE(dataset_without_samples)
{
    LabeledDataset dataset;

    BOOST_CHECK_THROW(ROC roc(dataset), InsufficientDataError);
    BOOST_CHECK_THROW(mann_whitney_auc(dataset), InsufficientDataError);
}

BOOST_AUTO_TEST_CASE(missing_scores_never_become_thresholds)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double positive[] = { 0.9, nan, 0.4, -std::numeric_limits<double>::infinity() };
    const double negative[] = { nan, 0.6, 0.1 };

    ROC roc(make_dataset(positive, 4, negative, 3));

    BOOST_REQUIRE_EQUAL(roc.size(), 5u);
    for (size_t i = 1; i < roc.size(); i++) {
        BOOST_CHECK(std::isfinite(roc.points()[i].threshold));
    }
    BOOST_CHECK_SMALL(roc.auc() - 0.75, 1e-12);
}

BOOST_AUTO_TEST_CASE(trapezoid_rule)
{
    std::vector<double> x;
    std::vector<double> y;
    x.push_back(0); y.push_back(0);
    x.push_back(0.5); y.push_back(1);
    x.push_back(1); y.push_back(1);

    BOOST_CHECK_SMALL(trapezoid_area(x, y) - 0.75, 1e-12);
}
