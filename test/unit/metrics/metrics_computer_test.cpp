//
// Unit tests for MetricsComputer
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <trade_eval/metrics/metrics_computer.h>
#include "../common/evaluation_fixtures.h"
#include <cmath>
#include <limits>

using namespace trade_eval;
using trade_eval::test::Day;
using Catch::Approx;

namespace {
ClusterAssignment Row(size_t day, int64_t cluster, std::vector<double> features) {
    return ClusterAssignment{.timestamp = Day(day), .cluster_id = cluster, .features = std::move(features)};
}

AnomalyScore Labelled(size_t day, int predicted, std::optional<int> truth) {
    return AnomalyScore{.timestamp = Day(day),
                        .probability = predicted ? 0.9 : 0.1,
                        .predicted_label = predicted,
                        .ground_truth_label = truth};
}

AssociationRule Rule(std::set<std::string> consequent, double support, double confidence, double lift) {
    return AssociationRule{.antecedent = {"rsi_low"},
                           .consequent = std::move(consequent),
                           .support = support,
                           .confidence = confidence,
                           .lift = lift};
}
} // namespace

TEST_CASE("ClassificationFromCounts - Zero division policy", "[metrics][classification]") {
    SECTION("Empty confusion matrix") {
        const auto m = ClassificationFromCounts({.tn = 0, .fp = 0, .fn = 0, .tp = 0});
        REQUIRE(m.precision == 0.0);
        REQUIRE(m.recall == 0.0);
        REQUIRE(m.f1 == 0.0);
    }

    SECTION("Only negatives") {
        const auto m = ClassificationFromCounts({.tn = 10, .fp = 0, .fn = 0, .tp = 0});
        REQUIRE(m.precision == 0.0);
        REQUIRE(m.recall == 0.0);
        REQUIRE(m.f1 == 0.0);
        REQUIRE(m.num_samples == 10);
        REQUIRE(m.pct_actual == 0.0);
    }

    SECTION("Regular counts") {
        const auto m = ClassificationFromCounts({.tn = 5, .fp = 1, .fn = 1, .tp = 3});
        REQUIRE(m.precision == Approx(0.75));
        REQUIRE(m.recall == Approx(0.75));
        REQUIRE(m.f1 == Approx(0.75));
        REQUIRE(m.num_actual == 4);
        REQUIRE(m.num_detected == 4);
        REQUIRE(m.pct_actual == Approx(40.0));
    }

    REQUIRE(SafeRatio(1.0, 0.0) == 0.0);
}

TEST_CASE("MetricsComputer - Classification", "[metrics][classification]") {
    const MetricsComputer computer{EvaluationConfig{}};

    SECTION("Mixed labels populate the confusion counts") {
        const AnomalySeries scores{Labelled(0, 1, 1), Labelled(1, 1, 0), Labelled(2, 0, 1),
                                   Labelled(3, 0, 0), Labelled(4, 0, 0), Labelled(5, 1, std::nullopt)};
        const auto m = computer.ComputeClassification(scores);

        REQUIRE(m.has_value());
        REQUIRE(m->num_samples == 5);
        REQUIRE(m->precision == Approx(0.5));
        REQUIRE(m->recall == Approx(0.5));
        REQUIRE(m->confusion.has_value());
        REQUIRE(m->confusion->tp == 1);
        REQUIRE(m->confusion->fp == 1);
        REQUIRE(m->confusion->fn == 1);
        REQUIRE(m->confusion->tn == 2);
    }

    SECTION("Single observed label leaves the confusion counts unset") {
        const AnomalySeries scores{Labelled(0, 0, 0), Labelled(1, 0, 0)};
        const auto m = computer.ComputeClassification(scores);

        REQUIRE(m.has_value());
        REQUIRE(m->precision == 0.0);
        REQUIRE(m->recall == 0.0);
        REQUIRE_FALSE(m->confusion.has_value());
    }

    SECTION("No ground truth is not computed") {
        const AnomalySeries scores{Labelled(0, 1, std::nullopt)};
        REQUIRE_FALSE(computer.ComputeClassification(scores).has_value());
        REQUIRE_FALSE(computer.ComputeClassification({}).has_value());
    }
}

TEST_CASE("MetricsComputer - Clustering", "[metrics][clustering]") {
    const MetricsComputer computer{EvaluationConfig{}};

    SECTION("Two separated clusters") {
        const ClusterSeries clusters{
            .feature_names = {"rsi", "volatility"},
            .rows = {Row(0, 0, {1.0, 1.0}), Row(1, 0, {1.1, 0.9}), Row(2, 0, {0.9, 1.1}),
                     Row(3, 1, {9.0, 9.0}), Row(4, 1, {9.1, 8.9}),
                     Row(5, UNASSIGNED_CLUSTER, {5.0, 5.0})}};
        const AnomalySeries anomalies{Labelled(3, 1, 1), Labelled(0, 1, 0)};

        const auto m = computer.ComputeClustering(clusters, &anomalies);
        REQUIRE(m.has_value());
        REQUIRE(m->total_rows == 6);
        REQUIRE_FALSE(m->silhouette.is_null());
        REQUIRE(m->silhouette.as_double() > 0.9);

        REQUIRE(m->clusters.size() == 2);
        const auto &first = m->clusters[0];
        REQUIRE(first.cluster_id == 0);
        REQUIRE(first.size == 3);
        REQUIRE(first.pct_of_rows == Approx(50.0));
        REQUIRE(first.feature_means[0].as_double() == Approx(1.0));
        // ground truth wins over the predicted flag
        REQUIRE(first.anomaly_pct.value() == Approx(0.0));

        const auto &second = m->clusters[1];
        REQUIRE(second.cluster_id == 1);
        REQUIRE(second.size == 2);
        REQUIRE(second.anomaly_pct.value() == Approx(50.0));
    }

    SECTION("Single cluster leaves silhouette not computed") {
        const ClusterSeries clusters{
            .feature_names = {"rsi"},
            .rows = {Row(0, 2, {1.0}), Row(1, 2, {2.0}), Row(2, 2, {3.0}), Row(3, UNASSIGNED_CLUSTER, {9.0})}};

        const auto m = computer.ComputeClustering(clusters, nullptr);
        REQUIRE(m.has_value());
        REQUIRE(m->silhouette.is_null());
        REQUIRE(m->clusters.size() == 1);
        REQUIRE_FALSE(m->clusters[0].anomaly_pct.has_value());
    }

    SECTION("Rows with missing features are excluded from silhouette") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const ClusterSeries clusters{
            .feature_names = {"rsi"},
            .rows = {Row(0, 0, {1.0}), Row(1, 1, {nan})}};

        const auto m = computer.ComputeClustering(clusters, nullptr);
        REQUIRE(m.has_value());
        REQUIRE(m->silhouette.is_null());
        REQUIRE(m->clusters[1].feature_means[0].is_null());
    }

    SECTION("Row with the wrong feature count is a fault") {
        const ClusterSeries clusters{
            .feature_names = {"rsi", "volatility"},
            .rows = {Row(0, 0, {1.0, 1.0}), Row(1, 0, {1.1}), Row(2, 1, {9.0, 9.0}), Row(3, 1, {9.1, 8.9})}};
        REQUIRE_THROWS(computer.ComputeClustering(clusters, nullptr));
    }

    SECTION("No rows") {
        REQUIRE_FALSE(computer.ComputeClustering(ClusterSeries{}, nullptr).has_value());
    }
}

TEST_CASE("MetricsComputer - Rules", "[metrics][rules]") {
    const MetricsComputer computer{EvaluationConfig{}};

    SECTION("Predictive rules split by direction") {
        const RuleTable rules{Rule({"forward_return_up"}, 0.2, 0.8, 1.5),
                              Rule({"forward_return_down"}, 0.1, 0.6, 1.2),
                              Rule({"forward_return_up", "volume_high"}, 0.3, 0.7, 1.1),
                              Rule({"macd_cross"}, 0.4, 0.5, 1.0)};
        const auto m = computer.ComputeRules(rules);

        REQUIRE(m.has_value());
        REQUIRE(m->num_rules == 4);
        REQUIRE(m->mean_confidence.as_double() == Approx(0.65));
        REQUIRE(m->mean_lift.as_double() == Approx(1.2));
        REQUIRE(m->mean_support.as_double() == Approx(0.25));

        REQUIRE(m->predictive.count == 3);
        REQUIRE(m->predictive.mean_confidence.as_double() == Approx(0.7));

        const auto &up = m->by_direction.at(epoch_core::RuleDirection::up);
        REQUIRE(up.count == 2);
        REQUIRE(up.mean_lift.as_double() == Approx(1.3));

        const auto &neutral = m->by_direction.at(epoch_core::RuleDirection::neutral);
        REQUIRE(neutral.count == 0);
        REQUIRE(neutral.mean_confidence.is_null());
    }

    SECTION("Forward return label is configurable") {
        EvaluationConfig config;
        config.forward_return_label = "next_return";
        const MetricsComputer custom{config};
        const auto m = custom.ComputeRules({Rule({"next_return_neutral"}, 0.1, 0.5, 1.0),
                                            Rule({"forward_return_up"}, 0.1, 0.5, 1.0)});

        REQUIRE(m->predictive.count == 1);
        REQUIRE(m->by_direction.at(epoch_core::RuleDirection::neutral).count == 1);
    }

    SECTION("Empty rule table is not computed") {
        REQUIRE_FALSE(computer.ComputeRules({}).has_value());
    }
}
