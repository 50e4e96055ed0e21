//
// Unit tests for Evaluator
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <trade_eval/evaluator.h>
#include "common/evaluation_fixtures.h"

using namespace trade_eval;
using trade_eval::test::Day;
using trade_eval::test::MakePrices;
using trade_eval::test::MakeScores;
using epoch_core::ReportCategory;
using Catch::Approx;

namespace {
EvaluationConfig SmallConfig() {
    EvaluationConfig config;
    config.short_window = 2;
    config.long_window = 3;
    config.test_fraction = 1.0;
    return config;
}

std::vector<double> Closes() {
    return {100, 98, 97, 99, 103, 106, 108, 105, 101, 98, 100, 104, 110, 115};
}

int64_t Int(EvaluationReport const &report, ReportCategory category, std::string const &metric) {
    return std::get<int64_t>(report.Value(category, metric).value());
}

double Real(EvaluationReport const &report, ReportCategory category, std::string const &metric) {
    return std::get<double>(report.Value(category, metric).value());
}
} // namespace

TEST_CASE("Evaluator - Prices only", "[evaluator]") {
    const Evaluator evaluator{SmallConfig()};
    const auto report = evaluator.Evaluate({.prices = MakePrices(Closes())});

    REQUIRE(report.Contains(ReportCategory::profitability));
    REQUIRE_FALSE(report.Contains(ReportCategory::clustering));
    REQUIRE_FALSE(report.Contains(ReportCategory::anomalies));
    REQUIRE_FALSE(report.Contains(ReportCategory::rules));

    REQUIRE(Real(report, ReportCategory::profitability, "buy_hold_return_pct") == Approx(15.0));
    REQUIRE(Int(report, ReportCategory::profitability, "buy_hold_trades") == 0);
    REQUIRE(Int(report, ReportCategory::profitability, "total_trades") ==
            Int(report, ReportCategory::profitability, "ma_crossover_trades"));
    REQUIRE_FALSE(report.Value(ReportCategory::profitability, "anomaly_return_pct").has_value());
}

TEST_CASE("Evaluator - All categories", "[evaluator]") {
    auto scores = MakeScores({0.1, 0.2, 0.9, 0.1, 0.1, 0.1, 0.1, 0.1, 0.95, 0.1, 0.1, 0.1, 0.1, 0.1});
    for (size_t i = 0; i < scores.size(); ++i) {
        scores[i].ground_truth_label = (i == 2 || i == 9) ? 1 : 0;
    }

    ClusterSeries clusters{.feature_names = {"ret"}};
    for (size_t i = 0; i < 14; ++i) {
        clusters.rows.push_back({.timestamp = Day(i),
                                 .cluster_id = i < 7 ? 0 : 1,
                                 .features = {i < 7 ? 0.0 + 0.01 * i : 5.0 + 0.01 * i}});
    }

    const RuleTable rules{{.antecedent = {"rsi_low"}, .consequent = {"forward_return_up"},
                           .support = 0.2, .confidence = 0.8, .lift = 1.4}};

    const EvaluationInputs inputs{.prices = MakePrices(Closes()),
                                  .clusters = clusters,
                                  .anomalies = scores,
                                  .rules = rules};

    auto config = SmallConfig();
    SECTION("Sequential") {
        const auto report = Evaluator{config}.Evaluate(inputs);

        REQUIRE(report.Contains(ReportCategory::clustering));
        REQUIRE(Int(report, ReportCategory::clustering, "num_clusters") == 2);
        REQUIRE(Real(report, ReportCategory::clustering, "cluster_0_anomaly_pct") == Approx(100.0 / 7.0));

        REQUIRE(Real(report, ReportCategory::anomalies, "precision") == Approx(0.5));
        REQUIRE(Real(report, ReportCategory::anomalies, "recall") == Approx(0.5));
        REQUIRE(Int(report, ReportCategory::anomalies, "tp") == 1);

        REQUIRE(Int(report, ReportCategory::rules, "num_predictive_rules") == 1);
        REQUIRE(Int(report, ReportCategory::rules, "num_rules_up") == 1);

        // entries at ticks 2 and 8, each held 5 ticks
        REQUIRE(Int(report, ReportCategory::profitability, "anomaly_trades") == 4);
        const auto expected = 10000.0 * 0.999 * (105.0 / 97.0) * 0.999 * 0.999 * (115.0 / 101.0) * 0.999;
        REQUIRE(Real(report, ReportCategory::profitability, "anomaly_final_capital") == Approx(expected));
        REQUIRE(Int(report, ReportCategory::profitability, "total_trades") ==
                Int(report, ReportCategory::profitability, "anomaly_trades") +
                    Int(report, ReportCategory::profitability, "ma_crossover_trades"));
    }

    SECTION("Parallel strategies give identical results") {
        const auto sequential = Evaluator{config}.Evaluate(inputs);
        config.parallel_strategies = true;
        const auto parallel = Evaluator{config}.Evaluate(inputs);

        for (const auto *name : {"ma_crossover_final_capital", "anomaly_final_capital", "total_trades"}) {
            REQUIRE(sequential.Value(ReportCategory::profitability, name) ==
                    parallel.Value(ReportCategory::profitability, name));
        }
    }
}

TEST_CASE("Evaluator - Model failures are isolated", "[evaluator]") {
    const EvaluationInputs inputs{.prices = MakePrices(Closes()),
                                  .clusters = ModelError{"kmeans did not converge"},
                                  .anomalies = Omitted{},
                                  .rules = RuleTable{}};

    const auto report = Evaluator{SmallConfig()}.Evaluate(inputs);

    const auto *clustering = report.Get(ReportCategory::clustering);
    REQUIRE(clustering != nullptr);
    REQUIRE(std::get<CategoryError>(*clustering).reason == "kmeans did not converge");

    // empty rule table: attempted, nothing to report
    REQUIRE_FALSE(report.Contains(ReportCategory::rules));
    REQUIRE_FALSE(report.Contains(ReportCategory::anomalies));
    REQUIRE(report.Metrics(ReportCategory::profitability) != nullptr);
}

TEST_CASE("Evaluator - Computation faults are isolated", "[evaluator]") {
    auto scores = MakeScores({0.1, 0.2, 0.9, 0.1, 0.1, 0.1, 0.1, 0.1, 0.95, 0.1, 0.1, 0.1, 0.1, 0.1});
    for (size_t i = 0; i < scores.size(); ++i) {
        scores[i].ground_truth_label = (i == 2 || i == 9) ? 1 : 0;
    }

    ClusterSeries clusters{.feature_names = {"ret"}};
    for (size_t i = 0; i < 14; ++i) {
        clusters.rows.push_back({.timestamp = Day(i), .cluster_id = i < 7 ? 0 : 1, .features = {0.01 * i}});
    }

    const RuleTable rules{{.antecedent = {"rsi_low"}, .consequent = {"forward_return_up"},
                           .support = 0.2, .confidence = 0.8, .lift = 1.4}};

    SECTION("Cluster row with the wrong feature count") {
        clusters.rows[4].features.push_back(1.0);
        const auto report = Evaluator{SmallConfig()}.Evaluate(
            {.prices = MakePrices(Closes()), .clusters = clusters, .anomalies = scores, .rules = rules});

        const auto *clustering = report.Get(ReportCategory::clustering);
        REQUIRE(clustering != nullptr);
        REQUIRE(std::holds_alternative<CategoryError>(*clustering));
        REQUIRE(std::get<CategoryError>(*clustering).reason.find("Cluster row 4") != std::string::npos);

        REQUIRE(report.Metrics(ReportCategory::anomalies) != nullptr);
        REQUIRE(report.Metrics(ReportCategory::rules) != nullptr);
        REQUIRE(report.Metrics(ReportCategory::profitability) != nullptr);
    }

    SECTION("Anomaly probability outside [0, 1] during the backtest") {
        scores[5].probability = 1.5;
        auto config = SmallConfig();
        for (const bool parallel : {false, true}) {
            config.parallel_strategies = parallel;
            const auto report = Evaluator{config}.Evaluate(
                {.prices = MakePrices(Closes()), .clusters = clusters, .anomalies = scores, .rules = rules});

            const auto *profitability = report.Get(ReportCategory::profitability);
            REQUIRE(profitability != nullptr);
            REQUIRE(std::holds_alternative<CategoryError>(*profitability));

            REQUIRE(report.Metrics(ReportCategory::clustering) != nullptr);
            REQUIRE(report.Metrics(ReportCategory::anomalies) != nullptr);
            REQUIRE(report.Metrics(ReportCategory::rules) != nullptr);
        }
    }
}

TEST_CASE("Evaluator - Test window", "[evaluator]") {
    auto config = SmallConfig();
    config.test_fraction = 0.5;
    const Evaluator evaluator{config};

    const auto results = evaluator.Backtest(MakePrices(Closes()), nullptr);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].strategy == strategies::BUY_HOLD);
    // last 7 closes: 105 -> 115
    REQUIRE(results[0].return_pct == Approx((115.0 - 105.0) / 105.0 * 100.0));
    REQUIRE(results[1].strategy == strategies::MA_CROSSOVER);
}

TEST_CASE("Evaluator - Empty price series omits profitability", "[evaluator]") {
    const auto report = Evaluator{SmallConfig()}.Evaluate({});
    REQUIRE(report.empty());
}
