/**
 * @file test_var_estimator.cpp
 * @brief Unit tests for VaREstimator comparison and batch estimation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "risk/var_estimator.hpp"
#include "risk/risk_errors.hpp"
#include "data/return_series.hpp"
#include "data/data_loader.hpp"

using namespace riskvar;
using namespace riskvar::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    ReturnSeries scenario_returns()
    {
        PriceSeries prices({"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"},
                           std::vector<double>{100.0, 102.0, 101.0, 105.0, 103.0});
        return ReturnSeriesBuilder::build(prices);
    }
}

TEST_CASE("VaREstimator compare", "[VaREstimator]") {
    VaREstimator estimator;
    auto returns = scenario_returns();

    auto comparison = estimator.compare(returns, ConfidenceLevel(0.95));

    REQUIRE(comparison.confidence_level == 0.95);
    REQUIRE(comparison.parametric.method == VaRMethod::PARAMETRIC);
    REQUIRE(comparison.historical.method == VaRMethod::HISTORICAL);
    REQUIRE_THAT(comparison.parametric.var_value, WithinAbs(0.036635455669541996, 1e-12));
    REQUIRE_THAT(comparison.historical.var_value, WithinAbs(0.017824502105156237, 1e-15));
}

TEST_CASE("VaREstimator estimate_all", "[VaREstimator]") {
    VaREstimator estimator;
    auto returns = scenario_returns();

    SECTION("Results are grouped by confidence level") {
        auto results = estimator.estimate_all(returns, {0.95, 0.97, 0.99});

        REQUIRE(results.size() == 6);
        REQUIRE(results[0].confidence_level == 0.95);
        REQUIRE(results[0].method == VaRMethod::PARAMETRIC);
        REQUIRE(results[1].confidence_level == 0.95);
        REQUIRE(results[1].method == VaRMethod::HISTORICAL);
        REQUIRE(results[2].confidence_level == 0.97);
        REQUIRE(results[5].confidence_level == 0.99);

        REQUIRE_THAT(results[2].var_value, WithinAbs(0.0429504823460847, 1e-12));
        REQUIRE_THAT(results[3].threshold_return, WithinAbs(-0.018387246034248798, 1e-15));
        REQUIRE_THAT(results[4].var_value, WithinAbs(0.054875918046436455, 1e-12));
        REQUIRE_THAT(results[5].threshold_return, WithinAbs(-0.018949989963341362, 1e-15));
    }

    SECTION("Empty level list falls back to 95% and 99%") {
        auto results = estimator.estimate_all(returns, {});
        REQUIRE(results.size() == 4);
        REQUIRE(results.front().confidence_level == 0.95);
        REQUIRE(results.back().confidence_level == 0.99);
    }

    SECTION("One invalid level rejects the whole batch") {
        std::vector<VaRResult> results;
        REQUIRE_THROWS_AS(results = estimator.estimate_all(returns, {0.95, 1.2}),
                          InvalidConfidenceLevelError);
        REQUIRE(results.empty());
    }

    SECTION("Median level leaves no downside") {
        auto results = estimator.estimate_all(returns, {0.5});
        REQUIRE_THAT(results[1].threshold_return, WithinAbs(0.0049751654265840686, 1e-15));
        REQUIRE(results[1].var_value == 0.0);
        REQUIRE(results[1].no_downside_risk);
    }

    SECTION("Insufficient data") {
        ReturnSeries single(Eigen::VectorXd::Constant(1, 0.01));
        REQUIRE_THROWS_AS(estimator.estimate_all(single, {0.95}), InsufficientDataError);
    }
}

TEST_CASE("VaREstimator configuration", "[VaREstimator]") {
    auto returns = ReturnSeriesBuilder::build(
        DataLoader::generate_synthetic_prices(301, "2022-01-03", 0.012, 0.0, 11));

    SECTION("Configured methods and levels") {
        VaRConfig config;
        config.methods = {"historical"};
        config.confidence_levels = {0.9};

        VaREstimator estimator(config);

        REQUIRE(estimator.model_names() == std::vector<std::string>{"HistoricalVaR"});
        REQUIRE(estimator.confidence_levels() == std::vector<double>{0.9});

        auto results = estimator.estimate_all(returns);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].method == VaRMethod::HISTORICAL);

        // Unconfigured methods are still available for single estimates
        auto parametric = estimator.estimate(returns, ConfidenceLevel(0.9), VaRMethod::PARAMETRIC);
        REQUIRE(parametric.method == VaRMethod::PARAMETRIC);
    }

    SECTION("Estimation window uses the most recent returns") {
        VaRConfig config;
        config.estimation_window = 100;
        VaREstimator windowed(config);

        auto results = windowed.estimate_all(returns, {0.95});
        REQUIRE(results[0].num_observations == 100);

        auto tail_results = VaREstimator().estimate_all(returns.tail(100), {0.95});
        REQUIRE(results[0].var_value == tail_results[0].var_value);
        REQUIRE(results[1].var_value == tail_results[1].var_value);

        REQUIRE(windowed.apply_window(returns).size() == 100);
    }

    SECTION("Window larger than the sample uses all returns") {
        VaRConfig config;
        config.estimation_window = 1000;
        auto results = VaREstimator(config).estimate_all(returns, {0.95});
        REQUIRE(results[0].num_observations == 300);
    }

    SECTION("Invalid construction") {
        REQUIRE_THROWS_AS(VaREstimator(std::vector<std::unique_ptr<VaRModel>>{}), std::invalid_argument);

        std::vector<std::unique_ptr<VaRModel>> models;
        models.push_back(VaRModelFactory::create("parametric"));
        REQUIRE_THROWS_AS(VaREstimator(std::move(models), 0), std::invalid_argument);
    }
}
