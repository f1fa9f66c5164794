/**
 * @file test_var_models.cpp
 * @brief Unit tests for the normal quantile, parametric and historical VaR models
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "risk/parametric_var.hpp"
#include "risk/historical_var.hpp"
#include "risk/var_model_factory.hpp"
#include "risk/normal_distribution.hpp"
#include "risk/risk_errors.hpp"
#include "data/data_loader.hpp"

#include <cmath>

using namespace riskvar;
using namespace riskvar::risk;
using Catch::Matchers::WithinAbs;

// Shared return series for model tests
class VaRModelTestFixture
{
protected:
    // ln returns of prices 100, 102, 101, 105, 103
    ReturnSeries small_returns_;

    // 1000 days of synthetic GBM log returns
    ReturnSeries long_returns_;

    VaRModelTestFixture()
        : small_returns_(make_small_returns()),
          long_returns_(ReturnSeriesBuilder::build(
              DataLoader::generate_synthetic_prices(1001, "2018-01-01", 0.015, 0.0002, 123)))
    {
    }

    static ReturnSeries make_small_returns()
    {
        PriceSeries prices({"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"},
                           std::vector<double>{100.0, 102.0, 101.0, 105.0, 103.0});
        return ReturnSeriesBuilder::build(prices);
    }

    static ReturnSeries constant_returns(double value, int n)
    {
        return ReturnSeries(Eigen::VectorXd::Constant(n, value));
    }
};

TEST_CASE("Inverse normal CDF", "[NormalDistribution]")
{
    SECTION("Standard quantiles")
    {
        REQUIRE_THAT(stats::inverse_normal_cdf(0.05), WithinAbs(-1.6448536269514715, 1e-12));
        REQUIRE_THAT(stats::inverse_normal_cdf(0.01), WithinAbs(-2.3263478740408408, 1e-12));
        REQUIRE_THAT(stats::inverse_normal_cdf(0.03), WithinAbs(-1.8807936081512504, 1e-12));
        REQUIRE_THAT(stats::inverse_normal_cdf(0.5), WithinAbs(0.0, 1e-14));
        REQUIRE_THAT(stats::inverse_normal_cdf(0.975), WithinAbs(1.959963984540054, 1e-12));
    }

    SECTION("Round trip through the CDF")
    {
        for (double p : {1e-6, 0.001, 0.02, 0.2, 0.6, 0.9, 0.999})
        {
            REQUIRE_THAT(stats::normal_cdf(stats::inverse_normal_cdf(p)), WithinAbs(p, 1e-14));
        }
    }

    SECTION("Out of range probabilities")
    {
        REQUIRE_THROWS_AS(stats::inverse_normal_cdf(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(stats::inverse_normal_cdf(1.0), std::invalid_argument);
    }

    SECTION("PDF at zero")
    {
        REQUIRE_THAT(stats::normal_pdf(0.0), WithinAbs(0.3989422804014327, 1e-15));
    }
}

TEST_CASE("ConfidenceLevel validation", "[VaRTypes]")
{
    REQUIRE_THAT(ConfidenceLevel(0.95).alpha(), WithinAbs(0.05, 1e-15));

    REQUIRE_THROWS_AS(ConfidenceLevel(1.5), InvalidConfidenceLevelError);
    REQUIRE_THROWS_AS(ConfidenceLevel(-0.1), InvalidConfidenceLevelError);
    REQUIRE_THROWS_AS(ConfidenceLevel(0.0), InvalidConfidenceLevelError);
    REQUIRE_THROWS_AS(ConfidenceLevel(1.0), InvalidConfidenceLevelError);
    REQUIRE_THROWS_AS(ConfidenceLevel(std::nan("")), InvalidConfidenceLevelError);

    auto defaults = ConfidenceLevel::defaults();
    REQUIRE(defaults.size() == 2);
    REQUIRE(defaults[0].value() == 0.95);
    REQUIRE(defaults[1].value() == 0.99);
}

TEST_CASE_METHOD(VaRModelTestFixture, "ParametricVaR basic functionality", "[VaRModel][ParametricVaR]")
{
    ParametricVaR model;

    SECTION("Metadata")
    {
        REQUIRE(model.get_name() == "ParametricVaR");
        REQUIRE(model.method() == VaRMethod::PARAMETRIC);
    }

    SECTION("Matches -(mean + z * stdev) at 95%")
    {
        auto result = model.estimate(small_returns_, 0.95);

        double mu = 0.0073897005603861116;
        double sigma = 0.02676539450596779;
        double expected = -(mu + (-1.6448536269514715) * sigma);

        REQUIRE(result.method == VaRMethod::PARAMETRIC);
        REQUIRE(result.confidence_level == 0.95);
        REQUIRE_THAT(result.var_value, WithinAbs(expected, 1e-12));
        REQUIRE_THAT(result.var_value, WithinAbs(0.036635455669541996, 1e-12));
        REQUIRE_THAT(result.threshold_return, WithinAbs(-expected, 1e-12));
        REQUIRE_FALSE(result.no_downside_risk);
        REQUIRE(result.num_observations == 4);
        REQUIRE(result.sufficient_sample);
    }

    SECTION("Matches reference value at 99%")
    {
        auto result = model.estimate(small_returns_, ConfidenceLevel(0.99));
        REQUIRE_THAT(result.var_value, WithinAbs(0.054875918046436455, 1e-12));
    }

    SECTION("VaR deepens as confidence increases")
    {
        auto var_95 = model.estimate(long_returns_, 0.95);
        auto var_99 = model.estimate(long_returns_, 0.99);
        REQUIRE(var_99.var_value >= var_95.var_value);

        auto small_95 = model.estimate(small_returns_, 0.95);
        auto small_99 = model.estimate(small_returns_, 0.99);
        REQUIRE(small_99.var_value >= small_95.var_value);
    }

    SECTION("z-score")
    {
        REQUIRE_THAT(ParametricVaR::z_score(ConfidenceLevel(0.95)), WithinAbs(-1.6448536269514715, 1e-12));
    }

    SECTION("Deterministic")
    {
        auto a = model.estimate(long_returns_, 0.97);
        auto b = model.estimate(long_returns_, 0.97);
        REQUIRE(a.var_value == b.var_value);
        REQUIRE(a.threshold_return == b.threshold_return);
    }
}

TEST_CASE_METHOD(VaRModelTestFixture, "ParametricVaR degenerate cases", "[VaRModel][ParametricVaR]")
{
    ParametricVaR model;

    SECTION("Zero variance at zero mean gives zero VaR")
    {
        auto returns = constant_returns(0.0, 10);
        for (double c : {0.5, 0.95, 0.99, 0.999})
        {
            auto result = model.estimate(returns, c);
            REQUIRE(result.var_value == 0.0);
            REQUIRE(result.no_downside_risk);
        }
    }

    SECTION("Positive threshold is clamped to zero")
    {
        auto result = model.estimate(constant_returns(0.01, 10), 0.95);
        REQUIRE(result.var_value == 0.0);
        REQUIRE_THAT(result.threshold_return, WithinAbs(0.01, 1e-15));
        REQUIRE(result.no_downside_risk);
    }
}

TEST_CASE_METHOD(VaRModelTestFixture, "VaR model error handling", "[VaRModel]")
{
    ParametricVaR parametric;
    HistoricalVaR historical;

    SECTION("Single observation")
    {
        auto single = constant_returns(0.01, 1);
        REQUIRE_THROWS_AS(parametric.estimate(single, 0.95), InsufficientDataError);
        REQUIRE_THROWS_AS(historical.estimate(single, 0.95), InsufficientDataError);
    }

    SECTION("Empty series")
    {
        ReturnSeries empty(Eigen::VectorXd(0));
        REQUIRE_THROWS_AS(parametric.estimate(empty, 0.95), InsufficientDataError);
        REQUIRE_THROWS_AS(historical.estimate(empty, 0.95), InsufficientDataError);
    }

    SECTION("Invalid confidence levels")
    {
        REQUIRE_THROWS_AS(parametric.estimate(small_returns_, 1.5), InvalidConfidenceLevelError);
        REQUIRE_THROWS_AS(historical.estimate(small_returns_, -0.1), InvalidConfidenceLevelError);
    }

    SECTION("Errors are invalid_argument")
    {
        REQUIRE_THROWS_AS(parametric.estimate(small_returns_, 1.5), std::invalid_argument);
    }
}

TEST_CASE_METHOD(VaRModelTestFixture, "HistoricalVaR basic functionality", "[VaRModel][HistoricalVaR]")
{
    HistoricalVaR model;

    SECTION("Metadata")
    {
        REQUIRE(model.get_name() == "HistoricalVaR");
        REQUIRE(model.method() == VaRMethod::HISTORICAL);
    }

    SECTION("Linear interpolation of the 5th percentile")
    {
        auto result = model.estimate(small_returns_, 0.95);

        // h = 0.05 * 3 = 0.15 between the two smallest returns
        double x0 = -0.019231361927887644;
        double x1 = -0.009852296443011594;
        double expected = x0 + 0.15 * (x1 - x0);

        REQUIRE_THAT(result.threshold_return, WithinAbs(expected, 1e-15));
        REQUIRE_THAT(result.var_value, WithinAbs(0.017824502105156237, 1e-15));
        REQUIRE(result.num_observations == 4);
    }

    SECTION("Small sample is flagged but still estimated")
    {
        auto result = model.estimate(small_returns_, 0.95);
        REQUIRE_FALSE(result.sufficient_sample);

        auto long_result = model.estimate(long_returns_, 0.99);
        REQUIRE(long_result.sufficient_sample);
    }

    SECTION("Threshold stays within observed range")
    {
        for (double c : {0.5, 0.9, 0.95, 0.99, 0.999})
        {
            auto result = model.estimate(long_returns_, c);
            REQUIRE(result.threshold_return >= long_returns_.min());
            REQUIRE(result.threshold_return <= long_returns_.max());
        }
    }

    SECTION("Zero returns give zero VaR")
    {
        auto result = model.estimate(constant_returns(0.0, 25), 0.95);
        REQUIRE(result.var_value == 0.0);
        REQUIRE(result.no_downside_risk);
    }
}

TEST_CASE("HistoricalVaR quantile convention", "[VaRModel][HistoricalVaR]")
{
    std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0, 5.0};

    SECTION("Exact order statistics")
    {
        REQUIRE(HistoricalVaR::quantile(sorted, 0.0) == 1.0);
        REQUIRE(HistoricalVaR::quantile(sorted, 0.25) == 2.0);
        REQUIRE(HistoricalVaR::quantile(sorted, 0.5) == 3.0);
        REQUIRE(HistoricalVaR::quantile(sorted, 1.0) == 5.0);
    }

    SECTION("Interpolated values")
    {
        REQUIRE(HistoricalVaR::quantile(sorted, 0.1) == Catch::Approx(1.4));
        REQUIRE(HistoricalVaR::quantile(sorted, 0.95) == Catch::Approx(4.8));
    }

    SECTION("Single value")
    {
        REQUIRE(HistoricalVaR::quantile({-0.02}, 0.05) == -0.02);
    }

    SECTION("Invalid inputs")
    {
        REQUIRE_THROWS_AS(HistoricalVaR::quantile({}, 0.5), std::invalid_argument);
        REQUIRE_THROWS_AS(HistoricalVaR::quantile(sorted, 1.5), std::invalid_argument);
    }

    SECTION("Recommended observations")
    {
        REQUIRE(HistoricalVaR::recommended_observations(ConfidenceLevel(0.95)) == 20);
        REQUIRE(HistoricalVaR::recommended_observations(ConfidenceLevel(0.99)) == 100);
        REQUIRE(HistoricalVaR::recommended_observations(ConfidenceLevel(0.97)) == 34);
    }
}

TEST_CASE("VaRModelFactory", "[VaRModelFactory]")
{
    SECTION("Create by name, case-insensitive")
    {
        REQUIRE(VaRModelFactory::create("parametric")->method() == VaRMethod::PARAMETRIC);
        REQUIRE(VaRModelFactory::create("Variance_Covariance")->method() == VaRMethod::PARAMETRIC);
        REQUIRE(VaRModelFactory::create("HISTORICAL")->method() == VaRMethod::HISTORICAL);
        REQUIRE(VaRModelFactory::create("historical_simulation")->get_name() == "HistoricalVaR");
    }

    SECTION("Unknown name")
    {
        REQUIRE_THROWS_AS(VaRModelFactory::create("monte_carlo"), std::invalid_argument);
    }

    SECTION("Create from configuration")
    {
        VaRConfig config;
        config.methods = {"historical"};
        auto models = VaRModelFactory::create_all(config);
        REQUIRE(models.size() == 1);
        REQUIRE(models[0]->method() == VaRMethod::HISTORICAL);
    }

    SECTION("Supported types")
    {
        REQUIRE(VaRModelFactory::get_supported_types().size() == 4);
    }
}

TEST_CASE("VaRConfig JSON parsing", "[VaRModelFactory]")
{
    SECTION("Defaults")
    {
        auto config = VaRConfig::from_json(nlohmann::json::object());
        REQUIRE(config.confidence_levels == std::vector<double>{0.95, 0.99});
        REQUIRE(config.methods.size() == 2);
        REQUIRE(config.estimation_window == -1);
    }

    SECTION("Explicit values")
    {
        nlohmann::json j = {{"confidence_levels", {0.97}},
                            {"methods", {"parametric"}},
                            {"estimation_window", 252}};
        auto config = VaRConfig::from_json(j);
        REQUIRE(config.confidence_levels == std::vector<double>{0.97});
        REQUIRE(config.methods == std::vector<std::string>{"parametric"});
        REQUIRE(config.estimation_window == 252);
        REQUIRE(config.to_json()["estimation_window"] == 252);
    }

    SECTION("Invalid values")
    {
        REQUIRE_THROWS_AS(VaRConfig::from_json({{"estimation_window", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(VaRConfig::from_json({{"methods", nlohmann::json::array()}}), std::invalid_argument);
    }
}
