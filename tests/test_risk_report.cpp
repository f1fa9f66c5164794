/**
 * @file test_risk_report.cpp
 * @brief Unit tests for the return histogram, risk report and console renderer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "analytics/return_histogram.hpp"
#include "analytics/risk_report.hpp"
#include "analytics/risk_renderer.hpp"
#include "risk/var_estimator.hpp"
#include "risk/risk_errors.hpp"
#include "data/data_loader.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using namespace riskvar;
using namespace riskvar::analytics;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace
{
    ReturnSeries synthetic_returns()
    {
        return ReturnSeriesBuilder::build(
            DataLoader::generate_synthetic_prices(501, "2022-01-03", 0.015, 0.0003, 42));
    }
}

TEST_CASE("ReturnHistogram binning", "[ReturnHistogram]") {
    auto returns = synthetic_returns();

    SECTION("Counts cover every return") {
        ReturnHistogram histogram(returns, 25);

        REQUIRE(histogram.num_bins() == 25);
        REQUIRE(histogram.total_count() == 500);
        REQUIRE(histogram.lower_edge() == returns.min());
        REQUIRE(histogram.upper_edge() == returns.max());
        REQUIRE(histogram.max_count() > 0);
    }

    SECTION("Extremes fall in the first and last bins") {
        ReturnHistogram histogram(returns, 10);

        REQUIRE(histogram.bin_index(returns.min()) == 0);
        REQUIRE(histogram.bin_index(returns.max()) == 9);
        REQUIRE(histogram.bin_index(returns.min() - 0.01) == -1);
        REQUIRE(histogram.bin_index(returns.max() + 0.01) == -1);
    }

    SECTION("Constant returns") {
        ReturnHistogram histogram(ReturnSeries(Eigen::VectorXd::Zero(5)), 4);
        REQUIRE(histogram.total_count() == 5);
        REQUIRE_THAT(histogram.lower_edge(), WithinAbs(-0.5, 1e-15));
        REQUIRE_THAT(histogram.upper_edge(), WithinAbs(0.5, 1e-15));
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(ReturnHistogram(returns, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(ReturnHistogram(ReturnSeries(Eigen::VectorXd(0))), std::invalid_argument);
    }
}

TEST_CASE("RiskReport", "[RiskReport]") {
    PriceSeries prices({"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"},
                       std::vector<double>{100.0, 102.0, 101.0, 105.0, 103.0});
    auto returns = ReturnSeriesBuilder::build(prices);

    risk::VaREstimator estimator;
    RiskReport report(returns, estimator.estimate_all(returns, {0.95, 0.99}));

    SECTION("Return statistics") {
        REQUIRE(report.num_observations() == 4);
        REQUIRE_THAT(report.mean_return(), WithinAbs(0.0073897005603861116, 1e-15));
        REQUIRE_THAT(report.daily_volatility(), WithinAbs(0.02676539450596779, 1e-15));
    }

    SECTION("Lookup by method and level") {
        REQUIRE(report.confidence_levels() == std::vector<double>{0.95, 0.99});

        auto parametric = report.find(risk::VaRMethod::PARAMETRIC, 0.99);
        REQUIRE(parametric.has_value());
        REQUIRE_THAT(parametric->var_value, WithinAbs(0.054875918046436455, 1e-12));

        REQUIRE_FALSE(report.find(risk::VaRMethod::HISTORICAL, 0.9).has_value());
    }

    SECTION("Text summary") {
        std::string text = report.summary();

        REQUIRE_THAT(text, ContainsSubstring("MARKET RISK ANALYSIS REPORT"));
        REQUIRE_THAT(text, ContainsSubstring("Observations:        4"));
        REQUIRE_THAT(text, ContainsSubstring("Confidence Level: 95.00%"));
        REQUIRE_THAT(text, ContainsSubstring("Historical VaR:"));
        REQUIRE_THAT(text, ContainsSubstring("Parametric VaR:"));
        REQUIRE_THAT(text, ContainsSubstring("3.6635%"));
        REQUIRE_THAT(text, ContainsSubstring("[small sample]"));
        REQUIRE_THAT(text, ContainsSubstring("Interpretation:"));

        // Historical is listed before parametric within a level
        REQUIRE(text.find("Historical VaR:") < text.find("Parametric VaR:"));
    }

    SECTION("JSON export") {
        auto j = nlohmann::json::parse(report.to_json());

        REQUIRE(j["return_statistics"]["num_observations"] == 4);
        REQUIRE(j["var_results"].size() == 4);
        REQUIRE(j["var_results"][0]["method"] == "parametric");
        REQUIRE(j["var_results"][1]["method"] == "historical");
        REQUIRE(j["var_results"][1]["sufficient_sample"] == false);
        REQUIRE_THAT(j["var_results"][0]["var_value"].get<double>(),
                     WithinAbs(0.036635455669541996, 1e-12));
    }

    SECTION("Too few returns") {
        ReturnSeries single(Eigen::VectorXd::Constant(1, 0.01));
        REQUIRE_THROWS_AS(RiskReport(single, {}), risk::InsufficientDataError);
    }
}

TEST_CASE("RiskReport flags clamped results", "[RiskReport]") {
    ReturnSeries rising(Eigen::VectorXd::Constant(30, 0.002));
    risk::VaREstimator estimator;
    RiskReport report(rising, estimator.estimate_all(rising, {0.95}));

    REQUIRE_THAT(report.summary(), ContainsSubstring("[no downside risk]"));
}

TEST_CASE("ConsoleHistogramRenderer", "[RiskRenderer]") {
    auto returns = synthetic_returns();
    risk::VaREstimator estimator;
    auto results = estimator.estimate_all(returns, {0.95, 0.99});

    std::ostringstream out;
    out.precision(3);
    ConsoleHistogramRenderer renderer(out, 20, 30);
    renderer.render(returns, results);

    std::string text = out.str();

    REQUIRE_THAT(text, ContainsSubstring("Return Distribution & VaR Thresholds (500 daily log returns)"));
    REQUIRE_THAT(text, ContainsSubstring("<- Historical 95.00%"));
    REQUIRE_THAT(text, ContainsSubstring("Parametric 99.00%"));
    REQUIRE_THAT(text, ContainsSubstring("#"));

    // Caller's stream formatting is restored
    REQUIRE(out.precision() == 3);
    REQUIRE((out.flags() & std::ios_base::fixed) == 0);

    SECTION("Invalid layout") {
        REQUIRE_THROWS_AS(ConsoleHistogramRenderer(out, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(ConsoleHistogramRenderer(out, 10, 0), std::invalid_argument);
    }
}
