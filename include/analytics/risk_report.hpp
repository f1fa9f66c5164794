/**
 * @file risk_report.hpp
 * @brief Side-by-side report of VaR results for one return series.
 *
 * Summarizes the return series (observations, mean, daily volatility) and
 * lists every VaR result grouped by confidence level, historical and
 * parametric next to each other. The report is produced as text or as a
 * JSON string; writing it anywhere is left to the caller.
 */

#ifndef RISKVAR_ANALYTICS_RISK_REPORT_HPP
#define RISKVAR_ANALYTICS_RISK_REPORT_HPP

#include "data/return_series.hpp"
#include "risk/var_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskvar
{
    namespace analytics
    {

        /**
         * @class RiskReport
         * @brief Market risk summary over a set of VaR results.
         *
         * Usage:
         * @code
         *   auto results = estimator.estimate_all(returns);
         *   RiskReport report(returns, results);
         *   std::cout << report.summary();
         * @endcode
         *
         * Thread safety: Immutable after construction.
         */
        class RiskReport
        {
        public:
            /**
             * @brief Build a report.
             * @param returns Return series the results were computed from (>= 2 returns).
             * @param results VaR results to present.
             * @throws risk::InsufficientDataError if returns has fewer than 2 observations.
             */
            RiskReport(const ReturnSeries &returns,
                       std::vector<risk::VaRResult> results);

            int num_observations() const { return num_observations_; }
            double mean_return() const { return mean_return_; }

            /**
             * @brief Sample standard deviation of daily returns.
             */
            double daily_volatility() const { return daily_volatility_; }

            const std::vector<risk::VaRResult> &results() const { return results_; }

            /**
             * @brief Distinct confidence levels, in first-seen order.
             */
            std::vector<double> confidence_levels() const;

            /**
             * @brief Result for a method and confidence level, if present.
             */
            std::optional<risk::VaRResult> find(risk::VaRMethod method,
                                                double confidence_level) const;

            /**
             * @brief Formatted text report.
             *
             * Ends with a plain-language interpretation of the parametric
             * result at each confidence level.
             */
            std::string summary() const;

            /**
             * @brief Report as an indented JSON document.
             */
            std::string to_json() const;

        private:
            int num_observations_;
            double mean_return_;
            double daily_volatility_;
            std::vector<risk::VaRResult> results_;
        };

    } // namespace analytics
} // namespace riskvar

#endif // RISKVAR_ANALYTICS_RISK_REPORT_HPP
