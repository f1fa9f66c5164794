/**
 * @file historical_var.hpp
 * @brief Historical simulation VaR estimator
 *
 * Reads the loss threshold directly from the empirical distribution of
 * observed returns. Quantile convention (linear interpolation between
 * order statistics, the "linear" percentile of NumPy and pandas):
 *     h  = alpha * (n - 1)
 *     lo = floor(h)
 *     q  = x[lo] + (h - lo) * (x[lo + 1] - x[lo])
 * with x sorted ascending and alpha = 1 - confidence.
 *
 * The threshold always lies within [min(x), max(x)].
 */

#pragma once

#include "risk/var_model.hpp"
#include <vector>

namespace riskvar
{
    namespace risk
    {

        /**
         * @class HistoricalVaR
         * @brief Empirical-quantile VaR estimator
         *
         * No distributional assumption. Results are flagged with
         * sufficient_sample = false when the series holds fewer than
         * ceil(1 / alpha) observations; the estimate is still returned.
         */
        class HistoricalVaR : public VaRModel
        {
        public:
            HistoricalVaR() = default;
            ~HistoricalVaR() override = default;

            using VaRModel::estimate;

            /**
             * @brief Estimate historical simulation VaR
             * @param returns Return series (>= 2 observations)
             * @param confidence Confidence level
             * @return VaRResult with method HISTORICAL
             * @throws InsufficientDataError if fewer than 2 returns
             *
             * Time complexity: O(T log T)
             */
            VaRResult estimate(const ReturnSeries &returns,
                               const ConfidenceLevel &confidence) const override;

            VaRMethod method() const override { return VaRMethod::HISTORICAL; }

            /**
             * @return "HistoricalVaR"
             */
            std::string get_name() const override;

            /**
             * @brief Linear-interpolation quantile of sorted data
             * @param sorted_values Values sorted ascending (non-empty)
             * @param probability Probability in [0, 1]
             * @throws std::invalid_argument if sorted_values is empty or
             *         probability is outside [0, 1]
             */
            static double quantile(const std::vector<double> &sorted_values,
                                   double probability);

            /**
             * @brief Recommended minimum number of observations for a confidence level
             * @return ceil(1 / alpha)
             */
            static size_t recommended_observations(const ConfidenceLevel &confidence);
        };

    } // namespace risk
} // namespace riskvar
