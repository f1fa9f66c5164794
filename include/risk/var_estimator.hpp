/**
 * @file var_estimator.hpp
 * @brief Runs one or more VaR models over a return series
 *
 * The estimator applies the configured estimation window and evaluates
 * each model at each requested confidence level. Both methodologies are
 * first-class: results are reported side by side and never reconciled.
 */

#pragma once

#include "risk/var_model.hpp"
#include "risk/var_model_factory.hpp"
#include <memory>
#include <vector>

namespace riskvar
{
    namespace risk
    {

        /**
         * @struct VaRComparison
         * @brief Parametric and historical results for the same inputs
         */
        struct VaRComparison
        {
            double confidence_level; ///< Shared confidence level
            VaRResult parametric;    ///< Variance-covariance estimate
            VaRResult historical;    ///< Historical simulation estimate
        };

        /**
         * @class VaREstimator
         * @brief Evaluates VaR models across confidence levels
         *
         * Usage Example:
         * @code
         * VaREstimator estimator;  // parametric + historical, all data
         * auto results = estimator.estimate_all(returns, {0.95, 0.99});
         * auto cmp = estimator.compare(returns, ConfidenceLevel(0.95));
         * @endcode
         *
         * Thread Safety: Immutable after construction.
         */
        class VaREstimator
        {
        public:
            /**
             * @brief Estimator with both methods over the full series
             */
            VaREstimator();

            /**
             * @brief Estimator configured from a VaRConfig
             * @throws std::invalid_argument if a method name is unknown
             */
            explicit VaREstimator(const VaRConfig &config);

            /**
             * @brief Estimator over an explicit set of models
             * @param models Models to evaluate, in reporting order (non-empty)
             * @param estimation_window Most recent N returns, or -1 for all
             * @throws std::invalid_argument if models is empty or the window is invalid
             */
            VaREstimator(std::vector<std::unique_ptr<VaRModel>> models,
                         int estimation_window = -1);

            /**
             * @brief Estimate with a single method
             * @throws InsufficientDataError if fewer than 2 returns in the window
             */
            VaRResult estimate(const ReturnSeries &returns,
                               const ConfidenceLevel &confidence,
                               VaRMethod method) const;

            /**
             * @brief Parametric and historical VaR for the same inputs
             * @throws InsufficientDataError if fewer than 2 returns in the window
             */
            VaRComparison compare(const ReturnSeries &returns,
                                  const ConfidenceLevel &confidence) const;

            /**
             * @brief One result per configured model and confidence level
             * @param returns Return series
             * @param confidence_levels Levels to evaluate; empty means the defaults (0.95, 0.99)
             * @return Results ordered by confidence level, then by model
             * @throws InvalidConfidenceLevelError before any estimation if a level is outside (0, 1)
             * @throws InsufficientDataError if fewer than 2 returns in the window
             */
            std::vector<VaRResult> estimate_all(const ReturnSeries &returns,
                                                const std::vector<double> &confidence_levels) const;

            /**
             * @brief Estimate at the configured confidence levels
             */
            std::vector<VaRResult> estimate_all(const ReturnSeries &returns) const;

            /**
             * @brief Apply the estimation window to a return series
             */
            ReturnSeries apply_window(const ReturnSeries &returns) const;

            int estimation_window() const { return estimation_window_; }
            const std::vector<double> &confidence_levels() const { return confidence_levels_; }

            /**
             * @brief Names of the configured models, in reporting order
             */
            std::vector<std::string> model_names() const;

        private:
            std::vector<std::unique_ptr<VaRModel>> models_; ///< Models in reporting order
            int estimation_window_;                         ///< -1 for all returns
            std::vector<double> confidence_levels_;         ///< Levels used by estimate_all(returns)
        };

    } // namespace risk
} // namespace riskvar
