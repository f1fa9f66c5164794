/**
 * @file var_model.hpp
 * @brief Abstract interface for Value-at-Risk estimation methods
 *
 * Every VaR model consumes the same ReturnSeries and ConfidenceLevel and
 * produces a VaRResult. Models differ only in their distributional
 * assumptions.
 *
 * Thread Safety: Implementations hold no mutable state and are safe to
 * call concurrently.
 */

#pragma once

#include "data/return_series.hpp"
#include "risk/var_types.hpp"
#include <string>

namespace riskvar
{
    namespace risk
    {

        /**
         * @class VaRModel
         * @brief Abstract base class for VaR estimators
         *
         * Usage Example:
         * @code
         * auto model = std::make_unique<ParametricVaR>();
         * VaRResult r = model->estimate(returns, ConfidenceLevel(0.95));
         * std::cout << r.var_value << std::endl;
         * @endcode
         */
        class VaRModel
        {
        public:
            virtual ~VaRModel() = default;

            /**
             * @brief Estimate VaR for a return series
             * @param returns Return series with at least 2 observations
             * @param confidence Validated confidence level
             * @return VaRResult for this model's method
             * @throws InsufficientDataError if returns has fewer than 2 observations
             */
            virtual VaRResult estimate(const ReturnSeries &returns,
                                       const ConfidenceLevel &confidence) const = 0;

            /**
             * @brief Estimate VaR from a raw confidence value
             * @throws InvalidConfidenceLevelError if confidence is outside (0, 1)
             */
            VaRResult estimate(const ReturnSeries &returns, double confidence) const;

            /**
             * @brief Methodology implemented by this model
             */
            virtual VaRMethod method() const = 0;

            /**
             * @brief Get the name of the VaR model
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Validate the return series
             * @throws InsufficientDataError if fewer than 2 returns
             */
            static void validate_returns(const ReturnSeries &returns);

            /**
             * @brief Assemble a result from a threshold return
             *
             * Applies the loss sign convention: var_value = -threshold,
             * clamped to 0 when the threshold is non-negative.
             */
            static VaRResult make_result(VaRMethod method,
                                         const ConfidenceLevel &confidence,
                                         double threshold_return,
                                         size_t num_observations,
                                         bool sufficient_sample);
        };

    } // namespace risk
} // namespace riskvar
