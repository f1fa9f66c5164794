/**
 * @file var_types.hpp
 * @brief Value types shared by all VaR models
 *
 * Defines the estimation method tag, the validated confidence level and
 * the immutable result produced by a single estimation call.
 */

#pragma once

#include <string>
#include <vector>

namespace riskvar
{
    namespace risk
    {

        /**
         * @enum VaRMethod
         * @brief Methodology used to estimate Value-at-Risk.
         */
        enum class VaRMethod
        {
            PARAMETRIC, ///< Normal fit: mean + z * std dev
            HISTORICAL  ///< Empirical quantile of observed returns
        };

        /**
         * @brief Human-readable name of a VaR method
         * @return "Parametric" or "Historical"
         */
        std::string to_string(VaRMethod method);

        /**
         * @class ConfidenceLevel
         * @brief Confidence level strictly inside (0, 1)
         *
         * The one-sided tail probability is alpha = 1 - confidence.
         *
         * Usage Example:
         * @code
         * ConfidenceLevel cl(0.99);
         * double tail = cl.alpha();  // 0.01
         * @endcode
         */
        class ConfidenceLevel
        {
        public:
            /**
             * @brief Construct and validate a confidence level
             * @param value Confidence in (0, 1)
             * @throws InvalidConfidenceLevelError if value is outside (0, 1) or NaN
             */
            explicit ConfidenceLevel(double value);

            double value() const { return value_; }

            /**
             * @brief Tail probability (1 - confidence)
             */
            double alpha() const { return 1.0 - value_; }

            /**
             * @brief Default confidence levels used when the caller supplies none
             * @return {0.95, 0.99}
             */
            static std::vector<ConfidenceLevel> defaults();

        private:
            double value_;
        };

        /**
         * @struct VaRResult
         * @brief Output of one (returns, confidence, method) estimation
         *
         * var_value is a loss magnitude and is never negative. When the
         * threshold return is non-negative there is no downside at that
         * confidence: var_value is clamped to 0 and no_downside_risk is set.
         */
        struct VaRResult
        {
            VaRMethod method;        ///< Estimation method
            double confidence_level; ///< Confidence in (0, 1)
            double var_value;        ///< Loss magnitude, >= 0
            double threshold_return; ///< Signed return at the alpha quantile
            bool no_downside_risk;   ///< threshold_return >= 0, var_value clamped to 0
            int num_observations;    ///< Size of the return series used
            bool sufficient_sample;  ///< At least ceil(1/alpha) observations
        };

    } // namespace risk
} // namespace riskvar
