/**
 * @file parametric_var.hpp
 * @brief Variance-covariance (parametric) VaR estimator
 *
 * Fits a normal distribution to the returns and reads the loss threshold
 * off the normal quantile:
 *     threshold = mu + z_alpha * sigma
 * where mu and sigma are the sample mean and sample standard deviation
 * (n-1 denominator) and z_alpha = Phi^-1(1 - confidence).
 *
 * Closed-form and fast, but sensitive to the normality assumption and to
 * estimation error in mu and sigma from short samples.
 */

#pragma once

#include "risk/var_model.hpp"

namespace riskvar
{
    namespace risk
    {

        /**
         * @class ParametricVaR
         * @brief Normal-distribution VaR estimator
         *
         * Properties:
         * - VaR grows monotonically with the confidence level
         * - Zero-variance series at zero mean yield a VaR of exactly 0
         * - Ignores skew and fat tails
         */
        class ParametricVaR : public VaRModel
        {
        public:
            ParametricVaR() = default;
            ~ParametricVaR() override = default;

            using VaRModel::estimate;

            /**
             * @brief Estimate parametric VaR
             * @param returns Return series (>= 2 observations)
             * @param confidence Confidence level
             * @return VaRResult with method PARAMETRIC
             * @throws InsufficientDataError if fewer than 2 returns
             *
             * Time complexity: O(T)
             */
            VaRResult estimate(const ReturnSeries &returns,
                               const ConfidenceLevel &confidence) const override;

            VaRMethod method() const override { return VaRMethod::PARAMETRIC; }

            /**
             * @return "ParametricVaR"
             */
            std::string get_name() const override;

            /**
             * @brief z-score for a confidence level
             * @return Phi^-1(1 - confidence), negative for confidence > 0.5
             */
            static double z_score(const ConfidenceLevel &confidence);
        };

    } // namespace risk
} // namespace riskvar
