/**
 * @file normal_distribution.hpp
 * @brief Standard normal distribution helpers for parametric VaR
 */

#pragma once

namespace riskvar
{
    namespace risk
    {
        namespace stats
        {

            /**
             * @brief Standard normal PDF: phi(x) = (1/sqrt(2*pi)) * exp(-x^2/2)
             */
            double normal_pdf(double x);

            /**
             * @brief Standard normal CDF computed through std::erfc
             */
            double normal_cdf(double x);

            /**
             * @brief Inverse standard normal CDF (probit)
             *
             * Acklam's rational approximation (relative error ~1.15e-9)
             * followed by one Halley refinement step against normal_cdf,
             * which brings the result close to full double precision.
             *
             * @param p Probability in (0, 1)
             * @return z such that Phi(z) = p
             * @throws std::invalid_argument if p is outside (0, 1)
             */
            double inverse_normal_cdf(double p);

        } // namespace stats
    } // namespace risk
} // namespace riskvar
