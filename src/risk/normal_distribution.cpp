/**
 * @file normal_distribution.cpp
 * @brief Implementation of standard normal distribution helpers
 */

#include "risk/normal_distribution.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace riskvar
{
    namespace risk
    {
        namespace stats
        {

            namespace
            {
                const double INV_SQRT_2PI = 0.3989422804014327;
                const double SQRT_2PI = 2.5066282746310002;
                const double INV_SQRT_2 = 0.7071067811865476;

                /**
                 * @brief Acklam's rational approximation of the probit function
                 */
                double acklam_probit(double p)
                {
                    static const double a[] = {
                        -3.969683028665376e+01, 2.209460984245205e+02,
                        -2.759285104469687e+02, 1.383577518672690e+02,
                        -3.066479806614716e+01, 2.506628277459239e+00};
                    static const double b[] = {
                        -5.447609879822406e+01, 1.615858368580409e+02,
                        -1.556989798598866e+02, 6.680131188771972e+01,
                        -1.328068155288572e+01};
                    static const double c[] = {
                        -7.784894002430293e-03, -3.223964580411365e-01,
                        -2.400758277161838e+00, -2.549732539343734e+00,
                        4.374664141464968e+00, 2.938163982698783e+00};
                    static const double d[] = {
                        7.784695709041462e-03, 3.224671290700398e-01,
                        2.445134137142996e+00, 3.754408661907416e+00};

                    static const double P_LOW = 0.02425;
                    static const double P_HIGH = 1.0 - P_LOW;

                    double q;
                    double r;

                    if (p < P_LOW)
                    {
                        // Lower tail
                        q = std::sqrt(-2.0 * std::log(p));
                        return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
                    }
                    else if (p <= P_HIGH)
                    {
                        // Central region
                        q = p - 0.5;
                        r = q * q;
                        return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q / (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
                    }
                    else
                    {
                        // Upper tail
                        q = std::sqrt(-2.0 * std::log(1.0 - p));
                        return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
                    }
                }

            } // anonymous namespace

            double normal_pdf(double x)
            {
                return INV_SQRT_2PI * std::exp(-0.5 * x * x);
            }

            double normal_cdf(double x)
            {
                return 0.5 * std::erfc(-x * INV_SQRT_2);
            }

            double inverse_normal_cdf(double p)
            {
                if (!(p > 0.0 && p < 1.0))
                {
                    throw std::invalid_argument(
                        "Probability must be in (0, 1), got: " + std::to_string(p));
                }

                double x = acklam_probit(p);

                // One Halley step: x <- x - u / (1 + x * u / 2)
                double e = normal_cdf(x) - p;
                double u = e * SQRT_2PI * std::exp(0.5 * x * x);
                x = x - u / (1.0 + 0.5 * x * u);

                return x;
            }

        } // namespace stats
    } // namespace risk
} // namespace riskvar
