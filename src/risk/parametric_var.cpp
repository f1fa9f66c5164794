/**
 * @file parametric_var.cpp
 * @brief Implementation of the parametric VaR estimator
 */

#include "risk/parametric_var.hpp"
#include "risk/normal_distribution.hpp"

namespace riskvar
{
    namespace risk
    {

        VaRResult ParametricVaR::estimate(const ReturnSeries &returns,
                                          const ConfidenceLevel &confidence) const
        {
            validate_returns(returns);

            const double mu = returns.mean();
            const double sigma = returns.standard_deviation();
            const double z = z_score(confidence);

            const double threshold = mu + z * sigma;

            return make_result(VaRMethod::PARAMETRIC, confidence, threshold,
                               returns.size(), true);
        }

        std::string ParametricVaR::get_name() const
        {
            return "ParametricVaR";
        }

        double ParametricVaR::z_score(const ConfidenceLevel &confidence)
        {
            return stats::inverse_normal_cdf(confidence.alpha());
        }

    } // namespace risk
} // namespace riskvar
