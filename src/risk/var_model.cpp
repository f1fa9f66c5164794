/**
 * @file var_model.cpp
 * @brief Implementation of VaRModel base class utilities
 */

#include "risk/var_model.hpp"
#include "risk/risk_errors.hpp"

namespace riskvar
{
    namespace risk
    {
        VaRResult VaRModel::estimate(const ReturnSeries &returns, double confidence) const
        {
            return estimate(returns, ConfidenceLevel(confidence));
        }

        void VaRModel::validate_returns(const ReturnSeries &returns)
        {
            if (returns.size() < 2)
            {
                throw InsufficientDataError("Not enough observations to estimate VaR. Return series must have at least 2 observations. Received: " + std::to_string(returns.size()));
            }
        }

        VaRResult VaRModel::make_result(VaRMethod method,
                                        const ConfidenceLevel &confidence,
                                        double threshold_return,
                                        size_t num_observations,
                                        bool sufficient_sample)
        {
            VaRResult result;
            result.method = method;
            result.confidence_level = confidence.value();
            result.threshold_return = threshold_return;
            result.num_observations = static_cast<int>(num_observations);
            result.sufficient_sample = sufficient_sample;

            // Degenerate case: no downside at this confidence, report zero loss
            if (threshold_return >= 0.0)
            {
                result.var_value = 0.0;
                result.no_downside_risk = true;
            }
            else
            {
                result.var_value = -threshold_return;
                result.no_downside_risk = false;
            }

            return result;
        }

    } // namespace risk
} // namespace riskvar
