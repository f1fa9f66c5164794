/**
 * @file historical_var.cpp
 * @brief Implementation of the historical simulation VaR estimator
 */

#include "risk/historical_var.hpp"
#include <cmath>
#include <stdexcept>

namespace riskvar
{
    namespace risk
    {

        VaRResult HistoricalVaR::estimate(const ReturnSeries &returns,
                                          const ConfidenceLevel &confidence) const
        {
            validate_returns(returns);

            std::vector<double> sorted_returns = returns.sorted();
            const double threshold = quantile(sorted_returns, confidence.alpha());

            const bool sufficient = returns.size() >= recommended_observations(confidence);

            return make_result(VaRMethod::HISTORICAL, confidence, threshold,
                               returns.size(), sufficient);
        }

        std::string HistoricalVaR::get_name() const
        {
            return "HistoricalVaR";
        }

        double HistoricalVaR::quantile(const std::vector<double> &sorted_values,
                                       double probability)
        {
            if (sorted_values.empty())
            {
                throw std::invalid_argument("Cannot compute a quantile of an empty sample");
            }
            if (!(probability >= 0.0 && probability <= 1.0))
            {
                throw std::invalid_argument(
                    "Quantile probability must be in [0, 1], got: " + std::to_string(probability));
            }

            const size_t n = sorted_values.size();

            double index = probability * static_cast<double>(n - 1);
            size_t lower = static_cast<size_t>(std::floor(index));
            size_t upper = static_cast<size_t>(std::ceil(index));

            if (lower == upper || upper >= n)
            {
                return sorted_values[lower];
            }

            double frac = index - static_cast<double>(lower);
            return sorted_values[lower] + frac * (sorted_values[upper] - sorted_values[lower]);
        }

        size_t HistoricalVaR::recommended_observations(const ConfidenceLevel &confidence)
        {
            // Small epsilon keeps 1 / 0.05 from rounding up to 21
            return static_cast<size_t>(std::ceil(1.0 / confidence.alpha() - 1e-9));
        }

    } // namespace risk
} // namespace riskvar
