/**
 * @file var_types.cpp
 * @brief Implementation of VaR value types
 */

#include "risk/var_types.hpp"
#include "risk/risk_errors.hpp"
#include <cmath>

namespace riskvar
{
    namespace risk
    {

        std::string to_string(VaRMethod method)
        {
            switch (method)
            {
            case VaRMethod::PARAMETRIC:
                return "Parametric";
            case VaRMethod::HISTORICAL:
                return "Historical";
            }
            return "Unknown";
        }

        ConfidenceLevel::ConfidenceLevel(double value) : value_(value)
        {
            // Negated comparison also rejects NaN
            if (!(value > 0.0 && value < 1.0))
            {
                throw InvalidConfidenceLevelError(
                    "Confidence level must be in (0, 1), got: " + std::to_string(value));
            }
        }

        std::vector<ConfidenceLevel> ConfidenceLevel::defaults()
        {
            return {ConfidenceLevel(0.95), ConfidenceLevel(0.99)};
        }

    } // namespace risk
} // namespace riskvar
