/**
 * @file risk_errors.hpp
 * @brief Exception types raised by the return builder and VaR estimators
 *
 * All errors derive from std::invalid_argument: each one signals that the
 * caller supplied inputs the computation cannot accept. None of them is
 * retryable with the same inputs.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace riskvar
{
    namespace risk
    {

        /**
         * @class InsufficientDataError
         * @brief Fewer observations than the computation requires
         *
         * Raised when building returns from fewer than 2 prices, or when
         * estimating VaR from fewer than 2 returns.
         */
        class InsufficientDataError : public std::invalid_argument
        {
        public:
            explicit InsufficientDataError(const std::string &what)
                : std::invalid_argument(what) {}
        };

        /**
         * @class InvalidConfidenceLevelError
         * @brief Confidence level outside the open interval (0, 1)
         */
        class InvalidConfidenceLevelError : public std::invalid_argument
        {
        public:
            explicit InvalidConfidenceLevelError(const std::string &what)
                : std::invalid_argument(what) {}
        };

        /**
         * @class InvalidPriceError
         * @brief Non-positive or non-finite price in a price series
         */
        class InvalidPriceError : public std::invalid_argument
        {
        public:
            explicit InvalidPriceError(const std::string &what)
                : std::invalid_argument(what) {}
        };

    } // namespace risk
} // namespace riskvar
