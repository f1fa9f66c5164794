/**
 * @file return_series.cpp
 * @brief Implementation of ReturnSeries and ReturnSeriesBuilder
 */

#include "data/return_series.hpp"
#include "risk/risk_errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace riskvar
{

    // ============================================================================
    // ReturnSeries
    // ============================================================================

    ReturnSeries::ReturnSeries(const Eigen::VectorXd &values)
        : ReturnSeries(values, {})
    {
    }

    ReturnSeries::ReturnSeries(const Eigen::VectorXd &values,
                               const std::vector<std::string> &dates)
        : values_(values), dates_(dates)
    {
        if (!dates_.empty() && dates_.size() != static_cast<size_t>(values_.size()))
        {
            throw std::invalid_argument("Return dates must be empty or match the number of returns");
        }

        if (!values_.allFinite())
        {
            throw std::invalid_argument("Return series contains NaN or Inf values.");
        }
    }

    double ReturnSeries::mean() const
    {
        if (empty())
        {
            throw risk::InsufficientDataError("Cannot compute the mean of an empty return series");
        }
        return values_.mean();
    }

    double ReturnSeries::standard_deviation() const
    {
        const Eigen::Index n = values_.size();
        if (n < 2)
        {
            throw risk::InsufficientDataError(
                "Need at least 2 returns to compute a sample standard deviation. Received: " + std::to_string(n));
        }

        // Bessel's correction: divide by (n-1) for the sample estimate
        Eigen::ArrayXd centered = values_.array() - values_.mean();
        return std::sqrt(centered.square().sum() / static_cast<double>(n - 1));
    }

    double ReturnSeries::min() const
    {
        if (empty())
        {
            throw risk::InsufficientDataError("Return series is empty");
        }
        return values_.minCoeff();
    }

    double ReturnSeries::max() const
    {
        if (empty())
        {
            throw risk::InsufficientDataError("Return series is empty");
        }
        return values_.maxCoeff();
    }

    std::vector<double> ReturnSeries::sorted() const
    {
        std::vector<double> sorted_returns(values_.data(), values_.data() + values_.size());
        std::sort(sorted_returns.begin(), sorted_returns.end());
        return sorted_returns;
    }

    ReturnSeries ReturnSeries::tail(size_t n) const
    {
        if (n >= size())
        {
            return *this;
        }

        const Eigen::Index count = static_cast<Eigen::Index>(n);
        std::vector<std::string> tail_dates;
        if (has_dates())
        {
            tail_dates.assign(dates_.end() - static_cast<std::ptrdiff_t>(n), dates_.end());
        }
        return ReturnSeries(values_.tail(count), tail_dates);
    }

    // ============================================================================
    // ReturnSeriesBuilder
    // ============================================================================

    ReturnSeries ReturnSeriesBuilder::build(const PriceSeries &prices)
    {
        if (prices.size() < 2)
        {
            throw risk::InsufficientDataError(
                "Need at least 2 price observations to calculate returns. Received: " + std::to_string(prices.size()));
        }

        const Eigen::VectorXd &p = prices.prices();
        const Eigen::Index n = p.size();

        Eigen::VectorXd returns(n - 1);

        // Prices are validated positive by PriceSeries, so the ratio is always defined
        for (Eigen::Index i = 0; i < n - 1; ++i)
        {
            returns(i) = std::log(p(i + 1) / p(i));
        }

        std::vector<std::string> dates(prices.dates().begin() + 1, prices.dates().end());

        return ReturnSeries(returns, dates);
    }

} // namespace riskvar
