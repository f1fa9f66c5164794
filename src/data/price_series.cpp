/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries
 */

#include "data/price_series.hpp"
#include "risk/risk_errors.hpp"
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace riskvar
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceSeries::PriceSeries(const std::vector<std::string> &dates,
                             const Eigen::VectorXd &prices)
        : prices_(prices), dates_(dates)
    {
        validate();
    }

    PriceSeries::PriceSeries(const std::vector<std::string> &dates,
                             const std::vector<double> &prices)
        : prices_(Eigen::Map<const Eigen::VectorXd>(prices.data(),
                                                   static_cast<Eigen::Index>(prices.size()))),
          dates_(dates)
    {
        validate();
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    double PriceSeries::first_price() const
    {
        if (empty())
        {
            throw std::out_of_range("PriceSeries is empty");
        }
        return prices_(0);
    }

    double PriceSeries::last_price() const
    {
        if (empty())
        {
            throw std::out_of_range("PriceSeries is empty");
        }
        return prices_(prices_.size() - 1);
    }

    // ============================================================================
    // Filtering Methods
    // ============================================================================

    PriceSeries PriceSeries::filter_by_date(const std::string &start_date,
                                            const std::string &end_date) const
    {
        std::vector<std::string> filtered_dates;
        std::vector<double> filtered_prices;

        // YYYY-MM-DD compares correctly as a plain string
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!start_date.empty() && dates_[i] < start_date)
            {
                continue;
            }
            if (!end_date.empty() && dates_[i] > end_date)
            {
                continue;
            }
            filtered_dates.push_back(dates_[i]);
            filtered_prices.push_back(prices_(static_cast<Eigen::Index>(i)));
        }

        return PriceSeries(filtered_dates, filtered_prices);
    }

    bool PriceSeries::is_valid_date_format(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    // ============================================================================
    // Validation
    // ============================================================================

    void PriceSeries::validate() const
    {
        if (static_cast<size_t>(prices_.size()) != dates_.size())
        {
            throw std::invalid_argument(
                "Price vector size (" + std::to_string(prices_.size()) +
                ") must match dates vector size (" + std::to_string(dates_.size()) + ")");
        }

        // Prices first: an invalid price must surface before anything else
        for (Eigen::Index i = 0; i < prices_.size(); ++i)
        {
            double price = prices_(i);
            if (!std::isfinite(price) || price <= 0.0)
            {
                std::ostringstream oss;
                oss << "Invalid price " << price << " at index " << i;
                if (static_cast<size_t>(i) < dates_.size())
                {
                    oss << " (" << dates_[static_cast<size_t>(i)] << ")";
                }
                oss << ": prices must be finite and strictly positive";
                throw risk::InvalidPriceError(oss.str());
            }
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!is_valid_date_format(dates_[i]))
            {
                throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): '" + dates_[i] + "'");
            }
            if (i > 0 && !(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument(
                    "Dates must be strictly ascending: '" + dates_[i - 1] +
                    "' is followed by '" + dates_[i] + "'");
            }
        }
    }

} // namespace riskvar
