/*
 * @file price_series.hpp
 * @brief Immutable, validated time series of asset or portfolio prices.
 *
 * A PriceSeries is built once from loaded data and never modified. Its
 * constructor rejects any state that would corrupt a return calculation:
 * misaligned dates, unordered dates and non-positive or non-finite prices.
 */

#ifndef RISKVAR_DATA_PRICE_SERIES_HPP
#define RISKVAR_DATA_PRICE_SERIES_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskvar
{

    /**
     * @class PriceSeries
     * @brief Ordered sequence of (date, price) observations.
     *
     * Dates are YYYY-MM-DD strings in strictly ascending order. Every price
     * is finite and strictly positive.
     *
     * @note Prices are stored as an Eigen vector aligned with dates().
     */
    class PriceSeries
    {
    public:
        /**
         * @brief Construct and validate a price series.
         * @param dates Date strings (YYYY-MM-DD), strictly ascending.
         * @param prices Prices aligned with dates.
         * @throws std::invalid_argument if sizes differ, a date is malformed
         *         or dates are not strictly ascending.
         * @throws risk::InvalidPriceError if any price is <= 0 or not finite.
         */
        PriceSeries(const std::vector<std::string> &dates,
                    const Eigen::VectorXd &prices);

        /**
         * @brief Convenience constructor from a std::vector of prices.
         */
        PriceSeries(const std::vector<std::string> &dates,
                    const std::vector<double> &prices);

        ~PriceSeries() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::VectorXd &prices() const
        {
            return prices_;
        }

        const std::vector<std::string> &dates() const
        {
            return dates_;
        }

        size_t size() const
        {
            return static_cast<size_t>(prices_.size());
        }

        bool empty() const
        {
            return prices_.size() == 0;
        }

        /**
         * @brief First price in the series.
         * @throws std::out_of_range if the series is empty.
         */
        double first_price() const;

        /**
         * @brief Last price in the series.
         * @throws std::out_of_range if the series is empty.
         */
        double last_price() const;

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Filter observations by date range.
         * @param start_date Start date (inclusive), empty for no lower bound.
         * @param end_date End date (inclusive), empty for no upper bound.
         * @return New PriceSeries with the observations inside the range.
         */
        PriceSeries filter_by_date(const std::string &start_date,
                                   const std::string &end_date) const;

        /**
         * @brief Check a date string for the YYYY-MM-DD layout.
         */
        static bool is_valid_date_format(const std::string &date);

    private:
        /**
         * @brief Validate dates and prices, throwing on the first violation.
         */
        void validate() const;

        Eigen::VectorXd prices_;         ///< Prices aligned with dates_
        std::vector<std::string> dates_; ///< Observation dates
    };

} // namespace riskvar

#endif // RISKVAR_DATA_PRICE_SERIES_HPP
