/*
 * @file return_series.hpp
 * @brief Logarithmic return series and the builder that derives it from prices.
 *
 * Returns are continuously compounded: r_i = ln(P_{i+1} / P_i). They are
 * additive across time, so exp(sum(r)) recovers P_last / P_first.
 */

#ifndef RISKVAR_DATA_RETURN_SERIES_HPP
#define RISKVAR_DATA_RETURN_SERIES_HPP

#include "data/price_series.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskvar
{

    /**
     * @class ReturnSeries
     * @brief Immutable ordered sequence of finite log returns.
     *
     * When built from a PriceSeries each return carries the date of the later
     * price of its pair. A series constructed directly from values (for
     * example a portfolio return stream computed elsewhere) may omit dates.
     */
    class ReturnSeries
    {
    public:
        /**
         * @brief Construct from return values without dates.
         * @param values Returns in chronological order.
         * @throws std::invalid_argument if any value is NaN or Inf.
         */
        explicit ReturnSeries(const Eigen::VectorXd &values);

        /**
         * @brief Construct from return values and their dates.
         * @param values Returns in chronological order.
         * @param dates One date per return, or empty.
         * @throws std::invalid_argument if any value is not finite or sizes differ.
         */
        ReturnSeries(const Eigen::VectorXd &values,
                     const std::vector<std::string> &dates);

        ~ReturnSeries() = default;

        const Eigen::VectorXd &values() const { return values_; }
        const std::vector<std::string> &dates() const { return dates_; }
        size_t size() const { return static_cast<size_t>(values_.size()); }
        bool empty() const { return values_.size() == 0; }
        bool has_dates() const { return !dates_.empty(); }

        double operator[](size_t i) const { return values_(static_cast<Eigen::Index>(i)); }

        /** ===========================================
         *  Statistical Methods
         *  ===========================================
         */

        /**
         * @brief Sample mean of the returns.
         * @throws risk::InsufficientDataError if the series is empty.
         */
        double mean() const;

        /**
         * @brief Sample standard deviation (n-1 denominator).
         * @throws risk::InsufficientDataError if fewer than 2 returns.
         */
        double standard_deviation() const;

        double min() const;
        double max() const;

        /**
         * @brief Copy of the returns sorted ascending.
         */
        std::vector<double> sorted() const;

        /**
         * @brief Most recent n returns.
         * @param n Window length; a series shorter than n is returned whole.
         */
        ReturnSeries tail(size_t n) const;

    private:
        Eigen::VectorXd values_;         ///< Log returns
        std::vector<std::string> dates_; ///< Date of each return, may be empty
    };

    /**
     * @class ReturnSeriesBuilder
     * @brief Converts a PriceSeries into a ReturnSeries of log returns.
     *
     * Usage Example:
     * @code
     * PriceSeries prices(dates, closes);
     * ReturnSeries returns = ReturnSeriesBuilder::build(prices);
     * @endcode
     */
    class ReturnSeriesBuilder
    {
    public:
        /**
         * @brief Compute ln(p[i+1] / p[i]) for every consecutive price pair.
         * @param prices Validated price series with at least 2 observations.
         * @return ReturnSeries of size prices.size() - 1, chronological.
         * @throws risk::InsufficientDataError if fewer than 2 prices.
         */
        static ReturnSeries build(const PriceSeries &prices);
    };

} // namespace riskvar

#endif // RISKVAR_DATA_RETURN_SERIES_HPP
