/**
 * @file return_histogram.hpp
 * @brief Equal-width histogram of a return series.
 *
 * Bin edges span [min, max] of the returns. Every bin is half-open
 * [lower, upper) except the last, which also includes its upper edge, so
 * the counts always sum to the number of returns. A series whose values
 * are all equal is given the range [v - 0.5, v + 0.5].
 */

#ifndef RISKVAR_ANALYTICS_RETURN_HISTOGRAM_HPP
#define RISKVAR_ANALYTICS_RETURN_HISTOGRAM_HPP

#include "data/return_series.hpp"
#include <vector>

namespace riskvar
{
    namespace analytics
    {

        /**
         * @struct HistogramBin
         * @brief One histogram bucket.
         */
        struct HistogramBin
        {
            double lower; ///< Inclusive lower edge
            double upper; ///< Upper edge (inclusive only for the last bin)
            int count;    ///< Number of returns in the bin
        };

        /**
         * @class ReturnHistogram
         * @brief Frequency distribution of returns for presentation.
         */
        class ReturnHistogram
        {
        public:
            /**
             * @brief Bin a return series.
             * @param returns Non-empty return series.
             * @param num_bins Number of equal-width bins (default 50).
             * @throws std::invalid_argument if num_bins < 1 or returns is empty.
             */
            explicit ReturnHistogram(const ReturnSeries &returns, int num_bins = 50);

            const std::vector<HistogramBin> &bins() const { return bins_; }
            int num_bins() const { return static_cast<int>(bins_.size()); }

            int total_count() const;
            int max_count() const;

            double lower_edge() const { return bins_.front().lower; }
            double upper_edge() const { return bins_.back().upper; }

            /**
             * @brief Index of the bin containing a value.
             * @return Bin index, or -1 if the value lies outside the histogram range.
             */
            int bin_index(double value) const;

        private:
            std::vector<HistogramBin> bins_;
            double width_;
        };

    } // namespace analytics
} // namespace riskvar

#endif // RISKVAR_ANALYTICS_RETURN_HISTOGRAM_HPP
