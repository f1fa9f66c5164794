/**
 * @file return_histogram.cpp
 * @brief Implementation of ReturnHistogram.
 */

#include "analytics/return_histogram.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace riskvar
{
    namespace analytics
    {

        ReturnHistogram::ReturnHistogram(const ReturnSeries &returns, int num_bins)
        {
            if (num_bins < 1)
            {
                throw std::invalid_argument("Histogram needs at least 1 bin, got: " + std::to_string(num_bins));
            }
            if (returns.empty())
            {
                throw std::invalid_argument("Cannot build a histogram of an empty return series");
            }

            double lo = returns.min();
            double hi = returns.max();
            if (lo == hi)
            {
                lo -= 0.5;
                hi += 0.5;
            }

            width_ = (hi - lo) / static_cast<double>(num_bins);

            bins_.reserve(static_cast<size_t>(num_bins));
            for (int i = 0; i < num_bins; ++i)
            {
                HistogramBin bin;
                bin.lower = lo + width_ * static_cast<double>(i);
                bin.upper = (i == num_bins - 1) ? hi : lo + width_ * static_cast<double>(i + 1);
                bin.count = 0;
                bins_.push_back(bin);
            }

            for (size_t i = 0; i < returns.size(); ++i)
            {
                int idx = bin_index(returns[i]);
                // Every return lies within [lo, hi] by construction
                if (idx >= 0)
                {
                    ++bins_[static_cast<size_t>(idx)].count;
                }
            }
        }

        int ReturnHistogram::total_count() const
        {
            int total = 0;
            for (const auto &bin : bins_)
            {
                total += bin.count;
            }
            return total;
        }

        int ReturnHistogram::max_count() const
        {
            int max_c = 0;
            for (const auto &bin : bins_)
            {
                max_c = std::max(max_c, bin.count);
            }
            return max_c;
        }

        int ReturnHistogram::bin_index(double value) const
        {
            if (value < lower_edge() || value > upper_edge())
            {
                return -1;
            }

            int idx = static_cast<int>(std::floor((value - lower_edge()) / width_));

            // Right edge belongs to the last bin; rounding may also overshoot by one
            idx = std::min(idx, num_bins() - 1);

            // Guard against rounding placing a value just below its bin's lower edge
            while (idx > 0 && value < bins_[static_cast<size_t>(idx)].lower)
            {
                --idx;
            }
            while (idx < num_bins() - 1 && value >= bins_[static_cast<size_t>(idx)].upper)
            {
                ++idx;
            }

            return idx;
        }

    } // namespace analytics
} // namespace riskvar
