/**
 * @file risk_renderer.cpp
 * @brief Implementation of ConsoleHistogramRenderer.
 */

#include "analytics/risk_renderer.hpp"
#include "analytics/return_histogram.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace riskvar
{
    namespace analytics
    {

        namespace
        {
            std::string marker_label(const risk::VaRResult &r)
            {
                std::ostringstream oss;
                oss << risk::to_string(r.method) << " " << std::fixed
                    << std::setprecision(2) << r.confidence_level * 100.0 << "%";
                return oss.str();
            }

        } // anonymous namespace

        ConsoleHistogramRenderer::ConsoleHistogramRenderer(std::ostream &out,
                                                           int num_bins,
                                                           int bar_width)
            : out_(out), num_bins_(num_bins), bar_width_(bar_width)
        {
            if (num_bins_ < 1 || bar_width_ < 1)
            {
                throw std::invalid_argument("Histogram bins and bar width must be at least 1");
            }
        }

        void ConsoleHistogramRenderer::render(const ReturnSeries &returns,
                                              const std::vector<risk::VaRResult> &results)
        {
            ReturnHistogram histogram(returns, num_bins_);
            const int max_count = histogram.max_count();

            // Thresholds outside the observed range (parametric tails) get their own lines
            std::vector<std::string> below;
            std::vector<std::string> above;
            std::vector<std::vector<std::string>> markers(static_cast<size_t>(histogram.num_bins()));

            for (const auto &r : results)
            {
                int idx = histogram.bin_index(r.threshold_return);
                if (idx >= 0)
                {
                    markers[static_cast<size_t>(idx)].push_back(marker_label(r));
                }
                else if (r.threshold_return < histogram.lower_edge())
                {
                    below.push_back(marker_label(r));
                }
                else
                {
                    above.push_back(marker_label(r));
                }
            }

            out_ << "\nReturn Distribution & VaR Thresholds (" << returns.size()
                 << " daily log returns)\n";
            out_ << std::string(60, '-') << "\n";

            for (const auto &label : below)
            {
                out_ << "  <- " << label << " (below observed range)\n";
            }

            const std::ios_base::fmtflags saved_flags = out_.flags();
            const std::streamsize saved_precision = out_.precision();
            out_ << std::fixed << std::setprecision(4);
            const auto &bins = histogram.bins();
            for (size_t i = 0; i < bins.size(); ++i)
            {
                int len = max_count > 0 ? bins[i].count * bar_width_ / max_count : 0;
                if (bins[i].count > 0 && len == 0)
                {
                    len = 1;
                }

                bool last = (i + 1 == bins.size());
                out_ << "[" << std::setw(8) << bins[i].lower << ", "
                     << std::setw(8) << bins[i].upper << (last ? "]" : ")") << " "
                     << std::left << std::setw(bar_width_) << std::string(static_cast<size_t>(len), '#')
                     << std::right << " " << std::setw(5) << bins[i].count;

                for (const auto &label : markers[i])
                {
                    out_ << "  <- " << label;
                }
                out_ << "\n";
            }

            for (const auto &label : above)
            {
                out_ << "  <- " << label << " (above observed range)\n";
            }

            out_ << std::string(60, '-') << std::endl;

            out_.flags(saved_flags);
            out_.precision(saved_precision);
        }

    } // namespace analytics
} // namespace riskvar
