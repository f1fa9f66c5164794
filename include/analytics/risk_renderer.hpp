/**
 * @file risk_renderer.hpp
 * @brief Presentation interface for return distributions and VaR thresholds.
 *
 * Rendering is a side effect and sits behind this narrow interface so the
 * estimators stay pure. ConsoleHistogramRenderer draws a text histogram;
 * other front ends implement render() the same way.
 */

#ifndef RISKVAR_ANALYTICS_RISK_RENDERER_HPP
#define RISKVAR_ANALYTICS_RISK_RENDERER_HPP

#include "data/return_series.hpp"
#include "risk/var_types.hpp"

#include <ostream>
#include <vector>

namespace riskvar
{
    namespace analytics
    {

        /**
         * @class RiskRenderer
         * @brief Abstract sink for a return series and its VaR results.
         */
        class RiskRenderer
        {
        public:
            virtual ~RiskRenderer() = default;

            /**
             * @brief Present the return distribution with VaR thresholds marked.
             * @param returns Return series the results were computed from.
             * @param results VaR results whose threshold_return values are marked.
             */
            virtual void render(const ReturnSeries &returns,
                                const std::vector<risk::VaRResult> &results) = 0;
        };

        /**
         * @class ConsoleHistogramRenderer
         * @brief Horizontal text histogram with threshold markers.
         *
         * One line per bin: range, bar, count, then a marker for each VaR
         * threshold that falls in the bin, e.g.
         * @code
         *   [-0.0312, -0.0291)  ###        3  <- Historical 95.00%
         * @endcode
         */
        class ConsoleHistogramRenderer : public RiskRenderer
        {
        public:
            /**
             * @param out Destination stream (must outlive the renderer).
             * @param num_bins Number of histogram bins.
             * @param bar_width Width in characters of the longest bar.
             * @throws std::invalid_argument if num_bins or bar_width < 1.
             */
            explicit ConsoleHistogramRenderer(std::ostream &out,
                                              int num_bins = 50,
                                              int bar_width = 50);

            void render(const ReturnSeries &returns,
                        const std::vector<risk::VaRResult> &results) override;

        private:
            std::ostream &out_;
            int num_bins_;
            int bar_width_;
        };

    } // namespace analytics
} // namespace riskvar

#endif // RISKVAR_ANALYTICS_RISK_RENDERER_HPP
