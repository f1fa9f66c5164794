/**
 * @file risk_report.cpp
 * @brief Implementation of the RiskReport class.
 *
 * Percentages in the text report are shown with 4 decimal places; JSON
 * values are raw fractions.
 */

#include "analytics/risk_report.hpp"
#include "risk/risk_errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <utility>

namespace riskvar
{
    namespace analytics
    {

        namespace
        {
            bool same_level(double a, double b)
            {
                return std::abs(a - b) < 1e-12;
            }

            std::string method_key(risk::VaRMethod method)
            {
                return method == risk::VaRMethod::PARAMETRIC ? "parametric" : "historical";
            }

        } // anonymous namespace

        // ===================================================================
        // Construction
        // ===================================================================

        RiskReport::RiskReport(const ReturnSeries &returns,
                               std::vector<risk::VaRResult> results)
            : num_observations_(static_cast<int>(returns.size())), mean_return_(0.0), daily_volatility_(0.0), results_(std::move(results))
        {
            if (returns.size() < 2)
            {
                throw risk::InsufficientDataError(
                    "Risk report needs at least 2 returns. Received: " + std::to_string(returns.size()));
            }

            mean_return_ = returns.mean();
            daily_volatility_ = returns.standard_deviation();
        }

        // ===================================================================
        // Lookup
        // ===================================================================

        std::vector<double> RiskReport::confidence_levels() const
        {
            std::vector<double> levels;
            for (const auto &r : results_)
            {
                bool seen = false;
                for (double level : levels)
                {
                    if (same_level(level, r.confidence_level))
                    {
                        seen = true;
                        break;
                    }
                }
                if (!seen)
                {
                    levels.push_back(r.confidence_level);
                }
            }
            return levels;
        }

        std::optional<risk::VaRResult> RiskReport::find(risk::VaRMethod method,
                                                        double confidence_level) const
        {
            for (const auto &r : results_)
            {
                if (r.method == method && same_level(r.confidence_level, confidence_level))
                {
                    return r;
                }
            }
            return std::nullopt;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string RiskReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << std::string(40, '=') << "\n";
            oss << "   MARKET RISK ANALYSIS REPORT\n";
            oss << std::string(40, '=') << "\n";
            oss << "Observations:        " << num_observations_ << "\n";
            oss << "Mean Return (Daily): " << std::setprecision(4)
                << mean_return_ * 100.0 << "%\n";
            oss << "Volatility (Daily):  " << std::setprecision(4)
                << daily_volatility_ << "\n";

            for (double level : confidence_levels())
            {
                oss << std::string(40, '-') << "\n";
                oss << "Confidence Level: " << std::setprecision(2)
                    << level * 100.0 << "%\n";

                // Historical first, then parametric
                for (auto method : {risk::VaRMethod::HISTORICAL, risk::VaRMethod::PARAMETRIC})
                {
                    auto r = find(method, level);
                    if (!r)
                    {
                        continue;
                    }

                    std::string label = risk::to_string(method) + " VaR:";
                    oss << "  " << std::left << std::setw(17) << label << std::right
                        << std::setprecision(4) << r->var_value * 100.0 << "%"
                        << "  (threshold " << r->threshold_return * 100.0 << "%)";
                    if (r->no_downside_risk)
                    {
                        oss << "  [no downside risk]";
                    }
                    if (!r->sufficient_sample)
                    {
                        oss << "  [small sample]";
                    }
                    oss << "\n";
                }
            }
            oss << std::string(40, '=') << "\n";

            bool has_parametric = false;
            for (double level : confidence_levels())
            {
                auto r = find(risk::VaRMethod::PARAMETRIC, level);
                if (!r)
                {
                    continue;
                }
                if (!has_parametric)
                {
                    oss << "\nInterpretation:\n";
                    has_parametric = true;
                }
                oss << "With " << std::setprecision(2) << level * 100.0
                    << "% confidence, the maximum expected daily loss\n"
                    << "will not exceed " << r->var_value * 100.0
                    << "% (Parametric model).\n";
            }

            return oss.str();
        }

        std::string RiskReport::to_json() const
        {
            nlohmann::json j;

            j["return_statistics"]["num_observations"] = num_observations_;
            j["return_statistics"]["mean_return"] = mean_return_;
            j["return_statistics"]["daily_volatility"] = daily_volatility_;

            j["var_results"] = nlohmann::json::array();
            for (const auto &r : results_)
            {
                nlohmann::json entry;
                entry["method"] = method_key(r.method);
                entry["confidence_level"] = r.confidence_level;
                entry["var_value"] = r.var_value;
                entry["threshold_return"] = r.threshold_return;
                entry["no_downside_risk"] = r.no_downside_risk;
                entry["num_observations"] = r.num_observations;
                entry["sufficient_sample"] = r.sufficient_sample;
                j["var_results"].push_back(entry);
            }

            return j.dump(2);
        }

    } // namespace analytics
} // namespace riskvar
