/**
 * @file var_estimator.cpp
 * @brief Implementation of VaREstimator
 */

#include "risk/var_estimator.hpp"
#include "risk/risk_errors.hpp"

namespace riskvar
{
    namespace risk
    {

        VaREstimator::VaREstimator()
            : VaREstimator(VaRConfig{})
        {
        }

        VaREstimator::VaREstimator(const VaRConfig &config)
            : VaREstimator(VaRModelFactory::create_all(config), config.estimation_window)
        {
            confidence_levels_ = config.confidence_levels;
        }

        VaREstimator::VaREstimator(std::vector<std::unique_ptr<VaRModel>> models,
                                   int estimation_window)
            : models_(std::move(models)), estimation_window_(estimation_window), confidence_levels_({0.95, 0.99})
        {
            if (models_.empty())
            {
                throw std::invalid_argument("VaREstimator requires at least one model");
            }
            if (estimation_window_ == 0 || estimation_window_ < -1)
            {
                throw std::invalid_argument(
                    "Estimation window must be -1 (all data) or positive, got: " + std::to_string(estimation_window_));
            }
        }

        VaRResult VaREstimator::estimate(const ReturnSeries &returns,
                                         const ConfidenceLevel &confidence,
                                         VaRMethod method) const
        {
            ReturnSeries window = apply_window(returns);

            for (const auto &model : models_)
            {
                if (model->method() == method)
                {
                    return model->estimate(window, confidence);
                }
            }

            // Method not configured: models are stateless, so a fresh one is equivalent
            return VaRModelFactory::create(method)->estimate(window, confidence);
        }

        VaRComparison VaREstimator::compare(const ReturnSeries &returns,
                                            const ConfidenceLevel &confidence) const
        {
            VaRComparison comparison;
            comparison.confidence_level = confidence.value();
            comparison.parametric = estimate(returns, confidence, VaRMethod::PARAMETRIC);
            comparison.historical = estimate(returns, confidence, VaRMethod::HISTORICAL);
            return comparison;
        }

        std::vector<VaRResult> VaREstimator::estimate_all(const ReturnSeries &returns,
                                                          const std::vector<double> &confidence_levels) const
        {
            // Validate every level up front so a bad one yields no partial results
            std::vector<ConfidenceLevel> levels;
            if (confidence_levels.empty())
            {
                levels = ConfidenceLevel::defaults();
            }
            else
            {
                levels.reserve(confidence_levels.size());
                for (double value : confidence_levels)
                {
                    levels.emplace_back(value);
                }
            }

            ReturnSeries window = apply_window(returns);

            std::vector<VaRResult> results;
            results.reserve(levels.size() * models_.size());

            for (const auto &level : levels)
            {
                for (const auto &model : models_)
                {
                    results.push_back(model->estimate(window, level));
                }
            }

            return results;
        }

        std::vector<VaRResult> VaREstimator::estimate_all(const ReturnSeries &returns) const
        {
            return estimate_all(returns, confidence_levels_);
        }

        ReturnSeries VaREstimator::apply_window(const ReturnSeries &returns) const
        {
            if (estimation_window_ < 0)
            {
                return returns;
            }
            return returns.tail(static_cast<size_t>(estimation_window_));
        }

        std::vector<std::string> VaREstimator::model_names() const
        {
            std::vector<std::string> names;
            names.reserve(models_.size());
            for (const auto &model : models_)
            {
                names.push_back(model->get_name());
            }
            return names;
        }

    } // namespace risk
} // namespace riskvar
