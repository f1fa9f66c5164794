/**
 * @file var_model_factory.hpp
 * @brief Factory for creating VaR models from configuration
 *
 * Allows configuration-driven selection of VaR methodologies. The "var"
 * section of the analysis configuration maps onto VaRConfig:
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "var": {
 *     "confidence_levels": [0.95, 0.99],
 *     "methods": ["parametric", "historical"],
 *     "estimation_window": 252
 *   }
 * }
 * @endcode
 */

#pragma once

#include "risk/var_model.hpp"
#include "risk/parametric_var.hpp"
#include "risk/historical_var.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace riskvar
{
    namespace risk
    {

        /**
         * @struct VaRConfig
         * @brief Configuration parameters for VaR estimation
         */
        struct VaRConfig
        {
            /**
             * @brief Confidence levels to evaluate
             *
             * Each value must lie in (0, 1). Validated when the estimator
             * runs, not when the configuration is parsed.
             * Default: {0.95, 0.99}
             */
            std::vector<double> confidence_levels = {0.95, 0.99};

            /**
             * @brief VaR methods to run
             *
             * Supported values (case-insensitive):
             * - "parametric" or "variance_covariance": ParametricVaR
             * - "historical" or "historical_simulation": HistoricalVaR
             */
            std::vector<std::string> methods = {"parametric", "historical"};

            /**
             * @brief Estimation window (number of most recent returns)
             *
             * If -1 (default), uses all available returns.
             */
            int estimation_window = -1;

            /**
             * @brief Create configuration from JSON
             * @param j JSON object with the "var" section
             * @return VaRConfig with defaults for missing fields
             * @throws std::invalid_argument if a list is empty or the window is 0 or < -1
             */
            static VaRConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @class VaRModelFactory
         * @brief Factory for creating VaR model instances
         *
         * Usage Pattern:
         * @code
         * auto model = VaRModelFactory::create("historical");
         * auto result = model->estimate(returns, 0.99);
         * @endcode
         */
        class VaRModelFactory
        {
        public:
            /**
             * @brief Create a VaR model by name
             * @param type Model name (case-insensitive)
             * @return Unique pointer to the created model
             * @throws std::invalid_argument if type is unknown
             */
            static std::unique_ptr<VaRModel> create(const std::string &type);

            /**
             * @brief Create a VaR model for a method tag
             */
            static std::unique_ptr<VaRModel> create(VaRMethod method);

            /**
             * @brief Create every model listed in a configuration
             * @throws std::invalid_argument if any name is unknown
             */
            static std::vector<std::unique_ptr<VaRModel>> create_all(const VaRConfig &config);

            /**
             * @brief Parse a method name
             * @throws std::invalid_argument if name is unknown
             */
            static VaRMethod parse_method(const std::string &type);

            static std::vector<std::string> get_supported_types();

        private:
            static std::string normalize_type(const std::string &type);
        };

    } // namespace risk
} // namespace riskvar
