/**
 * @file var_model_factory.cpp
 * @brief Implementation of VaR model factory
 */

#include "risk/var_model_factory.hpp"
#include <algorithm>
#include <cctype>

namespace riskvar
{
    namespace risk
    {

        // VaRConfig implementation
        VaRConfig VaRConfig::from_json(const nlohmann::json &doc)
        {
            VaRConfig config;

            if (doc.contains("confidence_levels"))
            {
                config.confidence_levels = doc["confidence_levels"].get<std::vector<double>>();
                if (config.confidence_levels.empty())
                {
                    throw std::invalid_argument("VaR configuration 'confidence_levels' cannot be empty");
                }
            }

            if (doc.contains("methods"))
            {
                config.methods = doc["methods"].get<std::vector<std::string>>();
                if (config.methods.empty())
                {
                    throw std::invalid_argument("VaR configuration 'methods' cannot be empty");
                }
            }

            if (doc.contains("estimation_window"))
            {
                config.estimation_window = doc["estimation_window"].get<int>();
                if (config.estimation_window == 0 || config.estimation_window < -1)
                {
                    throw std::invalid_argument(
                        "VaR 'estimation_window' must be -1 (all data) or positive, got: " +
                        std::to_string(config.estimation_window));
                }
            }

            return config;
        }

        nlohmann::json VaRConfig::to_json() const
        {
            return nlohmann::json{
                {"confidence_levels", confidence_levels},
                {"methods", methods},
                {"estimation_window", estimation_window}};
        }

        // VaRModelFactory implementation
        std::string VaRModelFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        VaRMethod VaRModelFactory::parse_method(const std::string &type)
        {
            std::string normalized = normalize_type(type);

            if (normalized == "parametric" || normalized == "variance_covariance")
            {
                return VaRMethod::PARAMETRIC;
            }
            else if (normalized == "historical" || normalized == "historical_simulation")
            {
                return VaRMethod::HISTORICAL;
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown VaR method: '" + type + "'. "
                                                     "Valid options: parametric, historical");
            }
        }

        std::unique_ptr<VaRModel> VaRModelFactory::create(const std::string &type)
        {
            return create(parse_method(type));
        }

        std::unique_ptr<VaRModel> VaRModelFactory::create(VaRMethod method)
        {
            switch (method)
            {
            case VaRMethod::PARAMETRIC:
                return std::make_unique<ParametricVaR>();
            case VaRMethod::HISTORICAL:
                return std::make_unique<HistoricalVaR>();
            }
            throw std::invalid_argument("Unsupported VaR method");
        }

        std::vector<std::unique_ptr<VaRModel>> VaRModelFactory::create_all(const VaRConfig &config)
        {
            std::vector<std::unique_ptr<VaRModel>> models;
            models.reserve(config.methods.size());

            for (const auto &name : config.methods)
            {
                models.push_back(create(name));
            }

            return models;
        }

        std::vector<std::string> VaRModelFactory::get_supported_types()
        {
            return {
                "parametric",
                "variance_covariance",
                "historical",
                "historical_simulation"};
        }

    } // namespace risk
} // namespace riskvar
