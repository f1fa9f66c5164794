/**
 * @file main.cpp
 * @brief Main entry point for the RiskVaR market risk analyzer
 *
 * Command-line application that loads configuration and prices, builds
 * the log-return series, estimates parametric and historical VaR, and
 * prints a comparative risk report.
 */

#include "data/data_loader.hpp"
#include "data/return_series.hpp"
#include "risk/var_estimator.hpp"
#include "analytics/risk_report.hpp"
#include "analytics/risk_renderer.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <stdexcept>
#include <iomanip>
#include <chrono>
#include <vector>

using namespace riskvar;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "RiskVaR Market Risk Analyzer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --data PATH           Price CSV file (overrides config data_file)\n"
              << "  --column NAME         Price column name (default: close)\n"
              << "  --confidence X        Confidence level in (0, 1), repeatable\n"
              << "  --synthetic N         Use N days of synthetic prices instead of a file\n"
              << "  --histogram           Print the return histogram with VaR thresholds\n"
              << "  --json                Print the report as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --data data/market/prices.csv --confidence 0.97\n"
              << "  " << program_name << " --config data/config/riskvar_config.json --histogram\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       RiskVaR Market Risk Analyzer v1.0.0                     \n"
              << "       Parametric vs. Historical Value-at-Risk                 \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string data_path;
    std::string price_column;
    std::vector<double> confidence_levels;
    int synthetic_days = 0;
    bool histogram = false;
    bool json = false;
    bool verbose = false;
    bool show_help = false;
    bool parse_error = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            try
            {
                if (arg == "--help" || arg == "-h")
                {
                    args.show_help = true;
                }
                else if (arg == "--config" && i + 1 < argc)
                {
                    args.config_path = argv[++i];
                }
                else if (arg == "--data" && i + 1 < argc)
                {
                    args.data_path = argv[++i];
                }
                else if (arg == "--column" && i + 1 < argc)
                {
                    args.price_column = argv[++i];
                }
                else if (arg == "--confidence" && i + 1 < argc)
                {
                    args.confidence_levels.push_back(std::stod(argv[++i]));
                }
                else if (arg == "--synthetic" && i + 1 < argc)
                {
                    args.synthetic_days = std::stoi(argv[++i]);
                }
                else if (arg == "--histogram")
                {
                    args.histogram = true;
                }
                else if (arg == "--json")
                {
                    args.json = true;
                }
                else if (arg == "--verbose")
                {
                    args.verbose = true;
                }
                else
                {
                    std::cerr << "Warning: Unknown argument: " << arg << std::endl;
                }
            }
            catch (const std::logic_error &)
            {
                std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << std::endl;
                args.parse_error = true;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !parse_error &&
               (!config_path.empty() || !data_path.empty() || synthetic_days > 0);
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        AnalysisConfig config = args.config_path.empty()
                                    ? AnalysisConfig::defaults()
                                    : DataLoader::load_config(args.config_path);

        if (!args.data_path.empty())
        {
            config.data.data_file = args.data_path;
        }
        if (!args.price_column.empty())
        {
            config.data.price_column = args.price_column;
        }
        if (!args.confidence_levels.empty())
        {
            config.var.confidence_levels = args.confidence_levels;
        }
        if (args.histogram)
        {
            config.report.show_histogram = true;
        }
        if (args.json)
        {
            config.report.format = "json";
        }

        if (args.verbose)
        {
            std::cout << "  - Confidence levels: ";
            for (double level : config.var.confidence_levels)
            {
                std::cout << level << " ";
            }
            std::cout << "\n  - Methods: ";
            for (const auto &method : config.var.methods)
            {
                std::cout << method << " ";
            }
            std::cout << "\n  - Estimation window: "
                      << (config.var.estimation_window < 0 ? std::string("all")
                                                            : std::to_string(config.var.estimation_window))
                      << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/4] Loading market data..." << std::endl;

        PriceSeries prices = args.synthetic_days > 0
                                 ? DataLoader::generate_synthetic_prices(static_cast<size_t>(args.synthetic_days))
                                 : DataLoader::load_prices(config.data);

        std::cout << "  - Loaded " << prices.size() << " prices";
        if (!prices.empty())
        {
            std::cout << " (" << prices.dates().front() << " to " << prices.dates().back() << ")";
        }
        std::cout << std::endl;

        // ====================================================================
        // 3. Calculate Returns
        // ====================================================================
        std::cout << "[3/4] Calculating log returns..." << std::endl;

        ReturnSeries returns = ReturnSeriesBuilder::build(prices);

        std::cout << "  - Total trading days analyzed: " << returns.size() << std::endl;

        if (args.verbose)
        {
            std::cout << "  - Mean (daily):       " << std::fixed << std::setprecision(6)
                      << returns.mean() << "\n";
            std::cout << "  - Min / Max:          " << returns.min() << " / " << returns.max() << "\n";
        }

        // ====================================================================
        // 4. Estimate VaR
        // ====================================================================
        std::cout << "[4/4] Estimating Value-at-Risk..." << std::endl;

        risk::VaREstimator estimator(config.var);
        auto results = estimator.estimate_all(returns);

        if (args.verbose)
        {
            std::cout << "  - Models: ";
            for (const auto &name : estimator.model_names())
            {
                std::cout << name << " ";
            }
            std::cout << "\n";
        }

        ReturnSeries window = estimator.apply_window(returns);
        analytics::RiskReport report(window, results);

        std::cout << "\n";
        if (config.report.format == "json")
        {
            std::cout << report.to_json() << std::endl;
        }
        else
        {
            std::cout << report.summary() << std::endl;
        }

        if (config.report.show_histogram)
        {
            analytics::ConsoleHistogramRenderer renderer(std::cout, config.report.histogram_bins);
            renderer.render(window, results);
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run analysis
    return run(args);
}
