/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load price series from CSV files and
 * analysis configuration from JSON files.
 */

#ifndef RISKVAR_DATA_LOADER_HPP
#define RISKVAR_DATA_LOADER_HPP

#include "data/price_series.hpp"
#include "risk/var_model_factory.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskvar {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string data_file;                     ///< Path to price CSV
    std::string date_column;                   ///< Date column name (case-insensitive)
    std::string price_column;                  ///< Price column name (case-insensitive)
    std::string start_date;                    ///< Start date filter, empty for none
    std::string end_date;                      ///< End date filter, empty for none

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct ReportConfig
 * @brief Configuration for the risk report and histogram
 */
struct ReportConfig {
    int histogram_bins;                        ///< Number of histogram bins
    bool show_histogram;                       ///< Render the return histogram
    std::string format;                        ///< "text" or "json"

    /**
     * @brief Load from JSON object
     * @throws std::invalid_argument if bins < 1 or format is unknown
     */
    static ReportConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Complete VaR analysis configuration
 */
struct AnalysisConfig {
    DataConfig data;
    risk::VaRConfig var;
    ReportConfig report;

    /**
     * @brief Configuration with every section at its defaults
     */
    static AnalysisConfig defaults();

    /**
     * @brief Load complete configuration from JSON file
     */
    static AnalysisConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and parses price data
 *
 * CSV layout: a header row naming the columns, then one row per date.
 * @code
 * date,close
 * 2020-01-02,100.0
 * 2020-01-03,101.5
 * @endcode
 * A wide file (date,AAPL,MSFT,...) works too: name the ticker as the
 * price column. Rows may appear in any order and are sorted by date.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load a price series from CSV
     *
     * Missing or unparseable prices are kept as NaN so that PriceSeries
     * rejects them; no row is silently dropped.
     *
     * @param filepath Path to CSV file
     * @param price_column Name of the price column (case-insensitive)
     * @param date_column Name of the date column (case-insensitive)
     * @return PriceSeries sorted by date
     * @throws std::runtime_error if the file cannot be read, a column is missing,
     *         a date is malformed or a date appears twice
     * @throws risk::InvalidPriceError if a price is non-positive or not a number
     */
    static PriceSeries load_csv(const std::string& filepath,
                                const std::string& price_column = "close",
                                const std::string& date_column = "date");

    /**
     * @brief Load the price series described by a DataConfig, date filter applied
     */
    static PriceSeries load_prices(const DataConfig& config);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analysis configuration
     * @param config_path Path to config JSON file
     * @return AnalysisConfig struct
     */
    static AnalysisConfig load_config(const std::string& config_path);

    /**
     * @brief Build analysis configuration from an in-memory JSON document
     */
    static AnalysisConfig parse_config(const nlohmann::json& j);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic price path (geometric Brownian motion)
     * @param num_days Number of observations
     * @param start_date Starting date (YYYY-MM-DD)
     * @param volatility Daily log-return volatility (default 0.02)
     * @param drift Daily log-return drift (default 0.0005)
     * @param seed Random seed for reproducible paths
     * @param initial_price Starting price (default 100)
     * @return PriceSeries with consecutive calendar dates
     */
    static PriceSeries generate_synthetic_prices(
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        unsigned int seed = 42,
        double initial_price = 100.0
    );

    /**
     * @brief Write a price series as a date,close CSV
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_csv(const PriceSeries& prices, const std::string& filepath,
                         const std::string& price_column = "close");

private:
    // ========================
    // Private Helper Methods
    // ========================

    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    /**
     * @brief Convert string to double
     * @return Parsed value, or NaN if the field is empty or not a number
     */
    static double safe_stod(const std::string& str);

    static std::string add_days(const std::string& start_date, int days_offset);
};

} // namespace riskvar

#endif // RISKVAR_DATA_LOADER_HPP
