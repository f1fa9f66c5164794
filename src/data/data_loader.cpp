/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <utility>

namespace riskvar
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", "data/market/prices.csv");
        config.date_column = j.value("date_column", "date");
        config.price_column = j.value("price_column", "close");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        return config;
    }

    ReportConfig ReportConfig::from_json(const nlohmann::json &j)
    {
        ReportConfig config;
        config.histogram_bins = j.value("histogram_bins", 50);
        config.show_histogram = j.value("show_histogram", false);
        config.format = j.value("format", "text");

        if (config.histogram_bins < 1)
        {
            throw std::invalid_argument("Report 'histogram_bins' must be at least 1, got: " + std::to_string(config.histogram_bins));
        }
        if (config.format != "text" && config.format != "json")
        {
            throw std::invalid_argument("Report 'format' must be 'text' or 'json', got: '" + config.format + "'");
        }

        return config;
    }

    AnalysisConfig AnalysisConfig::defaults()
    {
        return DataLoader::parse_config(nlohmann::json::object());
    }

    AnalysisConfig AnalysisConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading
    // ===========================

    PriceSeries DataLoader::load_csv(const std::string &filepath,
                                     const std::string &price_column,
                                     const std::string &date_column)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);

        // Locate the date and price columns by name
        const std::string wanted_date = to_lower(date_column);
        const std::string wanted_price = to_lower(price_column);
        size_t date_idx = header.size();
        size_t price_idx = header.size();

        for (size_t i = 0; i < header.size(); ++i)
        {
            std::string name = to_lower(trim(header[i]));
            if (name == wanted_date && date_idx == header.size())
            {
                date_idx = i;
            }
            else if (name == wanted_price && price_idx == header.size())
            {
                price_idx = i;
            }
        }

        if (date_idx == header.size())
        {
            throw std::runtime_error("CSV has no '" + date_column + "' column: " + filepath);
        }
        if (price_idx == header.size())
        {
            throw std::runtime_error("CSV has no '" + price_column + "' column: " + filepath);
        }

        std::vector<std::pair<std::string, double>> rows;
        size_t line_number = 1;

        // Read data rows
        while (std::getline(file, line))
        {
            ++line_number;

            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            std::string date = date_idx < fields.size() ? trim(fields[date_idx]) : "";
            if (!PriceSeries::is_valid_date_format(date))
            {
                throw std::runtime_error("Invalid date '" + date + "' at line " +
                                         std::to_string(line_number) + " of " + filepath);
            }

            double price = price_idx < fields.size()
                               ? safe_stod(fields[price_idx])
                               : std::numeric_limits<double>::quiet_NaN();

            rows.emplace_back(date, price);
        }

        file.close();

        // Chronological order, dates compare correctly as YYYY-MM-DD strings
        std::stable_sort(rows.begin(), rows.end(),
                         [](const auto &a, const auto &b)
                         { return a.first < b.first; });

        std::vector<std::string> dates;
        std::vector<double> prices;
        dates.reserve(rows.size());
        prices.reserve(rows.size());

        for (size_t i = 0; i < rows.size(); ++i)
        {
            if (i > 0 && rows[i].first == rows[i - 1].first)
            {
                throw std::runtime_error("Duplicate date '" + rows[i].first + "' in " + filepath);
            }
            dates.push_back(rows[i].first);
            prices.push_back(rows[i].second);
        }

        return PriceSeries(dates, prices);
    }

    PriceSeries DataLoader::load_prices(const DataConfig &config)
    {
        PriceSeries prices = load_csv(config.data_file, config.price_column, config.date_column);

        if (!config.start_date.empty() || !config.end_date.empty())
        {
            return prices.filter_by_date(config.start_date, config.end_date);
        }

        return prices;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        return parse_config(load_json(config_path));
    }

    AnalysisConfig DataLoader::parse_config(const nlohmann::json &j)
    {
        AnalysisConfig config;
        const nlohmann::json empty = nlohmann::json::object();

        try
        {
            config.data = DataConfig::from_json(j.contains("data") ? j["data"] : empty);
            config.var = risk::VaRConfig::from_json(j.contains("var") ? j["var"] : empty);
            config.report = ReportConfig::from_json(j.contains("report") ? j["report"] : empty);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration: " + std::string(e.what()));
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceSeries DataLoader::generate_synthetic_prices(
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed,
        double initial_price)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        std::vector<std::string> dates;
        std::vector<double> prices;
        dates.reserve(num_days);
        prices.reserve(num_days);

        // Geometric Brownian motion on log prices
        double price = initial_price;
        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(add_days(start_date, static_cast<int>(i)));
            if (i > 0)
            {
                price *= std::exp(dist(gen));
            }
            prices.push_back(price);
        }

        return PriceSeries(dates, prices);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv(const PriceSeries &prices, const std::string &filepath,
                              const std::string &price_column)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date," << price_column << "\n";

        const auto &dates = prices.dates();
        const auto &values = prices.prices();

        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i] << "," << std::fixed << std::setprecision(6)
                 << values(static_cast<Eigen::Index>(i)) << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string lowered = str;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        return lowered;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        errno = 0;
        char *end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);

        // Trailing garbage or overflow counts as unparseable
        if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        return value;
    }

    std::string DataLoader::add_days(const std::string &start_date, int days_offset)
    {
        struct tm tm = {};
        std::istringstream ss(start_date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail())
        {
            throw std::invalid_argument("Invalid start date (expected YYYY-MM-DD): '" + start_date + "'");
        }

        // Normalize through mktime at noon so DST shifts never repeat a date
        tm.tm_mday += days_offset;
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        std::mktime(&tm);

        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);

        return std::string(buffer);
    }

} // namespace riskvar
