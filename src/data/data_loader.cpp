/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader
 */

#include "data/data_loader.hpp"

#include "common/random_source.hpp"
#include "common/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <stdexcept>

namespace fxhedge
{
    namespace data
    {

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                             const std::string &base_currency,
                                             const std::vector<std::string> &currencies)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.empty() || trim(header[0]) != "date")
            {
                throw std::runtime_error("CSV must start with 'date' column");
            }

            std::vector<std::string> all_currencies;
            for (size_t i = 1; i < header.size(); ++i)
            {
                all_currencies.push_back(trim(header[i]));
            }

            std::vector<size_t> column_indices;
            std::vector<std::string> selected;

            if (currencies.empty())
            {
                for (size_t i = 0; i < all_currencies.size(); ++i)
                {
                    column_indices.push_back(i);
                    selected.push_back(all_currencies[i]);
                }
            }
            else
            {
                for (const auto &currency : currencies)
                {
                    auto it = std::find(all_currencies.begin(), all_currencies.end(), currency);
                    if (it != all_currencies.end())
                    {
                        column_indices.push_back(static_cast<size_t>(std::distance(all_currencies.begin(), it)));
                        selected.push_back(currency);
                    }
                }

                if (column_indices.empty())
                {
                    throw std::runtime_error("None of the requested currencies found in CSV");
                }
            }

            std::vector<std::string> dates;
            std::vector<std::vector<double>> rows;

            while (std::getline(file, line))
            {
                if (line.empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 2)
                    continue;

                std::string date = trim(fields[0]);
                if (!common::is_valid_date_format(date))
                {
                    continue;
                }

                std::vector<double> row;
                row.reserve(column_indices.size());
                for (size_t idx : column_indices)
                {
                    if (idx + 1 < fields.size())
                    {
                        row.push_back(safe_stod(fields[idx + 1]));
                    }
                    else
                    {
                        row.push_back(std::numeric_limits<double>::quiet_NaN());
                    }
                }

                dates.push_back(date);
                rows.push_back(row);
            }

            if (dates.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            Eigen::MatrixXd rates(dates.size(), selected.size());
            for (size_t i = 0; i < dates.size(); ++i)
            {
                for (size_t j = 0; j < selected.size(); ++j)
                {
                    rates(i, j) = rows[i][j];
                }
            }

            return MarketData(rates, dates, selected, base_currency);
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
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }
            return j;
        }

        config::EngineConfig DataLoader::load_config(const std::string &config_path)
        {
            return config::EngineConfig::from_json(load_json(config_path));
        }

        Portfolio DataLoader::load_portfolio(const std::string &filepath)
        {
            return Portfolio::from_json(load_json(filepath));
        }

        size_t DataLoader::load_rates(const std::string &filepath, InMemoryMarketDataProvider &provider)
        {
            auto j = load_json(filepath);
            std::string base = j.value("base_currency", std::string("USD"));

            if (!j.contains("rates") || !j["rates"].is_object())
            {
                throw std::runtime_error("Rate table must contain a 'rates' object: " + filepath);
            }

            size_t count = 0;
            for (auto it = j["rates"].begin(); it != j["rates"].end(); ++it)
            {
                provider.set_rate(it.key(), base, it.value().get<double>());
                ++count;
            }
            return count;
        }

        // ===========================
        // Synthetic Data Generation
        // ===========================

        std::vector<SyntheticFxSpec> DataLoader::default_synthetic_specs()
        {
            return {
                {"EUR", 1.0850, 0.08, 0.5},
                {"GBP", 1.2700, 0.09, 0.5},
                {"JPY", 0.0067, 0.10, -0.6},
                {"AUD", 0.6600, 0.12, 0.7},
                {"CAD", 0.7400, 0.07, 0.4},
                {"CHF", 1.1200, 0.07, -0.2}};
        }

        MarketData DataLoader::generate_synthetic_fx_history(
            const std::vector<SyntheticFxSpec> &specs,
            size_t num_days,
            const std::string &start_date,
            const std::string &base_currency,
            std::optional<std::uint64_t> seed)
        {
            if (num_days < 2)
            {
                throw std::invalid_argument("Synthetic history needs at least 2 days, got: " + std::to_string(num_days));
            }

            common::RandomSource source(seed);
            auto gen = source.engine();
            std::normal_distribution<double> dist(0.0, 1.0);

            Eigen::MatrixXd rates(num_days, specs.size());
            std::vector<std::string> dates;
            std::vector<std::string> currencies;
            dates.reserve(num_days);

            for (size_t i = 0; i < num_days; ++i)
            {
                dates.push_back(common::add_days(start_date, static_cast<int>(i)));
            }

            for (size_t j = 0; j < specs.size(); ++j)
            {
                if (specs[j].market_beta < -1.0 || specs[j].market_beta > 1.0)
                {
                    throw std::invalid_argument("market_beta must be in [-1, 1] for " + specs[j].currency);
                }
                currencies.push_back(specs[j].currency);
                rates(0, j) = specs[j].initial_rate;
            }

            for (size_t i = 1; i < num_days; ++i)
            {
                double market = dist(gen);
                for (size_t j = 0; j < specs.size(); ++j)
                {
                    const auto &spec = specs[j];
                    double daily_vol = spec.annual_volatility / std::sqrt(252.0);
                    double idio = dist(gen);
                    double shock = spec.market_beta * market +
                                   std::sqrt(1.0 - spec.market_beta * spec.market_beta) * idio;
                    rates(i, j) = rates(i - 1, j) * (1.0 + daily_vol * shock);
                }
            }

            return MarketData(rates, dates, currencies, base_currency);
        }

        // ==================
        // Export Methods
        // ==================

        void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date";
            for (const auto &currency : data.get_currencies())
            {
                file << "," << currency;
            }
            file << "\n";

            const auto &rates = data.get_rates();
            const auto &dates = data.get_dates();

            for (size_t i = 0; i < dates.size(); ++i)
            {
                file << dates[i];
                for (Eigen::Index j = 0; j < rates.cols(); ++j)
                {
                    file << "," << std::fixed << std::setprecision(8) << rates(static_cast<Eigen::Index>(i), j);
                }
                file << "\n";
            }
        }

        void DataLoader::save_json(const nlohmann::json &j, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << j.dump(2) << "\n";
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

        double DataLoader::safe_stod(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            try
            {
                return std::stod(trimmed);
            }
            catch (const std::invalid_argument &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::out_of_range &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }

    } // namespace data
} // namespace fxhedge
