/**
 * @file market_data.cpp
 * @brief Implementation of MarketData
 */

#include "data/market_data.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace fxhedge
{
    namespace data
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        MarketData::MarketData(const Eigen::MatrixXd &rates,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &currencies,
                               const std::string &base_currency)
            : rates_(rates), dates_(dates), currencies_(currencies), base_currency_(base_currency)
        {
            if (rates_.rows() != static_cast<Eigen::Index>(dates_.size()))
            {
                throw std::invalid_argument("Rate matrix rows must match dates vector size");
            }
            if (rates_.cols() != static_cast<Eigen::Index>(currencies_.size()))
            {
                throw std::invalid_argument("Rate matrix columns must match currencies vector size");
            }

            build_index_map();
        }

        // ============================================================================
        // Data Access Methods
        // ============================================================================

        bool MarketData::has_currency(const std::string &currency) const
        {
            return find_currency_index(currency) >= 0;
        }

        Eigen::VectorXd MarketData::get_rates(const std::string &currency) const
        {
            int idx = find_currency_index(currency);
            if (idx < 0)
            {
                throw std::invalid_argument("Currency not found: " + currency);
            }
            return rates_.col(idx);
        }

        std::vector<double> MarketData::latest_rates(const std::string &currency, size_t days) const
        {
            int idx = find_currency_index(currency);
            if (idx < 0)
            {
                throw std::invalid_argument("Currency not found: " + currency);
            }

            std::vector<double> result;
            for (Eigen::Index i = rates_.rows() - 1; i >= 0 && result.size() < days; --i)
            {
                double r = rates_(i, idx);
                if (std::isfinite(r))
                {
                    result.push_back(r);
                }
            }
            std::reverse(result.begin(), result.end());
            return result;
        }

        double MarketData::latest_rate(const std::string &currency) const
        {
            auto rates = latest_rates(currency, 1);
            if (rates.empty())
            {
                throw std::invalid_argument("No observations for currency: " + currency);
            }
            return rates.back();
        }

        // ===========================
        // Calculation Methods
        // ===========================

        std::vector<double> simple_returns(const std::vector<double> &prices)
        {
            std::vector<double> returns;
            if (prices.size() < 2)
            {
                return returns;
            }
            returns.reserve(prices.size() - 1);

            for (size_t i = 1; i < prices.size(); ++i)
            {
                double p_t = prices[i];
                double p_tm1 = prices[i - 1];
                if (!std::isfinite(p_t) || !std::isfinite(p_tm1) || p_t <= 0.0 || p_tm1 <= 0.0)
                {
                    continue;
                }
                returns.push_back((p_t - p_tm1) / p_tm1);
            }
            return returns;
        }

        std::vector<double> MarketData::calculate_returns(const std::string &currency) const
        {
            Eigen::VectorXd col = get_rates(currency);
            std::vector<double> prices(col.data(), col.data() + col.size());
            return simple_returns(prices);
        }

        MarketData MarketData::tail(size_t n) const
        {
            size_t rows = std::min(n, num_dates());
            size_t start = num_dates() - rows;

            Eigen::MatrixXd block = rates_.bottomRows(static_cast<Eigen::Index>(rows));
            std::vector<std::string> dates(dates_.begin() + static_cast<std::ptrdiff_t>(start), dates_.end());
            return MarketData(block, dates, currencies_, base_currency_);
        }

        size_t MarketData::count_missing() const
        {
            size_t count = 0;
            for (Eigen::Index i = 0; i < rates_.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < rates_.cols(); ++j)
                {
                    if (std::isnan(rates_(i, j)))
                    {
                        ++count;
                    }
                }
            }
            return count;
        }

        void MarketData::print_summary() const
        {
            std::cout << "\n=== FX History Summary ===\n";
            std::cout << "Dimensions: " << rates_.rows() << " dates x "
                      << rates_.cols() << " currencies (quoted in " << base_currency_ << ")\n";
            if (!dates_.empty())
            {
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
            }
            std::cout << "Currencies: ";
            for (const auto &currency : currencies_)
            {
                std::cout << currency << " ";
            }
            std::cout << "\nMissing values: " << count_missing() << "\n";
            std::cout << "==========================\n"
                      << std::endl;
        }

        // =========================
        // Private Helper Methods
        // =========================

        int MarketData::find_currency_index(const std::string &currency) const
        {
            auto it = currency_index_.find(currency);
            if (it != currency_index_.end())
            {
                return static_cast<int>(it->second);
            }
            return -1;
        }

        void MarketData::build_index_map()
        {
            currency_index_.clear();
            for (size_t i = 0; i < currencies_.size(); ++i)
            {
                currency_index_[currencies_[i]] = i;
            }
        }

    } // namespace data
} // namespace fxhedge
