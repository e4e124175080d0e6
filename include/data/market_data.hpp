/*
 * @file market_data.hpp
 * @brief Exchange-rate history storage.
 *
 * Holds a dates x currencies matrix of exchange rates quoted against a single
 * base currency (units of base per unit of foreign currency).
 */

#ifndef FXHEDGE_MARKET_DATA_HPP
#define FXHEDGE_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace data
    {
        /**
         * @class MarketData
         * @brief Container for multi-currency exchange-rate histories.
         *
         * @note Rows are dates in ascending order, columns are currencies.
         * @note Missing observations are stored as NaN.
         */
        class MarketData
        {
        public:
            MarketData() = default;

            /**
             * @brief Constructor with data.
             * @param rates Rate matrix (dates x currencies).
             * @param dates Date strings (YYYY-MM-DD), ascending.
             * @param currencies Currency codes, one per column.
             * @param base_currency Currency the rates are quoted in.
             * @throws std::invalid_argument if dimensions disagree.
             */
            MarketData(const Eigen::MatrixXd &rates,
                       const std::vector<std::string> &dates,
                       const std::vector<std::string> &currencies,
                       const std::string &base_currency = "USD");

            /** ===========================================
             *  Data Access Methods
             *  ===========================================
             */

            const Eigen::MatrixXd &get_rates() const { return rates_; }
            const std::vector<std::string> &get_dates() const { return dates_; }
            const std::vector<std::string> &get_currencies() const { return currencies_; }
            const std::string &base_currency() const { return base_currency_; }

            size_t num_dates() const { return rates_.rows(); }
            size_t num_currencies() const { return rates_.cols(); }

            bool has_currency(const std::string &currency) const;

            /**
             * @brief Full rate column for a currency.
             * @throws std::invalid_argument if the currency is not present.
             */
            Eigen::VectorXd get_rates(const std::string &currency) const;

            /**
             * @brief Most recent observed rates for a currency, oldest first.
             *
             * Missing (NaN) observations are skipped.
             *
             * @param currency Currency code.
             * @param days Maximum number of observations to return.
             * @return Up to `days` rates; fewer if the history is shorter.
             */
            std::vector<double> latest_rates(const std::string &currency, size_t days) const;

            /**
             * @brief Most recent observed rate for a currency.
             * @throws std::invalid_argument if the currency has no observations.
             */
            double latest_rate(const std::string &currency) const;

            /** ===========================================
             *  Calculation Methods
             *  ===========================================
             */

            /**
             * @brief Simple returns (r_t = P_t / P_{t-1} - 1) for one currency.
             *
             * Pairs with a missing or zero rate are skipped.
             */
            std::vector<double> calculate_returns(const std::string &currency) const;

            /**
             * @brief Keep only the last n dates.
             */
            MarketData tail(size_t n) const;

            size_t count_missing() const;

            void print_summary() const;

        private:
            int find_currency_index(const std::string &currency) const;
            void build_index_map();

            Eigen::MatrixXd rates_;                        ///< Rate matrix (dates x currencies)
            std::vector<std::string> dates_;               ///< Date strings
            std::vector<std::string> currencies_;          ///< Currency codes
            std::string base_currency_ = "USD";            ///< Quote currency
            std::map<std::string, size_t> currency_index_; ///< Currency to column map
        };

        /**
         * @brief Simple returns from an ordered price sequence.
         *
         * Non-finite or non-positive prices break the pair and are skipped.
         */
        std::vector<double> simple_returns(const std::vector<double> &prices);

    } // namespace data
} // namespace fxhedge

#endif // FXHEDGE_MARKET_DATA_HPP
