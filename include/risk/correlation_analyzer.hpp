/**
 * @file correlation_analyzer.hpp
 * @brief Currency-pair correlation matrix
 */

#pragma once

#include "risk/volatility_estimator.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @class CorrelationMatrix
         * @brief Symmetric correlation matrix indexed by currency code
         *
         * Values are clamped to [-1, 1] and the diagonal is fixed at 1.
         * Lookups for an unknown currency pair return 0.
         */
        class CorrelationMatrix
        {
        public:
            CorrelationMatrix() = default;

            /**
             * @brief Identity matrix over the given currencies
             */
            explicit CorrelationMatrix(const std::vector<std::string> &currencies);

            /**
             * @brief Set a pair symmetrically
             * @throws std::invalid_argument for unknown currencies
             */
            void set(const std::string &a, const std::string &b, double value);

            double get(const std::string &a, const std::string &b) const;

            bool contains(const std::string &currency) const;

            /**
             * @brief Whether the currency's correlations were estimated from returns
             */
            bool has_data(const std::string &currency) const;
            void mark_without_data(const std::string &currency);

            const Eigen::MatrixXd &values() const { return values_; }
            const std::vector<std::string> &currencies() const { return currencies_; }
            size_t size() const { return currencies_.size(); }

            /**
             * @brief Sub-matrix in the given currency order (unknown currencies get identity rows)
             */
            Eigen::MatrixXd matrix_for(const std::vector<std::string> &currencies) const;

            nlohmann::json to_json() const;

        private:
            int index_of(const std::string &currency) const;

            std::vector<std::string> currencies_;
            std::map<std::string, size_t> index_;
            Eigen::MatrixXd values_;
            std::set<std::string> without_data_;
        };

        /**
         * @class CorrelationAnalyzer
         * @brief Pearson correlation over aligned recent-return windows
         */
        class CorrelationAnalyzer
        {
        public:
            CorrelationAnalyzer() = default;

            /**
             * @brief Build the matrix for every pair of currencies
             *
             * Currencies with fewer than two recent returns (including fallback
             * profiles) keep correlation 0 with every other currency. The other
             * series are truncated to their common trailing length first.
             *
             * @param currencies Currency order of the matrix
             * @param profiles Volatility profiles keyed by currency
             */
            CorrelationMatrix analyze(const std::vector<std::string> &currencies,
                                      const std::map<std::string, VolatilityProfile> &profiles) const;

            /**
             * @brief Pearson correlation of two equal-length series
             * @return 0 if either series has zero variance or fewer than two points
             */
            static double pearson(const std::vector<double> &x, const std::vector<double> &y);

            std::string get_name() const { return "CorrelationAnalyzer"; }
        };

    } // namespace risk
} // namespace fxhedge
