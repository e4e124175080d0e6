/**
 * @file portfolio.hpp
 * @brief Portfolio snapshot supplied by the caller
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fxhedge
{
    namespace data
    {

        /**
         * @struct Account
         * @brief One balance held in a single currency
         */
        struct Account
        {
            std::string currency;
            double balance = 0.0;
            std::string account_type = "checking";

            static Account from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct Portfolio
         * @brief Base currency plus an ordered list of accounts
         */
        struct Portfolio
        {
            std::string base_currency = "USD";
            std::vector<Account> accounts;

            /**
             * @brief Parse {"base_currency": ..., "accounts": [...]}
             * @throws std::invalid_argument on a malformed document
             */
            static Portfolio from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;

            /**
             * @throws std::invalid_argument if a currency code is empty or a balance is not finite
             */
            void validate() const;

            /**
             * @brief Distinct non-base currencies in first-seen order
             */
            std::vector<std::string> foreign_currencies() const;
        };

    } // namespace data
} // namespace fxhedge
