#include "data/portfolio.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fxhedge
{
    namespace data
    {

        Account Account::from_json(const nlohmann::json &j)
        {
            if (!j.contains("currency") || !j.contains("balance"))
            {
                throw std::invalid_argument("Account requires 'currency' and 'balance' fields");
            }
            Account account;
            account.currency = j.at("currency").get<std::string>();
            account.balance = j.at("balance").get<double>();
            account.account_type = j.value("account_type", account.account_type);
            return account;
        }

        nlohmann::json Account::to_json() const
        {
            return {{"currency", currency}, {"balance", balance}, {"account_type", account_type}};
        }

        Portfolio Portfolio::from_json(const nlohmann::json &j)
        {
            Portfolio portfolio;
            portfolio.base_currency = j.value("base_currency", portfolio.base_currency);

            if (j.contains("accounts"))
            {
                if (!j["accounts"].is_array())
                {
                    throw std::invalid_argument("'accounts' must be an array");
                }
                for (const auto &a : j["accounts"])
                {
                    portfolio.accounts.push_back(Account::from_json(a));
                }
            }

            portfolio.validate();
            return portfolio;
        }

        nlohmann::json Portfolio::to_json() const
        {
            nlohmann::json accs = nlohmann::json::array();
            for (const auto &a : accounts)
            {
                accs.push_back(a.to_json());
            }
            return {{"base_currency", base_currency}, {"accounts", accs}};
        }

        void Portfolio::validate() const
        {
            if (base_currency.empty())
            {
                throw std::invalid_argument("Portfolio base currency must not be empty");
            }
            for (const auto &a : accounts)
            {
                if (a.currency.empty())
                {
                    throw std::invalid_argument("Account currency must not be empty");
                }
                if (!std::isfinite(a.balance))
                {
                    throw std::invalid_argument("Account balance for " + a.currency + " must be finite");
                }
            }
        }

        std::vector<std::string> Portfolio::foreign_currencies() const
        {
            std::vector<std::string> result;
            for (const auto &a : accounts)
            {
                if (a.currency != base_currency &&
                    std::find(result.begin(), result.end(), a.currency) == result.end())
                {
                    result.push_back(a.currency);
                }
            }
            return result;
        }

    } // namespace data
} // namespace fxhedge
