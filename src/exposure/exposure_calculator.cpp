#include "exposure/exposure_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace fxhedge
{
    namespace exposure
    {

        nlohmann::json CurrencyExposure::to_json() const
        {
            return {
                {"currency", currency},
                {"absolute_exposure", absolute_exposure},
                {"original_amount", original_amount},
                {"exchange_rate", exchange_rate},
                {"account_type", account_type},
                {"relative_exposure", relative_exposure},
                {"rank", rank}};
        }

        const CurrencyExposure *ExposureSummary::find(const std::string &currency) const
        {
            for (const auto &e : exposures)
            {
                if (e.currency == currency)
                {
                    return &e;
                }
            }
            return nullptr;
        }

        std::vector<std::string> ExposureSummary::currencies() const
        {
            std::vector<std::string> result;
            result.reserve(exposures.size());
            for (const auto &e : exposures)
            {
                result.push_back(e.currency);
            }
            return result;
        }

        nlohmann::json ExposureSummary::to_json() const
        {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &e : exposures)
            {
                list.push_back(e.to_json());
            }
            return {
                {"base_currency", base_currency},
                {"total_portfolio_value", total_portfolio_value},
                {"total_foreign_exposure", total_foreign_exposure},
                {"exposures", list}};
        }

        ExposureCalculator::ExposureCalculator(const data::MarketDataProvider &provider)
            : provider_(provider)
        {
        }

        ExposureSummary ExposureCalculator::calculate(const data::Portfolio &portfolio) const
        {
            portfolio.validate();

            ExposureSummary summary;
            summary.base_currency = portfolio.base_currency;

            // Aggregate balances per foreign currency, preserving first-seen order
            std::vector<std::string> order;
            std::map<std::string, CurrencyExposure> by_currency;

            for (const auto &account : portfolio.accounts)
            {
                if (account.currency == portfolio.base_currency)
                {
                    summary.total_portfolio_value += account.balance;
                    continue;
                }

                auto it = by_currency.find(account.currency);
                if (it == by_currency.end())
                {
                    CurrencyExposure e;
                    e.currency = account.currency;
                    e.original_amount = account.balance;
                    e.account_type = account.account_type;
                    by_currency.emplace(account.currency, e);
                    order.push_back(account.currency);
                }
                else
                {
                    it->second.original_amount += account.balance;
                    if (it->second.account_type != account.account_type)
                    {
                        it->second.account_type = "mixed";
                    }
                }
            }

            for (const auto &currency : order)
            {
                CurrencyExposure e = by_currency[currency];
                e.exchange_rate = provider_.get_exchange_rate(currency, portfolio.base_currency);
                e.absolute_exposure = std::abs(e.original_amount * e.exchange_rate);
                if (e.absolute_exposure <= 0.0)
                {
                    continue;
                }
                summary.total_foreign_exposure += e.absolute_exposure;
                summary.exposures.push_back(e);
            }

            summary.total_portfolio_value += summary.total_foreign_exposure;

            for (auto &e : summary.exposures)
            {
                e.relative_exposure = e.absolute_exposure / summary.total_foreign_exposure;
            }

            std::stable_sort(summary.exposures.begin(), summary.exposures.end(),
                             [](const CurrencyExposure &a, const CurrencyExposure &b)
                             { return a.absolute_exposure > b.absolute_exposure; });

            for (size_t i = 0; i < summary.exposures.size(); ++i)
            {
                summary.exposures[i].rank = static_cast<int>(i + 1);
            }

            return summary;
        }

    } // namespace exposure
} // namespace fxhedge
