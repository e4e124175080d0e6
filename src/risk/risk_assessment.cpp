/**
 * @file risk_assessment.cpp
 * @brief JSON export and console summary of risk results
 */

#include "risk/risk_assessment.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace fxhedge
{
    namespace risk
    {

        // ===== JSON export =====

        nlohmann::json VaREstimate::to_json() const
        {
            return {
                {"confidence", confidence},
                {"historical", historical},
                {"parametric", parametric},
                {"monte_carlo", monte_carlo},
                {"expected_shortfall", expected_shortfall},
                {"historical_by_currency", historical_by_currency}};
        }

        nlohmann::json MonteCarloSummary::to_json() const
        {
            nlohmann::json j = {
                {"trials", trials},
                {"batches", batches},
                {"mean", mean},
                {"std_dev", std_dev},
                {"correlated_draws", correlated_draws}};
            j["seed"] = seed ? nlohmann::json(*seed) : nlohmann::json(nullptr);
            return j;
        }

        nlohmann::json ConcentrationAdvice::to_json() const
        {
            return {
                {"currency", currency},
                {"current_concentration", current_concentration},
                {"recommended_max", recommended_max},
                {"action", action}};
        }

        nlohmann::json ConcentrationMetrics::to_json() const
        {
            nlohmann::json adv = nlohmann::json::array();
            for (const auto &a : advice)
            {
                adv.push_back(a.to_json());
            }
            return {
                {"herfindahl_index", herfindahl_index},
                {"max_concentration", max_concentration},
                {"max_currency", max_currency},
                {"top3_concentration", top3_concentration},
                {"flagged_currencies", flagged_currencies},
                {"risk_level", risk_level},
                {"recommendations", adv}};
        }

        std::string to_string(RiskFactorType type)
        {
            return type == RiskFactorType::INDIVIDUAL ? "individual" : "correlation";
        }

        std::string RiskFactor::label() const
        {
            std::string name;
            for (size_t i = 0; i < currencies.size(); ++i)
            {
                if (i > 0)
                    name += "-";
                name += currencies[i];
            }
            return name;
        }

        nlohmann::json RiskFactor::to_json() const
        {
            return {
                {"type", to_string(type)},
                {"factor", label()},
                {"currencies", currencies},
                {"contribution", contribution},
                {"relative_contribution", relative_contribution},
                {"correlation", correlation},
                {"is_high_correlation", is_high_correlation}};
        }

        nlohmann::json StressTestResult::to_json() const
        {
            return {
                {"scenario", scenario},
                {"total_loss", total_loss},
                {"loss_fraction", loss_fraction},
                {"severity", severity},
                {"currency_losses", currency_losses}};
        }

        nlohmann::json RiskRecommendation::to_json() const
        {
            return {
                {"type", type},
                {"priority", priority},
                {"title", title},
                {"description", description},
                {"action", action},
                {"impact", impact}};
        }

        nlohmann::json RiskAlert::to_json() const
        {
            return {
                {"type", type},
                {"severity", severity},
                {"message", message},
                {"value", value},
                {"threshold", threshold}};
        }

        // ===== RiskAssessment =====

        const VaREstimate *RiskAssessment::var_at(double confidence) const
        {
            for (const auto &v : var)
            {
                if (std::abs(v.confidence - confidence) < 1e-12)
                {
                    return &v;
                }
            }
            return nullptr;
        }

        const VolatilityProfile *RiskAssessment::volatility_of(const std::string &currency) const
        {
            auto it = volatilities.find(currency);
            return it == volatilities.end() ? nullptr : &it->second;
        }

        double RiskAssessment::individual_risk(const std::string &currency) const
        {
            for (const auto &f : risk_factors)
            {
                if (f.type == RiskFactorType::INDIVIDUAL && !f.currencies.empty() && f.currencies.front() == currency)
                {
                    return f.contribution;
                }
            }
            return 0.0;
        }

        nlohmann::json RiskAssessment::to_json() const
        {
            nlohmann::json vols = nlohmann::json::object();
            for (const auto &kv : volatilities)
            {
                vols[kv.first] = kv.second.to_json();
            }

            nlohmann::json var_list = nlohmann::json::array();
            for (const auto &v : var)
            {
                var_list.push_back(v.to_json());
            }

            nlohmann::json factors = nlohmann::json::array();
            for (const auto &f : risk_factors)
            {
                factors.push_back(f.to_json());
            }

            nlohmann::json stress = nlohmann::json::array();
            for (const auto &s : stress_tests)
            {
                stress.push_back(s.to_json());
            }

            nlohmann::json recs = nlohmann::json::array();
            for (const auto &r : recommendations)
            {
                recs.push_back(r.to_json());
            }

            nlohmann::json alert_list = nlohmann::json::array();
            for (const auto &a : alerts)
            {
                alert_list.push_back(a.to_json());
            }

            return {
                {"id", id},
                {"user_id", user_id},
                {"timestamp", timestamp},
                {"base_currency", base_currency},
                {"exposures", exposures.to_json()},
                {"volatilities", vols},
                {"correlations", correlations.to_json()},
                {"value_at_risk", var_list},
                {"monte_carlo", monte_carlo.to_json()},
                {"concentration", concentration.to_json()},
                {"risk_factors", factors},
                {"stress_tests", stress},
                {"total_risk", total_risk},
                {"risk_score", risk_score},
                {"recommendations", recs},
                {"alerts", alert_list}};
        }

        void RiskAssessment::print_summary() const
        {
            std::cout << "\n=== Currency Risk Assessment ===\n";
            std::cout << "User: " << user_id << "  Base: " << base_currency << "  At: " << timestamp << "\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Portfolio value:  " << exposures.total_portfolio_value << "\n";
            std::cout << "Foreign exposure: " << exposures.total_foreign_exposure << "\n";

            if (!exposures.exposures.empty())
            {
                std::cout << "\nExposures:\n";
                std::cout << std::string(60, '-') << "\n";
                for (const auto &e : exposures.exposures)
                {
                    const auto *vol = volatility_of(e.currency);
                    std::cout << "  " << std::setw(2) << e.rank << ". " << std::setw(5) << std::left << e.currency
                              << std::right << std::setw(16) << e.absolute_exposure
                              << std::setw(9) << e.relative_exposure * 100.0 << "%";
                    if (vol != nullptr)
                    {
                        std::cout << "  vol " << std::setw(6) << vol->annual * 100.0 << "%"
                                  << (vol->is_fallback ? " (default)" : "");
                    }
                    std::cout << "\n";
                }
                std::cout << std::string(60, '-') << "\n";
            }

            std::cout << "\nValue at Risk (1 day):\n";
            for (const auto &v : var)
            {
                std::cout << "  " << std::setprecision(0) << v.confidence * 100.0 << "%: "
                          << std::setprecision(2)
                          << "historical " << v.historical
                          << ", parametric " << v.parametric
                          << ", monte carlo " << v.monte_carlo
                          << ", ES " << v.expected_shortfall << "\n";
            }

            std::cout << "\nConcentration: HHI " << std::setprecision(4) << concentration.herfindahl_index
                      << ", max " << std::setprecision(2) << concentration.max_concentration * 100.0 << "% ("
                      << concentration.max_currency << "), level " << concentration.risk_level << "\n";

            if (!stress_tests.empty())
            {
                std::cout << "\nStress tests:\n";
                for (const auto &s : stress_tests)
                {
                    std::cout << "  " << std::setw(26) << std::left << s.scenario << std::right
                              << std::setw(14) << s.total_loss << "  " << s.severity << "\n";
                }
            }

            std::cout << "\nRisk score: " << std::setprecision(0) << risk_score << " / 100\n";
            for (const auto &r : recommendations)
            {
                std::cout << "  [" << r.priority << "] " << r.title << ": " << r.description << "\n";
            }
            for (const auto &a : alerts)
            {
                std::cout << "  ALERT " << a.type << ": " << a.message << "\n";
            }
            std::cout << "================================\n"
                      << std::endl;
        }

    } // namespace risk
} // namespace fxhedge
