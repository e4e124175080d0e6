#include "risk/risk_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fxhedge
{
    namespace risk
    {

        namespace
        {
            std::string join(const std::vector<std::string> &items)
            {
                std::string out;
                for (size_t i = 0; i < items.size(); ++i)
                {
                    if (i > 0)
                        out += ", ";
                    out += items[i];
                }
                return out;
            }

            std::string percent(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(1) << value * 100.0 << "%";
                return oss.str();
            }
        }

        RiskScorer::RiskScorer(const config::RiskConfig &config)
            : config_(config)
        {
        }

        double RiskScorer::score(const exposure::ExposureSummary &exposures,
                                 const ConcentrationMetrics &concentration,
                                 const std::map<std::string, VolatilityProfile> &volatilities) const
        {
            if (exposures.empty())
            {
                return 0.0;
            }

            double concentration_part = 40.0 * concentration.max_concentration;

            double vol_sum = 0.0;
            int vol_count = 0;
            for (const auto &e : exposures.exposures)
            {
                auto it = volatilities.find(e.currency);
                if (it != volatilities.end())
                {
                    vol_sum += it->second.annual;
                    ++vol_count;
                }
            }
            double avg_vol = vol_count > 0 ? vol_sum / vol_count : 0.0;
            double volatility_part = std::min(40.0, 200.0 * avg_vol);

            double count = static_cast<double>(exposures.exposures.size());
            double diversification_part = std::max(0.0, 20.0 - 2.0 * count);

            double total = std::round(concentration_part + volatility_part + diversification_part);
            return std::max(0.0, std::min(100.0, total));
        }

        std::vector<RiskRecommendation> RiskScorer::recommend(const ConcentrationMetrics &concentration,
                                                              const std::vector<RiskFactor> &risk_factors,
                                                              const std::map<std::string, VolatilityProfile> &volatilities) const
        {
            std::vector<RiskRecommendation> recs;

            if (concentration.max_concentration > config_.concentration_threshold)
            {
                RiskRecommendation r;
                r.type = "concentration";
                r.priority = "high";
                r.title = "Reduce Currency Concentration";
                r.description = concentration.max_currency + " makes up " +
                                percent(concentration.max_concentration) + " of foreign exposure";
                r.action = "Diversify across more currencies or hedge the largest exposure";
                r.impact = "Lower sensitivity to a single currency move";
                recs.push_back(r);
            }

            std::vector<std::string> correlated_pairs;
            for (const auto &f : risk_factors)
            {
                if (f.type == RiskFactorType::CORRELATION &&
                    std::abs(f.correlation) > config_.high_correlation_threshold)
                {
                    correlated_pairs.push_back(f.label());
                }
            }
            if (!correlated_pairs.empty())
            {
                RiskRecommendation r;
                r.type = "correlation";
                r.priority = "medium";
                r.title = "Address High Currency Correlations";
                r.description = "Highly correlated pairs: " + join(correlated_pairs);
                r.action = "Hedge one side of each pair or add uncorrelated currencies";
                r.impact = "Reduces the chance of simultaneous losses";
                recs.push_back(r);
            }

            std::vector<std::string> volatile_currencies;
            for (const auto &kv : volatilities)
            {
                if (kv.second.annual > config_.high_volatility_threshold)
                {
                    volatile_currencies.push_back(kv.first);
                }
            }
            if (!volatile_currencies.empty())
            {
                RiskRecommendation r;
                r.type = "volatility";
                r.priority = "medium";
                r.title = "Manage High Volatility Exposures";
                r.description = "Annual volatility above " + percent(config_.high_volatility_threshold) +
                                ": " + join(volatile_currencies);
                r.action = "Consider forwards or options on the volatile currencies";
                r.impact = "Smoother portfolio value in base currency";
                recs.push_back(r);
            }

            return recs;
        }

    } // namespace risk
} // namespace fxhedge
