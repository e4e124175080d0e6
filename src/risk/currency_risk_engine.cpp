/**
 * @file currency_risk_engine.cpp
 * @brief Implementation of CurrencyRiskEngine
 */

#include "risk/currency_risk_engine.hpp"

#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "exposure/exposure_calculator.hpp"
#include "risk/correlation_analyzer.hpp"
#include "risk/risk_measure_engine.hpp"
#include "risk/risk_scorer.hpp"
#include "risk/volatility_estimator.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace fxhedge
{
    namespace risk
    {

        CurrencyRiskEngine::CurrencyRiskEngine(const data::MarketDataProvider &provider,
                                               const config::EngineConfig &config,
                                               std::shared_ptr<AssessmentCache> cache)
            : provider_(provider),
              config_(config),
              cache_(cache ? std::move(cache) : std::make_shared<MostRecentAssessmentCache>())
        {
            config_.validate();
        }

        // ============================================================================
        // In-flight tracking
        // ============================================================================

        common::CancellationTokenPtr CurrencyRiskEngine::begin_calculation(const std::string &user_id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(user_id);
            if (it != in_flight_.end())
            {
                it->second->cancel();
            }
            auto token = std::make_shared<common::CancellationToken>();
            in_flight_[user_id] = token;
            return token;
        }

        void CurrencyRiskEngine::end_calculation(const std::string &user_id,
                                                 const common::CancellationTokenPtr &token)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(user_id);
            // A newer calculation may already own the slot
            if (it != in_flight_.end() && it->second == token)
            {
                in_flight_.erase(it);
            }
        }

        bool CurrencyRiskEngine::commit_calculation(const std::string &user_id,
                                                    const common::CancellationTokenPtr &token,
                                                    const AssessmentPtr &result)
        {
            // A superseded calculation must not store after its successor
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(user_id);
            if (it == in_flight_.end() || it->second != token || token->is_cancelled())
            {
                return false;
            }
            cache_->store(user_id, result);
            in_flight_.erase(it);
            return true;
        }

        bool CurrencyRiskEngine::cancel(const std::string &user_id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(user_id);
            if (it == in_flight_.end())
            {
                return false;
            }
            it->second->cancel();
            return true;
        }

        void CurrencyRiskEngine::add_observer(std::shared_ptr<RiskObserver> observer)
        {
            if (!observer)
            {
                throw std::invalid_argument("Observer must not be null");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            observers_.push_back(std::move(observer));
        }

        AssessmentPtr CurrencyRiskEngine::cached_assessment(const std::string &user_id) const
        {
            return cache_->get(user_id);
        }

        // ============================================================================
        // Calculation
        // ============================================================================

        AssessmentPtr CurrencyRiskEngine::calculate_currency_risk(const std::string &user_id,
                                                                  const data::Portfolio &portfolio)
        {
            auto token = begin_calculation(user_id);
            const std::string operation = "currency risk calculation";

            try
            {
                portfolio.validate();

                auto assessment = std::make_shared<RiskAssessment>();
                assessment->id = common::make_identifier("risk");
                assessment->user_id = user_id;
                assessment->timestamp = common::current_timestamp();
                assessment->base_currency = portfolio.base_currency;

                exposure::ExposureCalculator calculator(provider_);
                assessment->exposures = calculator.calculate(portfolio);
                const auto currencies = assessment->exposures.currencies();

                VolatilityEstimator estimator(provider_, config_.risk);
                assessment->volatilities = estimator.estimate_all(currencies, portfolio.base_currency);
                token->throw_if_cancelled(operation);

                CorrelationAnalyzer analyzer;
                assessment->correlations = analyzer.analyze(currencies, assessment->volatilities);

                RiskMeasureEngine measures(config_.risk);
                const common::RandomSource random = random_ ? *random_ : common::RandomSource(config_.risk.random_seed);
                auto simulation = measures.simulate(assessment->exposures, assessment->volatilities,
                                                    assessment->correlations, random, token.get());
                assessment->monte_carlo = simulation.summary;
                assessment->var = measures.value_at_risk(assessment->exposures, assessment->volatilities,
                                                         assessment->correlations, simulation);
                assessment->concentration = measures.concentration(assessment->exposures);
                assessment->risk_factors = measures.decompose(assessment->exposures, assessment->volatilities,
                                                              assessment->correlations);
                assessment->stress_tests = measures.stress_test(assessment->exposures);
                assessment->total_risk = measures.total_risk(assessment->exposures, assessment->volatilities);

                RiskScorer scorer(config_.risk);
                assessment->risk_score = scorer.score(assessment->exposures, assessment->concentration,
                                                      assessment->volatilities);
                assessment->recommendations = scorer.recommend(assessment->concentration,
                                                               assessment->risk_factors,
                                                               assessment->volatilities);

                verify_finite(*assessment);
                assessment->alerts = check_alerts(*assessment);

                AssessmentPtr result = assessment;
                if (!commit_calculation(user_id, token, result))
                {
                    throw common::OperationCancelled(operation);
                }

                std::vector<std::shared_ptr<RiskObserver>> observers;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    observers = observers_;
                }
                for (const auto &observer : observers)
                {
                    observer->on_risk_calculated(*result);
                    for (const auto &alert : result->alerts)
                    {
                        observer->on_risk_alert(user_id, alert);
                    }
                }
                return result;
            }
            catch (const common::OperationCancelled &)
            {
                end_calculation(user_id, token);
                throw;
            }
            catch (const std::exception &e)
            {
                end_calculation(user_id, token);
                notify_error(user_id, operation, e.what());
                throw;
            }
        }

        void CurrencyRiskEngine::verify_finite(const RiskAssessment &assessment) const
        {
            const std::string operation = "currency risk calculation";
            for (const auto &v : assessment.var)
            {
                if (!std::isfinite(v.historical) || !std::isfinite(v.parametric) ||
                    !std::isfinite(v.monte_carlo) || !std::isfinite(v.expected_shortfall))
                {
                    throw common::CalculationError(operation, assessment.user_id,
                                                   "non-finite VaR at confidence " + std::to_string(v.confidence));
                }
            }
            if (!std::isfinite(assessment.total_risk) || !std::isfinite(assessment.risk_score) ||
                !std::isfinite(assessment.concentration.herfindahl_index))
            {
                throw common::CalculationError(operation, assessment.user_id, "non-finite risk aggregate");
            }
        }

        std::vector<RiskAlert> CurrencyRiskEngine::check_alerts(const RiskAssessment &assessment) const
        {
            std::vector<RiskAlert> alerts;

            const auto *var95 = assessment.var_at(0.95);
            if (var95 != nullptr && var95->parametric > config_.risk.var_alert_limit)
            {
                std::ostringstream msg;
                msg << std::fixed << std::setprecision(2)
                    << "95% VaR exceeds " << config_.risk.var_alert_limit << ": " << var95->parametric;

                RiskAlert alert;
                alert.type = "var_threshold";
                alert.severity = "high";
                alert.message = msg.str();
                alert.value = var95->parametric;
                alert.threshold = config_.risk.var_alert_limit;
                alerts.push_back(alert);
            }

            const double max_conc = assessment.concentration.max_concentration;
            if (max_conc > config_.risk.concentration_alert_limit)
            {
                std::ostringstream msg;
                msg << std::fixed << std::setprecision(1)
                    << "High concentration risk: " << max_conc * 100.0 << "% in "
                    << assessment.concentration.max_currency;

                RiskAlert alert;
                alert.type = "concentration_alert";
                alert.severity = "medium";
                alert.message = msg.str();
                alert.value = max_conc;
                alert.threshold = config_.risk.concentration_alert_limit;
                alerts.push_back(alert);
            }

            return alerts;
        }

        void CurrencyRiskEngine::notify_error(const std::string &user_id,
                                              const std::string &operation,
                                              const std::string &message) const
        {
            std::vector<std::shared_ptr<RiskObserver>> observers;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                observers = observers_;
            }
            for (const auto &observer : observers)
            {
                observer->on_error(user_id, operation, message);
            }
        }

    } // namespace risk
} // namespace fxhedge
