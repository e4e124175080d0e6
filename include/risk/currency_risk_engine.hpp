/**
 * @file currency_risk_engine.hpp
 * @brief End-to-end currency risk assessment for one portfolio
 *
 * Pipeline:
 *   Portfolio -> ExposureCalculator -> VolatilityEstimator (per currency, concurrent)
 *             -> CorrelationAnalyzer -> RiskMeasureEngine -> RiskScorer -> RiskAssessment
 *
 * Usage Example:
 * @code
 * data::InMemoryMarketDataProvider provider(history);
 * risk::CurrencyRiskEngine engine(provider, config::EngineConfig::default_config());
 * auto assessment = engine.calculate_currency_risk("user-1", portfolio);
 * assessment->print_summary();
 * @endcode
 */

#pragma once

#include "common/cancellation.hpp"
#include "common/random_source.hpp"
#include "config/engine_config.hpp"
#include "data/market_data_provider.hpp"
#include "data/portfolio.hpp"
#include "risk/assessment_cache.hpp"
#include "risk/risk_assessment.hpp"
#include "risk/risk_observer.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @class CurrencyRiskEngine
         * @brief Produces and caches RiskAssessments
         *
         * Thread Safety: calculate_currency_risk() may be called concurrently.
         * A new calculation for a user cancels that user's in-flight one; the
         * superseded call throws common::OperationCancelled.
         */
        class CurrencyRiskEngine
        {
        public:
            /**
             * @param provider Market data; must outlive the engine
             * @param config Engine configuration (validated here)
             * @param cache Result cache; a MostRecentAssessmentCache is created when null
             */
            CurrencyRiskEngine(const data::MarketDataProvider &provider,
                               const config::EngineConfig &config,
                               std::shared_ptr<AssessmentCache> cache = nullptr);

            /**
             * @brief Run the full assessment
             * @param user_id Owner of the portfolio
             * @param portfolio Portfolio snapshot
             * @return Immutable assessment, also stored in the cache
             * @throws common::DataUnavailableError if an exchange rate is missing
             * @throws common::CalculationError if a result is not finite
             * @throws common::OperationCancelled if superseded or cancelled
             */
            AssessmentPtr calculate_currency_risk(const std::string &user_id,
                                                  const data::Portfolio &portfolio);

            /**
             * @brief Latest cached assessment, or nullptr
             */
            AssessmentPtr cached_assessment(const std::string &user_id) const;

            /**
             * @brief Cancel the in-flight calculation of a user
             * @return true if a calculation was running
             */
            bool cancel(const std::string &user_id);

            void add_observer(std::shared_ptr<RiskObserver> observer);

            /**
             * @brief Fix the random source used for Monte Carlo draws
             *
             * Without one, every calculation builds a source from the
             * configured seed (or a fresh random seed when none is set).
             */
            void set_random_source(const common::RandomSource &random) { random_ = random; }

            /**
             * @brief Alerts raised for an assessment (VaR and concentration limits)
             */
            std::vector<RiskAlert> check_alerts(const RiskAssessment &assessment) const;

            const config::EngineConfig &config() const { return config_; }

        private:
            common::CancellationTokenPtr begin_calculation(const std::string &user_id);
            void end_calculation(const std::string &user_id, const common::CancellationTokenPtr &token);

            /**
             * @brief Store the result if the token still owns the user's slot
             * @return false when the calculation was cancelled or superseded
             */
            bool commit_calculation(const std::string &user_id,
                                    const common::CancellationTokenPtr &token,
                                    const AssessmentPtr &result);

            void verify_finite(const RiskAssessment &assessment) const;

            void notify_error(const std::string &user_id, const std::string &operation, const std::string &message) const;

            const data::MarketDataProvider &provider_;
            config::EngineConfig config_;
            std::shared_ptr<AssessmentCache> cache_;
            std::optional<common::RandomSource> random_;

            mutable std::mutex mutex_;
            std::map<std::string, common::CancellationTokenPtr> in_flight_;
            std::vector<std::shared_ptr<RiskObserver>> observers_;
        };

    } // namespace risk
} // namespace fxhedge
