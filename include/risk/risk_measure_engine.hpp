/**
 * @file risk_measure_engine.hpp
 * @brief Value-at-Risk, Expected Shortfall, concentration, decomposition and stress tests
 *
 * All VaR figures are one-day losses in base currency, reported as positive
 * numbers. Tail indices are floor(n * (1 - confidence)) into an ascending
 * sort, so a higher confidence never selects a smaller loss.
 */

#pragma once

#include "common/cancellation.hpp"
#include "common/random_source.hpp"
#include "config/engine_config.hpp"
#include "exposure/exposure_calculator.hpp"
#include "risk/correlation_analyzer.hpp"
#include "risk/risk_assessment.hpp"
#include "risk/volatility_estimator.hpp"

#include <Eigen/Dense>

#include <map>
#include <random>
#include <string>
#include <vector>

namespace fxhedge
{
    namespace risk
    {

        using VolatilityMap = std::map<std::string, VolatilityProfile>;

        /**
         * @struct SimulationResult
         * @brief Sorted Monte Carlo portfolio returns plus run statistics
         */
        struct SimulationResult
        {
            std::vector<double> sorted_returns; ///< Ascending
            MonteCarloSummary summary;
        };

        /**
         * @class RiskMeasureEngine
         * @brief Stateless risk calculations over exposures, volatilities and correlations
         */
        class RiskMeasureEngine
        {
        public:
            explicit RiskMeasureEngine(const config::RiskConfig &config);

            // ===== Value at Risk =====

            /**
             * @brief Historical VaR per currency
             *
             * Each currency's returns are sorted ascending and indexed at the
             * (1 - confidence) tail, then scaled by its exposure. A currency
             * without a return history (fallback volatility) uses
             * daily volatility x z-score instead.
             */
            std::map<std::string, double> historical_var_by_currency(const exposure::ExposureSummary &exposures,
                                                                     const VolatilityMap &volatilities,
                                                                     double confidence) const;

            /**
             * @brief Sum of per-currency historical VaR
             *
             * Ignores cross-currency correlation.
             */
            double historical_var(const exposure::ExposureSummary &exposures,
                                  const VolatilityMap &volatilities,
                                  double confidence) const;

            /**
             * @brief Daily standard deviation of the portfolio value change
             *
             * sqrt(sum_ij e_i e_j v_i v_j rho_ij)
             */
            double portfolio_std_dev(const exposure::ExposureSummary &exposures,
                                     const VolatilityMap &volatilities,
                                     const CorrelationMatrix &correlations) const;

            /**
             * @brief Variance-covariance VaR (portfolio std dev x z-score)
             */
            double parametric_var(const exposure::ExposureSummary &exposures,
                                  const VolatilityMap &volatilities,
                                  const CorrelationMatrix &correlations,
                                  double confidence) const;

            /**
             * @brief Simulate portfolio returns
             *
             * Trials are split into independent batches that run concurrently,
             * each drawing from the engine RandomSource derives for its batch
             * index. By default every currency is drawn independently (an
             * approximation that ignores correlation); with correlated draws
             * enabled the standard normals are multiplied by the Cholesky
             * factor of the correlation matrix.
             *
             * @param token Optional cancellation token, checked between chunks of trials
             * @throws common::OperationCancelled if the token is cancelled
             */
            SimulationResult simulate(const exposure::ExposureSummary &exposures,
                                      const VolatilityMap &volatilities,
                                      const CorrelationMatrix &correlations,
                                      const common::RandomSource &random,
                                      const common::CancellationToken *token = nullptr) const;

            /**
             * @brief VaR from an ascending sample of portfolio returns
             */
            static double monte_carlo_var(const std::vector<double> &sorted_returns, double confidence);

            /**
             * @brief Mean |return| over every sample at or beyond the VaR tail index
             */
            static double expected_shortfall(const std::vector<double> &sorted_returns, double confidence);

            /**
             * @brief All VaR methods at every configured confidence level
             */
            std::vector<VaREstimate> value_at_risk(const exposure::ExposureSummary &exposures,
                                                   const VolatilityMap &volatilities,
                                                   const CorrelationMatrix &correlations,
                                                   const SimulationResult &simulation) const;

            // ===== Structure of the risk =====

            ConcentrationMetrics concentration(const exposure::ExposureSummary &exposures) const;

            /**
             * @brief Individual and pairwise-correlation risk factors, largest |contribution| first
             */
            std::vector<RiskFactor> decompose(const exposure::ExposureSummary &exposures,
                                              const VolatilityMap &volatilities,
                                              const CorrelationMatrix &correlations) const;

            /**
             * @brief Apply the configured stress scenarios, largest loss first
             */
            std::vector<StressTestResult> stress_test(const exposure::ExposureSummary &exposures) const;

            /**
             * @brief Sum of exposure x daily volatility
             */
            double total_risk(const exposure::ExposureSummary &exposures,
                              const VolatilityMap &volatilities) const;

            static std::string concentration_level(double herfindahl_index, double max_concentration);
            static std::string stress_severity(double loss_fraction);

            const config::RiskConfig &config() const { return config_; }
            std::string get_name() const { return "RiskMeasureEngine"; }

        private:
            const VolatilityProfile &profile_for(const VolatilityMap &volatilities,
                                                 const std::string &currency) const;

            void run_batch(const Eigen::VectorXd &exposure,
                           const Eigen::VectorXd &daily_vol,
                           const Eigen::MatrixXd *cholesky,
                           std::mt19937_64 engine,
                           int trials,
                           const common::CancellationToken *token,
                           std::vector<double> &out) const;

            config::RiskConfig config_;
        };

    } // namespace risk
} // namespace fxhedge
