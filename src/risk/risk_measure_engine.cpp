/**
 * @file risk_measure_engine.cpp
 * @brief Implementation of RiskMeasureEngine
 */

#include "risk/risk_measure_engine.hpp"

#include "common/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fxhedge
{
    namespace risk
    {

        namespace
        {
            const int CANCELLATION_CHECK_INTERVAL = 1000;
        }

        RiskMeasureEngine::RiskMeasureEngine(const config::RiskConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        const VolatilityProfile &RiskMeasureEngine::profile_for(const VolatilityMap &volatilities,
                                                                const std::string &currency) const
        {
            auto it = volatilities.find(currency);
            if (it == volatilities.end())
            {
                throw std::invalid_argument("No volatility profile for currency: " + currency);
            }
            return it->second;
        }

        // ============================================================================
        // Historical VaR
        // ============================================================================

        std::map<std::string, double> RiskMeasureEngine::historical_var_by_currency(
            const exposure::ExposureSummary &exposures,
            const VolatilityMap &volatilities,
            double confidence) const
        {
            std::map<std::string, double> result;

            for (const auto &e : exposures.exposures)
            {
                const auto &profile = profile_for(volatilities, e.currency);

                double loss_fraction;
                if (profile.has_returns())
                {
                    std::vector<double> sorted(profile.returns);
                    std::sort(sorted.begin(), sorted.end());
                    size_t idx = common::tail_index(sorted.size(), confidence);
                    loss_fraction = std::max(0.0, -sorted[idx]);
                }
                else
                {
                    loss_fraction = profile.daily * common::z_score(confidence);
                }

                result[e.currency] = loss_fraction * e.absolute_exposure;
            }

            return result;
        }

        double RiskMeasureEngine::historical_var(const exposure::ExposureSummary &exposures,
                                                 const VolatilityMap &volatilities,
                                                 double confidence) const
        {
            double total = 0.0;
            for (const auto &kv : historical_var_by_currency(exposures, volatilities, confidence))
            {
                total += kv.second;
            }
            return total;
        }

        // ============================================================================
        // Parametric VaR
        // ============================================================================

        double RiskMeasureEngine::portfolio_std_dev(const exposure::ExposureSummary &exposures,
                                                    const VolatilityMap &volatilities,
                                                    const CorrelationMatrix &correlations) const
        {
            const auto n = static_cast<Eigen::Index>(exposures.exposures.size());
            if (n == 0)
            {
                return 0.0;
            }

            Eigen::VectorXd weighted(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const auto &e = exposures.exposures[static_cast<size_t>(i)];
                weighted(i) = e.absolute_exposure * profile_for(volatilities, e.currency).daily;
            }

            Eigen::MatrixXd corr = correlations.matrix_for(exposures.currencies());
            double variance = weighted.dot(corr * weighted);

            // Rounding can leave a tiny negative variance for near-singular matrices
            return std::sqrt(std::max(0.0, variance));
        }

        double RiskMeasureEngine::parametric_var(const exposure::ExposureSummary &exposures,
                                                 const VolatilityMap &volatilities,
                                                 const CorrelationMatrix &correlations,
                                                 double confidence) const
        {
            return portfolio_std_dev(exposures, volatilities, correlations) * common::z_score(confidence);
        }

        // ============================================================================
        // Monte Carlo VaR
        // ============================================================================

        void RiskMeasureEngine::run_batch(const Eigen::VectorXd &exposure,
                                          const Eigen::VectorXd &daily_vol,
                                          const Eigen::MatrixXd *cholesky,
                                          std::mt19937_64 engine,
                                          int trials,
                                          const common::CancellationToken *token,
                                          std::vector<double> &out) const
        {
            std::normal_distribution<double> dist(0.0, 1.0);
            Eigen::VectorXd z(exposure.size());
            out.reserve(static_cast<size_t>(trials));

            for (int t = 0; t < trials; ++t)
            {
                if (t % CANCELLATION_CHECK_INTERVAL == 0)
                {
                    common::check_cancelled(token, "Monte Carlo simulation");
                }

                for (Eigen::Index i = 0; i < z.size(); ++i)
                {
                    z(i) = dist(engine);
                }
                if (cholesky != nullptr)
                {
                    z = (*cholesky) * z;
                }

                out.push_back(exposure.cwiseProduct(daily_vol).dot(z));
            }
        }

        SimulationResult RiskMeasureEngine::simulate(const exposure::ExposureSummary &exposures,
                                                     const VolatilityMap &volatilities,
                                                     const CorrelationMatrix &correlations,
                                                     const common::RandomSource &random,
                                                     const common::CancellationToken *token) const
        {
            SimulationResult result;
            result.summary.trials = config_.monte_carlo_trials;
            result.summary.correlated_draws = config_.correlated_draws;
            if (random.is_seeded())
            {
                result.summary.seed = random.base_seed();
            }

            const auto n = static_cast<Eigen::Index>(exposures.exposures.size());
            if (n == 0)
            {
                return result;
            }

            Eigen::VectorXd exposure(n);
            Eigen::VectorXd daily_vol(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const auto &e = exposures.exposures[static_cast<size_t>(i)];
                exposure(i) = e.absolute_exposure;
                daily_vol(i) = profile_for(volatilities, e.currency).daily;
            }

            Eigen::MatrixXd lower;
            const Eigen::MatrixXd *cholesky = nullptr;
            if (config_.correlated_draws)
            {
                Eigen::LLT<Eigen::MatrixXd> llt(correlations.matrix_for(exposures.currencies()));
                if (llt.info() == Eigen::Success)
                {
                    lower = llt.matrixL();
                    cholesky = &lower;
                }
                else
                {
                    std::cerr << "Warning: correlation matrix is not positive definite; "
                              << "using independent Monte Carlo draws" << std::endl;
                    result.summary.correlated_draws = false;
                }
            }

            const int trials = config_.monte_carlo_trials;
            const int batches = std::min(config_.monte_carlo_batches, trials);
            result.summary.batches = batches;

            std::vector<std::future<std::vector<double>>> tasks;
            tasks.reserve(static_cast<size_t>(batches));

            for (int b = 0; b < batches; ++b)
            {
                int count = trials / batches + (b < trials % batches ? 1 : 0);
                auto engine = random.engine_for_batch(static_cast<std::uint64_t>(b));
                tasks.push_back(std::async(std::launch::async,
                                           [this, &exposure, &daily_vol, cholesky, engine, count, token]()
                                           {
                                               std::vector<double> out;
                                               run_batch(exposure, daily_vol, cholesky, engine, count, token, out);
                                               return out;
                                           }));
            }

            // Concatenate in batch order so a seeded run is reproducible
            std::vector<double> samples;
            samples.reserve(static_cast<size_t>(trials));
            for (auto &task : tasks)
            {
                auto batch = task.get();
                samples.insert(samples.end(), batch.begin(), batch.end());
            }

            result.summary.mean = common::mean(samples);
            result.summary.std_dev = common::sample_stddev(samples);

            std::sort(samples.begin(), samples.end());
            result.sorted_returns = std::move(samples);
            return result;
        }

        double RiskMeasureEngine::monte_carlo_var(const std::vector<double> &sorted_returns, double confidence)
        {
            if (sorted_returns.empty())
            {
                return 0.0;
            }
            size_t idx = common::tail_index(sorted_returns.size(), confidence);
            return std::max(0.0, -sorted_returns[idx]);
        }

        double RiskMeasureEngine::expected_shortfall(const std::vector<double> &sorted_returns, double confidence)
        {
            if (sorted_returns.empty())
            {
                return 0.0;
            }
            size_t idx = common::tail_index(sorted_returns.size(), confidence);

            double sum = 0.0;
            for (size_t i = 0; i <= idx; ++i)
            {
                sum += std::abs(sorted_returns[i]);
            }
            return sum / static_cast<double>(idx + 1);
        }

        std::vector<VaREstimate> RiskMeasureEngine::value_at_risk(const exposure::ExposureSummary &exposures,
                                                                  const VolatilityMap &volatilities,
                                                                  const CorrelationMatrix &correlations,
                                                                  const SimulationResult &simulation) const
        {
            std::vector<double> levels(config_.confidence_levels);
            std::sort(levels.begin(), levels.end());

            std::vector<VaREstimate> result;
            for (double confidence : levels)
            {
                VaREstimate v;
                v.confidence = confidence;
                v.historical_by_currency = historical_var_by_currency(exposures, volatilities, confidence);
                for (const auto &kv : v.historical_by_currency)
                {
                    v.historical += kv.second;
                }
                v.parametric = parametric_var(exposures, volatilities, correlations, confidence);
                v.monte_carlo = monte_carlo_var(simulation.sorted_returns, confidence);
                v.expected_shortfall = expected_shortfall(simulation.sorted_returns, confidence);
                result.push_back(v);
            }
            return result;
        }

        // ============================================================================
        // Concentration
        // ============================================================================

        std::string RiskMeasureEngine::concentration_level(double herfindahl_index, double max_concentration)
        {
            if (max_concentration > 0.5 || herfindahl_index > 0.25)
                return "high";
            if (max_concentration > 0.3 || herfindahl_index > 0.15)
                return "medium";
            return "low";
        }

        ConcentrationMetrics RiskMeasureEngine::concentration(const exposure::ExposureSummary &exposures) const
        {
            ConcentrationMetrics metrics;

            std::vector<const exposure::CurrencyExposure *> sorted;
            for (const auto &e : exposures.exposures)
            {
                sorted.push_back(&e);
            }
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const exposure::CurrencyExposure *a, const exposure::CurrencyExposure *b)
                             { return a->relative_exposure > b->relative_exposure; });

            for (size_t i = 0; i < sorted.size(); ++i)
            {
                const auto &e = *sorted[i];
                metrics.herfindahl_index += e.relative_exposure * e.relative_exposure;
                if (i < 3)
                {
                    metrics.top3_concentration += e.relative_exposure;
                }

                if (e.relative_exposure > config_.concentration_threshold)
                {
                    metrics.flagged_currencies.push_back(e.currency);

                    std::ostringstream action;
                    action << "Reduce " << e.currency << " exposure by " << std::fixed << std::setprecision(1)
                           << (e.relative_exposure - config_.concentration_threshold) * 100.0 << "%";

                    ConcentrationAdvice advice;
                    advice.currency = e.currency;
                    advice.current_concentration = e.relative_exposure;
                    advice.recommended_max = config_.concentration_threshold;
                    advice.action = action.str();
                    metrics.advice.push_back(advice);
                }
            }

            if (!sorted.empty())
            {
                metrics.max_concentration = sorted.front()->relative_exposure;
                metrics.max_currency = sorted.front()->currency;
            }

            metrics.risk_level = concentration_level(metrics.herfindahl_index, metrics.max_concentration);
            return metrics;
        }

        // ============================================================================
        // Risk factor decomposition
        // ============================================================================

        std::vector<RiskFactor> RiskMeasureEngine::decompose(const exposure::ExposureSummary &exposures,
                                                             const VolatilityMap &volatilities,
                                                             const CorrelationMatrix &correlations) const
        {
            std::vector<RiskFactor> factors;
            const auto &list = exposures.exposures;

            for (const auto &e : list)
            {
                RiskFactor f;
                f.type = RiskFactorType::INDIVIDUAL;
                f.currencies = {e.currency};
                f.contribution = e.absolute_exposure * profile_for(volatilities, e.currency).daily;
                factors.push_back(f);
            }

            for (size_t i = 0; i < list.size(); ++i)
            {
                for (size_t j = i + 1; j < list.size(); ++j)
                {
                    double corr = correlations.get(list[i].currency, list[j].currency);
                    if (std::abs(corr) <= config_.correlation_threshold)
                    {
                        continue;
                    }

                    RiskFactor f;
                    f.type = RiskFactorType::CORRELATION;
                    f.currencies = {list[i].currency, list[j].currency};
                    f.correlation = corr;
                    f.is_high_correlation = std::abs(corr) > config_.high_correlation_threshold;
                    f.contribution = 2.0 * list[i].absolute_exposure * list[j].absolute_exposure *
                                     profile_for(volatilities, list[i].currency).daily *
                                     profile_for(volatilities, list[j].currency).daily * corr;
                    factors.push_back(f);
                }
            }

            double total = 0.0;
            for (const auto &f : factors)
            {
                total += std::abs(f.contribution);
            }
            for (auto &f : factors)
            {
                f.relative_contribution = total > 0.0 ? std::abs(f.contribution) / total : 0.0;
            }

            std::stable_sort(factors.begin(), factors.end(),
                             [](const RiskFactor &a, const RiskFactor &b)
                             { return std::abs(a.contribution) > std::abs(b.contribution); });
            return factors;
        }

        // ============================================================================
        // Stress tests
        // ============================================================================

        std::string RiskMeasureEngine::stress_severity(double loss_fraction)
        {
            if (loss_fraction > 0.20)
                return "severe";
            if (loss_fraction > 0.10)
                return "high";
            if (loss_fraction > 0.05)
                return "medium";
            return "low";
        }

        std::vector<StressTestResult> RiskMeasureEngine::stress_test(const exposure::ExposureSummary &exposures) const
        {
            std::vector<StressTestResult> results;

            for (const auto &scenario : config_.stress_scenarios)
            {
                StressTestResult r;
                r.scenario = scenario.name;

                for (const auto &e : exposures.exposures)
                {
                    auto shock = scenario.shocks.find(e.currency);
                    if (shock == scenario.shocks.end())
                    {
                        continue;
                    }
                    double loss = e.absolute_exposure * std::abs(shock->second);
                    r.currency_losses[e.currency] = loss;
                    r.total_loss += loss;
                }

                r.loss_fraction = exposures.total_foreign_exposure > 0.0
                                      ? r.total_loss / exposures.total_foreign_exposure
                                      : 0.0;
                r.severity = stress_severity(r.loss_fraction);
                results.push_back(r);
            }

            std::stable_sort(results.begin(), results.end(),
                             [](const StressTestResult &a, const StressTestResult &b)
                             { return a.total_loss > b.total_loss; });
            return results;
        }

        double RiskMeasureEngine::total_risk(const exposure::ExposureSummary &exposures,
                                             const VolatilityMap &volatilities) const
        {
            double total = 0.0;
            for (const auto &e : exposures.exposures)
            {
                total += e.absolute_exposure * profile_for(volatilities, e.currency).daily;
            }
            return total;
        }

    } // namespace risk
} // namespace fxhedge
