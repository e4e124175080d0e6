#include "risk/correlation_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace fxhedge
{
    namespace risk
    {

        // ============================================================================
        // CorrelationMatrix
        // ============================================================================

        CorrelationMatrix::CorrelationMatrix(const std::vector<std::string> &currencies)
            : currencies_(currencies),
              values_(Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(currencies.size()),
                                                static_cast<Eigen::Index>(currencies.size())))
        {
            for (size_t i = 0; i < currencies_.size(); ++i)
            {
                if (!index_.emplace(currencies_[i], i).second)
                {
                    throw std::invalid_argument("Duplicate currency in correlation matrix: " + currencies_[i]);
                }
            }
        }

        int CorrelationMatrix::index_of(const std::string &currency) const
        {
            auto it = index_.find(currency);
            return it == index_.end() ? -1 : static_cast<int>(it->second);
        }

        void CorrelationMatrix::set(const std::string &a, const std::string &b, double value)
        {
            int i = index_of(a);
            int j = index_of(b);
            if (i < 0 || j < 0)
            {
                throw std::invalid_argument("Unknown currency pair in correlation matrix: " + a + "/" + b);
            }
            if (i == j)
            {
                return;
            }
            double clamped = std::isfinite(value) ? std::max(-1.0, std::min(1.0, value)) : 0.0;
            values_(i, j) = clamped;
            values_(j, i) = clamped;
        }

        double CorrelationMatrix::get(const std::string &a, const std::string &b) const
        {
            if (a == b)
            {
                return 1.0;
            }
            int i = index_of(a);
            int j = index_of(b);
            if (i < 0 || j < 0)
            {
                return 0.0;
            }
            return values_(i, j);
        }

        bool CorrelationMatrix::contains(const std::string &currency) const
        {
            return index_of(currency) >= 0;
        }

        bool CorrelationMatrix::has_data(const std::string &currency) const
        {
            return contains(currency) && without_data_.count(currency) == 0;
        }

        void CorrelationMatrix::mark_without_data(const std::string &currency)
        {
            without_data_.insert(currency);
        }

        Eigen::MatrixXd CorrelationMatrix::matrix_for(const std::vector<std::string> &currencies) const
        {
            const auto n = static_cast<Eigen::Index>(currencies.size());
            Eigen::MatrixXd m(n, n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    m(i, j) = get(currencies[static_cast<size_t>(i)], currencies[static_cast<size_t>(j)]);
                }
            }
            return m;
        }

        nlohmann::json CorrelationMatrix::to_json() const
        {
            nlohmann::json j = nlohmann::json::object();
            for (size_t i = 0; i < currencies_.size(); ++i)
            {
                nlohmann::json row = nlohmann::json::object();
                for (size_t k = 0; k < currencies_.size(); ++k)
                {
                    row[currencies_[k]] = values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k));
                }
                j[currencies_[i]] = row;
            }
            return j;
        }

        // ============================================================================
        // CorrelationAnalyzer
        // ============================================================================

        double CorrelationAnalyzer::pearson(const std::vector<double> &x, const std::vector<double> &y)
        {
            size_t n = std::min(x.size(), y.size());
            if (n < 2)
            {
                return 0.0;
            }

            double mean_x = 0.0;
            double mean_y = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                mean_x += x[i];
                mean_y += y[i];
            }
            mean_x /= static_cast<double>(n);
            mean_y /= static_cast<double>(n);

            double cov = 0.0;
            double var_x = 0.0;
            double var_y = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                double dx = x[i] - mean_x;
                double dy = y[i] - mean_y;
                cov += dx * dy;
                var_x += dx * dx;
                var_y += dy * dy;
            }

            // Degenerate series: correlation is defined as 0
            const double eps = std::numeric_limits<double>::epsilon();
            if (var_x <= eps * eps || var_y <= eps * eps)
            {
                return 0.0;
            }

            double corr = cov / std::sqrt(var_x * var_y);
            return std::max(-1.0, std::min(1.0, corr));
        }

        CorrelationMatrix CorrelationAnalyzer::analyze(const std::vector<std::string> &currencies,
                                                       const std::map<std::string, VolatilityProfile> &profiles) const
        {
            CorrelationMatrix matrix(currencies);

            std::vector<std::string> with_data;
            size_t common_length = std::numeric_limits<size_t>::max();

            for (const auto &currency : currencies)
            {
                auto it = profiles.find(currency);
                if (it == profiles.end() || it->second.recent_returns.size() < 2)
                {
                    matrix.mark_without_data(currency);
                    continue;
                }
                with_data.push_back(currency);
                common_length = std::min(common_length, it->second.recent_returns.size());
            }

            // Align every series to the common trailing window
            std::map<std::string, std::vector<double>> aligned;
            for (const auto &currency : with_data)
            {
                const auto &r = profiles.at(currency).recent_returns;
                aligned[currency].assign(r.end() - static_cast<std::ptrdiff_t>(common_length), r.end());
            }

            for (size_t i = 0; i < with_data.size(); ++i)
            {
                for (size_t j = i + 1; j < with_data.size(); ++j)
                {
                    matrix.set(with_data[i], with_data[j],
                               pearson(aligned[with_data[i]], aligned[with_data[j]]));
                }
            }

            return matrix;
        }

    } // namespace risk
} // namespace fxhedge
