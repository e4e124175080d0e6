/**
 * @file statistics.hpp
 * @brief Normal-distribution and sample-statistic helpers shared by the risk modules
 */

#pragma once

#include <cstddef>
#include <vector>

namespace fxhedge
{
    namespace common
    {

        /**
         * @brief Standard normal probability density
         */
        double normal_pdf(double x);

        /**
         * @brief Standard normal cumulative distribution
         */
        double normal_cdf(double x);

        /**
         * @brief Inverse of the standard normal CDF (Beasley-Springer-Moro)
         * @param p Probability in (0, 1)
         * @throws std::invalid_argument if p is outside (0, 1)
         */
        double inverse_normal_cdf(double p);

        /**
         * @brief One-sided z-score for a VaR confidence level
         *
         * The conventional table values 1.645 (95%) and 2.326 (99%) are used
         * for those levels; other levels use inverse_normal_cdf.
         *
         * @param confidence Confidence level in (0, 1)
         */
        double z_score(double confidence);

        double mean(const std::vector<double> &values);

        /**
         * @brief Sample standard deviation (n - 1 denominator)
         * @return 0 for fewer than two observations
         */
        double sample_stddev(const std::vector<double> &values);

        /**
         * @brief Index into an ascending-sorted sample at the (1 - confidence) tail
         *
         * floor(n * (1 - confidence)), clamped to [0, n - 1].
         */
        size_t tail_index(size_t n, double confidence);

    } // namespace common
} // namespace fxhedge
