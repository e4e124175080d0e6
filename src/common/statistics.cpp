/**
 * @file statistics.cpp
 * @brief Implementation of the shared statistics helpers
 */

#include "common/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace fxhedge
{
    namespace common
    {

        double normal_pdf(double x)
        {
            static const double INV_SQRT_2PI = 0.3989422804014327;
            return INV_SQRT_2PI * std::exp(-0.5 * x * x);
        }

        double normal_cdf(double x)
        {
            return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
        }

        double inverse_normal_cdf(double p)
        {
            if (p <= 0.0 || p >= 1.0)
            {
                throw std::invalid_argument("Probability must be in (0, 1), got: " + std::to_string(p));
            }

            static const double a[] = {
                -3.969683028665376e+01, 2.209460984245205e+02,
                -2.759285104469687e+02, 1.383577518672690e+02,
                -3.066479806614716e+01, 2.506628277459239e+00};
            static const double b[] = {
                -5.447609879822406e+01, 1.615858368580409e+02,
                -1.556989798598866e+02, 6.680131188771972e+01,
                -1.328068155288572e+01};
            static const double c[] = {
                -7.784894002430293e-03, -3.223964580411365e-01,
                -2.400758277161838e+00, -2.549732539343734e+00,
                4.374664141464968e+00, 2.938163982698783e+00};
            static const double d[] = {
                7.784695709041462e-03, 3.224671290700398e-01,
                2.445134137142996e+00, 3.754408661907416e+00};

            static const double P_LOW = 0.02425;
            static const double P_HIGH = 1.0 - P_LOW;

            if (p < P_LOW)
            {
                double q = std::sqrt(-2.0 * std::log(p));
                return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }
            if (p <= P_HIGH)
            {
                double q = p - 0.5;
                double r = q * q;
                return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
                       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
            }
            double q = std::sqrt(-2.0 * std::log(1.0 - p));
            return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                   ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
        }

        double z_score(double confidence)
        {
            if (std::abs(confidence - 0.95) < 1e-12)
                return 1.645;
            if (std::abs(confidence - 0.99) < 1e-12)
                return 2.326;
            return inverse_normal_cdf(confidence);
        }

        double mean(const std::vector<double> &values)
        {
            if (values.empty())
                return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        double sample_stddev(const std::vector<double> &values)
        {
            if (values.size() < 2)
                return 0.0;

            double m = mean(values);
            double sum_sq = 0.0;
            for (double v : values)
            {
                sum_sq += (v - m) * (v - m);
            }
            return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
        }

        size_t tail_index(size_t n, double confidence)
        {
            if (n == 0)
                return 0;
            double raw = std::floor(static_cast<double>(n) * (1.0 - confidence) + 1e-9);
            size_t idx = raw < 0.0 ? 0 : static_cast<size_t>(raw);
            return std::min(idx, n - 1);
        }

    } // namespace common
} // namespace fxhedge
