/**
 * @file risk_observer.hpp
 * @brief Optional listener for risk-engine events
 */

#pragma once

#include "risk/risk_assessment.hpp"

#include <string>

namespace fxhedge
{
    namespace risk
    {

        /**
         * @class RiskObserver
         * @brief Receives notifications from CurrencyRiskEngine
         *
         * Observers are registered explicitly on an engine instance. Callbacks
         * run on the calling thread of calculate_currency_risk(); every method
         * has an empty default so an observer overrides only what it needs.
         */
        class RiskObserver
        {
        public:
            virtual ~RiskObserver() = default;

            virtual void on_risk_calculated(const RiskAssessment &) {}

            virtual void on_risk_alert(const std::string &, const RiskAlert &) {}

            virtual void on_error(const std::string &, const std::string &, const std::string &) {}
        };

    } // namespace risk
} // namespace fxhedge
