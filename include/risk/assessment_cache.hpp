/**
 * @file assessment_cache.hpp
 * @brief Per-user storage of the latest risk assessment
 *
 * Assessments are immutable once stored; a newer assessment for the same
 * user replaces the previous one. No history is kept.
 */

#pragma once

#include "risk/risk_assessment.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fxhedge
{
    namespace risk
    {

        using AssessmentPtr = std::shared_ptr<const RiskAssessment>;

        /**
         * @class AssessmentCache
         * @brief Abstract cache injected into the risk engine
         *
         * Implementations must be safe for concurrent use.
         */
        class AssessmentCache
        {
        public:
            virtual ~AssessmentCache() = default;

            virtual void store(const std::string &user_id, AssessmentPtr assessment) = 0;

            /**
             * @brief Latest assessment for a user, or nullptr
             */
            virtual AssessmentPtr get(const std::string &user_id) const = 0;

            virtual void evict(const std::string &user_id) = 0;

            virtual size_t size() const = 0;
        };

        /**
         * @class MostRecentAssessmentCache
         * @brief Keeps only the most recent assessment per user (last write wins)
         */
        class MostRecentAssessmentCache : public AssessmentCache
        {
        public:
            void store(const std::string &user_id, AssessmentPtr assessment) override;
            AssessmentPtr get(const std::string &user_id) const override;
            void evict(const std::string &user_id) override;
            size_t size() const override;

        private:
            mutable std::mutex mutex_;
            std::map<std::string, AssessmentPtr> entries_;
        };

    } // namespace risk
} // namespace fxhedge
