#include "risk/assessment_cache.hpp"

#include <stdexcept>

namespace fxhedge
{
    namespace risk
    {

        void MostRecentAssessmentCache::store(const std::string &user_id, AssessmentPtr assessment)
        {
            if (!assessment)
            {
                throw std::invalid_argument("Cannot cache a null assessment for user: " + user_id);
            }
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[user_id] = std::move(assessment);
        }

        AssessmentPtr MostRecentAssessmentCache::get(const std::string &user_id) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(user_id);
            return it == entries_.end() ? nullptr : it->second;
        }

        void MostRecentAssessmentCache::evict(const std::string &user_id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(user_id);
        }

        size_t MostRecentAssessmentCache::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

    } // namespace risk
} // namespace fxhedge
