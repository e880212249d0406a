#include "core/usage_quota.hpp"
#include <cstdio>

std::string UsageQuotaCounter::monthlyKey(const std::string &prefix, const CalendarDate &date)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", date.year, date.month);
    return prefix + ":" + buffer;
}

InMemoryUsageQuotaCounter::InMemoryUsageQuotaCounter(long limit) : limit_(limit)
{
}

QuotaDecision InMemoryUsageQuotaCounter::checkAndIncrement(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    long &count = counts_[key];

    QuotaDecision decision;
    if (count >= limit_)
    {
        decision.current_count = count;
        return decision;
    }
    ++count;
    decision.allowed = true;
    decision.current_count = count;
    return decision;
}

long InMemoryUsageQuotaCounter::currentCount(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}
