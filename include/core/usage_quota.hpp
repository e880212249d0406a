#pragma once

#include "core/extraction_types.hpp"
#include <map>
#include <mutex>
#include <string>

struct QuotaDecision
{
    bool allowed = false;
    long current_count = 0;
};

/**
 * @brief Shared usage counter with atomic check-and-increment
 */
class UsageQuotaCounter
{
public:
    virtual ~UsageQuotaCounter() = default;

    /**
     * @brief Count one use of `key` if the limit allows it
     * @return allowed=false and the unchanged count once the limit is reached
     */
    virtual QuotaDecision checkAndIncrement(const std::string &key) = 0;

    /**
     * @brief Key namespaced by calendar month, e.g. "ai_extraction:2026-01"
     */
    static std::string monthlyKey(const std::string &prefix, const CalendarDate &date);
};

/**
 * @brief Process-local counter with one limit for every key
 */
class InMemoryUsageQuotaCounter : public UsageQuotaCounter
{
public:
    explicit InMemoryUsageQuotaCounter(long limit);

    QuotaDecision checkAndIncrement(const std::string &key) override;

    long currentCount(const std::string &key) const;
    long limit() const { return limit_; }

private:
    long limit_;
    mutable std::mutex mutex_;
    std::map<std::string, long> counts_;
};
