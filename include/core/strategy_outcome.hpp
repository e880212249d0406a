#pragma once

#include "core/extraction_types.hpp"
#include <optional>
#include <string>

/**
 * @brief Recoverable failure of one extraction strategy
 */
struct StrategyFailure
{
    ExtractionStrategy strategy;
    std::string reason;
    std::string detail;

    StrategyFailure() : strategy(ExtractionStrategy::OCR) {}
    StrategyFailure(ExtractionStrategy s, const std::string &r, const std::string &d = "")
        : strategy(s), reason(r), detail(d) {}

    /**
     * @brief Human-readable warning line, e.g. "ai_structured: timeout (read timed out)"
     */
    std::string describe() const
    {
        std::string text = strategyName(strategy) + ": " + reason;
        if (!detail.empty())
            text += " (" + detail + ")";
        return text;
    }
};

/**
 * @brief Tagged outcome of one strategy attempt: a candidate or a failure
 */
struct StrategyOutcome
{
    bool success;
    std::optional<ExtractionCandidate> candidate;
    StrategyFailure failure;

    StrategyOutcome() : success(false) {}

    static StrategyOutcome ofCandidate(ExtractionCandidate c)
    {
        StrategyOutcome outcome;
        outcome.success = true;
        outcome.candidate = std::move(c);
        return outcome;
    }

    static StrategyOutcome ofFailure(ExtractionStrategy strategy, const std::string &reason, const std::string &detail = "")
    {
        StrategyOutcome outcome;
        outcome.failure = StrategyFailure(strategy, reason, detail);
        return outcome;
    }
};
