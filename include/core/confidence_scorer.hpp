#pragma once

#include "core/extraction_types.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Per-field weights of the overall confidence
 */
struct ScoringWeights
{
    std::map<std::string, double> weights;
    double default_weight = 0.5;

    static ScoringWeights defaults();

    /**
     * @brief Defaults overridden by a `scoring.weights` object; `other` sets the default weight
     */
    static ScoringWeights fromJson(const nlohmann::json &weights_section);

    double weightOf(const std::string &field) const;
};

/**
 * @brief Overall confidence computation and field-level merge of candidates
 */
class ConfidenceScorer
{
public:
    explicit ConfidenceScorer(const ScoringWeights &weights = ScoringWeights::defaults());

    /**
     * @brief Fields that always take part in the weighted mean, with confidence 0 when absent
     */
    static const std::vector<std::string> &requiredFields();

    /**
     * @brief Weighted mean of field confidences
     *
     * Returns 0 for an empty map. Missing required fields contribute their
     * weight with confidence 0, so a partial result stays strictly below 1.
     */
    double overallConfidence(const FieldConfidence &fields) const;

    /**
     * @brief Highest overall confidence, ties broken barcode > AI > OCR
     * @return index into `candidates`, or -1 when empty
     */
    int selectBest(const std::vector<ExtractionCandidate> &candidates) const;

    /**
     * @brief Field-level merge of scored candidates
     *
     * Starts from the best candidate; each field then takes the value of the
     * candidate with the highest confidence for it (ties by method priority).
     * The airline travels with the flight number. Extra segments and passengers
     * come from the best candidate. The result is re-scored.
     *
     * @param candidates Non-empty list of candidates
     */
    ExtractionCandidate merge(const std::vector<ExtractionCandidate> &candidates) const;

private:
    ScoringWeights weights_;
};
