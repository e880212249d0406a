#pragma once

#include "core/admin_notifier.hpp"
#include "core/ai_extractor.hpp"
#include "core/airport_database.hpp"
#include "core/barcode_decoder.hpp"
#include "core/confidence_scorer.hpp"
#include "core/document_loader.hpp"
#include "core/extraction_types.hpp"
#include "core/field_parser.hpp"
#include "core/image_preprocessor.hpp"
#include "core/ocr_engine.hpp"
#include "core/pipeline_config.hpp"
#include "core/strategy_outcome.hpp"
#include "core/usage_quota.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief External services used by the orchestrator
 *
 * Only `airports` is required. A missing barcode source, OCR engine or AI
 * service disables that strategy; a missing quota counter leaves AI calls
 * unmetered and a missing notifier drops alerts.
 */
struct ExtractionCollaborators
{
    std::shared_ptr<const AirportLookup> airports;
    std::shared_ptr<const BarcodeSource> barcode_source;
    std::shared_ptr<const OcrEngine> ocr_engine;
    std::shared_ptr<AiExtractorService> ai_service;
    std::shared_ptr<UsageQuotaCounter> quota_counter;
    std::shared_ptr<AdminNotifier> notifier;
    std::function<CalendarDate()> today; // defaults to the local calendar date
};

/**
 * @brief Runs the extraction strategies for one document and merges their results
 *
 * Order: barcode (authoritative when it parses), AI-structured extraction
 * (quota-limited), OCR fallback. Recoverable failures never throw; only
 * malformed input raises FatalInputError.
 */
class ExtractionOrchestrator
{
public:
    ExtractionOrchestrator(const PipelineConfig &config, const ExtractionCollaborators &collaborators);

    /**
     * @brief Extract boarding pass data from one uploaded document
     * @throws FatalInputError for empty, oversized, unsupported or undecodable input
     */
    ExtractionResult extract(const ExtractionRequest &request);

private:
    using Clock = std::chrono::steady_clock;

    struct RunState
    {
        const ExtractionRequest &request;
        Clock::time_point deadline;
        CalendarDate today;
        std::vector<ExtractionCandidate> candidates;
        std::vector<StrategyFailure> failures;
        std::vector<std::string> warnings;
    };

    StrategyOutcome runBarcode(const LoadedDocument &document, RunState &state) const;
    StrategyOutcome runAi(const LoadedDocument &document, RunState &state);
    StrategyOutcome runOcr(const LoadedDocument &document, RunState &state) const;

    /**
     * @brief Consume the request quota for one AI call
     * @return false when the monthly limit is reached
     */
    bool consumeAiQuota(RunState &state);

    void recordFailure(RunState &state, const StrategyFailure &failure, bool warn) const;
    void addWarning(RunState &state, const std::string &warning) const;

    ExtractionResult buildResult(RunState &state, Clock::time_point started) const;
    ExtractionResult buildFailure(RunState &state, Clock::time_point started, const std::string &error) const;

    PipelineConfig config_;
    ExtractionCollaborators collaborators_;
    DocumentLoader loader_;
    ImagePreprocessor preprocessor_;
    FieldParser parser_;
    AiStructuredExtractor ai_extractor_;
    ConfidenceScorer scorer_;
};
