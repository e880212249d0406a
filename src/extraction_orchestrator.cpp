#include "core/extraction_orchestrator.hpp"
#include "core/bcbp_parser.hpp"
#include "core/date_time_utils.hpp"
#include "core/ocr_pipeline.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace
{
    const AirportLookup &requireAirports(const ExtractionCollaborators &collaborators)
    {
        if (!collaborators.airports)
            throw std::invalid_argument("ExtractionOrchestrator requires an airport dataset");
        return *collaborators.airports;
    }

    const char *NO_BARCODE = "no barcode found";
    const char *DISABLED = "disabled";

    bool carriesSegmentFields(const ExtractionCandidate &candidate)
    {
        static const char *segment_fields[] = {
            FieldNames::FLIGHT_NUMBER, FieldNames::DEPARTURE_AIRPORT, FieldNames::ARRIVAL_AIRPORT,
            FieldNames::FLIGHT_DATE, FieldNames::DEPARTURE_TIME, FieldNames::ARRIVAL_TIME,
            FieldNames::BOARDING_TIME, FieldNames::SEAT_NUMBER};
        if (candidate.flight_segments.empty())
            return false;
        for (const char *field : segment_fields)
        {
            if (candidate.confidenceOf(field) > 0.0)
                return true;
        }
        return false;
    }

    std::string formatConfidence(double value)
    {
        std::ostringstream ss;
        ss.precision(2);
        ss << std::fixed << value;
        return ss.str();
    }
}

ExtractionOrchestrator::ExtractionOrchestrator(const PipelineConfig &config, const ExtractionCollaborators &collaborators)
    : config_(config),
      collaborators_(collaborators),
      loader_(config.input),
      preprocessor_(config.ocr.preprocessing),
      parser_(config.ocr.parser, requireAirports(collaborators)),
      ai_extractor_(*collaborators.airports),
      scorer_(config.scoring)
{
    if (!collaborators_.today)
        collaborators_.today = &DateTimeUtils::today;
}

ExtractionResult ExtractionOrchestrator::extract(const ExtractionRequest &request)
{
    const auto started = Clock::now();
    std::chrono::milliseconds budget = request.timeout.count() > 0
                                           ? request.timeout
                                           : std::chrono::milliseconds(config_.default_timeout_ms);

    // Throws FatalInputError; nothing else is attempted for malformed input
    LoadedDocument document = loader_.load(request.data, request.media_type);
    Logger::info("Extracting document sha256=" + document.fingerprint + " (" + document.media_type + ", " +
                 std::to_string(request.data.size()) + " bytes)");

    RunState state{request, started + budget, collaborators_.today(), {}, {}, {}};
    for (const auto &warning : document.warnings)
        addWarning(state, warning);

    if (request.isCancelled())
        return buildFailure(state, started, "Extraction cancelled");

    StrategyOutcome barcode = runBarcode(document, state);
    if (barcode.success)
    {
        state.candidates.push_back(*barcode.candidate);
        return buildResult(state, started);
    }
    recordFailure(state, barcode.failure, barcode.failure.reason != NO_BARCODE && barcode.failure.reason != DISABLED);

    if (request.isCancelled())
        return buildFailure(state, started, "Extraction cancelled");

    bool ai_accepted = false;
    StrategyOutcome ai = runAi(document, state);
    if (ai.success)
    {
        if (ai.candidate->overall_confidence >= config_.ai.min_confidence)
        {
            ai_accepted = true;
        }
        else
        {
            addWarning(state, "AI result confidence " + formatConfidence(ai.candidate->overall_confidence) +
                                  " is below " + formatConfidence(config_.ai.min_confidence) + "; running OCR");
        }
        state.candidates.push_back(*ai.candidate);
    }
    else
    {
        recordFailure(state, ai.failure, ai.failure.reason != DISABLED);
    }

    if (!ai_accepted)
    {
        if (request.isCancelled())
            return buildFailure(state, started, "Extraction cancelled");

        StrategyOutcome ocr = runOcr(document, state);
        if (ocr.success)
            state.candidates.push_back(*ocr.candidate);
        else
            recordFailure(state, ocr.failure, true);
    }

    if (state.candidates.empty())
        return buildFailure(state, started, "All extraction strategies failed");
    if (std::none_of(state.candidates.begin(), state.candidates.end(), carriesSegmentFields))
    {
        addWarning(state, "No flight details found; passenger and booking data alone are not a boarding pass");
        return buildFailure(state, started, "No flight segment extracted");
    }
    return buildResult(state, started);
}

StrategyOutcome ExtractionOrchestrator::runBarcode(const LoadedDocument &document, RunState &state) const
{
    if (!config_.barcode_enabled || !collaborators_.barcode_source)
        return StrategyOutcome::ofFailure(ExtractionStrategy::BARCODE, DISABLED);

    try
    {
        std::vector<DecodedBarcode> symbols = collaborators_.barcode_source->decode(document.image);
        if (symbols.empty())
        {
            Logger::debug("No barcode symbol detected");
            return StrategyOutcome::ofFailure(ExtractionStrategy::BARCODE, NO_BARCODE);
        }

        BcbpParser parser(*collaborators_.airports, state.today);
        for (const auto &symbol : symbols)
        {
            auto payload = BcbpParser::parse(symbol.text);
            if (!payload)
            {
                addWarning(state, "barcode: " + symbol.format + " payload is not a valid boarding pass");
                continue;
            }

            ExtractionCandidate candidate = parser.buildCandidate(*payload, symbol.format, symbol.text);
            if (candidate.flight_segments.empty() || candidate.flight_segments.front().flight_number.empty())
            {
                addWarning(state, "barcode: " + symbol.format + " payload carries no flight number");
                continue;
            }

            candidate.overall_confidence = scorer_.overallConfidence(candidate.field_confidence);
            Logger::info("Barcode strategy succeeded (" + symbol.format + ")");
            return StrategyOutcome::ofCandidate(candidate);
        }

        return StrategyOutcome::ofFailure(ExtractionStrategy::BARCODE, "unparseable payload",
                                          std::to_string(symbols.size()) + " symbol(s) decoded");
    }
    catch (const std::exception &e)
    {
        Logger::error("Barcode strategy error: " + std::string(e.what()));
        return StrategyOutcome::ofFailure(ExtractionStrategy::BARCODE, "internal error", e.what());
    }
}

bool ExtractionOrchestrator::consumeAiQuota(RunState &state)
{
    if (!collaborators_.quota_counter)
        return true;

    const std::string key = UsageQuotaCounter::monthlyKey(config_.ai.quota_key, state.today);
    QuotaDecision decision = collaborators_.quota_counter->checkAndIncrement(key);
    const std::string usage = std::to_string(decision.current_count) + "/" + std::to_string(config_.ai.monthly_limit);

    if (!decision.allowed)
    {
        Logger::warn("AI extraction quota exhausted for " + key + " (" + usage + ")");
        if (collaborators_.notifier)
        {
            collaborators_.notifier->sendAlert("AI extraction quota exceeded",
                                               "Monthly quota " + key + " is exhausted (" + usage +
                                                   "); documents fall back to OCR");
        }
        return false;
    }

    if (decision.current_count == config_.ai.warning_threshold && collaborators_.notifier)
    {
        collaborators_.notifier->sendAlert("AI extraction quota warning",
                                           "Monthly quota " + key + " reached its warning threshold (" + usage + ")");
    }
    return true;
}

StrategyOutcome ExtractionOrchestrator::runAi(const LoadedDocument &document, RunState &state)
{
    if (!config_.ai.enabled || !collaborators_.ai_service)
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, DISABLED);

    try
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(state.deadline - Clock::now());
        if (remaining.count() <= 0)
            return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "time budget exhausted");

        if (!consumeAiQuota(state))
        {
            addWarning(state, "AI extraction monthly quota exhausted; OCR fallback used");
            return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "quota exceeded");
        }

        auto timeout = std::min(std::chrono::milliseconds(config_.ai.timeout_ms), remaining);
        Logger::debug("Calling AI extractor with a " + std::to_string(timeout.count()) + " ms timeout");

        AiServiceResponse response = collaborators_.ai_service->extractStructured(
            document.ai_image, document.ai_media_type, AiStructuredExtractor::outputSchema(), timeout);
        StrategyOutcome outcome = ai_extractor_.interpret(response);

        if (outcome.success)
        {
            outcome.candidate->overall_confidence = scorer_.overallConfidence(outcome.candidate->field_confidence);
            Logger::info("AI strategy produced " + std::to_string(outcome.candidate->fieldCount()) +
                         " fields, confidence " + formatConfidence(outcome.candidate->overall_confidence));
        }
        return outcome;
    }
    catch (const std::exception &e)
    {
        Logger::error("AI strategy error: " + std::string(e.what()));
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "internal error", e.what());
    }
}

StrategyOutcome ExtractionOrchestrator::runOcr(const LoadedDocument &document, RunState &state) const
{
    if (!config_.ocr.enabled || !collaborators_.ocr_engine)
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, DISABLED);

    if (Clock::now() >= state.deadline)
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "time budget exhausted");

    try
    {
        OcrPipeline pipeline(*collaborators_.ocr_engine, preprocessor_, parser_, config_.ocr.pipeline);
        const ExtractionRequest &request = state.request;
        StrategyOutcome outcome = pipeline.run(document.image, state.deadline,
                                               [&request]()
                                               { return request.isCancelled(); });
        if (outcome.success)
            outcome.candidate->overall_confidence = scorer_.overallConfidence(outcome.candidate->field_confidence);
        return outcome;
    }
    catch (const std::exception &e)
    {
        Logger::error("OCR strategy error: " + std::string(e.what()));
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "internal error", e.what());
    }
}

void ExtractionOrchestrator::recordFailure(RunState &state, const StrategyFailure &failure, bool warn) const
{
    Logger::info("Strategy failed: " + failure.describe());
    state.failures.push_back(failure);
    if (warn)
        addWarning(state, failure.describe());
}

void ExtractionOrchestrator::addWarning(RunState &state, const std::string &warning) const
{
    if (std::find(state.warnings.begin(), state.warnings.end(), warning) == state.warnings.end())
        state.warnings.push_back(warning);
}

ExtractionResult ExtractionOrchestrator::buildResult(RunState &state, Clock::time_point started) const
{
    ExtractionCandidate merged = scorer_.merge(state.candidates);
    for (const auto &warning : merged.warnings)
        addWarning(state, warning);

    ExtractionResult result;
    result.success = true;
    result.method = merged.method;
    result.flight_segments = merged.flight_segments;
    result.passengers = merged.passengers;
    result.booking_reference = merged.booking_reference;
    result.field_confidence = merged.field_confidence;
    result.raw_text = merged.raw_text;

    if (result.passengers.empty() || result.passengers.front().empty())
    {
        if (result.passengers.empty())
            result.passengers.emplace_back();
        result.field_confidence[FieldNames::PASSENGER_NAME] = 0.0;
        addWarning(state, "Passenger name not found");
    }

    result.overall_confidence = scorer_.overallConfidence(result.field_confidence);
    result.warnings = state.warnings;
    result.processing_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();

    Logger::info("Extraction finished via " + result.method->toString() + " in " +
                 std::to_string(result.processing_time_ms) + " ms (confidence " +
                 formatConfidence(result.overall_confidence) + ", " + std::to_string(state.candidates.size()) +
                 " candidate(s))");
    return result;
}

ExtractionResult ExtractionOrchestrator::buildFailure(RunState &state, Clock::time_point started, const std::string &error) const
{
    for (const auto &failure : state.failures)
        addWarning(state, failure.describe());

    std::string summary = error;
    if (!state.failures.empty())
    {
        summary += ":";
        for (size_t i = 0; i < state.failures.size(); ++i)
            summary += (i == 0 ? " " : "; ") + state.failures[i].describe();
    }

    ExtractionResult result;
    result.success = false;
    result.overall_confidence = 0.0;
    result.warnings = state.warnings;
    result.errors.push_back(summary);
    result.processing_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();

    Logger::warn("Extraction failed after " + std::to_string(result.processing_time_ms) + " ms: " + summary);
    return result;
}
