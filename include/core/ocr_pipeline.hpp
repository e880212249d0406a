#pragma once

#include "core/field_parser.hpp"
#include "core/image_preprocessor.hpp"
#include "core/ocr_engine.hpp"
#include "core/strategy_outcome.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct OcrPipelineOptions
{
    std::vector<int> page_segmentation_modes{6, 4, 11};
    size_t min_fields = 3;
    int max_threads = 4;
};

/**
 * @brief One (variant, page segmentation mode) recognition attempt
 */
struct OcrAttempt
{
    std::string variant;
    int page_segmentation_mode = 0;
    bool completed = false;
    std::string error_message;
    ExtractionCandidate candidate;
};

/**
 * @brief OCR fallback chain: preprocessing, recognition attempts and field parsing
 *
 * Every variant is recognized under every configured page segmentation mode.
 * Attempts run in parallel inside a task arena sized by `max_threads`; each
 * attempt writes only to its own slot. Attempts not started before the
 * deadline or after cancellation are skipped.
 */
class OcrPipeline
{
public:
    OcrPipeline(const OcrEngine &engine, const ImagePreprocessor &preprocessor,
                const FieldParser &parser, const OcrPipelineOptions &options);

    /**
     * @brief Run all attempts and select the best one
     * @param image Decoded document page
     * @param deadline Attempts are not started after this point
     * @param is_cancelled Polled before each attempt
     * @return The best candidate, or a failure when the engine is unavailable,
     *         no attempt completed, or the best attempt has fewer than `min_fields` recognized fields
     */
    StrategyOutcome run(const cv::Mat &image,
                        std::chrono::steady_clock::time_point deadline,
                        const std::function<bool()> &is_cancelled) const;

    /**
     * @brief Most parsed fields wins, ties by higher average field confidence
     * @return nullptr when no attempt completed
     */
    static const OcrAttempt *selectBest(const std::vector<OcrAttempt> &attempts);

private:
    const OcrEngine &engine_;
    const ImagePreprocessor &preprocessor_;
    const FieldParser &parser_;
    OcrPipelineOptions options_;
};
