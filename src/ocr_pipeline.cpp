#include "core/ocr_pipeline.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>

OcrPipeline::OcrPipeline(const OcrEngine &engine, const ImagePreprocessor &preprocessor,
                         const FieldParser &parser, const OcrPipelineOptions &options)
    : engine_(engine), preprocessor_(preprocessor), parser_(parser), options_(options)
{
}

const OcrAttempt *OcrPipeline::selectBest(const std::vector<OcrAttempt> &attempts)
{
    const OcrAttempt *best = nullptr;
    for (const auto &attempt : attempts)
    {
        if (!attempt.completed)
            continue;
        if (!best)
        {
            best = &attempt;
            continue;
        }

        size_t fields = attempt.candidate.recognizedFieldCount();
        size_t best_fields = best->candidate.recognizedFieldCount();
        if (fields > best_fields ||
            (fields == best_fields &&
             attempt.candidate.averageFieldConfidence() > best->candidate.averageFieldConfidence()))
        {
            best = &attempt;
        }
    }
    return best;
}

StrategyOutcome OcrPipeline::run(const cv::Mat &image,
                                 std::chrono::steady_clock::time_point deadline,
                                 const std::function<bool()> &is_cancelled) const
{
    if (!engine_.isAvailable())
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "OCR engine unavailable");

    auto variants = preprocessor_.preprocess(image);
    if (variants.empty())
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "no image variants to recognize");

    const auto &modes = options_.page_segmentation_modes;
    if (modes.empty())
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "no page segmentation modes configured");

    std::vector<OcrAttempt> attempts(variants.size() * modes.size());
    for (size_t v = 0; v < variants.size(); ++v)
    {
        for (size_t m = 0; m < modes.size(); ++m)
        {
            OcrAttempt &attempt = attempts[v * modes.size() + m];
            attempt.variant = variants[v].name;
            attempt.page_segmentation_mode = modes[m];
        }
    }

    Logger::debug("Running " + std::to_string(attempts.size()) + " OCR attempts (" +
                  std::to_string(variants.size()) + " variants x " + std::to_string(modes.size()) + " modes)");

    tbb::task_arena arena(std::max(1, options_.max_threads));
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, attempts.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              OcrAttempt &attempt = attempts[i];
                                              if (std::chrono::steady_clock::now() >= deadline)
                                              {
                                                  attempt.error_message = "time budget expired";
                                                  continue;
                                              }
                                              if (is_cancelled && is_cancelled())
                                              {
                                                  attempt.error_message = "cancelled";
                                                  continue;
                                              }

                                              try
                                              {
                                                  const cv::Mat &variant = variants[i / modes.size()].image;
                                                  OcrText text = engine_.recognize(variant, attempt.page_segmentation_mode);
                                                  if (!text.success)
                                                  {
                                                      attempt.error_message = text.error_message;
                                                      continue;
                                                  }
                                                  attempt.candidate = parser_.parse(text.text);
                                                  attempt.completed = true;
                                              }
                                              catch (const std::exception &e)
                                              {
                                                  attempt.error_message = e.what();
                                              }
                                          }
                                      }); });

    size_t completed = static_cast<size_t>(std::count_if(attempts.begin(), attempts.end(),
                                                         [](const OcrAttempt &a)
                                                         { return a.completed; }));
    for (const auto &attempt : attempts)
    {
        if (!attempt.completed)
        {
            Logger::debug("OCR attempt " + attempt.variant + "/psm" + std::to_string(attempt.page_segmentation_mode) +
                          " did not complete: " + attempt.error_message);
        }
    }

    const OcrAttempt *best = selectBest(attempts);
    if (!best)
    {
        std::string detail = attempts.front().error_message.empty() ? "no text recognized" : attempts.front().error_message;
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "no OCR attempt completed", detail);
    }

    size_t fields = best->candidate.recognizedFieldCount();
    Logger::info("Best OCR attempt " + best->variant + "/psm" + std::to_string(best->page_segmentation_mode) +
                 " parsed " + std::to_string(fields) + " field(s); " + std::to_string(completed) + " of " +
                 std::to_string(attempts.size()) + " attempts completed");

    if (fields < options_.min_fields)
    {
        return StrategyOutcome::ofFailure(ExtractionStrategy::OCR, "insufficient fields",
                                          "best attempt found " + std::to_string(fields) + " of " +
                                              std::to_string(options_.min_fields) + " required fields");
    }

    ExtractionCandidate candidate = best->candidate;
    size_t skipped = static_cast<size_t>(std::count_if(attempts.begin(), attempts.end(),
                                                       [](const OcrAttempt &a)
                                                       { return a.error_message == "time budget expired" ||
                                                                a.error_message == "cancelled"; }));
    if (skipped > 0)
    {
        candidate.warnings.push_back("OCR skipped " + std::to_string(skipped) + " of " +
                                     std::to_string(attempts.size()) + " attempts (time budget or cancellation)");
    }
    return StrategyOutcome::ofCandidate(std::move(candidate));
}
