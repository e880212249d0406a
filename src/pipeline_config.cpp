#include "core/pipeline_config.hpp"
#include "logging/logger.hpp"

namespace
{
    const nlohmann::json &section(const nlohmann::json &config, const char *key)
    {
        static const nlohmann::json empty = nlohmann::json::object();
        auto it = config.find(key);
        return it != config.end() && it->is_object() ? *it : empty;
    }

    template <typename T>
    void read(const nlohmann::json &node, const char *key, T &target)
    {
        auto it = node.find(key);
        if (it == node.end() || it->is_null())
            return;
        try
        {
            target = it->get<T>();
        }
        catch (const nlohmann::json::type_error &e)
        {
            Logger::warn(std::string("Ignoring mistyped configuration value '") + key + "': " + e.what());
        }
    }
}

PipelineConfig PipelineConfig::defaults()
{
    return PipelineConfig();
}

PipelineConfig PipelineConfig::fromJson(const nlohmann::json &config)
{
    PipelineConfig result;
    if (!config.is_object())
        return result;

    read(config, "log_level", result.log_level);

    const auto &input = section(config, "input");
    read(input, "max_bytes", result.input.max_bytes);
    read(input, "pdf_render_dpi", result.input.pdf_render_dpi);

    const auto &pipeline = section(config, "pipeline");
    read(pipeline, "default_timeout_ms", result.default_timeout_ms);
    read(pipeline, "max_processing_threads", result.ocr.pipeline.max_threads);

    const auto &barcode = section(config, "barcode");
    read(barcode, "enabled", result.barcode_enabled);
    read(barcode, "try_harder", result.barcode_try_harder);

    const auto &ai = section(config, "ai");
    read(ai, "enabled", result.ai.enabled);
    read(ai, "endpoint", result.ai.service.endpoint);
    read(ai, "path", result.ai.service.path);
    read(ai, "api_key", result.ai.service.api_key);
    read(ai, "api_key_header", result.ai.service.api_key_header);
    read(ai, "model", result.ai.service.model);
    read(ai, "timeout_ms", result.ai.timeout_ms);
    read(ai, "min_confidence", result.ai.min_confidence);
    read(ai, "quota_key", result.ai.quota_key);
    read(ai, "monthly_limit", result.ai.monthly_limit);
    read(ai, "warning_threshold", result.ai.warning_threshold);

    const auto &ocr = section(config, "ocr");
    read(ocr, "enabled", result.ocr.enabled);
    read(ocr, "language", result.ocr.language);
    read(ocr, "tessdata_path", result.ocr.tessdata_path);
    read(ocr, "min_fields", result.ocr.pipeline.min_fields);
    read(ocr, "page_segmentation_modes", result.ocr.pipeline.page_segmentation_modes);
    read(ocr, "upscale_below_px", result.ocr.preprocessing.upscale_below_px);
    read(ocr, "upscale_factor", result.ocr.preprocessing.upscale_factor);
    result.ocr.parser = FieldParserConfig::fromJson(ocr);

    const auto &airports = section(config, "airports");
    read(airports, "database_path", result.airports_database_path);

    const auto &scoring = section(config, "scoring");
    auto weights = scoring.find("weights");
    if (weights != scoring.end())
        result.scoring = ScoringWeights::fromJson(*weights);

    if (result.ocr.pipeline.page_segmentation_modes.empty())
    {
        Logger::warn("ocr.page_segmentation_modes is empty, using defaults");
        result.ocr.pipeline.page_segmentation_modes = OcrPipelineOptions().page_segmentation_modes;
    }
    if (result.ocr.pipeline.max_threads <= 0)
        result.ocr.pipeline.max_threads = 1;

    return result;
}
