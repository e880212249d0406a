#pragma once

#include "core/confidence_scorer.hpp"
#include "core/document_loader.hpp"
#include "core/field_parser.hpp"
#include "core/http_ai_extractor_service.hpp"
#include "core/image_preprocessor.hpp"
#include "core/ocr_pipeline.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct AiConfig
{
    bool enabled = false;
    AiServiceSettings service;
    int timeout_ms = 45000;
    double min_confidence = 0.6;
    std::string quota_key = "ai_extraction";
    long monthly_limit = 999;
    long warning_threshold = 900;
};

struct OcrConfig
{
    bool enabled = true;
    std::string language = "eng";
    std::string tessdata_path;
    OcrPipelineOptions pipeline;
    PreprocessorOptions preprocessing;
    FieldParserConfig parser = FieldParserConfig::defaults();
};

/**
 * @brief Immutable settings snapshot handed to the orchestrator
 *
 * Built from PocoConfigManager::getAll(); tests construct it directly.
 */
struct PipelineConfig
{
    std::string log_level = "INFO";
    DocumentLoaderOptions input;
    int default_timeout_ms = 60000;
    bool barcode_enabled = true;
    bool barcode_try_harder = true;
    AiConfig ai;
    OcrConfig ocr;
    std::string airports_database_path = "data/airports.json";
    ScoringWeights scoring = ScoringWeights::defaults();

    static PipelineConfig defaults();

    /**
     * @brief Snapshot from a full configuration tree; missing keys keep their defaults
     */
    static PipelineConfig fromJson(const nlohmann::json &config);
};
