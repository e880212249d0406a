#include "core/admin_notifier.hpp"
#include "core/airport_database.hpp"
#include "core/barcode_decoder.hpp"
#include "core/extraction_errors.hpp"
#include "core/extraction_orchestrator.hpp"
#include "core/http_ai_extractor_service.hpp"
#include "core/ocr_engine.hpp"
#include "core/pipeline_config.hpp"
#include "core/poco_config_manager.hpp"
#include "core/usage_quota.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

namespace
{
    const int EXIT_EXTRACTION_FAILED = 1;
    const int EXIT_FATAL_INPUT = 2;
    const int EXIT_USAGE = 3;

    void printUsage(const char *program)
    {
        std::cout << "Boarding Pass Extractor" << std::endl;
        std::cout << "Usage: " << program << " [options] <file>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>       Configuration file (default: config/config.json)" << std::endl;
        std::cout << "  --media-type, -t <type>   Declared media type, e.g. image/png (default: from extension)" << std::endl;
        std::cout << "  --help, -h                Show this help message" << std::endl;
    }

    bool readFile(const std::string &path, std::vector<uint8_t> &data)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return false;
        data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return !in.bad();
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config/config.json";
    std::string media_type;
    std::string input_path;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--media-type" || arg == "-t") && i + 1 < argc)
        {
            media_type = argv[++i];
        }
        else if (!arg.empty() && arg[0] != '-' && input_path.empty())
        {
            input_path = arg;
        }
        else
        {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (input_path.empty())
    {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    Logger::init("INFO");

    auto &config_manager = PocoConfigManager::getInstance();
    if (!config_manager.load(config_path))
    {
        Logger::warn("Using default configuration");
        config_manager.initializeDefaultConfig();
    }
    if (!config_manager.validateConfig())
    {
        std::cerr << "Invalid configuration: " << config_path << std::endl;
        return EXIT_USAGE;
    }

    PipelineConfig config = PipelineConfig::fromJson(config_manager.getAll());
    Logger::setLevel(config.log_level);

    std::vector<uint8_t> data;
    if (!readFile(input_path, data))
    {
        std::cerr << "Cannot read file: " << input_path << std::endl;
        return EXIT_USAGE;
    }
    if (media_type.empty())
        media_type = DocumentLoader::mediaTypeForPath(input_path);

    auto airports = std::make_shared<AirportDatabase>();
    if (!airports->loadFromFile(config.airports_database_path))
        Logger::warn("Airport dataset unavailable; airport codes cannot be validated");

    ExtractionCollaborators collaborators;
    collaborators.airports = airports;
    collaborators.barcode_source = std::make_shared<BarcodeDecoder>(config.barcode_try_harder);
    if (config.ocr.enabled)
        collaborators.ocr_engine = std::make_shared<TesseractOcrEngine>(config.ocr.tessdata_path, config.ocr.language);
    if (config.ai.enabled)
        collaborators.ai_service = std::make_shared<HttpAiExtractorService>(config.ai.service);
    collaborators.quota_counter = std::make_shared<InMemoryUsageQuotaCounter>(config.ai.monthly_limit);
    collaborators.notifier = std::make_shared<LoggingAdminNotifier>();

    ExtractionOrchestrator orchestrator(config, collaborators);

    ExtractionRequest request;
    request.data = std::move(data);
    request.media_type = media_type;

    try
    {
        ExtractionResult result = orchestrator.extract(request);
        std::cout << result.toJson().dump(2) << std::endl;
        return result.success ? 0 : EXIT_EXTRACTION_FAILED;
    }
    catch (const FatalInputError &e)
    {
        Logger::error("Rejected input (" + FatalInputError::kindName(e.kind()) + "): " + e.what());
        nlohmann::json error = {{"success", false},
                                {"errorKind", FatalInputError::kindName(e.kind())},
                                {"errors", nlohmann::json::array({e.what()})}};
        std::cout << error.dump(2) << std::endl;
        return EXIT_FATAL_INPUT;
    }
}
