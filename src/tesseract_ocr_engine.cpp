#include "core/ocr_engine.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <tbb/enumerable_thread_specific.h>
#include <tesseract/baseapi.h>

struct TesseractOcrEngine::Impl
{
    std::string tessdata_path;
    std::string language;
    bool available = false;
    tbb::enumerable_thread_specific<std::unique_ptr<tesseract::TessBaseAPI>> apis;

    std::unique_ptr<tesseract::TessBaseAPI> createApi() const
    {
        auto api = std::make_unique<tesseract::TessBaseAPI>();
        const char *datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
        int rc = api->Init(datapath, language.c_str(), tesseract::OEM_DEFAULT);
        if (rc != 0)
        {
            Logger::error("Tesseract Init failed (rc=" + std::to_string(rc) + ", lang=" + language +
                          "). Check TESSDATA_PREFIX and traineddata presence.");
            return nullptr;
        }
        return api;
    }

    tesseract::TessBaseAPI *threadApi()
    {
        auto &api = apis.local();
        if (!api)
            api = createApi();
        return api.get();
    }
};

TesseractOcrEngine::TesseractOcrEngine(const std::string &tessdata_path, const std::string &language)
    : impl_(std::make_unique<Impl>())
{
    impl_->tessdata_path = tessdata_path;
    impl_->language = language;
    impl_->available = impl_->threadApi() != nullptr;
    if (impl_->available)
        Logger::info("Tesseract OCR engine initialised (lang=" + language + ")");
}

TesseractOcrEngine::~TesseractOcrEngine()
{
    for (auto &api : impl_->apis)
    {
        if (api)
            api->End();
    }
}

bool TesseractOcrEngine::isAvailable() const
{
    return impl_->available;
}

OcrText TesseractOcrEngine::recognize(const cv::Mat &image, int page_segmentation_mode) const
{
    if (!impl_->available)
        return OcrText(false, "", 0.0, "Tesseract engine failed to initialise");
    if (image.empty())
        return OcrText(false, "", 0.0, "Empty image");

    tesseract::TessBaseAPI *api = impl_->threadApi();
    if (!api)
        return OcrText(false, "", 0.0, "Tesseract engine failed to initialise on worker thread");

    cv::Mat gray;
    if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = image;

    api->SetPageSegMode(static_cast<tesseract::PageSegMode>(page_segmentation_mode));
    api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    api->SetSourceResolution(300);

    std::unique_ptr<char[]> text(api->GetUTF8Text());
    if (!text)
    {
        api->Clear();
        return OcrText(false, "", 0.0, "Tesseract returned no text");
    }

    double confidence = api->MeanTextConf() / 100.0;
    api->Clear();
    return OcrText(true, text.get(), confidence);
}
