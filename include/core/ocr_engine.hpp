#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <string>

/**
 * @brief Text recognized from one image under one page segmentation mode
 */
struct OcrText
{
    bool success;
    std::string text;
    double mean_confidence; // 0..1
    std::string error_message;

    OcrText() : success(false), mean_confidence(0.0) {}
    OcrText(bool s, const std::string &t = "", double c = 0.0, const std::string &msg = "")
        : success(s), text(t), mean_confidence(c), error_message(msg) {}
};

/**
 * @brief Text recognition backend
 *
 * Implementations must be safe to call concurrently from several threads.
 */
class OcrEngine
{
public:
    virtual ~OcrEngine() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @param image BGR or grayscale image
     * @param page_segmentation_mode Tesseract PSM number (e.g. 6 single block, 11 sparse text)
     */
    virtual OcrText recognize(const cv::Mat &image, int page_segmentation_mode) const = 0;
};

/**
 * @brief Tesseract backed engine holding one TessBaseAPI per worker thread
 */
class TesseractOcrEngine : public OcrEngine
{
public:
    /**
     * @param tessdata_path Directory with *.traineddata; empty uses TESSDATA_PREFIX
     * @param language Tesseract language string, e.g. "eng" or "eng+deu"
     */
    TesseractOcrEngine(const std::string &tessdata_path, const std::string &language);
    ~TesseractOcrEngine() override;

    TesseractOcrEngine(const TesseractOcrEngine &) = delete;
    TesseractOcrEngine &operator=(const TesseractOcrEngine &) = delete;

    bool isAvailable() const override;
    OcrText recognize(const cv::Mat &image, int page_segmentation_mode) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
