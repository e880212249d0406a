#include "core/barcode_decoder.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <ZXing/BarcodeFormat.h>
#include <ZXing/ReadBarcode.h>

BarcodeDecoder::BarcodeDecoder(bool try_harder) : try_harder_(try_harder)
{
}

std::vector<DecodedBarcode> BarcodeDecoder::decode(const cv::Mat &image) const
{
    if (image.empty())
        return {};

    try
    {
        cv::Mat gray;
        if (image.channels() == 3)
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        else if (image.channels() == 4)
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        else
            gray = image.isContinuous() ? image : image.clone();

        auto results = decodeGray(gray, false);
        if (!results.empty())
            return results;

        cv::Mat equalized;
        cv::equalizeHist(gray, equalized);
        results = decodeGray(equalized, false);
        if (!results.empty())
            return results;

        cv::Mat inverted;
        cv::bitwise_not(gray, inverted);
        return decodeGray(inverted, true);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV error while preparing image for barcode decoding: " + std::string(e.what()));
        return {};
    }
}

std::vector<DecodedBarcode> BarcodeDecoder::decodeGray(const cv::Mat &gray, bool inverted) const
{
    std::vector<DecodedBarcode> results;

    ZXing::ImageView view(gray.data, gray.cols, gray.rows, ZXing::ImageFormat::Lum, static_cast<int>(gray.step));

    ZXing::ReaderOptions options;
    options.setTryHarder(try_harder_);
    options.setTryRotate(true);
    options.setTryInvert(false);
    options.setMaxNumberOfSymbols(4);
    options.setFormats(ZXing::BarcodeFormat::PDF417 | ZXing::BarcodeFormat::Aztec |
                       ZXing::BarcodeFormat::QRCode | ZXing::BarcodeFormat::DataMatrix |
                       ZXing::BarcodeFormat::Code128);

    auto barcodes = ZXing::ReadBarcodes(view, options);
    for (const auto &barcode : barcodes)
    {
        if (barcode.isValid() && !barcode.text().empty())
        {
            DecodedBarcode result;
            result.text = barcode.text();
            result.format = ZXing::ToString(barcode.format());
            result.inverted = inverted;
            results.push_back(result);
        }
    }

    Logger::debug("ZXing pass" + std::string(inverted ? " (inverted)" : "") + " found " +
                  std::to_string(results.size()) + " symbol(s)");
    return results;
}
