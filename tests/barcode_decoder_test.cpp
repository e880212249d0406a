#include "test_base.hpp"
#include "core/barcode_decoder.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <ZXing/BarcodeFormat.h>
#include <ZXing/BitMatrix.h>
#include <ZXing/MultiFormatWriter.h>

namespace
{
    const std::string PAYLOAD = "M1MUSTERMANN/MAX      EABC123 FRAJFKLH 1234 014Y012A0001 100";

    cv::Mat renderSymbol(ZXing::BarcodeFormat format, const std::string &text, int width, int height)
    {
        ZXing::MultiFormatWriter writer(format);
        writer.setMargin(16);
        ZXing::BitMatrix matrix = writer.encode(text, width, height);
        auto pixels = ZXing::ToMatrix<uint8_t>(matrix);
        cv::Mat image(pixels.height(), pixels.width(), CV_8UC1, const_cast<uint8_t *>(pixels.data()));
        return image.clone();
    }
}

class BarcodeDecoderTest : public TestBase
{
protected:
    BarcodeDecoder decoder_{true};
};

TEST_F(BarcodeDecoderTest, DecodesQrCodeOnColourPage)
{
    cv::Mat symbol = renderSymbol(ZXing::BarcodeFormat::QRCode, PAYLOAD, 300, 300);

    // Place the symbol on a larger white page
    cv::Mat page(800, 600, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::Mat symbol_bgr;
    cv::cvtColor(symbol, symbol_bgr, cv::COLOR_GRAY2BGR);
    symbol_bgr.copyTo(page(cv::Rect(150, 400, symbol_bgr.cols, symbol_bgr.rows)));

    auto results = decoder_.decode(page);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().text, PAYLOAD);
    EXPECT_EQ(results.front().format, "QRCode");
    EXPECT_FALSE(results.front().inverted);
}

TEST_F(BarcodeDecoderTest, DecodesInvertedSymbol)
{
    cv::Mat symbol = renderSymbol(ZXing::BarcodeFormat::QRCode, PAYLOAD, 300, 300);
    cv::Mat inverted;
    cv::bitwise_not(symbol, inverted);

    auto results = decoder_.decode(inverted);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.front().text, PAYLOAD);
}

TEST_F(BarcodeDecoderTest, BlankImageYieldsNoSymbols)
{
    cv::Mat blank(600, 400, CV_8UC3, cv::Scalar(255, 255, 255));
    EXPECT_TRUE(decoder_.decode(blank).empty());
    EXPECT_TRUE(decoder_.decode(cv::Mat()).empty());
}
