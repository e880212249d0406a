#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief One decoded barcode symbol
 */
struct DecodedBarcode
{
    std::string text;
    std::string format; // ZXing format name, e.g. "PDF417", "QRCode"
    bool inverted = false;
};

/**
 * @brief Source of decoded barcode symbols for an image
 *
 * Returns an empty list when no decodable symbol is present; that is not an error.
 */
class BarcodeSource
{
public:
    virtual ~BarcodeSource() = default;
    virtual std::vector<DecodedBarcode> decode(const cv::Mat &image) const = 0;
};

/**
 * @brief ZXing based decoder for boarding pass symbologies
 *
 * Reads PDF417, Aztec, QR Code, DataMatrix and Code128. The grayscale image is
 * tried as is, then histogram equalized, then colour inverted; the first pass
 * that yields symbols wins.
 */
class BarcodeDecoder : public BarcodeSource
{
public:
    explicit BarcodeDecoder(bool try_harder = true);

    std::vector<DecodedBarcode> decode(const cv::Mat &image) const override;

private:
    std::vector<DecodedBarcode> decodeGray(const cv::Mat &gray, bool inverted) const;

    bool try_harder_;
};
