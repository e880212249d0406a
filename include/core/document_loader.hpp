#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

struct DocumentLoaderOptions
{
    size_t max_bytes = 10 * 1024 * 1024;
    int pdf_render_dpi = 200;
};

/**
 * @brief Decoded upload ready for the extraction strategies
 */
struct LoadedDocument
{
    std::string media_type;          // sniffed type, e.g. "image/png"
    cv::Mat image;                   // BGR raster of the image or first PDF page
    std::vector<uint8_t> ai_image;   // bytes sent to the AI extractor
    std::string ai_media_type;
    std::string fingerprint;         // SHA-256 of the input bytes
    int page_count = 1;
    std::vector<std::string> warnings;
};

/**
 * @brief Validates and decodes uploaded bytes
 *
 * Supports JPEG, PNG, WebP, BMP, TIFF and PDF (first page only). Every
 * rejection is a FatalInputError.
 */
class DocumentLoader
{
public:
    explicit DocumentLoader(const DocumentLoaderOptions &options = DocumentLoaderOptions());

    /**
     * @brief Check size and type, then decode
     * @param data Uploaded bytes
     * @param declared_media_type Caller-supplied type; empty to trust the signature
     * @throws FatalInputError on empty, oversized, mistyped or undecodable input
     */
    LoadedDocument load(const std::vector<uint8_t> &data, const std::string &declared_media_type) const;

    /**
     * @brief Media type from the leading file signature, if recognised
     */
    static std::optional<std::string> sniffMediaType(const std::vector<uint8_t> &data);

    /**
     * @brief Lower-case, parameters stripped, common aliases folded (image/jpg -> image/jpeg)
     */
    static std::string normalizeMediaType(const std::string &media_type);

    static bool isSupportedMediaType(const std::string &media_type);

    /**
     * @brief Media type guessed from a file extension; empty when unknown
     */
    static std::string mediaTypeForPath(const std::string &path);

    static std::string generateHash(const std::vector<uint8_t> &data);

    static std::vector<uint8_t> encodePng(const cv::Mat &image);

private:
    cv::Mat decodeRaster(const std::vector<uint8_t> &data) const;
    cv::Mat renderFirstPdfPage(const std::vector<uint8_t> &data, int &page_count) const;

    DocumentLoaderOptions options_;
};
