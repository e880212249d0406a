#include "core/document_loader.hpp"
#include "core/extraction_errors.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/sha.h>
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>

namespace
{
    bool startsWith(const std::vector<uint8_t> &data, const char *signature, size_t offset = 0)
    {
        size_t length = std::strlen(signature);
        if (data.size() < offset + length)
            return false;
        return std::memcmp(data.data() + offset, signature, length) == 0;
    }
}

DocumentLoader::DocumentLoader(const DocumentLoaderOptions &options) : options_(options)
{
}

std::optional<std::string> DocumentLoader::sniffMediaType(const std::vector<uint8_t> &data)
{
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF)
        return std::string("image/jpeg");
    if (startsWith(data, "\x89PNG\r\n\x1a\n"))
        return std::string("image/png");
    if (startsWith(data, "RIFF") && startsWith(data, "WEBP", 8))
        return std::string("image/webp");
    if (startsWith(data, "BM"))
        return std::string("image/bmp");
    if (data.size() >= 4 && ((data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00) ||
                             (data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A)))
        return std::string("image/tiff");
    if (startsWith(data, "%PDF-"))
        return std::string("application/pdf");
    return std::nullopt;
}

std::string DocumentLoader::normalizeMediaType(const std::string &media_type)
{
    std::string normalized = TextUtils::trim(media_type.substr(0, media_type.find(';')));
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);

    if (normalized == "image/jpg" || normalized == "image/pjpeg")
        return "image/jpeg";
    if (normalized == "image/x-ms-bmp" || normalized == "image/x-bmp")
        return "image/bmp";
    if (normalized == "image/tif")
        return "image/tiff";
    if (normalized == "application/x-pdf")
        return "application/pdf";
    return normalized;
}

bool DocumentLoader::isSupportedMediaType(const std::string &media_type)
{
    static const std::vector<std::string> supported = {
        "image/jpeg", "image/png", "image/webp", "image/bmp", "image/tiff", "application/pdf"};
    return std::find(supported.begin(), supported.end(), media_type) != supported.end();
}

std::string DocumentLoader::mediaTypeForPath(const std::string &path)
{
    size_t dot_pos = path.find_last_of('.');
    if (dot_pos == std::string::npos)
        return "";

    std::string extension = path.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    if (extension == "jpg" || extension == "jpeg")
        return "image/jpeg";
    if (extension == "png")
        return "image/png";
    if (extension == "webp")
        return "image/webp";
    if (extension == "bmp")
        return "image/bmp";
    if (extension == "tif" || extension == "tiff")
        return "image/tiff";
    if (extension == "pdf")
        return "application/pdf";
    return "";
}

std::string DocumentLoader::generateHash(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash, &sha256);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::vector<uint8_t> DocumentLoader::encodePng(const cv::Mat &image)
{
    std::vector<uint8_t> buffer;
    if (!cv::imencode(".png", image, buffer))
        throw std::runtime_error("PNG encoding failed");
    return buffer;
}

LoadedDocument DocumentLoader::load(const std::vector<uint8_t> &data, const std::string &declared_media_type) const
{
    if (data.empty())
        throw FatalInputError(FatalInputKind::EMPTY, "Document is empty");

    if (data.size() > options_.max_bytes)
    {
        throw FatalInputError(FatalInputKind::TOO_LARGE,
                              "Document is " + std::to_string(data.size()) + " bytes, limit is " +
                                  std::to_string(options_.max_bytes));
    }

    std::string declared = normalizeMediaType(declared_media_type);
    if (!declared.empty() && !isSupportedMediaType(declared))
        throw FatalInputError(FatalInputKind::UNSUPPORTED_MEDIA_TYPE, "Unsupported media type: " + declared);

    auto sniffed = sniffMediaType(data);
    if (!sniffed)
        throw FatalInputError(FatalInputKind::UNSUPPORTED_MEDIA_TYPE, "Unrecognised file signature");

    if (!declared.empty() && declared != *sniffed)
    {
        throw FatalInputError(FatalInputKind::UNSUPPORTED_MEDIA_TYPE,
                              "Declared media type " + declared + " does not match content (" + *sniffed + ")");
    }

    LoadedDocument document;
    document.media_type = *sniffed;
    document.fingerprint = generateHash(data);

    try
    {
        if (document.media_type == "application/pdf")
        {
            document.image = renderFirstPdfPage(data, document.page_count);
            if (document.page_count > 1)
            {
                document.warnings.push_back("PDF has " + std::to_string(document.page_count) +
                                            " pages; only the first page was processed");
            }
        }
        else
        {
            document.image = decodeRaster(data);
        }
    }
    catch (const cv::Exception &e)
    {
        throw FatalInputError(FatalInputKind::UNREADABLE, "Image decoding failed: " + std::string(e.what()));
    }

    if (document.image.empty())
        throw FatalInputError(FatalInputKind::UNREADABLE, "Could not decode " + document.media_type + " content");

    // The generative endpoint accepts JPEG, PNG and WebP as-is
    if (document.media_type == "image/jpeg" || document.media_type == "image/png" ||
        document.media_type == "image/webp")
    {
        document.ai_image = data;
        document.ai_media_type = document.media_type;
    }
    else
    {
        document.ai_image = encodePng(document.image);
        document.ai_media_type = "image/png";
    }

    Logger::debug("Loaded " + document.media_type + " " + std::to_string(document.image.cols) + "x" +
                  std::to_string(document.image.rows) + " sha256=" + document.fingerprint);
    return document;
}

cv::Mat DocumentLoader::decodeRaster(const std::vector<uint8_t> &data) const
{
    cv::Mat image = cv::imdecode(data, cv::IMREAD_COLOR);
    return image;
}

cv::Mat DocumentLoader::renderFirstPdfPage(const std::vector<uint8_t> &data, int &page_count) const
{
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_raw_data(reinterpret_cast<const char *>(data.data()), static_cast<int>(data.size())));

    if (!doc)
        throw FatalInputError(FatalInputKind::UNREADABLE, "Failed to load PDF document");
    if (doc->is_locked())
        throw FatalInputError(FatalInputKind::UNREADABLE, "PDF document is password protected");

    page_count = doc->pages();
    if (page_count < 1)
        throw FatalInputError(FatalInputKind::UNREADABLE, "PDF document has no pages");

    std::unique_ptr<poppler::page> page(doc->create_page(0));
    if (!page)
        throw FatalInputError(FatalInputKind::UNREADABLE, "Failed to open the first PDF page");

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image rendered = renderer.render_page(page.get(), options_.pdf_render_dpi, options_.pdf_render_dpi);
    if (!rendered.is_valid())
        throw FatalInputError(FatalInputKind::UNREADABLE, "Failed to render the first PDF page");

    // ARGB32 is stored as BGRA bytes on little-endian hosts
    cv::Mat bgra(rendered.height(), rendered.width(), CV_8UC4,
                 const_cast<char *>(rendered.const_data()), rendered.bytes_per_row());
    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);

    Logger::debug("Rendered PDF page 1 of " + std::to_string(page_count) + " at " +
                  std::to_string(options_.pdf_render_dpi) + " dpi");
    return bgr;
}
