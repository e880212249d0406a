#include "test_base.hpp"
#include "core/document_loader.hpp"
#include "core/extraction_errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <sstream>

namespace
{
    std::vector<uint8_t> encodedImage(const std::string &extension, int width = 40, int height = 30)
    {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(200, 120, 40));
        std::vector<uint8_t> buffer;
        cv::imencode(extension, image, buffer);
        return buffer;
    }

    std::vector<uint8_t> bytesOf(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    // Minimal PDF with `pages` empty 200x100 pt pages and a valid xref table
    std::vector<uint8_t> blankPdf(int pages)
    {
        std::vector<std::string> objects;
        std::string kids;
        for (int i = 0; i < pages; ++i)
            kids += std::to_string(3 + i) + " 0 R ";
        objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
        objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) + " >>");
        for (int i = 0; i < pages; ++i)
            objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 100] >>");

        std::ostringstream pdf;
        pdf << "%PDF-1.4\n";
        std::vector<long> offsets;
        for (size_t i = 0; i < objects.size(); ++i)
        {
            offsets.push_back(static_cast<long>(pdf.tellp()));
            pdf << (i + 1) << " 0 obj\n" << objects[i] << "\nendobj\n";
        }

        long xref = static_cast<long>(pdf.tellp());
        pdf << "xref\n0 " << (objects.size() + 1) << "\n";
        pdf << "0000000000 65535 f \n";
        for (long offset : offsets)
        {
            char line[24];
            std::snprintf(line, sizeof(line), "%010ld 00000 n \n", offset);
            pdf << line;
        }
        pdf << "trailer\n<< /Size " << (objects.size() + 1) << " /Root 1 0 R >>\n";
        pdf << "startxref\n" << xref << "\n%%EOF\n";
        return bytesOf(pdf.str());
    }

    FatalInputKind rejectionOf(const DocumentLoader &loader, const std::vector<uint8_t> &data, const std::string &type)
    {
        try
        {
            loader.load(data, type);
        }
        catch (const FatalInputError &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "document was accepted";
        return FatalInputKind::UNREADABLE;
    }
}

class DocumentLoaderTest : public TestBase
{
protected:
    DocumentLoader loader_;
};

TEST_F(DocumentLoaderTest, LoadsPngAndKeepsBytesForAi)
{
    std::vector<uint8_t> png = encodedImage(".png");
    LoadedDocument document = loader_.load(png, "image/png");

    EXPECT_EQ(document.media_type, "image/png");
    EXPECT_EQ(document.image.cols, 40);
    EXPECT_EQ(document.image.rows, 30);
    EXPECT_EQ(document.ai_image, png);
    EXPECT_EQ(document.ai_media_type, "image/png");
    EXPECT_EQ(document.fingerprint, DocumentLoader::generateHash(png));
    EXPECT_EQ(document.page_count, 1);
    EXPECT_TRUE(document.warnings.empty());
}

TEST_F(DocumentLoaderTest, EmptyDeclaredTypeTrustsSignature)
{
    LoadedDocument document = loader_.load(encodedImage(".jpg"), "");
    EXPECT_EQ(document.media_type, "image/jpeg");
}

TEST_F(DocumentLoaderTest, BmpIsReencodedAsPngForAi)
{
    LoadedDocument document = loader_.load(encodedImage(".bmp"), "image/x-ms-bmp");
    EXPECT_EQ(document.media_type, "image/bmp");
    EXPECT_EQ(document.ai_media_type, "image/png");
    auto sniffed = DocumentLoader::sniffMediaType(document.ai_image);
    ASSERT_TRUE(sniffed.has_value());
    EXPECT_EQ(*sniffed, "image/png");
}

TEST_F(DocumentLoaderTest, RendersFirstPdfPageAndWarnsAboutTheRest)
{
    LoadedDocument document = loader_.load(blankPdf(2), "application/pdf");
    EXPECT_EQ(document.media_type, "application/pdf");
    EXPECT_EQ(document.page_count, 2);
    EXPECT_FALSE(document.image.empty());
    EXPECT_EQ(document.image.channels(), 3);
    EXPECT_EQ(document.ai_media_type, "image/png");
    ASSERT_EQ(document.warnings.size(), 1u);
    EXPECT_EQ(document.warnings.front(), "PDF has 2 pages; only the first page was processed");
}

TEST_F(DocumentLoaderTest, SinglePagePdfHasNoWarning)
{
    LoadedDocument document = loader_.load(blankPdf(1), "");
    EXPECT_EQ(document.page_count, 1);
    EXPECT_TRUE(document.warnings.empty());
}

TEST_F(DocumentLoaderTest, RejectsEmptyInput)
{
    EXPECT_EQ(rejectionOf(loader_, {}, "image/png"), FatalInputKind::EMPTY);
}

TEST_F(DocumentLoaderTest, RejectsOversizedInput)
{
    DocumentLoaderOptions options;
    options.max_bytes = 16;
    DocumentLoader loader(options);
    EXPECT_EQ(rejectionOf(loader, encodedImage(".png"), "image/png"), FatalInputKind::TOO_LARGE);
}

TEST_F(DocumentLoaderTest, RejectsUnsupportedAndMismatchedTypes)
{
    std::vector<uint8_t> png = encodedImage(".png");
    EXPECT_EQ(rejectionOf(loader_, png, "image/gif"), FatalInputKind::UNSUPPORTED_MEDIA_TYPE);
    EXPECT_EQ(rejectionOf(loader_, png, "image/jpeg"), FatalInputKind::UNSUPPORTED_MEDIA_TYPE);
    EXPECT_EQ(rejectionOf(loader_, bytesOf("hello, this is text"), ""), FatalInputKind::UNSUPPORTED_MEDIA_TYPE);
}

TEST_F(DocumentLoaderTest, RejectsCorruptContent)
{
    std::vector<uint8_t> truncated = bytesOf("\x89PNG\r\n\x1a\n");
    truncated.resize(64, 0x00);
    EXPECT_EQ(rejectionOf(loader_, truncated, "image/png"), FatalInputKind::UNREADABLE);

    EXPECT_EQ(rejectionOf(loader_, bytesOf("%PDF-1.4\nnot really a pdf"), "application/pdf"),
              FatalInputKind::UNREADABLE);
}

TEST_F(DocumentLoaderTest, NormalizesMediaTypeAliases)
{
    EXPECT_EQ(DocumentLoader::normalizeMediaType("IMAGE/JPG; q=0.9"), "image/jpeg");
    EXPECT_EQ(DocumentLoader::normalizeMediaType("image/tif"), "image/tiff");
    EXPECT_EQ(DocumentLoader::normalizeMediaType("application/x-pdf"), "application/pdf");
    EXPECT_TRUE(DocumentLoader::isSupportedMediaType("image/webp"));
    EXPECT_FALSE(DocumentLoader::isSupportedMediaType("image/gif"));
}

TEST_F(DocumentLoaderTest, GuessesMediaTypeFromExtension)
{
    EXPECT_EQ(DocumentLoader::mediaTypeForPath("/tmp/pass.JPG"), "image/jpeg");
    EXPECT_EQ(DocumentLoader::mediaTypeForPath("pass.tif"), "image/tiff");
    EXPECT_EQ(DocumentLoader::mediaTypeForPath("pass.pdf"), "application/pdf");
    EXPECT_EQ(DocumentLoader::mediaTypeForPath("pass"), "");
}

TEST_F(DocumentLoaderTest, SniffsTiffByteOrders)
{
    std::vector<uint8_t> little = {'I', 'I', 0x2A, 0x00, 0x08};
    std::vector<uint8_t> big = {'M', 'M', 0x00, 0x2A, 0x00};
    EXPECT_EQ(DocumentLoader::sniffMediaType(little).value_or(""), "image/tiff");
    EXPECT_EQ(DocumentLoader::sniffMediaType(big).value_or(""), "image/tiff");
    EXPECT_FALSE(DocumentLoader::sniffMediaType({'G', 'I', 'F', '8'}).has_value());
}

TEST_F(DocumentLoaderTest, FingerprintIsSha256)
{
    EXPECT_EQ(DocumentLoader::generateHash(bytesOf("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
