#include "test_base.hpp"
#include "core/image_preprocessor.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    // White page with five dark text-like lines. Each line has sparse
    // ascenders on top and a dense body below, like upright Latin text.
    cv::Mat uprightPage(int width, int height)
    {
        cv::Mat page(height, width, CV_8UC1, cv::Scalar(255));
        for (int line = 0; line < 5; ++line)
        {
            int top = 40 + line * 60;
            for (int x = 50; x < width - 50; x += 10)
                cv::rectangle(page, cv::Rect(x, top, 2, 8), cv::Scalar(0), cv::FILLED);
            cv::rectangle(page, cv::Rect(50, top + 8, width - 100, 12), cv::Scalar(0), cv::FILLED);
        }
        return page;
    }

    bool sameImage(const cv::Mat &a, const cv::Mat &b)
    {
        if (a.size() != b.size() || a.type() != b.type())
            return false;
        cv::Mat diff;
        cv::absdiff(a, b, diff);
        return cv::countNonZero(diff) == 0;
    }

    std::vector<std::string> namesOf(const std::vector<NamedVariant> &variants)
    {
        std::vector<std::string> names;
        for (const auto &variant : variants)
            names.push_back(variant.name);
        return names;
    }
}

class ImagePreprocessorTest : public TestBase
{
};

TEST_F(ImagePreprocessorTest, SmallImageGetsUpscaledVariant)
{
    ImagePreprocessor preprocessor;
    auto variants = preprocessor.preprocess(uprightPage(600, 400));

    std::vector<std::string> expected = {"original", "contrast", "sharpened", "binary", "upscaled"};
    EXPECT_EQ(namesOf(variants), expected);
    EXPECT_EQ(variants.back().image.cols, 1200);
    EXPECT_EQ(variants.back().image.rows, 800);
}

TEST_F(ImagePreprocessorTest, LargeImageSkipsUpscaling)
{
    ImagePreprocessor preprocessor;
    auto variants = preprocessor.preprocess(uprightPage(1600, 400));

    std::vector<std::string> expected = {"original", "contrast", "sharpened", "binary"};
    EXPECT_EQ(namesOf(variants), expected);

    for (const auto &variant : variants)
        EXPECT_EQ(variant.image.cols, 1600) << variant.name;
}

TEST_F(ImagePreprocessorTest, UpscaleThresholdIsConfigurable)
{
    PreprocessorOptions options;
    options.upscale_below_px = 500;
    ImagePreprocessor preprocessor(options);
    EXPECT_EQ(preprocessor.preprocess(uprightPage(600, 400)).size(), 4u);
}

TEST_F(ImagePreprocessorTest, BinaryVariantIsTwoLevel)
{
    ImagePreprocessor preprocessor;
    auto variants = preprocessor.preprocess(uprightPage(600, 400));
    const cv::Mat &binary = variants[3].image;
    ASSERT_EQ(binary.channels(), 1);

    cv::Mat mid;
    cv::inRange(binary, cv::Scalar(1), cv::Scalar(254), mid);
    EXPECT_EQ(cv::countNonZero(mid), 0);
}

TEST_F(ImagePreprocessorTest, UprightPageIsLeftAlone)
{
    cv::Mat page = uprightPage(600, 400);
    EXPECT_FALSE(ImagePreprocessor::isSideways(page));
    EXPECT_FALSE(ImagePreprocessor::isUpsideDown(page));
    EXPECT_TRUE(sameImage(ImagePreprocessor::correctOrientation(page), page));
}

TEST_F(ImagePreprocessorTest, DetectsUpsideDownPage)
{
    cv::Mat page = uprightPage(600, 400);
    cv::Mat flipped;
    cv::rotate(page, flipped, cv::ROTATE_180);

    EXPECT_FALSE(ImagePreprocessor::isSideways(flipped));
    EXPECT_TRUE(ImagePreprocessor::isUpsideDown(flipped));
    EXPECT_TRUE(sameImage(ImagePreprocessor::correctOrientation(flipped), page));
}

TEST_F(ImagePreprocessorTest, DetectsSidewaysPage)
{
    cv::Mat page = uprightPage(600, 400);
    cv::Mat sideways;
    cv::rotate(page, sideways, cv::ROTATE_90_COUNTERCLOCKWISE);

    EXPECT_TRUE(ImagePreprocessor::isSideways(sideways));

    cv::Mat corrected = ImagePreprocessor::correctOrientation(sideways);
    EXPECT_EQ(corrected.cols, 600);
    EXPECT_EQ(corrected.rows, 400);
    EXPECT_TRUE(sameImage(corrected, page));
}

TEST_F(ImagePreprocessorTest, EmptyImageYieldsNoVariants)
{
    ImagePreprocessor preprocessor;
    EXPECT_TRUE(preprocessor.preprocess(cv::Mat()).empty());
}
