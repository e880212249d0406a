#include "core/image_preprocessor.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace
{
    // Row/column energy ratio required before a capture is considered sideways
    constexpr double SIDEWAYS_RATIO = 1.5;
    // Distance of the mean ink centroid from the band centre required to flip
    constexpr double UPSIDE_DOWN_MARGIN = 0.03;
    constexpr int MIN_BAND_HEIGHT = 4;
    constexpr size_t MIN_BANDS = 2;
}

ImagePreprocessor::ImagePreprocessor(const PreprocessorOptions &options) : options_(options)
{
}

cv::Mat ImagePreprocessor::toGray(const cv::Mat &image)
{
    cv::Mat gray;
    if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = image.clone();
    return gray;
}

cv::Mat ImagePreprocessor::inkMask(const cv::Mat &gray)
{
    cv::Mat ink;
    cv::threshold(gray, ink, 0, 1, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    return ink;
}

double ImagePreprocessor::profileEnergy(const cv::Mat &ink, int axis)
{
    // axis 1 reduces each row to a single column (row profile), axis 0 each column
    cv::Mat profile;
    cv::reduce(ink, profile, axis, cv::REDUCE_SUM, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(profile, mean, stddev);
    double length = axis == 1 ? ink.cols : ink.rows;
    return length > 0 ? (stddev[0] * stddev[0]) / (length * length) : 0.0;
}

bool ImagePreprocessor::isSideways(const cv::Mat &gray)
{
    if (gray.empty())
        return false;

    cv::Mat ink = inkMask(gray);
    double row_energy = profileEnergy(ink, 1);
    double column_energy = profileEnergy(ink, 0);
    return column_energy > row_energy * SIDEWAYS_RATIO;
}

bool ImagePreprocessor::isUpsideDown(const cv::Mat &gray)
{
    if (gray.empty())
        return false;

    cv::Mat ink = inkMask(gray);
    cv::Mat row_profile;
    cv::reduce(ink, row_profile, 1, cv::REDUCE_SUM, CV_64F);

    double weighted_position = 0.0;
    double total_mass = 0.0;
    size_t bands = 0;

    int row = 0;
    while (row < row_profile.rows)
    {
        if (row_profile.at<double>(row, 0) <= 0.0)
        {
            ++row;
            continue;
        }

        int band_start = row;
        while (row < row_profile.rows && row_profile.at<double>(row, 0) > 0.0)
            ++row;
        int band_end = row; // exclusive
        int height = band_end - band_start;
        if (height < MIN_BAND_HEIGHT)
            continue;

        double band_mass = 0.0;
        double band_moment = 0.0;
        for (int r = band_start; r < band_end; ++r)
        {
            double mass = row_profile.at<double>(r, 0);
            band_mass += mass;
            band_moment += mass * (static_cast<double>(r - band_start) + 0.5) / height;
        }
        if (band_mass <= 0.0)
            continue;

        weighted_position += band_moment;
        total_mass += band_mass;
        ++bands;
    }

    if (bands < MIN_BANDS || total_mass <= 0.0)
        return false;

    // Upright Latin text carries most ink in the x-height zone below the band centre
    double centroid = weighted_position / total_mass;
    return centroid < 0.5 - UPSIDE_DOWN_MARGIN;
}

cv::Mat ImagePreprocessor::correctOrientation(const cv::Mat &image)
{
    if (image.empty())
        return image;

    cv::Mat oriented = image;
    cv::Mat gray = toGray(image);

    if (isSideways(gray))
    {
        cv::rotate(image, oriented, cv::ROTATE_90_CLOCKWISE);
        cv::rotate(gray, gray, cv::ROTATE_90_CLOCKWISE);
        Logger::debug("Sideways capture detected, rotated 90 degrees");
    }

    if (isUpsideDown(gray))
    {
        cv::Mat flipped;
        cv::rotate(oriented, flipped, cv::ROTATE_180);
        oriented = flipped;
        Logger::debug("Upside-down capture detected, rotated 180 degrees");
    }

    return oriented;
}

std::vector<NamedVariant> ImagePreprocessor::preprocess(const cv::Mat &image) const
{
    std::vector<NamedVariant> variants;
    if (image.empty())
        return variants;

    cv::Mat original = correctOrientation(image);
    variants.push_back({"original", original});

    cv::Mat gray = toGray(original);

    cv::Mat contrast;
    auto clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
    clahe->apply(gray, contrast);
    variants.push_back({"contrast", contrast});

    cv::Mat blurred, sharpened;
    cv::GaussianBlur(gray, blurred, cv::Size(0, 0), 3.0);
    cv::addWeighted(gray, 1.5, blurred, -0.5, 0, sharpened);
    variants.push_back({"sharpened", sharpened});

    cv::Mat binary;
    cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    variants.push_back({"binary", binary});

    int longest_side = std::max(original.cols, original.rows);
    if (longest_side < options_.upscale_below_px && options_.upscale_factor > 1.0)
    {
        cv::Mat upscaled;
        cv::resize(contrast, upscaled, cv::Size(), options_.upscale_factor, options_.upscale_factor, cv::INTER_CUBIC);
        variants.push_back({"upscaled", upscaled});
    }

    Logger::debug("Prepared " + std::to_string(variants.size()) + " OCR variants for " +
                  std::to_string(original.cols) + "x" + std::to_string(original.rows) + " image");
    return variants;
}
