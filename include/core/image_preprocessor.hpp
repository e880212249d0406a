#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief An image variant handed to the OCR engine
 */
struct NamedVariant
{
    std::string name;
    cv::Mat image;
};

struct PreprocessorOptions
{
    int upscale_below_px = 1200; // longest side below which an upscaled variant is produced
    double upscale_factor = 2.0;
};

/**
 * @brief Produces the OCR image variants for a document page
 *
 * Variants, in order: `original` (orientation corrected only), `contrast`
 * (CLAHE on grayscale), `sharpened` (unsharp mask), `binary` (Otsu) and,
 * for small images only, `upscaled` (cubic). Deterministic and free of
 * external calls.
 */
class ImagePreprocessor
{
public:
    explicit ImagePreprocessor(const PreprocessorOptions &options = PreprocessorOptions());

    std::vector<NamedVariant> preprocess(const cv::Mat &image) const;

    /**
     * @brief Rotate a sideways or upside-down capture back to upright
     */
    static cv::Mat correctOrientation(const cv::Mat &image);

    /**
     * @brief Text lines run vertically: column projection energy dominates row energy
     * @param gray Single channel image
     */
    static bool isSideways(const cv::Mat &gray);

    /**
     * @brief Ink centroid inside text line bands sits above the band centre
     * @param gray Single channel image with horizontal text lines
     */
    static bool isUpsideDown(const cv::Mat &gray);

    static cv::Mat toGray(const cv::Mat &image);

private:
    static cv::Mat inkMask(const cv::Mat &gray);
    static double profileEnergy(const cv::Mat &ink, int axis);

    PreprocessorOptions options_;
};
