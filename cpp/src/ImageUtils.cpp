/**
 * =============================================================================
 * ImageUtils.cpp - OpenCV Image Loading and ImageNet Normalization
 * =============================================================================
 *
 * @file ImageUtils.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "ImageUtils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace ImageUtils {

std::vector<float> loadAndPreprocessImage(
    const std::string& imagePath,
    int targetWidth,
    int targetHeight
) {
    if (targetWidth < 1 || targetHeight < 1) {
        throw std::invalid_argument("Target image size must be positive");
    }

    // -------------------------------------------------------------------------
    // STEP 1: Load image from file (always 3-channel BGR)
    // -------------------------------------------------------------------------
    cv::Mat img = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (img.empty()) {
        throw std::runtime_error("Failed to load image: " + imagePath);
    }

    // -------------------------------------------------------------------------
    // STEP 2: Convert from BGR to RGB
    // -------------------------------------------------------------------------
    cv::cvtColor(img, img, cv::COLOR_BGR2RGB);

    // -------------------------------------------------------------------------
    // STEP 3: Resize
    // -------------------------------------------------------------------------
    cv::Mat resized;
    cv::resize(img, resized, cv::Size(targetWidth, targetHeight), 0, 0, cv::INTER_LINEAR);

    // -------------------------------------------------------------------------
    // STEP 4: Normalize and convert from HWC to CHW
    // -------------------------------------------------------------------------
    const float mean[3] = {0.485f, 0.456f, 0.406f};
    const float stddev[3] = {0.229f, 0.224f, 0.225f};

    std::vector<float> tensor(3 * static_cast<size_t>(targetHeight) * targetWidth);

    for (int h = 0; h < targetHeight; ++h) {
        const cv::Vec3b* row = resized.ptr<cv::Vec3b>(h);
        for (int w = 0; w < targetWidth; ++w) {
            for (int c = 0; c < 3; ++c) {
                // CHW index = channel * plane_size + row * width + col
                size_t chwIdx = (static_cast<size_t>(c) * targetHeight + h) * targetWidth + w;
                float pixel = static_cast<float>(row[w][c]) / 255.0f;
                tensor[chwIdx] = (pixel - mean[c]) / stddev[c];
            }
        }
    }

    return tensor;
}

ImageBatch loadImageBatch(
    const std::vector<std::string>& imagePaths,
    int targetWidth,
    int targetHeight
) {
    if (imagePaths.empty()) {
        throw std::invalid_argument("No images to load");
    }

    ImageBatch batch;
    batch.batch = static_cast<int>(imagePaths.size());
    batch.channels = 3;
    batch.height = targetHeight;
    batch.width = targetWidth;
    batch.data.reserve(imagePaths.size() * batch.imageSize());

    for (const std::string& path : imagePaths) {
        std::vector<float> image = loadAndPreprocessImage(path, targetWidth, targetHeight);
        batch.data.insert(batch.data.end(), image.begin(), image.end());
    }
    return batch;
}

} // namespace ImageUtils
