/**
 * =============================================================================
 * ImageUtils.hpp - Image Loading and Preprocessing for the Backbone
 * =============================================================================
 *
 * The pretrained backbone expects its input in a very specific format:
 *
 * 1. SIZE: fixed spatial size (224x224 for ResNet-50)
 * 2. NORMALIZATION: (pixel / 255 - mean) / std with ImageNet statistics
 *    - Mean: [0.485, 0.456, 0.406] for RGB
 *    - Std:  [0.229, 0.224, 0.225] for RGB
 * 3. FORMAT: CHW planes, RGB order (OpenCV loads BGR, so channels are swapped)
 *
 * @file ImageUtils.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#pragma once

#include "Tensor.hpp"

#include <string>
#include <vector>

namespace ImageUtils {

/**
 * Load one image and preprocess it for an ImageNet backbone.
 *
 * Memory layout of the result: [R plane][G plane][B plane]
 *
 * @param imagePath    Path to the image file (JPEG, PNG, ...)
 * @param targetWidth  Output width
 * @param targetHeight Output height
 * @return 3 * targetHeight * targetWidth floats
 *
 * @throws std::runtime_error if the image cannot be loaded
 */
std::vector<float> loadAndPreprocessImage(
    const std::string& imagePath,
    int targetWidth,
    int targetHeight
);

/**
 * Load several images into one [N, 3, targetHeight, targetWidth] batch.
 *
 * @throws std::invalid_argument if imagePaths is empty
 * @throws std::runtime_error if any image cannot be loaded
 */
ImageBatch loadImageBatch(
    const std::vector<std::string>& imagePaths,
    int targetWidth,
    int targetHeight
);

} // namespace ImageUtils
