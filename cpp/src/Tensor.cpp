/**
 * =============================================================================
 * Tensor.cpp - Shape Checks for Shared Tensor Types
 * =============================================================================
 *
 * @file Tensor.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "Tensor.hpp"

#include <stdexcept>
#include <string>

void ImageBatch::checkShape() const {
    if (batch < 1 || channels < 1 || height < 1 || width < 1) {
        throw std::invalid_argument(
            "Image batch has non-positive shape [" + std::to_string(batch) + ", " +
            std::to_string(channels) + ", " + std::to_string(height) + ", " +
            std::to_string(width) + "]");
    }

    // CHW planes for every image must be present, no more and no less
    if (data.size() != static_cast<size_t>(batch) * imageSize()) {
        throw std::invalid_argument(
            "Image batch holds " + std::to_string(data.size()) +
            " values, expected " + std::to_string(static_cast<size_t>(batch) * imageSize()));
    }
}
