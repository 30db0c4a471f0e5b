/**
 * =============================================================================
 * FeatureExtractor.hpp - Pretrained Backbone Interface
 * =============================================================================
 *
 * The image encoder does not know how features are computed. It only needs
 * something that turns a batch of images into a pooled feature map:
 *
 *   images [N, 3, H, W]  →  features [N, C, 1, 1]   (ResNet-50: C = 2048)
 *
 * i.e. a classification network with its final fully connected layer
 * removed. OnnxBackbone is the production implementation; tests provide
 * their own.
 *
 * FROZEN WEIGHTS:
 * ---------------
 * A backbone may expose its weights through parameters(). The encoder marks
 * every one of them non-trainable when it takes ownership of the backbone.
 * Backbones whose weights live inside an external runtime expose none.
 *
 * @file FeatureExtractor.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "Parameter.hpp"
#include "Tensor.hpp"

#include <cstdint>
#include <vector>

/**
 * Pooled feature maps for a batch, before flattening.
 *
 * shape holds the per-image dimensions (e.g. {2048, 1, 1});
 * data holds batch * product(shape) floats, image after image.
 */
struct FeatureMap {
    int batch = 0;
    std::vector<int64_t> shape;
    std::vector<float> data;

    /** Number of floats per image (product of shape) */
    int64_t elementsPerImage() const;
};

class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    /** Flattened feature width per image (C * 1 * 1 for a pooled map) */
    virtual int featureSize() const = 0;

    /**
     * Run the backbone on a batch.
     *
     * @throws std::invalid_argument / std::runtime_error on malformed input
     *         or backbone failure
     */
    virtual FeatureMap extract(const ImageBatch& images) const = 0;

    /** Weights owned by the backbone, if it exposes any */
    virtual std::vector<Parameter*> parameters() { return {}; }
};

#endif // FEATURE_EXTRACTOR_HPP
