/**
 * =============================================================================
 * ImageEncoder.cpp - Frozen Backbone + Trainable Projection
 * =============================================================================
 *
 * @file ImageEncoder.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "ImageEncoder.hpp"

#include <stdexcept>
#include <string>

namespace {

/**
 * Checks the backbone pointer before the member initializer list uses it.
 * Returns the feature size so it can size the projection.
 */
int checkedFeatureSize(const std::unique_ptr<FeatureExtractor>& backbone, const EncoderConfig& config) {
    if (!backbone) {
        throw std::invalid_argument("Image encoder requires a backbone");
    }
    config.validate();
    return backbone->featureSize();
}

} // namespace

int64_t FeatureMap::elementsPerImage() const {
    int64_t count = 1;
    for (int64_t dim : shape) {
        count *= dim;
    }
    return count;
}

ImageEncoder::ImageEncoder(std::unique_ptr<FeatureExtractor> backboneIn,
                           const EncoderConfig& config,
                           std::mt19937& rng)
    : backbone(std::move(backboneIn))
    , projection(checkedFeatureSize(backbone, config), config.embedSize, rng, "encoder.embed")
{
    // Pretrained weights are excluded from training
    ParameterGroup frozen{"encoder.backbone", backbone->parameters()};
    frozen.setTrainable(false);
}

Matrix ImageEncoder::encode(const ImageBatch& images) const {
    FeatureMap features = backbone->extract(images);

    // ========================================================================
    // FLATTEN: [N, C, 1, 1] → [N, C]
    // ========================================================================

    const int64_t perImage = features.elementsPerImage();
    if (perImage != projection.inFeatures()) {
        throw std::invalid_argument(
            "Backbone produced " + std::to_string(perImage) +
            " features per image, encoder expects " + std::to_string(projection.inFeatures()));
    }
    if (features.data.size() != static_cast<size_t>(features.batch) * static_cast<size_t>(perImage)) {
        throw std::invalid_argument("Backbone feature buffer does not match its shape");
    }

    // Feature data is already image-major, so a row-major map is the flatten
    Eigen::Map<const Matrix> flat(features.data.data(), features.batch, perImage);

    return projection.forward(flat);
}

std::vector<ParameterGroup> ImageEncoder::parameterGroups() {
    return {
        ParameterGroup{"encoder.backbone", backbone->parameters()},
        ParameterGroup{"encoder.embed", projection.parameters()}
    };
}

std::vector<Parameter*> ImageEncoder::parameters() {
    std::vector<Parameter*> params;
    for (const ParameterGroup& group : parameterGroups()) {
        params.insert(params.end(), group.parameters.begin(), group.parameters.end());
    }
    return params;
}

std::vector<Parameter*> ImageEncoder::trainableParameters() {
    return filterTrainable(parameters());
}
