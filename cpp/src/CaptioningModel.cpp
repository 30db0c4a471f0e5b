/**
 * =============================================================================
 * CaptioningModel.cpp - End-to-End Captioning
 * =============================================================================
 *
 * @file CaptioningModel.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "CaptioningModel.hpp"

#include <stdexcept>
#include <string>

namespace {

const EncoderConfig& checkWidths(const EncoderConfig& encoderConfig, const DecoderConfig& decoderConfig) {
    if (encoderConfig.embedSize != decoderConfig.embedSize) {
        throw std::invalid_argument(
            "Encoder output width " + std::to_string(encoderConfig.embedSize) +
            " does not match decoder input width " + std::to_string(decoderConfig.embedSize));
    }
    return encoderConfig;
}

} // namespace

CaptioningModel::CaptioningModel(std::unique_ptr<FeatureExtractor> backbone,
                                 const EncoderConfig& encoderConfig,
                                 const DecoderConfig& decoderConfig,
                                 std::mt19937& rng)
    : imageEncoder(std::move(backbone), checkWidths(encoderConfig, decoderConfig), rng)
    , captionDecoder(decoderConfig, rng)
{
}

ScoreSequenceBatch CaptioningModel::forward(const ImageBatch& images, const CaptionBatch& captions) const {
    return captionDecoder.forward(imageEncoder.encode(images), captions);
}

std::vector<int> CaptioningModel::caption(const ImageBatch& image, int maxLen) const {
    return captionDecoder.sample(encodeSingle(image), maxLen);
}

std::vector<SampledToken> CaptioningModel::captionDetailed(const ImageBatch& image, int maxLen) const {
    return captionDecoder.sampleDetailed(encodeSingle(image), captionDecoder.initialState(), maxLen);
}

Matrix CaptioningModel::encodeSingle(const ImageBatch& image) const {
    // Sampling handles exactly one image; callers loop over a batch themselves
    if (image.batch != 1) {
        throw std::invalid_argument(
            "Captioning takes one image at a time, got a batch of " + std::to_string(image.batch));
    }
    return imageEncoder.encode(image);
}

std::vector<ParameterGroup> CaptioningModel::parameterGroups() {
    std::vector<ParameterGroup> groups = imageEncoder.parameterGroups();
    for (ParameterGroup& group : captionDecoder.parameterGroups()) {
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<Parameter*> CaptioningModel::parameters() {
    std::vector<Parameter*> params = imageEncoder.parameters();
    std::vector<Parameter*> decoderParams = captionDecoder.parameters();
    params.insert(params.end(), decoderParams.begin(), decoderParams.end());
    return params;
}

std::vector<Parameter*> CaptioningModel::trainableParameters() {
    return filterTrainable(parameters());
}
