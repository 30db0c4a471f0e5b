/**
 * =============================================================================
 * TestBackbone.hpp - In-Memory Backbone for Tests
 * =============================================================================
 *
 * Stands in for OnnxBackbone so encoder and model tests run without a model
 * file. It behaves like the tail of a CNN: a per-channel scale followed by
 * global average pooling.
 *
 *   images [N, C, H, W] → features [N, C, 1, 1]
 *   feature[c] = scale[c] * mean(image plane c)
 *
 * The scale is exposed as a parameter so tests can check that the encoder
 * freezes it.
 *
 * @file TestBackbone.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef TEST_BACKBONE_HPP
#define TEST_BACKBONE_HPP

#include "FeatureExtractor.hpp"

#include <stdexcept>

class TestBackbone : public FeatureExtractor {
public:
    explicit TestBackbone(int channels) : numChannels(channels) {
        scale.name = "backbone.scale";
        scale.value = Matrix::Ones(1, channels);
    }

    int featureSize() const override { return numChannels; }

    FeatureMap extract(const ImageBatch& images) const override {
        images.checkShape();
        if (images.channels != numChannels) {
            throw std::invalid_argument("TestBackbone: wrong channel count");
        }

        FeatureMap features;
        features.batch = images.batch;
        features.shape = {numChannels, 1, 1};

        const size_t plane = static_cast<size_t>(images.height) * images.width;
        for (int n = 0; n < images.batch; ++n) {
            const float* image = images.image(n);
            for (int c = 0; c < numChannels; ++c) {
                double sum = 0.0;
                for (size_t i = 0; i < plane; ++i) {
                    sum += image[c * plane + i];
                }
                features.data.push_back(scale.value(0, c) * static_cast<float>(sum / plane));
            }
        }
        return features;
    }

    std::vector<Parameter*> parameters() override { return {&scale}; }

private:
    int numChannels;
    Parameter scale;
};

/** Deterministic [batch, channels, height, width] images, different per image */
inline ImageBatch makeImages(int batch, int channels = 3, int height = 4, int width = 4) {
    ImageBatch images;
    images.batch = batch;
    images.channels = channels;
    images.height = height;
    images.width = width;
    images.data.resize(static_cast<size_t>(batch) * images.imageSize());
    for (int n = 0; n < batch; ++n) {
        for (size_t i = 0; i < images.imageSize(); ++i) {
            images.data[n * images.imageSize() + i] = static_cast<float>(n + 1) * 0.1f + static_cast<float>(i % 7) * 0.01f;
        }
    }
    return images;
}

#endif // TEST_BACKBONE_HPP
