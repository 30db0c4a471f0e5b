/**
 * =============================================================================
 * ImageEncoder.hpp - Image → Embedding Vector
 * =============================================================================
 *
 * PIPELINE:
 *   images [N, 3, H, W]
 *     → backbone (frozen)           [N, C, 1, 1]
 *     → flatten per image           [N, C]
 *     → projection (trainable)      [N, embedSize]
 *
 * Only the projection is learned. The backbone is a pretrained classifier
 * whose weights never change while the captioning model trains.
 *
 * @file ImageEncoder.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef IMAGE_ENCODER_HPP
#define IMAGE_ENCODER_HPP

#include "FeatureExtractor.hpp"
#include "Linear.hpp"
#include "ModelConfig.hpp"

#include <memory>   // std::unique_ptr owning the backbone
#include <random>   // std::mt19937 for projection init
#include <vector>   // std::vector for parameter lists

class ImageEncoder {
public:
    /**
     * Take ownership of a backbone and freeze its parameters.
     *
     * @throws std::invalid_argument if backbone is null or the config is invalid
     */
    ImageEncoder(std::unique_ptr<FeatureExtractor> backbone,
                 const EncoderConfig& config,
                 std::mt19937& rng);

    /**
     * Encode a batch of images.
     *
     * @param images Pre-normalized batch, any batch size >= 1
     * @return [images.batch, embedSize]
     * @throws std::invalid_argument if the backbone output does not match its
     *         declared feature size
     */
    Matrix encode(const ImageBatch& images) const;

    int embedSize() const { return projection.outFeatures(); }
    int featureSize() const { return projection.inFeatures(); }

    /**
     * Parameter groups:
     *   "encoder.backbone"   - frozen
     *   "encoder.embed"      - trainable
     */
    std::vector<ParameterGroup> parameterGroups();

    /** Every parameter, frozen ones included */
    std::vector<Parameter*> parameters();

    /** Parameters an optimizer should update */
    std::vector<Parameter*> trainableParameters();

private:
    std::unique_ptr<FeatureExtractor> backbone;
    Linear projection;
};

#endif // IMAGE_ENCODER_HPP
