/**
 * =============================================================================
 * CaptioningModel.hpp - Encoder + Decoder Composition
 * =============================================================================
 *
 *   image ──► ImageEncoder ──► embedding ──► CaptionDecoder ──► caption
 *
 * The model owns both halves and checks, once at construction, that the
 * encoder's output width equals the decoder's input width. After that every
 * call is straight-line: no retries, no partial results.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * std::mt19937 rng(42);
 * CaptioningModel model(std::move(backbone), encoderConfig, decoderConfig, rng);
 *
 * // Training: scores for a ground-truth batch
 * ScoreSequenceBatch scores = model.forward(images, captions);
 *
 * // Inference: one image at a time
 * std::vector<int> tokens = model.caption(oneImage, 20);
 * ```
 *
 * @file CaptioningModel.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef CAPTIONING_MODEL_HPP
#define CAPTIONING_MODEL_HPP

#include "CaptionDecoder.hpp"
#include "ImageEncoder.hpp"

#include <memory>
#include <random>
#include <vector>

class CaptioningModel {
public:
    /**
     * @throws std::invalid_argument if either config is invalid or
     *         encoder.embedSize != decoder.embedSize
     */
    CaptioningModel(std::unique_ptr<FeatureExtractor> backbone,
                    const EncoderConfig& encoderConfig,
                    const DecoderConfig& decoderConfig,
                    std::mt19937& rng);

    /**
     * Teacher-forced scores for a batch of images and their captions.
     * @return [batch, seqLen, vocabSize]
     */
    ScoreSequenceBatch forward(const ImageBatch& images, const CaptionBatch& captions) const;

    /**
     * Greedy caption for a single image.
     *
     * @throws std::invalid_argument if images.batch != 1
     */
    std::vector<int> caption(const ImageBatch& image, int maxLen = CaptionDecoder::kDefaultMaxLen) const;

    /** Same as caption(), with per-token probabilities */
    std::vector<SampledToken> captionDetailed(const ImageBatch& image,
                                              int maxLen = CaptionDecoder::kDefaultMaxLen) const;

    const ImageEncoder& encoder() const { return imageEncoder; }
    const CaptionDecoder& decoder() const { return captionDecoder; }

    std::vector<ParameterGroup> parameterGroups();
    std::vector<Parameter*> parameters();
    std::vector<Parameter*> trainableParameters();

private:
    Matrix encodeSingle(const ImageBatch& image) const;

    ImageEncoder imageEncoder;
    CaptionDecoder captionDecoder;
};

#endif // CAPTIONING_MODEL_HPP
