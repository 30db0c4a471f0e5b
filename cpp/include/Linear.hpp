/**
 * =============================================================================
 * Linear.hpp - Fully Connected Layer
 * =============================================================================
 *
 * y = x · Wᵀ + b
 *
 *   x: [batch, inFeatures]
 *   W: [outFeatures, inFeatures]
 *   b: [1, outFeatures]   (broadcast over the batch)
 *   y: [batch, outFeatures]
 *
 * Used twice in the model:
 * - ImageEncoder: backbone features (2048 for ResNet-50) → embed_size
 * - CaptionDecoder: LSTM hidden output → vocab_size scores
 *
 * @file Linear.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef LINEAR_HPP
#define LINEAR_HPP

#include "Parameter.hpp"

#include <random>
#include <string>
#include <vector>

class Linear {
public:
    /**
     * Create a layer with weights drawn from U(-1/sqrt(in), 1/sqrt(in)).
     *
     * @throws std::invalid_argument if either size is not positive
     */
    Linear(int inFeatures, int outFeatures, std::mt19937& rng, const std::string& name);

    /**
     * @param input [batch, inFeatures]
     * @return [batch, outFeatures]
     * @throws std::invalid_argument on a width mismatch
     */
    Matrix forward(const Matrix& input) const;

    int inFeatures() const { return inSize; }
    int outFeatures() const { return outSize; }

    /** weight and bias, in that order */
    std::vector<Parameter*> parameters();

    const Parameter& weight() const { return weightParam; }
    const Parameter& bias() const { return biasParam; }

private:
    int inSize;
    int outSize;
    Parameter weightParam;
    Parameter biasParam;
};

#endif // LINEAR_HPP
