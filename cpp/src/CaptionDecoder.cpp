/**
 * =============================================================================
 * CaptionDecoder.cpp - Teacher Forcing and Greedy Sampling
 * =============================================================================
 *
 * @file CaptionDecoder.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "CaptionDecoder.hpp"
#include "Scores.hpp"

#include <stdexcept>
#include <string>

namespace {

const DecoderConfig& validated(const DecoderConfig& config) {
    config.validate();
    return config;
}

} // namespace

CaptionDecoder::CaptionDecoder(const DecoderConfig& config, std::mt19937& rng)
    : cfg(validated(config))
    , wordEmbedding(config.vocabSize, config.embedSize, rng, "decoder.word_embedding")
    , lstm(config.embedSize, config.hiddenSize, config.numLayers, rng, "decoder.lstm")
    , output(config.hiddenSize, config.vocabSize, rng, "decoder.linear")
{
}

// ============================================================================
// TRAINING MODE
// ============================================================================

ScoreSequenceBatch CaptionDecoder::forward(const Matrix& features, const CaptionBatch& captions) const {
    if (features.cols() != cfg.embedSize) {
        throw std::invalid_argument(
            "Decoder expected features of width " + std::to_string(cfg.embedSize) +
            ", got " + std::to_string(features.cols()));
    }
    if (captions.rows() != features.rows()) {
        throw std::invalid_argument(
            "Caption batch has " + std::to_string(captions.rows()) +
            " rows but feature batch has " + std::to_string(features.rows()));
    }
    if (captions.rows() < 1 || captions.cols() < 1) {
        throw std::invalid_argument("Caption batch must hold at least one token per caption");
    }

    const Eigen::Index batch = captions.rows();
    const Eigen::Index seqLen = captions.cols();

    // ========================================================================
    // BUILD INPUT SEQUENCE: [image, token_0, ..., token_{seqLen-2}]
    // ========================================================================

    // The last caption token (<end>) is only ever a target, never an input
    std::vector<Matrix> inputs;
    inputs.reserve(static_cast<size_t>(seqLen));
    inputs.push_back(features);

    std::vector<int64_t> column(static_cast<size_t>(batch));
    for (Eigen::Index t = 0; t + 1 < seqLen; ++t) {
        for (Eigen::Index b = 0; b < batch; ++b) {
            column[static_cast<size_t>(b)] = captions(b, t);
        }
        inputs.push_back(wordEmbedding.lookup(column));
    }

    // ========================================================================
    // RECURRENCE + OUTPUT PROJECTION
    // ========================================================================

    LstmSequenceResult recurrent = lstm.forward(inputs, lstm.initialState(static_cast<int>(batch)));

    ScoreSequenceBatch scores(static_cast<size_t>(batch), Matrix(seqLen, cfg.vocabSize));
    for (Eigen::Index t = 0; t < seqLen; ++t) {
        Matrix stepScores = output.forward(recurrent.outputs[static_cast<size_t>(t)]);
        for (Eigen::Index b = 0; b < batch; ++b) {
            scores[static_cast<size_t>(b)].row(t) = stepScores.row(b);
        }
    }
    return scores;
}

// ============================================================================
// INFERENCE MODE
// ============================================================================

SamplingStep CaptionDecoder::step(const Matrix& input, const LstmState& state) const {
    checkStepInput(input);
    LstmStepResult recurrent = lstm.step(input, state);

    SamplingStep result;
    result.scores = output.forward(recurrent.output).row(0);
    result.token = ScoreUtils::argmax(result.scores);
    result.probability = ScoreUtils::softmax(result.scores)[result.token];
    result.state = std::move(recurrent.state);
    result.nextInput = embedToken(result.token);
    return result;
}

std::vector<int> CaptionDecoder::sample(const Matrix& inputs, int maxLen) const {
    return sample(inputs, initialState(), maxLen);
}

std::vector<int> CaptionDecoder::sample(const Matrix& inputs, const LstmState& states, int maxLen) const {
    std::vector<int> tokens;
    for (const SampledToken& sampled : sampleDetailed(inputs, states, maxLen)) {
        tokens.push_back(sampled.index);
    }
    return tokens;
}

std::vector<SampledToken> CaptionDecoder::sampleDetailed(const Matrix& inputs, const LstmState& states,
                                                         int maxLen) const {
    checkSeed(inputs, maxLen);

    std::vector<SampledToken> caption;
    caption.reserve(static_cast<size_t>(maxLen));

    Matrix input = inputs;
    LstmState state = states;

    for (int stepCount = 0; stepCount < maxLen; ++stepCount) {
        SamplingStep next = step(input, state);
        caption.push_back(SampledToken{next.token, next.probability});

        // The end token is emitted, then decoding stops
        if (next.token == cfg.endToken) {
            break;
        }

        input = std::move(next.nextInput);
        state = std::move(next.state);
    }
    return caption;
}

LstmState CaptionDecoder::initialState() const {
    return lstm.initialState(1);
}

Matrix CaptionDecoder::embedToken(int64_t token) const {
    return wordEmbedding.lookup(token);
}

void CaptionDecoder::checkSeed(const Matrix& inputs, int maxLen) const {
    if (maxLen < 1) {
        throw std::invalid_argument("maxLen must be positive, got " + std::to_string(maxLen));
    }
    checkStepInput(inputs);
}

void CaptionDecoder::checkStepInput(const Matrix& input) const {
    if (input.rows() != 1 || input.cols() != cfg.embedSize) {
        throw std::invalid_argument(
            "Sampling input must be [1, " + std::to_string(cfg.embedSize) + "], got [" +
            std::to_string(input.rows()) + ", " + std::to_string(input.cols()) + "]");
    }
}

// ============================================================================
// PARAMETERS
// ============================================================================

std::vector<ParameterGroup> CaptionDecoder::parameterGroups() {
    return {
        ParameterGroup{"decoder.word_embedding", wordEmbedding.parameters()},
        ParameterGroup{"decoder.lstm", lstm.parameters()},
        ParameterGroup{"decoder.linear", output.parameters()}
    };
}

std::vector<Parameter*> CaptionDecoder::parameters() {
    std::vector<Parameter*> params;
    for (const ParameterGroup& group : parameterGroups()) {
        params.insert(params.end(), group.parameters.begin(), group.parameters.end());
    }
    return params;
}

std::vector<Parameter*> CaptionDecoder::trainableParameters() {
    return filterTrainable(parameters());
}
