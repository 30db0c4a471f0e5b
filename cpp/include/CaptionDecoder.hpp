/**
 * =============================================================================
 * CaptionDecoder.hpp - LSTM Caption Generator
 * =============================================================================
 *
 * The decoder turns an image embedding into a caption. It has two modes that
 * share the same weights but move data very differently.
 *
 * TRAINING (teacher forcing) - forward():
 * ---------------------------------------
 *   caption:   <start>  a   dog  runs  <end>
 *   inputs:    [image] <start> a   dog  runs      (drop <end>, prepend image)
 *   targets:   <start>  a   dog  runs  <end>
 *
 *   Output timestep t is the prediction for caption token t. The whole
 *   sequence is known up front, so every timestep runs in one call from a
 *   zero recurrent state.
 *
 * INFERENCE (greedy sampling) - sample():
 * ---------------------------------------
 *   input = image embedding, state = zero (or caller's)
 *   repeat:
 *     scores = output(lstm(input, state))
 *     token  = argmax(scores)            (lowest index on ties)
 *     emit token
 *     stop if token == endToken or maxLen tokens emitted
 *     input  = embedding(token)
 *
 *   Each step depends on the previous step's prediction, so this loop is
 *   strictly sequential.
 *
 * @file CaptionDecoder.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef CAPTION_DECODER_HPP
#define CAPTION_DECODER_HPP

#include "Linear.hpp"          // output projection hidden -> vocabulary
#include "Lstm.hpp"            // recurrent core and LstmState
#include "ModelConfig.hpp"     // DecoderConfig
#include "WordEmbedding.hpp"   // token -> embedding lookup

#include <random>   // std::mt19937 for seeded weight initialization
#include <vector>   // std::vector for token lists and score sequences

/**
 * One greedy decoding step. Produced by step() without touching any state
 * outside the returned value.
 */
struct SamplingStep {
    int token = 0;              // argmax of scores
    float probability = 0.0f;   // softmax(scores)[token]
    RowVector scores;           // [vocabSize]
    LstmState state;            // recurrent state after this step
    Matrix nextInput;           // [1, embedSize], embedding of token
};

/** A predicted token together with its softmax probability */
struct SampledToken {
    int index = 0;
    float probability = 0.0f;
};

class CaptionDecoder {
public:
    static constexpr int kDefaultMaxLen = 20;

    /** @throws std::invalid_argument if the config is invalid */
    CaptionDecoder(const DecoderConfig& config, std::mt19937& rng);

    // ========================================================================
    // TRAINING MODE
    // ========================================================================

    /**
     * Teacher-forced scores for a batch of ground-truth captions.
     *
     * @param features [batch, embedSize] image embeddings
     * @param captions [batch, seqLen] token indices, seqLen >= 1
     * @return [batch, seqLen, vocabSize]
     * @throws std::invalid_argument on any shape mismatch or bad token index
     */
    ScoreSequenceBatch forward(const Matrix& features, const CaptionBatch& captions) const;

    // ========================================================================
    // INFERENCE MODE
    // ========================================================================

    /**
     * Greedy caption from a zero recurrent state.
     *
     * @param inputs Seed vector, [1, embedSize] (usually an image embedding)
     * @param maxLen Maximum number of tokens to emit (>= 1)
     * @return Between 1 and maxLen token indices. If endToken was predicted
     *         it is the last element.
     */
    std::vector<int> sample(const Matrix& inputs, int maxLen = kDefaultMaxLen) const;

    /** Greedy caption continuing from a caller-supplied recurrent state */
    std::vector<int> sample(const Matrix& inputs, const LstmState& states,
                            int maxLen = kDefaultMaxLen) const;

    /** Same as sample(), also reporting each token's probability */
    std::vector<SampledToken> sampleDetailed(const Matrix& inputs, const LstmState& states,
                                             int maxLen = kDefaultMaxLen) const;

    /**
     * A single decoding step: feed input and state, pick the best token.
     *
     * @param input [1, embedSize]
     * @param state State for batch size 1
     * @throws std::invalid_argument if input is not [1, embedSize]
     */
    SamplingStep step(const Matrix& input, const LstmState& state) const;

    /** Zero recurrent state for one sample */
    LstmState initialState() const;

    /** Word embedding of one token, [1, embedSize] */
    Matrix embedToken(int64_t token) const;

    // ========================================================================
    // PARAMETERS
    // ========================================================================

    /** "decoder.word_embedding", "decoder.lstm", "decoder.linear" */
    std::vector<ParameterGroup> parameterGroups();
    std::vector<Parameter*> parameters();
    std::vector<Parameter*> trainableParameters();

    const DecoderConfig& config() const { return cfg; }

private:
    void checkSeed(const Matrix& inputs, int maxLen) const;
    void checkStepInput(const Matrix& input) const;

    DecoderConfig cfg;
    WordEmbedding wordEmbedding;
    Lstm lstm;
    Linear output;
};

#endif // CAPTION_DECODER_HPP
