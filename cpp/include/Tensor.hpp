/**
 * =============================================================================
 * Tensor.hpp - Shared Tensor Types for the Captioning Model
 * =============================================================================
 *
 * Every component of the captioning model exchanges data through the small
 * set of types declared here.
 *
 * LAYOUT CONVENTIONS:
 * -------------------
 * - Matrices are ROW-MAJOR: one row per sample (or per timestep).
 *   A batch of embeddings [batch, embed_size] is a Matrix with batch rows.
 * - Images stay in the flat CHW layout produced by ImageUtils:
 *   [batch, channels, height, width] stored contiguously.
 * - Caption tokens are 64-bit integers, matching the index type used by the
 *   training data pipeline.
 *
 * @file Tensor.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef TENSOR_HPP
#define TENSOR_HPP

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

/** Dense float matrix, row-major: [rows = samples/timesteps, cols = features] */
using Matrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/** Dense float row vector: a single sample's features */
using RowVector = Eigen::RowVectorXf;

/**
 * Caption token indices, shape [batch, seq_len].
 * Each row includes the start token and the end token.
 */
using CaptionBatch = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * Per-timestep vocabulary scores for a batch: [batch, seq_len, vocab_size].
 * Element b is a [seq_len, vocab_size] matrix for caption b.
 */
using ScoreSequenceBatch = std::vector<Matrix>;

/**
 * Batch of pre-normalized images in NCHW layout.
 *
 * Memory layout of data:
 *   image 0: [R plane][G plane][B plane], image 1: [R plane]...
 */
struct ImageBatch {
    int batch = 0;
    int channels = 3;
    int height = 0;
    int width = 0;
    std::vector<float> data;

    /** Number of floats in one image (channels * height * width) */
    size_t imageSize() const {
        return static_cast<size_t>(channels) * height * width;
    }

    /** Pointer to the first float of image i */
    const float* image(int i) const {
        return data.data() + static_cast<size_t>(i) * imageSize();
    }

    /**
     * Throws std::invalid_argument if the buffer does not hold exactly
     * batch * channels * height * width floats.
     */
    void checkShape() const;
};

#endif // TENSOR_HPP
