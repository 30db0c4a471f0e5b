/**
 * =============================================================================
 * Scores.hpp - Vocabulary Score Utilities
 * =============================================================================
 *
 * The decoder's output layer produces one "score" (logit) per vocabulary
 * entry. Two operations turn those scores into decisions:
 *
 * ARGMAX (greedy decoding):
 *   token = index of the highest score
 *   Ties are broken by the LOWEST index, so the same scores always produce
 *   the same token.
 *
 * SOFTMAX (confidence reporting):
 *   P(i) = exp(score_i - max) / Σ exp(score_j - max)
 *   Subtracting the max keeps exp() from overflowing for large scores.
 *
 * @file Scores.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef SCORES_HPP
#define SCORES_HPP

#include "Tensor.hpp"

namespace ScoreUtils {

    /**
     * Convert scores to probabilities.
     *
     * @param scores Raw vocabulary scores (one row)
     * @return Probabilities (all positive, sum to 1.0). Empty in, empty out.
     */
    RowVector softmax(const RowVector& scores);

    /**
     * Index of the maximum score, lowest index on ties.
     *
     * @throws std::invalid_argument if scores is empty
     */
    int argmax(const RowVector& scores);

}

#endif // SCORES_HPP
