/**
 * =============================================================================
 * Scores.cpp - Softmax and Greedy Argmax
 * =============================================================================
 *
 * @file Scores.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "Scores.hpp"

#include <algorithm>   // std::max_element
#include <cmath>       // std::exp
#include <stdexcept>

namespace ScoreUtils {

RowVector softmax(const RowVector& scores) {
    if (scores.size() == 0) {
        return RowVector();
    }

    const float maxScore = scores.maxCoeff();

    RowVector probabilities(scores.size());
    double sum = 0.0;
    for (Eigen::Index i = 0; i < scores.size(); ++i) {
        double e = std::exp(static_cast<double>(scores[i] - maxScore));
        probabilities[i] = static_cast<float>(e);
        sum += e;
    }

    for (Eigen::Index i = 0; i < probabilities.size(); ++i) {
        probabilities[i] = static_cast<float>(static_cast<double>(probabilities[i]) / sum);
    }
    return probabilities;
}

int argmax(const RowVector& scores) {
    if (scores.size() == 0) {
        throw std::invalid_argument("Cannot take argmax of an empty score vector");
    }

    // std::max_element returns the FIRST largest element, which gives the
    // lowest-index tie-break
    const float* begin = scores.data();
    const float* end = begin + scores.size();
    return static_cast<int>(std::max_element(begin, end) - begin);
}

} // namespace ScoreUtils
