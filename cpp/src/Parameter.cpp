/**
 * =============================================================================
 * Parameter.cpp - Parameter Groups and Weight Initializers
 * =============================================================================
 *
 * INITIALIZATION:
 * ---------------
 * Weights are drawn from a caller-owned std::mt19937. Building two models
 * with the same seed gives bit-identical weights, which is what makes
 * sampling reproducible across runs of the CLI.
 *
 * @file Parameter.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "Parameter.hpp"

void ParameterGroup::setTrainable(bool trainable) {
    for (Parameter* param : parameters) {
        param->trainable = trainable;
    }
}

size_t ParameterGroup::count() const {
    size_t total = 0;
    for (const Parameter* param : parameters) {
        total += static_cast<size_t>(param->value.size());
    }
    return total;
}

namespace ParameterInit {

void uniform(Matrix& m, float bound, std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-bound, bound);

    // Row-major traversal keeps the draw order independent of Eigen internals
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        for (Eigen::Index c = 0; c < m.cols(); ++c) {
            m(r, c) = dist(rng);
        }
    }
}

void normal(Matrix& m, std::mt19937& rng) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        for (Eigen::Index c = 0; c < m.cols(); ++c) {
            m(r, c) = dist(rng);
        }
    }
}

} // namespace ParameterInit

std::vector<Parameter*> filterTrainable(const std::vector<Parameter*>& params) {
    std::vector<Parameter*> trainable;
    for (Parameter* param : params) {
        if (param->trainable) {
            trainable.push_back(param);
        }
    }
    return trainable;
}
