/**
 * =============================================================================
 * Linear.cpp - Fully Connected Layer Implementation
 * =============================================================================
 *
 * @file Linear.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "Linear.hpp"

#include <cmath>
#include <stdexcept>

Linear::Linear(int inFeatures, int outFeatures, std::mt19937& rng, const std::string& name)
    : inSize(inFeatures)
    , outSize(outFeatures)
{
    if (inFeatures < 1 || outFeatures < 1) {
        throw std::invalid_argument(name + ": layer sizes must be positive");
    }

    const float bound = 1.0f / std::sqrt(static_cast<float>(inFeatures));

    weightParam.name = name + ".weight";
    weightParam.value.resize(outFeatures, inFeatures);
    ParameterInit::uniform(weightParam.value, bound, rng);

    biasParam.name = name + ".bias";
    biasParam.value.resize(1, outFeatures);
    ParameterInit::uniform(biasParam.value, bound, rng);
}

Matrix Linear::forward(const Matrix& input) const {
    if (input.cols() != inSize) {
        throw std::invalid_argument(
            weightParam.name + ": expected input width " + std::to_string(inSize) +
            ", got " + std::to_string(input.cols()));
    }

    Matrix output = input * weightParam.value.transpose();
    output.rowwise() += biasParam.value.row(0);
    return output;
}

std::vector<Parameter*> Linear::parameters() {
    return {&weightParam, &biasParam};
}
