/**
 * =============================================================================
 * Lstm.cpp - Stacked LSTM Implementation
 * =============================================================================
 *
 * Gate layout follows the common (i, f, g, o) convention so that weights
 * exported from other frameworks can be copied in without reordering.
 *
 * @file Lstm.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "Lstm.hpp"

#include <cmath>
#include <stdexcept>

namespace {

using GateArray = Eigen::Array<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

GateArray sigmoid(const GateArray& x) {
    return (1.0f + (-x).exp()).inverse();
}

} // namespace

LstmState LstmState::zeros(int numLayers, int batch, int hiddenSize) {
    LstmState state;
    const Matrix zero = Matrix::Zero(batch, hiddenSize);
    state.hidden.assign(numLayers, zero);
    state.cell.assign(numLayers, zero);
    return state;
}

Lstm::Lstm(int inputSize, int hiddenSize, int numLayers, std::mt19937& rng, const std::string& name)
    : inSize(inputSize)
    , hidSize(hiddenSize)
{
    if (inputSize < 1 || hiddenSize < 1 || numLayers < 1) {
        throw std::invalid_argument(name + ": input size, hidden size and layer count must be positive");
    }

    const float bound = 1.0f / std::sqrt(static_cast<float>(hiddenSize));

    layers.resize(numLayers);
    for (int k = 0; k < numLayers; ++k) {
        Layer& layer = layers[k];
        const int layerInput = (k == 0) ? inputSize : hiddenSize;
        const std::string prefix = name + ".l" + std::to_string(k);

        layer.weightIh.name = prefix + ".weight_ih";
        layer.weightIh.value.resize(4 * hiddenSize, layerInput);
        ParameterInit::uniform(layer.weightIh.value, bound, rng);

        layer.weightHh.name = prefix + ".weight_hh";
        layer.weightHh.value.resize(4 * hiddenSize, hiddenSize);
        ParameterInit::uniform(layer.weightHh.value, bound, rng);

        layer.biasIh.name = prefix + ".bias_ih";
        layer.biasIh.value.resize(1, 4 * hiddenSize);
        ParameterInit::uniform(layer.biasIh.value, bound, rng);

        layer.biasHh.name = prefix + ".bias_hh";
        layer.biasHh.value.resize(1, 4 * hiddenSize);
        ParameterInit::uniform(layer.biasHh.value, bound, rng);
    }
}

LstmStepResult Lstm::step(const Matrix& input, const LstmState& state) const {
    if (input.cols() != inSize) {
        throw std::invalid_argument(
            "LSTM expected input width " + std::to_string(inSize) +
            ", got " + std::to_string(input.cols()));
    }
    checkState(state, input.rows());

    LstmStepResult result;
    result.state.hidden.reserve(layers.size());
    result.state.cell.reserve(layers.size());

    Matrix x = input;
    for (size_t k = 0; k < layers.size(); ++k) {
        const Layer& layer = layers[k];

        Matrix gates = x * layer.weightIh.value.transpose()
                     + state.hidden[k] * layer.weightHh.value.transpose();
        gates.rowwise() += layer.biasIh.value.row(0) + layer.biasHh.value.row(0);

        const GateArray inputGate  = sigmoid(gates.middleCols(0, hidSize).array());
        const GateArray forgetGate = sigmoid(gates.middleCols(hidSize, hidSize).array());
        const GateArray cellGate   = gates.middleCols(2 * hidSize, hidSize).array().tanh();
        const GateArray outputGate = sigmoid(gates.middleCols(3 * hidSize, hidSize).array());

        Matrix c = (forgetGate * state.cell[k].array() + inputGate * cellGate).matrix();
        Matrix h = (outputGate * c.array().tanh()).matrix();

        result.state.hidden.push_back(h);
        result.state.cell.push_back(c);
        x = h;
    }

    result.output = x;
    return result;
}

LstmSequenceResult Lstm::forward(const std::vector<Matrix>& inputs, const LstmState& state) const {
    LstmSequenceResult result;
    result.outputs.reserve(inputs.size());
    result.state = state;

    for (const Matrix& input : inputs) {
        LstmStepResult stepResult = step(input, result.state);
        result.outputs.push_back(std::move(stepResult.output));
        result.state = std::move(stepResult.state);
    }
    return result;
}

LstmState Lstm::initialState(int batch) const {
    return LstmState::zeros(numLayers(), batch, hidSize);
}

std::vector<Parameter*> Lstm::parameters() {
    std::vector<Parameter*> params;
    for (Layer& layer : layers) {
        params.push_back(&layer.weightIh);
        params.push_back(&layer.weightHh);
        params.push_back(&layer.biasIh);
        params.push_back(&layer.biasHh);
    }
    return params;
}

void Lstm::checkState(const LstmState& state, Eigen::Index batch) const {
    if (state.numLayers() != numLayers() || state.cell.size() != state.hidden.size()) {
        throw std::invalid_argument(
            "LSTM state has " + std::to_string(state.numLayers()) +
            " layers, expected " + std::to_string(numLayers()));
    }

    for (size_t k = 0; k < layers.size(); ++k) {
        if (state.hidden[k].rows() != batch || state.hidden[k].cols() != hidSize ||
            state.cell[k].rows() != batch || state.cell[k].cols() != hidSize) {
            throw std::invalid_argument(
                "LSTM state for layer " + std::to_string(k) + " must be [" +
                std::to_string(batch) + ", " + std::to_string(hidSize) + "]");
        }
    }
}
