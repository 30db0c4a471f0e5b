/**
 * =============================================================================
 * Lstm.hpp - Stacked Long Short-Term Memory Layer
 * =============================================================================
 *
 * LSTM CELL (one layer, one timestep):
 * ------------------------------------
 *   gates = x · W_ihᵀ + b_ih + h · W_hhᵀ + b_hh        [batch, 4 * hidden]
 *   i, f, g, o = split(gates)                          (this order)
 *   c' = σ(f) ⊙ c + σ(i) ⊙ tanh(g)
 *   h' = σ(o) ⊙ tanh(c')
 *
 * STACKING:
 * ---------
 * Layer k's h' is layer k+1's x. The top layer's h' is the LSTM output.
 *
 * STATE THREADING:
 * ----------------
 * Nothing in this class is mutated by a forward call. Every call takes an
 * LstmState and returns a new one, so two samples captioned at the same time
 * never share recurrent state.
 *
 * @file Lstm.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef LSTM_HPP
#define LSTM_HPP

#include "Parameter.hpp"   // Parameter, Matrix

#include <random>   // std::mt19937 for U(-1/sqrt(hidden), 1/sqrt(hidden)) init
#include <string>   // std::string for parameter names
#include <vector>   // std::vector for per-layer weights and state

/**
 * Recurrent state: one (hidden, cell) pair per layer, each [batch, hiddenSize].
 */
struct LstmState {
    std::vector<Matrix> hidden;
    std::vector<Matrix> cell;

    /** All-zero state, the implicit initial state of every forward call */
    static LstmState zeros(int numLayers, int batch, int hiddenSize);

    int numLayers() const { return static_cast<int>(hidden.size()); }
};

/** Result of a single timestep */
struct LstmStepResult {
    Matrix output;      // [batch, hiddenSize], top layer
    LstmState state;
};

/** Result of a full sequence */
struct LstmSequenceResult {
    std::vector<Matrix> outputs;   // one [batch, hiddenSize] per timestep
    LstmState state;               // state after the last timestep
};

class Lstm {
public:
    /**
     * @param inputSize  Width of each timestep's input
     * @param hiddenSize Width of h and c
     * @param numLayers  Recurrent depth (1 or more)
     * @param rng        Source for U(-1/sqrt(hidden), 1/sqrt(hidden)) init
     * @throws std::invalid_argument if any size is not positive
     */
    Lstm(int inputSize, int hiddenSize, int numLayers, std::mt19937& rng, const std::string& name);

    /**
     * Advance every layer by one timestep.
     *
     * @param input [batch, inputSize]
     * @param state State for the same batch size
     * @throws std::invalid_argument on input or state shape mismatch
     */
    LstmStepResult step(const Matrix& input, const LstmState& state) const;

    /**
     * Run a whole sequence, time-major: inputs[t] is [batch, inputSize].
     * Equivalent to calling step() once per timestep and threading the state.
     */
    LstmSequenceResult forward(const std::vector<Matrix>& inputs, const LstmState& state) const;

    /** Zero state for a batch */
    LstmState initialState(int batch) const;

    int inputSize() const { return inSize; }
    int hiddenSize() const { return hidSize; }
    int numLayers() const { return static_cast<int>(layers.size()); }

    std::vector<Parameter*> parameters();

private:
    struct Layer {
        Parameter weightIh;   // [4 * hidden, layerInput]
        Parameter weightHh;   // [4 * hidden, hidden]
        Parameter biasIh;     // [1, 4 * hidden]
        Parameter biasHh;     // [1, 4 * hidden]
    };

    void checkState(const LstmState& state, Eigen::Index batch) const;

    int inSize;
    int hidSize;
    std::vector<Layer> layers;
};

#endif // LSTM_HPP
