/**
 * =============================================================================
 * Parameter.hpp - Learned Weights and Trainability Flags
 * =============================================================================
 *
 * A Parameter is a named weight tensor owned by a layer. Each one carries a
 * trainable flag:
 *
 *   trainable = true   → handed to the optimizer (projection, LSTM, embedding)
 *   trainable = false  → frozen (pretrained backbone weights)
 *
 * The training loop lives outside this library. It asks a module for
 * trainableParameters() and updates only those, so freezing is a property of
 * the parameter, decided once at construction time.
 *
 * @file Parameter.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef PARAMETER_HPP
#define PARAMETER_HPP

#include "Tensor.hpp"

#include <random>
#include <string>
#include <vector>

struct Parameter {
    std::string name;
    Matrix value;
    bool trainable = true;
};

/**
 * Named collection of parameter pointers, e.g. "encoder.embed" or
 * "decoder.lstm". Pointers refer into the owning layer and stay valid for
 * the layer's lifetime.
 */
struct ParameterGroup {
    std::string name;
    std::vector<Parameter*> parameters;

    /** Set the trainable flag on every parameter in the group */
    void setTrainable(bool trainable);

    /** Total number of scalar weights */
    size_t count() const;
};

namespace ParameterInit {

    /**
     * Fill with U(-bound, bound).
     * Used for Linear and LSTM weights with bound = 1/sqrt(fan).
     */
    void uniform(Matrix& m, float bound, std::mt19937& rng);

    /** Fill with N(0, 1). Used for word embedding tables. */
    void normal(Matrix& m, std::mt19937& rng);

}

/** Keep only trainable parameters from a list */
std::vector<Parameter*> filterTrainable(const std::vector<Parameter*>& params);

#endif // PARAMETER_HPP
