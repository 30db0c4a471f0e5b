#include "Linear.hpp"
#include "Lstm.hpp"
#include "WordEmbedding.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>

namespace {

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

Parameter* findParameter(std::vector<Parameter*> params, const std::string& name) {
    for (Parameter* param : params) {
        if (param->name == name) {
            return param;
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Linear
// ============================================================================

TEST(LinearTest, ComputesAffineMap) {
    std::mt19937 rng(1);
    Linear layer(2, 3, rng, "fc");

    auto params = layer.parameters();
    ASSERT_EQ(params.size(), 2u);
    params[0]->value << 1.0f, 0.0f,
                        0.0f, 1.0f,
                        1.0f, 1.0f;
    params[1]->value << 0.5f, 0.0f, -1.0f;

    Matrix x(1, 2);
    x << 1.0f, 2.0f;
    Matrix y = layer.forward(x);

    ASSERT_EQ(y.rows(), 1);
    ASSERT_EQ(y.cols(), 3);
    EXPECT_FLOAT_EQ(y(0, 0), 1.5f);
    EXPECT_FLOAT_EQ(y(0, 1), 2.0f);
    EXPECT_FLOAT_EQ(y(0, 2), 2.0f);
}

TEST(LinearTest, InitializationWithinFanInBound) {
    std::mt19937 rng(7);
    Linear layer(16, 4, rng, "fc");

    const float bound = 1.0f / std::sqrt(16.0f);
    EXPECT_LE(layer.weight().value.cwiseAbs().maxCoeff(), bound);
    EXPECT_LE(layer.bias().value.cwiseAbs().maxCoeff(), bound);
    EXPECT_EQ(layer.weight().name, "fc.weight");
    EXPECT_TRUE(layer.weight().trainable);
}

TEST(LinearTest, RejectsWrongInputWidth) {
    std::mt19937 rng(1);
    Linear layer(4, 2, rng, "fc");
    EXPECT_THROW(layer.forward(Matrix::Zero(1, 3)), std::invalid_argument);
}

TEST(LinearTest, RejectsNonPositiveSizes) {
    std::mt19937 rng(1);
    EXPECT_THROW(Linear(0, 2, rng, "fc"), std::invalid_argument);
}

// ============================================================================
// WordEmbedding
// ============================================================================

TEST(WordEmbeddingTest, LookupReturnsTableRows) {
    std::mt19937 rng(3);
    WordEmbedding embedding(10, 4, rng, "emb");
    const Matrix& table = embedding.parameters()[0]->value;

    Matrix rows = embedding.lookup(std::vector<int64_t>{7, 0, 7});

    ASSERT_EQ(rows.rows(), 3);
    ASSERT_EQ(rows.cols(), 4);
    EXPECT_TRUE(rows.row(0) == table.row(7));
    EXPECT_TRUE(rows.row(1) == table.row(0));
    EXPECT_TRUE(rows.row(2) == table.row(7));

    Matrix single = embedding.lookup(static_cast<int64_t>(2));
    EXPECT_EQ(single.rows(), 1);
    EXPECT_TRUE(single.row(0) == table.row(2));
}

TEST(WordEmbeddingTest, RejectsOutOfRangeTokens) {
    std::mt19937 rng(3);
    WordEmbedding embedding(10, 4, rng, "emb");

    EXPECT_THROW(embedding.lookup(static_cast<int64_t>(10)), std::invalid_argument);
    EXPECT_THROW(embedding.lookup(static_cast<int64_t>(-1)), std::invalid_argument);
    EXPECT_THROW(embedding.lookup(std::vector<int64_t>{1, 2, 42}), std::invalid_argument);
}

// ============================================================================
// Lstm
// ============================================================================

/**
 * One cell with only bias_ih set: checks the (i, f, g, o) gate order
 */
TEST(LstmTest, SingleCellMatchesHandComputation) {
    std::mt19937 rng(5);
    Lstm lstm(1, 1, 1, rng, "lstm");

    auto params = lstm.parameters();
    for (Parameter* param : params) {
        param->value.setZero();
    }
    Parameter* biasIh = findParameter(params, "lstm.l0.bias_ih");
    ASSERT_NE(biasIh, nullptr);
    biasIh->value << 1.0f, 0.0f, 2.0f, -1.0f;

    Matrix x = Matrix::Constant(1, 1, 3.0f);
    LstmStepResult result = lstm.step(x, lstm.initialState(1));

    const float c = sigmoid(1.0f) * std::tanh(2.0f);
    const float h = sigmoid(-1.0f) * std::tanh(c);

    EXPECT_NEAR(result.state.cell[0](0, 0), c, 1e-6f);
    EXPECT_NEAR(result.state.hidden[0](0, 0), h, 1e-6f);
    EXPECT_NEAR(result.output(0, 0), h, 1e-6f);
}

TEST(LstmTest, ForgetGateCarriesCellState) {
    std::mt19937 rng(5);
    Lstm lstm(1, 1, 1, rng, "lstm");
    for (Parameter* param : lstm.parameters()) {
        param->value.setZero();
    }

    LstmState state = lstm.initialState(1);
    state.cell[0](0, 0) = 2.0f;

    // All gates at sigmoid(0) = 0.5, cell candidate tanh(0) = 0
    LstmStepResult result = lstm.step(Matrix::Zero(1, 1), state);
    EXPECT_NEAR(result.state.cell[0](0, 0), 1.0f, 1e-6f);
    EXPECT_NEAR(result.output(0, 0), 0.5f * std::tanh(1.0f), 1e-6f);

    // The caller's state is untouched
    EXPECT_FLOAT_EQ(state.cell[0](0, 0), 2.0f);
}

TEST(LstmTest, ForwardEqualsThreadedSteps) {
    std::mt19937 rng(11);
    Lstm lstm(3, 5, 2, rng, "lstm");

    std::mt19937 dataRng(99);
    std::vector<Matrix> inputs;
    for (int t = 0; t < 4; ++t) {
        Matrix x(2, 3);
        ParameterInit::uniform(x, 1.0f, dataRng);
        inputs.push_back(x);
    }

    LstmSequenceResult sequence = lstm.forward(inputs, lstm.initialState(2));
    ASSERT_EQ(sequence.outputs.size(), inputs.size());

    LstmState state = lstm.initialState(2);
    for (size_t t = 0; t < inputs.size(); ++t) {
        LstmStepResult stepResult = lstm.step(inputs[t], state);
        EXPECT_TRUE(stepResult.output == sequence.outputs[t]);
        state = stepResult.state;
    }
    for (int k = 0; k < 2; ++k) {
        EXPECT_TRUE(state.hidden[k] == sequence.state.hidden[k]);
        EXPECT_TRUE(state.cell[k] == sequence.state.cell[k]);
    }
}

TEST(LstmTest, SameSeedGivesSameWeights) {
    std::mt19937 rngA(2024);
    std::mt19937 rngB(2024);
    Lstm a(4, 6, 2, rngA, "lstm");
    Lstm b(4, 6, 2, rngB, "lstm");

    auto paramsA = a.parameters();
    auto paramsB = b.parameters();
    ASSERT_EQ(paramsA.size(), 8u);
    ASSERT_EQ(paramsA.size(), paramsB.size());
    for (size_t i = 0; i < paramsA.size(); ++i) {
        EXPECT_EQ(paramsA[i]->name, paramsB[i]->name);
        EXPECT_TRUE(paramsA[i]->value == paramsB[i]->value);
    }
}

TEST(LstmTest, LayerShapes) {
    std::mt19937 rng(1);
    Lstm lstm(4, 6, 2, rng, "lstm");
    auto params = lstm.parameters();

    EXPECT_EQ(findParameter(params, "lstm.l0.weight_ih")->value.rows(), 24);
    EXPECT_EQ(findParameter(params, "lstm.l0.weight_ih")->value.cols(), 4);
    EXPECT_EQ(findParameter(params, "lstm.l1.weight_ih")->value.cols(), 6);
    EXPECT_EQ(findParameter(params, "lstm.l1.weight_hh")->value.cols(), 6);
}

TEST(LstmTest, RejectsMismatchedState) {
    std::mt19937 rng(1);
    Lstm lstm(2, 3, 2, rng, "lstm");

    // Wrong number of layers
    EXPECT_THROW(lstm.step(Matrix::Zero(1, 2), LstmState::zeros(1, 1, 3)), std::invalid_argument);
    // Wrong batch size
    EXPECT_THROW(lstm.step(Matrix::Zero(1, 2), lstm.initialState(2)), std::invalid_argument);
    // Wrong input width
    EXPECT_THROW(lstm.step(Matrix::Zero(1, 5), lstm.initialState(1)), std::invalid_argument);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
