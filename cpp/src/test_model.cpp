#include "CaptioningModel.hpp"
#include "TestBackbone.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <stdexcept>

namespace {

EncoderConfig encoderConfig(int embedSize = 6) {
    EncoderConfig config;
    config.embedSize = embedSize;
    return config;
}

DecoderConfig decoderConfig(int embedSize = 6) {
    DecoderConfig config;
    config.embedSize = embedSize;
    config.hiddenSize = 10;
    config.vocabSize = 12;
    config.numLayers = 1;
    return config;
}

} // namespace

TEST(CaptioningModelTest, RejectsEmbeddingWidthMismatch) {
    std::mt19937 rng(1);
    EXPECT_THROW(
        CaptioningModel(std::make_unique<TestBackbone>(3), encoderConfig(6), decoderConfig(7), rng),
        std::invalid_argument);
}

/**
 * Encode an image, then decode a <start> <end> caption: two timesteps
 */
TEST(CaptioningModelTest, StartEndRoundTripHasTwoTimesteps) {
    std::mt19937 rng(1);
    CaptioningModel model(std::make_unique<TestBackbone>(3), encoderConfig(), decoderConfig(), rng);

    CaptionBatch captions(1, 2);
    captions << 0, 1;

    ScoreSequenceBatch scores = model.forward(makeImages(1), captions);
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_EQ(scores[0].rows(), 2);
    EXPECT_EQ(scores[0].cols(), 12);
}

TEST(CaptioningModelTest, TrainingForwardShape) {
    std::mt19937 rng(2);
    CaptioningModel model(std::make_unique<TestBackbone>(3), encoderConfig(), decoderConfig(), rng);

    CaptionBatch captions(4, 7);
    for (int b = 0; b < 4; ++b) {
        for (int t = 0; t < 7; ++t) {
            captions(b, t) = (3 * b + t) % 12;
        }
    }

    ScoreSequenceBatch scores = model.forward(makeImages(4), captions);
    ASSERT_EQ(scores.size(), 4u);
    for (const Matrix& caption : scores) {
        EXPECT_EQ(caption.rows(), 7);
        EXPECT_EQ(caption.cols(), 12);
    }
}

TEST(CaptioningModelTest, CaptionEqualsEncodeThenSample) {
    std::mt19937 rng(3);
    CaptioningModel model(std::make_unique<TestBackbone>(3), encoderConfig(), decoderConfig(), rng);

    ImageBatch image = makeImages(1);
    std::vector<int> tokens = model.caption(image, 15);
    std::vector<int> expected = model.decoder().sample(model.encoder().encode(image), 15);

    EXPECT_EQ(tokens, expected);
    EXPECT_GE(tokens.size(), 1u);
    EXPECT_LE(tokens.size(), 15u);
    EXPECT_EQ(model.caption(image, 15), tokens);

    std::vector<SampledToken> detailed = model.captionDetailed(image, 15);
    ASSERT_EQ(detailed.size(), tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(detailed[i].index, tokens[i]);
    }
}

/**
 * Images in a batch are captioned one by one, each from its own zero state
 */
TEST(CaptioningModelTest, CaptionTakesOneImageAtATime) {
    std::mt19937 rng(3);
    CaptioningModel model(std::make_unique<TestBackbone>(3), encoderConfig(), decoderConfig(), rng);

    EXPECT_THROW(model.caption(makeImages(2)), std::invalid_argument);
}

TEST(CaptioningModelTest, TrainableParametersExcludeBackbone) {
    std::mt19937 rng(1);
    CaptioningModel model(std::make_unique<TestBackbone>(3), encoderConfig(), decoderConfig(), rng);

    std::vector<Parameter*> all = model.parameters();
    std::vector<Parameter*> trainable = model.trainableParameters();

    // backbone scale + projection (2) + embedding (1) + LSTM (4) + output (2)
    EXPECT_EQ(all.size(), 10u);
    EXPECT_EQ(trainable.size(), 9u);
    for (const Parameter* param : trainable) {
        EXPECT_NE(param->name, "backbone.scale");
    }

    std::vector<ParameterGroup> groups = model.parameterGroups();
    ASSERT_EQ(groups.size(), 5u);
    EXPECT_EQ(groups.front().name, "encoder.backbone");
    EXPECT_EQ(groups.back().name, "decoder.linear");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
