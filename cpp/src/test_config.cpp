#include "CaptionFormatter.hpp"
#include "ModelConfig.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/** Build argv from strings; the strings must outlive the returned vector */
std::vector<char*> makeArgv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    for (std::string& arg : args) {
        argv.push_back(&arg[0]);
    }
    return argv;
}

ModelConfig parse(std::vector<std::string> args) {
    std::vector<char*> argv = makeArgv(args);
    return ConfigUtils::parseCommandLine(static_cast<int>(argv.size()), argv.data());
}

} // namespace

// ============================================================================
// ModelConfig
// ============================================================================

TEST(ModelConfigTest, DefaultsMatchReferenceModel) {
    ModelConfig config = parse({"caption_images", "backbone.onnx", "dog.jpg"});

    EXPECT_EQ(config.backbone.modelPath, "backbone.onnx");
    ASSERT_EQ(config.imagePaths.size(), 1u);
    EXPECT_EQ(config.imagePaths[0], "dog.jpg");

    EXPECT_EQ(config.encoder.embedSize, 256);
    EXPECT_EQ(config.decoder.embedSize, 256);
    EXPECT_EQ(config.decoder.hiddenSize, 512);
    EXPECT_EQ(config.decoder.vocabSize, 5000);
    EXPECT_EQ(config.decoder.numLayers, 1);
    EXPECT_EQ(config.decoder.endToken, 1);
    EXPECT_EQ(config.maxLen, 20);
    EXPECT_EQ(config.backbone.inputName, "input");
    EXPECT_EQ(config.backbone.outputName, "features");
}

TEST(ModelConfigTest, ParsesFlags) {
    ModelConfig config = parse({
        "caption_images", "model.onnx", "a.jpg", "b.png",
        "--embed-size", "128", "--hidden-size", "64", "--vocab-size", "900",
        "--num-layers", "2", "--end-token", "2", "--max-len", "5",
        "--seed", "7", "--vocab", "words.txt", "--output-name", "pool"
    });

    EXPECT_EQ(config.imagePaths, (std::vector<std::string>{"a.jpg", "b.png"}));
    EXPECT_EQ(config.encoder.embedSize, 128);
    EXPECT_EQ(config.decoder.embedSize, 128);
    EXPECT_EQ(config.decoder.hiddenSize, 64);
    EXPECT_EQ(config.decoder.vocabSize, 900);
    EXPECT_EQ(config.decoder.numLayers, 2);
    EXPECT_EQ(config.decoder.endToken, 2);
    EXPECT_EQ(config.maxLen, 5);
    EXPECT_EQ(config.seed, 7u);
    EXPECT_EQ(config.vocabPath, "words.txt");
    EXPECT_EQ(config.backbone.outputName, "pool");
}

TEST(ModelConfigTest, RejectsBadArguments) {
    EXPECT_THROW(parse({"caption_images", "model.onnx"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--max-len"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--max-len", "12abc"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--max-len", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--num-layers", "-1"}), std::invalid_argument);
}

TEST(ModelConfigTest, RejectsOutOfRangeIntegers) {
    // Would wrap to 5 and 1 if narrowed to int
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--vocab-size", "4294967301"}),
                 std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--max-len", "4294967297"}),
                 std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--seed", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--seed", "4294967296"}),
                 std::invalid_argument);
    EXPECT_THROW(parse({"caption_images", "m.onnx", "a.jpg", "--hidden-size", "99999999999999999999"}),
                 std::invalid_argument);

    ModelConfig config = parse({"caption_images", "m.onnx", "a.jpg", "--seed", "4294967295"});
    EXPECT_EQ(config.seed, 4294967295u);
}

TEST(ModelConfigTest, EndTokenMustBeInVocabulary) {
    DecoderConfig config;
    config.vocabSize = 10;
    config.endToken = 10;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config.endToken = 9;
    EXPECT_NO_THROW(config.validate());
}

TEST(ModelConfigTest, EncoderAndDecoderWidthsMustAgree) {
    ModelConfig config;
    config.backbone.modelPath = "model.onnx";
    config.encoder.embedSize = 128;
    config.decoder.embedSize = 256;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ModelConfigTest, UsageListsOptions) {
    std::string text = ConfigUtils::usage("caption_images");
    EXPECT_NE(text.find("--max-len"), std::string::npos);
    EXPECT_NE(text.find("caption_images"), std::string::npos);
}

// ============================================================================
// CaptionFormatter
// ============================================================================

TEST(CaptionFormatterTest, FormatsWithWordList) {
    const std::string path = "caption_formatter_words.txt";
    {
        std::ofstream out(path);
        out << "<start>\n<end>\na\ndog\n\nruns\r\n";
    }

    CaptionFormatter formatter;
    ASSERT_TRUE(formatter.loadWords(path));
    std::remove(path.c_str());

    EXPECT_EQ(formatter.size(), 6u);
    EXPECT_EQ(formatter.word(3), "dog");
    EXPECT_EQ(formatter.word(5), "runs");
    EXPECT_EQ(formatter.format({0, 2, 3, 5, 1}), "a dog runs");
}

TEST(CaptionFormatterTest, PlaceholdersWithoutWordList) {
    CaptionFormatter formatter;
    EXPECT_FALSE(formatter.loadWords("nonexistent_words.txt"));

    EXPECT_EQ(formatter.word(42), "token_42");
    EXPECT_EQ(formatter.format({7, 8, 1}), "token_7 token_8");
}

TEST(CaptionFormatterTest, CustomEndToken) {
    CaptionFormatter formatter(0, 3);
    EXPECT_EQ(formatter.format({1, 2, 3}), "token_1 token_2");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
