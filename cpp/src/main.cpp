/**
 * =============================================================================
 * main.cpp - Command-Line Interface for the Captioning Model
 * =============================================================================
 *
 * Captions images with a pretrained ONNX backbone and a freshly initialized
 * (seeded) decoder. Useful for:
 * - Checking that a backbone export loads and produces pooled features
 * - Timing the encoder and the greedy sampling loop
 * - Reproducing a caption exactly (same seed, same image → same tokens)
 *
 * USAGE:
 *   ./caption_images <backbone.onnx> <image> [<image>...] [options]
 *
 * EXAMPLE:
 *   ./caption_images models/resnet50_headless.onnx test_images/dog.jpg \
 *       --vocab models/vocab.txt --max-len 20
 *
 * OUTPUT:
 *   - Token indices, their probabilities, and the formatted caption
 *   - Captioning time per image in milliseconds
 *
 * @file main.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "CaptionFormatter.hpp"
#include "CaptioningModel.hpp"
#include "ImageUtils.hpp"
#include "ModelConfig.hpp"
#include "OnnxBackbone.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << ConfigUtils::usage(argv[0]);
        return 1;
    }

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    ModelConfig config;
    try {
        config = ConfigUtils::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ConfigUtils::usage(argv[0]);
        return 1;
    }

    try {
        std::cout << "=== Image Captioning ===" << std::endl;
        std::cout << "Loading backbone..." << std::endl;

        // ====================================================================
        // BACKBONE + MODEL
        // ====================================================================

        auto backbone = std::make_unique<OnnxBackbone>();
        if (!backbone->initialize(config.backbone, config.imageSize)) {
            std::cerr << "Failed to initialize backbone" << std::endl;
            return 1;
        }

        int width = 0, height = 0, channels = 0;
        backbone->getInputDimensions(width, height, channels);

        // Same seed → same decoder weights → same captions
        std::mt19937 rng(config.seed);
        CaptioningModel model(std::move(backbone), config.encoder, config.decoder, rng);

        std::cout << "Embed size: " << config.decoder.embedSize
                  << ", hidden size: " << config.decoder.hiddenSize
                  << ", vocabulary: " << config.decoder.vocabSize
                  << ", layers: " << config.decoder.numLayers << std::endl;
        std::cout << "Trainable parameters: " << model.trainableParameters().size()
                  << " of " << model.parameters().size() << std::endl;

        CaptionFormatter formatter(0, config.decoder.endToken);
        if (!config.vocabPath.empty()) {
            formatter.loadWords(config.vocabPath);
        }

        // ====================================================================
        // CAPTION EACH IMAGE INDEPENDENTLY
        // ====================================================================

        for (const std::string& imagePath : config.imagePaths) {
            std::cout << "\nCaptioning image: " << imagePath << std::endl;

            auto start = std::chrono::high_resolution_clock::now();

            ImageBatch image = ImageUtils::loadImageBatch({imagePath}, width, height);
            std::vector<SampledToken> caption = model.captionDetailed(image, config.maxLen);

            auto end = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

            std::vector<int> tokens;
            std::cout << "Tokens:" << std::endl;
            for (size_t i = 0; i < caption.size(); ++i) {
                tokens.push_back(caption[i].index);
                std::cout << "  " << (i + 1) << ". " << formatter.word(caption[i].index)
                          << " [" << caption[i].index << "] ("
                          << std::fixed << std::setprecision(2)
                          << (caption[i].probability * 100.0f) << "%)" << std::endl;
            }

            std::cout << "Caption: " << formatter.format(tokens) << std::endl;
            std::cout << "Captioning time: " << duration.count() << " ms" << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
