/**
 * =============================================================================
 * ModelConfig.cpp - Configuration Validation and Command-Line Parsing
 * =============================================================================
 *
 * @file ModelConfig.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "ModelConfig.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

void requirePositive(int value, const std::string& what) {
    if (value < 1) {
        throw std::invalid_argument(what + " must be positive, got " + std::to_string(value));
    }
}

/**
 * Parse a whole string as an integer.
 * std::stoll alone accepts "12abc", so check that every character was used.
 */
long long parseInteger(const std::string& flag, const std::string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    return value;
}

/** parseInteger, then reject values that do not fit [minValue, maxValue] */
long long parseInRange(const std::string& flag, const std::string& text,
                       long long minValue, long long maxValue) {
    long long value = parseInteger(flag, text);
    if (value < minValue || value > maxValue) {
        throw std::invalid_argument(flag + " value " + text + " is out of range [" +
                                    std::to_string(minValue) + ", " + std::to_string(maxValue) + "]");
    }
    return value;
}

int parseInt(const std::string& flag, const std::string& text) {
    return static_cast<int>(parseInRange(flag, text,
                                         std::numeric_limits<int>::min(),
                                         std::numeric_limits<int>::max()));
}

} // namespace

void EncoderConfig::validate() const {
    requirePositive(embedSize, "encoder embed size");
}

void DecoderConfig::validate() const {
    requirePositive(embedSize, "decoder embed size");
    requirePositive(hiddenSize, "decoder hidden size");
    requirePositive(vocabSize, "decoder vocabulary size");
    requirePositive(numLayers, "decoder layer count");

    if (endToken < 0 || endToken >= vocabSize) {
        throw std::invalid_argument(
            "end token " + std::to_string(endToken) +
            " outside vocabulary of size " + std::to_string(vocabSize));
    }
}

void BackboneConfig::validate() const {
    if (modelPath.empty()) {
        throw std::invalid_argument("backbone model path is empty");
    }
    requirePositive(intraOpThreads, "backbone thread count");
}

void ModelConfig::validate() const {
    encoder.validate();
    decoder.validate();
    backbone.validate();
    requirePositive(maxLen, "max caption length");
    requirePositive(imageSize, "image size");

    if (encoder.embedSize != decoder.embedSize) {
        throw std::invalid_argument(
            "encoder embed size " + std::to_string(encoder.embedSize) +
            " does not match decoder embed size " + std::to_string(decoder.embedSize));
    }
}

namespace ConfigUtils {

ModelConfig parseCommandLine(int argc, char* argv[]) {
    ModelConfig config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }

        // Every flag takes exactly one value
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--embed-size") {
            config.encoder.embedSize = parseInt(arg, value);
            config.decoder.embedSize = config.encoder.embedSize;
        } else if (arg == "--hidden-size") {
            config.decoder.hiddenSize = parseInt(arg, value);
        } else if (arg == "--vocab-size") {
            config.decoder.vocabSize = parseInt(arg, value);
        } else if (arg == "--num-layers") {
            config.decoder.numLayers = parseInt(arg, value);
        } else if (arg == "--end-token") {
            config.decoder.endToken = parseInteger(arg, value);
        } else if (arg == "--max-len") {
            config.maxLen = parseInt(arg, value);
        } else if (arg == "--seed") {
            config.seed = static_cast<uint32_t>(
                parseInRange(arg, value, 0, std::numeric_limits<uint32_t>::max()));
        } else if (arg == "--vocab") {
            config.vocabPath = value;
        } else if (arg == "--image-size") {
            config.imageSize = parseInt(arg, value);
        } else if (arg == "--input-name") {
            config.backbone.inputName = value;
        } else if (arg == "--output-name") {
            config.backbone.outputName = value;
        } else if (arg == "--threads") {
            config.backbone.intraOpThreads = parseInt(arg, value);
        } else {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }

    if (positional.size() < 2) {
        throw std::invalid_argument("Expected a backbone model path and at least one image");
    }
    config.backbone.modelPath = positional[0];
    config.imagePaths.assign(positional.begin() + 1, positional.end());

    config.validate();
    return config;
}

std::string usage(const std::string& programName) {
    std::ostringstream out;
    out << "Usage: " << programName << " <backbone.onnx> <image> [<image>...] [options]\n"
        << "\n"
        << "Options:\n"
        << "  --embed-size N    Encoder output / decoder input width (default 256)\n"
        << "  --hidden-size N   LSTM width (default 512)\n"
        << "  --vocab-size N    Vocabulary size (default 5000)\n"
        << "  --num-layers N    LSTM depth (default 1)\n"
        << "  --end-token N     End-of-caption index (default 1)\n"
        << "  --max-len N       Maximum caption length (default 20)\n"
        << "  --seed N          Weight initialization seed (default 42)\n"
        << "  --vocab PATH      Word list, one token per line\n"
        << "  --image-size N    Input size when the model does not declare one (default 224)\n"
        << "  --input-name S    Backbone input tensor name (default input)\n"
        << "  --output-name S   Backbone feature tensor name (default features)\n"
        << "  --threads N       ONNX Runtime intra-op threads (default 4)\n";
    return out.str();
}

} // namespace ConfigUtils
