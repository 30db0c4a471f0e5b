/**
 * =============================================================================
 * ModelConfig.hpp - Construction-Time Configuration
 * =============================================================================
 *
 * All sizes are fixed for the lifetime of a model. They are checked once,
 * when the model is built, so that a forward or sampling call never has to
 * second-guess them.
 *
 * MUTUAL CONSISTENCY:
 * -------------------
 *   encoder.embedSize == decoder.embedSize     (encoder output feeds LSTM)
 *   0 <= decoder.endToken < decoder.vocabSize  (end token must be predictable)
 *
 * maxLen is NOT part of the model: it is a sampling-call parameter. It lives
 * here only so the command-line tool can carry it around.
 *
 * @file ModelConfig.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef MODEL_CONFIG_HPP
#define MODEL_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/** Image encoder: backbone features → embedSize */
struct EncoderConfig {
    int embedSize = 256;

    /** @throws std::invalid_argument if embedSize < 1 */
    void validate() const;
};

/** Caption decoder: word embedding + LSTM + output layer */
struct DecoderConfig {
    int embedSize = 256;
    int hiddenSize = 512;
    int vocabSize = 5000;
    int numLayers = 1;

    /** Reserved end-of-sequence index, shared with the vocabulary */
    int64_t endToken = 1;

    /** @throws std::invalid_argument on non-positive sizes or bad endToken */
    void validate() const;
};

/** ONNX backbone model location and tensor names */
struct BackboneConfig {
    std::string modelPath;

    /** Graph input, expected shape [N, 3, H, W] */
    std::string inputName = "input";

    /** Pooled feature output of the headless backbone, [N, C, 1, 1] */
    std::string outputName = "features";

    int intraOpThreads = 4;

    /** @throws std::invalid_argument if modelPath is empty or threads < 1 */
    void validate() const;
};

struct ModelConfig {
    EncoderConfig encoder;
    DecoderConfig decoder;
    BackboneConfig backbone;

    /** Sampling cutoff (call-time parameter, default 20) */
    int maxLen = 20;

    /** Seed for weight initialization */
    uint32_t seed = 42;

    /** Optional word list for printing captions */
    std::string vocabPath;

    /** Image paths to caption */
    std::vector<std::string> imagePaths;

    /** Fallback backbone input size when the model declares dynamic dims */
    int imageSize = 224;

    /** Validate every section plus the cross-section constraints */
    void validate() const;
};

namespace ConfigUtils {

    /**
     * Build a ModelConfig from command-line arguments.
     *
     * Positional: <backbone.onnx> <image> [<image>...]
     * Flags (all "--name value"):
     *   --embed-size, --hidden-size, --vocab-size, --num-layers,
     *   --end-token, --max-len, --seed, --vocab, --image-size,
     *   --input-name, --output-name, --threads
     *
     * The embed size applies to both encoder and decoder.
     *
     * @throws std::invalid_argument on unknown flags, missing values,
     *         non-numeric values, or an invalid resulting configuration
     */
    ModelConfig parseCommandLine(int argc, char* argv[]);

    /** Usage text for the command-line tool */
    std::string usage(const std::string& programName);

}

#endif // MODEL_CONFIG_HPP
