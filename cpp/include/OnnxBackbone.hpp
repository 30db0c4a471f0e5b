/**
 * =============================================================================
 * OnnxBackbone.hpp - Pretrained CNN Feature Extractor on ONNX Runtime
 * =============================================================================
 *
 * Runs a pretrained image classifier whose final classification layer has
 * been removed before export (e.g. ResNet-50 up to its global average pool).
 *
 *   input  "input"    : [N, 3, 224, 224]   float, ImageNet-normalized
 *   output "features" : [N, 2048, 1, 1]    float, pooled feature map
 *
 * The weights live inside the ONNX graph. Nothing here can change them, so
 * the backbone is frozen by construction and exposes no parameters.
 *
 * DESIGN PATTERN: PIMPL (Pointer to Implementation)
 * -------------------------------------------------
 * No ONNX Runtime headers appear in this header. Users of the captioning
 * model only need ONNX Runtime at link time.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * auto backbone = std::make_unique<OnnxBackbone>();
 * if (!backbone->initialize(backboneConfig)) {
 *     return 1;
 * }
 * ImageEncoder encoder(std::move(backbone), encoderConfig, rng);
 * ```
 *
 * @file OnnxBackbone.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef ONNX_BACKBONE_HPP
#define ONNX_BACKBONE_HPP

#include "FeatureExtractor.hpp"
#include "ModelConfig.hpp"

#include <memory>
#include <string>

class OnnxBackbone : public FeatureExtractor {
public:
    /**
     * Creates an uninitialized backbone. Call initialize() before use.
     */
    OnnxBackbone();

    /**
     * Declared here, defined in .cpp because unique_ptr<Impl> needs the
     * complete Impl type to destroy it.
     */
    ~OnnxBackbone() override;

    /**
     * Load the ONNX model and read its input/output geometry.
     *
     * Will attempt to use GPU (CUDA) if available, falls back to CPU.
     *
     * @param config Model path, tensor names, thread count
     * @param fallbackImageSize Input height/width used when the model declares
     *        dynamic spatial dimensions
     * @return true if the model loaded and exposes a usable feature output,
     *         false otherwise (reason logged to std::cerr)
     */
    bool initialize(const BackboneConfig& config, int fallbackImageSize = 224);

    bool isInitialized() const;

    /** Flattened pooled feature width, e.g. 2048 for ResNet-50 */
    int featureSize() const override;

    /**
     * Run the backbone.
     *
     * @throws std::runtime_error if not initialized or ONNX Runtime fails
     * @throws std::invalid_argument if the images do not match the model's
     *         channel count or spatial size
     */
    FeatureMap extract(const ImageBatch& images) const override;

    /**
     * Expected input image dimensions.
     *
     * @param[out] width    Image width (typically 224)
     * @param[out] height   Image height (typically 224)
     * @param[out] channels Number of color channels (typically 3 for RGB)
     */
    void getInputDimensions(int& width, int& height, int& channels) const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#endif // ONNX_BACKBONE_HPP
