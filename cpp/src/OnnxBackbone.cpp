/**
 * =============================================================================
 * OnnxBackbone.cpp - ONNX Runtime Feature Extraction
 * =============================================================================
 *
 * ONNX RUNTIME OVERVIEW:
 * ----------------------
 * - Env: global runtime state (logging, thread pools), one per backbone
 * - Session: a loaded model ready for inference; expensive to create, so it
 *   is created once in initialize() and reused for every batch
 * - Value: a tensor passed into or returned from Session::Run
 *
 * FEATURE EXTRACTION PIPELINE:
 * 1. Receive an ImageBatch (already resized and normalized)
 * 2. Wrap its CHW data in an [N, 3, H, W] input tensor
 * 3. Run the headless classifier
 * 4. Copy the pooled [N, C, 1, 1] output into a FeatureMap
 *
 * @file OnnxBackbone.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "OnnxBackbone.hpp"

#include <onnxruntime_cxx_api.h>

#include <array>
#include <iostream>
#include <stdexcept>
#include <vector>

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

struct OnnxBackbone::Impl {
    BackboneConfig config;

    /** Whether a session is loaded and the geometry is known */
    bool initialized = false;

    /**
     * Input geometry read from the model. ResNet-50 expects 3x224x224.
     */
    int inputChannels = 3;
    int inputHeight = 224;
    int inputWidth = 224;

    /** Per-image output dimensions, batch excluded, e.g. {2048, 1, 1} */
    std::vector<int64_t> featureShape;

    /** Product of featureShape */
    int featureSize = 0;

    /**
     * Runtime environment, WARNING level to keep the console quiet.
     * Declared before session so it outlives it.
     */
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "CaptionBackbone"};

    std::unique_ptr<Ort::Session> session;

    Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    /**
     * Find a graph input or output by name.
     * @return its index, or -1 if the graph has no such tensor
     */
    int findInput(const std::string& name) {
        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session->GetInputCount(); ++i) {
            if (name == session->GetInputNameAllocated(i, allocator).get()) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    int findOutput(const std::string& name) {
        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session->GetOutputCount(); ++i) {
            if (name == session->GetOutputNameAllocated(i, allocator).get()) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    /**
     * Read [N, C, H, W] from the model input. Dynamic spatial dims (-1)
     * fall back to the configured image size.
     */
    void readInputGeometry(int inputIndex, int fallbackImageSize) {
        auto shape = session->GetInputTypeInfo(inputIndex).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() != 4) {
            throw std::runtime_error(
                "Backbone input '" + config.inputName + "' must be 4-D [N, C, H, W], got " +
                std::to_string(shape.size()) + " dimensions");
        }
        inputChannels = shape[1] > 0 ? static_cast<int>(shape[1]) : 3;
        inputHeight = shape[2] > 0 ? static_cast<int>(shape[2]) : fallbackImageSize;
        inputWidth = shape[3] > 0 ? static_cast<int>(shape[3]) : fallbackImageSize;
    }

    /**
     * Read the pooled feature shape. Every non-batch dimension must be fixed,
     * because it sizes the encoder's projection layer.
     */
    void readFeatureGeometry(int outputIndex) {
        auto shape = session->GetOutputTypeInfo(outputIndex).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() < 2) {
            throw std::runtime_error("Backbone output '" + config.outputName + "' has no feature dimension");
        }

        featureShape.assign(shape.begin() + 1, shape.end());
        int64_t size = 1;
        for (int64_t dim : featureShape) {
            if (dim <= 0) {
                throw std::runtime_error(
                    "Backbone output '" + config.outputName + "' has a dynamic feature dimension");
            }
            size *= dim;
        }
        featureSize = static_cast<int>(size);
    }
};

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

OnnxBackbone::OnnxBackbone() : pImpl(std::make_unique<Impl>()) {}

OnnxBackbone::~OnnxBackbone() = default;

// ============================================================================
// INITIALIZATION
// ============================================================================

bool OnnxBackbone::initialize(const BackboneConfig& config, int fallbackImageSize) {
    try {
        config.validate();
        pImpl->config = config;
        pImpl->initialized = false;

        Ort::SessionOptions sessionOptions;

        try {
            OrtCUDAProviderOptions cuda_options;
            cuda_options.device_id = 0;
            cuda_options.arena_extend_strategy = 0;
            cuda_options.gpu_mem_limit = 2ULL * 1024 * 1024 * 1024;
            cuda_options.cudnn_conv_algo_search = OrtCudnnConvAlgoSearchExhaustive;
            cuda_options.do_copy_in_default_stream = 1;

            sessionOptions.AppendExecutionProvider_CUDA(cuda_options);
            std::cout << "CUDA execution provider enabled" << std::endl;
        } catch (const std::exception& e) {
            // CUDA not available - this is okay, will fall back to CPU
            std::cerr << "CUDA not available, falling back to CPU: " << e.what() << std::endl;
        }

        sessionOptions.SetIntraOpNumThreads(config.intraOpThreads);
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);

        pImpl->session = std::make_unique<Ort::Session>(
            pImpl->env,
            config.modelPath.c_str(),
            sessionOptions
        );

        // ====================================================================
        // READ MODEL METADATA
        // ====================================================================

        int inputIndex = pImpl->findInput(config.inputName);
        if (inputIndex < 0) {
            std::cerr << "Backbone has no input named '" << config.inputName << "'" << std::endl;
            return false;
        }
        int outputIndex = pImpl->findOutput(config.outputName);
        if (outputIndex < 0) {
            std::cerr << "Backbone has no output named '" << config.outputName
                      << "' (export the model without its classification layer)" << std::endl;
            return false;
        }

        pImpl->readInputGeometry(inputIndex, fallbackImageSize);
        pImpl->readFeatureGeometry(outputIndex);
        pImpl->initialized = true;

        std::cout << "Backbone loaded: " << config.modelPath << std::endl;
        std::cout << "Input dimensions: " << pImpl->inputWidth << "x"
                  << pImpl->inputHeight << "x" << pImpl->inputChannels << std::endl;
        std::cout << "Feature size: " << pImpl->featureSize << std::endl;

        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize backbone: " << e.what() << std::endl;
        pImpl->session.reset();
        return false;
    }
}

bool OnnxBackbone::isInitialized() const {
    return pImpl->initialized;
}

int OnnxBackbone::featureSize() const {
    return pImpl->featureSize;
}

void OnnxBackbone::getInputDimensions(int& width, int& height, int& channels) const {
    width = pImpl->inputWidth;
    height = pImpl->inputHeight;
    channels = pImpl->inputChannels;
}

// ============================================================================
// FEATURE EXTRACTION
// ============================================================================

FeatureMap OnnxBackbone::extract(const ImageBatch& images) const {
    if (!pImpl->initialized) {
        throw std::runtime_error("Backbone not initialized. Call initialize() first.");
    }

    images.checkShape();
    if (images.channels != pImpl->inputChannels ||
        images.height != pImpl->inputHeight ||
        images.width != pImpl->inputWidth) {
        throw std::invalid_argument(
            "Backbone expects " + std::to_string(pImpl->inputChannels) + "x" +
            std::to_string(pImpl->inputHeight) + "x" + std::to_string(pImpl->inputWidth) +
            " images, got " + std::to_string(images.channels) + "x" +
            std::to_string(images.height) + "x" + std::to_string(images.width));
    }

    // ========================================================================
    // CREATE INPUT TENSOR
    // ========================================================================

    std::array<int64_t, 4> inputShape = {
        images.batch,
        images.channels,
        images.height,
        images.width
    };

    // CreateTensor needs a non-const pointer
    std::vector<float> inputData = images.data;

    Ort::Value inputOrt = Ort::Value::CreateTensor<float>(
        pImpl->memoryInfo,
        inputData.data(),
        inputData.size(),
        inputShape.data(),
        inputShape.size()
    );

    // ========================================================================
    // RUN INFERENCE
    // ========================================================================

    const char* inputNames[] = {pImpl->config.inputName.c_str()};
    const char* outputNames[] = {pImpl->config.outputName.c_str()};

    try {
        auto outputTensors = pImpl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames, &inputOrt, 1,
            outputNames, 1
        );

        auto outputInfo = outputTensors[0].GetTensorTypeAndShapeInfo();
        auto outputShape = outputInfo.GetShape();
        const float* outputData = outputTensors[0].GetTensorData<float>();

        FeatureMap features;
        features.batch = static_cast<int>(outputShape[0]);
        features.shape.assign(outputShape.begin() + 1, outputShape.end());
        features.data.assign(outputData, outputData + outputInfo.GetElementCount());
        return features;

    } catch (const Ort::Exception& e) {
        std::cerr << "ONNX Runtime error: " << e.what() << std::endl;
        throw std::runtime_error(std::string("Backbone inference failed: ") + e.what());
    }
}
