#pragma once

#include <onnxruntime_cxx_api.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "detector_config.hpp"
#include "mapped_model.hpp"

// One forward pass of a fixed, pre-trained graph.
// The detector only talks to this interface, so tests can swap in a fake.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    // Runs the graph on `input` and overwrites `output` with the scores.
    virtual void run(const std::vector<float>& input, std::vector<float>& output) = 0;

    virtual size_t inputSize() const = 0;
    virtual size_t outputSize() const = 0;
};

// Builds an engine bound to a mapped model artifact
using EngineFactory = std::function<std::unique_ptr<InferenceEngine>(MappedModel)>;

// ONNX Runtime implementation. The session is created straight from the
// mapped bytes, and the mapping is kept alive for as long as the session.
class OnnxInferenceEngine : public InferenceEngine {
public:
    OnnxInferenceEngine(MappedModel model, const DetectorConfig& config);

    void run(const std::vector<float>& input, std::vector<float>& output) override;

    size_t inputSize() const override { return inputCount; }
    size_t outputSize() const override { return outputCount; }

    // Factory for DigitsDetector, throws ModelLoadError on any failure
    static EngineFactory factory(const DetectorConfig& config);

private:
    // ONNX Runtime Resources
    MappedModel model;
    Ort::Env env;
    Ort::Session session{nullptr};
    Ort::MemoryInfo memoryInfo{nullptr};

    // Names are read from the model, not hardcoded per export
    std::string inputName;
    std::string outputName;
    std::vector<int64_t> inputShape;
    std::vector<int64_t> outputShape;
    size_t inputCount = 0;
    size_t outputCount = 0;
};
