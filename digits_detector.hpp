#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "detector_config.hpp"
#include "inference.hpp"

// Thrown by classify() when the model failed to load at construction
class ClassifierNotInitialized : public std::logic_error {
public:
    explicit ClassifierNotInitialized(const std::string& what) : std::logic_error(what) {}
};

struct Prediction {
    int digit = kNoDigit;
    std::vector<float> scores;
    double inferenceMillis = 0.0;
};

// Writes 255 - blue for every pixel of a 28x28 8-bit bitmap into `buffer`,
// row-major, after rewinding it to 784 entries.
// An empty bitmap or a null buffer is a no-op; any other size or type throws
// std::invalid_argument.
void preprocessBitmap(const cv::Mat& bitmap, std::vector<float>* buffer);

// Maps the 10 output scores to a digit, or kNoDigit.
int selectDigit(const std::vector<float>& scores,
                SelectionPolicy policy = SelectionPolicy::ExactMatch,
                float confidenceThreshold = 0.5f);

class DigitsDetector {
public:
    // Loads <assetDir>/<config.modelAssetName> with ONNX Runtime.
    // Never throws on a load failure: the detector is left uninitialized.
    explicit DigitsDetector(const std::string& assetDir, DetectorConfig config = DetectorConfig());

    // Same, with a custom engine built from the mapped asset
    DigitsDetector(const std::string& assetDir, const EngineFactory& factory,
                   DetectorConfig config = DetectorConfig());

    // Uses an engine that is already loaded (nullptr leaves it uninitialized)
    explicit DigitsDetector(std::unique_ptr<InferenceEngine> engine,
                            DetectorConfig config = DetectorConfig());

    // Fail-fast variant: throws ModelLoadError instead of returning an
    // uninitialized detector.
    static std::unique_ptr<DigitsDetector> create(const std::string& assetDir,
                                                  DetectorConfig config = DetectorConfig());

    bool isInitialized() const { return engine != nullptr; }

    // Reason the model failed to load, empty when initialized
    const std::string& initError() const { return loadError; }

    // Identifies the digit drawn on a 28x28 bitmap (kNoDigit if none).
    // Must not be called concurrently on one instance.
    int classify(const cv::Mat& bitmap);

    Prediction classifyDetailed(const cv::Mat& bitmap);

    // Input tensor as filled by the last classify() call
    const std::vector<float>& inputTensor() const { return inputBuffer; }

private:
    void load(const std::string& assetDir, const EngineFactory& factory);
    void runInference();
    int postprocess() const;

    DetectorConfig config;
    std::unique_ptr<InferenceEngine> engine;
    std::string loadError;

    // Reused across calls, never shared between threads
    std::vector<float> inputBuffer;
    std::vector<float> mnistOutput;
};
