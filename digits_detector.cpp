#include "digits_detector.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace {

const char* const TAG = "DigitsDetector: ";

// Engines must consume one 28x28 bitmap and produce one score per digit
void checkEngineShape(const InferenceEngine& engine) {
    if (engine.inputSize() != static_cast<size_t>(INPUT_TENSOR_SIZE) ||
        engine.outputSize() != static_cast<size_t>(NUMBER_LENGTH)) {
        throw ModelLoadError("Engine takes " + std::to_string(engine.inputSize()) + " inputs and gives " +
                             std::to_string(engine.outputSize()) + " scores, need " +
                             std::to_string(INPUT_TENSOR_SIZE) + " and " + std::to_string(NUMBER_LENGTH));
    }
}

double millisSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

void preprocessBitmap(const cv::Mat& bitmap, std::vector<float>* buffer) {
    if (bitmap.empty() || buffer == nullptr) {
        return;
    }

    // The bitmap shape should be 28 x 28, scaling is the caller's job
    if (bitmap.cols != DIM_IMG_SIZE_X || bitmap.rows != DIM_IMG_SIZE_Y) {
        throw std::invalid_argument("Bitmap must be " + std::to_string(DIM_IMG_SIZE_X) + "x" +
                                    std::to_string(DIM_IMG_SIZE_Y) + ", got " +
                                    std::to_string(bitmap.cols) + "x" + std::to_string(bitmap.rows));
    }
    const int channels = bitmap.channels();
    if (bitmap.depth() != CV_8U || (channels != 1 && channels != 3 && channels != 4)) {
        throw std::invalid_argument("Bitmap must be 8-bit gray, BGR or BGRA (type " +
                                    std::to_string(bitmap.type()) + ")");
    }

    // Rewind: every call rewrites all 784 entries from position 0
    buffer->resize(INPUT_TENSOR_SIZE);
    float* out = buffer->data();

    for (int y = 0; y < bitmap.rows; ++y) {
        const uchar* row = bitmap.ptr<uchar>(y);
        for (int x = 0; x < bitmap.cols; ++x) {
            // Channel 0 is blue in BGR(A) and the intensity itself in gray.
            // Black strokes become 255, white background becomes 0.
            uchar blue = row[x * channels];
            *out++ = static_cast<float>(0xff - blue);
        }
    }
}

int selectDigit(const std::vector<float>& scores, SelectionPolicy policy, float confidenceThreshold) {
    if (policy == SelectionPolicy::ExactMatch) {
        for (size_t i = 0; i < scores.size(); ++i) {
            if (scores[i] == 1.0f) {
                return static_cast<int>(i);
            }
        }
        return kNoDigit;
    }

    int best = kNoDigit;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (best == kNoDigit || scores[i] > scores[best]) {
            best = static_cast<int>(i);
        }
    }
    if (best == kNoDigit || scores[best] < confidenceThreshold) {
        return kNoDigit;
    }
    return best;
}

DigitsDetector::DigitsDetector(const std::string& assetDir, DetectorConfig cfg)
    : config(std::move(cfg)) {
    load(assetDir, OnnxInferenceEngine::factory(config));
}

DigitsDetector::DigitsDetector(const std::string& assetDir, const EngineFactory& factory,
                               DetectorConfig cfg)
    : config(std::move(cfg)) {
    load(assetDir, factory);
}

DigitsDetector::DigitsDetector(std::unique_ptr<InferenceEngine> loaded, DetectorConfig cfg)
    : config(std::move(cfg)), engine(std::move(loaded)) {
    if (!engine) {
        loadError = "no inference engine supplied";
        return;
    }
    try {
        checkEngineShape(*engine);
    } catch (const ModelLoadError& e) {
        engine.reset();
        loadError = e.what();
        std::cerr << TAG << "Rejected inference engine: " << loadError << std::endl;
        return;
    }

    inputBuffer.assign(INPUT_TENSOR_SIZE, 0.0f);
    mnistOutput.assign(NUMBER_LENGTH, 0.0f);
}

std::unique_ptr<DigitsDetector> DigitsDetector::create(const std::string& assetDir, DetectorConfig config) {
    auto detector = std::make_unique<DigitsDetector>(assetDir, std::move(config));
    if (!detector->isInitialized()) {
        throw ModelLoadError(detector->initError());
    }
    return detector;
}

void DigitsDetector::load(const std::string& assetDir, const EngineFactory& factory) {
    std::string path = assetDir.empty() ? config.modelAssetName : assetDir + "/" + config.modelAssetName;
    try {
        engine = factory(MappedModel::open(path));
        if (!engine) {
            throw ModelLoadError("Engine factory returned no engine for '" + path + "'");
        }
        checkEngineShape(*engine);
    } catch (const std::exception& e) {
        // No retry and no fallback model: classify() reports the failure
        engine.reset();
        loadError = e.what();
        std::cerr << TAG << "Error loading the model file: " << loadError << std::endl;
        return;
    }

    inputBuffer.assign(INPUT_TENSOR_SIZE, 0.0f);
    mnistOutput.assign(NUMBER_LENGTH, 0.0f);
}

int DigitsDetector::classify(const cv::Mat& bitmap) {
    return classifyDetailed(bitmap).digit;
}

Prediction DigitsDetector::classifyDetailed(const cv::Mat& bitmap) {
    if (!engine) {
        std::cerr << TAG << "Image classifier has not been initialized; Skipped." << std::endl;
        throw ClassifierNotInitialized("Image classifier has not been initialized: " + loadError);
    }
    // An empty bitmap would leave the previous call's pixels in the buffer
    if (bitmap.empty()) {
        throw std::invalid_argument("Cannot classify an empty bitmap");
    }

    auto start = std::chrono::steady_clock::now();
    preprocessBitmap(bitmap, &inputBuffer);
    if (config.verbose) {
        std::cout << TAG << "Time cost to put values into buffer: " << millisSince(start) << " ms" << std::endl;
    }

    start = std::chrono::steady_clock::now();
    runInference();

    Prediction prediction;
    prediction.inferenceMillis = millisSince(start);
    prediction.digit = postprocess();
    prediction.scores = mnistOutput;
    if (config.verbose) {
        std::cout << TAG << "Inference took " << prediction.inferenceMillis << " ms, digit "
                  << prediction.digit << std::endl;
    }
    return prediction;
}

// Run the input buffer through the model and load the result in mnistOutput
void DigitsDetector::runInference() {
    engine->run(inputBuffer, mnistOutput);
}

int DigitsDetector::postprocess() const {
    if (config.verbose) {
        for (size_t i = 0; i < mnistOutput.size(); ++i) {
            std::cout << TAG << "Output for " << i << ": " << mnistOutput[i] << std::endl;
        }
    }
    return selectDigit(mnistOutput, config.policy, config.confidenceThreshold);
}
