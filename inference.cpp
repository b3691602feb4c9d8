#include "inference.hpp"

#include <stdexcept>
#include <utility>

namespace {

// Dynamic dimensions (-1) are pinned to 1: we always feed a single image.
std::vector<int64_t> concreteShape(std::vector<int64_t> shape) {
    for (auto& dim : shape) {
        if (dim < 0) dim = 1;
    }
    return shape;
}

size_t elementCount(const std::vector<int64_t>& shape) {
    size_t count = 1;
    for (int64_t dim : shape) count *= static_cast<size_t>(dim);
    return count;
}

std::string shapeToString(const std::vector<int64_t>& shape) {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "]";
}

} // namespace

OnnxInferenceEngine::OnnxInferenceEngine(MappedModel mapped, const DetectorConfig& config)
    : model(std::move(mapped)),
      env(ORT_LOGGING_LEVEL_WARNING, "DigitsDetector") {

    const std::string source = model.path();
    try {
        Ort::SessionOptions options;
        options.SetIntraOpNumThreads(config.intraOpThreads);
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        // Build the session from the mapped region instead of the file path
        session = Ort::Session(env, model.data(), model.size(), options);

        Ort::AllocatorWithDefaultOptions allocator;
        inputName = session.GetInputNameAllocated(0, allocator).get();
        outputName = session.GetOutputNameAllocated(0, allocator).get();

        inputShape = concreteShape(
            session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape());
        outputShape = concreteShape(
            session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape());

        memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    } catch (const Ort::Exception& e) {
        throw ModelLoadError("ONNX Runtime rejected model '" + source + "': " + e.what());
    }

    inputCount = elementCount(inputShape);
    outputCount = elementCount(outputShape);

    // Tensor sizes must match the bitmap layout and the digit classes
    if (inputCount != static_cast<size_t>(INPUT_TENSOR_SIZE)) {
        throw ModelLoadError("Model '" + source + "' expects input " + shapeToString(inputShape) +
                             ", need " + std::to_string(INPUT_TENSOR_SIZE) + " floats");
    }
    if (outputCount != static_cast<size_t>(NUMBER_LENGTH)) {
        throw ModelLoadError("Model '" + source + "' produces output " + shapeToString(outputShape) +
                             ", need " + std::to_string(NUMBER_LENGTH) + " scores");
    }
}

void OnnxInferenceEngine::run(const std::vector<float>& input, std::vector<float>& output) {
    if (input.size() != inputCount) {
        throw std::invalid_argument("Input tensor has " + std::to_string(input.size()) +
                                    " floats, model expects " + std::to_string(inputCount));
    }
    output.resize(outputCount);

    // CreateTensor wraps our buffers without copying (needs non-const pointer)
    Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
        memoryInfo, const_cast<float*>(input.data()), input.size(),
        inputShape.data(), inputShape.size());
    Ort::Value outputTensor = Ort::Value::CreateTensor<float>(
        memoryInfo, output.data(), output.size(),
        outputShape.data(), outputShape.size());

    const char* inputNames[] = {inputName.c_str()};
    const char* outputNames[] = {outputName.c_str()};

    // The session writes the scores straight into `output`
    session.Run(Ort::RunOptions{nullptr},
                inputNames, &inputTensor, 1,
                outputNames, &outputTensor, 1);
}

EngineFactory OnnxInferenceEngine::factory(const DetectorConfig& config) {
    return [config](MappedModel mapped) -> std::unique_ptr<InferenceEngine> {
        return std::make_unique<OnnxInferenceEngine>(std::move(mapped), config);
    };
}
