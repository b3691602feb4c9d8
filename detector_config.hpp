#pragma once

#include <string>

// Model geometry (fixed by the MNIST model's architecture)
constexpr int DIM_BATCH_SIZE = 1;
constexpr int DIM_IMG_SIZE_X = 28;
constexpr int DIM_IMG_SIZE_Y = 28;
constexpr int DIM_PIXEL_SIZE = 1;
constexpr int NUMBER_LENGTH = 10;

// Number of floats in one input tensor: 1 x 28 x 28 x 1
constexpr int INPUT_TENSOR_SIZE = DIM_BATCH_SIZE * DIM_IMG_SIZE_X * DIM_IMG_SIZE_Y * DIM_PIXEL_SIZE;

// Returned by classify() when no class is selected
constexpr int kNoDigit = -1;

enum class SelectionPolicy {
    ExactMatch, // first score exactly equal to 1.0
    ArgMax      // highest score, if at least confidenceThreshold
};

struct DetectorConfig {
    // File name of the model inside the asset directory
    std::string modelAssetName = "mnist.onnx";

    SelectionPolicy policy = SelectionPolicy::ExactMatch;

    // Only used by SelectionPolicy::ArgMax
    float confidenceThreshold = 0.5f;

    // Threads ONNX Runtime may use inside one operator
    int intraOpThreads = 1;

    // Log per-call timing and per-class scores
    bool verbose = false;
};
