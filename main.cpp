#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "digits_detector.hpp"

static void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [-v] [--argmax] <asset_dir> <image>..." << std::endl;
}

// Scales a drawing down to the model's 28x28 input. The detector itself never
// resizes.
static cv::Mat toModelBitmap(const cv::Mat &image) {
  cv::Mat resized;
  cv::resize(image, resized, cv::Size(DIM_IMG_SIZE_X, DIM_IMG_SIZE_Y), 0, 0,
             cv::INTER_AREA);
  return resized;
}

int main(int argc, char *argv[]) {
  DetectorConfig config;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-v") == 0) {
      config.verbose = true;
    } else if (std::strcmp(argv[i], "--argmax") == 0) {
      config.policy = SelectionPolicy::ArgMax;
    } else {
      positional.push_back(argv[i]);
    }
  }
  if (positional.size() < 2) {
    usage(argv[0]);
    return 2;
  }

  // 1. Load the model once
  const std::string assetDir = positional[0];
  std::cout << "Loading Model: " << assetDir << "/" << config.modelAssetName
            << std::endl;
  DigitsDetector detector(assetDir, config);
  if (!detector.isInitialized()) {
    std::cerr << "Error: " << detector.initError() << std::endl;
    return 1;
  }

  // 2. Classify every image, one at a time on this thread
  int status = 0;
  for (size_t i = 1; i < positional.size(); ++i) {
    const std::string &path = positional[i];
    cv::Mat image = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (image.empty()) {
      std::cerr << "Error: Could not read image " << path << std::endl;
      status = 1;
      continue;
    }

    try {
      Prediction prediction = detector.classifyDetailed(toModelBitmap(image));
      std::cout << path << ": " << prediction.digit << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "Error: " << path << ": " << e.what() << std::endl;
      status = 1;
    }
  }
  return status;
}
