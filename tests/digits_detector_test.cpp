#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include <sys/stat.h>

#include "digits_detector.hpp"
#include "fake_engine.hpp"

namespace {

cv::Mat gray(uchar value) {
    return cv::Mat(DIM_IMG_SIZE_Y, DIM_IMG_SIZE_X, CV_8UC1, cv::Scalar(value));
}

// Asset directory holding a model file with the given contents
std::string assetDirWith(const std::string& dirName, const std::string& contents) {
    std::string dir = ::testing::TempDir() + dirName;
    ::mkdir(dir.c_str(), 0755);
    std::ofstream out(dir + "/mnist.onnx", std::ios::binary | std::ios::trunc);
    out << contents;
    return dir;
}

// Factory handing out a FakeEngine and remembering how many bytes it was given
EngineFactory fakeFactory(FakeEngine** created, size_t* mappedBytes,
                          const std::vector<std::vector<float>>& outputs) {
    return [=](MappedModel model) -> std::unique_ptr<InferenceEngine> {
        *mappedBytes = model.size();
        auto engine = makeFake(outputs);
        *created = engine.get();
        return engine;
    };
}

} // namespace

TEST(DigitsDetectorTest, ClassifiesWithInjectedEngine) {
    auto engine = makeFake({oneHot(3)});
    FakeEngine* fake = engine.get();
    DigitsDetector detector(std::move(engine));

    ASSERT_TRUE(detector.isInitialized());
    EXPECT_EQ(detector.classify(gray(0)), 3);
    ASSERT_EQ(fake->inputs.size(), 1u);
    EXPECT_EQ(fake->inputs[0], std::vector<float>(INPUT_TENSOR_SIZE, 255.0f));
}

TEST(DigitsDetectorTest, NoExactOneGivesSentinel) {
    DigitsDetector detector(makeFake({std::vector<float>(NUMBER_LENGTH, 0.1f)}));
    EXPECT_EQ(detector.classify(gray(0)), kNoDigit);
}

TEST(DigitsDetectorTest, SecondCallDoesNotSeeFirstBitmap) {
    auto engine = makeFake({oneHot(1), oneHot(8)});
    FakeEngine* fake = engine.get();
    DigitsDetector detector(std::move(engine));

    cv::Mat stroke = gray(255);
    stroke.col(14).setTo(cv::Scalar(0));

    EXPECT_EQ(detector.classify(stroke), 1);
    EXPECT_EQ(detector.classify(gray(255)), 8);

    ASSERT_EQ(fake->inputs.size(), 2u);
    EXPECT_EQ(fake->inputs[0][14], 255.0f);
    EXPECT_EQ(fake->inputs[1], std::vector<float>(INPUT_TENSOR_SIZE, 0.0f));
    EXPECT_EQ(detector.inputTensor().size(), static_cast<size_t>(INPUT_TENSOR_SIZE));
}

TEST(DigitsDetectorTest, DetailedPredictionCarriesScores) {
    std::vector<float> scores = oneHot(9);
    DetectorConfig config;
    config.verbose = true;
    DigitsDetector detector(makeFake({scores}), config);

    Prediction prediction = detector.classifyDetailed(gray(0));
    EXPECT_EQ(prediction.digit, 9);
    EXPECT_EQ(prediction.scores, scores);
    EXPECT_GE(prediction.inferenceMillis, 0.0);
}

TEST(DigitsDetectorTest, ArgMaxPolicyFromConfig) {
    std::vector<float> scores(NUMBER_LENGTH, 0.0f);
    scores[6] = 0.97f;
    DetectorConfig config;
    config.policy = SelectionPolicy::ArgMax;
    config.confidenceThreshold = 0.9f;
    DigitsDetector detector(makeFake({scores}), config);

    EXPECT_EQ(detector.classify(gray(0)), 6);
}

TEST(DigitsDetectorTest, RejectsBadBitmaps) {
    DigitsDetector detector(makeFake({oneHot(0)}));
    EXPECT_THROW(detector.classify(cv::Mat()), std::invalid_argument);
    EXPECT_THROW(detector.classify(cv::Mat(10, 10, CV_8UC1, cv::Scalar(0))), std::invalid_argument);
}

TEST(DigitsDetectorTest, LoadsModelThroughFactory) {
    std::string dir = assetDirWith("detector_ok", "not really a model");
    FakeEngine* fake = nullptr;
    size_t mappedBytes = 0;
    DigitsDetector detector(dir, fakeFactory(&fake, &mappedBytes, {oneHot(5)}));

    ASSERT_TRUE(detector.isInitialized());
    EXPECT_TRUE(detector.initError().empty());
    EXPECT_EQ(mappedBytes, std::string("not really a model").size());
    EXPECT_EQ(detector.classify(gray(0)), 5);
    ASSERT_NE(fake, nullptr);
    EXPECT_EQ(fake->inputs.size(), 1u);
}

TEST(DigitsDetectorTest, MissingAssetLeavesDetectorUninitialized) {
    FakeEngine* fake = nullptr;
    size_t mappedBytes = 0;
    std::unique_ptr<DigitsDetector> detector;
    ASSERT_NO_THROW(detector = std::make_unique<DigitsDetector>(::testing::TempDir() + "no_such_dir",
                                                                fakeFactory(&fake, &mappedBytes, {oneHot(5)})));

    EXPECT_FALSE(detector->isInitialized());
    EXPECT_EQ(fake, nullptr);
    EXPECT_NE(detector->initError().find("mnist.onnx"), std::string::npos);
    EXPECT_THROW(detector->classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, FactoryFailureLeavesDetectorUninitialized) {
    std::string dir = assetDirWith("detector_factory_fails", "bytes");
    EngineFactory failing = [](MappedModel) -> std::unique_ptr<InferenceEngine> {
        throw ModelLoadError("unsupported model");
    };
    DigitsDetector detector(dir, failing);

    EXPECT_FALSE(detector.isInitialized());
    EXPECT_EQ(detector.initError(), "unsupported model");
    EXPECT_THROW(detector.classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, NullEngineIsUninitialized) {
    DigitsDetector detector{std::unique_ptr<InferenceEngine>()};
    EXPECT_FALSE(detector.isInitialized());
    EXPECT_THROW(detector.classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, RejectsEngineWithWrongTensorSizes) {
    DigitsDetector wrongInput(std::make_unique<FakeEngine>(std::vector<std::vector<float>>{oneHot(2)},
                                                           INPUT_TENSOR_SIZE * 3, NUMBER_LENGTH));
    EXPECT_FALSE(wrongInput.isInitialized());
    EXPECT_NE(wrongInput.initError().find("2352"), std::string::npos);
    EXPECT_THROW(wrongInput.classify(gray(0)), ClassifierNotInitialized);

    DigitsDetector wrongOutput(std::make_unique<FakeEngine>(std::vector<std::vector<float>>{oneHot(2)},
                                                            INPUT_TENSOR_SIZE, 1000));
    EXPECT_FALSE(wrongOutput.isInitialized());
    EXPECT_THROW(wrongOutput.classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, FactoryEngineWithWrongTensorSizesIsRejected) {
    std::string dir = assetDirWith("detector_wrong_shape", "bytes");
    EngineFactory wrongShape = [](MappedModel) -> std::unique_ptr<InferenceEngine> {
        return std::make_unique<FakeEngine>(std::vector<std::vector<float>>{oneHot(4)},
                                            INPUT_TENSOR_SIZE, 1);
    };
    DigitsDetector detector(dir, wrongShape);

    EXPECT_FALSE(detector.isInitialized());
    EXPECT_FALSE(detector.initError().empty());
    EXPECT_THROW(detector.classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, CorruptModelIsRejectedByOnnxRuntime) {
    std::string dir = assetDirWith("detector_corrupt", std::string(512, '\x7f'));
    std::unique_ptr<DigitsDetector> detector;
    ASSERT_NO_THROW(detector = std::make_unique<DigitsDetector>(dir));

    EXPECT_FALSE(detector->isInitialized());
    EXPECT_FALSE(detector->initError().empty());
    EXPECT_THROW(detector->classify(gray(0)), ClassifierNotInitialized);
}

TEST(DigitsDetectorTest, CreateFailsFast) {
    EXPECT_THROW(DigitsDetector::create(::testing::TempDir() + "no_such_dir"), ModelLoadError);
}
