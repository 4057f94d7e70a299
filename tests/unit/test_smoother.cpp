#include <gtest/gtest.h>
#include "haptics/smoother.hpp"
#include "haptics/threshold_calibrator.hpp"
#include "utils/error_handler.hpp"
#include <cmath>

using namespace haptick::haptics;
using haptick::audio::FeatureSeries;

TEST(SmootherTest, CenteredMovingAverageShrinksAtEdges) {
    Smoother smoother(3);
    auto result = smoother.smooth({0.0f, 3.0f, 6.0f, 9.0f});

    ASSERT_EQ(result.size(), 4u);
    EXPECT_FLOAT_EQ(result[0], 1.5f);
    EXPECT_FLOAT_EQ(result[1], 3.0f);
    EXPECT_FLOAT_EQ(result[2], 6.0f);
    EXPECT_FLOAT_EQ(result[3], 7.5f);
}

TEST(SmootherTest, DefaultWindowIsEleven) {
    Smoother smoother;
    EXPECT_EQ(smoother.windowSize(), 11u);

    std::vector<float> values(21, 0.0f);
    values[10] = 11.0f;
    auto result = smoother.smooth(values);

    // The spike spreads evenly over the five neighbours on each side
    for (size_t i = 0; i < result.size(); ++i) {
        if (i >= 5 && i <= 15) {
            EXPECT_FLOAT_EQ(result[i], 1.0f) << "index " << i;
        } else {
            EXPECT_FLOAT_EQ(result[i], 0.0f) << "index " << i;
        }
    }
}

TEST(SmootherTest, ConstantInputIsUnchanged) {
    Smoother smoother(11);
    auto result = smoother.smooth(std::vector<float>(7, 0.42f));
    ASSERT_EQ(result.size(), 7u);
    for (float value : result) {
        EXPECT_NEAR(value, 0.42f, 1e-6f);
    }
}

TEST(SmootherTest, WindowOfOneIsIdentity) {
    Smoother smoother(1);
    std::vector<float> values = {0.1f, 0.9f, 0.3f};
    auto result = smoother.smooth(values);
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_FLOAT_EQ(result[i], values[i]);
    }
}

TEST(SmootherTest, EmptyInputStaysEmpty) {
    Smoother smoother;
    EXPECT_TRUE(smoother.smooth(std::vector<float>()).empty());
}

TEST(SmootherTest, EvenOrZeroWindowRejected) {
    EXPECT_THROW(Smoother(0), haptick::utils::ConfigurationException);
    EXPECT_THROW(Smoother(4), haptick::utils::ConfigurationException);
    EXPECT_NO_THROW(Smoother(5));
}

TEST(SmootherTest, SmoothsEverySeries) {
    FeatureSeries series;
    series.set(FeatureSeries::RMS, {0.0f, 3.0f, 0.0f});
    series.set(FeatureSeries::SPECTRAL_CENTROID, {300.0f, 0.0f, 300.0f});

    FeatureSeries result = Smoother(3).smooth(series);
    EXPECT_EQ(result.length(), 3u);
    EXPECT_FLOAT_EQ(result.get(FeatureSeries::RMS)[1], 1.0f);
    EXPECT_FLOAT_EQ(result.get(FeatureSeries::SPECTRAL_CENTROID)[1], 200.0f);
}

TEST(ThresholdCalibratorTest, MeanPlusHalfStdDev) {
    ThresholdCalibrator calibrator;
    EXPECT_FLOAT_EQ(calibrator.k(), 0.5f);

    float threshold = calibrator.calibrate({1.0f, 2.0f, 3.0f, 4.0f});
    EXPECT_NEAR(threshold, 2.5f + 0.5f * std::sqrt(1.25f), 1e-5f);
}

TEST(ThresholdCalibratorTest, UsesPopulationStdDev) {
    std::vector<float> values = {2.0f, 4.0f, 4.0f, 4.0f, 5.0f, 5.0f, 7.0f, 9.0f};
    double mean = ThresholdCalibrator::mean(values);
    EXPECT_DOUBLE_EQ(mean, 5.0);
    EXPECT_DOUBLE_EQ(ThresholdCalibrator::populationStdDev(values, mean), 2.0);

    EXPECT_NEAR(ThresholdCalibrator(1.0f).calibrate(values), 7.0f, 1e-6f);
    EXPECT_NEAR(ThresholdCalibrator(0.0f).calibrate(values), 5.0f, 1e-6f);
}

TEST(ThresholdCalibratorTest, ConstantInputGivesThatConstant) {
    EXPECT_FLOAT_EQ(ThresholdCalibrator().calibrate(std::vector<float>(10, 0.3f)), 0.3f);
    EXPECT_FLOAT_EQ(ThresholdCalibrator().calibrate(std::vector<float>(10, 0.0f)), 0.0f);
}

TEST(ThresholdCalibratorTest, EmptyInputGivesZero) {
    EXPECT_FLOAT_EQ(ThresholdCalibrator().calibrate({}), 0.0f);
}
