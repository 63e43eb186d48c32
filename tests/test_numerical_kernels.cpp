/**
 * Unit Tests for the graphical analysis numerical kernels
 *
 * Covers the cumulative trapezoidal integral, the least-squares line fit and
 * the threshold index lookup.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

#include "../src/common/PetKineticsExceptions.h"
#include "../src/graphical_analysis/NumericalKernels.h"

using namespace petkinetics;
using namespace petkinetics::graphical;

class NumericalKernelsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tolerance = 1e-9;
        frame_times = {0.0, 0.5, 1.0, 2.0, 4.0, 8.0, 15.0};
    }

    double tolerance;
    std::vector<double> frame_times;
};

// ===== Cumulative integral =====

TEST_F(NumericalKernelsTest, TwoPointTrapezoid) {
    auto integral = CumulativeTrapezoidalIntegral({0.0, 1.0}, {2.0, 4.0});

    ASSERT_EQ(integral.size(), 2u);
    EXPECT_DOUBLE_EQ(integral[0], 0.0);
    EXPECT_NEAR(integral[1], 3.0, tolerance);
}

TEST_F(NumericalKernelsTest, ZeroValuesStayAtInitial) {
    std::vector<double> zeros(frame_times.size(), 0.0);
    auto integral = CumulativeTrapezoidalIntegral(frame_times, zeros, 2.5);

    ASSERT_EQ(integral.size(), frame_times.size());
    for (double value : integral) {
        EXPECT_DOUBLE_EQ(value, 2.5);
    }
}

TEST_F(NumericalKernelsTest, ConstantPositiveValuesGrowMonotonically) {
    std::vector<double> constant(frame_times.size(), 3.0);
    auto integral = CumulativeTrapezoidalIntegral(frame_times, constant, 1.0);

    EXPECT_DOUBLE_EQ(integral[0], 1.0);
    for (size_t i = 1; i < integral.size(); ++i) {
        EXPECT_GT(integral[i], integral[i - 1]);
        // Exact for a constant integrand
        EXPECT_NEAR(integral[i], 1.0 + 3.0 * frame_times[i], tolerance);
    }
}

TEST_F(NumericalKernelsTest, ConstantNegativeValuesDecreaseMonotonically) {
    std::vector<double> constant(frame_times.size(), -2.0);
    auto integral = CumulativeTrapezoidalIntegral(frame_times, constant);

    for (size_t i = 1; i < integral.size(); ++i) {
        EXPECT_LT(integral[i], integral[i - 1]);
    }
}

TEST_F(NumericalKernelsTest, LinearIntegrandIsExact) {
    // Trapezoid rule is exact for f(t) = 2t + 1: F(t) = t^2 + t
    std::vector<double> values;
    for (double t : frame_times) {
        values.push_back(2.0 * t + 1.0);
    }
    auto integral = CumulativeTrapezoidalIntegral(frame_times, values);

    for (size_t i = 0; i < frame_times.size(); ++i) {
        double t = frame_times[i];
        EXPECT_NEAR(integral[i], t * t + t, tolerance);
    }
}

TEST_F(NumericalKernelsTest, DecreasingTimesGiveSignedArea) {
    auto integral = CumulativeTrapezoidalIntegral({1.0, 0.0}, {2.0, 2.0});

    ASSERT_EQ(integral.size(), 2u);
    EXPECT_NEAR(integral[1], -2.0, tolerance);
}

TEST_F(NumericalKernelsTest, SingleSampleIntegral) {
    auto integral = CumulativeTrapezoidalIntegral({3.0}, {7.0}, 4.0);

    ASSERT_EQ(integral.size(), 1u);
    EXPECT_DOUBLE_EQ(integral[0], 4.0);
}

TEST_F(NumericalKernelsTest, IntegralRejectsLengthMismatch) {
    EXPECT_THROW(CumulativeTrapezoidalIntegral({0.0, 1.0, 2.0}, {1.0, 2.0}),
                 ShapeMismatchException);
}

// ===== Line fit =====

TEST_F(NumericalKernelsTest, DesignMatrixLayout) {
    auto design = MakeLineFitDesignMatrix({4.0, 5.0, 6.0});

    ASSERT_EQ(design.rows(), 3u);
    ASSERT_EQ(design.cols(), 2u);
    EXPECT_DOUBLE_EQ(design(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(design(2, 0), 6.0);
    for (unsigned int row = 0; row < 3; ++row) {
        EXPECT_DOUBLE_EQ(design(row, 1), 1.0);
    }
}

TEST_F(NumericalKernelsTest, FitPerfectLine) {
    LineFit fit = FitLineToDataUsingLLS({0.0, 1.0, 2.0, 3.0},
                                        {1.0, 3.0, 5.0, 7.0});

    EXPECT_NEAR(fit.slope, 2.0, tolerance);
    EXPECT_NEAR(fit.intercept, 1.0, tolerance);
}

TEST_F(NumericalKernelsTest, FitTwoPoints) {
    LineFit fit = FitLineToDataUsingLLS({1.0, 3.0}, {5.0, 1.0});

    EXPECT_NEAR(fit.slope, -2.0, tolerance);
    EXPECT_NEAR(fit.intercept, 7.0, tolerance);
}

TEST_F(NumericalKernelsTest, FitNoisyDataMatchesClosedForm) {
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0};
    std::vector<double> y = {0.9, 3.2, 4.8, 7.1, 9.0};

    // Closed-form OLS for comparison
    double n = static_cast<double>(x.size());
    double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sx += x[i];
        sy += y[i];
        sxx += x[i] * x[i];
        sxy += x[i] * y[i];
    }
    double expected_slope = (n * sxy - sx * sy) / (n * sxx - sx * sx);
    double expected_intercept = (sy - expected_slope * sx) / n;

    LineFit fit = FitLineToDataUsingLLS(x, y);

    EXPECT_NEAR(fit.slope, expected_slope, tolerance);
    EXPECT_NEAR(fit.intercept, expected_intercept, tolerance);
}

TEST_F(NumericalKernelsTest, FitPropagatesNonFiniteSamples) {
    double nan = std::nan("");
    LineFit fit = FitLineToDataUsingLLS({0.0, 1.0, nan, 3.0},
                                        {1.0, 3.0, 5.0, 7.0});

    EXPECT_TRUE(std::isnan(fit.slope));
    EXPECT_TRUE(std::isnan(fit.intercept));

    double inf = std::numeric_limits<double>::infinity();
    LineFit inf_fit = FitLineToDataUsingLLS({0.0, 1.0, 2.0}, {1.0, inf, 5.0});
    EXPECT_FALSE(std::isfinite(inf_fit.slope) && std::isfinite(inf_fit.intercept));
}

TEST_F(NumericalKernelsTest, FitConstantXGivesMinimumNormSolution) {
    // [x | 1] has rank one; the minimum-norm solution of 2a + b = mean(y)
    // is mean(y) * (2, 1) / 5
    LineFit fit = FitLineToDataUsingLLS({2.0, 2.0, 2.0}, {1.0, 3.0, 5.0});

    EXPECT_NEAR(fit.slope, 1.2, 1e-8);
    EXPECT_NEAR(fit.intercept, 0.6, 1e-8);
    EXPECT_NEAR(2.0 * fit.slope + fit.intercept, 3.0, 1e-8);
}

TEST_F(NumericalKernelsTest, FitRejectsTooFewPoints) {
    EXPECT_THROW(FitLineToDataUsingLLS({1.0}, {2.0}),
                 InsufficientFitPointsException);
    EXPECT_THROW(FitLineToDataUsingLLS({}, {}), InsufficientFitPointsException);
}

TEST_F(NumericalKernelsTest, FitRejectsLengthMismatch) {
    EXPECT_THROW(FitLineToDataUsingLLS({0.0, 1.0, 2.0}, {1.0, 2.0}),
                 ShapeMismatchException);
}

// ===== Threshold index =====

TEST_F(NumericalKernelsTest, ThresholdBetweenSamples) {
    EXPECT_EQ(GetIndexFromThreshold({0.0, 1.0, 2.0, 3.0}, 1.5), 2);
}

TEST_F(NumericalKernelsTest, ThresholdOnSample) {
    EXPECT_EQ(GetIndexFromThreshold({0.0, 1.0, 2.0, 3.0}, 2.0), 2);
}

TEST_F(NumericalKernelsTest, ThresholdBeforeFirstSample) {
    EXPECT_EQ(GetIndexFromThreshold({0.0, 1.0, 2.0, 3.0}, -4.0), 0);
}

TEST_F(NumericalKernelsTest, ThresholdAtLastSample) {
    EXPECT_EQ(GetIndexFromThreshold({0.0, 1.0, 2.0}, 2.0), 2);
}

TEST_F(NumericalKernelsTest, ThresholdBeyondAllSamples) {
    EXPECT_EQ(GetIndexFromThreshold({0.0, 1.0, 2.0}, 5.0), -1);
    EXPECT_EQ(GetIndexFromThreshold({}, 0.0), -1);
}

// ===== Helpers =====

TEST_F(NumericalKernelsTest, ElementwiseDivideFollowsIeee) {
    auto quotient = ElementwiseDivide({1.0, 0.0, 6.0}, {0.0, 0.0, 3.0});

    ASSERT_EQ(quotient.size(), 3u);
    EXPECT_TRUE(std::isinf(quotient[0]));
    EXPECT_TRUE(std::isnan(quotient[1]));
    EXPECT_DOUBLE_EQ(quotient[2], 2.0);
}

TEST_F(NumericalKernelsTest, TailFromIndex) {
    std::vector<double> values = {1.0, 2.0, 3.0, 4.0};

    EXPECT_EQ(TailFrom(values, 0), values);
    EXPECT_EQ(TailFrom(values, 2), (std::vector<double>{3.0, 4.0}));
    EXPECT_TRUE(TailFrom(values, 4).empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
