/**
 * @file test_error_handling.cpp
 * @brief Tests for the PetKinetics exception hierarchy
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "../src/common/PetKineticsExceptions.h"
#include "../src/graphical_analysis/GraphicalMethods.h"

using namespace petkinetics;

TEST(ErrorHandlingTest, InvalidMethodNameCarriesName) {
    InvalidMethodNameException e("bogus");

    EXPECT_EQ(e.GetMethodName(), "bogus");
    EXPECT_EQ(e.GetCategory(), PetKineticsException::Category::Analysis);
    EXPECT_EQ(e.GetSeverity(), PetKineticsException::Severity::Error);
    EXPECT_NE(e.GetMessage().find("'bogus'"), std::string::npos);
    EXPECT_FALSE(e.GetRecoverySuggestions().empty());
}

TEST(ErrorHandlingTest, ShapeMismatchDescribesBothShapes) {
    ShapeMismatchException e("PatlakAnalysis", 12, 13);

    std::string message = e.what();
    EXPECT_NE(message.find("PatlakAnalysis"), std::string::npos);
    EXPECT_NE(message.find("length 12"), std::string::npos);
    EXPECT_NE(message.find("length 13"), std::string::npos);
    EXPECT_EQ(e.GetCategory(), PetKineticsException::Category::InputData);
}

TEST(ErrorHandlingTest, EmptyFitWindowContext) {
    EmptyFitWindowException e(90.0, 60.0);

    EXPECT_DOUBLE_EQ(e.GetThresholdTime(), 90.0);
    EXPECT_DOUBLE_EQ(e.GetLastFrameTime(), 60.0);
    EXPECT_NE(e.GetDetailedContext().find("90"), std::string::npos);
    EXPECT_EQ(e.GetCategory(), PetKineticsException::Category::Fitting);
}

TEST(ErrorHandlingTest, FormattedReportContainsAllSections) {
    OutOfBoundsFrameException e(3, 12, 8);

    std::string report = e.GetFormattedReport();
    EXPECT_NE(report.find("=== PetKinetics Error Report ==="), std::string::npos);
    EXPECT_NE(report.find("Severity: ERROR"), std::string::npos);
    EXPECT_NE(report.find("Category: DATA_PREPARATION"), std::string::npos);
    EXPECT_NE(report.find("Component: ImageDerivedInputFunction"), std::string::npos);
    EXPECT_NE(report.find("Context: Requested frames [3, 12] of 8 available"),
              std::string::npos);
    EXPECT_NE(report.find("Recovery Suggestions:"), std::string::npos);
    EXPECT_NE(report.find("  1. "), std::string::npos);
}

TEST(ErrorHandlingTest, ConfigurationExceptionMessage) {
    ConfigurationException e("percentile", "150", "0 to 100");

    EXPECT_EQ(std::string(e.what()),
              "Invalid configuration parameter 'percentile' with value '150' "
              "(expected: 0 to 100)");
    EXPECT_EQ(PetKineticsException::CategoryToString(e.GetCategory()),
              "CONFIGURATION");
}

TEST(ErrorHandlingTest, HierarchyIsPolymorphic) {
    std::vector<std::unique_ptr<PetKineticsException>> exceptions;
    exceptions.push_back(std::make_unique<InvalidMethodNameException>("patlak2"));
    exceptions.push_back(std::make_unique<ShapeMismatchException>("Fit", 2, 3));
    exceptions.push_back(std::make_unique<OutOfBoundsFrameException>(-1, 4, 10));
    exceptions.push_back(std::make_unique<EmptyFitWindowException>(5.0, 4.0));
    exceptions.push_back(std::make_unique<InsufficientFitPointsException>(1));
    exceptions.push_back(std::make_unique<ConfigurationException>("a", "b"));

    for (const auto& exception : exceptions) {
        EXPECT_FALSE(exception->GetMessage().empty());
        EXPECT_EQ(std::string(exception->what()), exception->GetMessage());
        EXPECT_NE(PetKineticsException::SeverityToString(exception->GetSeverity()),
                  "UNKNOWN");
        EXPECT_NE(PetKineticsException::CategoryToString(exception->GetCategory()),
                  "UNKNOWN");
    }
}

TEST(ErrorHandlingTest, DispatcherErrorsCatchableAsBase) {
    std::vector<double> times = {0.0, 1.0, 2.0};
    std::vector<double> values = {1.0, 2.0, 3.0};

    try {
        graphical::RunGraphicalAnalysis("bogus", values, values, times, 0.0);
        FAIL() << "Expected an exception";
    } catch (const PetKineticsException& e) {
        EXPECT_EQ(e.GetComponent(), "AnalysisDispatcher");
    }

    EXPECT_THROW(graphical::RunGraphicalAnalysis("logan", values, values, times, 3.0),
                 std::exception);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
