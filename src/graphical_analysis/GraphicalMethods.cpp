/**
 * @file GraphicalMethods.cpp
 * @brief Implementation of the graphical analysis methods and dispatch
 */

#include "GraphicalMethods.h"
#include "../common/PetKineticsExceptions.h"

namespace petkinetics {
namespace graphical {

namespace {

void ValidateTacShapes(const std::string &method,
                       const std::vector<double> &input_tac_values,
                       const std::vector<double> &region_tac_values,
                       const std::vector<double> &tac_times_in_minutes) {
  if (input_tac_values.size() != region_tac_values.size()) {
    throw ShapeMismatchException(
        method, "input TAC length " + std::to_string(input_tac_values.size()),
        "region TAC length " + std::to_string(region_tac_values.size()));
  }
  if (input_tac_values.size() != tac_times_in_minutes.size()) {
    throw ShapeMismatchException(
        method, "TAC length " + std::to_string(input_tac_values.size()),
        "times length " + std::to_string(tac_times_in_minutes.size()));
  }
}

// -1 from the locator means no samples at or after the threshold
size_t ResolveFitStart(const std::vector<double> &tac_times_in_minutes,
                       double t_thresh_in_minutes) {
  int index = GetIndexFromThreshold(tac_times_in_minutes, t_thresh_in_minutes);
  if (index < 0) {
    double last_time =
        tac_times_in_minutes.empty() ? 0.0 : tac_times_in_minutes.back();
    throw EmptyFitWindowException(t_thresh_in_minutes, last_time);
  }
  return static_cast<size_t>(index);
}

LineFit FitFromIndex(const std::vector<double> &x, const std::vector<double> &y,
                     size_t start_index) {
  return FitLineToDataUsingLLS(TailFrom(x, start_index),
                               TailFrom(y, start_index));
}

} // namespace

std::vector<double> CalculatePatlakX(const std::vector<double> &tac_times,
                                     const std::vector<double> &tac_vals) {
  std::vector<double> cumulative_integral =
      CumulativeTrapezoidalIntegral(tac_times, tac_vals, 0.0);
  return ElementwiseDivide(cumulative_integral, tac_vals);
}

LineFit PatlakAnalysis(const std::vector<double> &input_tac_values,
                       const std::vector<double> &region_tac_values,
                       const std::vector<double> &tac_times_in_minutes,
                       double t_thresh_in_minutes) {
  ValidateTacShapes("PatlakAnalysis", input_tac_values, region_tac_values,
                    tac_times_in_minutes);
  size_t start = ResolveFitStart(tac_times_in_minutes, t_thresh_in_minutes);

  std::vector<double> patlak_x =
      CalculatePatlakX(tac_times_in_minutes, input_tac_values);
  std::vector<double> patlak_y =
      ElementwiseDivide(region_tac_values, input_tac_values);

  return FitFromIndex(patlak_x, patlak_y, start);
}

LineFit LoganAnalysis(const std::vector<double> &input_tac_values,
                      const std::vector<double> &region_tac_values,
                      const std::vector<double> &tac_times_in_minutes,
                      double t_thresh_in_minutes) {
  ValidateTacShapes("LoganAnalysis", input_tac_values, region_tac_values,
                    tac_times_in_minutes);
  size_t start = ResolveFitStart(tac_times_in_minutes, t_thresh_in_minutes);

  std::vector<double> input_integral =
      CumulativeTrapezoidalIntegral(tac_times_in_minutes, input_tac_values);
  std::vector<double> region_integral =
      CumulativeTrapezoidalIntegral(tac_times_in_minutes, region_tac_values);

  std::vector<double> logan_x =
      ElementwiseDivide(input_integral, region_tac_values);
  std::vector<double> logan_y =
      ElementwiseDivide(region_integral, region_tac_values);

  return FitFromIndex(logan_x, logan_y, start);
}

LineFit AlternativeLoganAnalysis(const std::vector<double> &input_tac_values,
                                 const std::vector<double> &region_tac_values,
                                 const std::vector<double> &tac_times_in_minutes,
                                 double t_thresh_in_minutes) {
  ValidateTacShapes("AlternativeLoganAnalysis", input_tac_values,
                    region_tac_values, tac_times_in_minutes);
  size_t start = ResolveFitStart(tac_times_in_minutes, t_thresh_in_minutes);

  std::vector<double> input_integral =
      CumulativeTrapezoidalIntegral(tac_times_in_minutes, input_tac_values);
  std::vector<double> region_integral =
      CumulativeTrapezoidalIntegral(tac_times_in_minutes, region_tac_values);

  std::vector<double> alt_logan_x =
      ElementwiseDivide(input_integral, region_tac_values);
  std::vector<double> alt_logan_y =
      ElementwiseDivide(region_integral, input_tac_values);

  return FitFromIndex(alt_logan_x, alt_logan_y, start);
}

GraphicalMethod MethodFromName(const std::string &method_name) {
  if (method_name == "patlak") {
    return GraphicalMethod::Patlak;
  } else if (method_name == "logan") {
    return GraphicalMethod::Logan;
  } else if (method_name == "alt_logan") {
    return GraphicalMethod::AltLogan;
  }
  throw InvalidMethodNameException(method_name);
}

std::string MethodToString(GraphicalMethod method) {
  switch (method) {
  case GraphicalMethod::Patlak:
    return "patlak";
  case GraphicalMethod::Logan:
    return "logan";
  case GraphicalMethod::AltLogan:
    return "alt_logan";
  }
  return "unknown";
}

std::vector<std::string> GetAvailableMethods() {
  return {"patlak", "logan", "alt_logan"};
}

AnalysisFunction GetGraphicalAnalysisMethod(GraphicalMethod method) {
  switch (method) {
  case GraphicalMethod::Patlak:
    return &PatlakAnalysis;
  case GraphicalMethod::Logan:
    return &LoganAnalysis;
  case GraphicalMethod::AltLogan:
    return &AlternativeLoganAnalysis;
  }
  throw InvalidMethodNameException(std::to_string(static_cast<int>(method)));
}

AnalysisFunction GetGraphicalAnalysisMethod(const std::string &method_name) {
  return GetGraphicalAnalysisMethod(MethodFromName(method_name));
}

LineFit RunGraphicalAnalysis(const std::string &method_name,
                             const std::vector<double> &input_tac_values,
                             const std::vector<double> &region_tac_values,
                             const std::vector<double> &tac_times_in_minutes,
                             double t_thresh_in_minutes) {
  return RunGraphicalAnalysis(MethodFromName(method_name), input_tac_values,
                              region_tac_values, tac_times_in_minutes,
                              t_thresh_in_minutes);
}

LineFit RunGraphicalAnalysis(GraphicalMethod method,
                             const std::vector<double> &input_tac_values,
                             const std::vector<double> &region_tac_values,
                             const std::vector<double> &tac_times_in_minutes,
                             double t_thresh_in_minutes) {
  AnalysisFunction analysis = GetGraphicalAnalysisMethod(method);
  return analysis(input_tac_values, region_tac_values, tac_times_in_minutes,
                  t_thresh_in_minutes);
}

} // namespace graphical
} // namespace petkinetics
