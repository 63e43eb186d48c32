/**
 * @file GraphicalAnalysis.cpp
 * @brief Implementation of the single TAC-pair graphical analysis
 */

#include "GraphicalAnalysis.h"
#include "../common/PetKineticsExceptions.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace petkinetics {
namespace graphical {

std::string AnalysisResult::ToString() const {
  std::stringstream ss;
  ss << "Method: " << MethodToString(method)
     << "; ThresholdTime: " << threshold_time
     << "; StartFrameTime: " << start_frame_time
     << "; EndFrameTime: " << end_frame_time
     << "; NumberOfPointsFit: " << number_of_points_fit << std::setprecision(8)
     << "; Slope: " << fit.slope << "; Intercept: " << fit.intercept;
  return ss.str();
}

std::ostream &operator<<(std::ostream &os, const AnalysisResult &result) {
  os << result.ToString();
  return os;
}

// ===== GraphicalAnalysis Implementation =====

GraphicalAnalysis::GraphicalAnalysis(const GraphicalAnalysisParameters &params) {
  SetParameters(params);
}

GraphicalAnalysis::GraphicalAnalysis(const std::string &method_name,
                                     double threshold_time) {
  GraphicalAnalysisParameters params;
  params.method = MethodFromName(method_name);
  params.threshold_time_minutes = threshold_time;
  SetParameters(params);
}

void GraphicalAnalysis::SetParameters(
    const GraphicalAnalysisParameters &params) {
  ValidateParameters(params);
  m_params = params;
}

void GraphicalAnalysis::SetMethod(const std::string &method_name) {
  m_params.method = MethodFromName(method_name);
}

void GraphicalAnalysis::SetThresholdTime(double threshold_time_minutes) {
  GraphicalAnalysisParameters params = m_params;
  params.threshold_time_minutes = threshold_time_minutes;
  SetParameters(params);
}

void GraphicalAnalysis::ValidateParameters(
    const GraphicalAnalysisParameters &params) {
  if (!std::isfinite(params.threshold_time_minutes)) {
    std::stringstream value;
    value << params.threshold_time_minutes;
    throw ConfigurationException("threshold_time_minutes", value.str(),
                                 "finite time in minutes");
  }
  // Rejects enum values outside the closed method set
  MethodFromName(MethodToString(params.method));
}

AnalysisResult
GraphicalAnalysis::Run(const std::vector<double> &tac_times_in_minutes,
                       const std::vector<double> &input_tac_values,
                       const std::vector<double> &region_tac_values) const {
  AnalysisResult result;
  result.method = m_params.method;
  result.threshold_time = m_params.threshold_time_minutes;
  result.fit = RunGraphicalAnalysis(m_params.method, input_tac_values,
                                    region_tac_values, tac_times_in_minutes,
                                    m_params.threshold_time_minutes);

  // The fit succeeded, so the threshold index is valid here
  size_t start = static_cast<size_t>(GetIndexFromThreshold(
      tac_times_in_minutes, m_params.threshold_time_minutes));
  result.start_frame_time = tac_times_in_minutes[start];
  result.end_frame_time = tac_times_in_minutes.back();
  result.number_of_points_fit = tac_times_in_minutes.size() - start;

  if (m_params.verbose) {
    std::cout << "Graphical analysis completed: " << result << std::endl;
    if (!std::isfinite(result.fit.slope) ||
        !std::isfinite(result.fit.intercept)) {
      std::cerr << "Warning: non-finite fit coefficients; check for zero "
                   "activity within the fit window"
                << std::endl;
    }
  }

  return result;
}

} // namespace graphical
} // namespace petkinetics
