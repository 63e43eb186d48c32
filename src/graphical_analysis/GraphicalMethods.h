/**
 * @file GraphicalMethods.h
 * @brief Patlak, Logan and Alternative Logan graphical analysis methods
 *
 * Each method turns an input (plasma) TAC and a region TAC, sampled at the
 * same times, into linear coordinates and fits a line over all samples at or
 * after a threshold time. The fitted slope and intercept are the
 * method-specific kinetic parameters (e.g. Ki and V0 for Patlak, the
 * distribution volume and intercept for Logan).
 *
 * Activity values of zero give non-finite coordinates. These are not filtered
 * and reach the fit unchanged, so callers should choose a threshold past the
 * pre-uptake frames.
 */

#ifndef PETKINETICS_GRAPHICAL_METHODS_H
#define PETKINETICS_GRAPHICAL_METHODS_H

#include "NumericalKernels.h"

#include <string>
#include <vector>

namespace petkinetics {
namespace graphical {

/**
 * @brief Supported graphical analysis methods
 */
enum class GraphicalMethod {
  Patlak,  // Irreversible uptake (Patlak-Gjedde)
  Logan,   // Reversible uptake
  AltLogan // Logan with the region integral scaled by the input TAC
};

/**
 * @brief Signature shared by every graphical analysis method
 */
using AnalysisFunction = LineFit (*)(const std::vector<double> &input_tac_values,
                                     const std::vector<double> &region_tac_values,
                                     const std::vector<double> &tac_times_in_minutes,
                                     double t_thresh_in_minutes);

// Patlak x variable: cumulative integral of the TAC divided by the TAC
std::vector<double> CalculatePatlakX(const std::vector<double> &tac_times,
                                     const std::vector<double> &tac_vals);

/**
 * @brief Patlak-Gjedde analysis
 * @return (Ki, V0)
 */
LineFit PatlakAnalysis(const std::vector<double> &input_tac_values,
                       const std::vector<double> &region_tac_values,
                       const std::vector<double> &tac_times_in_minutes,
                       double t_thresh_in_minutes);

/**
 * @brief Logan analysis
 * @return (Vd, intercept); interpretation depends on the kinetic model
 */
LineFit LoganAnalysis(const std::vector<double> &input_tac_values,
                      const std::vector<double> &region_tac_values,
                      const std::vector<double> &tac_times_in_minutes,
                      double t_thresh_in_minutes);

/**
 * @brief Alternative Logan analysis
 * @return (Vd, intercept); interpretation depends on the kinetic model
 */
LineFit AlternativeLoganAnalysis(const std::vector<double> &input_tac_values,
                                 const std::vector<double> &region_tac_values,
                                 const std::vector<double> &tac_times_in_minutes,
                                 double t_thresh_in_minutes);

// Method lookup
GraphicalMethod MethodFromName(const std::string &method_name);
std::string MethodToString(GraphicalMethod method);
std::vector<std::string> GetAvailableMethods();

AnalysisFunction GetGraphicalAnalysisMethod(GraphicalMethod method);

/**
 * @brief Function implementing the named method
 * @throws InvalidMethodNameException unless the name is "patlak", "logan" or
 *         "alt_logan"
 */
AnalysisFunction GetGraphicalAnalysisMethod(const std::string &method_name);

/**
 * @brief Run the named method and return its fit unchanged
 * @throws InvalidMethodNameException for an unknown method name
 */
LineFit RunGraphicalAnalysis(const std::string &method_name,
                             const std::vector<double> &input_tac_values,
                             const std::vector<double> &region_tac_values,
                             const std::vector<double> &tac_times_in_minutes,
                             double t_thresh_in_minutes);

LineFit RunGraphicalAnalysis(GraphicalMethod method,
                             const std::vector<double> &input_tac_values,
                             const std::vector<double> &region_tac_values,
                             const std::vector<double> &tac_times_in_minutes,
                             double t_thresh_in_minutes);

} // namespace graphical
} // namespace petkinetics

#endif // PETKINETICS_GRAPHICAL_METHODS_H
