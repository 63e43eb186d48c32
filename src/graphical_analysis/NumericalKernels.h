/**
 * @file NumericalKernels.h
 * @brief Numerical building blocks of the graphical analysis engine
 *
 * Cumulative trapezoidal integration, threshold index lookup and the linear
 * least-squares line fit shared by the Patlak, Logan and Alternative Logan
 * methods. All functions are pure: they read their arguments and return newly
 * allocated results, so they may be called concurrently.
 */

#ifndef PETKINETICS_NUMERICAL_KERNELS_H
#define PETKINETICS_NUMERICAL_KERNELS_H

#include <vector>

// vnl (shipped with ITK)
#include "vnl/vnl_matrix.h"

namespace petkinetics {
namespace graphical {

/**
 * @brief Result of a straight line fit y = slope * x + intercept
 */
struct LineFit {
  double slope = 0.0;
  double intercept = 0.0;
};

/**
 * @brief Cumulative integral of @p values over @p times (trapezoidal rule)
 *
 * out[0] = initial, out[i] = out[i-1] + (t[i]-t[i-1]) * (v[i]+v[i-1]) / 2.
 * Non-increasing times give a signed area and are not rejected.
 *
 * @throws ShapeMismatchException if the two sequences differ in length
 */
std::vector<double> CumulativeTrapezoidalIntegral(
    const std::vector<double> &times, const std::vector<double> &values,
    double initial = 0.0);

/**
 * @brief Design matrix for a line fit: first column @p xdata, second column 1
 */
vnl_matrix<double> MakeLineFitDesignMatrix(const std::vector<double> &xdata);

/**
 * @brief Ordinary least-squares fit of a line to paired samples
 *
 * Solves [x | 1] * (slope, intercept)^T ~ y through the SVD pseudo-inverse.
 * A constant x window yields the minimum-norm solution. Any non-finite sample
 * makes both coefficients NaN.
 *
 * @throws ShapeMismatchException if xdata and ydata differ in length
 * @throws InsufficientFitPointsException if fewer than two points are given
 */
LineFit FitLineToDataUsingLLS(const std::vector<double> &xdata,
                              const std::vector<double> &ydata);

/**
 * @brief Index of the first time at or after the threshold
 *
 * @param times Sample times in minutes, sorted ascending
 * @param t_thresh Threshold time in minutes
 * @return First index with times[i] >= t_thresh, or -1 if the threshold is
 *         larger than every sample time (or times is empty)
 */
int GetIndexFromThreshold(const std::vector<double> &times, double t_thresh);

/**
 * @brief Elementwise quotient numerator[i] / denominator[i]
 *
 * Zero denominators yield inf or NaN following IEEE arithmetic.
 */
std::vector<double> ElementwiseDivide(const std::vector<double> &numerator,
                                      const std::vector<double> &denominator);

/**
 * @brief Copy of @p values from @p start_index to the end
 */
std::vector<double> TailFrom(const std::vector<double> &values,
                             size_t start_index);

} // namespace graphical
} // namespace petkinetics

#endif // PETKINETICS_NUMERICAL_KERNELS_H
