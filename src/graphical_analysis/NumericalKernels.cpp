/**
 * @file NumericalKernels.cpp
 * @brief Implementation of the graphical analysis numerical kernels
 */

#include "NumericalKernels.h"
#include "../common/PetKineticsExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "vnl/algo/vnl_svd.h"
#include "vnl/vnl_vector.h"

namespace petkinetics {
namespace graphical {

namespace {
// Singular values below this fraction of the largest are treated as zero
const double kSingularValueCutoff = 1e-10;
} // namespace

std::vector<double> CumulativeTrapezoidalIntegral(
    const std::vector<double> &times, const std::vector<double> &values,
    double initial) {
  if (times.size() != values.size()) {
    throw ShapeMismatchException("CumulativeTrapezoidalIntegral", times.size(),
                                 values.size());
  }

  std::vector<double> cumulative(times.size());
  if (cumulative.empty()) {
    return cumulative;
  }

  cumulative[0] = initial;
  for (size_t i = 1; i < times.size(); ++i) {
    double dx = times[i] - times[i - 1];
    cumulative[i] = cumulative[i - 1] + dx * (values[i] + values[i - 1]) / 2.0;
  }

  return cumulative;
}

vnl_matrix<double> MakeLineFitDesignMatrix(const std::vector<double> &xdata) {
  vnl_matrix<double> design(static_cast<unsigned int>(xdata.size()), 2, 1.0);
  for (size_t i = 0; i < xdata.size(); ++i) {
    design(static_cast<unsigned int>(i), 0) = xdata[i];
  }
  return design;
}

LineFit FitLineToDataUsingLLS(const std::vector<double> &xdata,
                              const std::vector<double> &ydata) {
  if (xdata.size() != ydata.size()) {
    throw ShapeMismatchException("FitLineToDataUsingLLS", xdata.size(),
                                 ydata.size());
  }
  if (xdata.size() < 2) {
    throw InsufficientFitPointsException(xdata.size());
  }

  auto is_finite = [](double value) { return std::isfinite(value); };
  if (!std::all_of(xdata.begin(), xdata.end(), is_finite) ||
      !std::all_of(ydata.begin(), ydata.end(), is_finite)) {
    LineFit undefined;
    undefined.slope = std::numeric_limits<double>::quiet_NaN();
    undefined.intercept = std::numeric_limits<double>::quiet_NaN();
    return undefined;
  }

  vnl_matrix<double> design = MakeLineFitDesignMatrix(xdata);
  vnl_vector<double> rhs(ydata.data(), static_cast<unsigned int>(ydata.size()));

  // Pseudo-inverse solve: a rank-deficient design (constant x) gives the
  // minimum-norm solution
  vnl_svd<double> svd(design);
  svd.zero_out_relative(kSingularValueCutoff);
  vnl_vector<double> solution = svd.solve(rhs);

  LineFit fit;
  fit.slope = solution[0];
  fit.intercept = solution[1];
  return fit;
}

int GetIndexFromThreshold(const std::vector<double> &times, double t_thresh) {
  if (times.empty()) {
    return -1;
  }

  if (t_thresh > *std::max_element(times.begin(), times.end())) {
    return -1;
  }

  for (size_t i = 0; i < times.size(); ++i) {
    if (times[i] >= t_thresh) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

std::vector<double> ElementwiseDivide(const std::vector<double> &numerator,
                                      const std::vector<double> &denominator) {
  if (numerator.size() != denominator.size()) {
    throw ShapeMismatchException("ElementwiseDivide", numerator.size(),
                                 denominator.size());
  }

  std::vector<double> quotient(numerator.size());
  std::transform(numerator.begin(), numerator.end(), denominator.begin(),
                 quotient.begin(),
                 [](double num, double den) { return num / den; });
  return quotient;
}

std::vector<double> TailFrom(const std::vector<double> &values,
                             size_t start_index) {
  if (start_index >= values.size()) {
    return {};
  }
  return std::vector<double>(values.begin() + start_index, values.end());
}

} // namespace graphical
} // namespace petkinetics
