#ifndef PETKINETICS_EXCEPTIONS_H
#define PETKINETICS_EXCEPTIONS_H

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file PetKineticsExceptions.h
 * @brief Exception hierarchy for PetKinetics
 *
 * Every failure raised by the graphical analysis engine and the image-derived
 * input function utilities derives from PetKineticsException, which carries
 * the failing component, a severity, a category and recovery suggestions.
 */

namespace petkinetics {

/**
 * @brief Base exception class for all PetKinetics errors
 */
class PetKineticsException : public std::exception {
public:
  enum class Severity {
    Warning, // Result may be unreliable
    Error,   // Current operation failed
    Critical // Caller state is compromised
  };

  enum class Category {
    InputData,     // TAC and image data shape or content errors
    Analysis,      // Graphical analysis method errors
    Fitting,       // Least-squares fitting errors
    Configuration, // Parameter errors
    DataPreparation // Image-derived input function errors
  };

protected:
  std::string m_message;
  std::string m_component;
  std::string m_function;
  Severity m_severity;
  Category m_category;
  std::chrono::system_clock::time_point m_timestamp;
  std::vector<std::string> m_recovery_suggestions;
  std::string m_detailed_context;

public:
  explicit PetKineticsException(const std::string &message,
                                const std::string &component = "Unknown",
                                const std::string &function = "Unknown",
                                Severity severity = Severity::Error,
                                Category category = Category::Analysis)
      : m_message(message), m_component(component), m_function(function),
        m_severity(severity), m_category(category),
        m_timestamp(std::chrono::system_clock::now()) {}

  const char *what() const noexcept override { return m_message.c_str(); }

  const std::string &GetMessage() const { return m_message; }
  const std::string &GetComponent() const { return m_component; }
  const std::string &GetFunction() const { return m_function; }
  Severity GetSeverity() const { return m_severity; }
  Category GetCategory() const { return m_category; }

  std::string GetTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(m_timestamp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
  }

  void AddRecoverySuggestion(const std::string &suggestion) {
    m_recovery_suggestions.push_back(suggestion);
  }

  const std::vector<std::string> &GetRecoverySuggestions() const {
    return m_recovery_suggestions;
  }

  void SetDetailedContext(const std::string &context) {
    m_detailed_context = context;
  }

  const std::string &GetDetailedContext() const { return m_detailed_context; }

  std::string GetFormattedReport() const {
    std::stringstream ss;
    ss << "=== PetKinetics Error Report ===" << std::endl;
    ss << "Timestamp: " << GetTimestamp() << std::endl;
    ss << "Severity: " << SeverityToString(m_severity) << std::endl;
    ss << "Category: " << CategoryToString(m_category) << std::endl;
    ss << "Component: " << m_component << std::endl;
    ss << "Function: " << m_function << std::endl;
    ss << "Message: " << m_message << std::endl;

    if (!m_detailed_context.empty()) {
      ss << "Context: " << m_detailed_context << std::endl;
    }

    if (!m_recovery_suggestions.empty()) {
      ss << "Recovery Suggestions:" << std::endl;
      for (size_t i = 0; i < m_recovery_suggestions.size(); ++i) {
        ss << "  " << (i + 1) << ". " << m_recovery_suggestions[i] << std::endl;
      }
    }

    return ss.str();
  }

  static std::string SeverityToString(Severity severity) {
    switch (severity) {
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string CategoryToString(Category category) {
    switch (category) {
    case Category::InputData:
      return "INPUT_DATA";
    case Category::Analysis:
      return "ANALYSIS";
    case Category::Fitting:
      return "FITTING";
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::DataPreparation:
      return "DATA_PREPARATION";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief Unrecognized graphical analysis method identifier
 */
class InvalidMethodNameException : public PetKineticsException {
private:
  std::string m_method_name;

public:
  explicit InvalidMethodNameException(const std::string &method_name)
      : PetKineticsException(
            "Invalid method_name! Must be either 'patlak', 'logan', or "
            "'alt_logan'. Got '" +
                method_name + "'",
            "AnalysisDispatcher", "GetGraphicalAnalysisMethod",
            Severity::Error, Category::Analysis),
        m_method_name(method_name) {
    AddRecoverySuggestion("Use one of: patlak, logan, alt_logan");
    AddRecoverySuggestion("Method names are case sensitive");
  }

  const std::string &GetMethodName() const { return m_method_name; }
};

/**
 * @brief Paired sequences or images with differing lengths or dimensions
 */
class ShapeMismatchException : public PetKineticsException {
public:
  ShapeMismatchException(const std::string &function,
                         const std::string &first_shape,
                         const std::string &second_shape,
                         const std::string &component = "InputData")
      : PetKineticsException("Shape mismatch in " + function + ": " +
                                 first_shape + " vs " + second_shape,
                             component, function, Severity::Error,
                             Category::InputData) {
    AddRecoverySuggestion(
        "Ensure both TACs are sampled at the same frame times");
    AddRecoverySuggestion("Verify image and mask share the same dimensions");
  }

  ShapeMismatchException(const std::string &function, size_t first_length,
                         size_t second_length)
      : ShapeMismatchException(function,
                               "length " + std::to_string(first_length),
                               "length " + std::to_string(second_length)) {}
};

/**
 * @brief Requested frame window falls outside the available frames
 */
class OutOfBoundsFrameException : public PetKineticsException {
private:
  int m_start_frame;
  int m_end_frame;
  size_t m_number_of_frames;

public:
  OutOfBoundsFrameException(int start_frame, int end_frame,
                            size_t number_of_frames)
      : PetKineticsException("Frame indices are out of bounds.",
                             "ImageDerivedInputFunction",
                             "MakeEarlyMeanImage", Severity::Error,
                             Category::DataPreparation),
        m_start_frame(start_frame), m_end_frame(end_frame),
        m_number_of_frames(number_of_frames) {
    std::stringstream context;
    context << "Requested frames [" << start_frame << ", " << end_frame
            << "] of " << number_of_frames << " available";
    SetDetailedContext(context.str());

    AddRecoverySuggestion("Check the number of frames in the 4D image");
    AddRecoverySuggestion("Frame indices are zero based and inclusive");
  }

  int GetStartFrame() const { return m_start_frame; }
  int GetEndFrame() const { return m_end_frame; }
  size_t GetNumberOfFrames() const { return m_number_of_frames; }
};

/**
 * @brief Threshold time lies after every sample time, so nothing can be fit
 */
class EmptyFitWindowException : public PetKineticsException {
private:
  double m_threshold_time;
  double m_last_frame_time;

public:
  EmptyFitWindowException(double threshold_time, double last_frame_time)
      : PetKineticsException(
            "No samples at or after the threshold time; fit window is empty",
            "GraphicalAnalysis", "GetIndexFromThreshold", Severity::Error,
            Category::Fitting),
        m_threshold_time(threshold_time), m_last_frame_time(last_frame_time) {
    std::stringstream context;
    context << "Threshold time: " << threshold_time
            << " min; last frame time: " << last_frame_time << " min";
    SetDetailedContext(context.str());

    AddRecoverySuggestion("Lower the threshold time");
    AddRecoverySuggestion("Check that frame times are given in minutes");
  }

  double GetThresholdTime() const { return m_threshold_time; }
  double GetLastFrameTime() const { return m_last_frame_time; }
};

/**
 * @brief Fewer than two points supplied to the line fit
 */
class InsufficientFitPointsException : public PetKineticsException {
private:
  size_t m_number_of_points;

public:
  explicit InsufficientFitPointsException(size_t number_of_points)
      : PetKineticsException("Line fit requires at least 2 points, got " +
                                 std::to_string(number_of_points),
                             "LineFitter", "FitLineToDataUsingLLS",
                             Severity::Error, Category::Fitting),
        m_number_of_points(number_of_points) {
    AddRecoverySuggestion("Lower the threshold time to include more frames");
  }

  size_t GetNumberOfPoints() const { return m_number_of_points; }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public PetKineticsException {
public:
  explicit ConfigurationException(const std::string &parameter_name,
                                  const std::string &invalid_value,
                                  const std::string &expected_format = "")
      : PetKineticsException(
            "Invalid configuration parameter '" + parameter_name +
                "' with value '" + invalid_value + "'" +
                (expected_format.empty()
                     ? ""
                     : " (expected: " + expected_format + ")"),
            "Configuration", "Parameter Validation", Severity::Error,
            Category::Configuration) {
    AddRecoverySuggestion("Check parameter documentation for valid ranges");
    AddRecoverySuggestion("Use default parameter values as starting point");
  }
};

} // namespace petkinetics

#endif // PETKINETICS_EXCEPTIONS_H
