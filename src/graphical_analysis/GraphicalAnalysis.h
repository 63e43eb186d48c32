/**
 * @file GraphicalAnalysis.h
 * @brief Graphical analysis of region TACs against an input function
 *
 * GraphicalAnalysis runs one configured method on one TAC pair and returns an
 * immutable AnalysisResult record describing the fit window and coefficients.
 * BatchGraphicalAnalysis runs one input TAC against many regions, optionally
 * in parallel; each job owns its own analysis object.
 */

#ifndef PETKINETICS_GRAPHICAL_ANALYSIS_H
#define PETKINETICS_GRAPHICAL_ANALYSIS_H

#include "GraphicalMethods.h"

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace petkinetics {
namespace graphical {

/**
 * @brief Graphical analysis configuration parameters
 */
struct GraphicalAnalysisParameters {
  GraphicalMethod method = GraphicalMethod::Patlak;
  double threshold_time_minutes = 0.0; // Fit all frames at or after this time
  bool verbose = false;                // Print a summary after each run
};

/**
 * @brief Outcome of one graphical analysis
 */
struct AnalysisResult {
  GraphicalMethod method = GraphicalMethod::Patlak;
  double threshold_time = 0.0;   // Requested threshold (min)
  double start_frame_time = 0.0; // First fitted frame time (min)
  double end_frame_time = 0.0;   // Last fitted frame time (min)
  size_t number_of_points_fit = 0;
  LineFit fit;

  double Slope() const { return fit.slope; }
  double Intercept() const { return fit.intercept; }

  std::string ToString() const;
};

std::ostream &operator<<(std::ostream &os, const AnalysisResult &result);

/**
 * @brief Runs a configured graphical method on TAC pairs
 */
class GraphicalAnalysis {
private:
  GraphicalAnalysisParameters m_params;

public:
  GraphicalAnalysis() = default;
  explicit GraphicalAnalysis(const GraphicalAnalysisParameters &params);
  GraphicalAnalysis(const std::string &method_name, double threshold_time);
  ~GraphicalAnalysis() = default;

  // Configuration
  void SetParameters(const GraphicalAnalysisParameters &params);
  const GraphicalAnalysisParameters &GetParameters() const { return m_params; }
  void SetMethod(const std::string &method_name);
  void SetThresholdTime(double threshold_time_minutes);

  /**
   * @brief Fit the configured method to a TAC pair
   *
   * @param tac_times_in_minutes Shared frame times, ascending
   * @param input_tac_values Input (plasma) TAC
   * @param region_tac_values Region TAC
   * @throws ShapeMismatchException, EmptyFitWindowException,
   *         InsufficientFitPointsException
   */
  AnalysisResult Run(const std::vector<double> &tac_times_in_minutes,
                     const std::vector<double> &input_tac_values,
                     const std::vector<double> &region_tac_values) const;

  // Throws ConfigurationException or InvalidMethodNameException
  static void ValidateParameters(const GraphicalAnalysisParameters &params);
};

/**
 * @brief Graphical analysis of many regions against one input TAC
 */
class BatchGraphicalAnalysis {
public:
  struct BatchJob {
    std::string region_name;
    std::vector<double> region_tac_values;
    bool completed = false;
    AnalysisResult result;
    std::string error_message;
    double processing_time_ms = 0.0;
  };

  struct BatchOptions {
    int max_parallel_jobs = 1;     // Number of concurrent jobs
    bool continue_on_error = true; // Keep going if one region fails
    bool verbose = false;
  };

  // error_message of jobs skipped once a failure stops the batch
  static const char *const kNotRunMessage;

  struct BatchStatistics {
    int total_jobs = 0;
    int completed_jobs = 0;
    int failed_jobs = 0;
    double total_processing_time_ms = 0.0;
    double average_processing_time_ms = 0.0;
  };

private:
  GraphicalAnalysisParameters m_params;
  BatchOptions m_options;
  std::vector<BatchJob> m_jobs;

public:
  explicit BatchGraphicalAnalysis(const GraphicalAnalysisParameters &params,
                                  const BatchOptions &options = BatchOptions());

  void AddRegion(const std::string &region_name,
                 const std::vector<double> &region_tac_values);
  void ClearJobs();
  size_t GetJobCount() const { return m_jobs.size(); }

  // Returns true only if every job completed
  bool ProcessAll(const std::vector<double> &tac_times_in_minutes,
                  const std::vector<double> &input_tac_values);

  const std::vector<BatchJob> &GetJobs() const { return m_jobs; }
  std::vector<BatchJob> GetCompletedJobs() const;
  std::vector<BatchJob> GetFailedJobs() const;
  std::map<std::string, AnalysisResult> GetResultsByRegion() const;
  BatchStatistics GetBatchStatistics() const;

private:
  bool ProcessJob(size_t job_index,
                  const std::vector<double> &tac_times_in_minutes,
                  const std::vector<double> &input_tac_values);
};

} // namespace graphical
} // namespace petkinetics

#endif // PETKINETICS_GRAPHICAL_ANALYSIS_H
