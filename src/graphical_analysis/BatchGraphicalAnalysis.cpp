/**
 * @file BatchGraphicalAnalysis.cpp
 * @brief Implementation of multi-region graphical analysis
 */

#include "GraphicalAnalysis.h"

#include <chrono>
#include <future>
#include <iostream>

namespace petkinetics {
namespace graphical {

// ===== BatchGraphicalAnalysis Implementation =====

const char *const BatchGraphicalAnalysis::kNotRunMessage =
    "Not run: batch stopped after an earlier failure";

BatchGraphicalAnalysis::BatchGraphicalAnalysis(
    const GraphicalAnalysisParameters &params, const BatchOptions &options)
    : m_params(params), m_options(options) {
  GraphicalAnalysis::ValidateParameters(params);
}

void BatchGraphicalAnalysis::AddRegion(
    const std::string &region_name,
    const std::vector<double> &region_tac_values) {
  BatchJob job;
  job.region_name = region_name;
  job.region_tac_values = region_tac_values;
  job.completed = false;

  m_jobs.push_back(job);
}

void BatchGraphicalAnalysis::ClearJobs() { m_jobs.clear(); }

bool BatchGraphicalAnalysis::ProcessAll(
    const std::vector<double> &tac_times_in_minutes,
    const std::vector<double> &input_tac_values) {
  if (m_jobs.empty()) {
    return true;
  }

  auto start_time = std::chrono::high_resolution_clock::now();

  if (m_options.verbose) {
    std::cout << "Starting " << MethodToString(m_params.method)
              << " analysis of " << m_jobs.size() << " regions" << std::endl;
    std::cout << "Maximum parallel jobs: " << m_options.max_parallel_jobs
              << std::endl;
  }

  // Overwritten by ProcessJob; survives only for jobs skipped after a failure
  for (auto &job : m_jobs) {
    job.completed = false;
    job.error_message = kNotRunMessage;
    job.processing_time_ms = 0.0;
  }

  bool overall_success = true;

  if (m_options.max_parallel_jobs <= 1) {
    for (size_t i = 0; i < m_jobs.size(); ++i) {
      if (!ProcessJob(i, tac_times_in_minutes, input_tac_values)) {
        overall_success = false;
        if (!m_options.continue_on_error) {
          break;
        }
      }
    }
  } else {
    // Jobs only touch their own slot in m_jobs, which is not resized here
    size_t job_index = 0;
    size_t max_parallel = static_cast<size_t>(m_options.max_parallel_jobs);

    while (job_index < m_jobs.size()) {
      std::vector<std::future<bool>> futures;

      while (futures.size() < max_parallel && job_index < m_jobs.size()) {
        futures.push_back(std::async(
            std::launch::async,
            [this, job_index, &tac_times_in_minutes, &input_tac_values]() {
              return ProcessJob(job_index, tac_times_in_minutes,
                                input_tac_values);
            }));
        job_index++;
      }

      bool group_success = true;
      for (auto &future : futures) {
        if (!future.get()) {
          group_success = false;
        }
      }

      if (!group_success) {
        overall_success = false;
        if (!m_options.continue_on_error) {
          break;
        }
      }
    }
  }

  auto end_time = std::chrono::high_resolution_clock::now();
  double total_time =
      std::chrono::duration<double, std::milli>(end_time - start_time).count();

  if (m_options.verbose) {
    auto stats = GetBatchStatistics();
    std::cout << "Batch analysis completed in " << total_time << " ms"
              << std::endl;
    std::cout << "Completed jobs: " << stats.completed_jobs << "/"
              << stats.total_jobs << std::endl;
    std::cout << "Failed jobs: " << stats.failed_jobs << std::endl;
  }

  return overall_success;
}

bool BatchGraphicalAnalysis::ProcessJob(
    size_t job_index, const std::vector<double> &tac_times_in_minutes,
    const std::vector<double> &input_tac_values) {
  if (job_index >= m_jobs.size()) {
    return false;
  }

  auto &job = m_jobs[job_index];
  job.error_message.clear();
  auto start_time = std::chrono::high_resolution_clock::now();

  try {
    GraphicalAnalysis analysis(m_params);
    job.result =
        analysis.Run(tac_times_in_minutes, input_tac_values,
                     job.region_tac_values);
    job.completed = true;
  } catch (const std::exception &e) {
    job.completed = false;
    job.error_message = e.what();

    if (m_options.verbose) {
      std::cerr << "Region '" << job.region_name << "' failed: " << e.what()
                << std::endl;
    }
  }

  auto end_time = std::chrono::high_resolution_clock::now();
  job.processing_time_ms =
      std::chrono::duration<double, std::milli>(end_time - start_time).count();

  return job.completed;
}

std::vector<BatchGraphicalAnalysis::BatchJob>
BatchGraphicalAnalysis::GetCompletedJobs() const {
  std::vector<BatchJob> completed;

  for (const auto &job : m_jobs) {
    if (job.completed) {
      completed.push_back(job);
    }
  }

  return completed;
}

std::vector<BatchGraphicalAnalysis::BatchJob>
BatchGraphicalAnalysis::GetFailedJobs() const {
  std::vector<BatchJob> failed;

  for (const auto &job : m_jobs) {
    if (!job.completed) {
      failed.push_back(job);
    }
  }

  return failed;
}

std::map<std::string, AnalysisResult>
BatchGraphicalAnalysis::GetResultsByRegion() const {
  std::map<std::string, AnalysisResult> results;
  for (const auto &job : m_jobs) {
    if (job.completed) {
      results[job.region_name] = job.result;
    }
  }
  return results;
}

BatchGraphicalAnalysis::BatchStatistics
BatchGraphicalAnalysis::GetBatchStatistics() const {
  BatchStatistics stats;

  stats.total_jobs = static_cast<int>(m_jobs.size());

  for (const auto &job : m_jobs) {
    if (job.completed) {
      stats.completed_jobs++;
    } else {
      stats.failed_jobs++;
    }
    stats.total_processing_time_ms += job.processing_time_ms;
  }

  if (stats.completed_jobs > 0) {
    stats.average_processing_time_ms =
        stats.total_processing_time_ms / stats.completed_jobs;
  }

  return stats;
}

} // namespace graphical
} // namespace petkinetics
