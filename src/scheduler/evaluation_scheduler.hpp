#pragma once

#include "core/logging/logger.hpp"
#include "credentials/credential_resolver.hpp"
#include "exams/exam_catalog.hpp"
#include "matrix/task_matrix.hpp"
#include "prompts/prompt_source.hpp"
#include "results/result_store.hpp"
#include "sandbox/sandbox_adapter.hpp"
#include "scheduler/run_summary.hpp"
#include "verify/output_normalizer.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace nucleobench::scheduler {

struct SchedulerOptions {
  std::string image = "calcolatori-bench";
  std::chrono::seconds timeout{600};
  bool bypass_cache = false;
  std::string marker = std::string(verify::kDefaultMarker);
  // Keeps per-task scratch directories for debugging.
  bool keep_work_dirs = false;
};

struct TaskOutcome {
  matrix::Task task;
  TaskState state = TaskState::kPending;
  bool cached = false;
  bool stored = false;
  results::Result result;
};

// Turns a completed sandbox execution into a verdict: the raw console
// capture is normalized and compared against every expected variant.
// `expected` holds the matched variant on a pass, otherwise the first one.
results::Result BuildCompletedResult(const matrix::Task& task, const exams::ExamSpec& exam,
                                     const sandbox::ExecutionArtifact& artifact,
                                     std::string_view marker, double duration_seconds);

// Drives every task of a matrix through cache lookup, sandbox execution,
// verification and persistence, one task at a time and in matrix order.
//
// Task-level failures become errored records and never stop the run. Each
// record is stored before the next task starts, so an interrupted run
// resumes from the last completed task.
class EvaluationScheduler {
public:
  EvaluationScheduler(SchedulerOptions options, const results::ResultStore& store,
                      sandbox::SandboxAdapter& adapter, prompts::IPromptSource& prompt_source,
                      core::logging::Logger& logger, std::ostream& progress = std::cout);

  RunSummary Run(const matrix::TaskMatrix& matrix,
                 const std::map<std::string, credentials::ResolvedCredential>& credentials);

  // One task, cache included. `credential` may be null, which yields an
  // errored record.
  TaskOutcome RunTask(const matrix::Task& task, const config::ModelSpec& model,
                      const exams::ExamSpec& exam,
                      const credentials::ResolvedCredential* credential);

private:
  bool TryCacheHit(const matrix::Task& task, TaskOutcome& outcome);
  results::Result Execute(const matrix::Task& task, const config::ModelSpec& model,
                          const exams::ExamSpec& exam,
                          const credentials::ResolvedCredential& credential);
  void Transition(TaskOutcome& outcome, TaskState next);

  SchedulerOptions options_;
  const results::ResultStore& store_;
  sandbox::SandboxAdapter& adapter_;
  prompts::IPromptSource& prompt_source_;
  core::logging::Logger& logger_;
  std::ostream& progress_;
};

} // namespace nucleobench::scheduler
