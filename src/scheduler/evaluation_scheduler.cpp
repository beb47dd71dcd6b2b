#include "scheduler/evaluation_scheduler.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "verify/verifier.hpp"

#include <utility>

namespace nucleobench::scheduler {

results::Result BuildCompletedResult(const matrix::Task& task, const exams::ExamSpec& exam,
                                     const sandbox::ExecutionArtifact& artifact,
                                     std::string_view marker, double duration_seconds) {
  results::Result result;
  result.model = task.model_id;
  result.exam = task.exam_id;
  result.output = verify::NormalizeConsoleOutput(artifact.raw_console_capture, marker);

  const verify::VerificationResult verification =
      verify::VerifyOutput(result.output, exam.expected_variants);
  result.passed = verification.passed;
  if (verification.matched_variant.has_value()) {
    result.expected = exam.expected_variants[*verification.matched_variant];
  } else if (!exam.expected_variants.empty()) {
    result.expected = exam.expected_variants.front();
  }

  result.diff = artifact.patch_diff;
  result.boot_capture = artifact.raw_console_capture;
  result.agent_transcript = artifact.agent_transcript;
  result.duration_seconds = duration_seconds;
  return result;
}

EvaluationScheduler::EvaluationScheduler(SchedulerOptions options,
                                         const results::ResultStore& store,
                                         sandbox::SandboxAdapter& adapter,
                                         prompts::IPromptSource& prompt_source,
                                         core::logging::Logger& logger, std::ostream& progress)
    : options_(std::move(options)), store_(store), adapter_(adapter),
      prompt_source_(prompt_source), logger_(logger), progress_(progress) {}

void EvaluationScheduler::Transition(TaskOutcome& outcome, TaskState next) {
  logger_.Debug("task state change",
                {{"from", ToString(outcome.state)}, {"to", ToString(next)}});
  outcome.state = next;
}

bool EvaluationScheduler::TryCacheHit(const matrix::Task& task, TaskOutcome& outcome) {
  if (options_.bypass_cache || !store_.Exists(task)) {
    return false;
  }

  std::string error;
  results::Result cached;
  if (!store_.Get(task, cached, error)) {
    logger_.Warn("cached result unreadable; re-running task", {{"error", error}});
    return false;
  }

  Transition(outcome, TaskState::kCacheHit);
  outcome.cached = true;
  outcome.result = std::move(cached);
  Transition(outcome, VerdictState(outcome.result));
  return true;
}

results::Result EvaluationScheduler::Execute(const matrix::Task& task,
                                             const config::ModelSpec& model,
                                             const exams::ExamSpec& exam,
                                             const credentials::ResolvedCredential& credential) {
  const auto started = std::chrono::steady_clock::now();

  std::string prompt;
  std::string error;
  if (!prompt_source_.BuildPrompt(exam, prompt, error)) {
    logger_.Error("prompt extraction failed", {{"error", error}});
    return results::MakeErroredResult(task, "Failed to extract PDF",
                                      core::ToSeconds(std::chrono::steady_clock::now() - started));
  }

  sandbox::TaskRunRequest request;
  request.task = task;
  request.image = options_.image;
  request.source_bundle_path = exam.source_bundle_path;
  request.prompt = std::move(prompt);
  request.agent.provider_id = credential.provider_id;
  request.agent.model_identifier = model.model_identifier;
  request.agent.env_var = credential.env_var;
  request.agent.api_key = credential.value;
  request.timeout = options_.timeout;
  request.work_dir = store_.WorkDir(task);

  const sandbox::TaskRunOutcome run = adapter_.Run(request);
  const double duration_seconds =
      core::ToSeconds(std::chrono::steady_clock::now() - started);

  if (!options_.keep_work_dirs) {
    core::RemovePathBestEffort(request.work_dir);
  }

  switch (run.status) {
  case sandbox::TaskRunStatus::kSandboxUnavailable:
    logger_.Error("sandbox unavailable", {{"error", run.error}});
    return results::MakeErroredResult(task, "Sandbox unavailable: " + run.error,
                                      duration_seconds);
  case sandbox::TaskRunStatus::kTimeout:
    logger_.Warn("task timed out", {{"timeout_s", std::to_string(options_.timeout.count())}});
    return results::MakeErroredResult(
        task, "Timeout after " + std::to_string(options_.timeout.count()) + "s",
        duration_seconds);
  case sandbox::TaskRunStatus::kCompleted:
    break;
  }

  if (run.artifact.agent_exit_code.has_value() && *run.artifact.agent_exit_code != 0) {
    logger_.Warn("agent exited non-zero; build and boot still evaluated",
                 {{"agent_exit_code", std::to_string(*run.artifact.agent_exit_code)}});
  }
  if (exam.expected_variants.empty()) {
    logger_.Warn("exam has no expected variants; task cannot pass", {{"exam", exam.name}});
  }

  return BuildCompletedResult(task, exam, run.artifact, options_.marker, duration_seconds);
}

TaskOutcome EvaluationScheduler::RunTask(const matrix::Task& task,
                                         const config::ModelSpec& model,
                                         const exams::ExamSpec& exam,
                                         const credentials::ResolvedCredential* credential) {
  core::logging::ScopedTaskLogScope scope(logger_, task.Key());

  TaskOutcome outcome;
  outcome.task = task;

  if (TryCacheHit(task, outcome)) {
    progress_ << "[CACHED] " << task.model_id << " x " << task.exam_id << '\n';
    return outcome;
  }

  Transition(outcome, TaskState::kRunning);
  progress_ << "[RUN] " << task.model_id << " x " << task.exam_id << '\n';
  progress_.flush();

  if (credential == nullptr) {
    outcome.result = results::MakeErroredResult(
        task, "Missing credential for provider '" + model.provider + "'");
  } else {
    outcome.result = Execute(task, model, exam, *credential);
  }
  Transition(outcome, VerdictState(outcome.result));

  std::string error;
  outcome.stored = store_.Put(task, outcome.result, error);
  if (!outcome.stored) {
    logger_.Error("result store failed", {{"error", error}});
  }

  progress_ << "  -> " << (outcome.result.passed ? "PASS" : "FAIL");
  if (outcome.result.error.has_value()) {
    progress_ << " (" << *outcome.result.error << ')';
  }
  if (outcome.result.duration_seconds.has_value()) {
    progress_ << " in " << core::FormatSeconds(*outcome.result.duration_seconds) << 's';
  }
  progress_ << '\n';
  return outcome;
}

RunSummary EvaluationScheduler::Run(
    const matrix::TaskMatrix& matrix,
    const std::map<std::string, credentials::ResolvedCredential>& credentials) {
  RunSummary summary;
  summary.rows.reserve(matrix.tasks.size());

  logger_.Info("evaluation started", {{"tasks", std::to_string(matrix.tasks.size())},
                                      {"bypass_cache", options_.bypass_cache ? "true" : "false"}});

  for (const auto& task : matrix.tasks) {
    const config::ModelSpec* model = matrix.FindModel(task.model_id);
    const exams::ExamSpec* exam = matrix.FindExam(task.exam_id);
    if (model == nullptr || exam == nullptr) {
      logger_.Error("task references unknown model or exam", {{"task", task.Key()}});
      continue;
    }

    const auto credential_it = credentials.find(model->provider);
    const credentials::ResolvedCredential* credential =
        credential_it == credentials.end() ? nullptr : &credential_it->second;

    TaskOutcome outcome = RunTask(task, *model, *exam, credential);
    if (!outcome.cached && !outcome.stored) {
      ++summary.store_failures;
    }

    SummaryRow row;
    row.model = task.model_id;
    row.exam = task.exam_id;
    row.state = outcome.state;
    row.cached = outcome.cached;
    row.error = outcome.result.error;
    summary.rows.push_back(std::move(row));
  }

  logger_.Info("evaluation finished",
               {{"tasks", std::to_string(summary.rows.size())},
                {"passed", std::to_string(summary.PassedCount())},
                {"errored", std::to_string(summary.ErroredCount())},
                {"cached", std::to_string(summary.CachedCount())}});
  return summary;
}

} // namespace nucleobench::scheduler
