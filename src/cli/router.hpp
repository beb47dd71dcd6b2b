#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace nucleobench::cli {

// Options shared by `nucleobench run` and in-process callers.
struct RunOptions {
  std::filesystem::path models_path = "models.json";
  std::filesystem::path exams_dir = "exams";
  std::filesystem::path results_dir = "results";
  std::filesystem::path secrets_path = ".env";
  std::chrono::seconds timeout{600};
  std::string image = "calcolatori-bench";
  std::filesystem::path dockerfile = "container/Dockerfile";
  std::filesystem::path docker_context = "container";
  bool build_image = false;
  bool bypass_cache = false;
  std::optional<std::string> model_filter;
  std::optional<std::string> exam_filter;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Full evaluation run: configuration, credential pre-flight, image check,
// then every task. Returns a process exit code; task verdicts never affect
// it.
int ExecuteRun(const RunOptions& options);

// Routes `nucleobench` subcommands and returns process exit codes with a
// stable contract for scripts and CI:
//   0  => success (all tasks processed, whatever their verdicts)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration error (models, exams, filters)
//   11 => missing credential
//   20 => sandbox image unavailable
int Dispatch(int argc, char** argv);

} // namespace nucleobench::cli
