#pragma once

#include "config/model_catalog.hpp"
#include "exams/exam_catalog.hpp"
#include "matrix/task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nucleobench::matrix {

// Exact-match selection of a subset of the matrix.
struct TaskFilter {
  std::optional<std::string> model_name;
  std::optional<std::string> exam_name;
};

// Expanded task list plus the specs it references, already narrowed.
struct TaskMatrix {
  std::vector<config::ModelSpec> models;
  std::vector<exams::ExamSpec> exams;
  std::vector<Task> tasks;

  const config::ModelSpec* FindModel(const std::string& name) const;
  const exams::ExamSpec* FindExam(const std::string& name) const;
};

// Builds the model-major cross product of `models` x `exams` after applying
// `filter`. Fails (configuration error) when either input is empty or when a
// requested filter matches nothing. Pure: touches neither disk nor
// environment.
bool BuildTaskMatrix(const std::vector<config::ModelSpec>& models,
                     const std::vector<exams::ExamSpec>& exams, const TaskFilter& filter,
                     TaskMatrix& matrix, std::string& error);

} // namespace nucleobench::matrix
