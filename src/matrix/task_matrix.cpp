#include "matrix/task_matrix.hpp"

namespace nucleobench::matrix {

const config::ModelSpec* TaskMatrix::FindModel(const std::string& name) const {
  for (const auto& model : models) {
    if (model.name == name) {
      return &model;
    }
  }
  return nullptr;
}

const exams::ExamSpec* TaskMatrix::FindExam(const std::string& name) const {
  for (const auto& exam : exams) {
    if (exam.name == name) {
      return &exam;
    }
  }
  return nullptr;
}

bool BuildTaskMatrix(const std::vector<config::ModelSpec>& models,
                     const std::vector<exams::ExamSpec>& exams, const TaskFilter& filter,
                     TaskMatrix& matrix, std::string& error) {
  matrix = TaskMatrix{};

  if (models.empty()) {
    error = "no models found in config";
    return false;
  }
  if (exams.empty()) {
    error = "no exams found";
    return false;
  }

  for (const auto& model : models) {
    if (!filter.model_name.has_value() || model.name == filter.model_name.value()) {
      matrix.models.push_back(model);
    }
  }
  if (matrix.models.empty()) {
    error = "model '" + filter.model_name.value_or("") + "' not found in config";
    return false;
  }

  for (const auto& exam : exams) {
    if (!filter.exam_name.has_value() || exam.name == filter.exam_name.value()) {
      matrix.exams.push_back(exam);
    }
  }
  if (matrix.exams.empty()) {
    error = "exam '" + filter.exam_name.value_or("") + "' not found";
    matrix = TaskMatrix{};
    return false;
  }

  matrix.tasks.reserve(matrix.models.size() * matrix.exams.size());
  for (const auto& model : matrix.models) {
    for (const auto& exam : matrix.exams) {
      matrix.tasks.push_back(Task{model.name, exam.name});
    }
  }
  return true;
}

} // namespace nucleobench::matrix
