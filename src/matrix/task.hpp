#pragma once

#include <compare>
#include <string>

namespace nucleobench::matrix {

// One (model, exam) evaluation unit. The pair is the primary key for the
// result cache and is unique within a run.
struct Task {
  std::string model_id;
  std::string exam_id;

  std::string Key() const {
    return model_id + "/" + exam_id;
  }

  bool operator==(const Task& other) const = default;
  auto operator<=>(const Task& other) const = default;
};

} // namespace nucleobench::matrix
