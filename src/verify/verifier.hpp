#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nucleobench::verify {

using OutputLines = std::vector<std::string>;

struct VerificationResult {
  bool passed = false;
  // Index into the variants list of the first exact match.
  std::optional<std::size_t> matched_variant;
};

// Strict comparison: passes iff `actual` equals at least one variant
// line-for-line, in order and with the same count. No variants never passes.
VerificationResult VerifyOutput(const OutputLines& actual,
                                const std::vector<OutputLines>& expected_variants);

} // namespace nucleobench::verify
