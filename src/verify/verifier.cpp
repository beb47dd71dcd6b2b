#include "verify/verifier.hpp"

namespace nucleobench::verify {

VerificationResult VerifyOutput(const OutputLines& actual,
                                const std::vector<OutputLines>& expected_variants) {
  VerificationResult result;
  for (std::size_t i = 0; i < expected_variants.size(); ++i) {
    if (actual == expected_variants[i]) {
      result.passed = true;
      result.matched_variant = i;
      return result;
    }
  }
  return result;
}

} // namespace nucleobench::verify
