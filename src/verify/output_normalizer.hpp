#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nucleobench::verify {

// Console lines carrying program output are tagged with this token by the
// kernel's log when built with AUTOCORR.
inline constexpr std::string_view kDefaultMarker = "USR";

// Converts a raw boot console capture into comparison lines.
//
// Rules, per line:
// - lines without `marker` are dropped
// - the line is trimmed
// - `<marker><ws+><digits><ws+>` collapses to `<marker> ` (removes the
//   per-boot counter)
// - a leading `<marker> ` is stripped, leaving the payload
// - lines that end up empty are dropped
//
// Total: malformed input only ever produces fewer lines.
std::vector<std::string> NormalizeConsoleOutput(std::string_view raw_capture,
                                                std::string_view marker = kDefaultMarker);

// Applies the per-line rules to a single line. Returns false when the line is
// dropped.
bool NormalizeConsoleLine(std::string_view line, std::string_view marker, std::string& payload);

} // namespace nucleobench::verify
