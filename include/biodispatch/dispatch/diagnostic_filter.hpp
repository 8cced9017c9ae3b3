#pragma once

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Settings shared by every dispatcher built from one registry.
 */
struct DispatchConfig {
  /**
   * Prefixes of stderr lines the toolkit prints during normal operation.
   * - "[sam_header_read2]": reference sequences were loaded from a header.
   * - "[bam_index_load]": an index file was loaded.
   * - "[bam_sort_core]": progress of the sort merge step.
   * - "[samopen] SAM header is present": a SAM file carried a header.
   */
  constexpr static auto BENIGN_PREFIXES = std::array{
    "[sam_header_read2]", "[bam_index_load]", "[bam_sort_core]",
    "[samopen] SAM header is present"};

  /**
   * A stderr line starting with any of these is not treated as an error.
   */
  std::vector<std::string> benign_prefixes
    = std::vector<std::string>(BENIGN_PREFIXES.begin(), BENIGN_PREFIXES.end());
};

/**
 * Whether a stderr line is a known harmless diagnostic.
 *
 * @param line One stderr line.
 * @param prefixes Recognized diagnostic prefixes.
 * @return true if the line begins with one of the prefixes.
 */
inline auto
is_benign(std::string_view line, const std::vector<std::string>& prefixes) {
  return std::ranges::any_of(prefixes, [line](const auto& prefix) {
    return line.starts_with(prefix);
  });
}

/**
 * Drop the harmless lines and keep the rest in their original order.
 *
 * @param lines stderr lines of one run.
 * @param prefixes Recognized diagnostic prefixes.
 * @return The suspicious lines.
 */
inline auto
suspicious_lines(const std::vector<std::string>& lines,
                 const std::vector<std::string>& prefixes) {
  auto suspicious = std::vector<std::string>{};
  for (const auto& line : lines) {
    if (is_benign(line, prefixes)) {
      SPDLOG_DEBUG("Suppressed diagnostic: {}", line);
      continue;
    }
    suspicious.push_back(line);
  }
  return suspicious;
}

}  // namespace biodispatch
