#pragma once

#include <boost/algorithm/string.hpp>
#include <concepts>
#include <string>
#include <string_view>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief What a native command left behind after one run.
 */
struct ExecutionOutcome {
  /**
   * Exit status of the command, 0 on success.
   */
  int exit_code = 0;

  /**
   * Standard error split into lines, without line terminators.
   */
  std::vector<std::string> stderr_lines;

  /**
   * Standard output, verbatim.
   */
  std::string output;
};

/**
 * Anything able to run a command by identifier.
 * - `execute(identifier, args)` runs the command with the arguments in the
 *   given order and reports its outcome.
 * - It is called with an empty argument list to obtain usage text.
 */
template<typename E>
concept CommandExecutor
  = requires(E& executor, std::string_view identifier,
             const std::vector<std::string>& args) {
      { executor.execute(identifier, args) } -> std::same_as<ExecutionOutcome>;
    };

/**
 * Split captured stream text into lines.
 * - The empty piece behind a trailing newline is dropped, so "a\nb\n"
 *   becomes {"a", "b"} and "" becomes {}.
 */
inline auto
split_lines(std::string_view text) {
  auto lines = std::vector<std::string>{};
  if (text.empty())
    return lines;
  const auto buffer = std::string{text};
  boost::split(lines, buffer, boost::is_any_of("\n"));
  if (lines.back().empty())
    lines.pop_back();
  return lines;
}

}  // namespace biodispatch
