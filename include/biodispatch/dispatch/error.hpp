#pragma once

#include <boost/algorithm/string/join.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Raised whenever a dispatched command does not finish cleanly.
 *
 * Two causes are told apart through `kind()`; catch the concrete type when
 * the extra fields are needed.
 */
struct DispatchError : std::runtime_error {
  enum class Kind : std::uint8_t { EXECUTION_FAILED, UNEXPECTED_DIAGNOSTIC };

  DispatchError(Kind kind, const std::string& message)
  : std::runtime_error(message), kind_(kind) {}

  auto
  kind() const noexcept {
    return kind_;
  }

 private:
  Kind kind_;
};

/**
 * The command returned a non-zero exit code.
 */
struct ExecutionFailed : DispatchError {
  ExecutionFailed(std::string identifier, int exit_code,
                  const std::vector<std::string>& stderr_lines)
  : DispatchError(Kind::EXECUTION_FAILED,
                  "'" + identifier + "' returned with error "
                    + std::to_string(exit_code) + ": "
                    + boost::algorithm::join(stderr_lines, "\n")),
    identifier(std::move(identifier)),
    exit_code(exit_code),
    stderr_text(boost::algorithm::join(stderr_lines, "\n")) {}

  std::string identifier;
  int exit_code;
  std::string stderr_text;
};

/**
 * The command exited with 0 but wrote lines to stderr that are not known to
 * be harmless. The message is exactly those lines joined by newlines.
 */
struct UnexpectedDiagnostic : DispatchError {
  explicit UnexpectedDiagnostic(std::vector<std::string> lines)
  : DispatchError(Kind::UNEXPECTED_DIAGNOSTIC,
                  boost::algorithm::join(lines, "\n")),
    lines(std::move(lines)) {}

  std::vector<std::string> lines;
};

}  // namespace biodispatch
