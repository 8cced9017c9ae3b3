#pragma once

#include <biodispatch/dispatch/diagnostic_filter.hpp>
#include <biodispatch/dispatch/error.hpp>
#include <biodispatch/dispatch/executor.hpp>
#include <biodispatch/dispatch/invocation_result.hpp>
#include <biodispatch/dispatch/parser_binding.hpp>
#include <boost/algorithm/string/join.hpp>
#include <spdlog/spdlog.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Calls one toolkit command as if it were a function.
 *
 * The dispatcher runs its command through the executor, turns failures into
 * exceptions and, if asked for and available, hands the output to a parser.
 *
 * Example:
 * ```cpp
 * auto executor = RoutineExecutor{};
 * auto flagstat = Dispatcher{executor, "flagstat", "flagstat", {}};
 * auto result = flagstat({"in.bam"});
 * std::cout << result.output();
 * ```
 *
 * @note A command may fail without a non-zero exit code, so any stderr line
 *       that is not a known benign diagnostic is treated as an error.
 */
template<CommandExecutor Executor>
class Dispatcher {
 public:
  /**
   * @param executor Runs the command; must outlive the dispatcher.
   * @param identifier Name the executor knows the command by.
   * @param public_name Name callers use.
   * @param parsers Parser bindings, tried in this order.
   * @param config Benign diagnostic prefixes.
   */
  Dispatcher(Executor& executor, std::string identifier,
             std::string public_name, std::vector<ParserBinding> parsers,
             DispatchConfig config = {})
  : executor_(&executor),
    identifier_(std::move(identifier)),
    public_name_(std::move(public_name)),
    parsers_(std::move(parsers)),
    config_(std::move(config)) {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * Run the command.
   *
   * @param args Positional arguments, passed on unchanged and in order.
   * @param options Named options; `raw` disables parsing.
   * @throw ExecutionFailed if the command exits with a non-zero code.
   * @throw UnexpectedDiagnostic if the command writes unknown lines to stderr.
   * @return The output, parsed by the first matching binding if any.
   */
  auto
  operator()(const std::vector<std::string>& args,
             const CallOptions& options = {}) {
    SPDLOG_DEBUG("Dispatch {} with {} argument(s)", identifier_, args.size());
    auto outcome = executor_->execute(identifier_, args);
    {
      auto lock = std::scoped_lock{mutex_};
      messages_ = outcome.stderr_lines;
    }

    if (outcome.exit_code != 0) {
      auto error
        = ExecutionFailed{identifier_, outcome.exit_code, outcome.stderr_lines};
      SPDLOG_ERROR("{}", error.what());
      throw error;
    }

    if (auto suspicious
        = suspicious_lines(outcome.stderr_lines, config_.benign_prefixes);
        !suspicious.empty()) {
      auto error = UnexpectedDiagnostic{std::move(suspicious)};
      SPDLOG_ERROR("{} wrote to stderr: {}", identifier_, error.what());
      throw error;
    }

    if (options.raw || outcome.output.empty() || parsers_.empty())
      return InvocationResult{std::move(outcome.output),
                              std::move(outcome.stderr_lines)};

    const auto* binding = select_parser(parsers_, args);
    if (binding == nullptr)
      return InvocationResult{std::move(outcome.output),
                              std::move(outcome.stderr_lines)};

    SPDLOG_DEBUG("Parse output of {} requiring [{}]", identifier_,
                 boost::algorithm::join(binding->required_options, " "));
    auto parsed = binding->transform(outcome.output, options);
    return InvocationResult{std::move(outcome.output),
                            std::move(outcome.stderr_lines), std::move(parsed)};
  }

  /**
   * stderr lines of the most recent call, unfiltered, whether it succeeded or
   * not.
   */
  auto
  messages() const {
    auto lock = std::scoped_lock{mutex_};
    return messages_;
  }

  /**
   * Usage text of the command, i.e. what it prints to stderr when run
   * without arguments.
   */
  auto
  usage() const {
    const auto outcome
      = executor_->execute(identifier_, std::vector<std::string>{});
    return boost::algorithm::join(outcome.stderr_lines, "\n");
  }

  const auto&
  identifier() const noexcept {
    return identifier_;
  }

  const auto&
  public_name() const noexcept {
    return public_name_;
  }

  const auto&
  parsers() const noexcept {
    return parsers_;
  }

 private:
  Executor* executor_;
  std::string identifier_;
  std::string public_name_;
  std::vector<ParserBinding> parsers_;
  DispatchConfig config_;

  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

}  // namespace biodispatch
