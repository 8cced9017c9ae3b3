#pragma once

#include <biodispatch/dispatch/dispatcher.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief One entry of a command table.
 */
struct CommandSpec {
  /**
   * Name passed to the executor.
   */
  std::string identifier;

  /**
   * Name callers look the command up by.
   * - Differs from the identifier when the latter is awkward to use, e.g.
   *   "import" is published as "samimport".
   */
  std::string public_name;

  /**
   * Output parsers, most specific first.
   */
  std::vector<ParserBinding> parsers;
};

/**
 * @ingroup dispatch
 * @brief Every command of a table, callable by its public name.
 *
 * The registry builds one Dispatcher per table entry on construction and is
 * not changed afterwards. Adding a command means adding a table entry.
 *
 * Example:
 * ```cpp
 * auto executor = make_samtools_executor();
 * auto samtools = make_samtools(executor);
 * auto stats = samtools.at("flagstat")({"in.bam"});
 * ```
 */
template<CommandExecutor Executor>
class CommandRegistry {
 public:
  using dispatcher_type = Dispatcher<Executor>;

  /**
   * @param executor Shared by all dispatchers; must outlive the registry.
   * @param table Commands to publish.
   * @param config Passed to every dispatcher.
   * @throw std::invalid_argument if two entries share a public name.
   */
  CommandRegistry(Executor& executor, const std::vector<CommandSpec>& table,
                  const DispatchConfig& config = {}) {
    for (const auto& spec : table) {
      const auto inserted
        = dispatchers_
            .try_emplace(spec.public_name, executor, spec.identifier,
                         spec.public_name, spec.parsers, config)
            .second;
      if (!inserted)
        throw std::invalid_argument("Duplicated command name: "
                                    + spec.public_name);
    }
    SPDLOG_DEBUG("Registered {} command(s)", dispatchers_.size());
  }

  /**
   * Get the dispatcher published under `name`.
   *
   * @throw std::out_of_range if there is no such command.
   */
  auto&
  at(std::string_view name) {
    if (auto* dispatcher = find(name); dispatcher != nullptr)
      return *dispatcher;
    throw std::out_of_range{"Command is not registered: " + std::string{name}};
  }

  const auto&
  at(std::string_view name) const {
    if (const auto* dispatcher = find(name); dispatcher != nullptr)
      return *dispatcher;
    throw std::out_of_range{"Command is not registered: " + std::string{name}};
  }

  /**
   * @return The dispatcher, nullptr if there is no such command.
   */
  auto
  find(std::string_view name) -> dispatcher_type* {
    auto itr = dispatchers_.find(name);
    return itr == dispatchers_.end() ? nullptr : &itr->second;
  }

  auto
  find(std::string_view name) const -> const dispatcher_type* {
    auto itr = dispatchers_.find(name);
    return itr == dispatchers_.end() ? nullptr : &itr->second;
  }

  auto
  contains(std::string_view name) const {
    return find(name) != nullptr;
  }

  /**
   * Public names in lexicographic order.
   */
  auto
  names() const {
    auto names = std::vector<std::string>{};
    names.reserve(dispatchers_.size());
    for (const auto& [name, dispatcher] : dispatchers_)
      names.push_back(name);
    return names;
  }

  auto
  size() const noexcept {
    return dispatchers_.size();
  }

  /**
   * Shortcut for `at(name)(args, options)`.
   */
  auto
  operator()(std::string_view name, const std::vector<std::string>& args,
             const CallOptions& options = {}) {
    return at(name)(args, options);
  }

 private:
  std::map<std::string, dispatcher_type, std::less<>> dispatchers_;
};

}  // namespace biodispatch
