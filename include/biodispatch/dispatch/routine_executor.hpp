#pragma once

#include <biodispatch/dispatch/executor.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <functional>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Runs native routines linked into the process.
 *
 * Each routine behaves like the `main` of a subcommand: it gets the
 * arguments, writes to the two streams it is handed and returns an exit
 * code.
 */
class RoutineExecutor {
 public:
  using Routine = std::function<int(const std::vector<std::string>& args,
                                    std::ostream& out, std::ostream& err)>;

  /**
   * Register a routine.
   *
   * @throw std::invalid_argument if the identifier is taken.
   */
  auto&
  add(std::string identifier, Routine routine) {
    if (routines_.contains(identifier))
      throw std::invalid_argument("Duplicated routine: " + identifier);
    routines_.emplace(std::move(identifier), std::move(routine));
    return *this;
  }

  auto
  contains(std::string_view identifier) const {
    return routines_.find(identifier) != routines_.end();
  }

  /**
   * Run the routine registered as `identifier`.
   * - An unknown identifier exits with 1, as the toolkit does.
   * - A routine throwing std::exception exits with 1 and its message as the
   *   last stderr line.
   */
  auto
  execute(std::string_view identifier,
          const std::vector<std::string>& args) const -> ExecutionOutcome {
    auto itr = routines_.find(identifier);
    if (itr == routines_.end())
      return {1,
              {"[main] unrecognized command '" + std::string{identifier} + "'"},
              {}};

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    auto exit_code = 0;
    try {
      exit_code = itr->second(args, out, err);
    } catch (const std::exception& e) {
      SPDLOG_DEBUG("Routine {} threw: {}", identifier, e.what());
      if (const auto text = err.str(); !text.empty() && text.back() != '\n')
        err << '\n';
      err << e.what() << '\n';
      exit_code = 1;
    }
    return {exit_code, split_lines(err.str()), out.str()};
  }

 private:
  std::map<std::string, Routine, std::less<>> routines_;
};

}  // namespace biodispatch
