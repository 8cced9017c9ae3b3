#pragma once

#include <algorithm>
#include <any>
#include <concepts>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Named options of one call.
 */
struct CallOptions {
  /**
   * Return the output as is, even if a parser would match.
   */
  bool raw = false;

  /**
   * Any other named option. The dispatcher ignores them; parsers may read
   * them.
   */
  std::map<std::string, std::string, std::less<>> extra;
};

/**
 * Pairs a set of command line options with a transform of the output.
 * - The binding applies when every option in `required_options` appears
 *   literally among the positional arguments of the call.
 */
struct ParserBinding {
  using Transform
    = std::function<std::any(const std::string& output, const CallOptions&)>;

  std::set<std::string> required_options;
  Transform transform;
};

/**
 * Check the required options against the literal arguments of a call.
 * - Only exact strings count, "-c" is not found inside "-cv".
 * - An empty requirement always matches.
 */
inline auto
options_match(const std::vector<std::string>& args,
              const std::set<std::string>& required) {
  return std::ranges::all_of(required, [&args](const auto& option) {
    return std::ranges::find(args, option) != args.end();
  });
}

/**
 * First binding in registration order whose options all appear in `args`.
 *
 * @return The binding, or nullptr if none applies.
 */
inline auto
select_parser(const std::vector<ParserBinding>& bindings,
              const std::vector<std::string>& args) -> const ParserBinding* {
  auto itr = std::ranges::find_if(bindings, [&args](const auto& binding) {
    return options_match(args, binding.required_options);
  });
  return itr == bindings.end() ? nullptr : &*itr;
}

/**
 * Build a binding from a plain callable.
 *
 * @param required Options that must be present for the parser to apply.
 * @param f Callable taking the output, and optionally the CallOptions,
 *          returning any value.
 */
template<typename F>
  requires std::invocable<F, const std::string&>
        || std::invocable<F, const std::string&, const CallOptions&>
auto
make_parser(std::set<std::string> required, F f) {
  auto transform
    = [f = std::move(f)](const std::string& output,
                         const CallOptions& options) -> std::any {
    if constexpr (std::invocable<F, const std::string&, const CallOptions&>)
      return f(output, options);
    else
      return f(output);
  };
  return ParserBinding{std::move(required), std::move(transform)};
}

}  // namespace biodispatch
