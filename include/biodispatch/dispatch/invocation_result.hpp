#pragma once

#include <any>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Value returned by a successful dispatch.
 *
 * Holds the raw output, and the parsed value when a parser was applied. The
 * stderr lines of the same call travel with it.
 */
class InvocationResult {
 public:
  InvocationResult(std::string output, std::vector<std::string> messages)
  : output_(std::move(output)), messages_(std::move(messages)) {}

  InvocationResult(std::string output, std::vector<std::string> messages,
                   std::any parsed)
  : output_(std::move(output)),
    messages_(std::move(messages)),
    parsed_(std::move(parsed)),
    is_parsed_(true) {}

  /**
   * Standard output of the command, never transformed.
   */
  const auto&
  output() const noexcept {
    return output_;
  }

  /**
   * Unfiltered stderr lines of this call.
   */
  const auto&
  messages() const noexcept {
    return messages_;
  }

  auto
  is_parsed() const noexcept {
    return is_parsed_;
  }

  /**
   * The parser's value.
   *
   * @tparam T Type the parser returned.
   * @throw std::logic_error if no parser was applied.
   * @throw std::bad_any_cast if T is not the parser's type.
   */
  template<typename T>
  const T&
  as() const& {
    if (!is_parsed_)
      throw std::logic_error("Output was not parsed.");
    return std::any_cast<const T&>(parsed_);
  }

  /**
   * Not available on temporaries; keep the result in a variable.
   */
  template<typename T>
  const T&
  as() const&& = delete;

 private:
  std::string output_;
  std::vector<std::string> messages_;
  std::any parsed_;
  bool is_parsed_ = false;
};

}  // namespace biodispatch
