#pragma once

/**
 *  @defgroup dispatch dispatch
 *  @brief Runs toolkit subcommands as function calls, turns their failures
 * into exceptions and parses their output.
 */

#include <biodispatch/dispatch/diagnostic_filter.hpp>
#include <biodispatch/dispatch/dispatcher.hpp>
#include <biodispatch/dispatch/error.hpp>
#include <biodispatch/dispatch/executor.hpp>
#include <biodispatch/dispatch/invocation_result.hpp>
#include <biodispatch/dispatch/parser_binding.hpp>
#include <biodispatch/dispatch/process_executor.hpp>
#include <biodispatch/dispatch/registry.hpp>
#include <biodispatch/dispatch/routine_executor.hpp>
