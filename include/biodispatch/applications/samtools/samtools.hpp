#pragma once

#include <biodispatch/dispatch/process_executor.hpp>
#include <biodispatch/dispatch/registry.hpp>
#include <biodispatch/file_io/pileup.hpp>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup applications
 * @brief The samtools subcommands published as functions.
 *
 * Public names equal the samtools command names, except `samimport` which
 * runs `samtools import`. `pileup -c` output is parsed into PileupRecord.
 *
 * @note `pileup` only exists in samtools 0.1.x; later releases reject it and
 *       the call fails with ExecutionFailed. Use `mpileup` with a current
 *       binary.
 */
inline auto
samtools_commands() {
  auto plain = [](std::string name) {
    return CommandSpec{name, name, {}};
  };
  return std::vector<CommandSpec>{
    // documented commands
    plain("view"),
    plain("sort"),
    plain("mpileup"),
    plain("depth"),
    plain("faidx"),
    plain("tview"),
    plain("index"),
    plain("idxstats"),
    plain("fixmate"),
    plain("flagstat"),
    plain("calmd"),
    plain("merge"),
    plain("rmdup"),
    plain("reheader"),
    plain("cat"),
    plain("targetcut"),
    plain("phase"),
    // others
    CommandSpec{"import", "samimport", {}},
    plain("bam2fq"),
    CommandSpec{"pileup", "pileup",
                {make_parser({"-c"}, [](const std::string& output) {
                  return parse_pileup(output);
                })}},
  };
}

/**
 * Executor for an installed samtools binary.
 *
 * @param program Path to samtools, or a name to look up in PATH.
 */
inline auto
make_samtools_executor(std::filesystem::path program = "samtools") {
  return ProcessExecutor{std::move(program)};
}

/**
 * Build the samtools registry on top of `executor`.
 */
template<CommandExecutor Executor>
auto
make_samtools(Executor& executor, const DispatchConfig& config = {}) {
  return CommandRegistry<Executor>{executor, samtools_commands(), config};
}

}  // namespace biodispatch
