#pragma once

#include <biodispatch/dispatch/executor.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace biodispatch {

/**
 * @ingroup dispatch
 * @brief Runs commands of a toolkit binary as child processes.
 *
 * `execute("sort", {"-o", "out.bam", "in.bam"})` runs
 * `<program> sort -o out.bam in.bam` and collects both output streams.
 * The child reads its standard input from `/dev/null`.
 */
class ProcessExecutor {
 public:
  /**
   * @param program Toolkit binary; looked up in PATH if it has no slash.
   */
  explicit ProcessExecutor(std::filesystem::path program)
  : program_(std::move(program)) {}

  /**
   * Run `<program> <identifier> <args...>` and wait for it.
   *
   * @throw std::system_error if the pipes or the child cannot be created.
   * @return The outcome; 127 if the program cannot be executed, 128 plus the
   *         signal number if the child was killed.
   */
  auto
  execute(std::string_view identifier,
          const std::vector<std::string>& args) const -> ExecutionOutcome {
    auto argv_strings = std::vector<std::string>{program_.string(),
                                                 std::string{identifier}};
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    auto argv = std::vector<char*>{};
    argv.reserve(argv_strings.size() + 1);
    for (auto& arg : argv_strings)
      argv.push_back(arg.data());
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
      throw std::system_error(errno, std::generic_category(), "pipe");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
      const auto error = errno;
      close_all({out_pipe[0], out_pipe[1]});
      throw std::system_error(error, std::generic_category(), "pipe");
    }

    SPDLOG_DEBUG("Running {} {}", program_.string(), identifier);
    const auto pid = fork();
    if (pid < 0) {
      const auto error = errno;
      close_all({out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]});
      throw std::system_error(error, std::generic_category(), "fork");
    }
    if (pid == 0) {
      const auto null_fd = open("/dev/null", O_RDONLY);
      if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) {
        dup2(err_pipe[1], STDERR_FILENO);
        std::perror("/dev/null");
        _exit(127);
      }
      if (null_fd != STDIN_FILENO)
        close(null_fd);
      dup2(out_pipe[1], STDOUT_FILENO);
      dup2(err_pipe[1], STDERR_FILENO);
      execvp(argv[0], argv.data());
      std::perror(argv[0]);
      _exit(127);
    }
    close_all({out_pipe[1], err_pipe[1]});

    auto outcome = ExecutionOutcome{};
    auto err_text = std::string{};
    const auto poll_error
      = drain(out_pipe[0], err_pipe[0], outcome.output, err_text);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (poll_error != 0)
      throw std::system_error(poll_error, std::generic_category(), "poll");

    if (WIFEXITED(status))
      outcome.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
      outcome.exit_code = 128 + WTERMSIG(status);
    else
      outcome.exit_code = 1;
    outcome.stderr_lines = split_lines(err_text);
    SPDLOG_DEBUG("{} {} exited with {}", program_.string(), identifier,
                 outcome.exit_code);
    return outcome;
  }

  const auto&
  program() const noexcept {
    return program_;
  }

 private:
  static void
  close_all(std::initializer_list<int> fds) {
    for (auto fd : fds)
      close(fd);
  }

  /**
   * Read both pipes until the child closes them. Closes the descriptors.
   *
   * @return 0, or the errno of a failed poll.
   */
  static int
  drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    auto fds = std::array<pollfd, 2>{
      pollfd{out_fd, POLLIN, 0}, pollfd{err_fd, POLLIN, 0}};
    auto sinks = std::array<std::string*, 2>{&out, &err};
    auto buffer = std::array<char, 4096>{};
    auto open = 2;
    while (open > 0) {
      if (poll(fds.data(), fds.size(), -1) < 0) {
        if (errno == EINTR)
          continue;
        const auto error = errno;
        for (auto& fd : fds)
          if (fd.fd >= 0)
            close(fd.fd);
        return error;
      }
      for (auto i = 0u; i < fds.size(); i++) {
        auto& fd = fds[i];
        if (fd.fd < 0 || fd.revents == 0)
          continue;
        const auto n = read(fd.fd, buffer.data(), buffer.size());
        if (n > 0)
          sinks[i]->append(buffer.data(), n);
        else if (n == 0 || errno != EINTR) {
          close(fd.fd);
          fd.fd = -1;
          open--;
        }
      }
    }
    return 0;
  }

  std::filesystem::path program_;
};

}  // namespace biodispatch
