#if defined(_WIN32)
#error "processor_posix.cpp should not be compiled on Windows builds"
#else

#include "processor.h"

#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace harvest {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr std::size_t kStderrTailBytes{ 512 };

// Content is handed to the child through a file rather than a pipe so a child that
// never reads stdin cannot block the parent.
std::filesystem::path create_stdin_file(std::string_view content) {
  auto const tmp_dir{ std::filesystem::temp_directory_path() };
  std::string const pattern{ (tmp_dir / "harvest-stdin-XXXXXX").string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  fd_cleanup fd{ ::mkstemp(path_buffer.data()) };
  if (fd.get() == -1) {
    throw std::system_error(errno, std::generic_category(), "mkstemp failed");
  }
  scoped_path_cleanup cleanup{ std::filesystem::path{ path_buffer.data() } };

  util_write_all(fd.get(), content.data(), content.size());
  if (!fd.release()) {
    throw std::system_error(errno, std::generic_category(), "close failed");
  }

  std::filesystem::path result{ cleanup.path() };
  cleanup.dismiss();
  return result;
}

struct pipe_state {
  fd_cleanup read_fd;
  std::string data;
  bool closed;
};

// Drains both pipes until EOF. Returns false if the deadline passed first.
bool stream_pipes(std::array<pipe_state, 2> &pipes,
                  std::chrono::steady_clock::time_point deadline,
                  std::uint64_t max_output_bytes) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].read_fd.get();
    poll_fds[i].events = POLLIN;
  }

  while (closed_count < pipes.size()) {
    auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()) };
    if (remaining.count() <= 0) { return false; }

    int const poll_result{ ::poll(poll_fds.data(),
                                  poll_fds.size(),
                                  static_cast<int>(std::min<long long>(remaining.count(),
                                                                       1000 * 60 * 60))) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (poll_result == 0) { continue; }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{ ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        pipes[i].closed = true;
        ++closed_count;
        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        continue;
      }

      if (pipes[i].data.size() + static_cast<size_t>(read_bytes) > max_output_bytes) {
        throw std::runtime_error("processor output exceeds " +
                                 std::to_string(max_output_bytes) + " bytes");
      }
      pipes[i].data.append(chunk.data(), static_cast<size_t>(read_bytes));
    }
  }
  return true;
}

processor_result status_to_result(int status);

processor_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }
  return status_to_result(status);
}

// A child may close its output and keep running, so reaping is bounded by the same
// deadline as streaming. nullopt if the deadline passed first.
std::optional<processor_result> wait_for_child_until(
    pid_t child,
    std::chrono::steady_clock::time_point deadline) {
  constexpr std::chrono::milliseconds kPollInterval{ 10 };

  while (true) {
    int status{ 0 };
    pid_t const result{ ::waitpid(child, &status, WNOHANG) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (result == child) { return status_to_result(status); }

    auto const now{ std::chrono::steady_clock::now() };
    if (now >= deadline) { return std::nullopt; }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now));
  }
}

// The child leads its own process group; the whole group goes so that background jobs
// the command started cannot outlive it.
void kill_process_group(pid_t child) {
  if (::kill(-child, SIGKILL) == -1) { ::kill(child, SIGKILL); }
}

processor_result status_to_result(int status) {
  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt, .out = {}, .err = {} };
  }
  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig, .out = {}, .err = {} };
  }
  return { .exit_code = status, .signal = std::nullopt, .out = {}, .err = {} };
}

// Everything the child touches is prepared before fork; only async-signal-safe calls
// happen between fork and execve.
[[noreturn]] void exec_child_process(int stdin_fd,
                                     int stdout_write,
                                     int stderr_write,
                                     std::vector<char *> const &argv,
                                     std::vector<char *> const &envp) {
  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ stdin_fd, STDIN_FILENO },
    std::pair{ stdout_write, STDOUT_FILENO },
    std::pair{ stderr_write, STDERR_FILENO },
  };

  ::setpgid(0, 0);

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) { _exit(kChildErrorExit); }
  }

  ::execve(argv[0], argv.data(), envp.data());
  _exit(kChildErrorExit);
}

std::string stderr_tail(std::string const &err) {
  auto const trimmed{ util_trim(err) };
  if (trimmed.size() <= kStderrTailBytes) { return std::string{ trimmed }; }
  return "..." + std::string{ trimmed.substr(trimmed.size() - kStderrTailBytes) };
}

}  // namespace

processor_env_t processor_getenv() {
  processor_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env[std::string{ kv.substr(0, sep) }] = std::string{ kv.substr(sep + 1) };
  }
  return env;
}

processor_result processor_exec(processor_cfg const &cfg,
                                processor_env_t const &env,
                                std::string_view stdin_content) {
  if (cfg.command.empty()) { throw std::invalid_argument("processor: command is empty"); }

  auto const stdin_path{ create_stdin_file(stdin_content) };
  scoped_path_cleanup stdin_cleanup{ stdin_path };

  fd_cleanup stdin_fd{ ::open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC) };
  if (stdin_fd.get() == -1) {
    throw std::system_error(errno, std::generic_category(), "open stdin file failed");
  }

  std::array<std::string, 3> argv_strings{ "/bin/sh", "-c", cfg.command };
  std::vector<char *> argv;
  for (auto &arg : argv_strings) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  env_strings.reserve(env.size());
  for (auto const &[key, value] : env) { env_strings.push_back(key + "=" + value); }
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &entry : env_strings) { envp.push_back(entry.data()); }
  envp.push_back(nullptr);

  // CLOEXEC keeps these pipes out of children forked concurrently by other workers
  int stdout_pipefd[2];
  if (::pipe2(stdout_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe2(stderr_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  auto const deadline{ std::chrono::steady_clock::now() + cfg.timeout };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdin_fd.get(),
                       stdout_write_end.get(),
                       stderr_write_end.get(),
                       argv,
                       envp);
  }

  // Also set from the parent so the group exists before any kill below.
  ::setpgid(child, child);

  stdout_write_end.release();
  stderr_write_end.release();
  stdin_fd.release();

  processor_result result;
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), {}, false },
      pipe_state{ std::move(stderr_read_end), {}, false },
    };

    std::optional<processor_result> exited;
    if (stream_pipes(pipes, deadline, cfg.max_output_bytes)) {
      exited = wait_for_child_until(child, deadline);
    }
    if (!exited) {
      throw std::runtime_error("processor timed out after " +
                               std::to_string(cfg.timeout.count()) + "ms");
    }
    result = std::move(*exited);
    result.out = std::move(pipes[0].data);
    result.err = std::move(pipes[1].data);
  } catch (...) {
    kill_process_group(child);
    wait_for_child(child);
    throw;
  }

  // Background jobs the command left running in its group do not outlive it. ESRCH is
  // the usual answer: nothing was left.
  if (::kill(-child, SIGKILL) == 0) {
    tui::debug("Killed background processes left by: %s", cfg.command.c_str());
  }

  return result;
}

item_fields_t processor_parse_output(std::string_view out) {
  picojson::value root;
  std::string const json{ util_trim(out) };
  if (std::string const err{ picojson::parse(root, json) }; !err.empty()) {
    throw std::runtime_error("processor output is not valid JSON: " + err);
  }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("processor output must be a JSON object");
  }

  item_fields_t fields;
  for (auto const &[name, value] : root.get<picojson::object>()) {
    if (value.is<std::string>()) {
      fields.emplace_back(name, value.get<std::string>());
    } else if (value.is<picojson::null>()) {
      fields.emplace_back(name, std::string{});
    } else {
      fields.emplace_back(name, value.serialize());
    }
  }
  return fields;
}

item_fields_t processor_run(processor_cfg const &cfg, processor_input const &input) {
  auto env{ processor_getenv() };
  env["HARVEST_UNIT"] = std::string{ input.unit };
  env["HARVEST_URL"] = std::string{ input.url };
  env["HARVEST_TEMPLATE_NAME"] = input.tmpl.name;
  env["HARVEST_TEMPLATE_PATH"] = input.tmpl.path.string();

  auto const result{ processor_exec(cfg, env, input.content) };

  if (!result.err.empty()) {
    tui::debug("Processor stderr for %s [%s]: %s",
               std::string{ input.url }.c_str(),
               input.tmpl.name.c_str(),
               stderr_tail(result.err).c_str());
  }

  if (result.signal) {
    throw std::runtime_error("processor killed by signal " + std::to_string(*result.signal) +
                             ": " + stderr_tail(result.err));
  }
  if (result.exit_code != 0) {
    throw std::runtime_error("processor exited with " + std::to_string(result.exit_code) +
                             ": " + stderr_tail(result.err));
  }
  return processor_parse_output(result.out);
}

}  // namespace harvest

#endif  // POSIX implementation
