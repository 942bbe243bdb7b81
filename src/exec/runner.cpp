#include "cmdgate/exec/runner.hpp"

#include "cmdgate/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cmdgate::exec {

namespace {

constexpr const char *kTruncatedMarker = "\n[output truncated]";

struct CapturedStream {
  int fd = -1;
  std::string text;
  bool truncated = false;
  bool open = true;
};

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

ExecutionResult launch_failure(const std::string &what, const int err) {
  ExecutionResult result;
  result.succeeded = false;
  result.error_message = what + ": " + std::strerror(err);
  return result;
}

// Reads what is currently available; returns false once the stream hit EOF.
bool drain_available(CapturedStream &stream, const std::size_t cap) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(stream.fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      const std::size_t remaining = cap > stream.text.size() ? cap - stream.text.size() : 0;
      const std::size_t to_copy = std::min<std::size_t>(remaining, static_cast<std::size_t>(bytes));
      stream.text.append(buffer.data(), to_copy);
      if (to_copy < static_cast<std::size_t>(bytes)) {
        stream.truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN: nothing more right now.
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// The byte cap can land inside a multi-byte sequence; drop the incomplete tail.
void drop_partial_sequence(std::string &text) {
  std::size_t lead = text.size();
  std::size_t continuation = 0;
  while (lead > 0 && continuation < 3 &&
         (static_cast<unsigned char>(text[lead - 1]) & 0xC0U) == 0x80U) {
    --lead;
    ++continuation;
  }
  if (lead == 0) {
    return;
  }
  const auto byte = static_cast<unsigned char>(text[lead - 1]);
  std::size_t expected = 1;
  if (byte >= 0xF0U) {
    expected = 4;
  } else if (byte >= 0xE0U) {
    expected = 3;
  } else if (byte >= 0xC0U) {
    expected = 2;
  }
  if (continuation + 1 < expected) {
    text.resize(lead - 1);
  }
}

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

std::string describe_timeout(const std::chrono::milliseconds timeout) {
  if (timeout.count() % 1000 == 0) {
    return std::to_string(timeout.count() / 1000) + " s";
  }
  return std::to_string(timeout.count()) + " ms";
}

CommandRunner::CommandRunner(RunnerOptions options) : options_(options) {}

ExecutionResult CommandRunner::run(const std::string &command) const {
  const auto started = std::chrono::steady_clock::now();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    return launch_failure("failed to create stdout pipe", errno);
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return launch_failure("failed to create stderr pipe", err);
  }
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return launch_failure("failed to create status pipe", err);
  }

  const char *command_text = command.c_str();
  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    for (int *fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0],
                    &status_pipe[1]}) {
      close_fd(*fd);
    }
    return launch_failure("failed to fork", err);
  }

  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    execl("/bin/sh", "sh", "-c", command_text, static_cast<char *>(nullptr));
    const int err = errno;
    (void)!write(status_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  // Both sides set the group so killpg never races the child's own setpgid.
  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  int exec_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (status_bytes < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    return launch_failure("failed to execute /bin/sh", exec_errno);
  }

  std::array<CapturedStream, 2> streams{};
  streams[0].fd = out_pipe[0];
  streams[1].fd = err_pipe[0];
  for (auto &stream : streams) {
    set_nonblocking(stream.fd);
  }

  const std::size_t cap = options_.max_output_bytes;
  int status = 0;
  bool exited = false;
  bool timed_out = false;
  while (!exited) {
    if (std::chrono::steady_clock::now() - started > options_.timeout) {
      killpg(pid, SIGKILL);
      timed_out = true;
      break;
    }

    std::array<pollfd, 2> fds{};
    for (std::size_t i = 0; i < streams.size(); ++i) {
      fds[i].fd = streams[i].open ? streams[i].fd : -1;
      fds[i].events = POLLIN;
      fds[i].revents = 0;
    }
    (void)poll(fds.data(), fds.size(), 50);

    for (std::size_t i = 0; i < streams.size(); ++i) {
      if (streams[i].open && fds[i].revents != 0) {
        streams[i].open = drain_available(streams[i], cap);
      }
    }

    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      exited = true;
    }
  }

  for (auto &stream : streams) {
    if (stream.open) {
      (void)drain_available(stream, cap);
    }
    close_fd(stream.fd);
  }
  if (!exited) {
    waitpid(pid, &status, 0);
  }

  ExecutionResult result;
  result.stdout_text = std::move(streams[0].text);
  result.stderr_text = std::move(streams[1].text);
  if (streams[0].truncated) {
    drop_partial_sequence(result.stdout_text);
    result.stdout_text += kTruncatedMarker;
  }
  if (streams[1].truncated) {
    drop_partial_sequence(result.stderr_text);
    result.stderr_text += kTruncatedMarker;
  }
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (timed_out) {
    result.succeeded = false;
    result.timed_out = true;
    result.error_message =
        "command exceeded the execution time limit (" + describe_timeout(options_.timeout) + ")";
    return result;
  }

  result.succeeded = true;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string render_execution_result(const ExecutionResult &result, const std::size_t budget) {
  if (!result.succeeded) {
    return "execution failed:\n```\n" + result.error_message + "\n```";
  }

  std::string output;
  if (!result.stdout_text.empty()) {
    output += "output:\n```\n" + result.stdout_text + "\n```\n";
  }
  if (!result.stderr_text.empty()) {
    output += "stderr:\n```\n" + result.stderr_text + "\n```\n";
  }
  if (result.exit_code != 0) {
    output += "exit code: " + std::to_string(result.exit_code) + "\n";
  }
  if (output.empty()) {
    output = "command executed successfully";
  }
  return common::truncate_with_marker(output, budget, "\n... (output truncated)");
}

} // namespace cmdgate::exec
