#include "subprocess.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace vidpipe::pipeline {

namespace {

constexpr size_t kStderrTailBytes = 4096;

std::string ErrnoMessage(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

class Pipe {
 public:
  Pipe() {
    if (::pipe(fds_.data()) != 0) throw util::TransientIo(ErrnoMessage("pipe"));
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int Read() const {
    return fds_[0];
  }
  int Write() const {
    return fds_[1];
  }
  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  std::array<int, 2> fds_{-1, -1};
};

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) throw std::invalid_argument("empty command line");

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) throw util::TransientIo(ErrnoMessage("fork"));

  if (pid == 0) {
    ::dup2(out_pipe.Write(), STDOUT_FILENO);
    ::dup2(err_pipe.Write(), STDERR_FILENO);
    out_pipe.CloseRead();
    err_pipe.CloseRead();
    ::execvp(c_argv[0], c_argv.data());
    ::_exit(127);
  }

  out_pipe.CloseWrite();
  err_pipe.CloseWrite();

  ProcessResult result;
  std::string   err;

  std::array<pollfd, 2> fds{pollfd{out_pipe.Read(), POLLIN, 0}, pollfd{err_pipe.Read(), POLLIN, 0}};
  size_t                open_fds = 2;
  std::array<char, 8192> buf{};

  using SteadyClock    = std::chrono::steady_clock;
  const bool bounded  = timeout.count() > 0;
  const auto deadline = SteadyClock::now() + timeout;
  bool       timed_out = false;

  while (open_fds > 0) {
    int wait_ms = -1;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
      if (left.count() <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<int64_t>(left.count(), INT32_MAX));
    }
    if (::poll(fds.data(), fds.size(), wait_ms) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

      const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n <= 0) {
        fds[i].fd = -1;
        --open_fds;
        continue;
      }
      auto& sink = i == 0 ? result.out : err;
      sink.append(buf.data(), static_cast<size_t>(n));
      if (i == 1 && err.size() > 2 * kStderrTailBytes) err.erase(0, err.size() - kStderrTailBytes);
    }
  }

  if (timed_out) ::kill(pid, SIGKILL);

  int status = 0;
  for (;;) {
    const pid_t reaped = ::waitpid(pid, &status, bounded && !timed_out ? WNOHANG : 0);
    if (reaped == pid) break;
    if (reaped < 0) {
      if (errno == EINTR) continue;
      throw util::TransientIo(ErrnoMessage("waitpid"));
    }
    // pipes closed but the child has not exited yet
    if (SteadyClock::now() >= deadline) {
      timed_out = true;
      ::kill(pid, SIGKILL);
      continue;
    }
    ::usleep(10 * 1000);
  }

  if (timed_out) {
    throw util::TransientIo(argv[0] + " killed after exceeding " + std::to_string(timeout.count()) + " ms");
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }

  result.err_tail = err.size() > kStderrTailBytes ? err.substr(err.size() - kStderrTailBytes) : err;
  return result;
}

} // namespace vidpipe::pipeline
