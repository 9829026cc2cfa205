#include "gitstack/process.hpp"

#include "gitstack/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitstack::proc {

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr int kExecFailedStatus = 127;

struct Child {
  int pid = -1;
  int out_fd = -1;
  int err_fd = -1;
};

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

Child spawn(const std::vector<std::string> &argv, const Options &opts) {
  if (argv.empty()) {
    throw std::invalid_argument("spawn: empty argv");
  }
  if (opts.stop.stop_requested()) {
    throw CancelledError();
  }

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);
  const std::string cwd = opts.cwd.string();

  std::array<int, 2> out_pipe{-1, -1};
  std::array<int, 2> err_pipe{-1, -1};
  if (::pipe2(out_pipe.data(), O_CLOEXEC) < 0) {
    throw Error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (::pipe2(err_pipe.data(), O_CLOEXEC) < 0) {
    const int saved = errno;
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    throw Error(std::string("pipe failed: ") + std::strerror(saved));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      ::close(fd);
    }
    throw Error(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      ::_exit(kExecFailedStatus);
    }
    for (const auto &[key, value] : opts.env) {
      ::setenv(key.c_str(), value.c_str(), 1);
    }
    ::execvp(cargv[0], cargv.data());
    const char msg[] = "exec failed\n";
    [[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(kExecFailedStatus);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  return Child{.pid = pid, .out_fd = out_pipe[0], .err_fd = err_pipe[0]};
}

// Read whatever is available on fd into `sink`; closes fd at EOF.
void drain_ready(int &fd, std::string &sink) {
  std::array<char, 4096> buf{};
  const ssize_t n = ::read(fd, buf.data(), buf.size());
  if (n > 0) {
    sink.append(buf.data(), static_cast<std::size_t>(n));
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    close_fd(fd);
  }
}

// Wait until at least one of the fds is readable or the stop token fires.
void poll_fds(int out_fd, int err_fd, const std::stop_token &stop, bool &out_ready,
              bool &err_ready) {
  std::array<pollfd, 2> fds{};
  nfds_t count = 0;
  int out_idx = -1;
  int err_idx = -1;
  if (out_fd >= 0) {
    fds[count] = pollfd{.fd = out_fd, .events = POLLIN, .revents = 0};
    out_idx = static_cast<int>(count++);
  }
  if (err_fd >= 0) {
    fds[count] = pollfd{.fd = err_fd, .events = POLLIN, .revents = 0};
    err_idx = static_cast<int>(count++);
  }

  out_ready = false;
  err_ready = false;
  for (;;) {
    if (stop.stop_requested()) {
      throw CancelledError();
    }
    const int rc = ::poll(fds.data(), count, kPollTimeoutMs);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw Error(std::string("poll failed: ") + std::strerror(errno));
    }
    if (rc == 0)
      continue;
    out_ready = out_idx >= 0 && fds[out_idx].revents != 0;
    err_ready = err_idx >= 0 && fds[err_idx].revents != 0;
    return;
  }
}

int wait_child(int pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw Error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return 128 + WTERMSIG(status);
}

void terminate(Child &child) {
  ::kill(child.pid, SIGTERM);
  close_fd(child.out_fd);
  close_fd(child.err_fd);
  int status = 0;
  ::waitpid(child.pid, &status, 0);
  child.pid = -1;
}

} // namespace

Result run(const std::vector<std::string> &argv, const Options &opts) {
  Child child = spawn(argv, opts);
  Result res{};
  try {
    while (child.out_fd >= 0 || child.err_fd >= 0) {
      bool out_ready = false;
      bool err_ready = false;
      poll_fds(child.out_fd, child.err_fd, opts.stop, out_ready, err_ready);
      if (out_ready)
        drain_ready(child.out_fd, res.out);
      if (err_ready)
        drain_ready(child.err_fd, res.err);
    }
  } catch (const CancelledError &) {
    terminate(child);
    throw;
  }
  res.exit_code = wait_child(child.pid);
  return res;
}

LineReader::LineReader(const std::vector<std::string> &argv, const Options &opts)
    : stop_(opts.stop) {
  const Child child = spawn(argv, opts);
  pid_ = child.pid;
  out_fd_ = child.out_fd;
  err_fd_ = child.err_fd;
}

LineReader::~LineReader() {
  if (pid_ >= 0) {
    kill_child();
  }
}

void LineReader::kill_child() {
  Child child{.pid = pid_, .out_fd = out_fd_, .err_fd = err_fd_};
  terminate(child);
  pid_ = -1;
  out_fd_ = -1;
  err_fd_ = -1;
}

bool LineReader::fill() {
  while (out_fd_ >= 0) {
    bool out_ready = false;
    bool err_ready = false;
    try {
      poll_fds(out_fd_, err_fd_, stop_, out_ready, err_ready);
    } catch (const CancelledError &) {
      kill_child();
      throw;
    }
    if (err_ready)
      drain_ready(err_fd_, err_);
    if (out_ready) {
      const auto before = buffer_.size();
      drain_ready(out_fd_, buffer_);
      if (buffer_.size() != before)
        return true;
    }
  }
  return false;
}

std::optional<std::string> LineReader::next_line() {
  for (;;) {
    if (const auto nl = buffer_.find('\n'); nl != std::string::npos) {
      std::string line = buffer_.substr(0, nl);
      buffer_.erase(0, nl + 1);
      return line;
    }
    if (!fill()) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      std::string line = std::move(buffer_);
      buffer_.clear();
      return line;
    }
  }
}

int LineReader::wait() {
  if (pid_ < 0) {
    return status_;
  }
  while (out_fd_ >= 0 || err_fd_ >= 0) {
    bool out_ready = false;
    bool err_ready = false;
    try {
      poll_fds(out_fd_, err_fd_, stop_, out_ready, err_ready);
    } catch (const CancelledError &) {
      kill_child();
      throw;
    }
    if (out_ready)
      drain_ready(out_fd_, buffer_);
    if (err_ready)
      drain_ready(err_fd_, err_);
  }
  status_ = wait_child(pid_);
  pid_ = -1;
  return status_;
}

} // namespace gitstack::proc
