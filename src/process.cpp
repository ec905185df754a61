#include "rebranch/process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rebranch::process {

namespace {

// Read end and write end of a pipe, closed on scope exit.
struct Pipe {
  std::array<int, 2> fd{-1, -1};

  Pipe() {
    if (::pipe(fd.data()) != 0) {
      throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  void close_read() {
    if (fd[0] >= 0) {
      ::close(fd[0]);
      fd[0] = -1;
    }
  }
  void close_write() {
    if (fd[1] >= 0) {
      ::close(fd[1]);
      fd[1] = -1;
    }
  }
};

// Drain whatever is readable; false once the writer has gone away.
bool drain(int fd, std::string &into) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      into.append(buffer, static_cast<std::size_t>(n));
      return true;
    }
    if (n == 0) {
      return false;
    }
    if (errno != EINTR) {
      return false;
    }
  }
}

} // namespace

Result run(const std::vector<std::string> &argv, const std::filesystem::path &cwd) {
  if (argv.empty()) {
    throw std::runtime_error("run: empty command line");
  }

  // Everything the child touches is prepared before fork
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);
  const std::string dir = cwd.string();

  Pipe out_pipe;
  Pipe err_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error("failed to start " + argv.front() + ": " + std::strerror(errno));
  }
  if (pid == 0) {
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe.fd[1], STDOUT_FILENO);
    ::dup2(err_pipe.fd[1], STDERR_FILENO);
    ::close(out_pipe.fd[0]);
    ::close(out_pipe.fd[1]);
    ::close(err_pipe.fd[0]);
    ::close(err_pipe.fd[1]);
    if (::chdir(dir.c_str()) != 0) {
      _exit(127);
    }
    ::execvp(args[0], args.data());
    _exit(127);
  }

  out_pipe.close_write();
  err_pipe.close_write();

  // Read both streams together so a chatty child never blocks on a full pipe
  Result result;
  std::array<pollfd, 2> fds{{{out_pipe.fd[0], POLLIN, 0}, {err_pipe.fd[0], POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&result.out, &result.err};
  int open_streams = 2;
  while (open_streams > 0) {
    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      // Closing our ends lets a blocked writer die of SIGPIPE before the wait
      out_pipe.close_read();
      err_pipe.close_read();
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      if (!drain(fds[i].fd, *sinks[i])) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error("failed to wait for " + argv.front() + ": " +
                               std::strerror(errno));
    }
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

} // namespace rebranch::process
