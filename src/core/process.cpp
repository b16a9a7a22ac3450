#include "core/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace edge_twin::core {
namespace {

bool set_nonblocking(const int fd) noexcept {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Returns false once the descriptor reached EOF or failed.
bool drain(const int fd, std::string& sink) noexcept {
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      sink.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

}  // namespace

CommandResult run_command(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  CommandResult result{};
  if (argv.empty()) {
    result.err = "empty command";
    return result;
  }

  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);

  int out_fds[2]{-1, -1};
  int err_fds[2]{-1, -1};
  if (pipe(out_fds) != 0) {
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  if (pipe(err_fds) != 0) {
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    close_fd(out_fds[0]);
    close_fd(out_fds[1]);
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    result.err = std::string("fork failed: ") + std::strerror(errno);
    close_fd(out_fds[0]);
    close_fd(out_fds[1]);
    close_fd(err_fds[0]);
    close_fd(err_fds[1]);
    return result;
  }

  if (pid == 0) {
    close(out_fds[0]);
    close(err_fds[0]);
    dup2(out_fds[1], STDOUT_FILENO);
    dup2(err_fds[1], STDERR_FILENO);
    close(out_fds[1]);
    close(err_fds[1]);
    execvp(exec_argv[0], exec_argv.data());
    _exit(127);
  }

  close_fd(out_fds[1]);
  close_fd(err_fds[1]);
  int out_fd = out_fds[0];
  int err_fd = err_fds[0];
  if (!set_nonblocking(out_fd) || !set_nonblocking(err_fd)) {
    close_fd(out_fd);
    close_fd(err_fd);
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    result.err = "failed to configure command pipes";
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (out_fd >= 0 || err_fd >= 0) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd fds[2]{};
    nfds_t count = 0;
    if (out_fd >= 0) {
      fds[count++] = pollfd{out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
      fds[count++] = pollfd{err_fd, POLLIN, 0};
    }

    const int ready = poll(fds, count, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (fds[i].fd == out_fd && !drain(out_fd, result.out)) {
        close_fd(out_fd);
      } else if (fds[i].fd == err_fd && !drain(err_fd, result.err)) {
        close_fd(err_fd);
      }
    }
  }

  close_fd(out_fd);
  close_fd(err_fd);

  int status = 0;
  pid_t waited = 0;
  while (!result.timed_out) {
    waited = waitpid(pid, &status, WNOHANG);
    if (waited != 0 || std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    usleep(5000);
  }

  if (waited == 0) {
    result.timed_out = true;
    kill(pid, SIGKILL);
    do {
      waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    return result;
  }

  if (waited == pid && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

bool command_on_path(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) {
    return false;
  }

  std::stringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> split_command_line(const std::string& command) {
  std::vector<std::string> argv;
  std::istringstream input(command);
  std::string token;
  while (input >> token) {
    argv.push_back(token);
  }
  return argv;
}

}  // namespace edge_twin::core
