#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "zbench/exec/command.hpp"

namespace zbench {
namespace {

using Clock = std::chrono::steady_clock;

uint64_t elapsed_ns(Clock::time_point start) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(first, last - first + 1);
}

void close_quietly(int fd) {
  if (fd >= 0) {
    ::close(fd);
  }
}

std::string drain(int fd) {
  std::string out;
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

std::string describe_status(const std::string& command, int status) {
  if (WIFEXITED(status)) {
    return "Command '" + command + "' returned non-zero exit status " +
           std::to_string(WEXITSTATUS(status)) + ".";
  }
  if (WIFSIGNALED(status)) {
    return "Command '" + command + "' died with signal " + std::to_string(WTERMSIG(status)) + ".";
  }
  return "Command '" + command + "' ended with unknown status " + std::to_string(status) + ".";
}

class ShellExecutor final : public ICommandExecutor {
 public:
  CommandOutcome execute(const std::string& command) noexcept override {
    CommandOutcome out{};
    try {
      run(command, out);
    } catch (const std::exception& ex) {
      out.success = false;
      out.error = std::string("failed to launch command: ") + ex.what();
    }
    return out;
  }

 private:
  static void run(const std::string& command, CommandOutcome& out) {
    int err_pipe[2] = {-1, -1};
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
      out.error = "failed to launch command: pipe: " + std::string(std::strerror(errno));
      return;
    }

    const auto start = Clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) {
      out.latency_ns = elapsed_ns(start);
      out.error = "failed to launch command: fork: " + std::string(std::strerror(errno));
      close_quietly(err_pipe[0]);
      close_quietly(err_pipe[1]);
      return;
    }

    if (pid == 0) {
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::close(devnull);
      }
      ::dup2(err_pipe[1], STDERR_FILENO);
      ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
      const char msg[] = "exec /bin/sh failed\n";
      (void)::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      std::_Exit(127);
    }

    close_quietly(err_pipe[1]);
    const std::string stderr_text = drain(err_pipe[0]);
    close_quietly(err_pipe[0]);

    int status = 0;
    pid_t waited = -1;
    do {
      waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    out.latency_ns = elapsed_ns(start);

    if (waited < 0) {
      out.error = "waitpid failed: " + std::string(std::strerror(errno));
      return;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
      out.success = true;
      return;
    }

    out.error = trim(stderr_text);
    if (out.error.empty()) {
      out.error = describe_status(command, status);
    }
  }
};

}  // namespace

std::unique_ptr<ICommandExecutor> make_shell_executor() {
  return std::make_unique<ShellExecutor>();
}

}  // namespace zbench
