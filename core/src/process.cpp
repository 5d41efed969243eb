#include "revgate/process.h"

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace revgate {

ProcessResult run_process(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
  ProcessResult result;
  if (args.empty()) {
    result.error_message = "missing command";
    return result;
  }

  int pipefd[2];
  if (::pipe(pipefd) != 0) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(127);
    }
    ::dup2(pipefd[1], STDOUT_FILENO);
    ::dup2(pipefd[1], STDERR_FILENO);
    ::close(pipefd[0]);
    ::close(pipefd[1]);

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (const auto& arg : args) {
      cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);
    ::execvp(cargs[0], cargs.data());
    _exit(127);
  }

  if (pid < 0) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  ::close(pipefd[1]);
  char buffer[512];
  while (true) {
    const ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  ::close(pipefd[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error_message = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace revgate
