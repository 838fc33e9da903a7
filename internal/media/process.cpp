#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "internal/util/errors.hpp"

namespace reel::media {

namespace {

// Exit status the child uses when exec itself fails.
constexpr int kExecFailed = 127;

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw util::MediaToolError("empty command line");
  }

  // Close-on-exec so other tools spawned concurrently never inherit this pipe.
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    throw util::MediaToolError(std::string("pipe failed: ") + std::strerror(errno));
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    throw util::MediaToolError(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Children never read the daemon's stdin.
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd > STDIN_FILENO) {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    close(fds[0]);
    close(fds[1]);
    execvp(args[0], args.data());
    _exit(kExecFailed);
  }

  close(fds[1]);

  ProcessResult result;
  char          buffer[4096];
  for (;;) {
    const ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<std::size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      break;
    }
  }
  close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw util::MediaToolError(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  if (result.exit_code == kExecFailed) {
    throw util::MediaToolError("could not execute " + argv[0]);
  }
  return result;
}

} // namespace reel::media
