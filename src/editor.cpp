#include "rebranch/editor.hpp"

#include "rebranch/error.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rebranch {

void SystemEditor::launch(const std::filesystem::path &path) {
  if (command_.empty()) {
    throw Error(ErrorKind::EditorFailure, "no editor configured");
  }

  // The command may carry its own arguments ("code --wait"), so it goes
  // through the shell and the path is passed as $1.
  const std::string script = command_ + " \"$1\"";
  const std::string file = path.string();

  const pid_t pid = fork();
  if (pid < 0) {
    throw Error(ErrorKind::EditorFailure,
                "failed to start editor '" + command_ + "': " + std::strerror(errno));
  }
  if (pid == 0) {
    execl("/bin/sh", "sh", "-c", script.c_str(), "sh", file.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw Error(ErrorKind::EditorFailure,
                  "failed to wait for editor '" + command_ + "': " + std::strerror(errno));
    }
  }

  if (WIFSIGNALED(status)) {
    throw Error(ErrorKind::EditorFailure, "editor '" + command_ + "' was killed by signal " +
                                              std::to_string(WTERMSIG(status)));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw Error(ErrorKind::EditorFailure,
                code == 127 ? "failed to start editor '" + command_ + "'"
                            : "editor '" + command_ + "' exited with status " +
                                  std::to_string(code));
  }
}

} // namespace rebranch
