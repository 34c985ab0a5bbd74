#pragma once

#include <cerrno>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace proc {

using ExitStatus = std::expected<int, std::error_code>;

// Spawns argv[0] (PATH lookup) and blocks until it exits. Returns the exit
// code, or 128 + signal number when the child was killed.
inline ExitStatus RunProcess(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(),
                          environ);
  if (rc != 0) {
    return std::unexpected(std::error_code(rc, std::generic_category()));
  }
  int status = 0;
  for (;;) {
    if (::waitpid(pid, &status, 0) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    break;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// mkdtemp wrapper: creates <parent>/<prefix>XXXXXX.
inline std::expected<std::filesystem::path, std::error_code>
MakeTempDir(const std::filesystem::path &parent, const std::string &prefix) {
  std::string tmpl = (parent / (prefix + "XXXXXX")).string();
  if (::mkdtemp(tmpl.data()) == nullptr) {
    return std::unexpected(std::error_code(errno, std::generic_category()));
  }
  return std::filesystem::path(tmpl);
}

} // namespace proc
