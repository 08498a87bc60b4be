#include "launcher.h"

#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace {

#ifdef __APPLE__
constexpr const char* kOpener = "open";
#else
constexpr const char* kOpener = "xdg-open";
#endif

}  // namespace

fetters::core::FettersResult<int> run_process(const std::vector<std::string>& args) {
  using ResultType = fetters::core::FettersResult<int>;

  if (args.empty()) {
    return ResultType::err(fetters::core::make_error(fetters::core::ErrorKind::kIo,
                                                     "no program to run"));
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  const int spawned = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
  if (spawned != 0) {
    return ResultType::err(fetters::core::make_error(
        fetters::core::ErrorKind::kIo, "failed to run " + args[0] + ": " + std::strerror(spawned)));
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return ResultType::err(fetters::core::make_error(
          fetters::core::ErrorKind::kIo,
          "failed to wait for " + args[0] + ": " + std::strerror(errno)));
    }
  }

  if (WIFEXITED(status)) {
    return ResultType::ok(WEXITSTATUS(status));
  }
  return ResultType::err(fetters::core::make_error(fetters::core::ErrorKind::kIo,
                                                   args[0] + " terminated abnormally"));
}

fetters::core::FettersResult<bool> open_link(const std::string& link) {
  using ResultType = fetters::core::FettersResult<bool>;

  auto status = run_process({kOpener, link});
  if (!status.has_value()) {
    return ResultType::err(status.error());
  }
  if (status.value() != 0) {
    return ResultType::err(fetters::core::make_error(
        fetters::core::ErrorKind::kIo,
        std::string(kOpener) + " exited with status " + std::to_string(status.value())));
  }
  return ResultType::ok(true);
}
