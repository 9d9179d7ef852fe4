#include "webctl/ProcessHost.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

extern char** environ;

namespace webctl {

namespace {

// Только async-signal-safe вызовы: выполняется в ребенке после fork()
[[noreturn]] void reportExecFailure(int fd) {
  int err = errno;
  ssize_t written = ::write(fd, &err, sizeof(err));
  (void)written;  // при неудачной записи родитель увидит только EOF
  _exit(127);
}

std::vector<std::string> buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> entries;
  for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
    std::string entry(*env);
    std::string name = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const auto& [key, value] : overrides) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) entries.push_back(std::move(entry));
  }
  for (const auto& [key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

std::vector<char*> toPointers(std::vector<std::string>& strings) {
  std::vector<char*> pointers;
  pointers.reserve(strings.size() + 1);
  for (auto& s : strings) pointers.push_back(s.data());
  pointers.push_back(nullptr);
  return pointers;
}

}  // namespace

int PosixProcessHost::toSignalNumber(ProcessSignal kind) {
  switch (kind) {
    case ProcessSignal::Terminate:
      return SIGTERM;
    case ProcessSignal::Interrupt:
      return SIGINT;
    case ProcessSignal::Kill:
      return SIGKILL;
  }
  return SIGTERM;
}

pid_t PosixProcessHost::spawn(const SpawnRequest& request) {
  if (request.argv.empty() || request.argv.front().empty()) {
    throw SpawnError(EINVAL, "PosixProcessHost: spawn(): Empty command");
  }

  // Все выделения памяти выполняются до fork()
  std::vector<std::string> args = request.argv;
  std::vector<std::string> envStrings = buildEnvironment(request.environment);
  std::vector<char*> argv = toPointers(args);
  std::vector<char*> envp = toPointers(envStrings);
  const char* workdir =
      request.workingDirectory.empty() ? nullptr
                                       : request.workingDirectory.c_str();

  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) == -1) {
    throw SpawnError(errno, "PosixProcessHost: spawn(): pipe2 failed");
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    throw SpawnError(err, "PosixProcessHost: spawn(): fork failed");
  }

  if (pid == 0) {
    close(pipefd[0]);
    setsid();

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE, SIGCHLD}) {
      ::signal(sig, SIG_DFL);
    }

    if (workdir != nullptr && chdir(workdir) == -1) {
      reportExecFailure(pipefd[1]);
    }
    execvpe(argv[0], argv.data(), envp.data());
    reportExecFailure(pipefd[1]);
  }

  close(pipefd[1]);
  int childErr = 0;
  ssize_t n;
  do {
    n = read(pipefd[0], &childErr, sizeof(childErr));
  } while (n == -1 && errno == EINTR);
  close(pipefd[0]);

  if (n > 0) {
    while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
    }
    throw SpawnError(childErr, "PosixProcessHost: spawn(): Failed to execute " +
                                   request.argv.front());
  }

  return pid;
}

bool PosixProcessHost::isAlive(pid_t pid) {
  if (pid <= 0) return false;

  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == pid) return false;  // наш ребенок завершился и пожат
  if (rc == 0) return true;     // наш ребенок еще работает

  // Не наш ребенок: жив, только если ему можно послать сигнал.
  // Чужой процесс (EPERM) под тем же PID не считается нашим сервером
  return kill(pid, 0) == 0;
}

bool PosixProcessHost::signal(pid_t pid, ProcessSignal kind) {
  if (pid <= 0) return false;

  if (kill(pid, toSignalNumber(kind)) == 0) return true;
  if (errno == ESRCH) return false;

  throw std::system_error(errno, std::system_category(),
                          "PosixProcessHost: signal(): kill failed for PID " +
                              std::to_string(pid));
}

}  // namespace webctl
