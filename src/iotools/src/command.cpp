#include "command.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <istream>
#include <string_view>
#include <utility>
#include <vector>

#include "stringhelpers.hpp"
#include "sysx_exception.hpp"
#include "sysx_invalid_argument_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"
#include "utf8.hpp"

extern char **environ;

namespace sysx {

namespace {

class FileDescriptor {
 public:
  FileDescriptor() noexcept = default;

  explicit FileDescriptor(int fd) noexcept : _fd(fd) {}

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  FileDescriptor(FileDescriptor &&rhs) noexcept : _fd(std::exchange(rhs._fd, -1)) {}
  FileDescriptor &operator=(FileDescriptor &&rhs) noexcept {
    if (&rhs != this) {
      close();
      _fd = std::exchange(rhs._fd, -1);
    }
    return *this;
  }

  ~FileDescriptor() { close(); }

  int get() const noexcept { return _fd; }

  void close() noexcept {
    if (_fd != -1) {
      ::close(_fd);
      _fd = -1;
    }
  }

 private:
  int _fd = -1;
};

struct Pipe {
  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw exception("Unable to create pipe: {}", std::strerror(errno));
    }
    readEnd = FileDescriptor(fds[0]);
    writeEnd = FileDescriptor(fds[1]);
  }

  FileDescriptor readEnd;
  FileDescriptor writeEnd;
};

class SpawnFileActions {
 public:
  SpawnFileActions() {
    if (::posix_spawn_file_actions_init(&_actions) != 0) {
      throw exception("Unable to initialize spawn file actions");
    }
  }

  SpawnFileActions(const SpawnFileActions &) = delete;
  SpawnFileActions &operator=(const SpawnFileActions &) = delete;

  ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&_actions); }

  void dup2(int fd, int newFd) {
    if (::posix_spawn_file_actions_adddup2(&_actions, fd, newFd) != 0) {
      throw exception("Unable to redirect file descriptor {} to {}", fd, newFd);
    }
  }

  posix_spawn_file_actions_t *get() noexcept { return &_actions; }

 private:
  posix_spawn_file_actions_t _actions;
};

// Read both pipes until they are closed, without blocking on one while the other is full.
void ReadPipes(const FileDescriptor &outFd, const FileDescriptor &errFd, string &out, string &err) {
  std::array<pollfd, 2> fds{{{outFd.get(), POLLIN, 0}, {errFd.get(), POLLIN, 0}}};
  std::array<string *, 2> buffers{&out, &err};
  std::array<char, 8192> readBuffer;

  int nbOpenFds = 2;
  while (nbOpenFds > 0) {
    const int pollRes = ::poll(fds.data(), fds.size(), -1);
    if (pollRes < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw exception("Error while polling command outputs: {}", std::strerror(errno));
    }
    for (std::size_t pos = 0; pos < fds.size(); ++pos) {
      if (fds[pos].fd < 0 || (fds[pos].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const auto nbRead = ::read(fds[pos].fd, readBuffer.data(), readBuffer.size());
      if (nbRead > 0) {
        buffers[pos]->append(readBuffer.data(), static_cast<std::size_t>(nbRead));
      } else if (nbRead == 0 || errno != EINTR) {
        // end of stream (or unrecoverable read error), stop polling this one
        fds[pos].fd = -1;
        --nbOpenFds;
      }
    }
  }
}

int ExitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Spawned child process, killed and reaped at destruction if it has not been waited for.
class ChildProcess {
 public:
  explicit ChildProcess(pid_t pid) noexcept : _pid(pid) {}

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  ~ChildProcess() {
    if (_pid == -1) {
      return;
    }
    ::kill(_pid, SIGKILL);
    int status;
    while (::waitpid(_pid, &status, 0) == -1) {
      if (errno != EINTR) {
        log::error("Unable to reap process {}: {}", _pid, std::strerror(errno));
        break;
      }
    }
  }

  /// Wait for the child to finish and return its exit status (128 + signal number if it was killed by a signal).
  int wait() {
    int status = 0;
    while (::waitpid(_pid, &status, 0) == -1) {
      if (errno != EINTR) {
        throw exception("Unable to wait for process {}: {}", _pid, std::strerror(errno));
      }
    }
    _pid = -1;
    return ExitStatus(status);
  }

 private:
  pid_t _pid;
};

}  // namespace

std::vector<string> SplitCommandLine(std::string_view cmdLine) {
  std::vector<string> words;
  string word;
  bool inWord = false;

  for (auto it = cmdLine.begin(); it != cmdLine.end(); ++it) {
    const char ch = *it;
    switch (ch) {
      case '\'': {
        inWord = true;
        auto endIt = std::find(it + 1, cmdLine.end(), '\'');
        if (endIt == cmdLine.end()) {
          throw invalid_argument("Unterminated single quote in command line");
        }
        word.append(it + 1, endIt);
        it = endIt;
        break;
      }
      case '"': {
        inWord = true;
        for (++it;; ++it) {
          if (it == cmdLine.end()) {
            throw invalid_argument("Unterminated double quote in command line");
          }
          if (*it == '"') {
            break;
          }
          if (*it == '\\' && it + 1 != cmdLine.end()) {
            const char next = *(it + 1);
            if (next == '\\' || next == '"' || next == '$' || next == '`') {
              word.push_back(next);
              ++it;
              continue;
            }
            if (next == '\n') {
              ++it;
              continue;
            }
          }
          word.push_back(*it);
        }
        break;
      }
      case '\\':
        if (it + 1 == cmdLine.end()) {
          throw invalid_argument("Trailing escape character in command line");
        }
        ++it;
        if (*it != '\n') {
          inWord = true;
          word.push_back(*it);
        }
        break;
      default:
        if (isspace(ch)) {
          if (inWord) {
            words.push_back(std::move(word));
            word.clear();
            inWord = false;
          }
        } else {
          inWord = true;
          word.push_back(ch);
        }
        break;
    }
  }
  if (inWord) {
    words.push_back(std::move(word));
  }
  return words;
}

CommandOutput SilentRun(std::string_view cmdLine) {
  cmdLine = TrimSpaces(cmdLine);
  if (cmdLine.empty()) {
    throw invalid_argument("Cannot run an empty command line");
  }
  const std::vector<string> words = SplitCommandLine(cmdLine);
  if (words.empty()) {
    throw invalid_argument("Cannot run an empty command line");
  }

  std::vector<char *> argv;
  argv.reserve(words.size() + 1U);
  for (const string &word : words) {
    argv.push_back(const_cast<char *>(word.c_str()));
  }
  argv.push_back(nullptr);

  Pipe inPipe;
  Pipe outPipe;
  Pipe errPipe;

  pid_t pid;
  {
    SpawnFileActions fileActions;
    fileActions.dup2(inPipe.readEnd.get(), STDIN_FILENO);
    fileActions.dup2(outPipe.writeEnd.get(), STDOUT_FILENO);
    fileActions.dup2(errPipe.writeEnd.get(), STDERR_FILENO);

    log::debug("Running {}", cmdLine);
    const int spawnErr = ::posix_spawnp(&pid, argv.front(), fileActions.get(), nullptr, argv.data(), environ);
    if (spawnErr != 0) {
      throw exception("Unable to run '{}': {}", words.front(), std::strerror(spawnErr));
    }
  }

  // Child owns its copies now, close ours so that reads end when the child exits
  inPipe.readEnd.close();
  inPipe.writeEnd.close();
  outPipe.writeEnd.close();
  errPipe.writeEnd.close();

  ChildProcess child(pid);

  CommandOutput output;
  ReadPipes(outPipe.readEnd, errPipe.readEnd, output.stdOut, output.stdErr);
  output.exitStatus = child.wait();

  log::debug("'{}' exited with status {}", words.front(), output.exitStatus);

  // only the selected output needs to be text, the other one may hold anything
  if (!IsValidUtf8(output.result())) {
    throw invalid_argument("{} of '{}' is not valid UTF-8", output.success() ? "Standard output" : "Standard error",
                           words.front());
  }
  return output;
}

CommandOutput Run(std::string_view cmdLine) {
  CommandOutput output = SilentRun(cmdLine);
#ifdef SYSX_DISABLE_SPDLOG
  std::cout << output.result();
#else
  auto outputLogger = log::get("output");
  if (outputLogger) {
    outputLogger->info("{}", TrimSpaces(output.result()));
  } else {
    std::cout << output.result();
  }
#endif
  return output;
}

string ReadLine(std::istream &is) {
  string line;
  if (!std::getline(is, line) && !is.eof()) {
    throw exception("Unable to read line from input stream");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

string Input() { return ReadLine(std::cin); }

}  // namespace sysx
