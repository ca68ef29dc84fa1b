// Sandstorm - Personal Cloud Sandbox
// Copyright (c) 2014 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "util.h"
#include <errno.h>
#include <kj/vector.h>
#include <kj/async-unix.h>
#include <ctype.h>
#include <stdlib.h>
#include <limits.h>
#include <math.h>
#include <unistd.h>
#include <sys/types.h>
#include <dirent.h>
#include <syscall.h>
#include <signal.h>
#include <string.h>
#include <time.h>
#include <sys/wait.h>
#include <map>

namespace guestbox {

Pipe Pipe::make() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return { kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1]) };
}

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = open(name.cStr(), flags, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::AutoCloseFd raiiOpenAt(int dirfd, kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = openat(dirfd, name.cStr(), flags, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(kj::StringPtr name, int flags, mode_t mode) {
  int fd = open(name.cStr(), flags, mode);
  if (fd == -1) {
    if (errno == ENOENT) {
      return nullptr;
    } else {
      KJ_FAIL_SYSCALL("open", errno, name);
    }
  } else {
    return kj::AutoCloseFd(fd);
  }
}

kj::Maybe<kj::AutoCloseFd> raiiOpenAtIfExists(
    int dirfd, kj::StringPtr name, int flags, mode_t mode) {
  int fd = openat(dirfd, name.cStr(), flags, mode);
  if (fd == -1) {
    if (errno == ENOENT) {
      return nullptr;
    } else {
      KJ_FAIL_SYSCALL("open", errno, name);
    }
  } else {
    return kj::AutoCloseFd(fd);
  }
}

kj::Maybe<kj::AutoCloseFd> raiiOpenAtIfExistsContained(
    int dirfd, kj::PathPtr pathPtr, int flags, mode_t mode) {
  kj::Path path = kj::Path{}.append(pathPtr);
  KJ_REQUIRE(path.size() > 0, "empty path");

  int fd;
  KJ_SYSCALL(fd = dup(dirfd));
  kj::AutoCloseFd file(fd);
  char pathBuf[PATH_MAX + 1];
  int symlinkLimit = 16;

  size_t i = 0;
  while (i < path.size()) {
    const char* part = path[i].cStr();
    bool last = i + 1 == path.size();

    // Intermediate components must be directories; only the final one gets the caller's flags.
    int partFlags = last ? flags : O_RDONLY | O_DIRECTORY | O_CLOEXEC;
    KJ_SYSCALL_HANDLE_ERRORS(fd = openat(file.get(), part, partFlags | O_NOFOLLOW, mode)) {
      case ENOENT:
        return nullptr;
      case ELOOP: {
        KJ_REQUIRE(symlinkLimit > 0, "too many levels of symbolic links", path);
        symlinkLimit--;

        ssize_t targetLen;
        KJ_SYSCALL(targetLen = readlinkat(file.get(), part, pathBuf, PATH_MAX + 1));
        KJ_REQUIRE(targetLen < PATH_MAX, "readlinkat: name too long");
        pathBuf[targetLen] = '\0';

        // Absolute targets restart at `dirfd`, which acts as the root.
        kj::Path nextPath = path.slice(0, i).eval(pathBuf);
        path = kj::mv(nextPath).append(path.slice(i + 1, path.size()));
        i = 0;
        KJ_SYSCALL(fd = dup(dirfd));
        break;
      }
      default:
        KJ_FAIL_SYSCALL("openat()", error, path);
    } else {
      i++;
    }
    file = kj::AutoCloseFd(fd);
  }
  return kj::mv(file);
}

kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice) {
  while (slice.size() > 0 && isspace(slice[0])) {
    slice = slice.slice(1, slice.size());
  }
  while (slice.size() > 0 && isspace(slice[slice.size() - 1])) {
    slice = slice.slice(0, slice.size() - 1);
  }

  return slice;
}

kj::String trim(kj::ArrayPtr<const char> slice) {
  return kj::heapString(trimArray(slice));
}

kj::Maybe<uint64_t> parseUInt64(kj::StringPtr s, int base) {
  char* end;
  uint64_t result = strtoull(s.cStr(), &end, base);
  if (s.size() == 0 || *end != '\0' || s[0] == '-') {
    return nullptr;
  }
  return result;
}

kj::Maybe<double> parseDouble(kj::StringPtr s) {
  char* end;
  double result = strtod(s.cStr(), &end);
  if (s.size() == 0 || *end != '\0' || !isfinite(result)) {
    return nullptr;
  }
  return result;
}

bool isDirectory(kj::StringPtr path) {
  struct stat stats;
  KJ_SYSCALL(lstat(path.cStr(), &stats), path);
  return S_ISDIR(stats.st_mode);
}

static kj::Array<kj::String> listDirectoryAndClose(DIR* dir) {
  KJ_DEFER(closedir(dir));
  kj::Vector<kj::String> entries;

  for (;;) {
    errno = 0;
    struct dirent* entry = readdir(dir);
    if (entry == nullptr) {
      int error = errno;
      if (error == 0) {
        break;
      } else {
        KJ_FAIL_SYSCALL("readdir", error);
      }
    }

    kj::StringPtr name = entry->d_name;
    if (name != "." && name != "..") {
      entries.add(kj::heapString(entry->d_name));
    }
  }

  return entries.releaseAsArray();
}

kj::Array<kj::String> listDirectory(kj::StringPtr dirname) {
  DIR* dir = opendir(dirname.cStr());
  if (dir == nullptr) {
    KJ_FAIL_SYSCALL("opendir", errno, dirname);
  }
  return listDirectoryAndClose(dir);
}

kj::Array<kj::String> listDirectoryAt(int dirfd, kj::StringPtr path) {
  int fd;
  KJ_SYSCALL(fd = openat(dirfd, path.cStr(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC),
             path);
  DIR* dir = fdopendir(fd);
  if (dir == nullptr) {
    int error = errno;
    close(fd);
    KJ_FAIL_SYSCALL("fdopendir", error, path);
  }
  return listDirectoryAndClose(dir);
}

void recursivelyDelete(kj::StringPtr path) {
  KJ_REQUIRE(!path.endsWith("/"),
      "refusing to recursively delete directory name with trailing / to reduce risk of "
      "catastrophic empty-string bugs");
  KJ_IF_MAYBE(slashPos, path.findLast('/')) {
    auto parentPath = *slashPos == 0 ? kj::str("/") : kj::heapString(path.slice(0, *slashPos));
    auto parent = raiiOpen(parentPath, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    recursivelyDeleteAt(parent, path.slice(*slashPos + 1));
  } else {
    recursivelyDeleteAt(AT_FDCWD, path);
  }
}

static kj::AutoCloseFd openSubdirectory(int dirfd, kj::StringPtr name) {
  return raiiOpenAt(dirfd, name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
}

void recursivelyDeleteAt(int fd, kj::StringPtr name) {
  KJ_REQUIRE(name.size() > 0 && name.findFirst('/') == nullptr && name != "." && name != "..",
             "expected a single path component", name);

  struct stat stats;
  KJ_SYSCALL_HANDLE_ERRORS(fstatat(fd, name.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
    case ENOENT:
      return;
    default:
      KJ_FAIL_SYSCALL("fstatat()", error, name);
  }
  if (!S_ISDIR(stats.st_mode)) {
    KJ_SYSCALL(unlinkat(fd, name.cStr(), 0), name);
    return;
  }

  // Descend one component at a time and climb back out through "..". However deep the tree,
  // only two descriptors are open and no syscall sees more than one path component.
  auto current = openSubdirectory(fd, name);
  kj::Vector<kj::String> names;
  for (;;) {
    kj::Maybe<kj::String> subdirectory;
    for (auto& entry: listDirectoryAt(current, ".")) {
      KJ_SYSCALL_HANDLE_ERRORS(fstatat(current, entry.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
        case ENOENT:
          continue;
        default:
          KJ_FAIL_SYSCALL("fstatat()", error, entry);
      }
      if (S_ISDIR(stats.st_mode)) {
        subdirectory = kj::mv(entry);
        break;
      }
      KJ_SYSCALL(unlinkat(current, entry.cStr(), 0), entry);
    }

    KJ_IF_MAYBE(child, subdirectory) {
      current = openSubdirectory(current, *child);
      names.add(kj::mv(*child));
    } else if (names.size() > 0) {
      auto parent = openSubdirectory(current, "..");
      KJ_SYSCALL(unlinkat(parent, names.back().cStr(), AT_REMOVEDIR), names.back());
      names.removeLast();
      current = kj::mv(parent);
    } else {
      break;
    }
  }

  KJ_SYSCALL(unlinkat(fd, name.cStr(), AT_REMOVEDIR), name);
}

void ensureDirectory(kj::StringPtr path, mode_t mode) {
  while (mkdir(path.cStr(), mode) < 0) {
    int error = errno;
    if (error == EEXIST) {
      KJ_REQUIRE(isDirectory(path), "exists but is not a directory", path);
      return;
    } else if (error != EINTR) {
      KJ_FAIL_SYSCALL("mkdir", error, path);
    }
  }
}

kj::Array<byte> readAllBytes(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<byte> content;
  for (;;) {
    byte buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  return content.releaseAsArray();
}

kj::String readAll(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::String readAll(kj::StringPtr name) {
  return readAll(raiiOpen(name, O_RDONLY | O_CLOEXEC));
}

void replaceFile(kj::StringPtr path, kj::ArrayPtr<const byte> content) {
  static uint counter = 0;
  auto tmpPath = kj::str(path, ".tmp.", getpid(), ".", counter++);
  {
    auto fd = raiiOpen(tmpPath, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    KJ_ON_SCOPE_FAILURE(unlink(tmpPath.cStr()));
    kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
    KJ_SYSCALL(fdatasync(fd.get()), tmpPath);
  }
  KJ_SYSCALL(rename(tmpPath.cStr(), path.cStr()), tmpPath, path);
}

kj::Array<kj::String> splitLines(kj::StringPtr input) {
  size_t lineStart = 0;
  kj::Vector<kj::String> results;
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '\n' || input[i] == '#') {
      bool hasComment = input[i] == '#';
      auto line = trim(input.slice(lineStart, i));
      if (line.size() > 0) {
        results.add(kj::mv(line));
      }
      if (hasComment) {
        // Ignore through newline.
        ++i;
        while (i < input.size() && input[i] != '\n') ++i;
      }
      lineStart = i + 1;
    }
  }

  if (lineStart < input.size()) {
    auto lastLine = trim(input.slice(lineStart));
    if (lastLine.size() > 0) {
      results.add(kj::mv(lastLine));
    }
  }

  return results.releaseAsArray();
}

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      result.add(input.slice(start, i));
      start = i + 1;
    }
  }
  result.add(input.slice(start, input.size()));
  return result;
}

kj::Maybe<size_t> find(kj::StringPtr haystack, kj::StringPtr needle, size_t start) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = start; i <= haystack.size() - needle.size(); i++) {
      if (memcmp(haystack.begin() + i, needle.begin(), needle.size()) == 0) {
        return i;
      }
    }
  }
  return nullptr;
}

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return find(haystack, needle) != nullptr;
}

void closeFdsExcept(kj::ArrayPtr<const int> keep) {
  // We detect open file descriptors by reading from /proc.
  //
  // We need to defer closing each FD until after the scan completes, because:
  // 1) We probably shouldn't change the directory contents while listing.
  // 2) opendir() itself opens an FD.  Closing it would disrupt the scan.
  kj::Vector<int> fds;

  {
    DIR* dir = opendir("/proc/self/fd");
    if (dir == nullptr) {
      KJ_FAIL_SYSCALL("opendir(/proc/self/fd)", errno);
    }
    KJ_DEFER(closedir(dir));

    for (;;) {
      errno = 0;
      struct dirent* entry = readdir(dir);
      if (entry == nullptr) {
        int error = errno;
        if (error != 0) {
          KJ_FAIL_SYSCALL("readdir(/proc/self/fd)", error);
        }
        break;
      }

      if (entry->d_name[0] != '.') {
        KJ_IF_MAYBE(fd, parseUInt64(entry->d_name, 10)) {
          if (*fd > STDERR_FILENO) {
            fds.add(*fd);
          }
        } else {
          KJ_FAIL_ASSERT("File in /proc/self/fd had non-numeric name?", entry->d_name);
        }
      }
    }
  }

  for (int fd: fds) {
    bool keepIt = false;
    for (int k: keep) {
      if (k == fd) keepIt = true;
    }
    if (!keepIt) {
      // Ignore close errors -- one of these is the directory FD already closed by closedir().
      close(fd);
    }
  }
}

int64_t currentTimeMs() {
  struct timespec ts;
  KJ_SYSCALL(clock_gettime(CLOCK_REALTIME, &ts));
  return int64_t(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

// =======================================================================================

Subprocess::Subprocess(kj::Function<int()> func, kj::StringPtr name)
    : name(kj::heapString(name)) {
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!

    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      _exit(func());
    })) {
      KJ_LOG(FATAL, *exception);
    }
  }
}

Subprocess::~Subprocess() noexcept(false) {
  if (pid != 0) {
    unwindDetector.catchExceptionsIfUnwinding([this]() {
      signal(SIGKILL);
      (void)waitForExitOrSignal();
    });
  }
}

void Subprocess::signal(int signo) {
  if (pid != 0) {
    KJ_SYSCALL(kill(pid, signo), name);
  }
}

int Subprocess::waitForExit() {
  int status = waitForExitOrSignal();
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    int signo = WTERMSIG(status);
    KJ_FAIL_ASSERT("child process killed by signal", name, signo, strsignal(signo));
  } else {
    KJ_FAIL_ASSERT("unknown child wait status", name, status);
  }
}

int Subprocess::waitForExitOrSignal() {
  KJ_REQUIRE(pid != 0, "already waited for this child");
  int status;
  KJ_SYSCALL(waitpid(pid, &status, 0));
  KJ_IF_MAYBE(s, subprocessSet) {
    s->alreadyReaped(pid);
  }
  pid = 0;
  return status;
}

// -----------------------------------------------------------------------------

struct SubprocessSet::WaitMap {
  struct ProcInfo {
    kj::Own<kj::PromiseFulfiller<int>> fulfiller;
    Subprocess* subprocess;
  };

  std::map<pid_t, ProcInfo> pids;
};

SubprocessSet::SubprocessSet(kj::UnixEventPort& eventPort)
    : eventPort(eventPort), waitMap(kj::heap<WaitMap>()),
      waitTask(waitLoop().eagerlyEvaluate([](kj::Exception&& exception) {
        KJ_LOG(FATAL, "subprocess wait loop failed", exception);
        // Nothing will ever be reaped again. Best to abort.
        abort();
      })) {
  kj::UnixEventPort::captureSignal(SIGCHLD);
}

SubprocessSet::~SubprocessSet() noexcept(false) {}

kj::Promise<int> SubprocessSet::waitForExitOrSignal(Subprocess& subprocess) {
  auto paf = kj::newPromiseAndFulfiller<int>();
  waitMap->pids.insert(std::make_pair(subprocess.getPid(),
      WaitMap::ProcInfo { kj::mv(paf.fulfiller), &subprocess }));
  subprocess.subprocessSet = *this;
  return kj::mv(paf.promise);
}

kj::Promise<void> SubprocessSet::waitLoop() {
  return eventPort.onSignal(SIGCHLD).then([this](auto&&) {
    while (!waitMap->pids.empty()) {
      int status;
      pid_t pid;
      KJ_SYSCALL(pid = waitpid(-1, &status, WNOHANG));
      if (pid == 0) break;

      auto iter = waitMap->pids.find(pid);
      if (iter == waitMap->pids.end()) {
        KJ_LOG(ERROR, "waitpid() returned unexpected PID; is this process running subprocesses "
                      "outside this set?", pid);
      } else {
        iter->second.subprocess->pid = 0;
        iter->second.fulfiller->fulfill(kj::mv(status));
        waitMap->pids.erase(iter);
      }
    }
    return waitLoop();
  });
}

void SubprocessSet::alreadyReaped(pid_t pid) {
  waitMap->pids.erase(pid);
}

}  // namespace guestbox
