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


#ifndef GUESTBOX_UTIL_H_
#define GUESTBOX_UTIL_H_
// Filesystem, string, and process helpers shared by the engine.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <kj/filesystem.h>
#include <unistd.h>
#include <kj/function.h>
#include <kj/async.h>

namespace kj {
  class UnixEventPort;
}

namespace guestbox {

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.  Requires C++14.

typedef unsigned int uint;
typedef unsigned char byte;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);
kj::AutoCloseFd raiiOpenAt(int dirfd, kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(
    kj::StringPtr name, int flags, mode_t mode = 0666);
kj::Maybe<kj::AutoCloseFd> raiiOpenAtIfExists(
    int dirfd, kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenAtIfExistsContained(
    int dirfd, kj::PathPtr path, int flags, mode_t mode = 0666);
// Like raiiOpenAtIfExists(), but resolves symlinks by hand so that the result is always inside
// `dirfd`. A symlink pointing to an absolute path is resolved relative to `dirfd`, as if `dirfd`
// were the root directory; a ".." that would climb out of `dirfd` throws.

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

kj::Maybe<uint64_t> parseUInt64(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

kj::Maybe<double> parseDouble(kj::StringPtr s);

bool isDirectory(kj::StringPtr path);

kj::Array<kj::String> listDirectory(kj::StringPtr dirname);
// Get names of all files in the given directory except for "." and "..".

kj::Array<kj::String> listDirectoryAt(int dirfd, kj::StringPtr path);
// Like `listDirectory()` but operates on a subdirectory of the given file descriptor.

void recursivelyDelete(kj::StringPtr path);
void recursivelyDeleteAt(int fd, kj::StringPtr name);
// Delete the given path, recursively if it is a directory. `name` must be a single component
// of `fd`. Symlinks inside the tree are deleted, never followed, and the depth of the tree is
// not limited by PATH_MAX.

void ensureDirectory(kj::StringPtr path, mode_t mode = 0770);
// mkdir() that tolerates an existing directory.

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

kj::Array<byte> readAllBytes(int fd);
// Read entire contents of the file descirptor to a byte array.

void replaceFile(kj::StringPtr path, kj::ArrayPtr<const byte> content);
// Write `content` to a temporary file beside `path`, fsync it, and rename it over `path`, so that
// readers see either the old or the new content, never a mix.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

bool contains(kj::StringPtr haystack, kj::StringPtr needle);
kj::Maybe<size_t> find(kj::StringPtr haystack, kj::StringPtr needle, size_t start = 0);

void closeFdsExcept(kj::ArrayPtr<const int> keep);
// Close every file descriptor above stderr except those listed. Used in forked children, which
// would otherwise hold on to pipes belonging to unrelated executions until they exit.

int64_t currentTimeMs();
// Wall-clock time in milliseconds since the Unix epoch.

class SubprocessSet;

class Subprocess {
  // A forked child running a function. The guest keeper is one of these.

public:
  Subprocess(kj::Function<int()> func, kj::StringPtr name = "(forked)");
  // Fork, run `func` in the child, and _exit() with its return value. The child never returns
  // from this constructor and never unwinds the parent's stack; an exception in `func` is
  // logged as fatal.

  KJ_DISALLOW_COPY(Subprocess);

  ~Subprocess() noexcept(false);
  // SIGKILL and reap the child if it is still around.

  void signal(int signo);

  int waitForExit() KJ_WARN_UNUSED_RESULT;
  // Block until the child exits and return its exit code. Throws if it died of a signal.

  int waitForExitOrSignal() KJ_WARN_UNUSED_RESULT;
  // Block until the child exits or dies; returns the raw wait status.

  pid_t getPid() {
    KJ_IREQUIRE(pid != 0, "already exited");
    return pid;
  }

  bool isRunning() {
    return pid != 0;
  }

private:
  kj::String name;
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = reaped
  kj::Maybe<SubprocessSet&> subprocessSet;

  friend class SubprocessSet;
};

class SubprocessSet {
  // Represents a set of subprocesses and allows you to asynchronously wait for them to complete.
  // In order to use SubprocessSet, it is necessary that *all* subprocesses of this process are
  // managed through it, and wait() is always called immediately on creation of a new subprocess.

public:
  explicit SubprocessSet(kj::UnixEventPort& eventPort);
  ~SubprocessSet() noexcept(false);
  KJ_DISALLOW_COPY(SubprocessSet);

  kj::Promise<int> waitForExitOrSignal(Subprocess& subprocess);
  // Resolves to the raw wait status. `subprocess` must outlive the promise or be destroyed
  // first, which cancels the wait.

private:
  struct WaitMap;
  kj::UnixEventPort& eventPort;
  kj::Own<WaitMap> waitMap;
  kj::Promise<void> waitTask;

  kj::Promise<void> waitLoop();

  void alreadyReaped(pid_t pid);
  // Called if the subprocess is destroyed and thus canceled. See ~Subprocess().

  friend class Subprocess;
};

}  // namespace guestbox

#endif // GUESTBOX_UTIL_H_
