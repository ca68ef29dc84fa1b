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
#include <kj/test.h>
#include "test-util.h"
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <sys/wait.h>
#include <signal.h>

namespace guestbox {
namespace {

void writeFile(kj::StringPtr path, kj::StringPtr content) {
  auto fd = raiiOpen(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
  kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
}

KJ_TEST("trim") {
  KJ_EXPECT(trim("  foo bar \n") == "foo bar");
  KJ_EXPECT(trim("\t\n ") == "");
  KJ_EXPECT(trim("x") == "x");
}

KJ_TEST("parseUInt64") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt64("12345", 10)) == 12345);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt64("ff", 16)) == 255);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt64("18000000000", 10)) == 18000000000ull);
  KJ_EXPECT(parseUInt64("", 10) == nullptr);
  KJ_EXPECT(parseUInt64("12x", 10) == nullptr);
  KJ_EXPECT(parseUInt64("-1", 10) == nullptr);
}

KJ_TEST("parseDouble") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseDouble("0.75")) == 0.75);
  KJ_EXPECT(parseDouble("") == nullptr);
  KJ_EXPECT(parseDouble("1.5x") == nullptr);
  KJ_EXPECT(parseDouble("inf") == nullptr);
}

KJ_TEST("splitLines") {
  auto lines = splitLines(
      "# comment\n"
      "FOO=1\n"
      "\n"
      "  BAR = 2  # trailing\n"
      "BAZ=3");
  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "FOO=1");
  KJ_EXPECT(lines[1] == "BAR = 2");
  KJ_EXPECT(lines[2] == "BAZ=3");
}

KJ_TEST("split") {
  auto parts = split(kj::StringPtr("a/b//c"), '/');
  KJ_ASSERT(parts.size() == 4);
  KJ_EXPECT(kj::str(parts[0]) == "a");
  KJ_EXPECT(kj::str(parts[1]) == "b");
  KJ_EXPECT(parts[2].size() == 0);
  KJ_EXPECT(kj::str(parts[3]) == "c");
}

KJ_TEST("find and contains") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(find("hello world", "o")) == 4);
  KJ_EXPECT(KJ_ASSERT_NONNULL(find("hello world", "o", 5)) == 7);
  KJ_EXPECT(find("hello", "hello world") == nullptr);
  KJ_EXPECT(contains("Traceback (most recent call last)", "recent"));
  KJ_EXPECT(!contains("abc", "abd"));
}

KJ_TEST("recursivelyDelete") {
  TempDir dir;
  auto sub = kj::str(dir.get(), "/a/b");
  ensureDirectory(kj::str(dir.get(), "/a"));
  ensureDirectory(sub);
  ensureDirectory(sub);  // Already exists; no error.
  writeFile(kj::str(sub, "/file"), "data");
  KJ_SYSCALL(symlink("/etc", kj::str(dir.get(), "/a/link").cStr()));

  recursivelyDelete(kj::str(dir.get(), "/a"));
  KJ_EXPECT(access(kj::str(dir.get(), "/a").cStr(), F_OK) < 0);
  KJ_EXPECT(access("/etc", F_OK) == 0);

  // Already gone.
  recursivelyDelete(kj::str(dir.get(), "/a"));

  auto fd = raiiOpen(dir.get(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  KJ_EXPECT_THROW_MESSAGE("single path component", recursivelyDeleteAt(fd, "a/b"));
  KJ_EXPECT_THROW_MESSAGE("single path component", recursivelyDeleteAt(fd, ".."));
}

KJ_TEST("replaceFile") {
  TempDir dir;
  auto path = kj::str(dir.get(), "/state");
  writeFile(path, "old");
  replaceFile(path, kj::StringPtr("new content").asBytes());
  KJ_EXPECT(readAll(path) == "new content");
  KJ_EXPECT(listDirectory(dir.get()).size() == 1);
}

KJ_TEST("raiiOpenAtIfExistsContained") {
  TempDir dir;
  auto root = kj::str(dir.get(), "/root");
  ensureDirectory(root);
  ensureDirectory(kj::str(root, "/sub"));
  writeFile(kj::str(root, "/sub/file"), "inside");
  writeFile(kj::str(dir.get(), "/secret"), "outside");

  // An absolute symlink resolves against the directory, not the host root.
  KJ_SYSCALL(symlink("/sub/file", kj::str(root, "/abs").cStr()));
  KJ_SYSCALL(symlink("sub", kj::str(root, "/dirlink").cStr()));
  KJ_SYSCALL(symlink("../secret", kj::str(root, "/escape").cStr()));
  KJ_SYSCALL(symlink("/secret", kj::str(root, "/absEscape").cStr()));

  auto rootFd = raiiOpen(root, O_RDONLY | O_DIRECTORY | O_CLOEXEC);

  {
    auto maybeFd = raiiOpenAtIfExistsContained(
        rootFd, kj::Path({"sub", "file"}), O_RDONLY | O_CLOEXEC);
    auto& fd = KJ_ASSERT_NONNULL(maybeFd);
    KJ_EXPECT(readAll(fd) == "inside");
  }
  {
    auto maybeFd = raiiOpenAtIfExistsContained(
        rootFd, kj::Path({"abs"}), O_RDONLY | O_CLOEXEC);
    auto& fd = KJ_ASSERT_NONNULL(maybeFd);
    KJ_EXPECT(readAll(fd) == "inside");
  }
  {
    auto maybeFd = raiiOpenAtIfExistsContained(
        rootFd, kj::Path({"dirlink", "file"}), O_RDONLY | O_CLOEXEC);
    auto& fd = KJ_ASSERT_NONNULL(maybeFd);
    KJ_EXPECT(readAll(fd) == "inside");
  }

  // "/secret" inside the root doesn't exist.
  KJ_EXPECT(raiiOpenAtIfExistsContained(
      rootFd, kj::Path({"absEscape"}), O_RDONLY | O_CLOEXEC) == nullptr);
  KJ_EXPECT(raiiOpenAtIfExistsContained(
      rootFd, kj::Path({"missing"}), O_RDONLY | O_CLOEXEC) == nullptr);

  KJ_EXPECT_THROW_MESSAGE("..", raiiOpenAtIfExistsContained(
      rootFd, kj::Path({"escape"}), O_RDONLY | O_CLOEXEC));
}

KJ_TEST("closeFdsExcept") {
  Pipe kept = Pipe::make();
  Pipe closed = Pipe::make();

  Subprocess child([&]() {
    int keep[] = { kept.writeEnd.get() };
    closeFdsExcept(keep);
    if (fcntl(closed.writeEnd.get(), F_GETFD) >= 0) return 1;
    if (fcntl(kept.writeEnd.get(), F_GETFD) < 0) return 2;
    return 0;
  });
  KJ_EXPECT(child.waitForExit() == 0);
}

KJ_TEST("Subprocess") {
  {
    Subprocess child([]() { return 0; });
    KJ_EXPECT(child.isRunning());
    KJ_EXPECT(child.waitForExit() == 0);
    KJ_EXPECT(!child.isRunning());
  }

  {
    Subprocess child([]() { return 123; }, "exits");
    KJ_EXPECT(child.waitForExit() == 123);
  }

  {
    Subprocess child([]() -> int {
      for (;;) pause();
    }, "sleeper");
    child.signal(SIGKILL);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status));
    KJ_EXPECT(WTERMSIG(status) == SIGKILL);
  }

  {
    Subprocess child([]() -> int {
      raise(SIGTERM);
      return 0;
    }, "terminated");
    KJ_EXPECT_THROW_MESSAGE("killed by signal", (void)child.waitForExit());
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess child([&]() -> int {
      KJ_SYSCALL(dup2(pipe.writeEnd, STDOUT_FILENO));
      execl("/bin/sh", "sh", "-c", "echo hello", (char*)nullptr);
      return 127;
    }, "sh");
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "hello\n");
    KJ_EXPECT(child.waitForExit() == 0);
  }

  {
    // Destroying a running child kills it.
    Subprocess child([]() -> int {
      for (;;) pause();
    });
  }
}

KJ_TEST("SubprocessSet") {
  auto io = kj::setupAsyncIo();
  SubprocessSet subprocessSet(io.unixEventPort);

  Subprocess exits([]() { return 7; });
  auto status = subprocessSet.waitForExitOrSignal(exits).wait(io.waitScope);
  KJ_EXPECT(WIFEXITED(status));
  KJ_EXPECT(WEXITSTATUS(status) == 7);
  KJ_EXPECT(!exits.isRunning());

  Subprocess sleeper([]() -> int {
    for (;;) pause();
  });
  auto promise = subprocessSet.waitForExitOrSignal(sleeper);
  sleeper.signal(SIGKILL);
  status = promise.wait(io.waitScope);
  KJ_EXPECT(WIFSIGNALED(status));
  KJ_EXPECT(WTERMSIG(status) == SIGKILL);
}

}  // namespace
}  // namespace guestbox
