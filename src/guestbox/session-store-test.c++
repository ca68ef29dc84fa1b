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

#include "session-store.h"
#include "code-wrapper.h"
#include "test-util.h"
#include <kj/test.h>
#include <string.h>
#include <unistd.h>

namespace guestbox {
namespace {

const uint64_t MAX_BYTES = 1024;

void put(SessionStore& store, kj::StringPtr id, kj::StringPtr path, kj::StringPtr content) {
  store.writeFile(id, path, content.asBytes(), MAX_BYTES);
}

kj::String get(SessionStore& store, kj::StringPtr id, kj::StringPtr path) {
  return bytesToString(store.readFile(id, path));
}

const uint DEEP_LEVELS = 25;
const size_t DEEP_NAME_LENGTH = 200;

void buildDeepTree(SessionStore& store, kj::StringPtr id) {
  // What a guest gets from mkdir() and chdir() in a loop: a file whose full path is far longer
  // than PATH_MAX.
  auto name = kj::heapString(DEEP_NAME_LENGTH);
  memset(name.begin(), 'd', name.size());

  auto current = store.openWorkspace(id);
  for (uint i = 0; i < DEEP_LEVELS; i++) {
    KJ_SYSCALL(mkdirat(current, name.cStr(), 0755));
    current = raiiOpenAt(current, name, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  }
  auto file = raiiOpenAt(current, "bottom.txt", O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  KJ_SYSCALL(write(file, "x", 1));
}

KJ_TEST("SessionStore: records survive a restart") {
  TempDir dir;

  {
    SessionStore store(dir.get());
    auto record = store.create("alpha");
    record.setOwnerKey("token:client1");
    record.setLanguage("python");
    record.initLimits().setFuel(1234);
    record.setAutoPersist(true);
    record.setLastActiveAt(99);
    record.setIdleTimeoutMs(600000);
    store.commit("alpha");

    // Created but never committed; gone after a restart.
    store.create("beta");

    put(store, "alpha", "data.txt", "hello");
  }

  SessionStore store(dir.get());
  auto loaded = store.loadAll();
  KJ_ASSERT(loaded.size() == 1);
  KJ_EXPECT(loaded[0] == "alpha");

  auto maybeRecord = store.find("alpha");
  auto record = KJ_ASSERT_NONNULL(maybeRecord);
  KJ_EXPECT(record.getOwnerKey() == "token:client1");
  KJ_EXPECT(record.getLanguage() == "python");
  KJ_EXPECT(record.getLimits().getFuel() == 1234);
  KJ_EXPECT(record.getLastActiveAt() == 99);
  KJ_EXPECT(get(store, "alpha", "data.txt") == "hello");

  KJ_EXPECT(store.find("beta") == nullptr);
  KJ_EXPECT(access((dir / "workspaces/beta").cStr(), F_OK) < 0);
}

KJ_TEST("SessionStore: unreadable records are discarded") {
  TempDir dir;
  {
    SessionStore store(dir.get());
    store.create("good");
    store.commit("good");
    store.create("bad");
    store.commit("bad");
  }

  replaceFile(dir / "records/bad", kj::StringPtr("not a capnp message").asBytes());
  replaceFile(dir / "records/.good.tmp.1.0", kj::StringPtr("partial").asBytes());

  SessionStore store(dir.get());
  {
    KJ_EXPECT_LOG(ERROR, "discarding unreadable session record");
    auto loaded = store.loadAll();
    KJ_ASSERT(loaded.size() == 1);
    KJ_EXPECT(loaded[0] == "good");
  }

  KJ_EXPECT(access((dir / "records/bad").cStr(), F_OK) < 0);
  KJ_EXPECT(access((dir / "workspaces/bad").cStr(), F_OK) < 0);
  KJ_EXPECT(access((dir / "records/.good.tmp.1.0").cStr(), F_OK) < 0);
}

KJ_TEST("SessionStore: create, remove, detach") {
  TempDir dir;
  SessionStore store(dir.get());

  store.create("one");
  store.commit("one");
  KJ_EXPECT_THROW_MESSAGE("already in use", store.create("one"));
  KJ_EXPECT_THROW_MESSAGE("invalid session id", store.create("../escape"));

  store.remove("one");
  KJ_EXPECT(store.find("one") == nullptr);
  KJ_EXPECT(access((dir / "records/one").cStr(), F_OK) < 0);
  KJ_EXPECT(access((dir / "workspaces/one").cStr(), F_OK) < 0);

  // The id can be reused at once, even while the old directory is still in use.
  store.create("two");
  put(store, "two", "old.txt", "old");
  auto trashPath = store.detach("two");
  KJ_EXPECT(access(kj::str(trashPath, "/old.txt").cStr(), F_OK) == 0);

  store.create("two");
  KJ_EXPECT(store.listFiles("two").size() == 0);

  store.deleteDetached(trashPath);
  KJ_EXPECT(access(trashPath.cStr(), F_OK) < 0);

  // Anything left in the trash is deleted on startup.
  auto leftover = store.detach("two");
  {
    SessionStore restarted(dir.get());
    KJ_EXPECT(access(leftover.cStr(), F_OK) < 0);
  }
}

KJ_TEST("SessionStore: file operations") {
  TempDir dir;
  SessionStore store(dir.get());
  store.create("s");

  put(store, "s", "b.txt", "bee");
  put(store, "s", "a/nested/c.txt", "sea");
  put(store, "s", "b.txt", "bumblebee");

  auto files = store.listFiles("s");
  KJ_ASSERT(files.size() == 2);
  KJ_EXPECT(files[0].path == "a/nested/c.txt");
  KJ_EXPECT(files[0].size == 3);
  KJ_EXPECT(files[1].path == "b.txt");
  KJ_EXPECT(files[1].size == 9);

  KJ_EXPECT(get(store, "s", "a/nested/c.txt") == "sea");
  KJ_EXPECT(get(store, "s", "a/./nested/../nested/c.txt") == "sea");

  store.deletePath("s", "a");
  KJ_EXPECT(store.listFiles("s").size() == 1);

  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "missing.txt"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { store.deletePath("s", "missing"); });

  // Directories can't be overwritten or read.
  put(store, "s", "dir/x", "x");
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { put(store, "s", "dir", "data"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "dir"); });

  // Size limit.
  auto big = kj::str(kj::repeat('x', MAX_BYTES + 1));
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { put(store, "s", "big", big); });

  store.clearWorkspace("s");
  KJ_EXPECT(store.listFiles("s").size() == 0);
  KJ_EXPECT(isDirectory(dir / "workspaces/s"));
}

KJ_TEST("SessionStore: paths can't leave the working directory") {
  TempDir dir;
  SessionStore store(dir.get());
  store.create("s");
  replaceFile(dir / "outside.txt", kj::StringPtr("secret").asBytes());

  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "/etc/passwd"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "../outside.txt"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "a/../../x"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { put(store, "s", "../x", "x"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { put(store, "s", "", "x"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { store.deletePath("s", "."); });

  // Symlinks left by a guest resolve as if the working directory were the root.
  auto workspace = dir / "workspaces/s";
  KJ_SYSCALL(symlink("../../outside.txt", kj::str(workspace, "/up").cStr()));
  KJ_SYSCALL(symlink((dir / "outside.txt").cStr(), kj::str(workspace, "/abs").cStr()));
  KJ_SYSCALL(symlink("/", kj::str(workspace, "/root").cStr()));

  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "up"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { get(store, "s", "abs"); });
  put(store, "s", "inside.txt", "mine");
  KJ_EXPECT(get(store, "s", "root/inside.txt") == "mine");

  // Writing over a symlink replaces the link, not its target.
  put(store, "s", "abs", "replaced");
  KJ_EXPECT(readAll(dir / "outside.txt") == "secret");
  KJ_EXPECT(get(store, "s", "abs") == "replaced");
}

KJ_TEST("SessionStore: the state file is read-only to callers") {
  TempDir dir;
  SessionStore store(dir.get());
  store.create("s");
  replaceFile(dir / "workspaces/s/.session_state.json", kj::StringPtr("{\"x\": 1}").asBytes());

  KJ_EXPECT(get(store, "s", ".session_state.json") == "{\"x\": 1}");
  expectEngineError(ErrorKind::INVALID_REQUEST,
      [&]() { put(store, "s", ".session_state.json", "{}"); });
  expectEngineError(ErrorKind::INVALID_REQUEST,
      [&]() { store.deletePath("s", ".session_state.json"); });
}

KJ_TEST("snapshotWorkspace and diffSnapshots") {
  TempDir dir;
  SessionStore store(dir.get());
  store.create("s");
  put(store, "s", "keep.txt", "same");
  put(store, "s", "change.txt", "before");
  put(store, "s", "user_code.py", "print(1)");

  auto fd = store.openWorkspace("s");
  auto before = snapshotWorkspace(fd);
  KJ_EXPECT(before.size() == 3);

  put(store, "s", "change.txt", "after, and longer");
  put(store, "s", "sub/new.txt", "new");
  put(store, "s", "user_code.py", "print(2)");
  KJ_SYSCALL(symlink("/etc/passwd", (dir / "workspaces/s/link").cStr()));
  auto after = snapshotWorkspace(fd);

  kj::Vector<kj::String> created;
  kj::Vector<kj::String> modified;
  kj::StringPtr ignore[] = { "user_code.py" };
  diffSnapshots(before, after, ignore, created, modified);

  KJ_ASSERT(created.size() == 1);
  KJ_EXPECT(created[0] == "sub/new.txt");
  KJ_ASSERT(modified.size() == 1);
  KJ_EXPECT(modified[0] == "change.txt");
}

KJ_TEST("SessionStore: trees deeper than PATH_MAX can be listed, snapshotted and deleted") {
  TempDir dir;
  {
    SessionStore store(dir.get());
    store.create("deep");
    store.commit("deep");
    buildDeepTree(store, "deep");
    put(store, "deep", "top.txt", "y");

    auto files = store.listFiles("deep");
    KJ_ASSERT(files.size() == 2, files.size());
    KJ_EXPECT(files[0].path.endsWith("/bottom.txt"));
    KJ_EXPECT(files[0].path.size() == DEEP_LEVELS * (DEEP_NAME_LENGTH + 1) + strlen("bottom.txt"),
              files[0].path.size());
    KJ_EXPECT(files[0].size == 1);
    KJ_EXPECT(files[1].path == "top.txt");

    {
      auto fd = store.openWorkspace("deep");
      auto snapshot = snapshotWorkspace(fd);
      KJ_EXPECT(snapshot.size() == 2);
    }

    store.clearWorkspace("deep");
    KJ_EXPECT(store.listFiles("deep").size() == 0);

    // Left in the trash, as if the process died before deleting it.
    buildDeepTree(store, "deep");
    store.detach("deep");
    KJ_EXPECT(store.find("deep") == nullptr);
    KJ_EXPECT(listDirectory(dir / "trash").size() == 1);
  }

  // The next start empties the trash.
  SessionStore store(dir.get());
  KJ_EXPECT(listDirectory(dir / "trash").size() == 0);

  store.create("again");
  store.commit("again");
  buildDeepTree(store, "again");
  store.remove("again");
  KJ_EXPECT(access((dir / "workspaces/again").cStr(), F_OK) < 0);
  KJ_EXPECT(access((dir / "records/again").cStr(), F_OK) < 0);
}

KJ_TEST("SessionStore: listing never follows a symlinked directory") {
  TempDir dir;
  SessionStore store(dir.get());
  store.create("s");
  put(store, "s", "real/file.txt", "data");
  ensureDirectory(dir / "outside");
  replaceFile(dir / "outside/secret.txt", kj::StringPtr("host").asBytes());
  KJ_SYSCALL(symlink((dir / "outside").cStr(), (dir / "workspaces/s/linked").cStr()));

  auto files = store.listFiles("s");
  KJ_ASSERT(files.size() == 1, files.size());
  KJ_EXPECT(files[0].path == "real/file.txt");

  auto fd = store.openWorkspace("s");
  auto snapshot = snapshotWorkspace(fd);
  KJ_EXPECT(snapshot.size() == 1);
  KJ_EXPECT(snapshot.find(kj::str("linked/secret.txt")) == snapshot.end());
}

KJ_TEST("parseSessionPath") {
  KJ_EXPECT(parseSessionPath("a/b.txt").toString() == "a/b.txt");
  KJ_EXPECT(parseSessionPath("a/../b").toString() == "b");
  expectEngineError(ErrorKind::INVALID_REQUEST, []() { parseSessionPath("/abs"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, []() { parseSessionPath(".."); });
  expectEngineError(ErrorKind::INVALID_REQUEST, []() { parseSessionPath(""); });
}

}  // namespace
}  // namespace guestbox
