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
#include "result.h"
#include "session-id.h"
#include <kj/debug.h>
#include <capnp/serialize.h>
#include <algorithm>
#include <sys/stat.h>
#include <fcntl.h>
#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <unistd.h>

namespace guestbox {

SessionStore::SessionStore(kj::StringPtr storageDir)
    : storageDir(kj::heapString(storageDir)),
      recordsDir(kj::str(storageDir, "/records")),
      workspaceRoot(kj::str(storageDir, "/workspaces")),
      trashDir(kj::str(storageDir, "/trash")),
      mountPoint(kj::str(storageDir, "/sandbox-root")) {
  ensureDirectory(storageDir, 0700);
  ensureDirectory(recordsDir, 0700);
  ensureDirectory(workspaceRoot, 0700);
  ensureDirectory(trashDir, 0700);
  ensureDirectory(mountPoint, 0755);

  // Whatever is in the trash was being deleted when the last process died.
  for (auto& name: listDirectory(trashDir)) {
    auto path = kj::str(trashDir, '/', name);
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      recursivelyDelete(path);
    })) {
      KJ_LOG(ERROR, "couldn't empty trash; leaving it for the next start", path, *exception);
    }
  }
}

SessionStore::Entry& SessionStore::getEntry(kj::StringPtr id) {
  auto iter = entries.find(id);
  KJ_REQUIRE(iter != entries.end(), "no such session record", id);
  return *iter->second;
}

const SessionStore::Entry& SessionStore::getEntry(kj::StringPtr id) const {
  auto iter = entries.find(id);
  KJ_REQUIRE(iter != entries.end(), "no such session record", id);
  return *iter->second;
}

kj::Array<kj::String> SessionStore::loadAll() {
  kj::Vector<kj::String> loaded;

  for (auto& name: listDirectory(recordsDir)) {
    auto path = kj::str(recordsDir, '/', name);
    if (!isValidSessionId(name)) {
      // Leftover temporary file from an interrupted commit.
      KJ_SYSCALL(unlink(path.cStr()), path);
      continue;
    }

    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      auto fd = raiiOpen(path, O_RDONLY | O_CLOEXEC);
      capnp::StreamFdMessageReader reader(fd.get());
      auto record = reader.getRoot<SessionRecord>();
      KJ_REQUIRE(record.getId() == name, "record id doesn't match its file name", record.getId());
      KJ_REQUIRE(isDirectory(workspacePath(name)), "session has no working directory");

      auto entry = kj::heap<Entry>();
      entry->id = kj::heapString(name);
      entry->message.setRoot(record);
      kj::StringPtr key = entry->id;
      entries.insert(std::make_pair(key, kj::mv(entry)));
      loaded.add(kj::heapString(name));
    })) {
      KJ_LOG(ERROR, "discarding unreadable session record", path, *exception);
      KJ_SYSCALL(unlink(path.cStr()), path);
      auto workspace = workspacePath(name);
      if (access(workspace.cStr(), F_OK) == 0) {
        recursivelyDelete(workspace);
      }
    }
  }

  // Working directories with no record belong to nobody.
  for (auto& name: listDirectory(workspaceRoot)) {
    if (entries.count(name) == 0) {
      recursivelyDelete(workspacePath(name));
    }
  }

  return loaded.releaseAsArray();
}

SessionRecord::Builder SessionStore::create(kj::StringPtr id) {
  KJ_REQUIRE(isValidSessionId(id), "invalid session id", id);
  KJ_REQUIRE(entries.count(id) == 0, "session id already in use", id);

  auto workspace = workspacePath(id);
  if (access(workspace.cStr(), F_OK) == 0) {
    recursivelyDelete(workspace);
  }
  KJ_SYSCALL(mkdir(workspace.cStr(), 0700), workspace);

  auto entry = kj::heap<Entry>();
  entry->id = kj::heapString(id);
  auto record = entry->message.initRoot<SessionRecord>();
  record.setId(id);

  kj::StringPtr key = entry->id;
  entries.insert(std::make_pair(key, kj::mv(entry)));
  return record;
}

kj::Maybe<SessionRecord::Builder> SessionStore::find(kj::StringPtr id) {
  auto iter = entries.find(id);
  if (iter == entries.end()) {
    return nullptr;
  } else {
    return iter->second->message.getRoot<SessionRecord>();
  }
}

kj::Array<kj::StringPtr> SessionStore::ids() const {
  auto result = kj::heapArrayBuilder<kj::StringPtr>(entries.size());
  for (auto& entry: entries) {
    result.add(entry.first);
  }
  return result.finish();
}

void SessionStore::commit(kj::StringPtr id) {
  auto& entry = getEntry(id);
  auto words = capnp::messageToFlatArray(entry.message);
  replaceFile(kj::str(recordsDir, '/', id), words.asBytes());
}

void SessionStore::remove(kj::StringPtr id) {
  auto trashPath = detach(id);
  deleteDetached(trashPath);
}

kj::String SessionStore::detach(kj::StringPtr id) {
  auto iter = entries.find(id);
  KJ_REQUIRE(iter != entries.end(), "no such session record", id);

  auto recordPath = kj::str(recordsDir, '/', id);
  KJ_SYSCALL_HANDLE_ERRORS(unlink(recordPath.cStr())) {
    case ENOENT:
      // Never committed.
      break;
    default:
      KJ_FAIL_SYSCALL("unlink()", error, recordPath);
  }

  auto workspace = workspacePath(id);
  auto trashPath = kj::str(trashDir, '/', id, '.', trashCounter++);
  KJ_SYSCALL(rename(workspace.cStr(), trashPath.cStr()), workspace, trashPath);

  entries.erase(iter);
  return trashPath;
}

void SessionStore::deleteDetached(kj::StringPtr trashPath) {
  KJ_REQUIRE(trashPath.startsWith(trashDir), "not in the trash", trashPath);
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    recursivelyDelete(trashPath);
  })) {
    KJ_LOG(ERROR, "couldn't delete working directory", trashPath, *exception);
  }
}

void SessionStore::clearWorkspace(kj::StringPtr id) {
  getEntry(id);
  auto fd = openWorkspace(id);
  for (auto& name: listDirectoryAt(fd, ".")) {
    recursivelyDeleteAt(fd, name);
  }
}

kj::String SessionStore::workspacePath(kj::StringPtr id) const {
  return kj::str(workspaceRoot, '/', id);
}

kj::AutoCloseFd SessionStore::openWorkspace(kj::StringPtr id) const {
  return raiiOpen(workspacePath(id), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
}

// -------------------------------------------------------------------
// File operations

kj::Path parseSessionPath(kj::StringPtr path) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    KJ_REQUIRE(!path.startsWith("/"), "path must be relative");
    KJ_REQUIRE(path.findFirst('\0') == nullptr, "path contains a NUL");
  })) {
    throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("invalid path '", path, "'"));
  }

  kj::Maybe<kj::Path> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = kj::Path::parse(path);
  })) {
    throwEngineError(ErrorKind::INVALID_REQUEST,
        kj::str("invalid path '", path, "': it must stay inside the working directory"));
  }

  KJ_IF_MAYBE(parsed, result) {
    if (parsed->size() == 0) {
      throwEngineError(ErrorKind::INVALID_REQUEST, "path names the working directory itself");
    }
    return kj::mv(*parsed);
  }
  KJ_UNREACHABLE;
}

static bool isStatePath(kj::PathPtr path) {
  return path.size() == 1 && CodeWrapper::isReservedFile(path[0]);
}

static kj::Maybe<kj::AutoCloseFd> openContained(int dirfd, kj::PathPtr path, int flags,
                                                kj::StringPtr original) {
  // Escapes via symlink show up as exceptions from path evaluation.
  kj::Maybe<kj::AutoCloseFd> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = raiiOpenAtIfExistsContained(dirfd, path, flags);
  })) {
    if (exception->getType() == kj::Exception::Type::FAILED) {
      throwEngineError(ErrorKind::INVALID_REQUEST,
          kj::str("can't open '", original, "': ", exception->getDescription()));
    }
    kj::throwFatalException(kj::mv(*exception));
  }
  return kj::mv(result);
}

static kj::AutoCloseFd openParent(int workdirFd, kj::PathPtr path, kj::StringPtr original,
                                  bool create) {
  int fd;
  KJ_SYSCALL(fd = dup(workdirFd));
  kj::AutoCloseFd current(fd);

  for (auto& part: path.parent()) {
    auto partPath = kj::Path(kj::heapString(part));
    KJ_IF_MAYBE(next, openContained(current, partPath,
                                    O_RDONLY | O_DIRECTORY | O_CLOEXEC, original)) {
      current = kj::mv(*next);
    } else if (create) {
      KJ_SYSCALL(mkdirat(current, part.cStr(), 0755), part);
      current = raiiOpenAt(current, part, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    } else {
      throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("no such file: '", original, "'"));
    }
  }

  return current;
}

static constexpr uint MAX_WALK_DEPTH = 128;
// Guest-built trees can be arbitrarily deep; anything below this many levels isn't reported.

static void walkTree(int dirfd, kj::StringPtr prefix, uint depth,
                     kj::Function<void(kj::StringPtr path, const struct stat& stats)>& callback) {
  // Each level is opened relative to its parent with O_NOFOLLOW, so the walk never sees a path
  // longer than one component and never leaves the tree, even if the guest is rearranging it
  // meanwhile.
  for (auto& name: listDirectoryAt(dirfd, ".")) {
    auto path = prefix.size() == 0 ? kj::heapString(name) : kj::str(prefix, '/', name);
    struct stat stats;
    KJ_SYSCALL_HANDLE_ERRORS(fstatat(dirfd, name.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
      case ENOENT:
        continue;
      default:
        KJ_FAIL_SYSCALL("fstatat()", error, path);
    }
    if (S_ISDIR(stats.st_mode)) {
      if (depth >= MAX_WALK_DEPTH) continue;
      int fd;
      KJ_SYSCALL_HANDLE_ERRORS(fd = openat(dirfd, name.cStr(),
                                           O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC)) {
        case ENOENT:
        case ENOTDIR:
        case ELOOP:
          // Replaced since the fstatat().
          continue;
        default:
          KJ_FAIL_SYSCALL("openat()", error, path);
      }
      kj::AutoCloseFd subdirectory(fd);
      walkTree(subdirectory, path, depth + 1, callback);
    } else if (S_ISREG(stats.st_mode)) {
      callback(path, stats);
    }
  }
}

kj::Array<FileEntry> SessionStore::listFiles(kj::StringPtr id) const {
  getEntry(id);
  auto fd = openWorkspace(id);

  kj::Vector<FileEntry> result;
  kj::Function<void(kj::StringPtr, const struct stat&)> callback =
      [&](kj::StringPtr path, const struct stat& stats) {
    result.add(FileEntry { kj::heapString(path), static_cast<uint64_t>(stats.st_size) });
  };
  walkTree(fd, "", 0, callback);

  std::sort(result.begin(), result.end(), [](const FileEntry& a, const FileEntry& b) {
    return a.path < b.path;
  });
  return result.releaseAsArray();
}

kj::Array<byte> SessionStore::readFile(kj::StringPtr id, kj::StringPtr path) const {
  getEntry(id);
  auto parsed = parseSessionPath(path);
  auto workdir = openWorkspace(id);

  KJ_IF_MAYBE(fd, openContained(workdir, parsed, O_RDONLY | O_CLOEXEC, path)) {
    struct stat stats;
    KJ_SYSCALL(fstat(*fd, &stats));
    if (!S_ISREG(stats.st_mode)) {
      throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("not a regular file: '", path, "'"));
    }
    return readAllBytes(*fd);
  } else {
    throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("no such file: '", path, "'"));
  }
}

void SessionStore::writeFile(kj::StringPtr id, kj::StringPtr path,
                             kj::ArrayPtr<const byte> content, uint64_t maxBytes) {
  getEntry(id);
  auto parsed = parseSessionPath(path);
  if (isStatePath(parsed)) {
    throwEngineError(ErrorKind::INVALID_REQUEST, "the session state file is read-only");
  }
  if (content.size() > maxBytes) {
    throwEngineError(ErrorKind::INVALID_REQUEST,
        kj::str("file of ", content.size(), " bytes exceeds the limit of ", maxBytes));
  }

  auto workdir = openWorkspace(id);
  auto parent = openParent(workdir, parsed, path, true);
  auto& name = parsed.basename()[0];

  // Write beside the target and rename over it. rename() replaces a symlink rather than
  // following it, so the write can't land outside the working directory.
  auto tmpName = kj::str(".", name, ".upload.", getpid());
  KJ_SYSCALL_HANDLE_ERRORS(unlinkat(parent, tmpName.cStr(), 0)) {
    case ENOENT:
      break;
    default:
      KJ_FAIL_SYSCALL("unlinkat()", error, tmpName);
  }
  {
    auto fd = raiiOpenAt(parent, tmpName,
                         O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644);
    kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
  }
  KJ_SYSCALL_HANDLE_ERRORS(renameat(parent, tmpName.cStr(), parent, name.cStr())) {
    case EISDIR:
    case ENOTEMPTY:
    case EEXIST:
      KJ_SYSCALL(unlinkat(parent, tmpName.cStr(), 0), tmpName);
      throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("'", path, "' is a directory"));
    default:
      KJ_FAIL_SYSCALL("renameat()", error, path);
  }
}

void SessionStore::deletePath(kj::StringPtr id, kj::StringPtr path) {
  getEntry(id);
  auto parsed = parseSessionPath(path);
  if (isStatePath(parsed)) {
    throwEngineError(ErrorKind::INVALID_REQUEST, "the session state file can't be deleted");
  }

  auto workdir = openWorkspace(id);
  auto parent = openParent(workdir, parsed, path, false);
  auto& name = parsed.basename()[0];

  struct stat stats;
  KJ_SYSCALL_HANDLE_ERRORS(fstatat(parent, name.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
    case ENOENT:
      throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("no such file: '", path, "'"));
    default:
      KJ_FAIL_SYSCALL("fstatat()", error, path);
  }
  recursivelyDeleteAt(parent, name);
}

// -------------------------------------------------------------------
// Snapshots

WorkspaceSnapshot snapshotWorkspace(int workdirFd) {
  WorkspaceSnapshot result;
  kj::Function<void(kj::StringPtr, const struct stat&)> callback =
      [&](kj::StringPtr path, const struct stat& stats) {
    FileStamp stamp;
    stamp.size = stats.st_size;
    stamp.mtimeNs = static_cast<int64_t>(stats.st_mtim.tv_sec) * 1000000000ll +
                    stats.st_mtim.tv_nsec;
    stamp.inode = stats.st_ino;
    result.insert(std::make_pair(kj::heapString(path), stamp));
  };
  walkTree(workdirFd, "", 0, callback);
  return result;
}

void diffSnapshots(const WorkspaceSnapshot& before, const WorkspaceSnapshot& after,
                   kj::ArrayPtr<const kj::StringPtr> ignore,
                   kj::Vector<kj::String>& created, kj::Vector<kj::String>& modified) {
  for (auto& entry: after) {
    bool ignored = false;
    for (auto name: ignore) {
      if (entry.first == name) ignored = true;
    }
    if (ignored) continue;

    auto iter = before.find(entry.first);
    if (iter == before.end()) {
      created.add(kj::heapString(entry.first));
    } else if (iter->second.size != entry.second.size ||
               iter->second.mtimeNs != entry.second.mtimeNs ||
               iter->second.inode != entry.second.inode) {
      modified.add(kj::heapString(entry.first));
    }
  }
}

}  // namespace guestbox
