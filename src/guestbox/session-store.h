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


#ifndef GUESTBOX_SESSION_STORE_H_
#define GUESTBOX_SESSION_STORE_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/io.h>
#include <capnp/message.h>
#include <guestbox/session.capnp.h>
#include <map>
#include "util.h"
#include <inttypes.h>

namespace guestbox {

struct FileEntry {
  kj::String path;
  // Relative to the working directory.
  uint64_t size;
};

struct FileStamp {
  uint64_t size;
  int64_t mtimeNs;
  uint64_t inode;
};

typedef std::map<kj::String, FileStamp> WorkspaceSnapshot;

class SessionStore {
  // Durable mapping from session id to session record, plus the working directories those
  // records own. Layout under the storage directory:
  //
  //     records/<id>      SessionRecord, as a Cap'n Proto message
  //     workspaces/<id>/  working directory, mapped at /app in the guest
  //     trash/            working directories waiting to be deleted
  //     sandbox-root/     empty; guests assemble their root on top of it
  //
  // Records are held in memory and written through on commit(). Nothing here is ever visible
  // to a guest except its own working directory.

public:
  explicit SessionStore(kj::StringPtr storageDir);
  KJ_DISALLOW_COPY(SessionStore);

  kj::StringPtr getWorkspaceRoot() const { return workspaceRoot; }
  kj::StringPtr getMountPoint() const { return mountPoint; }

  kj::Array<kj::String> loadAll();
  // Read every record persisted by a previous process. Unreadable records are logged and
  // deleted. Returns the ids loaded.

  SessionRecord::Builder create(kj::StringPtr id);
  // Create a record with only its id set, and an empty working directory. The id must not be in
  // use.

  kj::Maybe<SessionRecord::Builder> find(kj::StringPtr id);
  kj::Array<kj::StringPtr> ids() const;

  void commit(kj::StringPtr id);
  // Write the in-memory record to disk.

  void remove(kj::StringPtr id);
  // Delete the record and its working directory.

  kj::String detach(kj::StringPtr id);
  // Delete the record, and move its working directory into the trash, returning the new path.
  // Used when the directory is still in use; pass the path to deleteDetached() later.

  void deleteDetached(kj::StringPtr trashPath);

  void clearWorkspace(kj::StringPtr id);
  // Empty the working directory, keeping the directory itself.

  kj::String workspacePath(kj::StringPtr id) const;
  kj::AutoCloseFd openWorkspace(kj::StringPtr id) const;

  kj::Array<FileEntry> listFiles(kj::StringPtr id) const;
  kj::Array<byte> readFile(kj::StringPtr id, kj::StringPtr path) const;
  void writeFile(kj::StringPtr id, kj::StringPtr path, kj::ArrayPtr<const byte> content,
                 uint64_t maxBytes);
  void deletePath(kj::StringPtr id, kj::StringPtr path);
  // `path` is relative to the working directory and can never reach outside it; symlinks are
  // resolved as though the working directory were the root. The state file can be read but not
  // written or deleted. Violations throw InvalidRequest.

private:
  struct Entry {
    kj::String id;
    capnp::MallocMessageBuilder message;
  };

  kj::String storageDir;
  kj::String recordsDir;
  kj::String workspaceRoot;
  kj::String trashDir;
  kj::String mountPoint;
  std::map<kj::StringPtr, kj::Own<Entry>> entries;
  uint trashCounter = 0;

  Entry& getEntry(kj::StringPtr id);
  const Entry& getEntry(kj::StringPtr id) const;
};

WorkspaceSnapshot snapshotWorkspace(int workdirFd);
// Every regular file in the tree, without following symlinks.

void diffSnapshots(const WorkspaceSnapshot& before, const WorkspaceSnapshot& after,
                   kj::ArrayPtr<const kj::StringPtr> ignore,
                   kj::Vector<kj::String>& created, kj::Vector<kj::String>& modified);
// Compare two snapshots. Paths in `ignore` are skipped.

kj::Path parseSessionPath(kj::StringPtr path);
// Parse a caller-supplied relative path. Throws InvalidRequest if it is absolute, empty, or
// climbs above its starting directory.

}  // namespace guestbox

#endif // GUESTBOX_SESSION_STORE_H_
