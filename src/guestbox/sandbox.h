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


#ifndef GUESTBOX_SANDBOX_H_
#define GUESTBOX_SANDBOX_H_
// The Linux-namespace sandbox that guest runtimes execute in.
//
// Each execution forks a "keeper" from the engine. The keeper unshares its namespaces and forks
// the guest, which becomes pid 1 of a fresh pid namespace. The guest waits on the start pipe
// until the engine has attached its meters, then assembles its filesystem, drops everything it
// can, and execs the interpreter. The keeper reaps it and reports back.

#include <kj/string.h>
#include <kj/array.h>
#include <sys/types.h>
#include <inttypes.h>

namespace guestbox {

class CapabilityDescriptor;

namespace sandbox {

struct GuestSpec {
  const CapabilityDescriptor& capabilities;

  kj::StringPtr mountPoint;
  // An empty host directory. The guest's root tmpfs is assembled on top of it inside the guest's
  // private mount namespace, so the host never sees anything mounted there.

  kj::StringPtr executable;
  // Guest path of the interpreter.

  kj::ArrayPtr<const kj::String> argv;
  kj::ArrayPtr<const kj::String> environ;

  uint64_t memoryBytes;
  uint64_t maxFileBytes;
};

struct KeeperFds {
  int stdoutFd;
  int stderrFd;
  // Write ends; become the guest's stdout and stderr.

  int controlFd;
  // Keeper to engine: KeeperReport messages.

  int startFd;
  // Engine to guest: one byte means go, EOF means abort.

  int setupErrorFd;
  // Guest to engine, close-on-exec: EOF without data means the exec succeeded.

  int workdirFd;
  // The session working directory, opened by the engine before the run. It is mounted in place
  // of the directory's host path, so renaming the directory mid-run does not break the guest.
};

struct KeeperReport {
  enum Type: uint32_t {
    STARTED,
    // `pid` is the guest's pid as seen by the engine.
    EXITED,
    // `status` is the guest's wait status.
    FAILED
    // The keeper could not set up the sandbox; see `error`.
  };

  uint32_t type;
  int32_t pid;
  int32_t status;
  uint64_t maxRssBytes;
  uint64_t cpuTimeNs;
  char error[512];
};

int runKeeper(const GuestSpec& spec, const KeeperFds& fds);
// Body of the keeper process. Returns the keeper's exit code.

void hideUserGroupIds(uid_t realUid, gid_t realGid);
// Map ourselves as 1000:1000 in a fresh user namespace.

void unshareNamespaces();
// Enter new user, mount, ipc, uts, pid and net namespaces. The pid namespace applies to children
// forked afterwards.

void setupFilesystem(const CapabilityDescriptor& capabilities, kj::StringPtr mountPoint,
                     int workdirFd = -1);
// Build the guest's root at `mountPoint`: a read-only tmpfs holding the mappings and a minimal
// /dev. Leaves the current directory at `mountPoint`. If `workdirFd` is given, the working
// directory is mounted from it rather than from its host path.

void enterRoot(kj::StringPtr mountPoint);
// pivot_root into `mountPoint` and detach the old root entirely.

void setResourceLimits(uint64_t memoryBytes, uint64_t maxFileBytes);

void dropPrivileges();
// Drop all Linux capabilities and set no_new_privs.

void setupSeccomp();

}  // namespace sandbox
}  // namespace guestbox

#endif // GUESTBOX_SANDBOX_H_
