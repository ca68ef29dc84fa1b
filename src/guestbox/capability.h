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


#ifndef GUESTBOX_CAPABILITY_H_
#define GUESTBOX_CAPABILITY_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/vector.h>

namespace guestbox {

struct RuntimeImage;

struct Mapping {
  // One entry of a guest's filesystem view. Anything not covered by some mapping does not exist
  // in the guest.

  enum class Type {
    WRITABLE,
    // Bind-mounted read-write. Only the session working directory.
    READABLE,
    // Bind-mounted read-only.
    IMAGE
    // The runtime image, bind-mounted read-only. Not counted among the granted roots.
  };

  kj::String guestPath;
  kj::String hostPath;
  Type type;
  bool isDirectory;
};

class CapabilityDescriptor {
  // The complete filesystem view of one execution.

public:
  CapabilityDescriptor(kj::Array<Mapping> mappings, kj::String workdirHostPath,
                       kj::String workdirGuestPath);

  kj::ArrayPtr<const Mapping> getMappings() const { return mappings; }
  // Parents before children, so mounting in order never hides an earlier mount.

  kj::ArrayPtr<const kj::String> grantedRoots() const { return roots; }
  // The guest path of every mapping except the runtime image, plus the devices under /dev.

  kj::StringPtr getWorkdirHostPath() const { return workdirHostPath; }
  kj::StringPtr getWorkdirGuestPath() const { return workdirGuestPath; }

private:
  kj::Array<Mapping> mappings;
  kj::Array<kj::String> roots;
  kj::String workdirHostPath;
  kj::String workdirGuestPath;
};

class CapabilityBinder {
public:
  static constexpr const char* WORKDIR_GUEST_PATH = "/app";
  static constexpr const char* HELPER_GUEST_PATH = "/data";
  static constexpr const char* EXTERNAL_GUEST_PATH = "/external";
  static constexpr const char* RUNTIME_GUEST_PATH = "/runtime";

  explicit CapabilityBinder(kj::StringPtr workspaceRoot);

  void addSharedMount(kj::StringPtr guestPath, kj::StringPtr hostPath);
  // Map a process-wide host directory read-only into every guest. Configuration time only.

  CapabilityDescriptor bind(kj::StringPtr workdir, const RuntimeImage& image) const;
  // `workdir` is a host path that must be a direct child of the workspace root and must not be
  // a symlink.

  kj::StringPtr getWorkspaceRoot() const { return workspaceRoot; }

private:
  kj::String workspaceRoot;
  kj::Vector<Mapping> sharedMounts;
};

void validateGuestPath(kj::StringPtr path);
// Throws unless `path` is absolute, not "/", and free of empty, "." and ".." components.

}  // namespace guestbox

#endif // GUESTBOX_CAPABILITY_H_
