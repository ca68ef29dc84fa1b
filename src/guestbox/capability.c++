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


#include "capability.h"
#include "runtime-registry.h"
#include "util.h"
#include <kj/debug.h>
#include <algorithm>
#include <sys/stat.h>
#include <unistd.h>

namespace guestbox {

static const char* const DEVICE_NODES[] = { "/dev/null", "/dev/zero", "/dev/random", "/dev/urandom" };

void validateGuestPath(kj::StringPtr path) {
  KJ_REQUIRE(path.startsWith("/") && path.size() > 1, "guest path must be absolute", path);
  for (auto part: split(path.slice(1), '/')) {
    KJ_REQUIRE(part.size() > 0 && !(part.size() == 1 && part[0] == '.') &&
               !(part.size() == 2 && part[0] == '.' && part[1] == '.'),
               "guest path must be normalized", path);
  }
}

static bool isDirectoryFollowingLinks(kj::StringPtr path) {
  // Shared directories are often configured through a symlink; the mount follows it.
  struct stat stats;
  KJ_SYSCALL(stat(path.cStr(), &stats), path);
  return S_ISDIR(stats.st_mode);
}

static bool isParentOrSame(kj::StringPtr parent, kj::StringPtr child) {
  return child.startsWith(parent) &&
      (child.size() == parent.size() || child[parent.size()] == '/');
}

CapabilityDescriptor::CapabilityDescriptor(
    kj::Array<Mapping> mappingsParam, kj::String workdirHostPath, kj::String workdirGuestPath)
    : mappings(kj::mv(mappingsParam)),
      workdirHostPath(kj::mv(workdirHostPath)),
      workdirGuestPath(kj::mv(workdirGuestPath)) {
  std::sort(mappings.begin(), mappings.end(), [](const Mapping& a, const Mapping& b) {
    return a.guestPath < b.guestPath;
  });

  for (auto i: kj::indices(mappings)) {
    validateGuestPath(mappings[i].guestPath);
    KJ_REQUIRE(mappings[i].guestPath != "/dev" && !mappings[i].guestPath.startsWith("/dev/"),
               "/dev is reserved", mappings[i].guestPath);
    if (i > 0) {
      KJ_REQUIRE(mappings[i - 1].guestPath != mappings[i].guestPath,
                 "duplicate guest path", mappings[i].guestPath);
      // Mount points are created inside the tmpfs root, so one mapping can't sit inside another.
      KJ_REQUIRE(!isParentOrSame(mappings[i - 1].guestPath, mappings[i].guestPath),
                 "guest paths must not nest", mappings[i - 1].guestPath, mappings[i].guestPath);
    }
  }

  // The runtime image is visible so that the interpreter can load itself, but it is not a
  // place guest code is granted; failed accesses there are reported like any other path.
  kj::Vector<kj::String> builder(mappings.size() + kj::size(DEVICE_NODES));
  for (auto& mapping: mappings) {
    if (mapping.type != Mapping::Type::IMAGE) {
      builder.add(kj::heapString(mapping.guestPath));
    }
  }
  for (auto device: DEVICE_NODES) {
    builder.add(kj::heapString(device));
  }
  roots = builder.releaseAsArray();
}

CapabilityBinder::CapabilityBinder(kj::StringPtr workspaceRoot)
    : workspaceRoot(kj::heapString(workspaceRoot)) {
  KJ_REQUIRE(workspaceRoot.startsWith("/"), "workspace root must be absolute", workspaceRoot);
}

void CapabilityBinder::addSharedMount(kj::StringPtr guestPath, kj::StringPtr hostPath) {
  validateGuestPath(guestPath);
  KJ_REQUIRE(isDirectoryFollowingLinks(hostPath), "shared mount must be a directory", hostPath);
  sharedMounts.add(Mapping {
    kj::heapString(guestPath), kj::heapString(hostPath), Mapping::Type::READABLE, true
  });
}

CapabilityDescriptor CapabilityBinder::bind(
    kj::StringPtr workdir, const RuntimeImage& image) const {
  KJ_REQUIRE(workdir.startsWith(workspaceRoot) && workdir.size() > workspaceRoot.size() + 1 &&
             workdir[workspaceRoot.size()] == '/' &&
             workdir.slice(workspaceRoot.size() + 1).findFirst('/') == nullptr,
             "working directory must be a direct child of the workspace root",
             workdir, workspaceRoot);
  {
    kj::StringPtr name = workdir.slice(workspaceRoot.size() + 1);
    KJ_REQUIRE(name != "." && name != "..", "invalid working directory", workdir);
  }

  struct stat stats;
  KJ_SYSCALL(lstat(workdir.cStr(), &stats), workdir);
  KJ_REQUIRE(S_ISDIR(stats.st_mode), "working directory must be a real directory", workdir);

  kj::Vector<Mapping> mappings(sharedMounts.size() + 2);

  mappings.add(Mapping {
    kj::str(WORKDIR_GUEST_PATH), kj::heapString(workdir), Mapping::Type::WRITABLE, true
  });
  mappings.add(Mapping {
    kj::str(RUNTIME_GUEST_PATH), kj::heapString(image.directory), Mapping::Type::IMAGE, true
  });
  for (auto& shared: sharedMounts) {
    mappings.add(Mapping {
      kj::heapString(shared.guestPath), kj::heapString(shared.hostPath), shared.type, true
    });
  }

  return CapabilityDescriptor(mappings.releaseAsArray(), kj::heapString(workdir),
                              kj::str(WORKDIR_GUEST_PATH));
}

}  // namespace guestbox
