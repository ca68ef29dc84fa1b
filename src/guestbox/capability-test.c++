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
#include <kj/test.h>
#include "test-util.h"

namespace guestbox {
namespace {

RuntimeImage makeImage(kj::StringPtr directory) {
  RuntimeImage image;
  image.language = kj::str("python");
  image.version = kj::str("3");
  image.directory = kj::heapString(directory);
  image.hostEntryPoint = kj::str(directory, "/bin/python3");
  image.guestEntryPoint = kj::str("/runtime/bin/python3");
  image.payloadFile = kj::str("user_code.py");
  return image;
}

KJ_TEST("validateGuestPath") {
  validateGuestPath("/app");
  validateGuestPath("/usr/lib");

  KJ_EXPECT_THROW_MESSAGE("must be absolute", validateGuestPath("app"));
  KJ_EXPECT_THROW_MESSAGE("must be absolute", validateGuestPath("/"));
  KJ_EXPECT_THROW_MESSAGE("must be normalized", validateGuestPath("/app/../etc"));
  KJ_EXPECT_THROW_MESSAGE("must be normalized", validateGuestPath("/app/./x"));
  KJ_EXPECT_THROW_MESSAGE("must be normalized", validateGuestPath("/app//x"));
  KJ_EXPECT_THROW_MESSAGE("must be normalized", validateGuestPath("/app/"));
}

KJ_TEST("CapabilityBinder: working directory, shared mount and runtime image") {
  TempDir dir;
  auto workspaces = kj::str(dir.get(), "/workspaces");
  auto runtime = kj::str(dir.get(), "/runtime");
  auto helpers = kj::str(dir.get(), "/helpers");
  ensureDirectory(workspaces);
  ensureDirectory(runtime);
  ensureDirectory(helpers);
  auto workdir = kj::str(workspaces, "/abc");
  ensureDirectory(workdir);

  CapabilityBinder binder(workspaces);
  binder.addSharedMount(CapabilityBinder::HELPER_GUEST_PATH, helpers);

  auto image = makeImage(runtime);
  auto caps = binder.bind(workdir, image);

  KJ_EXPECT(caps.getWorkdirHostPath() == workdir);
  KJ_EXPECT(caps.getWorkdirGuestPath() == "/app");

  auto mappings = caps.getMappings();
  KJ_ASSERT(mappings.size() == 3);
  // Sorted by guest path.
  KJ_EXPECT(mappings[0].guestPath == "/app");
  KJ_EXPECT(mappings[0].hostPath == workdir);
  KJ_EXPECT(mappings[0].type == Mapping::Type::WRITABLE);
  KJ_EXPECT(mappings[1].guestPath == "/data");
  KJ_EXPECT(mappings[1].type == Mapping::Type::READABLE);
  KJ_EXPECT(mappings[2].guestPath == "/runtime");
  KJ_EXPECT(mappings[2].hostPath == runtime);
  KJ_EXPECT(mappings[2].type == Mapping::Type::IMAGE);
  KJ_EXPECT(mappings[2].isDirectory);

  // Exactly one writable mapping.
  uint writable = 0;
  for (auto& mapping: mappings) {
    if (mapping.type == Mapping::Type::WRITABLE) ++writable;
  }
  KJ_EXPECT(writable == 1);

  auto roots = caps.grantedRoots();
  // The working directory, the shared mount and four devices. No host system directory and
  // not the runtime image.
  KJ_EXPECT(roots.size() == 6);
  bool sawDevNull = false;
  for (auto& root: roots) {
    if (root == "/dev/null") sawDevNull = true;
    KJ_EXPECT(root != "/etc");
    KJ_EXPECT(root != "/usr");
    KJ_EXPECT(root != "/lib");
    KJ_EXPECT(root != "/runtime");
  }
  KJ_EXPECT(sawDevNull);
}

KJ_TEST("CapabilityBinder: rejects working directories outside the workspace root") {
  TempDir dir;
  auto workspaces = kj::str(dir.get(), "/workspaces");
  ensureDirectory(workspaces);
  ensureDirectory(kj::str(workspaces, "/abc"));
  ensureDirectory(kj::str(workspaces, "/abc/nested"));
  ensureDirectory(kj::str(dir.get(), "/elsewhere"));
  KJ_SYSCALL(symlink(kj::str(dir.get(), "/elsewhere").cStr(),
                     kj::str(workspaces, "/link").cStr()));

  CapabilityBinder binder(workspaces);
  auto image = makeImage(kj::str(dir.get(), "/elsewhere"));

  KJ_EXPECT_THROW_MESSAGE("direct child",
      binder.bind(kj::str(dir.get(), "/elsewhere"), image));
  KJ_EXPECT_THROW_MESSAGE("direct child",
      binder.bind(kj::str(workspaces, "/abc/nested"), image));
  KJ_EXPECT_THROW_MESSAGE("direct child", binder.bind(workspaces, image));
  KJ_EXPECT_THROW_MESSAGE("invalid working directory",
      binder.bind(kj::str(workspaces, "/.."), image));
  KJ_EXPECT_THROW_MESSAGE("real directory",
      binder.bind(kj::str(workspaces, "/link"), image));
}

KJ_TEST("CapabilityDescriptor: rejects nested and reserved guest paths") {
  auto make = [](kj::StringPtr a, kj::StringPtr b) {
    auto mappings = kj::heapArrayBuilder<Mapping>(2);
    mappings.add(Mapping { kj::heapString(a), kj::str("/tmp"), Mapping::Type::READABLE, true });
    mappings.add(Mapping { kj::heapString(b), kj::str("/tmp"), Mapping::Type::READABLE, true });
    return CapabilityDescriptor(mappings.finish(), kj::str("/tmp"), kj::str("/app"));
  };

  make("/lib", "/lib64");
  KJ_EXPECT_THROW_MESSAGE("must not nest", make("/usr", "/usr/lib"));
  KJ_EXPECT_THROW_MESSAGE("duplicate guest path", make("/usr", "/usr"));
  KJ_EXPECT_THROW_MESSAGE("/dev is reserved", make("/app", "/dev/shm"));
}

}  // namespace
}  // namespace guestbox
