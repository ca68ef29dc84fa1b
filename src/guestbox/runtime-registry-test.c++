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

#include "runtime-registry.h"
#include "test-util.h"
#include <kj/debug.h>
#include <sys/stat.h>
#include <unistd.h>

namespace guestbox {
namespace {

void writeManifest(const TempDir& dir, kj::StringPtr language, kj::StringPtr json) {
  // Writes the manifest plus an executable bin/sh inside the image.
  auto imageDir = dir / language;
  ensureDirectory(imageDir);
  replaceFile(kj::str(imageDir, "/runtime.json"), json.asBytes());
  ensureDirectory(kj::str(imageDir, "/bin"));
  auto interp = kj::str(imageDir, "/bin/sh");
  replaceFile(interp, kj::StringPtr("#!/bin/sh\n").asBytes());
  KJ_SYSCALL(chmod(interp.cStr(), 0755));
}

kj::String shellManifest(kj::StringPtr language, kj::StringPtr extra = nullptr) {
  return kj::str(
      "{\"language\": \"", language, "\", \"version\": \"1.0\",",
      " \"capabilities\": [\"stdlib\", \"json\"],",
      " \"entryPoint\": \"bin/sh\", \"argv\": [\"sh\", \"{payload}\", \"{workdir}\"],",
      " \"environ\": [{\"key\": \"LC_ALL\", \"value\": \"C.UTF-8\"}],",
      " \"payloadFile\": \"user_code.sh\"", extra, "}");
}

KJ_TEST("RuntimeRegistry loads a manifest") {
  TempDir dir;
  writeManifest(dir, "shell", shellManifest("shell"));

  RuntimeRegistry registry(dir.get());
  auto& image = registry.load("shell");
  KJ_EXPECT(image.language == "shell");
  KJ_EXPECT(image.version == "1.0");
  KJ_ASSERT(image.capabilities.size() == 2);
  KJ_EXPECT(image.capabilities[1] == "json");
  KJ_EXPECT(image.directory == dir / "shell");
  KJ_EXPECT(image.hostEntryPoint == dir / "shell/bin/sh");
  KJ_EXPECT(image.guestEntryPoint == "/runtime/bin/sh");
  KJ_ASSERT(image.environ.size() == 1);
  KJ_EXPECT(image.environ[0] == "LC_ALL=C.UTF-8");
  KJ_EXPECT(image.payloadFile == "user_code.sh");

  // Loading again returns the same image.
  KJ_EXPECT(&registry.load("shell") == &image);
  KJ_EXPECT(&registry.get("shell") == &image);

  auto argv = image.expandArgv("/workspaces/abc/user_code.sh", "/workspaces/abc");
  KJ_ASSERT(argv.size() == 3);
  KJ_EXPECT(argv[0] == "sh");
  KJ_EXPECT(argv[1] == "/workspaces/abc/user_code.sh");
  KJ_EXPECT(argv[2] == "/workspaces/abc");
}

KJ_TEST("RuntimeRegistry resolves the entry point inside the image") {
  TempDir dir;
  writeManifest(dir, "tiny", "{\"language\": \"tiny\", \"entryPoint\": \"bin/tiny\","
                             " \"argv\": [\"tiny\", \"{payload}\"]}");
  auto interp = dir / "tiny/bin/tiny";
  replaceFile(interp, kj::StringPtr("#!/bin/sh\n").asBytes());
  KJ_SYSCALL(chmod(interp.cStr(), 0755));

  RuntimeRegistry registry(dir.get());
  auto& image = registry.load("tiny");
  KJ_EXPECT(image.hostEntryPoint == interp);
  KJ_EXPECT(image.guestEntryPoint == "/runtime/bin/tiny");
  KJ_EXPECT(image.payloadFile == "user_code");
}

KJ_TEST("RuntimeRegistry distinguishes unsupported from unloaded languages") {
  TempDir dir;
  writeManifest(dir, "shell", shellManifest("shell"));
  writeManifest(dir, "other", shellManifest("other"));

  RuntimeRegistry registry(dir.get());
  registry.load("shell");
  registry.seal();
  KJ_EXPECT(registry.isSealed());

  expectEngineError(ErrorKind::RUNTIME_NOT_LOADED, [&]() { registry.get("other"); });
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE, [&]() { registry.get("cobol"); });
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE, [&]() { registry.get("../shell"); });
  KJ_EXPECT(registry.find("other") == nullptr);

  KJ_EXPECT_THROW_MESSAGE("sealed", registry.load("other"));
}

KJ_TEST("RuntimeRegistry::load() rejects an unknown language") {
  TempDir dir;
  RuntimeRegistry registry(dir.get());
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE, [&]() { registry.load("python"); });
}

KJ_TEST("RuntimeRegistry::loadAll() loads every image directory") {
  TempDir dir;
  writeManifest(dir, "zsh", shellManifest("zsh"));
  writeManifest(dir, "ash", shellManifest("ash"));
  ensureDirectory(dir / "empty");
  replaceFile(dir / "README", kj::StringPtr("not an image").asBytes());

  RuntimeRegistry registry(dir.get());
  registry.loadAll();
  auto images = registry.list();
  KJ_ASSERT(images.size() == 2);
  KJ_EXPECT(images[0]->language == "ash");
  KJ_EXPECT(images[1]->language == "zsh");
}

KJ_TEST("RuntimeRegistry rejects broken manifests") {
  TempDir dir;
  RuntimeRegistry registry(dir.get());

  writeManifest(dir, "mismatch", shellManifest("other"));
  KJ_EXPECT_THROW_MESSAGE("different language", registry.load("mismatch"));

  writeManifest(dir, "garbage", "{\"language\": ");
  KJ_EXPECT_THROW_MESSAGE("not valid", registry.load("garbage"));

  writeManifest(dir, "noargv", "{\"language\": \"noargv\", \"entryPoint\": \"bin/sh\"}");
  KJ_EXPECT_THROW_MESSAGE("empty argv", registry.load("noargv"));

  writeManifest(dir, "badenv", "{\"language\": \"badenv\", \"entryPoint\": \"bin/sh\","
                               " \"argv\": [\"sh\"],"
                               " \"environ\": [{\"key\": \"A=B\", \"value\": \"c\"}]}");
  KJ_EXPECT_THROW_MESSAGE("environment variable", registry.load("badenv"));

  writeManifest(dir, "badpayload", "{\"language\": \"badpayload\", \"entryPoint\": \"bin/sh\","
                                   " \"argv\": [\"sh\"], \"payloadFile\": \"../escape.py\"}");
  KJ_EXPECT_THROW_MESSAGE("payload file", registry.load("badpayload"));

  // Host executables are never reachable from the guest.
  writeManifest(dir, "hostbin", "{\"language\": \"hostbin\", \"entryPoint\": \"/bin/sh\","
                                " \"argv\": [\"sh\"]}");
  KJ_EXPECT_THROW_MESSAGE("inside the image directory", registry.load("hostbin"));

  writeManifest(dir, "climb", "{\"language\": \"climb\", \"entryPoint\": \"../climb/bin/sh\","
                              " \"argv\": [\"sh\"]}");
  KJ_EXPECT_THROW_MESSAGE("normalized relative path", registry.load("climb"));

  writeManifest(dir, "missing", "{\"language\": \"missing\", \"entryPoint\": \"bin/python3\","
                                " \"argv\": [\"python3\"]}");
  KJ_EXPECT_THROW_MESSAGE("not executable", registry.load("missing"));

  writeManifest(dir, "noexec", "{\"language\": \"noexec\", \"entryPoint\": \"runtime.json\","
                               " \"argv\": [\"x\"]}");
  KJ_EXPECT_THROW_MESSAGE("not executable", registry.load("noexec"));

  KJ_EXPECT(registry.list().size() == 0);
}

}  // namespace
}  // namespace guestbox
