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

#include "engine.h"
#include "session-id.h"
#include "test-util.h"
#include <kj/debug.h>
#include <capnp/message.h>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace guestbox {
namespace {

void writeManifest(const TempDir& dir, kj::StringPtr language, kj::StringPtr json) {
  // The image gets the manifest and a stub bin/sh; enough to load, not to run.
  auto image = kj::str(dir / "runtimes", '/', language);
  ensureDirectory(dir / "runtimes");
  ensureDirectory(image);
  ensureDirectory(kj::str(image, "/bin"));
  replaceFile(kj::str(image, "/runtime.json"), json.asBytes());
  auto interp = kj::str(image, "/bin/sh");
  replaceFile(interp, kj::StringPtr("#!/bin/sh\n").asBytes());
  KJ_SYSCALL(chmod(interp.cStr(), 0755));
}

EngineConfig testConfig(const TempDir& dir) {
  EngineConfig config;
  config.storageDir = dir / "storage";
  config.runtimeDir = dir / "runtimes";
  config.fuelMeter = FuelMeterKind::CPU_TIME;
  config.defaultLimits = { 20000000000ull, 512000000ull, 10000 };
  config.sessionTimeoutMs = 3600 * 1000;
  return config;
}

bool skipOrFail(kj::StringPtr reason) {
  // Sandboxed tests need namespaces and host interpreters to build images from. Where those
  // are missing the tests are skipped, loudly, unless GUESTBOX_REQUIRE_SANDBOX is set, in
  // which case they fail.
  if (getenv("GUESTBOX_REQUIRE_SANDBOX") != nullptr) {
    KJ_FAIL_EXPECT("sandboxed execution unavailable", reason);
  } else {
    KJ_LOG(WARNING, "SKIPPED: sandboxed execution unavailable", reason);
  }
  return false;
}

bool buildImage(kj::StringPtr language, kj::StringPtr dest) {
  auto script = kj::str(GUESTBOX_SOURCE_DIR, "/runtimes/build-image.sh");
  Subprocess child([&]() -> int {
    int devNull;
    KJ_SYSCALL(devNull = open("/dev/null", O_WRONLY | O_CLOEXEC));
    KJ_SYSCALL(dup2(devNull, STDOUT_FILENO));
    execl("/bin/sh", "sh", script.cStr(), language.cStr(), dest.cStr(), (char*)nullptr);
    return 127;
  }, "build-image.sh");
  return child.waitForExit() == 0;
}

struct SharedRuntimes {
  // Runtime images built from the host's interpreters, once per test run.

  TempDir dir;
  bool python = false;
  bool javascript = false;

  SharedRuntimes() {
    python = access("/usr/bin/python3", X_OK) == 0 && buildImage("python", dir / "python");
    javascript = (access("/usr/bin/qjs", X_OK) == 0 ||
                  access("/usr/local/bin/qjs", X_OK) == 0) &&
                 buildImage("javascript", dir / "javascript");
  }
};

SharedRuntimes& sharedRuntimes() {
  static SharedRuntimes runtimes;
  return runtimes;
}

bool namespacesAvailable() {
  // Try what every guest needs: fresh namespaces and a tmpfs mounted inside them.
  pid_t pid;
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWPID |
                CLONE_NEWNET) < 0 ||
        mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0 ||
        mount("tmpfs", "/tmp", "tmpfs", 0, "size=1m") < 0) {
      _exit(1);
    }
    _exit(0);
  }

  int status;
  KJ_SYSCALL(waitpid(pid, &status, 0));
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool sandboxAvailable(kj::StringPtr language = "python") {
  if (!namespacesAvailable()) {
    return skipOrFail("can't create user namespaces here");
  }
  auto& runtimes = sharedRuntimes();
  if (language == "python" && !runtimes.python) {
    return skipOrFail("couldn't build a python image (is python3 installed?)");
  }
  if (language == "javascript" && !runtimes.javascript) {
    return skipOrFail("couldn't build a javascript image (is qjs installed?)");
  }
  return true;
}

ExecutionRequest pythonRequest(kj::StringPtr code, kj::StringPtr sessionId = nullptr) {
  ExecutionRequest request;
  request.language = kj::str("python");
  request.code = kj::str(code);
  if (sessionId != nullptr) {
    request.sessionId = kj::str(sessionId);
  }
  return request;
}

struct EngineFixture {
  TempDir dir;
  kj::AsyncIoContext io = kj::setupAsyncIo();
  kj::Own<ExecutionEngine> engine;
  kj::Own<SessionManager::Binding> binding;

  explicit EngineFixture(kj::Maybe<kj::StringPtr> helperDir = nullptr) {
    auto config = testConfig(dir);
    config.runtimeDir = kj::heapString(sharedRuntimes().dir.get());
    KJ_IF_MAYBE(helpers, helperDir) {
      config.helperDir = kj::heapString(*helpers);
    }
    engine = kj::heap<ExecutionEngine>(kj::mv(config), io);
    binding = engine->bind("client");
  }

  ExecutionResult run(kj::StringPtr code, kj::StringPtr sessionId = "s1") {
    return binding->execute(pythonRequest(code, sessionId)).wait(io.waitScope);
  }

  ErrorKind guidanceKind(const ExecutionResult& result) {
    KJ_IF_MAYBE(report, result.errorGuidance) {
      return report->kind;
    } else {
      KJ_FAIL_ASSERT("result has no error guidance", result.stderrText);
    }
  }
};

// =======================================================================================
// Tests that don't launch guests.

KJ_TEST("ExecutionEngine serves runtimes and rejects unknown languages over RPC") {
  TempDir dir;
  writeManifest(dir, "shell", "{\"language\": \"shell\", \"version\": \"5.2\","
                              " \"capabilities\": [\"posix\"], \"entryPoint\": \"bin/sh\","
                              " \"argv\": [\"sh\", \"{payload}\"]}");
  auto io = kj::setupAsyncIo();
  ExecutionEngine engine(testConfig(dir), io);

  rpc::Engine::Client client = engine.getBootstrap();
  {
    auto response = client.listRuntimesRequest().send().wait(io.waitScope);
    auto runtimes = response.getRuntimes();
    KJ_ASSERT(runtimes.size() == 1);
    KJ_EXPECT(runtimes[0].getLanguage() == "shell");
    KJ_EXPECT(runtimes[0].getVersion() == "5.2");
    KJ_ASSERT(runtimes[0].getCapabilities().size() == 1);
    KJ_EXPECT(runtimes[0].getCapabilities()[0] == "posix");
  }

  auto bindRequest = client.bindRequest();
  bindRequest.setToken("alice");
  auto transport = bindRequest.send().getTransport();

  {
    auto request = transport.executeRequest();
    request.getRequest().setLanguage("cobol");
    request.getRequest().setCode("DISPLAY 'HI'.");
    expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE, [&]() {
      request.send().wait(io.waitScope);
    });
  }

  {
    auto request = transport.createSessionRequest();
    request.setLanguage("shell");
    request.getLimits().setTimeoutMs(1234);
    auto response = request.send().wait(io.waitScope);
    kj::StringPtr id = response.getSessionId();
    KJ_EXPECT(isValidSessionId(id), id);
    KJ_EXPECT(response.getExpiresAt() > response.getCreatedAt());

    auto infoRequest = transport.getSessionInfoRequest();
    infoRequest.setSessionId(id);
    auto info = infoRequest.send().wait(io.waitScope).getInfo();
    KJ_EXPECT(info.getLanguage() == "shell");
    KJ_EXPECT(info.getState() == "idle");
    KJ_EXPECT(info.getExecutionCount() == 0);
    KJ_EXPECT(info.getLimits().getTimeoutMs() == 1234);
    KJ_EXPECT(info.getLimits().getFuel() == 20000000000ull);
    KJ_EXPECT(info.getAutoPersist());

    auto writeRequest = transport.writeFileRequest();
    writeRequest.setSessionId(id);
    writeRequest.setPath("data/input.csv");
    writeRequest.setContent(kj::StringPtr("a,b\n1,2\n").asBytes());
    writeRequest.send().wait(io.waitScope);

    auto listRequest = transport.listFilesRequest();
    listRequest.setSessionId(id);
    auto files = listRequest.send().wait(io.waitScope);
    KJ_ASSERT(files.getFiles().size() == 1);
    KJ_EXPECT(files.getFiles()[0].getPath() == "data/input.csv");
    KJ_EXPECT(files.getFiles()[0].getSize() == 8);

    auto readRequest = transport.readFileRequest();
    readRequest.setSessionId(id);
    readRequest.setPath("data/input.csv");
    auto content = readRequest.send().wait(io.waitScope);
    KJ_EXPECT(bytesToString(content.getContent()) == "a,b\n1,2\n");

    auto destroyRequest = transport.destroySessionRequest();
    destroyRequest.setSessionId(id);
    KJ_EXPECT(destroyRequest.send().wait(io.waitScope).getDestroyed());

    auto infoAgain = transport.getSessionInfoRequest();
    infoAgain.setSessionId(id);
    expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() {
      infoAgain.send().wait(io.waitScope);
    });
  }
}

KJ_TEST("ExecutionEngine applies the configured persistence default over RPC") {
  TempDir dir;
  writeManifest(dir, "shell", "{\"language\": \"shell\", \"entryPoint\": \"bin/sh\","
                              " \"argv\": [\"sh\", \"{payload}\"]}");
  auto io = kj::setupAsyncIo();
  auto config = testConfig(dir);
  config.autoPersistDefault = false;
  ExecutionEngine engine(kj::mv(config), io);

  rpc::Engine::Client client = engine.getBootstrap();
  auto bindRequest = client.bindRequest();
  bindRequest.setToken("client");
  auto transport = bindRequest.send().getTransport();

  auto create = [&](rpc::AutoPersist autoPersist) {
    auto request = transport.createSessionRequest();
    request.setLanguage("shell");
    request.setAutoPersist(autoPersist);
    auto id = kj::heapString(request.send().wait(io.waitScope).getSessionId());
    auto infoRequest = transport.getSessionInfoRequest();
    infoRequest.setSessionId(id);
    return infoRequest.send().wait(io.waitScope).getInfo().getAutoPersist();
  };

  KJ_EXPECT(!create(rpc::AutoPersist::USE_DEFAULT));
  KJ_EXPECT(create(rpc::AutoPersist::ENABLED));
  KJ_EXPECT(!create(rpc::AutoPersist::DISABLED));
}

KJ_TEST("ExecutionEngine starts without any runtime images") {
  TempDir dir;
  ensureDirectory(dir / "runtimes");
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(WARNING, "no runtime images found");
  ExecutionEngine engine(testConfig(dir), io);
  KJ_EXPECT(engine.listRuntimes().size() == 0);

  auto binding = engine.bind("client");
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE, [&]() {
    binding->execute(pythonRequest("print(1)")).wait(io.waitScope);
  });
}

KJ_TEST("wire conversions") {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<rpc::ExecutionRequest>();
  request.setLanguage("python");
  request.setCode("print(1)");
  request.getLimits().setFuel(5);

  auto converted = fromRpc(request.asReader());
  KJ_EXPECT(converted.language == "python");
  KJ_EXPECT(converted.code == "print(1)");
  KJ_EXPECT(converted.sessionId == nullptr);
  KJ_EXPECT(converted.timeoutMs == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(converted.limits.fuel) == 5);
  KJ_EXPECT(converted.limits.memoryBytes == nullptr);
  KJ_EXPECT(converted.limits.timeoutMs == nullptr);

  request.setSessionId("abc");
  request.setTimeoutMs(750);
  auto converted2 = fromRpc(request.asReader());
  KJ_EXPECT(KJ_ASSERT_NONNULL(converted2.sessionId) == "abc");
  KJ_EXPECT(KJ_ASSERT_NONNULL(converted2.timeoutMs) == 750);

  ExecutionResult result;
  result.success = false;
  result.stdoutText = kj::str("partial\n");
  result.stderrText = kj::str("Traceback\n");
  result.exitCode = 1;
  result.trap = TrapKind::TIMEOUT;
  result.trapReason = kj::str("wall-clock limit of 500 ms exceeded");
  result.sessionId = kj::str("abc");
  result.language = kj::str("python");
  result.errorGuidance = ErrorReport {
    ErrorKind::TIMEOUT, kj::str("Execution timed out"),
    kj::arr(kj::str("Reduce the work")), nullptr, nullptr
  };

  auto json = resultToJson(result);
  // Spacing depends on the codec's pretty-printer, so look for the pieces.
  KJ_EXPECT(contains(json, "\"partial\\n\""), json);
  KJ_EXPECT(contains(json, "\"timeout\""), json);
  KJ_EXPECT(contains(json, "\"Timeout\""), json);
  KJ_EXPECT(contains(json, "\"Reduce the work\""), json);
  KJ_EXPECT(contains(json, "\"none\""), json);
}

// =======================================================================================
// Tests that launch guests.

KJ_TEST("state persists within a session and sessions are isolated") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto first = fixture.run("x = 42\nnames = ['a']");
  KJ_EXPECT(first.success, first.stderrText);
  KJ_EXPECT(first.sessionId == "s1");
  KJ_EXPECT(first.language == "python");
  KJ_EXPECT(first.trap == TrapKind::NONE);
  KJ_EXPECT(first.errorGuidance == nullptr);
  KJ_EXPECT(first.fuelMetered);

  auto second = fixture.run("names.append('b')\nprint(x + 1, names)");
  KJ_EXPECT(second.success, second.stderrText);
  KJ_EXPECT(second.stdoutText == "43 ['a', 'b']\n", second.stdoutText);

  auto other = fixture.run("print(x)", "s2");
  KJ_EXPECT(!other.success);
  KJ_EXPECT(other.exitCode != 0);
  KJ_EXPECT(contains(other.stderrText, "NameError"), other.stderrText);
  KJ_EXPECT(fixture.guidanceKind(other) == ErrorKind::GUEST_RUNTIME_ERROR);

  auto info = fixture.binding->getSessionInfo("s1");
  KJ_EXPECT(info.executionCount == 2);
  KJ_EXPECT(!info.active);

  // Destroying and recreating a session starts from nothing.
  fixture.binding->destroySession("s1");
  auto fresh = fixture.run("print('x' in globals())");
  KJ_EXPECT(fresh.success, fresh.stderrText);
  KJ_EXPECT(fresh.stdoutText == "False\n", fresh.stdoutText);
}

KJ_TEST("a persisted counter advances once per execution") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  for (int i = 0; i < 5; i++) {
    auto result = fixture.run("counter = globals().get('counter', 0) + 1", "counting");
    KJ_EXPECT(result.success, result.stderrText);
    auto unrelated = fixture.run("counter = 100", "noise");
    KJ_EXPECT(unrelated.success, unrelated.stderrText);
  }

  auto last = fixture.run("print(counter)", "counting");
  KJ_EXPECT(last.stdoutText == "5\n", last.stdoutText, last.stderrText);
}

KJ_TEST("a corrupt state file restarts the session with empty state") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto first = fixture.run("x = 1", "fragile");
  KJ_EXPECT(first.success, first.stderrText);

  replaceFile(kj::str(fixture.dir / "storage/workspaces/fragile/", CodeWrapper::STATE_FILE),
              kj::StringPtr("{not json").asBytes());

  auto second = fixture.run("print('x' in globals())\ny = 2", "fragile");
  KJ_EXPECT(second.success, second.stderrText);
  KJ_EXPECT(second.stdoutText == "False\n", second.stdoutText);
  KJ_EXPECT(contains(second.stderrText, "StatePersistenceCorrupt"), second.stderrText);
  KJ_EXPECT(second.errorGuidance == nullptr);

  auto third = fixture.run("print(y)", "fragile");
  KJ_EXPECT(third.stdoutText == "2\n", third.stdoutText, third.stderrText);
}

KJ_TEST("guests see their working directory and nothing else of the host") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto created = fixture.run("open('report.txt', 'w').write('hello')");
  KJ_EXPECT(created.success, created.stderrText);
  KJ_ASSERT(created.filesCreated.size() == 1, created.filesCreated.size());
  KJ_EXPECT(created.filesCreated[0] == "report.txt");
  KJ_EXPECT(bytesToString(fixture.binding->readFile("s1", "report.txt")) == "hello");

  fixture.binding->writeFile("s1", "input.txt", kj::StringPtr("from host").asBytes());
  auto read = fixture.run("print(open('input.txt').read())");
  KJ_EXPECT(read.stdoutText == "from host\n", read.stdoutText, read.stderrText);

  auto modified = fixture.run("open('report.txt', 'a').write(' again')");
  KJ_ASSERT(modified.filesModified.size() == 1);
  KJ_EXPECT(modified.filesModified[0] == "report.txt");
  KJ_EXPECT(modified.filesCreated.size() == 0);

  // No host directory is visible, system directories included.
  for (kj::StringPtr path: { "/etc/passwd", "/usr/lib/os-release", "/usr/bin/python3",
                             "/lib/x86_64-linux-gnu/libc.so.6", "/tmp/x", "/proc/self/environ" }) {
    auto escape = fixture.run(kj::str("print(open('", path, "').read())"));
    KJ_EXPECT(!escape.success, path);
    KJ_EXPECT(fixture.guidanceKind(escape) == ErrorKind::PATH_RESTRICTION,
              path, escape.stderrText);
  }
  auto listing = fixture.run("import os\nprint(sorted(os.listdir('/')))");
  KJ_EXPECT(listing.success, listing.stderrText);
  KJ_EXPECT(listing.stdoutText == "['app', 'dev', 'runtime']\n", listing.stdoutText);

  auto network = fixture.run(
      "import socket\n"
      "socket.create_connection(('1.1.1.1', 80), timeout=2)");
  KJ_EXPECT(!network.success);
}

KJ_TEST("runaway guests are stopped by their limits") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  {
    auto request = pythonRequest("while True:\n    pass", "slow");
    request.timeoutMs = 500;
    request.limits.fuel = 100000000000ull;
    auto result = fixture.binding->execute(kj::mv(request)).wait(fixture.io.waitScope);
    KJ_EXPECT(!result.success);
    KJ_EXPECT(result.trap == TrapKind::TIMEOUT);
    KJ_EXPECT(result.durationMs >= 500);
    KJ_EXPECT(fixture.guidanceKind(result) == ErrorKind::TIMEOUT);
  }

  {
    auto request = pythonRequest("while True:\n    pass", "hungry");
    request.limits.fuel = 200000000;
    auto result = fixture.binding->execute(kj::mv(request)).wait(fixture.io.waitScope);
    KJ_EXPECT(!result.success);
    KJ_EXPECT(result.trap == TrapKind::OUT_OF_FUEL);
    KJ_EXPECT(result.fuelConsumed >= 200000000);
    KJ_EXPECT(result.fuelBudget == 200000000);
    KJ_EXPECT(fixture.guidanceKind(result) == ErrorKind::OUT_OF_FUEL);
    auto& analysis = KJ_ASSERT_NONNULL(result.fuelAnalysis);
    KJ_EXPECT(analysis.status == "exhausted", analysis.status);
  }

  {
    auto request = pythonRequest("data = bytearray(1024 * 1024 * 1024)", "greedy");
    request.limits.memoryBytes = 256000000;
    auto result = fixture.binding->execute(kj::mv(request)).wait(fixture.io.waitScope);
    KJ_EXPECT(!result.success);
    KJ_EXPECT(fixture.guidanceKind(result) == ErrorKind::MEMORY_EXHAUSTED, result.stderrText);
  }

  // The sessions are still usable afterwards.
  auto after = fixture.run("print('ok')", "slow");
  KJ_EXPECT(after.success, after.stderrText);
  KJ_EXPECT(after.stdoutText == "ok\n");
}

KJ_TEST("a crashing guest is reported as a fault, not as running out of memory") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto result = fixture.run("import os\nos.abort()");
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.trap == TrapKind::FAULT, result.trapReason);
  KJ_EXPECT(result.exitCode == 128 + SIGABRT, result.exitCode);
  KJ_EXPECT(fixture.guidanceKind(result) == ErrorKind::GUEST_RUNTIME_ERROR, result.stderrText);
}

KJ_TEST("a session runs one execution at a time") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto slow = fixture.binding->execute(pythonRequest("import time\ntime.sleep(0.5)\nprint('done')",
                                                     "busy"));
  expectEngineError(ErrorKind::SESSION_BUSY, [&]() {
    fixture.binding->execute(pythonRequest("print(1)", "busy")).wait(fixture.io.waitScope);
  });
  KJ_EXPECT(fixture.binding->getSessionInfo("busy").active);

  // Other sessions are unaffected.
  auto other = fixture.run("print(2)", "free");
  KJ_EXPECT(other.stdoutText == "2\n");

  auto result = slow.wait(fixture.io.waitScope);
  KJ_EXPECT(result.success, result.stderrText);
  KJ_EXPECT(result.stdoutText == "done\n");

  auto next = fixture.run("print(3)", "busy");
  KJ_EXPECT(next.stdoutText == "3\n");
}

KJ_TEST("javascript guests keep state and load vendored helpers") {
  if (!sandboxAvailable("javascript")) return;

  TempDir helpers;
  ensureDirectory(helpers / "javascript");
  replaceFile(helpers / "javascript/greet.js", kj::StringPtr(
      "module.exports = { hello: function (name) { return 'hello ' + name; } };\n").asBytes());
  EngineFixture fixture(helpers.get());

  auto run = [&](kj::StringPtr code) {
    ExecutionRequest request;
    request.language = kj::str("javascript");
    request.code = kj::str(code);
    request.sessionId = kj::str("js");
    return fixture.binding->execute(kj::mv(request)).wait(fixture.io.waitScope);
  };

  auto first = run("_state.count = 1;");
  KJ_EXPECT(first.success, first.stderrText);
  KJ_EXPECT(first.language == "javascript");

  auto second = run("_state.count += 1;\n"
                    "console.log(_state.count, requireVendor('greet').hello('js'));");
  KJ_EXPECT(second.success, second.stderrText);
  KJ_EXPECT(second.stdoutText == "2 hello js\n", second.stdoutText);

  auto missing = run("requireVendor('lodash');");
  KJ_EXPECT(!missing.success);
  KJ_EXPECT(fixture.guidanceKind(missing) == ErrorKind::MISSING_HELPER_LIBRARY,
            missing.stderrText);

  auto escape = run("std.loadFile('/etc/passwd').length;");
  KJ_EXPECT(!escape.success);
}

KJ_TEST("guest output is capped") {
  if (!sandboxAvailable()) return;
  EngineFixture fixture;

  auto result = fixture.run("import sys\nsys.stdout.write('x' * 5000000)");
  KJ_EXPECT(result.stdoutTruncated);
  KJ_EXPECT(result.stdoutText.size() <= 2000000, result.stdoutText.size());
}

}  // namespace
}  // namespace guestbox
