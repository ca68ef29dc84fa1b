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

#include "session-manager.h"
#include "session-store.h"
#include "test-util.h"
#include <kj/test.h>
#include <kj/async.h>
#include <kj/timer.h>

namespace guestbox {
namespace {

class FakeExecutor final: public Executor {
  // Records jobs instead of running them. While `hold` is set, executions stay pending until
  // the test completes them.

public:
  bool hold = false;
  kj::Vector<ExecutionJob> jobs;
  kj::Vector<kj::Own<kj::PromiseFulfiller<ExecutionResult>>> pending;

  kj::Promise<ExecutionResult> execute(ExecutionJob job) override {
    jobs.add(kj::mv(job));
    if (hold) {
      auto paf = kj::newPromiseAndFulfiller<ExecutionResult>();
      pending.add(kj::mv(paf.fulfiller));
      return kj::mv(paf.promise);
    }
    return resultFor(jobs.back());
  }

  void requireRuntime(kj::StringPtr language) override {
    if (language != "python") {
      throwEngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
                       kj::str("no runtime for '", language, "'"));
    }
  }

  void complete(size_t i) {
    pending[i]->fulfill(resultFor(jobs[i]));
  }

  static ExecutionResult resultFor(const ExecutionJob& job) {
    ExecutionResult result;
    result.success = true;
    result.stdoutText = kj::str("ran ", job.code, '\n');
    result.sessionId = kj::heapString(job.sessionId);
    result.language = kj::heapString(job.language);
    return result;
  }
};

EngineConfig testConfig() {
  EngineConfig config;
  config.maxSessionsPerClient = 3;
  config.sessionTimeoutMs = 60000;
  config.defaultLimits = { 1000, 2000, 3000 };
  return config;
}

struct Fixture {
  TempDir dir;
  EngineConfig config;
  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  SessionStore store;
  FakeExecutor executor;
  SessionManager manager;

  explicit Fixture(EngineConfig configParam = testConfig())
      : config(kj::mv(configParam)),
        waitScope(loop),
        timer(kj::origin<kj::TimePoint>()),
        store(dir.get()),
        manager(config, store, executor, timer, "testboot") {}
};

ExecutionRequest makeRequest(kj::StringPtr code, kj::StringPtr sessionId = nullptr,
                             kj::StringPtr language = "python") {
  ExecutionRequest request;
  request.language = kj::heapString(language);
  request.code = kj::heapString(code);
  if (sessionId.size() > 0) {
    request.sessionId = kj::heapString(sessionId);
  }
  return request;
}

KJ_TEST("SessionManager: execute creates the default session on first use") {
  Fixture f;
  auto binding = f.manager.bind("client1");
  KJ_EXPECT(binding->getOwnerKey() == "token:client1");

  auto result = binding->execute(makeRequest("x = 1")).wait(f.waitScope);
  KJ_EXPECT(result.success);
  KJ_EXPECT(result.stdoutText == "ran x = 1\n");

  KJ_ASSERT(f.executor.jobs.size() == 1);
  auto& job = f.executor.jobs[0];
  KJ_EXPECT(job.language == "python");
  KJ_EXPECT(job.limits.fuel == 1000);
  KJ_EXPECT(job.limits.memoryBytes == 2000);
  KJ_EXPECT(job.limits.timeoutMs == 3000);
  KJ_EXPECT(job.autoPersist);
  KJ_EXPECT(job.workdir == f.dir / kj::str("workspaces/", job.sessionId));

  auto info = binding->getSessionInfo(job.sessionId);
  KJ_EXPECT(info.executionCount == 1);
  KJ_EXPECT(info.language == "python");
  KJ_EXPECT(!info.active);
  KJ_EXPECT(info.expiresAt == info.lastActiveAt + 60000);

  // The same session is used again.
  binding->execute(makeRequest("print(x)")).wait(f.waitScope);
  KJ_ASSERT(f.executor.jobs.size() == 2);
  KJ_EXPECT(f.executor.jobs[1].sessionId == job.sessionId);
  KJ_EXPECT(binding->getSessionInfo(job.sessionId).executionCount == 2);
}

KJ_TEST("SessionManager: named sessions and limit overrides") {
  Fixture f;
  auto binding = f.manager.bind("client1");

  auto info = binding->createSession("python", LimitOverrides { uint64_t(5000), nullptr, nullptr },
                                     false);
  KJ_EXPECT(info.limits.fuel == 5000);
  KJ_EXPECT(info.limits.memoryBytes == 2000);
  KJ_EXPECT(!info.autoPersist);
  KJ_EXPECT(info.executionCount == 0);

  auto request = makeRequest("work()", info.sessionId);
  request.limits.memoryBytes = uint64_t(9000);
  request.limits.timeoutMs = uint64_t(10);
  request.timeoutMs = uint64_t(20);
  binding->execute(kj::mv(request)).wait(f.waitScope);

  auto& job = f.executor.jobs[0];
  KJ_EXPECT(job.sessionId == info.sessionId);
  KJ_EXPECT(job.limits.fuel == 5000);
  KJ_EXPECT(job.limits.memoryBytes == 9000);
  KJ_EXPECT(job.limits.timeoutMs == 20);
  KJ_EXPECT(!job.autoPersist);

  // Overrides apply to one execution only.
  KJ_EXPECT(binding->getSessionInfo(info.sessionId).limits.memoryBytes == 2000);

  // A caller-chosen id is created on first use.
  binding->execute(makeRequest("1", "my-session")).wait(f.waitScope);
  KJ_EXPECT(binding->getSessionInfo("my-session").executionCount == 1);

  auto zero = makeRequest("1", "my-session");
  zero.limits.fuel = uint64_t(0);
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { binding->execute(kj::mv(zero)); });
}

KJ_TEST("SessionManager: invalid requests") {
  Fixture f;
  auto binding = f.manager.bind("client1");

  expectEngineError(ErrorKind::INVALID_REQUEST,
      [&]() { binding->execute(makeRequest("1", "../../etc")); });
  expectEngineError(ErrorKind::INVALID_REQUEST,
      [&]() { binding->getSessionInfo("has space"); });
  expectEngineError(ErrorKind::INVALID_REQUEST, [&]() { f.manager.bind("bad/token"); });
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
      [&]() { binding->execute(makeRequest("1", nullptr, "cobol")); });
  expectEngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
      [&]() { binding->createSession("cobol", LimitOverrides(), nullptr); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { binding->destroySession("nope"); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { binding->resetSession("nope"); });

  // Nothing was created along the way.
  KJ_EXPECT(f.store.ids().size() == 0);
  KJ_EXPECT(f.executor.jobs.size() == 0);
}

KJ_TEST("SessionManager: one execution per session at a time") {
  Fixture f;
  f.executor.hold = true;
  auto binding = f.manager.bind("client1");
  auto info = binding->createSession("python", LimitOverrides(), nullptr);
  auto id = kj::mv(info.sessionId);

  auto first = binding->execute(makeRequest("slow()", id));
  KJ_EXPECT(f.manager.isRunning(id));
  KJ_EXPECT(binding->getSessionInfo(id).active);

  expectEngineError(ErrorKind::SESSION_BUSY,
      [&]() { binding->execute(makeRequest("again()", id)); });
  expectEngineError(ErrorKind::SESSION_BUSY, [&]() { binding->resetSession(id); });
  expectEngineError(ErrorKind::SESSION_BUSY,
      [&]() { binding->writeFile(id, "f.txt", kj::StringPtr("x").asBytes()); });
  expectEngineError(ErrorKind::SESSION_BUSY, [&]() { binding->deletePath(id, "f.txt"); });

  // Reading is fine.
  KJ_EXPECT(binding->listFiles(id).size() == 0);

  // Other sessions are unaffected.
  auto other = binding->createSession("python", LimitOverrides(), nullptr);
  auto second = binding->execute(makeRequest("fast()", other.sessionId));

  KJ_ASSERT(f.executor.jobs.size() == 2);
  f.executor.complete(0);
  auto result = first.wait(f.waitScope);
  KJ_EXPECT(result.stdoutText == "ran slow()\n");
  KJ_EXPECT(!f.manager.isRunning(id));
  KJ_EXPECT(binding->getSessionInfo(id).executionCount == 1);

  f.executor.complete(1);
  second.wait(f.waitScope);

  // Idle again.
  binding->writeFile(id, "f.txt", kj::StringPtr("x").asBytes());
  KJ_EXPECT(bytesToString(binding->readFile(id, "f.txt")) == "x");
}

KJ_TEST("SessionManager: destroying a running session") {
  Fixture f;
  f.executor.hold = true;
  auto binding = f.manager.bind("client1");

  auto promise = binding->execute(makeRequest("slow()", "busy"));
  auto oldWorkdir = kj::heapString(f.executor.jobs[0].workdir);
  binding->destroySession("busy");
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { binding->getSessionInfo("busy"); });

  // The id is free again at once.
  auto second = binding->execute(makeRequest("fresh()", "busy"));
  KJ_EXPECT(binding->getSessionInfo("busy").executionCount == 0);

  f.executor.complete(0);
  KJ_EXPECT(promise.wait(f.waitScope).success);

  // The finished execution doesn't touch the new session.
  KJ_EXPECT(binding->getSessionInfo("busy").executionCount == 0);
  KJ_EXPECT(f.manager.isRunning("busy"));
  KJ_EXPECT(isDirectory(oldWorkdir));

  f.executor.complete(1);
  second.wait(f.waitScope);
  KJ_EXPECT(binding->getSessionInfo("busy").executionCount == 1);

  // Only one trash entry was ever made, and it's gone.
  KJ_EXPECT(listDirectory(f.dir / "trash").size() == 0);
}

KJ_TEST("SessionManager: session ceiling") {
  Fixture f;
  auto binding = f.manager.bind("client1");

  binding->createSession("python", LimitOverrides(), nullptr);
  binding->createSession("python", LimitOverrides(), nullptr);
  binding->execute(makeRequest("1", "third")).wait(f.waitScope);

  expectEngineError(ErrorKind::SESSION_LIMIT_EXCEEDED,
      [&]() { binding->createSession("python", LimitOverrides(), nullptr); });
  expectEngineError(ErrorKind::SESSION_LIMIT_EXCEEDED,
      [&]() { binding->execute(makeRequest("1", "fourth")); });

  // Existing sessions still work.
  binding->execute(makeRequest("2", "third")).wait(f.waitScope);

  // Other clients have their own allowance.
  auto other = f.manager.bind("client2");
  other->createSession("python", LimitOverrides(), nullptr);

  binding->destroySession("third");
  binding->createSession("python", LimitOverrides(), nullptr);
}

KJ_TEST("SessionManager: sessions are private to their owner") {
  Fixture f;
  auto alice = f.manager.bind("alice");
  auto bob = f.manager.bind("bob");

  auto info = alice->createSession("python", LimitOverrides(), nullptr);
  alice->writeFile(info.sessionId, "secret.txt", kj::StringPtr("s3cret").asBytes());

  auto id = kj::StringPtr(info.sessionId);
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { bob->getSessionInfo(id); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { bob->readFile(id, "secret.txt"); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { bob->listFiles(id); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { bob->destroySession(id); });
  expectEngineError(ErrorKind::SESSION_NOT_FOUND, [&]() { bob->execute(makeRequest("1", id)); });
  KJ_EXPECT(f.executor.jobs.size() == 0);

  // A second connection with the same token is the same owner.
  auto alice2 = f.manager.bind("alice");
  KJ_EXPECT(alice2->getSessionInfo(id).sessionId == id);
}

KJ_TEST("SessionManager: sessions end with their owner's last binding") {
  Fixture f;
  auto first = f.manager.bind("client1");
  auto second = f.manager.bind("client1");

  auto info = first->createSession("python", LimitOverrides(), nullptr);
  first->execute(makeRequest("1")).wait(f.waitScope);
  KJ_EXPECT(f.store.ids().size() == 2);

  first = nullptr;
  KJ_EXPECT(f.store.ids().size() == 2);
  second->getSessionInfo(info.sessionId);

  second = nullptr;
  KJ_EXPECT(f.store.ids().size() == 0);
  KJ_EXPECT(listDirectory(f.dir / "workspaces").size() == 0);

  // Reconnecting starts from nothing.
  auto third = f.manager.bind("client1");
  expectEngineError(ErrorKind::SESSION_NOT_FOUND,
      [&]() { third->getSessionInfo(info.sessionId); });
}

KJ_TEST("SessionManager: single-stream binding") {
  auto config = testConfig();
  config.binding = BindingStrategy::SINGLE_STREAM;
  Fixture f(kj::mv(config));

  auto a = f.manager.bind("ignored");
  auto b = f.manager.bind("also-ignored");
  KJ_EXPECT(a->getOwnerKey() == "process:testboot");
  KJ_EXPECT(b->getOwnerKey() == "process:testboot");

  auto info = a->createSession("python", LimitOverrides(), nullptr);
  KJ_EXPECT(b->getSessionInfo(info.sessionId).sessionId == info.sessionId);
}

KJ_TEST("SessionManager: idle sessions are evicted") {
  Fixture f;
  f.executor.hold = true;
  auto binding = f.manager.bind("client1");

  auto idle = binding->createSession("python", LimitOverrides(), nullptr);
  auto running = binding->createSession("python", LimitOverrides(), nullptr);
  auto promise = binding->execute(makeRequest("slow()", running.sessionId));

  KJ_EXPECT(f.manager.evictIdle(idle.lastActiveAt + 60000) == 0);
  KJ_EXPECT(f.manager.evictIdle(idle.lastActiveAt + 60001 + 1000) == 1);
  expectEngineError(ErrorKind::SESSION_NOT_FOUND,
      [&]() { binding->getSessionInfo(idle.sessionId); });

  // Running sessions are never evicted, however old.
  KJ_EXPECT(binding->getSessionInfo(running.sessionId).active);

  f.executor.complete(0);
  promise.wait(f.waitScope);
  KJ_EXPECT(binding->getSessionInfo(running.sessionId).executionCount == 1);
}

KJ_TEST("SessionManager: eviction runs on a timer") {
  auto config = testConfig();
  config.cleanupIntervalMs = 1000;
  config.sessionTimeoutMs = 1;
  Fixture f(kj::mv(config));

  auto binding = f.manager.bind("client1");
  auto info = binding->createSession("python", LimitOverrides(), nullptr);
  f.manager.startCleanupLoop();

  // Let the session age past its timeout in real time, then fire the cleanup timer.
  usleep(5000);
  f.timer.advanceTo(f.timer.now() + 1 * kj::SECONDS);
  f.waitScope.poll();

  expectEngineError(ErrorKind::SESSION_NOT_FOUND,
      [&]() { binding->getSessionInfo(info.sessionId); });
}

KJ_TEST("SessionManager: reset") {
  Fixture f;
  auto binding = f.manager.bind("client1");
  binding->execute(makeRequest("1", "s")).wait(f.waitScope);
  binding->writeFile("s", "data.csv", kj::StringPtr("a,b\n").asBytes());
  binding->writeFile("s", "sub/more.csv", kj::StringPtr("c,d\n").asBytes());
  KJ_EXPECT(binding->listFiles("s").size() == 2);

  binding->resetSession("s");
  KJ_EXPECT(binding->listFiles("s").size() == 0);
  auto info = binding->getSessionInfo("s");
  KJ_EXPECT(info.executionCount == 0);
  KJ_EXPECT(info.limits.fuel == 1000);
}

KJ_TEST("SessionManager: recovery after restart") {
  TempDir dir;
  auto config = testConfig();
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  FakeExecutor executor;

  {
    SessionStore store(dir.get());
    SessionManager manager(config, store, executor, timer, "oldboot");

    auto mine = manager.bind("client1");
    mine->execute(makeRequest("1", "tokened")).wait(waitScope);

    // Simulate the previous process dying with a single-stream session still open.
    auto record = store.create("orphan");
    record.setOwnerKey("process:oldboot");
    record.setLanguage("python");
    record.setIdleTimeoutMs(60000);
    store.commit("orphan");

    // Simulate a crash: the records stay on disk even though the bindings are going away.
    auto copy = readAllBytes(raiiOpen(dir / "records/tokened", O_RDONLY | O_CLOEXEC));
    mine = nullptr;
    replaceFile(dir / "records/tokened", copy);
    KJ_SYSCALL(mkdir((dir / "workspaces/tokened").cStr(), 0700));
  }

  SessionStore store(dir.get());
  SessionManager manager(config, store, executor, timer, "newboot");
  manager.recover();

  KJ_EXPECT(store.find("orphan") == nullptr);
  KJ_EXPECT(store.find("tokened") != nullptr);

  auto binding = manager.bind("client1");
  KJ_EXPECT(binding->getSessionInfo("tokened").executionCount == 1);
}

}  // namespace
}  // namespace guestbox
