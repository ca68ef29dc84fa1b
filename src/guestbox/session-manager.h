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


#ifndef GUESTBOX_SESSION_MANAGER_H_
#define GUESTBOX_SESSION_MANAGER_H_

#include <kj/async.h>
#include <kj/timer.h>
#include <map>
#include "result.h"
#include "config.h"
#include "session-store.h"
#include "pipeline.h"

namespace guestbox {

struct SessionInfo {
  kj::String sessionId;
  kj::String language;
  int64_t createdAt;
  int64_t lastActiveAt;
  int64_t expiresAt;
  uint64_t executionCount;
  ExecutionLimits limits;
  bool autoPersist;
  bool active;
  // True while an execution is running.
};

class SessionManager: private kj::TaskSet::ErrorHandler {
  // Owns the lifecycle of every session: creation on first use, one execution at a time,
  // eviction after inactivity, destruction on request or when the owning client goes away.
  //
  // All methods run on the event loop thread. A session is "busy" from the moment an execution
  // is accepted until its result is delivered; a second execution meanwhile fails with
  // SessionBusy rather than waiting.

public:
  SessionManager(const EngineConfig& config, SessionStore& store, Executor& executor,
                 kj::Timer& timer, kj::StringPtr bootId);
  KJ_DISALLOW_COPY(SessionManager);
  ~SessionManager() noexcept(false);

  void recover();
  // Adopt the records left by a previous process. Sessions that belonged to another process's
  // single-stream binding can never be reached again and are destroyed.

  void startCleanupLoop();
  // Evict idle sessions every `cleanupIntervalMs`.

  size_t evictIdle(int64_t nowMs);
  // Evict every session that is not running and has been idle for longer than its timeout.
  // Returns the number evicted.

  class Binding {
    // One client's view of the engine. Sessions it creates are owned by its key and only
    // visible through bindings with the same key. When the last binding for a key is destroyed,
    // the key's sessions are destroyed with it.

  public:
    ~Binding() noexcept(false);
    KJ_DISALLOW_COPY(Binding);

    kj::StringPtr getOwnerKey() const;

    kj::Promise<ExecutionResult> execute(ExecutionRequest request);
    // Run code in the requested session, or in this binding's default session if none is
    // named. A session that doesn't exist yet is created.

    SessionInfo createSession(kj::StringPtr language, const LimitOverrides& limits,
                              kj::Maybe<bool> autoPersist);

    void destroySession(kj::StringPtr id);
    // If the session is running, it is removed at once and its working directory is deleted
    // when the execution finishes.

    SessionInfo getSessionInfo(kj::StringPtr id);

    void resetSession(kj::StringPtr id);
    // Empty the working directory and zero the execution count.

    kj::Array<FileEntry> listFiles(kj::StringPtr id);
    kj::Array<byte> readFile(kj::StringPtr id, kj::StringPtr path);
    void writeFile(kj::StringPtr id, kj::StringPtr path, kj::ArrayPtr<const byte> content);
    void deletePath(kj::StringPtr id, kj::StringPtr path);

    struct Owner;
    Binding(SessionManager& manager, Owner& owner);
    // Use SessionManager::bind().

  private:
    SessionManager& manager;
    Owner& owner;

    friend class SessionManager;
  };

  kj::Own<Binding> bind(kj::StringPtr token);
  // With the single-stream strategy, `token` is ignored and every binding shares one owner.

  bool isRunning(kj::StringPtr id) const;

private:
  class RunScope;

  const EngineConfig& config;
  SessionStore& store;
  Executor& executor;
  kj::Timer& timer;
  kj::String processKey;

  std::map<kj::StringPtr, kj::Own<Binding::Owner>> owners;
  std::map<kj::StringPtr, RunScope*> running;
  kj::TaskSet tasks;

  kj::Promise<void> cleanupLoop();
  void taskFailed(kj::Exception&& exception) override;

  SessionRecord::Builder getOwned(Binding::Owner& owner, kj::StringPtr id);
  SessionRecord::Builder create(Binding::Owner& owner, kj::StringPtr id,
                                kj::StringPtr language, const LimitOverrides& limits,
                                bool autoPersist);
  void destroy(kj::StringPtr id, kj::StringPtr why);
  void requireIdle(kj::StringPtr id);
  size_t countOwned(kj::StringPtr ownerKey);
  SessionInfo makeInfo(SessionRecord::Reader record);
  void release(Binding::Owner& owner);
};

}  // namespace guestbox

#endif // GUESTBOX_SESSION_MANAGER_H_
