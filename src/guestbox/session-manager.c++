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
#include "session-id.h"
#include "util.h"
#include <kj/debug.h>

namespace guestbox {

struct SessionManager::Binding::Owner {
  kj::String key;
  uint bindings = 0;

  kj::String defaultSessionId;
  // Chosen when the owner first binds. The session itself is created on first use, and again
  // after each time it is destroyed or evicted.
};

class SessionManager::RunScope {
  // Marks a session busy for as long as it exists.

public:
  RunScope(SessionManager& manager, kj::StringPtr id)
      : manager(manager), id(kj::heapString(id)) {
    KJ_ASSERT(manager.running.insert(std::make_pair(kj::StringPtr(this->id), this)).second);
  }

  ~RunScope() noexcept(false) {
    if (!destroyed) {
      manager.running.erase(id);
    }
    KJ_IF_MAYBE(path, trashPath) {
      manager.store.deleteDetached(*path);
    }
  }

  kj::StringPtr getId() const { return id; }
  bool isDestroyed() const { return destroyed; }

  void markDestroyed(kj::String trashPath) {
    // The session was destroyed while we were running. Its id is free for reuse immediately;
    // the old working directory goes once we're done with it.
    manager.running.erase(id);
    destroyed = true;
    this->trashPath = kj::mv(trashPath);
  }

private:
  SessionManager& manager;
  kj::String id;
  bool destroyed = false;
  kj::Maybe<kj::String> trashPath;
};

// =======================================================================================

SessionManager::SessionManager(const EngineConfig& config, SessionStore& store,
                               Executor& executor, kj::Timer& timer, kj::StringPtr bootId)
    : config(config), store(store), executor(executor), timer(timer),
      processKey(kj::str("process:", bootId)), tasks(*this) {}

SessionManager::~SessionManager() noexcept(false) {}

void SessionManager::recover() {
  for (auto& id: store.loadAll()) {
    auto record = KJ_ASSERT_NONNULL(store.find(id));
    kj::StringPtr ownerKey = record.getOwnerKey();
    if (ownerKey.startsWith("process:") && ownerKey != processKey) {
      KJ_LOG(INFO, "destroying orphaned session", id, ownerKey);
      destroy(id, "orphaned");
    }
  }
}

void SessionManager::startCleanupLoop() {
  tasks.add(cleanupLoop());
}

kj::Promise<void> SessionManager::cleanupLoop() {
  return timer.afterDelay(static_cast<int64_t>(config.cleanupIntervalMs) * kj::MILLISECONDS)
      .then([this]() {
    evictIdle(currentTimeMs());
    return cleanupLoop();
  });
}

void SessionManager::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, exception);
}

size_t SessionManager::evictIdle(int64_t nowMs) {
  kj::Vector<kj::String> expired;
  for (auto id: store.ids()) {
    if (isRunning(id)) continue;

    auto record = KJ_ASSERT_NONNULL(store.find(id));
    if (nowMs - record.getLastActiveAt() > static_cast<int64_t>(record.getIdleTimeoutMs())) {
      expired.add(kj::heapString(id));
    }
  }

  size_t count = 0;
  for (auto& id: expired) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      destroy(id, "evicted after inactivity");
    })) {
      KJ_LOG(ERROR, "couldn't evict session", id, *exception);
    } else {
      ++count;
    }
  }
  return count;
}

bool SessionManager::isRunning(kj::StringPtr id) const {
  return running.find(id) != running.end();
}

kj::Own<SessionManager::Binding> SessionManager::bind(kj::StringPtr token) {
  kj::String key;
  if (config.binding == BindingStrategy::SINGLE_STREAM) {
    key = kj::heapString(processKey);
  } else {
    if (!isValidSessionId(token)) {
      throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("invalid session token '", token, "'"));
    }
    key = kj::str("token:", token);
  }

  auto iter = owners.find(key);
  if (iter == owners.end()) {
    auto owner = kj::heap<Binding::Owner>();
    owner->key = kj::mv(key);
    owner->defaultSessionId = randomSessionId();
    kj::StringPtr keyPtr = owner->key;
    iter = owners.insert(std::make_pair(keyPtr, kj::mv(owner))).first;
  }

  return kj::heap<Binding>(*this, *iter->second);
}

void SessionManager::release(Binding::Owner& owner) {
  KJ_ASSERT(owner.bindings > 0);
  if (--owner.bindings > 0) return;

  // The client is gone, and with it every way of reaching its sessions.
  for (auto& id: KJ_MAP(id, store.ids()) { return kj::heapString(id); }) {
    auto record = KJ_ASSERT_NONNULL(store.find(id));
    if (record.getOwnerKey() == owner.key) {
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        destroy(id, "owner disconnected");
      })) {
        KJ_LOG(ERROR, "couldn't destroy session of disconnected owner", id, *exception);
      }
    }
  }

  auto iter = owners.find(owner.key);
  KJ_ASSERT(iter != owners.end());
  owners.erase(iter);
}

SessionRecord::Builder SessionManager::getOwned(Binding::Owner& owner, kj::StringPtr id) {
  if (!isValidSessionId(id)) {
    throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("invalid session id '", id, "'"));
  }

  KJ_IF_MAYBE(record, store.find(id)) {
    if (record->getOwnerKey() == owner.key) {
      return *record;
    }
  }

  // Someone else's session is indistinguishable from no session at all.
  throwEngineError(ErrorKind::SESSION_NOT_FOUND, kj::str("no session with id '", id, "'"));
}

size_t SessionManager::countOwned(kj::StringPtr ownerKey) {
  size_t count = 0;
  for (auto id: store.ids()) {
    if (KJ_ASSERT_NONNULL(store.find(id)).getOwnerKey() == ownerKey) {
      ++count;
    }
  }
  return count;
}

SessionRecord::Builder SessionManager::create(
    Binding::Owner& owner, kj::StringPtr id, kj::StringPtr language,
    const LimitOverrides& limits, bool autoPersist) {
  executor.requireRuntime(language);

  if (countOwned(owner.key) >= config.maxSessionsPerClient) {
    throwEngineError(ErrorKind::SESSION_LIMIT_EXCEEDED,
        kj::str("this client already has ", config.maxSessionsPerClient,
                " sessions; destroy one before creating another"));
  }

  auto effective = limits.applyTo(config.defaultLimits);
  int64_t now = currentTimeMs();

  auto record = store.create(id);
  record.setOwnerKey(owner.key);
  record.setLanguage(language);
  auto recordLimits = record.initLimits();
  recordLimits.setFuel(effective.fuel);
  recordLimits.setMemoryBytes(effective.memoryBytes);
  recordLimits.setTimeoutMs(effective.timeoutMs);
  record.setAutoPersist(autoPersist);
  record.setCreatedAt(now);
  record.setLastActiveAt(now);
  record.setIdleTimeoutMs(config.sessionTimeoutMs);
  record.setExecutionCount(0);
  store.commit(id);

  KJ_LOG(INFO, "created session", id, language, owner.key);
  return record;
}

void SessionManager::destroy(kj::StringPtr id, kj::StringPtr why) {
  auto iter = running.find(id);
  if (iter == running.end()) {
    store.remove(id);
  } else {
    iter->second->markDestroyed(store.detach(id));
  }
  KJ_LOG(INFO, "destroyed session", id, why);
}

void SessionManager::requireIdle(kj::StringPtr id) {
  if (isRunning(id)) {
    throwEngineError(ErrorKind::SESSION_BUSY,
        kj::str("session '", id, "' is already executing; retry when it has finished"));
  }
}

SessionInfo SessionManager::makeInfo(SessionRecord::Reader record) {
  auto limits = record.getLimits();
  SessionInfo info;
  info.sessionId = kj::heapString(record.getId());
  info.language = kj::heapString(record.getLanguage());
  info.createdAt = record.getCreatedAt();
  info.lastActiveAt = record.getLastActiveAt();
  info.expiresAt = record.getLastActiveAt() + static_cast<int64_t>(record.getIdleTimeoutMs());
  info.executionCount = record.getExecutionCount();
  info.limits = { limits.getFuel(), limits.getMemoryBytes(), limits.getTimeoutMs() };
  info.autoPersist = record.getAutoPersist();
  info.active = isRunning(record.getId());
  return info;
}

// =======================================================================================

SessionManager::Binding::Binding(SessionManager& manager, Owner& owner)
    : manager(manager), owner(owner) {
  ++owner.bindings;
}

SessionManager::Binding::~Binding() noexcept(false) {
  manager.release(owner);
}

kj::StringPtr SessionManager::Binding::getOwnerKey() const {
  return owner.key;
}

kj::Promise<ExecutionResult> SessionManager::Binding::execute(ExecutionRequest request) {
  kj::StringPtr id = owner.defaultSessionId;
  KJ_IF_MAYBE(requested, request.sessionId) {
    id = *requested;
  }

  if (!isValidSessionId(id)) {
    throwEngineError(ErrorKind::INVALID_REQUEST, kj::str("invalid session id '", id, "'"));
  }
  manager.executor.requireRuntime(request.language);

  bool exists = manager.store.find(id) != nullptr;
  if (exists) {
    manager.getOwned(owner, id);
    manager.requireIdle(id);
  }
  SessionRecord::Builder record = exists
      ? manager.getOwned(owner, id)
      : manager.create(owner, id, request.language, LimitOverrides(),
                       manager.config.autoPersistDefault);

  auto sessionLimits = record.getLimits();
  auto limits = request.limits.applyTo(ExecutionLimits {
    sessionLimits.getFuel(), sessionLimits.getMemoryBytes(), sessionLimits.getTimeoutMs()
  });
  KJ_IF_MAYBE(timeout, request.timeoutMs) {
    limits.timeoutMs = *timeout;
  }
  if (limits.fuel == 0 || limits.memoryBytes == 0 || limits.timeoutMs == 0) {
    throwEngineError(ErrorKind::INVALID_REQUEST, "execution limits must be positive");
  }

  ExecutionJob job = {
    kj::heapString(id),
    kj::mv(request.language),
    kj::mv(request.code),
    record.getAutoPersist(),
    limits,
    manager.store.workspacePath(id)
  };

  // The binding may go away before the execution finishes; the manager won't.
  SessionManager& sessionManager = manager;
  auto scope = kj::heap<RunScope>(sessionManager, id);
  return kj::evalNow([&]() {
    return sessionManager.executor.execute(kj::mv(job));
  }).then([&sessionManager,&runScope = *scope](ExecutionResult&& result) {
    if (!runScope.isDestroyed()) {
      KJ_IF_MAYBE(record, sessionManager.store.find(runScope.getId())) {
        record->setLastActiveAt(currentTimeMs());
        record->setExecutionCount(record->getExecutionCount() + 1);
        sessionManager.store.commit(runScope.getId());
      }
    }
    return kj::mv(result);
  }).attach(kj::mv(scope));
}

SessionInfo SessionManager::Binding::createSession(
    kj::StringPtr language, const LimitOverrides& limits, kj::Maybe<bool> autoPersist) {
  auto id = randomSessionId();
  bool persist = manager.config.autoPersistDefault;
  KJ_IF_MAYBE(p, autoPersist) {
    persist = *p;
  }
  return manager.makeInfo(manager.create(owner, id, language, limits, persist));
}

void SessionManager::Binding::destroySession(kj::StringPtr id) {
  manager.getOwned(owner, id);
  manager.destroy(id, "destroyed by client");
}

SessionInfo SessionManager::Binding::getSessionInfo(kj::StringPtr id) {
  return manager.makeInfo(manager.getOwned(owner, id));
}

void SessionManager::Binding::resetSession(kj::StringPtr id) {
  auto record = manager.getOwned(owner, id);
  manager.requireIdle(id);
  manager.store.clearWorkspace(id);
  record.setExecutionCount(0);
  record.setLastActiveAt(currentTimeMs());
  manager.store.commit(id);
  KJ_LOG(INFO, "reset session", id);
}

kj::Array<FileEntry> SessionManager::Binding::listFiles(kj::StringPtr id) {
  manager.getOwned(owner, id);
  return manager.store.listFiles(id);
}

kj::Array<byte> SessionManager::Binding::readFile(kj::StringPtr id, kj::StringPtr path) {
  manager.getOwned(owner, id);
  return manager.store.readFile(id, path);
}

void SessionManager::Binding::writeFile(
    kj::StringPtr id, kj::StringPtr path, kj::ArrayPtr<const byte> content) {
  manager.getOwned(owner, id);
  manager.requireIdle(id);
  manager.store.writeFile(id, path, content, manager.config.maxFileBytes);
}

void SessionManager::Binding::deletePath(kj::StringPtr id, kj::StringPtr path) {
  manager.getOwned(owner, id);
  manager.requireIdle(id);
  manager.store.deletePath(id, path);
}

}  // namespace guestbox
