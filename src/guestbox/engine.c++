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
#include <kj/debug.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>

namespace guestbox {

namespace {

rpc::TrapKind toRpc(TrapKind trap) {
  switch (trap) {
    case TrapKind::NONE: return rpc::TrapKind::NONE;
    case TrapKind::OUT_OF_FUEL: return rpc::TrapKind::OUT_OF_FUEL;
    case TrapKind::MEMORY_LIMIT: return rpc::TrapKind::MEMORY_LIMIT;
    case TrapKind::TIMEOUT: return rpc::TrapKind::TIMEOUT;
    case TrapKind::FAULT: return rpc::TrapKind::FAULT;
  }
  KJ_UNREACHABLE;
}

void fillTextList(capnp::List<capnp::Text>::Builder list, kj::ArrayPtr<const kj::String> items) {
  for (auto i: kj::indices(items)) {
    list.set(i, items[i]);
  }
}

void toRpc(const ErrorReport& report, rpc::ErrorReport::Builder builder) {
  builder.setKind(errorKindName(report.kind));
  builder.setMessage(report.message);
  fillTextList(builder.initRemediation(report.remediation.size()), report.remediation);
  auto examples = builder.initCodeExamples(report.codeExamples.size());
  for (auto i: kj::indices(report.codeExamples)) {
    auto& example = report.codeExamples[i];
    examples[i].setBefore(example.before);
    examples[i].setAfter(example.after);
    examples[i].setExplanation(example.explanation);
  }
  fillTextList(builder.initDocs(report.docs.size()), report.docs);
}

void toRpc(const FuelAnalysis& analysis, rpc::FuelAnalysis::Builder builder) {
  builder.setConsumed(analysis.consumed);
  builder.setBudget(analysis.budget);
  builder.setUtilizationPercent(analysis.utilizationPercent);
  builder.setStatus(analysis.status);
  builder.setRecommendation(analysis.recommendation);
  fillTextList(builder.initLikelyCauses(analysis.likelyCauses.size()), analysis.likelyCauses);
}

void fillRuntimes(capnp::List<rpc::RuntimeInfo>::Builder list,
                  kj::ArrayPtr<const RuntimeImage* const> images) {
  for (auto i: kj::indices(images)) {
    auto& image = *images[i];
    list[i].setLanguage(image.language);
    list[i].setVersion(image.version);
    fillTextList(list[i].initCapabilities(image.capabilities.size()), image.capabilities);
  }
}

// =======================================================================================

class TransportImpl final: public rpc::Transport::Server {
public:
  TransportImpl(ExecutionEngine& engine, kj::Own<SessionManager::Binding> binding)
      : engine(engine), binding(kj::mv(binding)) {}

  kj::Promise<void> execute(ExecuteContext context) override {
    auto request = fromRpc(context.getParams().getRequest());
    return binding->execute(kj::mv(request))
        .then([context](ExecutionResult&& result) mutable {
      toRpc(result, context.getResults().initResult());
    });
  }

  kj::Promise<void> createSession(CreateSessionContext context) override {
    auto params = context.getParams();
    kj::Maybe<bool> autoPersist;
    switch (params.getAutoPersist()) {
      case rpc::AutoPersist::USE_DEFAULT:
        break;
      case rpc::AutoPersist::ENABLED:
        autoPersist = true;
        break;
      case rpc::AutoPersist::DISABLED:
        autoPersist = false;
        break;
    }
    auto info = binding->createSession(params.getLanguage(), fromRpc(params.getLimits()),
                                       autoPersist);
    auto results = context.getResults();
    results.setSessionId(info.sessionId);
    results.setCreatedAt(info.createdAt);
    results.setExpiresAt(info.expiresAt);
    return kj::READY_NOW;
  }

  kj::Promise<void> destroySession(DestroySessionContext context) override {
    binding->destroySession(context.getParams().getSessionId());
    context.getResults().setDestroyed(true);
    return kj::READY_NOW;
  }

  kj::Promise<void> getSessionInfo(GetSessionInfoContext context) override {
    auto info = binding->getSessionInfo(context.getParams().getSessionId());
    toRpc(info, context.getResults().initInfo());
    return kj::READY_NOW;
  }

  kj::Promise<void> resetSession(ResetSessionContext context) override {
    binding->resetSession(context.getParams().getSessionId());
    context.getResults().setReset(true);
    return kj::READY_NOW;
  }

  kj::Promise<void> listRuntimes(ListRuntimesContext context) override {
    auto images = engine.listRuntimes();
    fillRuntimes(context.getResults().initRuntimes(images.size()), images);
    return kj::READY_NOW;
  }

  kj::Promise<void> listFiles(ListFilesContext context) override {
    auto files = binding->listFiles(context.getParams().getSessionId());
    auto list = context.getResults().initFiles(files.size());
    for (auto i: kj::indices(files)) {
      list[i].setPath(files[i].path);
      list[i].setSize(files[i].size);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> readFile(ReadFileContext context) override {
    auto params = context.getParams();
    auto content = binding->readFile(params.getSessionId(), params.getPath());
    context.getResults().setContent(kj::ArrayPtr<const byte>(content));
    return kj::READY_NOW;
  }

  kj::Promise<void> writeFile(WriteFileContext context) override {
    auto params = context.getParams();
    binding->writeFile(params.getSessionId(), params.getPath(), params.getContent());
    return kj::READY_NOW;
  }

  kj::Promise<void> deletePath(DeletePathContext context) override {
    auto params = context.getParams();
    binding->deletePath(params.getSessionId(), params.getPath());
    return kj::READY_NOW;
  }

private:
  ExecutionEngine& engine;
  kj::Own<SessionManager::Binding> binding;
};

class EngineImpl final: public rpc::Engine::Server {
public:
  explicit EngineImpl(ExecutionEngine& engine): engine(engine) {}

  kj::Promise<void> bind(BindContext context) override {
    auto binding = engine.bind(context.getParams().getToken());
    context.getResults().setTransport(kj::heap<TransportImpl>(engine, kj::mv(binding)));
    return kj::READY_NOW;
  }

  kj::Promise<void> listRuntimes(ListRuntimesContext context) override {
    auto images = engine.listRuntimes();
    fillRuntimes(context.getResults().initRuntimes(images.size()), images);
    return kj::READY_NOW;
  }

private:
  ExecutionEngine& engine;
};

}  // namespace

// =======================================================================================

ExecutionEngine::ExecutionEngine(EngineConfig configParam, kj::AsyncIoContext& io)
    : config(kj::mv(configParam)),
      store(config.storageDir),
      registry(config.runtimeDir),
      binder(store.getWorkspaceRoot()),
      wrapper(CapabilityBinder::WORKDIR_GUEST_PATH, CapabilityBinder::HELPER_GUEST_PATH),
      classifier(config.classifierPolicy),
      subprocessSet(io.unixEventPort),
      pipeline(config, registry, binder, wrapper, classifier, store.getMountPoint(),
               io.provider->getTimer(), *io.lowLevelProvider, subprocessSet),
      sessions(config, store, pipeline, io.provider->getTimer(), randomBootId()) {
  registry.loadAll();
  registry.seal();
  if (registry.list().size() == 0) {
    KJ_LOG(WARNING, "no runtime images found; every execution will fail", config.runtimeDir);
  }

  KJ_IF_MAYBE(dir, config.helperDir) {
    binder.addSharedMount(CapabilityBinder::HELPER_GUEST_PATH, *dir);
  }
  KJ_IF_MAYBE(dir, config.externalDir) {
    binder.addSharedMount(CapabilityBinder::EXTERNAL_GUEST_PATH, *dir);
  }

  sessions.recover();
  sessions.startCleanupLoop();
}

ExecutionEngine::~ExecutionEngine() noexcept(false) {}

kj::Own<SessionManager::Binding> ExecutionEngine::bind(kj::StringPtr token) {
  return sessions.bind(token);
}

rpc::Engine::Client ExecutionEngine::getBootstrap() {
  return kj::heap<EngineImpl>(*this);
}

// =======================================================================================

LimitOverrides fromRpc(rpc::LimitOverrides::Reader limits) {
  LimitOverrides result;
  if (limits.getFuel() > 0) result.fuel = limits.getFuel();
  if (limits.getMemoryBytes() > 0) result.memoryBytes = limits.getMemoryBytes();
  if (limits.getTimeoutMs() > 0) result.timeoutMs = limits.getTimeoutMs();
  return result;
}

ExecutionRequest fromRpc(rpc::ExecutionRequest::Reader request) {
  ExecutionRequest result;
  result.language = kj::heapString(request.getLanguage());
  result.code = kj::heapString(request.getCode());
  if (request.getSessionId().size() > 0) {
    result.sessionId = kj::heapString(request.getSessionId());
  }
  result.limits = fromRpc(request.getLimits());
  if (request.getTimeoutMs() > 0) {
    result.timeoutMs = request.getTimeoutMs();
  }
  return result;
}

void toRpc(const ExecutionResult& result, rpc::ExecutionResult::Builder builder) {
  builder.setSuccess(result.success);
  builder.setStdout(result.stdoutText);
  builder.setStderr(result.stderrText);
  builder.setExitCode(result.exitCode);
  builder.setDurationMs(result.durationMs);
  builder.setFuelConsumed(result.fuelConsumed);
  builder.setFuelMetered(result.fuelMetered);
  builder.setTrap(toRpc(result.trap));
  builder.setTrapReason(result.trapReason);
  builder.setStdoutTruncated(result.stdoutTruncated);
  builder.setStderrTruncated(result.stderrTruncated);
  builder.setMemoryUsedBytes(result.memoryUsedBytes);
  fillTextList(builder.initFilesCreated(result.filesCreated.size()), result.filesCreated);
  fillTextList(builder.initFilesModified(result.filesModified.size()), result.filesModified);
  builder.setSessionId(result.sessionId);
  builder.setLanguage(result.language);

  auto metadata = builder.initMetadata();
  KJ_IF_MAYBE(report, result.errorGuidance) {
    toRpc(*report, metadata.getErrorGuidance().initReport());
  } else {
    metadata.getErrorGuidance().setNone();
  }
  KJ_IF_MAYBE(analysis, result.fuelAnalysis) {
    toRpc(*analysis, metadata.getFuelAnalysis().initAnalysis());
  } else {
    metadata.getFuelAnalysis().setNone();
  }
}

void toRpc(const SessionInfo& info, rpc::SessionInfo::Builder builder) {
  builder.setSessionId(info.sessionId);
  builder.setLanguage(info.language);
  builder.setCreatedAt(info.createdAt);
  builder.setLastActiveAt(info.lastActiveAt);
  builder.setExpiresAt(info.expiresAt);
  builder.setExecutionCount(info.executionCount);
  auto limits = builder.initLimits();
  limits.setFuel(info.limits.fuel);
  limits.setMemoryBytes(info.limits.memoryBytes);
  limits.setTimeoutMs(info.limits.timeoutMs);
  builder.setAutoPersist(info.autoPersist);
  builder.setState(info.active ? "active" : "idle");
}

kj::String resultToJson(const ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<rpc::ExecutionResult>();
  toRpc(result, root);

  capnp::JsonCodec json;
  json.setPrettyPrint(true);
  return json.encode(root.asReader());
}

}  // namespace guestbox
