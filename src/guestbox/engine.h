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


#ifndef GUESTBOX_ENGINE_H_
#define GUESTBOX_ENGINE_H_

#include <kj/async-io.h>
#include <guestbox/engine.capnp.h>
#include "config.h"
#include "util.h"
#include "runtime-registry.h"
#include "capability.h"
#include "code-wrapper.h"
#include "classifier.h"
#include "session-store.h"
#include "pipeline.h"
#include "session-manager.h"

namespace guestbox {

class ExecutionEngine {
  // Everything wired together: storage, runtime images, the execution pipeline and the session
  // manager. Constructing one loads the runtime images, recovers sessions left by a previous
  // process, and starts the eviction loop; it must be done on the thread that runs `io`.

public:
  ExecutionEngine(EngineConfig config, kj::AsyncIoContext& io);
  KJ_DISALLOW_COPY(ExecutionEngine);
  ~ExecutionEngine() noexcept(false);

  kj::Own<SessionManager::Binding> bind(kj::StringPtr token);
  kj::Array<const RuntimeImage*> listRuntimes() const { return registry.list(); }

  rpc::Engine::Client getBootstrap();
  // The capability served to each RPC client.

private:
  EngineConfig config;
  SessionStore store;
  RuntimeRegistry registry;
  CapabilityBinder binder;
  CodeWrapper wrapper;
  OutcomeClassifier classifier;
  SubprocessSet subprocessSet;
  ExecutionPipeline pipeline;
  SessionManager sessions;
};

ExecutionRequest fromRpc(rpc::ExecutionRequest::Reader request);
LimitOverrides fromRpc(rpc::LimitOverrides::Reader limits);
// Zero fields of the wire form mean "not given".

void toRpc(const ExecutionResult& result, rpc::ExecutionResult::Builder builder);
void toRpc(const SessionInfo& info, rpc::SessionInfo::Builder builder);

kj::String resultToJson(const ExecutionResult& result);
// The result in Cap'n Proto's JSON encoding, as printed by `guestbox run`.

}  // namespace guestbox

#endif // GUESTBOX_ENGINE_H_
