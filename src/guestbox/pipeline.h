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


#ifndef GUESTBOX_PIPELINE_H_
#define GUESTBOX_PIPELINE_H_

#include <kj/async-io.h>
#include <kj/timer.h>
#include "result.h"
#include "config.h"
#include "fuel-meter.h"
#include "cgroup2.h"

namespace guestbox {

class SubprocessSet;
class RuntimeRegistry;
class CapabilityBinder;
class CapabilityDescriptor;
class CodeWrapper;
class OutcomeClassifier;
struct RuntimeImage;

struct ExecutionJob {
  // Everything the pipeline needs to run one piece of code for one session. Owns its contents,
  // since the session may be destroyed while the job is running.

  kj::String sessionId;
  kj::String language;
  kj::String code;
  bool autoPersist;
  ExecutionLimits limits;

  kj::String workdir;
  // Host path of the session's working directory.
};

class Executor {
  // Runs jobs. The session manager only sees this interface, so that it can be tested without
  // launching guests.

public:
  virtual kj::Promise<ExecutionResult> execute(ExecutionJob job) = 0;
  // Guest failures of every sort are reported in the result, fully classified. The promise is
  // only rejected for request-level errors (see throwEngineError()) and for failures of the
  // engine itself, such as a sandbox that cannot be set up.

  virtual void requireRuntime(kj::StringPtr language) = 0;
  // Throws UnsupportedLanguage or RuntimeNotLoaded unless jobs in `language` can be run.
};

class ExecutionPipeline final: public Executor {
public:
  ExecutionPipeline(const EngineConfig& config, const RuntimeRegistry& registry,
                    const CapabilityBinder& binder, const CodeWrapper& wrapper,
                    const OutcomeClassifier& classifier, kj::StringPtr mountPoint,
                    kj::Timer& timer, kj::LowLevelAsyncIoProvider& ioProvider,
                    SubprocessSet& subprocessSet);
  KJ_DISALLOW_COPY(ExecutionPipeline);
  ~ExecutionPipeline() noexcept(false);

  kj::Promise<ExecutionResult> execute(ExecutionJob job) override;
  // Wrap the job's code, write the payload into the working directory, run it, and classify
  // the outcome.

  void requireRuntime(kj::StringPtr language) override;

  kj::Promise<ExecutionResult> run(const RuntimeImage& image,
                                   const CapabilityDescriptor& capabilities,
                                   ExecutionLimits limits, int workdirFd);
  // Run the image's interpreter on the payload already in the working directory. Fills in the
  // raw outcome only: output, exit status, duration, fuel, trap and memory. `image` and
  // `capabilities` are not used after run() returns; `workdirFd` must stay open until the
  // promise resolves.

private:
  class Instance;

  const EngineConfig& config;
  const RuntimeRegistry& registry;
  const CapabilityBinder& binder;
  const CodeWrapper& wrapper;
  const OutcomeClassifier& classifier;
  kj::StringPtr mountPoint;
  kj::Timer& timer;
  kj::LowLevelAsyncIoProvider& ioProvider;
  SubprocessSet& subprocessSet;

  FuelMeterFactory fuelMeters;
  kj::Maybe<Cgroup> cgroup;
  uint64_t instanceCounter = 0;
};

}  // namespace guestbox

#endif // GUESTBOX_PIPELINE_H_
