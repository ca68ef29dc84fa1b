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

#include "pipeline.h"
#include "sandbox.h"
#include "capability.h"
#include "runtime-registry.h"
#include "code-wrapper.h"
#include "classifier.h"
#include "session-store.h"
#include "util.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <sys/wait.h>

namespace guestbox {

namespace {

struct Capture {
  // Output of one guest stream. Everything is read; only the first `limit` bytes are kept.

  kj::Own<kj::AsyncInputStream> stream;
  size_t limit;
  kj::Vector<char> data;
  bool truncated = false;
  char buffer[4096];

  kj::String text() {
    return kj::heapString(data.begin(), data.size());
  }
};

kj::Promise<void> drain(Capture& capture) {
  return capture.stream->tryRead(capture.buffer, 1, sizeof(capture.buffer))
      .then([&capture](size_t n) -> kj::Promise<void> {
    if (n == 0) {
      return kj::READY_NOW;
    }

    size_t room = capture.limit - kj::min(capture.limit, capture.data.size());
    size_t kept = kj::min(room, n);
    capture.data.addAll(capture.buffer, capture.buffer + kept);
    if (kept < n) {
      capture.truncated = true;
    }
    return drain(capture);
  });
}

bool hasErrorMarker(kj::StringPtr stderrText) {
  if (contains(stderrText, "Traceback")) return true;
  if (stderrText.startsWith("Error:")) return true;
  return contains(stderrText, "\nError:");
}

bool isMemorySignal(int signo) {
  // What an interpreter dies of when an allocation fails under RLIMIT_AS.
  return signo == SIGSEGV || signo == SIGBUS || signo == SIGABRT;
}

bool nearMemoryCeiling(uint64_t peakBytes, uint64_t limitBytes) {
  // A crash signal only counts as a memory failure when usage got close to the limit;
  // otherwise it is an ordinary fault (abort(), a native segfault).
  return limitBytes > 0 && peakBytes >= limitBytes / 4 * 3;
}

}  // namespace

// =======================================================================================

class ExecutionPipeline::Instance {
  // One guest, from fork to reaping.

public:
  Instance(ExecutionPipeline& pipeline, ExecutionLimits limits)
      : pipeline(pipeline), limits(limits), number(++pipeline.instanceCounter) {}

  ~Instance() noexcept(false) {
    if (guestPid != 0 && !guestExited) {
      // Canceled mid-run. The guest is pid 1 of its namespace, so this takes down everything
      // it started. The keeper is killed by ~Subprocess().
      if (::kill(guestPid, SIGKILL) < 0 && errno != ESRCH) {
        KJ_LOG(ERROR, "couldn't kill guest", guestPid, strerror(errno));
      }
    }
    KJ_IF_MAYBE(name, cgroupName) {
      KJ_IF_MAYBE(parent, pipeline.cgroup) {
        KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
          if (!parent->tryRemoveChild(*name)) {
            KJ_LOG(WARNING, "execution cgroup still busy; leaving it behind", *name);
          }
        })) {
          KJ_LOG(ERROR, "couldn't remove execution cgroup", *name, *exception);
        }
      }
    }
  }

  kj::Promise<ExecutionResult> start(const RuntimeImage& image,
                                     const CapabilityDescriptor& capabilities,
                                     int workdirFd) {
    auto stdoutPipe = Pipe::make();
    auto stderrPipe = Pipe::make();
    auto controlPipe = Pipe::make();
    auto startPipe = Pipe::make();
    auto setupErrorPipe = Pipe::make();

    auto payloadPath = kj::str(capabilities.getWorkdirGuestPath(), '/', image.payloadFile);
    auto argv = image.expandArgv(payloadPath, capabilities.getWorkdirGuestPath());

    sandbox::GuestSpec spec = {
      capabilities, pipeline.mountPoint, image.guestEntryPoint, argv, image.environ,
      limits.memoryBytes, pipeline.config.maxFileBytes
    };
    sandbox::KeeperFds fds = {
      stdoutPipe.writeEnd, stderrPipe.writeEnd, controlPipe.writeEnd,
      startPipe.readEnd, setupErrorPipe.writeEnd, workdirFd
    };

    keeper = kj::heap<Subprocess>([&]() -> int {
      return sandbox::runKeeper(spec, fds);
    }, "keeper");
    auto keeperDone = pipeline.subprocessSet.waitForExitOrSignal(*keeper);

    // From here on only the keeper and guest may hold the child ends, or we'd never see EOF.
    stdoutPipe.writeEnd = nullptr;
    stderrPipe.writeEnd = nullptr;
    controlPipe.writeEnd = nullptr;
    startPipe.readEnd = nullptr;
    setupErrorPipe.writeEnd = nullptr;

    startFd = kj::mv(startPipe.writeEnd);
    control = wrap(kj::mv(controlPipe.readEnd));
    stdoutCapture.stream = wrap(kj::mv(stdoutPipe.readEnd));
    stdoutCapture.limit = pipeline.config.outputCaps.stdoutMaxBytes;
    stderrCapture.stream = wrap(kj::mv(stderrPipe.readEnd));
    stderrCapture.limit = pipeline.config.outputCaps.stderrMaxBytes;
    setupErrorCapture.stream = wrap(kj::mv(setupErrorPipe.readEnd));
    setupErrorCapture.limit = sizeof(setupErrorCapture.buffer);

    return readReport()
        .then([this,KJ_MVCAP(keeperDone)](sandbox::KeeperReport report) mutable {
      if (report.type == sandbox::KeeperReport::FAILED) {
        KJ_FAIL_ASSERT("couldn't set up guest sandbox",
                       kj::heapString(report.error, strnlen(report.error, sizeof(report.error))));
      }
      KJ_ASSERT(report.type == sandbox::KeeperReport::STARTED, report.type);
      guestPid = report.pid;

      attachMeters();

      // Go.
      KJ_SYSCALL(write(startFd, "g", 1));
      startFd = nullptr;
      startTime = pipeline.timer.now();

      auto guestDone = readReport().then([this](sandbox::KeeperReport report) {
        KJ_ASSERT(report.type == sandbox::KeeperReport::EXITED, report.type);
        exitReport = report;
        guestExited = true;
        endTime = pipeline.timer.now();
      }).exclusiveJoin(watchTimeout().exclusiveJoin(watchFuel()));

      auto all = kj::heapArrayBuilder<kj::Promise<void>>(5);
      all.add(kj::mv(guestDone));
      all.add(drain(stdoutCapture));
      all.add(drain(stderrCapture));
      all.add(drain(setupErrorCapture));
      all.add(keeperDone.ignoreResult());
      return kj::joinPromises(all.finish());
    }).then([this]() {
      return finish();
    });
  }

private:
  ExecutionPipeline& pipeline;
  ExecutionLimits limits;
  uint64_t number;

  kj::Own<Subprocess> keeper;
  kj::AutoCloseFd startFd;
  kj::Own<kj::AsyncInputStream> control;
  sandbox::KeeperReport report = {};
  Capture stdoutCapture;
  Capture stderrCapture;
  Capture setupErrorCapture;

  pid_t guestPid = 0;
  bool guestExited = false;
  sandbox::KeeperReport exitReport = {};
  kj::TimePoint startTime = kj::origin<kj::TimePoint>();
  kj::TimePoint endTime = kj::origin<kj::TimePoint>();

  kj::Maybe<kj::Own<FuelMeter>> meter;
  kj::Maybe<kj::String> cgroupName;
  TrapKind killedFor = TrapKind::NONE;

  kj::Own<kj::AsyncInputStream> wrap(kj::AutoCloseFd fd) {
    return pipeline.ioProvider.wrapInputFd(fd.release(),
        kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
        kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
  }

  kj::Promise<sandbox::KeeperReport> readReport() {
    return control->tryRead(&report, sizeof(report), sizeof(report))
        .then([this](size_t n) {
      KJ_ASSERT(n == sizeof(report), "sandbox keeper died unexpectedly");
      return report;
    });
  }

  void attachMeters() {
    // The guest is parked on the start pipe, so nothing it does can escape accounting.
    meter = pipeline.fuelMeters.attach(guestPid);

    KJ_IF_MAYBE(parent, pipeline.cgroup) {
      auto name = kj::str("exec-", getpid(), '-', number);
      auto child = parent->getOrMakeChild(name);
      cgroupName = kj::mv(name);
      child.setMemoryMax(limits.memoryBytes);
      child.addPid(guestPid);
    }
  }

  void killGuest(TrapKind reason) {
    if (killedFor != TrapKind::NONE || guestExited) return;
    killedFor = reason;
    KJ_SYSCALL_HANDLE_ERRORS(::kill(guestPid, SIGKILL)) {
      case ESRCH:
        // Already on its way out.
        break;
      default:
        KJ_FAIL_SYSCALL("kill(guest)", error, guestPid);
    }
  }

  kj::Promise<void> watchTimeout() {
    if (limits.timeoutMs == 0) return kj::NEVER_DONE;
    return pipeline.timer.afterDelay(static_cast<int64_t>(limits.timeoutMs) * kj::MILLISECONDS)
        .then([this]() -> kj::Promise<void> {
      killGuest(TrapKind::TIMEOUT);
      return kj::NEVER_DONE;
    });
  }

  kj::Promise<void> watchFuel() {
    KJ_IF_MAYBE(m, meter) {
      FuelMeter& fuelMeter = **m;
      return pipeline.timer.afterDelay(
          static_cast<int64_t>(pipeline.config.fuelPollMs) * kj::MILLISECONDS)
          .then([this,&fuelMeter]() -> kj::Promise<void> {
        if (fuelMeter.sample() >= limits.fuel) {
          killGuest(TrapKind::OUT_OF_FUEL);
          return kj::NEVER_DONE;
        }
        return watchFuel();
      });
    } else {
      return kj::NEVER_DONE;
    }
  }

  uint64_t oomKills() {
    KJ_IF_MAYBE(name, cgroupName) {
      KJ_IF_MAYBE(parent, pipeline.cgroup) {
        return parent->getChild(*name).getOomKillCount();
      }
    }
    return 0;
  }

  uint64_t memoryPeak() {
    uint64_t peak = exitReport.maxRssBytes;
    KJ_IF_MAYBE(name, cgroupName) {
      KJ_IF_MAYBE(parent, pipeline.cgroup) {
        KJ_IF_MAYBE(cgroupPeak, parent->getChild(*name).getMemoryPeak()) {
          peak = kj::max(peak, *cgroupPeak);
        }
      }
    }
    return peak;
  }

  ExecutionResult finish() {
    auto setupError = setupErrorCapture.text();
    if (setupError.size() > 0) {
      KJ_FAIL_ASSERT("couldn't set up guest sandbox", setupError);
    }

    ExecutionResult result;
    result.stdoutText = stdoutCapture.text();
    result.stdoutTruncated = stdoutCapture.truncated;
    result.stderrTruncated = stderrCapture.truncated;
    result.durationMs = (endTime - startTime) / kj::MILLISECONDS;
    result.fuelBudget = limits.fuel;
    result.memoryUsedBytes = memoryPeak();

    KJ_IF_MAYBE(m, meter) {
      result.fuelMetered = true;
      result.fuelConsumed = (*m)->finish(exitReport.cpuTimeNs);
    }

    int status = exitReport.status;
    if (WIFSIGNALED(status)) {
      result.exitCode = 128 + WTERMSIG(status);
    } else if (WIFEXITED(status)) {
      result.exitCode = WEXITSTATUS(status);
    } else {
      KJ_FAIL_ASSERT("unknown guest wait status", status);
    }

    if (killedFor == TrapKind::OUT_OF_FUEL ||
        (result.fuelMetered && result.fuelConsumed >= limits.fuel)) {
      result.trap = TrapKind::OUT_OF_FUEL;
      result.fuelConsumed = limits.fuel;
      result.trapReason = kj::str("fuel budget of ", limits.fuel, " instructions exhausted");
    } else if (killedFor == TrapKind::TIMEOUT) {
      result.trap = TrapKind::TIMEOUT;
      result.trapReason = kj::str("wall-clock timeout of ", limits.timeoutMs, " ms exceeded");
    } else if (WIFSIGNALED(status)) {
      int signo = WTERMSIG(status);
      bool nearCeiling = nearMemoryCeiling(result.memoryUsedBytes, limits.memoryBytes);
      if (oomKills() > 0 || (isMemorySignal(signo) && nearCeiling)) {
        result.trap = TrapKind::MEMORY_LIMIT;
        result.trapReason = kj::str("memory limit of ", limits.memoryBytes,
                                    " bytes exceeded (", strsignal(signo), ")");
      } else {
        result.trap = TrapKind::FAULT;
        result.trapReason = kj::str("guest killed by signal ", signo, " (", strsignal(signo), ")");
      }
    }

    if (result.trap == TrapKind::NONE) {
      result.stderrText = stderrCapture.text();
    } else {
      kj::StringPtr separator =
          stderrCapture.data.size() == 0 || stderrCapture.data.back() == '\n' ? "" : "\n";
      result.stderrText = kj::str(stderrCapture.text(), separator,
                              "Execution trapped: ", result.trapReason, '\n');
    }

    result.success = result.trap == TrapKind::NONE && result.exitCode == 0 &&
                     !hasErrorMarker(result.stderrText);
    return result;
  }
};

// =======================================================================================

ExecutionPipeline::ExecutionPipeline(
    const EngineConfig& config, const RuntimeRegistry& registry,
    const CapabilityBinder& binder, const CodeWrapper& wrapper,
    const OutcomeClassifier& classifier, kj::StringPtr mountPoint,
    kj::Timer& timer, kj::LowLevelAsyncIoProvider& ioProvider, SubprocessSet& subprocessSet)
    : config(config), registry(registry), binder(binder), wrapper(wrapper),
      classifier(classifier), mountPoint(mountPoint), timer(timer), ioProvider(ioProvider),
      subprocessSet(subprocessSet),
      fuelMeters(config.fuelMeter, config.cpuFuelPerNanosecond) {
  KJ_IF_MAYBE(dir, config.cgroupDir) {
    cgroup = Cgroup(*dir);
  }
}

ExecutionPipeline::~ExecutionPipeline() noexcept(false) {}

kj::Promise<ExecutionResult> ExecutionPipeline::run(
    const RuntimeImage& image, const CapabilityDescriptor& capabilities,
    ExecutionLimits limits, int workdirFd) {
  auto instance = kj::heap<Instance>(*this, limits);
  auto promise = instance->start(image, capabilities, workdirFd);
  return promise.attach(kj::mv(instance));
}

void ExecutionPipeline::requireRuntime(kj::StringPtr language) {
  registry.get(language);
}

kj::Promise<ExecutionResult> ExecutionPipeline::execute(ExecutionJob job) {
  const RuntimeImage& image = registry.get(job.language);

  // Held for the whole run: if the session is destroyed meanwhile, its directory is renamed
  // away, but this fd still reaches it.
  auto workdirFd = raiiOpen(job.workdir, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
  auto before = snapshotWorkspace(workdirFd);

  wrapper.writePayload(workdirFd, image.payloadFile,
                       wrapper.wrap(image.language, job.code, job.autoPersist));

  auto capabilities = binder.bind(job.workdir, image);
  auto roots = KJ_MAP(root, capabilities.grantedRoots()) { return kj::heapString(root); };
  auto workdirGuestPath = kj::heapString(capabilities.getWorkdirGuestPath());
  auto payloadFile = kj::heapString(image.payloadFile);

  auto promise = run(image, capabilities, job.limits, workdirFd);

  return promise.then(
      [this,KJ_MVCAP(job),KJ_MVCAP(workdirFd),KJ_MVCAP(before),KJ_MVCAP(roots),
       KJ_MVCAP(workdirGuestPath),KJ_MVCAP(payloadFile)]
      (ExecutionResult&& result) mutable {
    auto after = snapshotWorkspace(workdirFd);
    const kj::StringPtr ignore[] = {
      CodeWrapper::STATE_FILE, CodeWrapper::STATE_TEMP_FILE, payloadFile
    };
    kj::Vector<kj::String> created;
    kj::Vector<kj::String> modified;
    diffSnapshots(before, after, ignore, created, modified);
    result.filesCreated = created.releaseAsArray();
    result.filesModified = modified.releaseAsArray();

    ClassificationInput input;
    input.code = job.code;
    input.grantedRoots = roots;
    input.workdir = workdirGuestPath;
    input.memoryBytes = job.limits.memoryBytes;
    classifier.classify(result, input);

    result.sessionId = kj::mv(job.sessionId);
    result.language = kj::mv(job.language);
    return kj::mv(result);
  });
}

}  // namespace guestbox
