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


#include "fuel-meter.h"
#include <kj/debug.h>
#include <kj/io.h>
#include <linux/perf_event.h>
#include <sys/syscall.h>
#include <string.h>
#include <errno.h>
#include <time.h>
#include <unistd.h>
#include <cmath>

namespace guestbox {

FuelMeter::~FuelMeter() noexcept(false) {}

namespace {

class InstructionMeter final: public FuelMeter {
  // Counts retired user-space instructions with a hardware performance counter. The counter is
  // enabled by the guest's execve() and inherited by anything it forks.

public:
  explicit InstructionMeter(kj::AutoCloseFd fd): fd(kj::mv(fd)) {}

  uint64_t sample() override {
    uint64_t count = 0;
    ssize_t n;
    KJ_SYSCALL(n = read(fd, &count, sizeof(count)));
    KJ_ASSERT(n == sizeof(count), "short read from performance counter");
    if (count > last) last = count;
    return last;
  }

  uint64_t finish(uint64_t guestCpuTimeNs) override {
    return sample();
  }

private:
  kj::AutoCloseFd fd;
  uint64_t last = 0;
};

class CpuTimeMeter final: public FuelMeter {
  // Approximates instructions as CPU time multiplied by a fixed rate.

public:
  CpuTimeMeter(clockid_t clock, double fuelPerNanosecond)
      : clock(clock), fuelPerNanosecond(fuelPerNanosecond) {}

  uint64_t sample() override {
    struct timespec ts;
    if (clock_gettime(clock, &ts) < 0) {
      // The guest has already been reaped; keep the last reading until finish().
      return last;
    }
    record(static_cast<uint64_t>(ts.tv_sec) * 1000000000ull + ts.tv_nsec);
    return last;
  }

  uint64_t finish(uint64_t guestCpuTimeNs) override {
    // wait4()'s figure also covers children the guest reaped, which the clock does not.
    record(guestCpuTimeNs);
    return last;
  }

private:
  clockid_t clock;
  double fuelPerNanosecond;
  uint64_t last = 0;

  void record(uint64_t nanoseconds) {
    uint64_t fuel = static_cast<uint64_t>(std::llround(nanoseconds * fuelPerNanosecond));
    if (fuel > last) last = fuel;
  }
};

kj::Maybe<kj::AutoCloseFd> openInstructionCounter(pid_t pid, int& error) {
  struct perf_event_attr attr;
  memset(&attr, 0, sizeof(attr));
  attr.type = PERF_TYPE_HARDWARE;
  attr.size = sizeof(attr);
  attr.config = PERF_COUNT_HW_INSTRUCTIONS;
  attr.disabled = 1;
  attr.enable_on_exec = 1;
  attr.inherit = 1;
  attr.exclude_kernel = 1;
  attr.exclude_hv = 1;

  int fd = syscall(__NR_perf_event_open, &attr, pid, -1, -1, PERF_FLAG_FD_CLOEXEC);
  if (fd < 0) {
    error = errno;
    return nullptr;
  }
  return kj::AutoCloseFd(fd);
}

}  // namespace

FuelMeterFactory::FuelMeterFactory(FuelMeterKind kind, double cpuFuelPerNanosecond)
    : kind(kind), cpuFuelPerNanosecond(cpuFuelPerNanosecond) {}

kj::Maybe<kj::Own<FuelMeter>> FuelMeterFactory::attach(pid_t pid) {
  if (kind != FuelMeterKind::CPU_TIME && !instructionCounterUnavailable) {
    int error = 0;
    KJ_IF_MAYBE(fd, openInstructionCounter(pid, error)) {
      return kj::Own<FuelMeter>(kj::heap<InstructionMeter>(kj::mv(*fd)));
    }

    if (kind == FuelMeterKind::INSTRUCTIONS) {
      KJ_FAIL_SYSCALL("perf_event_open(PERF_COUNT_HW_INSTRUCTIONS)", error, pid);
    }

    KJ_LOG(WARNING, "hardware instruction counter unavailable; metering fuel by CPU time",
           strerror(error), cpuFuelPerNanosecond);
    instructionCounterUnavailable = true;
  }

  clockid_t clock;
  int error = clock_getcpuclockid(pid, &clock);
  if (error != 0) {
    KJ_LOG(ERROR, "can't read guest CPU clock; execution is unmetered", pid, strerror(error));
    return nullptr;
  }
  return kj::Own<FuelMeter>(kj::heap<CpuTimeMeter>(clock, cpuFuelPerNanosecond));
}

}  // namespace guestbox
