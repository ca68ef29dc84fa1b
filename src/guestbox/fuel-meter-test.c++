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
#include <kj/test.h>
#include <kj/debug.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace guestbox {
namespace {

class Spinner {
  // A child process that burns CPU until it is killed.

public:
  Spinner() {
    KJ_SYSCALL(pid = fork());
    if (pid == 0) {
      volatile uint64_t n = 0;
      for (;;) ++n;
    }
  }
  ~Spinner() noexcept(false) {
    if (pid != 0) reap();
  }
  KJ_DISALLOW_COPY(Spinner);

  pid_t getPid() { return pid; }

  void reap() {
    kill(pid, SIGKILL);
    int status;
    KJ_SYSCALL(waitpid(pid, &status, 0));
    pid = 0;
  }

private:
  pid_t pid;
};

KJ_TEST("CPU-time fuel meter") {
  Spinner spinner;
  FuelMeterFactory factory(FuelMeterKind::CPU_TIME, 2.0);
  auto maybeMeter = factory.attach(spinner.getPid());
  auto meter = kj::mv(KJ_ASSERT_NONNULL(maybeMeter));

  uint64_t first = 0;
  for (int i = 0; i < 200 && first == 0; i++) {
    usleep(10000);
    first = meter->sample();
  }
  KJ_ASSERT(first > 0, "spinner consumed no CPU time");

  usleep(20000);
  uint64_t second = meter->sample();
  KJ_EXPECT(second >= first);

  spinner.reap();

  // The clock is gone once the process is reaped; the last reading stands.
  KJ_EXPECT(meter->sample() == second);

  KJ_EXPECT(meter->finish(5000000000ull) == 10000000000ull);

  // Never decreases.
  KJ_EXPECT(meter->finish(0) == 10000000000ull);
  KJ_EXPECT(meter->sample() == 10000000000ull);
}

KJ_TEST("automatic fuel meter always attaches to a live process") {
  Spinner spinner;
  FuelMeterFactory factory(FuelMeterKind::AUTO, 1.0);
  auto meter = factory.attach(spinner.getPid());
  KJ_EXPECT(meter != nullptr);

  // A second attachment reuses whatever the first one settled on.
  auto meter2 = factory.attach(spinner.getPid());
  KJ_EXPECT(meter2 != nullptr);
}

}  // namespace
}  // namespace guestbox
