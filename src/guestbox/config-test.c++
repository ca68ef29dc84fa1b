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

#include "config.h"
#include <kj/test.h>

namespace guestbox {
namespace {

KJ_TEST("parseConfig: defaults") {
  auto config = parseConfig("");
  KJ_EXPECT(config.storageDir == "/var/lib/guestbox");
  KJ_EXPECT(config.binding == BindingStrategy::MULTIPLEXED);
  KJ_EXPECT(config.sessionTimeoutMs == 600000);
  KJ_EXPECT(config.cleanupIntervalMs == 300000);
  KJ_EXPECT(config.maxSessionsPerClient == 5);
  KJ_EXPECT(config.defaultLimits.fuel == 2000000000ull);
  KJ_EXPECT(config.defaultLimits.memoryBytes == 128000000ull);
  KJ_EXPECT(config.defaultLimits.timeoutMs == 30000);
  KJ_EXPECT(config.outputCaps.stdoutMaxBytes == 2000000);
  KJ_EXPECT(config.outputCaps.stderrMaxBytes == 1000000);
  KJ_EXPECT(config.autoPersistDefault);
  KJ_EXPECT(config.helperDir == nullptr);
  KJ_EXPECT(config.cgroupDir == nullptr);
}

KJ_TEST("parseConfig: every option") {
  auto config = parseConfig(
      "# Engine settings\n"
      "STORAGE_DIR=/srv/guestbox/\n"
      "RUNTIME_DIR=/opt/runtimes\n"
      "HELPER_DIR=/opt/helpers\n"
      "EXTERNAL_DIR=/mnt/shared\n"
      "CGROUP_DIR=/sys/fs/cgroup/guestbox\n"
      "BINDING=single-stream\n"
      "SESSION_TIMEOUT_SECONDS=60\n"
      "CLEANUP_INTERVAL_SECONDS=5\n"
      "MAX_SESSIONS_PER_CLIENT=2\n"
      "DEFAULT_FUEL=1000\n"
      "DEFAULT_MEMORY_BYTES=64000000\n"
      "DEFAULT_TIMEOUT_SECONDS=3\n"
      "STDOUT_MAX_BYTES=100\n"
      "STDERR_MAX_BYTES=50\n"
      "AUTO_PERSIST_DEFAULT=no\n"
      "FUEL_METER=cputime\n"
      "CPU_FUEL_PER_NANOSECOND=0.5\n"
      "FUEL_POLL_MS=20\n"
      "MAX_FILE_BYTES=4096\n"
      "FUEL_MODERATE_THRESHOLD=0.4\n"
      "FUEL_WARNING_THRESHOLD=0.6\n"
      "FUEL_CRITICAL_THRESHOLD=0.8\n"
      "FUEL_WARNING_MARGIN=1.25\n"
      "FUEL_CRITICAL_MARGIN=3\n");

  KJ_EXPECT(config.storageDir == "/srv/guestbox");
  KJ_EXPECT(config.runtimeDir == "/opt/runtimes");
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.helperDir) == "/opt/helpers");
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.externalDir) == "/mnt/shared");
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.cgroupDir) == "/sys/fs/cgroup/guestbox");
  KJ_EXPECT(config.binding == BindingStrategy::SINGLE_STREAM);
  KJ_EXPECT(config.sessionTimeoutMs == 60000);
  KJ_EXPECT(config.cleanupIntervalMs == 5000);
  KJ_EXPECT(config.maxSessionsPerClient == 2);
  KJ_EXPECT(config.defaultLimits.fuel == 1000);
  KJ_EXPECT(config.defaultLimits.memoryBytes == 64000000);
  KJ_EXPECT(config.defaultLimits.timeoutMs == 3000);
  KJ_EXPECT(config.outputCaps.stdoutMaxBytes == 100);
  KJ_EXPECT(config.outputCaps.stderrMaxBytes == 50);
  KJ_EXPECT(!config.autoPersistDefault);
  KJ_EXPECT(config.fuelMeter == FuelMeterKind::CPU_TIME);
  KJ_EXPECT(config.cpuFuelPerNanosecond == 0.5);
  KJ_EXPECT(config.fuelPollMs == 20);
  KJ_EXPECT(config.maxFileBytes == 4096);
  KJ_EXPECT(config.classifierPolicy.moderateThreshold == 0.4);
  KJ_EXPECT(config.classifierPolicy.warningThreshold == 0.6);
  KJ_EXPECT(config.classifierPolicy.criticalThreshold == 0.8);
  KJ_EXPECT(config.classifierPolicy.warningMargin == 1.25);
  KJ_EXPECT(config.classifierPolicy.criticalMargin == 3);
}

KJ_TEST("parseConfig: invalid values") {
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("STORAGE_DIR=relative/path"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("DEFAULT_FUEL=0"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("DEFAULT_FUEL=lots"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("BINDING=both"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("AUTO_PERSIST_DEFAULT=maybe"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("FUEL_CRITICAL_THRESHOLD=1.5"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", parseConfig("FUEL_WARNING_MARGIN=0.5"));
  KJ_EXPECT_THROW_MESSAGE("must be increasing", parseConfig(
      "FUEL_WARNING_THRESHOLD=0.95\n"
      "FUEL_CRITICAL_THRESHOLD=0.9\n"));
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", parseConfig("NO_EQUALS_SIGN"));
}

KJ_TEST("parseConfig: unknown options are ignored") {
  KJ_EXPECT_LOG(WARNING, "Ignoring unrecognized config option");
  auto config = parseConfig("SOME_FUTURE_OPTION=1\nMAX_SESSIONS_PER_CLIENT=7\n");
  KJ_EXPECT(config.maxSessionsPerClient == 7);
}

}  // namespace
}  // namespace guestbox
