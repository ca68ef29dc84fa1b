#ifndef GUESTBOX_CONFIG_H_
#define GUESTBOX_CONFIG_H_

#include <kj/string.h>
#include "result.h"
#include "classifier.h"

namespace guestbox {

enum class BindingStrategy {
  SINGLE_STREAM,
  // One process-lifetime owner for every binding.
  MULTIPLEXED
  // One owner per externally supplied session token.
};

enum class FuelMeterKind {
  AUTO,
  // Count instructions when the hardware counter is available, otherwise CPU time.
  INSTRUCTIONS,
  CPU_TIME
};

struct EngineConfig {
  kj::String storageDir = kj::str("/var/lib/guestbox");
  kj::String runtimeDir = kj::str("/usr/lib/guestbox/runtimes");
  kj::Maybe<kj::String> helperDir = nullptr;
  kj::Maybe<kj::String> externalDir = nullptr;

  BindingStrategy binding = BindingStrategy::MULTIPLEXED;
  uint64_t sessionTimeoutMs = 600 * 1000;
  uint64_t cleanupIntervalMs = 300 * 1000;
  uint maxSessionsPerClient = 5;

  ExecutionLimits defaultLimits = { 2000000000ull, 128000000ull, 30 * 1000 };
  OutputCaps outputCaps = { 2000000, 1000000 };
  bool autoPersistDefault = true;

  FuelMeterKind fuelMeter = FuelMeterKind::AUTO;
  double cpuFuelPerNanosecond = 1;
  uint fuelPollMs = 10;
  kj::Maybe<kj::String> cgroupDir = nullptr;

  uint64_t maxFileBytes = 64000000;
  // Largest file accepted by writeFile, and RLIMIT_FSIZE for guests.

  ClassifierPolicy classifierPolicy;
};

// Read and return the config file from `path`.
EngineConfig readConfig(kj::StringPtr path);

// Same, from the file's text.
EngineConfig parseConfig(kj::StringPtr text);

}  // namespace guestbox

#endif
