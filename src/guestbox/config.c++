#include <kj/debug.h>

#include "util.h"
#include "config.h"

namespace guestbox {

static uint64_t parseUInt64Value(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(n, parseUInt64(value, 10)) {
    return *n;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static uint64_t parsePositiveValue(kj::StringPtr key, kj::StringPtr value) {
  uint64_t result = parseUInt64Value(key, value);
  KJ_REQUIRE(result > 0, "invalid config value", key, value);
  return result;
}

static double parseFraction(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(d, parseDouble(value)) {
    KJ_REQUIRE(*d > 0 && *d <= 1, "invalid config value", key, value);
    return *d;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static double parseMargin(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(d, parseDouble(value)) {
    KJ_REQUIRE(*d >= 1, "invalid config value", key, value);
    return *d;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static bool parseBool(kj::StringPtr key, kj::StringPtr value) {
  if (value == "true" || value == "yes") {
    return true;
  } else if (value == "false" || value == "no") {
    return false;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static kj::String parseDirectory(kj::StringPtr key, kj::String value) {
  KJ_REQUIRE(value.startsWith("/"), "invalid config value; must be an absolute path", key, value);

  // Strip trailing slashes so that paths can be joined with "/" without doubling up.
  size_t desiredLength = value.size();
  while (desiredLength > 1 && value[desiredLength - 1] == '/') {
    desiredLength -= 1;
  }
  return kj::str(value.slice(0, desiredLength));
}

EngineConfig parseConfig(kj::StringPtr text) {
  EngineConfig config;

  auto lines = splitLines(text);
  for (auto& line: lines) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "STORAGE_DIR") {
      config.storageDir = parseDirectory(key, kj::mv(value));
    } else if (key == "RUNTIME_DIR") {
      config.runtimeDir = parseDirectory(key, kj::mv(value));
    } else if (key == "HELPER_DIR") {
      config.helperDir = parseDirectory(key, kj::mv(value));
    } else if (key == "EXTERNAL_DIR") {
      config.externalDir = parseDirectory(key, kj::mv(value));
    } else if (key == "CGROUP_DIR") {
      config.cgroupDir = parseDirectory(key, kj::mv(value));
    } else if (key == "BINDING") {
      if (value == "single-stream") {
        config.binding = BindingStrategy::SINGLE_STREAM;
      } else if (value == "multiplexed") {
        config.binding = BindingStrategy::MULTIPLEXED;
      } else {
        KJ_FAIL_REQUIRE("invalid config value BINDING", value);
      }
    } else if (key == "SESSION_TIMEOUT_SECONDS") {
      config.sessionTimeoutMs = parsePositiveValue(key, value) * 1000;
    } else if (key == "CLEANUP_INTERVAL_SECONDS") {
      config.cleanupIntervalMs = parsePositiveValue(key, value) * 1000;
    } else if (key == "MAX_SESSIONS_PER_CLIENT") {
      config.maxSessionsPerClient = parsePositiveValue(key, value);
    } else if (key == "DEFAULT_FUEL") {
      config.defaultLimits.fuel = parsePositiveValue(key, value);
    } else if (key == "DEFAULT_MEMORY_BYTES") {
      config.defaultLimits.memoryBytes = parsePositiveValue(key, value);
    } else if (key == "DEFAULT_TIMEOUT_SECONDS") {
      config.defaultLimits.timeoutMs = parsePositiveValue(key, value) * 1000;
    } else if (key == "STDOUT_MAX_BYTES") {
      config.outputCaps.stdoutMaxBytes = parsePositiveValue(key, value);
    } else if (key == "STDERR_MAX_BYTES") {
      config.outputCaps.stderrMaxBytes = parsePositiveValue(key, value);
    } else if (key == "AUTO_PERSIST_DEFAULT") {
      config.autoPersistDefault = parseBool(key, value);
    } else if (key == "FUEL_METER") {
      if (value == "auto") {
        config.fuelMeter = FuelMeterKind::AUTO;
      } else if (value == "instructions") {
        config.fuelMeter = FuelMeterKind::INSTRUCTIONS;
      } else if (value == "cputime") {
        config.fuelMeter = FuelMeterKind::CPU_TIME;
      } else {
        KJ_FAIL_REQUIRE("invalid config value FUEL_METER", value);
      }
    } else if (key == "CPU_FUEL_PER_NANOSECOND") {
      KJ_IF_MAYBE(d, parseDouble(value)) {
        KJ_REQUIRE(*d > 0, "invalid config value CPU_FUEL_PER_NANOSECOND", value);
        config.cpuFuelPerNanosecond = *d;
      } else {
        KJ_FAIL_REQUIRE("invalid config value CPU_FUEL_PER_NANOSECOND", value);
      }
    } else if (key == "FUEL_POLL_MS") {
      config.fuelPollMs = parsePositiveValue(key, value);
    } else if (key == "MAX_FILE_BYTES") {
      config.maxFileBytes = parsePositiveValue(key, value);
    } else if (key == "FUEL_MODERATE_THRESHOLD") {
      config.classifierPolicy.moderateThreshold = parseFraction(key, value);
    } else if (key == "FUEL_WARNING_THRESHOLD") {
      config.classifierPolicy.warningThreshold = parseFraction(key, value);
    } else if (key == "FUEL_CRITICAL_THRESHOLD") {
      config.classifierPolicy.criticalThreshold = parseFraction(key, value);
    } else if (key == "FUEL_WARNING_MARGIN") {
      config.classifierPolicy.warningMargin = parseMargin(key, value);
    } else if (key == "FUEL_CRITICAL_MARGIN") {
      config.classifierPolicy.criticalMargin = parseMargin(key, value);
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  auto& policy = config.classifierPolicy;
  KJ_REQUIRE(policy.moderateThreshold <= policy.warningThreshold &&
             policy.warningThreshold <= policy.criticalThreshold,
             "FUEL_*_THRESHOLD values must be increasing",
             policy.moderateThreshold, policy.warningThreshold, policy.criticalThreshold);

  return config;
}

EngineConfig readConfig(kj::StringPtr path) {
  return parseConfig(readAll(path));
}

}  // namespace guestbox
