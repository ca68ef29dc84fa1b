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


#ifndef GUESTBOX_FUEL_METER_H_
#define GUESTBOX_FUEL_METER_H_

#include <kj/memory.h>
#include <sys/types.h>
#include <inttypes.h>
#include "config.h"

namespace guestbox {

class FuelMeter {
  // Measures the fuel a guest has consumed. One per execution, attached to the guest before it
  // execs the interpreter.

public:
  virtual ~FuelMeter() noexcept(false);

  virtual uint64_t sample() = 0;
  // Fuel consumed so far. Never decreases.

  virtual uint64_t finish(uint64_t guestCpuTimeNs) = 0;
  // The final reading, taken after the guest has been reaped. `guestCpuTimeNs` is the guest's
  // total CPU time as reported by wait4().
};

class FuelMeterFactory {
public:
  FuelMeterFactory(FuelMeterKind kind, double cpuFuelPerNanosecond);
  KJ_DISALLOW_COPY(FuelMeterFactory);

  kj::Maybe<kj::Own<FuelMeter>> attach(pid_t pid);
  // Returns null if no meter could be attached, in which case the execution is unmetered. With
  // FuelMeterKind::INSTRUCTIONS, failing to open the counter throws instead.

private:
  FuelMeterKind kind;
  double cpuFuelPerNanosecond;
  bool instructionCounterUnavailable = false;
};

}  // namespace guestbox

#endif // GUESTBOX_FUEL_METER_H_
