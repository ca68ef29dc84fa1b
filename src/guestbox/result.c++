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


#include "result.h"
#include <kj/debug.h>

namespace guestbox {

static constexpr const char* ERROR_KIND_NAMES[] = {
  "UnsupportedLanguage",
  "RuntimeNotLoaded",
  "OutOfFuel",
  "MemoryExhausted",
  "Timeout",
  "PathRestriction",
  "MissingHelperLibrary",
  "StatePersistenceCorrupt",
  "SessionBusy",
  "SessionLimitExceeded",
  "GuestRuntimeError",
  "SessionNotFound",
  "InvalidRequest",
};

kj::StringPtr errorKindName(ErrorKind kind) {
  return ERROR_KIND_NAMES[static_cast<size_t>(kind)];
}

kj::Maybe<ErrorKind> errorKindFromName(kj::StringPtr name) {
  for (size_t i = 0; i < kj::size(ERROR_KIND_NAMES); i++) {
    if (name == ERROR_KIND_NAMES[i]) {
      return static_cast<ErrorKind>(i);
    }
  }
  return nullptr;
}

void throwEngineError(ErrorKind kind, kj::StringPtr message) {
  auto type = kind == ErrorKind::SESSION_BUSY || kind == ErrorKind::SESSION_LIMIT_EXCEEDED
      ? kj::Exception::Type::OVERLOADED : kj::Exception::Type::FAILED;
  kj::throwFatalException(kj::Exception(type, __FILE__, __LINE__,
      kj::str(errorKindName(kind), ": ", message)));
}

kj::Maybe<ErrorKind> errorKindFromException(const kj::Exception& exception) {
  kj::StringPtr description = exception.getDescription();

  // Cap'n Proto RPC prefixes exceptions that crossed the wire.
  kj::StringPtr REMOTE_PREFIX = "remote exception: ";
  if (description.startsWith(REMOTE_PREFIX)) {
    description = description.slice(REMOTE_PREFIX.size());
  }

  KJ_IF_MAYBE(colon, description.findFirst(':')) {
    return errorKindFromName(kj::heapString(description.slice(0, *colon)));
  } else {
    return nullptr;
  }
}

ExecutionLimits LimitOverrides::applyTo(ExecutionLimits limits) const {
  KJ_IF_MAYBE(f, fuel) limits.fuel = *f;
  KJ_IF_MAYBE(m, memoryBytes) limits.memoryBytes = *m;
  KJ_IF_MAYBE(t, timeoutMs) limits.timeoutMs = *t;
  return limits;
}

}  // namespace guestbox
