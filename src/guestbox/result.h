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


#ifndef GUESTBOX_RESULT_H_
#define GUESTBOX_RESULT_H_
// Value types passed between the engine's components: limits, requests, results, and the
// request-level error taxonomy.

#include <kj/string.h>
#include <kj/array.h>
#include <kj/exception.h>
#include <inttypes.h>

namespace guestbox {

enum class ErrorKind {
  UNSUPPORTED_LANGUAGE,
  RUNTIME_NOT_LOADED,
  OUT_OF_FUEL,
  MEMORY_EXHAUSTED,
  TIMEOUT,
  PATH_RESTRICTION,
  MISSING_HELPER_LIBRARY,
  STATE_PERSISTENCE_CORRUPT,
  SESSION_BUSY,
  SESSION_LIMIT_EXCEEDED,
  GUEST_RUNTIME_ERROR,
  SESSION_NOT_FOUND,
  INVALID_REQUEST
};

kj::StringPtr errorKindName(ErrorKind kind);
// E.g. "OutOfFuel". This is the name reported to callers.

kj::Maybe<ErrorKind> errorKindFromName(kj::StringPtr name);

KJ_NORETURN(void throwEngineError(ErrorKind kind, kj::StringPtr message));
// Throw a request-level error. The exception's description is "<KindName>: <message>", and its
// type is OVERLOADED for SessionBusy and SessionLimitExceeded (the caller may retry later) or
// FAILED otherwise.

kj::Maybe<ErrorKind> errorKindFromException(const kj::Exception& exception);
// Recover the kind of an exception produced by throwEngineError(), including after it has
// passed over RPC. Returns null for any other exception.

enum class TrapKind {
  NONE,
  OUT_OF_FUEL,
  MEMORY_LIMIT,
  TIMEOUT,
  FAULT
};

struct ExecutionLimits {
  uint64_t fuel;
  uint64_t memoryBytes;
  uint64_t timeoutMs;
};

struct LimitOverrides {
  kj::Maybe<uint64_t> fuel;
  kj::Maybe<uint64_t> memoryBytes;
  kj::Maybe<uint64_t> timeoutMs;

  ExecutionLimits applyTo(ExecutionLimits limits) const;
  // Replace the fields of `limits` that are overridden.
};

struct OutputCaps {
  size_t stdoutMaxBytes;
  size_t stderrMaxBytes;
};

struct ExecutionRequest {
  kj::String language;
  kj::String code;
  kj::Maybe<kj::String> sessionId;
  // Null means the binding's default session.

  LimitOverrides limits;
  kj::Maybe<uint64_t> timeoutMs;
  // Takes precedence over `limits.timeoutMs`.
};

struct CodeExample {
  kj::String before;
  kj::String after;
  kj::String explanation;
};

struct ErrorReport {
  ErrorKind kind;
  kj::String message;
  kj::Array<kj::String> remediation;
  kj::Array<CodeExample> codeExamples;
  kj::Array<kj::String> docs;
};

struct FuelAnalysis {
  uint64_t consumed;
  uint64_t budget;
  double utilizationPercent;
  kj::String status;
  kj::String recommendation;
  kj::Array<kj::String> likelyCauses;
};

struct ExecutionResult {
  bool success = false;
  kj::String stdoutText;
  kj::String stderrText;
  int exitCode = 0;
  uint64_t durationMs = 0;

  uint64_t fuelConsumed = 0;
  uint64_t fuelBudget = 0;
  bool fuelMetered = false;
  // If false, `fuelConsumed` is meaningless and the fuel analysis reports "unknown".

  TrapKind trap = TrapKind::NONE;
  kj::String trapReason;

  bool stdoutTruncated = false;
  bool stderrTruncated = false;
  uint64_t memoryUsedBytes = 0;

  kj::Array<kj::String> filesCreated;
  kj::Array<kj::String> filesModified;
  // Paths relative to the working directory. The engine's own files are never listed.

  kj::String sessionId;
  kj::String language;

  kj::Maybe<ErrorReport> errorGuidance;
  kj::Maybe<FuelAnalysis> fuelAnalysis;
  // Attached by the classifier.
};

}  // namespace guestbox

#endif // GUESTBOX_RESULT_H_
