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
#include <kj/test.h>

namespace guestbox {
namespace {

KJ_TEST("error kinds round-trip through exceptions") {
  auto maybeException = kj::runCatchingExceptions([]() {
    throwEngineError(ErrorKind::SESSION_NOT_FOUND, "no session 'abc'");
  });
  auto& exception = KJ_ASSERT_NONNULL(maybeException);
  KJ_EXPECT(exception.getDescription() == "SessionNotFound: no session 'abc'");
  KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(KJ_ASSERT_NONNULL(errorKindFromException(exception)) ==
            ErrorKind::SESSION_NOT_FOUND);

  // Callers may retry these later.
  auto maybeBusy = kj::runCatchingExceptions([]() {
    throwEngineError(ErrorKind::SESSION_BUSY, "session is running");
  });
  auto& busy = KJ_ASSERT_NONNULL(maybeBusy);
  KJ_EXPECT(busy.getType() == kj::Exception::Type::OVERLOADED);

  // As seen by an RPC client.
  kj::Exception remote(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str("remote exception: PathRestriction: nope"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(errorKindFromException(remote)) == ErrorKind::PATH_RESTRICTION);

  kj::Exception other(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                      kj::str("something: else"));
  KJ_EXPECT(errorKindFromException(other) == nullptr);
}

KJ_TEST("errorKindName") {
  KJ_EXPECT(errorKindName(ErrorKind::UNSUPPORTED_LANGUAGE) == "UnsupportedLanguage");
  KJ_EXPECT(errorKindName(ErrorKind::INVALID_REQUEST) == "InvalidRequest");
  KJ_EXPECT(KJ_ASSERT_NONNULL(errorKindFromName("OutOfFuel")) == ErrorKind::OUT_OF_FUEL);
  KJ_EXPECT(errorKindFromName("NoSuchKind") == nullptr);
}

KJ_TEST("LimitOverrides") {
  ExecutionLimits defaults = { 100, 200, 300 };

  LimitOverrides none;
  auto same = none.applyTo(defaults);
  KJ_EXPECT(same.fuel == 100);
  KJ_EXPECT(same.memoryBytes == 200);
  KJ_EXPECT(same.timeoutMs == 300);

  LimitOverrides some;
  some.fuel = uint64_t(5);
  some.timeoutMs = uint64_t(7);
  auto applied = some.applyTo(defaults);
  KJ_EXPECT(applied.fuel == 5);
  KJ_EXPECT(applied.memoryBytes == 200);
  KJ_EXPECT(applied.timeoutMs == 7);
}

}  // namespace
}  // namespace guestbox
