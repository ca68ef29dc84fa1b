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

#include "session-id.h"
#include <kj/test.h>
#include <set>

namespace guestbox {
namespace {

KJ_TEST("base32Encode") {
  KJ_EXPECT(base32Encode(nullptr) == "");

  kj::byte zero[] = { 0x00 };
  KJ_EXPECT(base32Encode(zero) == "00");

  kj::byte ones[] = { 0xff };
  KJ_EXPECT(base32Encode(ones) == "zw");

  kj::byte five[] = { 0xff, 0xff, 0xff, 0xff, 0xff };
  KJ_EXPECT(base32Encode(five) == "zzzzzzzz");
}

KJ_TEST("randomSessionId") {
  std::set<kj::String> seen;
  for (uint i = 0; i < 100; i++) {
    auto id = randomSessionId();
    KJ_EXPECT(id.size() == 26);
    KJ_EXPECT(isValidSessionId(id), id);
    KJ_EXPECT(seen.insert(kj::mv(id)).second);
  }

  KJ_EXPECT(randomBootId().size() == 16);
}

KJ_TEST("isValidSessionId") {
  KJ_EXPECT(isValidSessionId("my-session_01"));
  KJ_EXPECT(isValidSessionId("A"));
  KJ_EXPECT(isValidSessionId(kj::str(kj::repeat('x', 64))));

  KJ_EXPECT(!isValidSessionId(""));
  KJ_EXPECT(!isValidSessionId(kj::str(kj::repeat('x', 65))));
  KJ_EXPECT(!isValidSessionId("../etc"));
  KJ_EXPECT(!isValidSessionId("a/b"));
  KJ_EXPECT(!isValidSessionId("a.b"));
  KJ_EXPECT(!isValidSessionId("with space"));
}

}  // namespace
}  // namespace guestbox
