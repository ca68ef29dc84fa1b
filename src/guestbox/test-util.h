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

#ifndef GUESTBOX_TEST_UTIL_H_
#define GUESTBOX_TEST_UTIL_H_
// Helpers shared by the tests.

#include <kj/test.h>
#include <kj/function.h>
#include <stdlib.h>
#include "result.h"
#include "util.h"

namespace guestbox {

class TempDir {
  // A directory under /tmp, deleted with everything in it when this goes out of scope.

public:
  TempDir() {
    char path[] = "/tmp/guestbox-test.XXXXXX";
    if (mkdtemp(path) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp", errno, path);
    }
    this->path = kj::heapString(path);
  }
  ~TempDir() noexcept(false) {
    recursivelyDelete(path);
  }
  KJ_DISALLOW_COPY(TempDir);

  kj::StringPtr get() const { return path; }
  kj::String operator/(kj::StringPtr name) const { return kj::str(path, '/', name); }

private:
  kj::String path;
};

inline void expectEngineError(ErrorKind kind, kj::Function<void()> func) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions(kj::mv(func))) {
    KJ_IF_MAYBE(actual, errorKindFromException(*exception)) {
      KJ_EXPECT(*actual == kind, errorKindName(kind), exception->getDescription());
    } else {
      KJ_FAIL_EXPECT("not an engine error", errorKindName(kind), exception->getDescription());
    }
  } else {
    KJ_FAIL_EXPECT("expected an engine error", errorKindName(kind));
  }
}

inline kj::String bytesToString(kj::ArrayPtr<const byte> bytes) {
  return kj::heapString(reinterpret_cast<const char*>(bytes.begin()), bytes.size());
}

}  // namespace guestbox

#endif // GUESTBOX_TEST_UTIL_H_
