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


#ifndef GUESTBOX_CODE_WRAPPER_H_
#define GUESTBOX_CODE_WRAPPER_H_

#include <kj/string.h>
#include <guestbox/session.capnp.h>

namespace guestbox {

class CodeWrapper {
  // Turns user code into the payload a guest interpreter actually runs: a prologue that restores
  // the session's persisted state and makes the vendored helpers importable, the user's code,
  // and an epilogue that saves the state again.
  //
  // State lives in STATE_FILE in the working directory as a JSON object. For Python the object
  // is merged into the module globals; for JavaScript it becomes the global `_state`. Values
  // that JSON can't represent are dropped on save. A state file that can't be parsed yields an
  // empty state and a "StatePersistenceCorrupt:" line on stderr, never a failed execution.

public:
  static constexpr const char* STATE_FILE = ".session_state.json";
  static constexpr const char* STATE_TEMP_FILE = ".session_state.json.tmp";

  CodeWrapper(kj::StringPtr workdirGuestPath, kj::StringPtr helperGuestPath);

  kj::String wrap(kj::StringPtr userCode, SessionRecord::Reader session) const;
  // Languages without a known wrapper get their code back unchanged.

  kj::String wrap(kj::StringPtr language, kj::StringPtr userCode, bool autoPersist) const;

  void writePayload(int workdirFd, kj::StringPtr payloadFile, kj::StringPtr payload) const;
  // Replace whatever is at `payloadFile` in the working directory, without following symlinks
  // the guest may have left there.

  static bool isReservedFile(kj::StringPtr name);
  // Files in the working directory that belong to the engine rather than to the user.

private:
  kj::String statePath;
  kj::String stateTempPath;
  kj::String helperGuestPath;

  kj::String wrapPython(kj::StringPtr userCode, bool autoPersist) const;
  kj::String wrapJavascript(kj::StringPtr userCode, bool autoPersist) const;
};

}  // namespace guestbox

#endif // GUESTBOX_CODE_WRAPPER_H_
