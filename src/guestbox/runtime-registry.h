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


#ifndef GUESTBOX_RUNTIME_REGISTRY_H_
#define GUESTBOX_RUNTIME_REGISTRY_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/memory.h>
#include <map>

namespace guestbox {

struct RuntimeImage {
  // A loaded guest-runtime image. Immutable once loaded.

  kj::String language;
  kj::String version;
  kj::Array<kj::String> capabilities;

  kj::String directory;
  // Host path of the image directory. Mapped at /runtime in the guest.

  kj::String hostEntryPoint;
  kj::String guestEntryPoint;
  // The same file, seen from the host and from inside the guest.

  kj::Array<kj::String> argv;
  // Template; see expandArgv().

  kj::Array<kj::String> environ;
  // "KEY=VALUE" strings.

  kj::String payloadFile;

  kj::Array<kj::String> expandArgv(kj::StringPtr payloadGuestPath,
                                   kj::StringPtr workdirGuestPath) const;
  // Substitute "{payload}" and "{workdir}" in the argv template.
};

class RuntimeRegistry {
  // Holds one image per supported language. Images are loaded during startup and the registry is
  // then sealed; afterwards it is only read, so sharing it requires no locking.

public:
  explicit RuntimeRegistry(kj::StringPtr runtimeDir);
  KJ_DISALLOW_COPY(RuntimeRegistry);

  const RuntimeImage& load(kj::StringPtr language);
  // Load the image for `language` from <runtimeDir>/<language>/runtime.json. Throws
  // UnsupportedLanguage if there is no such manifest. A manifest that exists but is broken is a
  // configuration error. Loading an already-loaded language returns the existing image.

  void loadAll();
  // Load every subdirectory of the runtime directory that contains a runtime.json.

  const RuntimeImage& get(kj::StringPtr language) const;
  // Throws UnsupportedLanguage if no manifest exists for `language`, or RuntimeNotLoaded if one
  // does but it was never loaded.

  kj::Maybe<const RuntimeImage&> find(kj::StringPtr language) const;

  kj::Array<const RuntimeImage*> list() const;
  // In language order.

  void seal();
  bool isSealed() const { return sealed; }

private:
  kj::String runtimeDir;
  std::map<kj::StringPtr, kj::Own<RuntimeImage>> images;
  bool sealed = false;

  bool hasManifest(kj::StringPtr language) const;
};

}  // namespace guestbox

#endif // GUESTBOX_RUNTIME_REGISTRY_H_
