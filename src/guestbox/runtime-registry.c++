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


#include "runtime-registry.h"
#include "result.h"
#include "session-id.h"
#include "util.h"
#include <guestbox/runtime.capnp.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include <kj/debug.h>
#include <unistd.h>

namespace guestbox {

kj::Array<kj::String> RuntimeImage::expandArgv(kj::StringPtr payloadGuestPath,
                                               kj::StringPtr workdirGuestPath) const {
  return KJ_MAP(arg, argv) -> kj::String {
    if (arg == "{payload}") {
      return kj::heapString(payloadGuestPath);
    } else if (arg == "{workdir}") {
      return kj::heapString(workdirGuestPath);
    } else {
      return kj::heapString(arg);
    }
  };
}

RuntimeRegistry::RuntimeRegistry(kj::StringPtr runtimeDir)
    : runtimeDir(kj::heapString(runtimeDir)) {}

bool RuntimeRegistry::hasManifest(kj::StringPtr language) const {
  // Language names double as directory names, so they obey the same rules as session ids.
  return isValidSessionId(language) &&
      access(kj::str(runtimeDir, '/', language, "/runtime.json").cStr(), F_OK) == 0;
}

const RuntimeImage& RuntimeRegistry::load(kj::StringPtr language) {
  KJ_REQUIRE(!sealed, "runtime registry is sealed; images can only be loaded at startup");

  auto iter = images.find(language);
  if (iter != images.end()) {
    return *iter->second;
  }

  if (!hasManifest(language)) {
    throwEngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
        kj::str("no runtime image for language '", language, "'"));
  }

  auto directory = kj::str(runtimeDir, '/', language);
  auto manifestPath = kj::str(directory, "/runtime.json");

  capnp::MallocMessageBuilder message;
  auto manifest = message.initRoot<RuntimeManifest>();
  {
    capnp::JsonCodec json;
    auto text = readAll(manifestPath);
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      json.decode(text, manifest);
    })) {
      KJ_FAIL_REQUIRE("runtime manifest is not valid", manifestPath, *exception);
    }
  }

  KJ_REQUIRE(manifest.getLanguage() == language,
             "runtime manifest names a different language than its directory",
             manifestPath, manifest.getLanguage());
  KJ_REQUIRE(manifest.getArgv().size() > 0, "runtime manifest has empty argv", manifestPath);

  auto image = kj::heap<RuntimeImage>();
  image->language = kj::heapString(language);
  image->version = kj::heapString(manifest.getVersion());
  image->capabilities = KJ_MAP(c, manifest.getCapabilities()) { return kj::heapString(c); };
  image->directory = kj::mv(directory);
  image->argv = KJ_MAP(a, manifest.getArgv()) { return kj::heapString(a); };
  image->environ = KJ_MAP(e, manifest.getEnviron()) {
    KJ_REQUIRE(e.getKey().size() > 0 && e.getKey().findFirst('=') == nullptr,
               "invalid environment variable name in runtime manifest", e.getKey());
    return kj::str(e.getKey(), '=', e.getValue());
  };

  image->payloadFile = kj::heapString(manifest.getPayloadFile());
  KJ_REQUIRE(image->payloadFile.size() > 0 && image->payloadFile.findFirst('/') == nullptr &&
             !image->payloadFile.startsWith("."),
             "invalid payload file name in runtime manifest", image->payloadFile);

  kj::StringPtr entryPoint = manifest.getEntryPoint();
  KJ_REQUIRE(entryPoint.size() > 0, "runtime manifest has no entry point", manifestPath);
  KJ_REQUIRE(!entryPoint.startsWith("/"),
             "entry point must be a path inside the image directory", entryPoint);
  for (auto part: split(entryPoint, '/')) {
    KJ_REQUIRE(part.size() > 0 && !(part.size() == 1 && part[0] == '.') &&
               !(part.size() == 2 && part[0] == '.' && part[1] == '.'),
               "entry point must be a normalized relative path", entryPoint);
  }
  image->hostEntryPoint = kj::str(image->directory, '/', entryPoint);
  image->guestEntryPoint = kj::str("/runtime/", entryPoint);
  KJ_REQUIRE(access(image->hostEntryPoint.cStr(), X_OK) == 0,
             "runtime entry point is not executable", image->hostEntryPoint);

  KJ_LOG(INFO, "loaded runtime image", image->language, image->version, image->directory);

  auto& result = *image;
  images.insert(std::make_pair(result.language.asPtr(), kj::mv(image)));
  return result;
}

void RuntimeRegistry::loadAll() {
  for (auto& name: listDirectory(runtimeDir)) {
    if (hasManifest(name)) {
      load(name);
    }
  }
}

const RuntimeImage& RuntimeRegistry::get(kj::StringPtr language) const {
  KJ_IF_MAYBE(image, find(language)) {
    return *image;
  } else if (hasManifest(language)) {
    throwEngineError(ErrorKind::RUNTIME_NOT_LOADED,
        kj::str("runtime image for '", language, "' was not loaded at startup"));
  } else {
    throwEngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
        kj::str("no runtime image for language '", language, "'"));
  }
}

kj::Maybe<const RuntimeImage&> RuntimeRegistry::find(kj::StringPtr language) const {
  auto iter = images.find(language);
  if (iter == images.end()) {
    return nullptr;
  } else {
    return *iter->second;
  }
}

kj::Array<const RuntimeImage*> RuntimeRegistry::list() const {
  auto result = kj::heapArrayBuilder<const RuntimeImage*>(images.size());
  for (auto& entry: images) {
    result.add(entry.second.get());
  }
  return result.finish();
}

void RuntimeRegistry::seal() {
  sealed = true;
}

}  // namespace guestbox
