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


#ifndef GUESTBOX_SESSION_ID_H_
#define GUESTBOX_SESSION_ID_H_

#include <kj/string.h>
#include <kj/array.h>

namespace guestbox {

kj::String base32Encode(kj::ArrayPtr<const kj::byte> data);
// Lower-case base32 with Douglas Crockford's alphabet.

kj::String randomSessionId();
// 128 random bits, base32-encoded (26 characters).

kj::String randomBootId();
// Identifies this process in the owner key of single-stream sessions.

bool isValidSessionId(kj::StringPtr id);
// Caller-supplied ids must be 1 to 64 characters from [A-Za-z0-9_-]. Ids can therefore be used
// directly as file names.

}  // namespace guestbox

#endif // GUESTBOX_SESSION_ID_H_
