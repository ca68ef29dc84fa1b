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
#include <kj/debug.h>
#include <sodium/randombytes.h>

namespace guestbox {

static constexpr char BASE32_ENCODE_TABLE[] = "0123456789acdefghjkmnpqrstuvwxyz";

kj::String base32Encode(kj::ArrayPtr<const kj::byte> data) {
  // We'll need a character for every 5 bits, rounded up.
  auto result = kj::heapString((data.size() * 8 + 4) / 5);

  size_t count = 0;
  if (data.size() > 0) {
    unsigned buffer = data[0];
    size_t next = 1;
    unsigned bitsLeft = 8;
    while (bitsLeft > 0 || next < data.size()) {
      if (bitsLeft < 5) {
        if (next < data.size()) {
          buffer <<= 8;
          buffer |= data[next++] & 0xFF;
          bitsLeft += 8;
        } else {
          // No more input; pad with zeros.
          unsigned pad = 5 - bitsLeft;
          buffer <<= pad;
          bitsLeft += pad;
        }
      }
      unsigned index = 0x1F & (buffer >> (bitsLeft - 5));
      bitsLeft -= 5;
      KJ_ASSERT(count < result.size());
      result[count++] = BASE32_ENCODE_TABLE[index];
    }
  }

  return result;
}

static kj::String randomId(size_t byteCount) {
  KJ_STACK_ARRAY(kj::byte, bytes, byteCount, 32, 32);
  randombytes_buf(bytes.begin(), bytes.size());
  return base32Encode(bytes);
}

kj::String randomSessionId() {
  return randomId(16);
}

kj::String randomBootId() {
  return randomId(10);
}

bool isValidSessionId(kj::StringPtr id) {
  if (id.size() == 0 || id.size() > 64) return false;
  for (char c: id) {
    if (!(('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9') ||
          c == '_' || c == '-')) {
      return false;
    }
  }
  return true;
}

}  // namespace guestbox
