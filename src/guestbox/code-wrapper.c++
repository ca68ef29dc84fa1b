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


#include "code-wrapper.h"
#include "util.h"
#include <kj/debug.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>

namespace guestbox {

CodeWrapper::CodeWrapper(kj::StringPtr workdirGuestPath, kj::StringPtr helperGuestPath)
    : statePath(kj::str(workdirGuestPath, '/', STATE_FILE)),
      stateTempPath(kj::str(workdirGuestPath, '/', STATE_TEMP_FILE)),
      helperGuestPath(kj::heapString(helperGuestPath)) {}

bool CodeWrapper::isReservedFile(kj::StringPtr name) {
  return name == STATE_FILE || name == STATE_TEMP_FILE;
}

kj::String CodeWrapper::wrap(kj::StringPtr userCode, SessionRecord::Reader session) const {
  return wrap(session.getLanguage(), userCode, session.getAutoPersist());
}

kj::String CodeWrapper::wrap(
    kj::StringPtr language, kj::StringPtr userCode, bool autoPersist) const {
  if (language == "python") {
    return wrapPython(userCode, autoPersist);
  } else if (language == "javascript") {
    return wrapJavascript(userCode, autoPersist);
  } else {
    return kj::heapString(userCode);
  }
}

// -------------------------------------------------------------------
// Python
//
// Helper names all start with an underscore, which the save filter skips, so they never end up
// in the persisted state.

kj::String CodeWrapper::wrapPython(kj::StringPtr userCode, bool autoPersist) const {
  auto helpers = kj::str(
      "import sys as _guestbox_sys\n"
      "if '", helperGuestPath, "/python' not in _guestbox_sys.path:\n"
      "    _guestbox_sys.path.insert(0, '", helperGuestPath, "/python')\n");

  if (!autoPersist) {
    return kj::str(helpers, userCode, '\n');
  }

  auto prologue = kj::str(
      "def _guestbox_load_state():\n"
      "    import json\n"
      "    try:\n"
      "        with open('", statePath, "', 'r', encoding='utf-8') as f:\n"
      "            state = json.load(f)\n"
      "        if not isinstance(state, dict):\n"
      "            raise ValueError('expected a JSON object, got %s' % type(state).__name__)\n"
      "    except FileNotFoundError:\n"
      "        return\n"
      "    except Exception as e:\n"
      "        print('StatePersistenceCorrupt: could not parse session state (%s); '\n"
      "              'starting with empty state' % e, file=_guestbox_sys.stderr)\n"
      "        return\n"
      "    globals().update(state)\n"
      "_guestbox_load_state()\n"
      "del _guestbox_load_state\n");

  auto epilogue = kj::str(
      "def _guestbox_save_state():\n"
      "    import json, math, os, types\n"
      "    def clean(value, ancestors):\n"
      "        if value is None or isinstance(value, (bool, str, int)):\n"
      "            return True, value\n"
      "        if isinstance(value, float):\n"
      "            return math.isfinite(value), value\n"
      "        if isinstance(value, (list, tuple, dict)):\n"
      "            if id(value) in ancestors:\n"
      "                return False, None\n"
      "            ancestors.add(id(value))\n"
      "            if isinstance(value, dict):\n"
      "                result = {}\n"
      "                for k, v in value.items():\n"
      "                    if isinstance(k, str):\n"
      "                        ok, v = clean(v, ancestors)\n"
      "                        if ok:\n"
      "                            result[k] = v\n"
      "            else:\n"
      "                result = []\n"
      "                for v in value:\n"
      "                    ok, v = clean(v, ancestors)\n"
      "                    if ok:\n"
      "                        result.append(v)\n"
      "            ancestors.discard(id(value))\n"
      "            return True, result\n"
      "        return False, None\n"
      "    try:\n"
      "        state = {}\n"
      "        for name, value in list(globals().items()):\n"
      "            if name.startswith('_') or callable(value) or "
                        "isinstance(value, types.ModuleType):\n"
      "                continue\n"
      "            ok, value = clean(value, set())\n"
      "            if ok:\n"
      "                state[name] = value\n"
      "        with open('", stateTempPath, "', 'w', encoding='utf-8') as f:\n"
      "            json.dump(state, f, sort_keys=True)\n"
      "        os.replace('", stateTempPath, "', '", statePath, "')\n"
      "    except Exception as e:\n"
      "        print('StatePersistenceCorrupt: could not save session state (%s)' % e,\n"
      "              file=_guestbox_sys.stderr)\n"
      "_guestbox_save_state()\n");

  return kj::str(helpers, prologue, "\n", userCode, "\n\n", epilogue);
}

// -------------------------------------------------------------------
// JavaScript (QuickJS, run with --std so that `std` and `os` are globals)

kj::String CodeWrapper::wrapJavascript(kj::StringPtr userCode, bool autoPersist) const {
  // Defined only if absent, so user code that defines its own requireVendor (function
  // declarations are hoisted above the prologue) keeps it.
  auto helpers = kj::str(
      "if (typeof globalThis.requireVendor !== 'function') {\n"
      "  globalThis.requireVendor = (function () {\n"
      "    var cache = {};\n"
      "    return function requireVendor(name) {\n"
      "      name = String(name);\n"
      "      if (Object.prototype.hasOwnProperty.call(cache, name)) return cache[name];\n"
      "      var source = /^[A-Za-z0-9_][A-Za-z0-9_.-]*$/.test(name)\n"
      "          ? std.loadFile('", helperGuestPath, "/javascript/' + name + '.js') : null;\n"
      "      if (source === null) {\n"
      "        throw new Error(\"MissingHelperLibrary: no vendored helper named '\" + name + \"'\");\n"
      "      }\n"
      "      var module = { exports: {} };\n"
      "      (new Function('module', 'exports', source))(module, module.exports);\n"
      "      cache[name] = module.exports;\n"
      "      return module.exports;\n"
      "    };\n"
      "  })();\n"
      "}\n");

  if (!autoPersist) {
    return kj::str(helpers, userCode, '\n');
  }

  auto prologue = kj::str(
      "var _state = {};\n"
      "(function () {\n"
      "  var text = std.loadFile('", statePath, "');\n"
      "  if (text === null) return;\n"
      "  try {\n"
      "    var parsed = JSON.parse(text);\n"
      "    if (parsed === null || typeof parsed !== 'object' || Array.isArray(parsed)) {\n"
      "      throw new Error('expected a JSON object');\n"
      "    }\n"
      "    _state = parsed;\n"
      "  } catch (e) {\n"
      "    std.err.puts('StatePersistenceCorrupt: could not parse session state (' +\n"
      "                 e.message + '); starting with empty state\\n');\n"
      "  }\n"
      "})();\n");

  auto epilogue = kj::str(
      "(function () {\n"
      "  function clean(value, ancestors) {\n"
      "    if (value === null || typeof value === 'boolean' || typeof value === 'string') {\n"
      "      return { ok: true, value: value };\n"
      "    }\n"
      "    if (typeof value === 'number') return { ok: isFinite(value), value: value };\n"
      "    if (typeof value !== 'object') return { ok: false };\n"
      "    if (ancestors.indexOf(value) >= 0) return { ok: false };\n"
      "    var result;\n"
      "    ancestors.push(value);\n"
      "    if (Array.isArray(value)) {\n"
      "      result = [];\n"
      "      for (var i = 0; i < value.length; i++) {\n"
      "        var item = clean(value[i], ancestors);\n"
      "        if (item.ok) result.push(item.value);\n"
      "      }\n"
      "    } else {\n"
      "      var proto = Object.getPrototypeOf(value);\n"
      "      if (proto !== Object.prototype && proto !== null) {\n"
      "        ancestors.pop();\n"
      "        return { ok: false };\n"
      "      }\n"
      "      result = {};\n"
      "      Object.keys(value).forEach(function (key) {\n"
      "        var member = clean(value[key], ancestors);\n"
      "        if (member.ok) result[key] = member.value;\n"
      "      });\n"
      "    }\n"
      "    ancestors.pop();\n"
      "    return { ok: true, value: result };\n"
      "  }\n"
      "  try {\n"
      "    var cleaned = clean(_state, []);\n"
      "    var state = cleaned.ok && !Array.isArray(cleaned.value) && cleaned.value !== null &&\n"
      "        typeof cleaned.value === 'object' ? cleaned.value : {};\n"
      "    var f = std.open('", stateTempPath, "', 'w');\n"
      "    if (f === null) throw new Error('cannot open state file for writing');\n"
      "    f.puts(JSON.stringify(state));\n"
      "    f.close();\n"
      "    var err = os.rename('", stateTempPath, "', '", statePath, "');\n"
      "    if (err < 0) throw new Error('rename failed with ' + std.strerror(-err));\n"
      "  } catch (e) {\n"
      "    std.err.puts('StatePersistenceCorrupt: could not save session state (' +\n"
      "                 e.message + ')\\n');\n"
      "  }\n"
      "})();\n");

  return kj::str(helpers, prologue, "\n", userCode, "\n;\n", epilogue);
}

// -------------------------------------------------------------------

void CodeWrapper::writePayload(
    int workdirFd, kj::StringPtr payloadFile, kj::StringPtr payload) const {
  KJ_REQUIRE(payloadFile.size() > 0 && payloadFile.findFirst('/') == nullptr,
             "payload file must be a plain name", payloadFile);

  // The guest may have replaced the file with a symlink or a directory. Remove whatever is
  // there and create it afresh.
  struct stat stats;
  bool exists = true;
  KJ_SYSCALL_HANDLE_ERRORS(fstatat(workdirFd, payloadFile.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
    case ENOENT:
      exists = false;
      break;
    default:
      KJ_FAIL_SYSCALL("fstatat()", error, payloadFile);
  }
  if (exists) {
    recursivelyDeleteAt(workdirFd, payloadFile);
  }

  auto fd = raiiOpenAt(workdirFd, payloadFile,
                       O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644);
  kj::FdOutputStream(fd.get()).write(payload.begin(), payload.size());
}

}  // namespace guestbox
