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
#include <kj/test.h>
#include "test-util.h"

namespace guestbox {
namespace {

struct Output {
  kj::String stdoutText;
  kj::String stderrText;
  int status;
};

Output runInterpreter(kj::StringPtr dir, kj::StringPtr fileName, kj::StringPtr payload,
                      kj::ArrayPtr<const kj::StringPtr> command) {
  // Runs `command` followed by the path of the payload, as the sandbox would, but on the host.
  auto path = kj::str(dir, '/', fileName);
  replaceFile(path, payload.asBytes());

  auto argvBuilder = kj::heapArrayBuilder<const char*>(command.size() + 2);
  for (auto& arg: command) {
    argvBuilder.add(arg.cStr());
  }
  argvBuilder.add(path.cStr());
  argvBuilder.add(nullptr);
  auto argv = argvBuilder.finish();

  Pipe out = Pipe::make();
  Pipe err = Pipe::make();
  Subprocess child([&]() -> int {
    KJ_SYSCALL(dup2(out.writeEnd, STDOUT_FILENO));
    KJ_SYSCALL(dup2(err.writeEnd, STDERR_FILENO));
    execv(argv[0], const_cast<char* const*>(argv.begin()));
    return 127;
  }, command[0]);
  out.writeEnd = nullptr;
  err.writeEnd = nullptr;

  Output result;
  result.stdoutText = readAll(out.readEnd);
  result.stderrText = readAll(err.readEnd);
  result.status = child.waitForExit();
  return result;
}

Output runPython(kj::StringPtr dir, kj::StringPtr payload) {
  kj::StringPtr command[] = { "/usr/bin/python3", "-B", "-s" };
  return runInterpreter(dir, "payload.py", payload, command);
}

bool havePython() {
  if (access("/usr/bin/python3", X_OK) == 0) return true;
  KJ_LOG(WARNING, "SKIPPED: python3 not installed");
  return false;
}

kj::Maybe<kj::StringPtr> findQuickJs() {
  for (kj::StringPtr path: { "/usr/bin/qjs", "/usr/local/bin/qjs" }) {
    if (access(path.cStr(), X_OK) == 0) return path;
  }
  KJ_LOG(WARNING, "SKIPPED: QuickJS (qjs) not installed");
  return nullptr;
}

Output runQuickJs(kj::StringPtr qjs, kj::StringPtr dir, kj::StringPtr payload) {
  kj::StringPtr command[] = { qjs, "--std" };
  return runInterpreter(dir, "payload.js", payload, command);
}

KJ_TEST("CodeWrapper: unknown languages pass through") {
  CodeWrapper wrapper("/app", "/data");
  KJ_EXPECT(wrapper.wrap("ruby", "puts 1", true) == "puts 1");
}

KJ_TEST("CodeWrapper: payload structure") {
  CodeWrapper wrapper("/app", "/data");

  auto persisted = wrapper.wrap("python", "x = 1", true);
  KJ_EXPECT(contains(persisted, "/app/.session_state.json"));
  KJ_EXPECT(contains(persisted, "/data/python"));
  KJ_EXPECT(contains(persisted, "\nx = 1\n"));

  auto plain = wrapper.wrap("python", "x = 1", false);
  KJ_EXPECT(!contains(plain, ".session_state.json"));
  KJ_EXPECT(contains(plain, "/data/python"));

  auto js = wrapper.wrap("javascript", "_state.x = 1;", true);
  KJ_EXPECT(contains(js, "std.loadFile('/app/.session_state.json')"));
  KJ_EXPECT(contains(js, "requireVendor"));
  KJ_EXPECT(contains(js, "_state.x = 1;"));
}

KJ_TEST("CodeWrapper: reserved files") {
  KJ_EXPECT(CodeWrapper::isReservedFile(".session_state.json"));
  KJ_EXPECT(CodeWrapper::isReservedFile(".session_state.json.tmp"));
  KJ_EXPECT(!CodeWrapper::isReservedFile("data.json"));
}

KJ_TEST("CodeWrapper: writePayload replaces symlinks and directories") {
  TempDir dir;
  CodeWrapper wrapper("/app", "/data");
  auto dirFd = raiiOpen(dir.get(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);

  auto victim = kj::str(dir.get(), "/victim");
  replaceFile(victim, kj::StringPtr("untouched").asBytes());
  KJ_SYSCALL(symlink(victim.cStr(), kj::str(dir.get(), "/user_code.py").cStr()));

  wrapper.writePayload(dirFd, "user_code.py", "print(1)\n");
  KJ_EXPECT(readAll(victim) == "untouched");
  KJ_EXPECT(readAll(kj::str(dir.get(), "/user_code.py")) == "print(1)\n");

  KJ_SYSCALL(unlink(kj::str(dir.get(), "/user_code.py").cStr()));
  ensureDirectory(kj::str(dir.get(), "/user_code.py"));
  ensureDirectory(kj::str(dir.get(), "/user_code.py/sub"));
  wrapper.writePayload(dirFd, "user_code.py", "print(2)\n");
  KJ_EXPECT(readAll(kj::str(dir.get(), "/user_code.py")) == "print(2)\n");

  KJ_EXPECT_THROW_MESSAGE("plain name", wrapper.writePayload(dirFd, "../escape", ""));
}

KJ_TEST("CodeWrapper: python state persists between runs") {
  if (!havePython()) return;

  TempDir dir;
  CodeWrapper wrapper(dir.get(), "/nonexistent");

  {
    auto output = runPython(dir.get(), wrapper.wrap("python",
        "import os\n"
        "counter = 41\n"
        "names = ['a', 'b']\n"
        "handle = open\n"
        "weird = {1, 2}\n"
        "_private = 'hidden'\n", true));
    KJ_EXPECT(output.status == 0, output.stderrText);
    KJ_EXPECT(output.stderrText == "", output.stderrText);
  }

  auto state = readAll(kj::str(dir.get(), "/.session_state.json"));
  KJ_EXPECT(state == "{\"counter\": 41, \"names\": [\"a\", \"b\"]}", state);

  {
    auto output = runPython(dir.get(), wrapper.wrap("python",
        "counter += 1\n"
        "print(counter, names)\n", true));
    KJ_EXPECT(output.status == 0, output.stderrText);
    KJ_EXPECT(output.stdoutText == "42 ['a', 'b']\n", output.stdoutText);
  }

  // Without persistence, nothing is loaded.
  {
    auto output = runPython(dir.get(), wrapper.wrap("python",
        "print('counter' in globals())\n", false));
    KJ_EXPECT(output.stdoutText == "False\n", output.stdoutText);
  }
}

KJ_TEST("CodeWrapper: corrupt python state starts empty") {
  if (!havePython()) return;

  TempDir dir;
  CodeWrapper wrapper(dir.get(), "/nonexistent");
  replaceFile(kj::str(dir.get(), "/.session_state.json"), kj::StringPtr("{not json").asBytes());

  auto output = runPython(dir.get(), wrapper.wrap("python",
      "print('counter' in globals())\n"
      "counter = 1\n", true));
  KJ_EXPECT(output.status == 0, output.stderrText);
  KJ_EXPECT(output.stdoutText == "False\n", output.stdoutText);
  KJ_EXPECT(output.stderrText.startsWith("StatePersistenceCorrupt:"), output.stderrText);

  // The next save repairs the file.
  KJ_EXPECT(readAll(kj::str(dir.get(), "/.session_state.json")) == "{\"counter\": 1}");
}

KJ_TEST("CodeWrapper: python state survives a failing execution") {
  if (!havePython()) return;

  TempDir dir;
  CodeWrapper wrapper(dir.get(), "/nonexistent");

  auto output = runPython(dir.get(), wrapper.wrap("python", "x = 1\n", true));
  KJ_EXPECT(output.status == 0, output.stderrText);

  output = runPython(dir.get(), wrapper.wrap("python", "x = 2\nraise ValueError('boom')\n", true));
  KJ_EXPECT(output.status != 0);
  KJ_EXPECT(contains(output.stderrText, "ValueError: boom"), output.stderrText);

  // The epilogue never ran, so the last successful state stands.
  KJ_EXPECT(readAll(kj::str(dir.get(), "/.session_state.json")) == "{\"x\": 1}");
}

KJ_TEST("CodeWrapper: javascript state persists between runs") {
  kj::StringPtr qjs;
  KJ_IF_MAYBE(path, findQuickJs()) { qjs = *path; } else { return; }

  TempDir dir;
  CodeWrapper wrapper(dir.get(), "/nonexistent");

  {
    auto output = runQuickJs(qjs, dir.get(), wrapper.wrap("javascript",
        "_state.counter = 41;\n"
        "_state.names = ['a', 'b'];\n"
        "_state.handler = function () {};\n", true));
    KJ_EXPECT(output.status == 0, output.stderrText);
    KJ_EXPECT(output.stderrText == "", output.stderrText);
  }

  auto state = readAll(kj::str(dir.get(), "/.session_state.json"));
  KJ_EXPECT(state == "{\"counter\":41,\"names\":[\"a\",\"b\"]}", state);

  {
    auto output = runQuickJs(qjs, dir.get(), wrapper.wrap("javascript",
        "_state.counter += 1;\n"
        "console.log(_state.counter, _state.names.join(','), typeof _state.handler);\n", true));
    KJ_EXPECT(output.status == 0, output.stderrText);
    KJ_EXPECT(output.stdoutText == "42 a,b undefined\n", output.stdoutText);
  }

  {
    auto output = runQuickJs(qjs, dir.get(), wrapper.wrap("javascript",
        "console.log(typeof _state);\n", false));
    KJ_EXPECT(output.stdoutText == "undefined\n", output.stdoutText);
  }
}

KJ_TEST("CodeWrapper: corrupt javascript state starts empty") {
  kj::StringPtr qjs;
  KJ_IF_MAYBE(path, findQuickJs()) { qjs = *path; } else { return; }

  TempDir dir;
  CodeWrapper wrapper(dir.get(), "/nonexistent");
  replaceFile(kj::str(dir.get(), "/.session_state.json"), kj::StringPtr("{not json").asBytes());

  auto output = runQuickJs(qjs, dir.get(), wrapper.wrap("javascript",
      "console.log(JSON.stringify(_state));\n"
      "_state.counter = 1;\n", true));
  KJ_EXPECT(output.status == 0, output.stderrText);
  KJ_EXPECT(output.stdoutText == "{}\n", output.stdoutText);
  KJ_EXPECT(output.stderrText.startsWith("StatePersistenceCorrupt:"), output.stderrText);
  KJ_EXPECT(readAll(kj::str(dir.get(), "/.session_state.json")) == "{\"counter\":1}");
}

KJ_TEST("CodeWrapper: javascript requireVendor loads helpers and reports missing ones") {
  kj::StringPtr qjs;
  KJ_IF_MAYBE(path, findQuickJs()) { qjs = *path; } else { return; }

  TempDir dir;
  auto helpers = kj::str(dir.get(), "/helpers");
  ensureDirectory(helpers);
  ensureDirectory(kj::str(helpers, "/javascript"));
  replaceFile(kj::str(helpers, "/javascript/greet.js"), kj::StringPtr(
      "module.exports = { hello: function (name) { return 'hello ' + name; } };\n").asBytes());
  auto workdir = kj::str(dir.get(), "/app");
  ensureDirectory(workdir);
  CodeWrapper wrapper(workdir, helpers);

  {
    auto output = runQuickJs(qjs, workdir, wrapper.wrap("javascript",
        "console.log(requireVendor('greet').hello('guest'));\n"
        "console.log(requireVendor('greet') === requireVendor('greet'));\n"
        "try { requireVendor('nope'); } catch (e) { console.log(e.message); }\n", false));
    KJ_EXPECT(output.status == 0, output.stderrText);
    KJ_EXPECT(output.stdoutText ==
        "hello guest\n"
        "true\n"
        "MissingHelperLibrary: no vendored helper named 'nope'\n", output.stdoutText);
  }

  {
    auto output = runQuickJs(qjs, workdir, wrapper.wrap("javascript",
        "requireVendor('../../etc/passwd');\n", true));
    KJ_EXPECT(output.status != 0);
    KJ_EXPECT(contains(output.stderrText, "MissingHelperLibrary"), output.stderrText);
  }
}

}  // namespace
}  // namespace guestbox
