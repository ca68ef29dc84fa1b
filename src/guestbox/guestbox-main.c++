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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/async-io.h>
#include <capnp/rpc-twoparty.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include "engine.h"
#include "config.h"
#include "runtime-registry.h"
#include "util.h"

#ifndef GUESTBOX_VERSION
#define GUESTBOX_VERSION "(unknown)"
#endif

namespace guestbox {

class GuestboxMain {
public:
  GuestboxMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    static const char* VERSION = "guestbox version " GUESTBOX_VERSION;

    return kj::MainBuilder(context, VERSION,
            "Runs untrusted code in sandboxed guest interpreters, with per-session state, "
            "instruction and memory budgets, and classified failures.")
        .addSubCommand("serve",
            [this]() {
              return kj::MainBuilder(context, VERSION,
                    "Serves the engine over Cap'n Proto RPC. The bootstrap capability is an "
                    "Engine; call bind() on it to get a Transport.")
                  .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile),
                      "<file>", "Read configuration from <file>. Default: /etc/guestbox.conf")
                  .addOptionWithArg({'l', "listen"}, KJ_BIND_METHOD(*this, setListenAddress),
                      "unix:<path>", "Accept connections on the Unix socket <path>. Each "
                      "client's bind() token names the owner of its sessions.")
                  .addOption({"stdio"}, KJ_BIND_METHOD(*this, useStdio),
                      "Serve a single connection on the socket at file descriptor 0. All "
                      "bindings share one owner that lives as long as this process.")
                  .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
                      "Log informational messages.")
                  .callAfterParsing(KJ_BIND_METHOD(*this, serve))
                  .build();
            },
            "Serve the engine.")
        .addSubCommand("run",
            [this]() {
              return kj::MainBuilder(context, VERSION,
                    "Runs <file> (or standard input, if <file> is '-') as <language> code in a "
                    "fresh session and prints the result as JSON.")
                  .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile),
                      "<file>", "Read configuration from <file>. Default: /etc/guestbox.conf")
                  .addOptionWithArg({'t', "timeout"}, KJ_BIND_METHOD(*this, setTimeout),
                      "<ms>", "Wall-clock limit in milliseconds.")
                  .addOptionWithArg({'f', "fuel"}, KJ_BIND_METHOD(*this, setFuel),
                      "<instructions>", "Fuel budget.")
                  .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
                      "Log informational messages.")
                  .expectArg("<language>", KJ_BIND_METHOD(*this, setLanguage))
                  .expectArg("<file>", KJ_BIND_METHOD(*this, setCodeFile))
                  .callAfterParsing(KJ_BIND_METHOD(*this, run))
                  .build();
            },
            "Run one piece of code.")
        .addSubCommand("runtimes",
            [this]() {
              return kj::MainBuilder(context, VERSION, "Lists the installed runtime images.")
                  .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile),
                      "<file>", "Read configuration from <file>. Default: /etc/guestbox.conf")
                  .callAfterParsing(KJ_BIND_METHOD(*this, listRuntimes))
                  .build();
            },
            "List runtime images.")
        .build();
  }

private:
  kj::ProcessContext& context;

  kj::StringPtr configFile = "/etc/guestbox.conf";
  bool configFileExplicit = false;
  kj::Maybe<kj::StringPtr> listenAddress;
  bool stdio = false;

  kj::StringPtr language;
  kj::StringPtr codeFile;
  LimitOverrides limits;

  kj::MainBuilder::Validity setConfigFile(kj::StringPtr arg) {
    configFile = arg;
    configFileExplicit = true;
    return true;
  }

  kj::MainBuilder::Validity setListenAddress(kj::StringPtr arg) {
    if (!arg.startsWith("unix:") || arg.size() == strlen("unix:")) {
      return "expected unix:<path>";
    }
    listenAddress = arg;
    return true;
  }

  kj::MainBuilder::Validity useStdio() {
    stdio = true;
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  kj::MainBuilder::Validity setLanguage(kj::StringPtr arg) {
    language = arg;
    return true;
  }

  kj::MainBuilder::Validity setCodeFile(kj::StringPtr arg) {
    codeFile = arg;
    return true;
  }

  kj::MainBuilder::Validity setTimeout(kj::StringPtr arg) {
    KJ_IF_MAYBE(value, parseUInt64(arg, 10)) {
      if (*value > 0) {
        limits.timeoutMs = *value;
        return true;
      }
    }
    return "expected a positive number of milliseconds";
  }

  kj::MainBuilder::Validity setFuel(kj::StringPtr arg) {
    KJ_IF_MAYBE(value, parseUInt64(arg, 10)) {
      if (*value > 0) {
        limits.fuel = *value;
        return true;
      }
    }
    return "expected a positive instruction count";
  }

  EngineConfig loadConfig() {
    // A missing default config file just means "all defaults".
    if (configFileExplicit || access(configFile.cStr(), F_OK) == 0) {
      return readConfig(configFile);
    }
    return EngineConfig();
  }

  // -----------------------------------------------------------------------------------

  class ErrorHandlerImpl: public kj::TaskSet::ErrorHandler {
  public:
    void taskFailed(kj::Exception&& exception) override {
      KJ_LOG(ERROR, "connection failed", exception);
    }
  };

  struct AcceptedConnection {
    kj::Own<kj::AsyncIoStream> connection;
    capnp::TwoPartyVatNetwork network;
    capnp::RpcSystem<capnp::rpc::twoparty::VatId> rpcSystem;

    AcceptedConnection(ExecutionEngine& engine, kj::Own<kj::AsyncIoStream>&& connectionParam)
        : connection(kj::mv(connectionParam)),
          network(*connection, capnp::rpc::twoparty::Side::SERVER),
          rpcSystem(capnp::makeRpcServer(network, engine.getBootstrap())) {}
  };

  kj::Promise<void> acceptLoop(kj::ConnectionReceiver& serverPort, ExecutionEngine& engine,
                               kj::TaskSet& tasks) {
    return serverPort.accept().then([&](kj::Own<kj::AsyncIoStream>&& connection) {
      auto connectionState = kj::heap<AcceptedConnection>(engine, kj::mv(connection));
      auto promise = connectionState->network.onDisconnect();
      tasks.add(promise.attach(kj::mv(connectionState)));
      return acceptLoop(serverPort, engine, tasks);
    });
  }

  kj::MainBuilder::Validity serve() {
    if (stdio == (listenAddress != nullptr)) {
      return "specify exactly one of --listen and --stdio";
    }

    auto config = loadConfig();
    config.binding = stdio ? BindingStrategy::SINGLE_STREAM : BindingStrategy::MULTIPLEXED;

    // A guest that dies before reading its start byte must not take the engine with it.
    signal(SIGPIPE, SIG_IGN);

    auto io = kj::setupAsyncIo();
    ExecutionEngine engine(kj::mv(config), io);

    if (stdio) {
      auto connection = io.lowLevelProvider->wrapSocketFd(STDIN_FILENO);
      capnp::TwoPartyVatNetwork network(*connection, capnp::rpc::twoparty::Side::SERVER);
      auto rpcSystem = capnp::makeRpcServer(network, engine.getBootstrap());
      network.onDisconnect().wait(io.waitScope);
      KJ_LOG(INFO, "client disconnected; shutting down");
      return true;
    }

    auto address = KJ_ASSERT_NONNULL(listenAddress);
    auto socketPath = address.slice(strlen("unix:"));
    if (unlink(socketPath.cStr()) < 0 && errno != ENOENT) {
      // Stale socket from a previous run.
      KJ_FAIL_SYSCALL("unlink", errno, socketPath);
    }

    ErrorHandlerImpl errorHandler;
    kj::TaskSet tasks(errorHandler);
    auto listener = io.provider->getNetwork().parseAddress(address)
        .wait(io.waitScope)->listen();
    KJ_LOG(INFO, "listening", address);
    acceptLoop(*listener, engine, tasks).wait(io.waitScope);
    KJ_UNREACHABLE;
  }

  kj::MainBuilder::Validity run() {
    auto config = loadConfig();

    // Use private storage, so that we never see (or, on recovery, destroy) the sessions of a
    // server sharing the configured storage directory.
    char storageTemplate[] = "/tmp/guestbox-run.XXXXXX";
    if (mkdtemp(storageTemplate) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp", errno, storageTemplate);
    }
    auto storageDir = kj::heapString(storageTemplate);
    KJ_DEFER(recursivelyDelete(storageDir));
    config.storageDir = kj::heapString(storageDir);

    auto code = codeFile == "-" ? readAll(STDIN_FILENO) : readAll(codeFile);

    signal(SIGPIPE, SIG_IGN);
    auto io = kj::setupAsyncIo();
    ExecutionResult result;
    {
      ExecutionEngine engine(kj::mv(config), io);
      auto binding = engine.bind("cli");

      ExecutionRequest request;
      request.language = kj::heapString(language);
      request.code = kj::mv(code);
      request.limits = limits;
      result = binding->execute(kj::mv(request)).wait(io.waitScope);
    }

    auto json = kj::str(resultToJson(result), '\n');
    kj::FdOutputStream(STDOUT_FILENO).write(json.begin(), json.size());
    if (!result.success) {
      context.error("execution did not succeed");
    }
    return true;
  }

  kj::MainBuilder::Validity listRuntimes() {
    auto config = loadConfig();
    RuntimeRegistry registry(config.runtimeDir);
    registry.loadAll();

    kj::Vector<kj::String> lines;
    for (auto image: registry.list()) {
      lines.add(kj::str(image->language, ' ', image->version,
                        " [", kj::strArray(image->capabilities, ", "), "]\n"));
    }
    auto text = kj::strArray(lines, "");
    kj::FdOutputStream(STDOUT_FILENO).write(text.begin(), text.size());
    return true;
  }
};

}  // namespace guestbox

KJ_MAIN(guestbox::GuestboxMain)
