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

#include "classifier.h"
#include "util.h"
#include <kj/test.h>

namespace guestbox {
namespace {

const kj::String ROOTS[] = {
  kj::str("/app"), kj::str("/data"), kj::str("/runtime"), kj::str("/usr"),
  kj::str("/dev/null"), kj::str("/dev/urandom"),
};

ClassificationInput makeInput(kj::StringPtr code = "") {
  ClassificationInput input;
  input.code = code;
  input.grantedRoots = ROOTS;
  input.workdir = "/app";
  input.memoryBytes = 128000000;
  return input;
}

ExecutionResult makeResult(kj::StringPtr language, int exitCode, kj::StringPtr errorOutput,
                           TrapKind trap = TrapKind::NONE) {
  ExecutionResult result;
  result.language = kj::heapString(language);
  result.exitCode = exitCode;
  result.stderrText = kj::heapString(errorOutput);
  result.trap = trap;
  result.fuelBudget = 10000000000ull;
  result.fuelConsumed = 1000000;
  result.fuelMetered = true;
  result.durationMs = 120;
  return result;
}

bool anyContains(kj::ArrayPtr<const kj::String> items, kj::StringPtr needle) {
  for (auto& item: items) {
    if (contains(item, needle)) return true;
  }
  return false;
}

KJ_TEST("classify: success gets a fuel analysis but no guidance") {
  OutcomeClassifier classifier;
  auto result = makeResult("python", 0, "");
  classifier.classify(result, makeInput("print(1)"));

  KJ_EXPECT(result.errorGuidance == nullptr);
  auto& analysis = KJ_ASSERT_NONNULL(result.fuelAnalysis);
  KJ_EXPECT(analysis.status == "efficient");
  KJ_EXPECT(analysis.recommendation == "Fuel budget is appropriate for this workload");
  KJ_EXPECT(analysis.likelyCauses.size() == 0);
}

KJ_TEST("classify: out of fuel with a heavy import") {
  OutcomeClassifier classifier;
  auto result = makeResult("python", 137, "Execution trapped: fuel exhausted",
                           TrapKind::OUT_OF_FUEL);
  result.fuelConsumed = result.fuelBudget;
  classifier.classify(result, makeInput("import openpyxl\nwb = openpyxl.Workbook()\n"));

  auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
  KJ_EXPECT(report.kind == ErrorKind::OUT_OF_FUEL);
  KJ_EXPECT(anyContains(report.remediation, "Detected heavy package(s): openpyxl"));
  KJ_EXPECT(anyContains(report.remediation, "from 10000000000 to 20000000000"));
  KJ_EXPECT(report.codeExamples.size() == 1);

  auto& analysis = KJ_ASSERT_NONNULL(result.fuelAnalysis);
  KJ_EXPECT(analysis.status == "exhausted");
  KJ_EXPECT(analysis.utilizationPercent == 100);
  KJ_EXPECT(contains(analysis.recommendation, "Increase to at least 20B"),
            analysis.recommendation);
  KJ_EXPECT(contains(analysis.recommendation, "openpyxl requires 5-7B"),
            analysis.recommendation);
  KJ_ASSERT(analysis.likelyCauses.size() == 1);
  KJ_EXPECT(analysis.likelyCauses[0] == "Heavy package imports detected: openpyxl");
}

KJ_TEST("classify: memory and timeout traps") {
  OutcomeClassifier classifier;

  {
    auto result = makeResult("python", 137, "", TrapKind::MEMORY_LIMIT);
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::MEMORY_EXHAUSTED);
    KJ_EXPECT(report.message == "Execution exceeded its memory limit of 128000000 bytes");
    KJ_EXPECT(anyContains(report.remediation, "from 128000000 to 256000000"));
  }

  {
    // Without a trap, the interpreter's own message is enough.
    auto result = makeResult("python", 1, "Traceback...\nMemoryError\n");
    classifier.classify(result, makeInput());
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.errorGuidance).kind == ErrorKind::MEMORY_EXHAUSTED);
  }

  {
    auto result = makeResult("javascript", 137, "", TrapKind::TIMEOUT);
    result.durationMs = 2001;
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::TIMEOUT);
    KJ_EXPECT(contains(report.message, "2001 ms"));
  }
}

KJ_TEST("classify: path restriction") {
  OutcomeClassifier classifier;

  {
    auto result = makeResult("python", 1,
        "Traceback (most recent call last):\n"
        "  File \"/app/user_code.py\", line 3, in <module>\n"
        "FileNotFoundError: [Errno 2] No such file or directory: '/etc/passwd'\n");
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::PATH_RESTRICTION);
    KJ_EXPECT(anyContains(report.remediation, "Detected path: /etc/passwd"));
    KJ_ASSERT(report.codeExamples.size() == 1);
    KJ_EXPECT(report.codeExamples[0].before == "with open('/etc/passwd', 'r') as f:");
  }

  {
    // Climbing out of the working directory is the same thing.
    auto result = makeResult("python", 1,
        "FileNotFoundError: [Errno 2] No such file or directory: '../../etc/shadow'\n");
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::PATH_RESTRICTION);
    KJ_EXPECT(anyContains(report.remediation, "Detected path: ../../etc/shadow"));
  }

  {
    // A missing file inside the workspace is an ordinary error.
    auto result = makeResult("python", 1,
        "FileNotFoundError: [Errno 2] No such file or directory: 'missing.txt'\n");
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::GUEST_RUNTIME_ERROR);
    KJ_EXPECT(report.message ==
        "FileNotFoundError: [Errno 2] No such file or directory: 'missing.txt'");
  }
}

KJ_TEST("classify: missing helper library") {
  OutcomeClassifier classifier;

  {
    auto result = makeResult("python", 1,
        "ModuleNotFoundError: No module named 'jinja2'\n");
    classifier.classify(result, makeInput("import jinja2"));
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::MISSING_HELPER_LIBRARY);
    KJ_EXPECT(report.message == "Missing helper library 'jinja2'");
    KJ_EXPECT(anyContains(report.remediation, "jinja2 requires 5-10B fuel"));
  }

  {
    auto result = makeResult("javascript", 1,
        "Error: MissingHelperLibrary: no vendored helper named 'lodash'\n");
    classifier.classify(result, makeInput());
    auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
    KJ_EXPECT(report.kind == ErrorKind::MISSING_HELPER_LIBRARY);
    KJ_EXPECT(report.message == "Missing helper library 'lodash'");
    KJ_ASSERT(report.codeExamples.size() == 1);
    KJ_EXPECT(report.codeExamples[0].after == "const pkg = requireVendor('lodash');");
  }

  {
    // Python rules don't apply to JavaScript.
    auto result = makeResult("javascript", 1, "No module named 'x'\n");
    classifier.classify(result, makeInput());
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.errorGuidance).kind == ErrorKind::GUEST_RUNTIME_ERROR);
  }
}

KJ_TEST("classify: tuple destructuring in javascript") {
  OutcomeClassifier classifier;
  auto result = makeResult("javascript", 1,
      "TypeError: value is not iterable\n    at <eval> (/app/user_code.js:5)\n");
  classifier.classify(result, makeInput());
  auto& report = KJ_ASSERT_NONNULL(result.errorGuidance);
  KJ_EXPECT(report.kind == ErrorKind::GUEST_RUNTIME_ERROR);
  KJ_ASSERT(report.codeExamples.size() == 1);
  KJ_EXPECT(contains(report.codeExamples[0].after, "const [data, status]"));
}

KJ_TEST("classify: generic failures") {
  OutcomeClassifier classifier;

  {
    auto result = makeResult("python", 3, "");
    classifier.classify(result, makeInput());
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.errorGuidance).message == "Guest exited with status 3");
  }

  {
    auto result = makeResult("python", 139, "", TrapKind::FAULT);
    result.trapReason = kj::str("killed by signal 11");
    classifier.classify(result, makeInput());
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.errorGuidance).message ==
              "Execution trapped: killed by signal 11");
  }
}

KJ_TEST("classify: only a bounded prefix of stderr is examined") {
  ClassifierPolicy policy;
  policy.stderrScanBytes = 100;
  OutcomeClassifier classifier(policy);

  auto output = kj::str(kj::repeat('x', 200), "\nMemoryError\n");
  auto result = makeResult("python", 1, output);
  classifier.classify(result, makeInput());
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.errorGuidance).kind == ErrorKind::GUEST_RUNTIME_ERROR);
}

KJ_TEST("analyzeFuel: bands") {
  OutcomeClassifier classifier;
  auto result = makeResult("python", 0, "");

  result.fuelConsumed = 4000000000ull;
  KJ_EXPECT(classifier.analyzeFuel(result, "").status == "efficient");

  result.fuelConsumed = 6000000000ull;
  {
    auto analysis = classifier.analyzeFuel(result, "");
    KJ_EXPECT(analysis.status == "moderate");
    KJ_EXPECT(analysis.utilizationPercent == 60);
    KJ_EXPECT(contains(analysis.recommendation, "(60.0%)"), analysis.recommendation);
  }

  result.fuelConsumed = 8000000000ull;
  {
    auto analysis = classifier.analyzeFuel(result, "");
    KJ_EXPECT(analysis.status == "warning");
    KJ_EXPECT(contains(analysis.recommendation, "increasing budget to 12B"),
              analysis.recommendation);
    KJ_EXPECT(contains(analysis.recommendation, "(current: 10B)"), analysis.recommendation);
  }

  result.fuelConsumed = 9500000000ull;
  {
    auto analysis = classifier.analyzeFuel(result, "");
    KJ_EXPECT(analysis.status == "critical");
    KJ_EXPECT(contains(analysis.recommendation, "Increase budget to 19B"),
              analysis.recommendation);
  }

  result.fuelConsumed = result.fuelBudget;
  KJ_EXPECT(classifier.analyzeFuel(result, "").status == "exhausted");

  result.fuelMetered = false;
  KJ_EXPECT(classifier.analyzeFuel(result, "").status == "unknown");
}

KJ_TEST("analyzeFuel: configurable thresholds") {
  ClassifierPolicy policy;
  policy.moderateThreshold = 0.2;
  policy.warningThreshold = 0.3;
  policy.criticalThreshold = 0.4;
  OutcomeClassifier classifier(policy);

  auto result = makeResult("python", 0, "");
  result.fuelConsumed = 3500000000ull;
  KJ_EXPECT(classifier.analyzeFuel(result, "").status == "warning");

  policy.warningThreshold = 0.5;
  KJ_EXPECT_THROW_MESSAGE("thresholds must be increasing", (void)OutcomeClassifier(policy));
}

KJ_TEST("analyzeFuel: likely causes") {
  OutcomeClassifier classifier;
  auto result = makeResult("python", 0, "");

  // Large consumption without heavy imports points at the data.
  result.fuelConsumed = 4000000000ull;
  {
    auto analysis = classifier.analyzeFuel(result, "total = sum(range(10**9))");
    KJ_ASSERT(analysis.likelyCauses.size() == 1);
    KJ_EXPECT(contains(analysis.likelyCauses[0], "large dataset processing"));
  }

  // Cheap standard library imports are never blamed.
  result.fuelConsumed = 9000000000ull;
  {
    auto analysis = classifier.analyzeFuel(result, "import json\nimport csv\n");
    KJ_ASSERT(analysis.likelyCauses.size() == 1);
    KJ_EXPECT(!contains(analysis.likelyCauses[0], "json"));
  }
}

KJ_TEST("detectHeavyPackages") {
  OutcomeClassifier classifier;

  auto found = classifier.detectHeavyPackages(
      "import json\n"
      "from jinja2 import Template\n"
      "# tabulate was imported earlier\n");
  KJ_ASSERT(found.size() == 2);
  KJ_EXPECT(found[0] == "jinja2");
  KJ_EXPECT(found[1] == "tabulate");

  KJ_EXPECT(classifier.detectHeavyPackages("my_openpyxl_wrapper = 1").size() == 0);
  KJ_EXPECT(classifier.detectHeavyPackages("important = 'openpyxl'").size() == 0);
}

KJ_TEST("normalizeGuestPath") {
  KJ_EXPECT(normalizeGuestPath("data.txt", "/app") == "/app/data.txt");
  KJ_EXPECT(normalizeGuestPath("./a/../b", "/app") == "/app/b");
  KJ_EXPECT(normalizeGuestPath("../../../etc", "/app") == "/etc");
  KJ_EXPECT(normalizeGuestPath("/usr//lib/", "/app") == "/usr/lib");
  KJ_EXPECT(normalizeGuestPath("/..", "/app") == "/");
}

KJ_TEST("isUnderRoot") {
  KJ_EXPECT(isUnderRoot("/app", ROOTS));
  KJ_EXPECT(isUnderRoot("/app/x/y", ROOTS));
  KJ_EXPECT(isUnderRoot("/dev/null", ROOTS));
  KJ_EXPECT(!isUnderRoot("/application", ROOTS));
  KJ_EXPECT(!isUnderRoot("/dev/sda", ROOTS));
  KJ_EXPECT(!isUnderRoot("/", ROOTS));
}

}  // namespace
}  // namespace guestbox
