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
#include <kj/debug.h>
#include <kj/vector.h>
#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

namespace guestbox {

static const PackageCost HEAVY_PACKAGE_TABLE[] = {
  // Document processing.
  { "openpyxl", 5, 7 },
  { "PyPDF2", 5, 6 },
  { "jinja2", 5, 10 },

  // Text and data.
  { "tabulate", 2, 2 },
  { "markdown", 2, 2 },
  { "python-dateutil", 2, 2 },

  // Standard library; too cheap to ever be reported.
  { "json", 0.1, 0.2 },
  { "csv", 0.1, 0.2 },
  { "pathlib", 0.1, 0.2 },
};

const kj::ArrayPtr<const PackageCost> DEFAULT_HEAVY_PACKAGES = HEAVY_PACKAGE_TABLE;

// =======================================================================================
// text helpers

static kj::String formatFixed(double value, int places) {
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%.*f", places, value);
  return kj::heapString(buffer);
}

static kj::String formatBillions(double value, int places) {
  return kj::str(formatFixed(value / 1e9, places), "B");
}

static bool isWordChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool equalsNoCase(kj::ArrayPtr<const char> text, kj::StringPtr word) {
  if (text.size() != word.size()) return false;
  for (size_t i = 0; i < text.size(); i++) {
    if (tolower(static_cast<unsigned char>(text[i])) !=
        tolower(static_cast<unsigned char>(word[i]))) {
      return false;
    }
  }
  return true;
}

static kj::Maybe<size_t> findWordNoCase(
    kj::ArrayPtr<const char> text, kj::StringPtr word, size_t start) {
  // Find `word` with a word boundary on both sides, ignoring case.
  for (size_t i = start; i + word.size() <= text.size(); i++) {
    if (equalsNoCase(text.slice(i, i + word.size()), word) &&
        (i == 0 || !isWordChar(text[i - 1])) &&
        (i + word.size() == text.size() || !isWordChar(text[i + word.size()]))) {
      return i;
    }
  }
  return nullptr;
}

static bool precededByKeyword(kj::ArrayPtr<const char> text, size_t pos, kj::StringPtr keyword) {
  // True if `text[0, pos)` ends with `keyword` and at least one whitespace character.
  size_t end = pos;
  while (end > 0 && isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  if (end == pos || end < keyword.size()) return false;
  size_t start = end - keyword.size();
  return equalsNoCase(text.slice(start, end), keyword) &&
         (start == 0 || !isWordChar(text[start - 1]));
}

static bool mentionsImport(kj::ArrayPtr<const char> text, kj::StringPtr package) {
  // Matches "import <package>", "from <package>", and "<package> ... imported" within a line.
  size_t pos = 0;
  for (;;) {
    KJ_IF_MAYBE(i, findWordNoCase(text, package, pos)) {
      if (precededByKeyword(text, *i, "import") || precededByKeyword(text, *i, "from")) {
        return true;
      }
      size_t lineEnd = *i + package.size();
      while (lineEnd < text.size() && text[lineEnd] != '\n') ++lineEnd;
      for (size_t j = *i + package.size(); j + 8 <= lineEnd; j++) {
        if (equalsNoCase(text.slice(j, j + 8), "imported")) return true;
      }
      pos = *i + 1;
    } else {
      return false;
    }
  }
}

static kj::ArrayPtr<const char> boundedPrefix(kj::StringPtr text, size_t limit) {
  return text.slice(0, kj::min(text.size(), limit));
}

static bool containsBytes(kj::ArrayPtr<const char> haystack, kj::StringPtr needle) {
  if (needle.size() > haystack.size()) return false;
  for (size_t i = 0; i + needle.size() <= haystack.size(); i++) {
    if (memcmp(haystack.begin() + i, needle.begin(), needle.size()) == 0) return true;
  }
  return false;
}

static kj::Maybe<size_t> findBytes(kj::ArrayPtr<const char> haystack, kj::StringPtr needle) {
  for (size_t i = 0; i + needle.size() <= haystack.size(); i++) {
    if (memcmp(haystack.begin() + i, needle.begin(), needle.size()) == 0) return i;
  }
  return nullptr;
}

static kj::Maybe<kj::String> lastNonEmptyLine(kj::StringPtr text, size_t limit) {
  // Examines at most `limit` bytes from the end.
  size_t floor = text.size() > limit ? text.size() - limit : 0;
  size_t end = text.size();
  for (;;) {
    size_t start = end;
    while (start > floor && text[start - 1] != '\n') --start;
    auto line = trimArray(text.slice(start, end));
    if (line.size() > 0) return kj::heapString(line);
    if (start <= floor) return nullptr;
    end = start - 1;
  }
}

static kj::Maybe<kj::String> quotedAfter(kj::ArrayPtr<const char> text, size_t pos) {
  // The first single-quoted string at or after `pos`.
  for (size_t i = pos; i < text.size(); i++) {
    if (text[i] == '\'') {
      for (size_t j = i + 1; j < text.size() && text[j] != '\n'; j++) {
        if (text[j] == '\'') {
          if (j == i + 1) break;
          return kj::heapString(text.slice(i + 1, j));
        }
      }
    }
  }
  return nullptr;
}

kj::String normalizeGuestPath(kj::StringPtr path, kj::StringPtr workdir) {
  auto full = path.startsWith("/") ? kj::heapString(path) : kj::str(workdir, '/', path);

  kj::Vector<kj::ArrayPtr<const char>> parts;
  for (auto part: split(full, '/')) {
    if (part.size() == 0 || (part.size() == 1 && part[0] == '.')) {
      continue;
    } else if (part.size() == 2 && part[0] == '.' && part[1] == '.') {
      if (parts.size() > 0) parts.removeLast();
    } else {
      parts.add(part);
    }
  }

  if (parts.size() == 0) return kj::str("/");
  kj::Vector<char> result;
  for (auto& part: parts) {
    result.add('/');
    result.addAll(part);
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

bool isUnderRoot(kj::StringPtr path, kj::ArrayPtr<const kj::String> roots) {
  for (auto& root: roots) {
    if (path == root) return true;
    if (path.startsWith(root) && path.size() > root.size() &&
        (path[root.size()] == '/' || root.endsWith("/"))) {
      return true;
    }
  }
  return false;
}

static kj::Maybe<kj::String> firstRestrictedPath(
    kj::ArrayPtr<const char> text, const ClassificationInput& input) {
  // Look at every quoted string, since interpreters quote the failing path in their messages.
  for (size_t i = 0; i < text.size(); i++) {
    char quote = text[i];
    if (quote != '\'' && quote != '"') continue;
    size_t j = i + 1;
    while (j < text.size() && text[j] != quote && text[j] != '\n') ++j;
    if (j >= text.size() || text[j] != quote) continue;

    auto candidate = kj::heapString(text.slice(i + 1, j));
    i = j;
    if (candidate.size() == 0) continue;

    auto normalized = normalizeGuestPath(candidate, input.workdir);
    if (!isUnderRoot(normalized, input.grantedRoots)) {
      return kj::mv(candidate);
    }
  }
  return nullptr;
}

// =======================================================================================
// reports

static kj::Array<kj::String> strings(std::initializer_list<kj::StringPtr> items) {
  auto result = kj::heapArrayBuilder<kj::String>(items.size());
  for (auto item: items) result.add(kj::heapString(item));
  return result.finish();
}

static ErrorReport buildOutOfFuel(const OutcomeClassifier::RuleMatch& match) {
  uint64_t budget = match.result.fuelBudget;
  kj::Vector<kj::String> remediation;
  remediation.add(kj::str("Code execution exceeded the fuel budget (instruction limit)."));
  remediation.add(kj::str(
      "This typically occurs with heavy package imports (openpyxl 5-7B, PyPDF2 5-6B, "
      "jinja2 5-10B on first import), large dataset processing, or infinite loops and very "
      "deep recursion."));

  auto input = boundedPrefix(match.input.code, match.policy.stderrScanBytes);
  kj::Vector<kj::StringPtr> packages;
  for (auto& package: match.policy.heavyPackages) {
    if (package.maxBillions >= 1 &&
        (mentionsImport(match.stderrPrefix, package.name) || mentionsImport(input, package.name))) {
      packages.add(package.name);
    }
  }
  if (packages.size() > 0) {
    remediation.add(kj::str("Detected heavy package(s): ", kj::strArray(packages, ", "),
        ". These require 5-10B fuel when imported."));
  }

  remediation.add(kj::str(
      "Increase the fuel limit when creating the session or in the execute call: 10B or more "
      "for heavy packages, roughly 1B per 100K loop iterations for data processing."));
  remediation.add(kj::str(
      "Reduce the work done per execution: fewer loop iterations, generators instead of "
      "materialized datasets, and splitting the job across several executions of one session."));
  if (budget > 0) {
    remediation.add(kj::str("Concrete recommendation: increase the fuel limit from ", budget,
                            " to ", budget * 2, " instructions."));
  }

  auto examples = kj::heapArrayBuilder<CodeExample>(1);
  examples.add(CodeExample {
    kj::str("execute(request = (language = \"python\", code = ...))"),
    kj::str("execute(request = (language = \"python\", code = ..., "
            "limits = (fuel = 10000000000)))"),
    kj::str("Raise the fuel limit for package imports or large computations."),
  });

  return ErrorReport {
    ErrorKind::OUT_OF_FUEL,
    kj::str("Execution ran out of fuel after ", match.result.fuelConsumed, " instructions"),
    remediation.releaseAsArray(),
    examples.finish(),
    strings({ "guestbox.conf: DEFAULT_FUEL", "engine.capnp: LimitOverrides.fuel" }),
  };
}

static ErrorReport buildMemoryExhausted(const OutcomeClassifier::RuleMatch& match) {
  uint64_t limit = match.input.memoryBytes;
  kj::Vector<kj::String> remediation;
  remediation.add(kj::str("Code execution exceeded the memory limit."));
  remediation.add(kj::str(
      "This typically occurs when loading large files entirely into memory, building large "
      "data structures, or leaking memory in long computations."));
  remediation.add(kj::str(
      "Increase memoryBytes when creating the session or in the execute call: 128 MB is the "
      "default, 256-512 MB suits large files, very large datasets need 1 GB or more."));
  remediation.add(kj::str("Process data in chunks instead of loading entire files."));
  remediation.add(kj::str("Use generators or iterators to avoid materializing full datasets."));
  remediation.add(kj::str("Release large objects once they are no longer needed."));
  if (limit > 0) {
    remediation.add(kj::str("Concrete recommendation: increase memoryBytes from ", limit,
                            " to ", limit * 2, " bytes."));
  }

  auto examples = kj::heapArrayBuilder<CodeExample>(1);
  examples.add(CodeExample {
    kj::str("data = open('/app/big.csv').read().splitlines()"),
    kj::str("with open('/app/big.csv') as f:\n    for line in f:\n        process(line)"),
    kj::str("Stream large files line by line instead of reading them whole."),
  });

  return ErrorReport {
    ErrorKind::MEMORY_EXHAUSTED,
    match.result.trap == TrapKind::MEMORY_LIMIT
        ? kj::str("Execution exceeded its memory limit of ", limit, " bytes")
        : kj::str("Guest ran out of memory"),
    remediation.releaseAsArray(),
    examples.finish(),
    strings({ "guestbox.conf: DEFAULT_MEMORY_BYTES", "engine.capnp: LimitOverrides.memoryBytes" }),
  };
}

static ErrorReport buildTimeout(const OutcomeClassifier::RuleMatch& match) {
  return ErrorReport {
    ErrorKind::TIMEOUT,
    kj::str("Execution exceeded its wall-clock limit after ", match.result.durationMs, " ms"),
    strings({
      "The guest was stopped because it ran longer than its timeout.",
      "Look for code that waits or loops without making progress.",
      "Increase timeoutMs in the execute call if the work is legitimately long.",
      "Split long jobs across several executions of one session; state persists between them.",
    }),
    nullptr,
    strings({ "guestbox.conf: DEFAULT_TIMEOUT_SECONDS", "engine.capnp: ExecutionRequest.timeoutMs" }),
  };
}

static ErrorReport buildPathRestriction(const OutcomeClassifier::RuleMatch& match) {
  auto path = KJ_ASSERT_NONNULL(match.captured).asPtr();

  auto remediation = kj::heapArrayBuilder<kj::String>(6);
  remediation.add(kj::str(
      "File access failed because the sandbox only exposes the session workspace at ",
      match.input.workdir, " and the read-only shared directories."));
  remediation.add(kj::str(
      "Absolute paths elsewhere and attempts to climb out with '..' are blocked."));
  remediation.add(kj::str("Detected path: ", path));
  remediation.add(kj::str(
      "Use relative paths within the workspace, e.g. 'data.txt' instead of '/etc/passwd'."));
  remediation.add(kj::str("Place input files in the workspace before execution (writeFile)."));
  remediation.add(kj::str("Read shared data from /data."));

  auto examples = kj::heapArrayBuilder<CodeExample>(1);
  examples.add(CodeExample {
    kj::str("with open('", path, "', 'r') as f:"),
    kj::str("with open('", match.input.workdir, "/data.txt', 'r') as f:"),
    kj::str("Use paths inside ", match.input.workdir, " or relative paths within the workspace."),
  });

  return ErrorReport {
    ErrorKind::PATH_RESTRICTION,
    kj::str("Access to '", path, "' is outside the filesystem granted to this session"),
    remediation.finish(),
    examples.finish(),
    strings({ "engine.capnp: Transport.writeFile" }),
  };
}

static ErrorReport buildMissingHelper(const OutcomeClassifier::RuleMatch& match) {
  kj::Vector<kj::String> remediation;
  kj::String message;
  kj::StringPtr name = "helper";
  KJ_IF_MAYBE(captured, match.captured) {
    name = *captured;
    message = kj::str("Missing helper library '", *captured, "'");
    remediation.add(kj::str("Missing helper library: ", *captured));
  } else {
    message = kj::str("Missing helper library");
  }

  if (match.result.language == "javascript") {
    remediation.add(kj::str(
        "Vendored JavaScript helpers are loaded with requireVendor(name), not require()."));
    remediation.add(kj::str("Available helpers are the .js files under /data/javascript."));
  } else {
    remediation.add(kj::str(
        "Vendored Python helpers live in /data/python, which is already on sys.path."));
    remediation.add(kj::str("Check the spelling of the module name, or use the standard "
                            "library instead."));
  }
  for (auto& package: match.policy.heavyPackages) {
    if (package.name == name && package.maxBillions >= 1) {
      remediation.add(kj::str("Note: ", name, " requires ", formatFixed(package.minBillions, 0),
          "-", formatFixed(package.maxBillions, 0), "B fuel on first import."));
    }
  }

  auto examples = kj::heapArrayBuilder<CodeExample>(1);
  if (match.result.language == "javascript") {
    examples.add(CodeExample {
      kj::str("const pkg = require('", name, "');"),
      kj::str("const pkg = requireVendor('", name, "');"),
      kj::str("Use requireVendor() for vendored helpers."),
    });
  } else {
    examples.add(CodeExample {
      kj::str("sys.path.insert(0, '/somewhere/else')\nimport ", name),
      kj::str("import ", name),
      kj::str("Vendored helpers are importable directly from /data/python."),
    });
  }

  return ErrorReport {
    ErrorKind::MISSING_HELPER_LIBRARY,
    kj::mv(message),
    remediation.releaseAsArray(),
    examples.finish(),
    nullptr,
  };
}

static ErrorReport buildTupleDestructuring(const OutcomeClassifier::RuleMatch& match) {
  auto examples = kj::heapArrayBuilder<CodeExample>(1);
  examples.add(CodeExample {
    kj::str("const (status, data) = os.stat('/app/file.txt');"),
    kj::str("const [data, status] = os.stat('/app/file.txt');"),
    kj::str("Use array destructuring syntax, not tuple syntax."),
  });

  kj::String message;
  KJ_IF_MAYBE(line, lastNonEmptyLine(match.result.stderrText, match.policy.stderrScanBytes)) {
    message = kj::mv(*line);
  } else {
    message = kj::str("TypeError: value is not iterable");
  }

  return ErrorReport {
    ErrorKind::GUEST_RUNTIME_ERROR,
    kj::mv(message),
    strings({
      "QuickJS helper functions return arrays (or objects), not tuples.",
      "Use array destructuring: const [key, value] = f();",
      "Or index the result: const result = f(); const key = result[0];",
    }),
    examples.finish(),
    nullptr,
  };
}

static ErrorReport buildGeneric(const OutcomeClassifier::RuleMatch& match) {
  kj::String message;
  KJ_IF_MAYBE(line, lastNonEmptyLine(match.result.stderrText, match.policy.stderrScanBytes)) {
    message = kj::mv(*line);
  } else if (match.result.trap != TrapKind::NONE) {
    message = kj::str("Execution trapped: ", match.result.trapReason);
  } else {
    message = kj::str("Guest exited with status ", match.result.exitCode);
  }

  return ErrorReport {
    ErrorKind::GUEST_RUNTIME_ERROR,
    kj::mv(message),
    strings({
      "The guest program failed; stderr holds the complete error output.",
      "Fix the reported error and run the code again.",
    }),
    nullptr,
    nullptr,
  };
}

// =======================================================================================

typedef OutcomeClassifier::Rule Rule;
typedef OutcomeClassifier::Extractor Extractor;

static Rule rule(kj::Maybe<kj::StringPtr> language, kj::Maybe<TrapKind> trap,
                 std::initializer_list<kj::StringPtr> markers, Extractor extractor,
                 ErrorKind kind, ErrorReport (*buildReport)(const OutcomeClassifier::RuleMatch&)) {
  return Rule { language, trap, kj::heapArray(markers), extractor, kind, buildReport };
}

kj::Array<Rule> OutcomeClassifier::defaultRules() {
  kj::Vector<Rule> rules;

  // Traps are the most reliable signal.
  rules.add(rule(nullptr, TrapKind::OUT_OF_FUEL, {}, Extractor::NONE,
                 ErrorKind::OUT_OF_FUEL, &buildOutOfFuel));
  rules.add(rule(nullptr, TrapKind::MEMORY_LIMIT, {}, Extractor::NONE,
                 ErrorKind::MEMORY_EXHAUSTED, &buildMemoryExhausted));
  rules.add(rule(nullptr, TrapKind::TIMEOUT, {}, Extractor::NONE,
                 ErrorKind::TIMEOUT, &buildTimeout));

  for (kj::StringPtr marker: { "MemoryError", "out of memory", "Cannot allocate memory" }) {
    rules.add(rule(nullptr, nullptr, { marker }, Extractor::NONE,
                   ErrorKind::MEMORY_EXHAUSTED, &buildMemoryExhausted));
  }

  rules.add(rule(kj::StringPtr("python"), nullptr, { "ModuleNotFoundError" },
                 Extractor::MODULE_NAME, ErrorKind::MISSING_HELPER_LIBRARY, &buildMissingHelper));
  rules.add(rule(kj::StringPtr("python"), nullptr, { "No module named" },
                 Extractor::MODULE_NAME, ErrorKind::MISSING_HELPER_LIBRARY, &buildMissingHelper));
  rules.add(rule(kj::StringPtr("javascript"), nullptr, { "MissingHelperLibrary:" },
                 Extractor::QUOTED_NAME, ErrorKind::MISSING_HELPER_LIBRARY, &buildMissingHelper));
  rules.add(rule(kj::StringPtr("javascript"), nullptr, { "Cannot find module" },
                 Extractor::QUOTED_NAME, ErrorKind::MISSING_HELPER_LIBRARY, &buildMissingHelper));

  for (kj::StringPtr marker: { "FileNotFoundError", "PermissionError", "IsADirectoryError",
                               "NotADirectoryError", "OSError", "No such file or directory",
                               "Permission denied", "Read-only file system" }) {
    rules.add(rule(nullptr, nullptr, { marker }, Extractor::QUOTED_PATH,
                   ErrorKind::PATH_RESTRICTION, &buildPathRestriction));
  }

  rules.add(rule(kj::StringPtr("javascript"), nullptr, { "TypeError", "not iterable" },
                 Extractor::NONE, ErrorKind::GUEST_RUNTIME_ERROR, &buildTupleDestructuring));

  rules.add(rule(nullptr, nullptr, {}, Extractor::NONE,
                 ErrorKind::GUEST_RUNTIME_ERROR, &buildGeneric));

  return rules.releaseAsArray();
}

OutcomeClassifier::OutcomeClassifier(ClassifierPolicy policy)
    : OutcomeClassifier(kj::mv(policy), defaultRules()) {}

OutcomeClassifier::OutcomeClassifier(ClassifierPolicy policy, kj::Array<Rule> rules)
    : policy(kj::mv(policy)), rules(kj::mv(rules)) {
  KJ_REQUIRE(this->policy.moderateThreshold <= this->policy.warningThreshold &&
             this->policy.warningThreshold <= this->policy.criticalThreshold &&
             this->policy.criticalThreshold <= 1.0,
             "fuel band thresholds must be increasing and at most 1.0");
}

void OutcomeClassifier::classify(ExecutionResult& result, const ClassificationInput& input) const {
  result.errorGuidance = guidanceFor(result, input);
  result.fuelAnalysis = analyzeFuel(result, input.code);
}

kj::Maybe<ErrorReport> OutcomeClassifier::guidanceFor(
    const ExecutionResult& result, const ClassificationInput& input) const {
  if (result.trap == TrapKind::NONE && result.exitCode == 0) {
    return nullptr;
  }

  auto stderrPrefix = boundedPrefix(result.stderrText, policy.stderrScanBytes);
  auto prefixStorage = kj::heapString(stderrPrefix);

  for (auto& rule: rules) {
    KJ_IF_MAYBE(language, rule.language) {
      if (*language != result.language) continue;
    }
    KJ_IF_MAYBE(trap, rule.trap) {
      if (*trap != result.trap) continue;
    }

    bool allMarkers = true;
    for (auto& marker: rule.markers) {
      if (!containsBytes(stderrPrefix, marker)) {
        allMarkers = false;
        break;
      }
    }
    if (!allMarkers) continue;

    kj::Maybe<kj::String> captured;
    switch (rule.extractor) {
      case Extractor::NONE:
        break;
      case Extractor::QUOTED_PATH:
        captured = firstRestrictedPath(stderrPrefix, input);
        if (captured == nullptr) continue;
        break;
      case Extractor::MODULE_NAME:
        KJ_IF_MAYBE(pos, findBytes(stderrPrefix, "No module named ")) {
          captured = quotedAfter(stderrPrefix, *pos);
        }
        break;
      case Extractor::QUOTED_NAME:
        KJ_IF_MAYBE(pos, findBytes(stderrPrefix, rule.markers[0])) {
          captured = quotedAfter(stderrPrefix, *pos);
        }
        break;
    }

    RuleMatch match { result, input, policy, prefixStorage, kj::mv(captured) };
    auto report = rule.buildReport(match);
    report.kind = rule.kind;
    return kj::mv(report);
  }

  // The table ends with a catch-all, so this only happens with a custom table.
  return ErrorReport {
    ErrorKind::GUEST_RUNTIME_ERROR,
    kj::str("Guest exited with status ", result.exitCode),
    nullptr, nullptr, nullptr,
  };
}

kj::Array<kj::StringPtr> OutcomeClassifier::detectHeavyPackages(kj::StringPtr text) const {
  auto prefix = boundedPrefix(text, policy.stderrScanBytes);
  kj::Vector<kj::StringPtr> result;
  for (auto& package: policy.heavyPackages) {
    if (package.maxBillions >= 1 && mentionsImport(prefix, package.name)) {
      result.add(package.name);
    }
  }
  return result.releaseAsArray();
}

FuelAnalysis OutcomeClassifier::analyzeFuel(
    const ExecutionResult& result, kj::StringPtr code) const {
  uint64_t budget = result.fuelBudget;
  if (!result.fuelMetered) {
    return FuelAnalysis {
      0, budget, 0.0, kj::str("unknown"), kj::str("Fuel was not metered for this execution"),
      nullptr,
    };
  }

  uint64_t consumed = result.fuelConsumed;
  double utilization = budget > 0 ? double(consumed) / double(budget) : 0.0;
  double percent = utilization * 100;

  kj::StringPtr status;
  double margin = 1.0;
  if (utilization >= 1.0) {
    status = "exhausted";
    margin = policy.criticalMargin;
  } else if (utilization >= policy.criticalThreshold) {
    status = "critical";
    margin = policy.criticalMargin;
  } else if (utilization >= policy.warningThreshold) {
    status = "warning";
    margin = policy.warningMargin;
  } else if (utilization >= policy.moderateThreshold) {
    status = "moderate";
  } else {
    status = "efficient";
  }

  // Heavy imports may show up either in the guest's own output or in its source.
  auto stderrPrefix = boundedPrefix(result.stderrText, policy.stderrScanBytes);
  auto codePrefix = boundedPrefix(code, policy.stderrScanBytes);
  kj::Vector<const PackageCost*> packages;
  for (auto& package: policy.heavyPackages) {
    if (package.maxBillions >= 1 &&
        (mentionsImport(stderrPrefix, package.name) || mentionsImport(codePrefix, package.name))) {
      packages.add(&package);
    }
  }

  kj::Vector<kj::String> causes;
  if (packages.size() > 0) {
    causes.add(kj::str("Heavy package imports detected: ",
        kj::strArray(KJ_MAP(p, packages) { return p->name; }, ", ")));
  } else if (consumed > policy.largeDatasetFuel) {
    causes.add(kj::str(
        "High fuel usage suggests large dataset processing or complex computation"));
  } else if (status != "efficient" && status != "moderate") {
    causes.add(kj::str(
        "High utilization with no recognized cause; look for long loops or deep recursion"));
  }

  kj::String recommendation;
  if (status == "efficient") {
    recommendation = kj::str("Fuel budget is appropriate for this workload");
  } else if (status == "moderate") {
    recommendation = kj::str("Fuel usage is moderate (", formatFixed(percent, 1), "%). "
        "Current budget is adequate, but consider increasing if similar tasks are planned");
  } else {
    // Suggested budgets are whole billions.
    uint64_t suggested = llround(double(consumed) * margin / 1e9);
    if (suggested < 1) suggested = 1;
    kj::Vector<kj::String> parts;
    if (status == "exhausted") {
      parts.add(kj::str("Fuel budget exhausted (see the OutOfFuel error guidance). "
          "Increase to at least ", suggested, "B instructions (current: ",
          formatBillions(budget, 0), ", consumed: ", formatBillions(consumed, 1), ")"));
    } else if (status == "critical") {
      parts.add(kj::str("Fuel usage is critical (", formatFixed(percent, 1), "%). "
          "Increase budget to ", suggested, "B instructions to avoid exhaustion (current: ",
          formatBillions(budget, 0), ")"));
    } else {
      parts.add(kj::str("Fuel usage is high (", formatFixed(percent, 1), "%). "
          "Consider increasing budget to ", suggested, "B instructions for similar tasks "
          "(current: ", formatBillions(budget, 0), ")"));
    }

    if (packages.size() > 0) {
      parts.add(kj::str("Package fuel requirements: ", kj::strArray(KJ_MAP(p, packages) {
        return kj::str(p->name, " requires ", formatFixed(p->minBillions, 0), "-",
                       formatFixed(p->maxBillions, 0), "B for first import");
      }, "; ")));
      parts.add(kj::str("Note: splitting imports and work across executions of a persistent "
                        "session keeps each execution within its budget"));
    }
    recommendation = kj::strArray(parts, ". ");
  }

  return FuelAnalysis {
    consumed,
    budget,
    round(percent * 100) / 100,
    kj::heapString(status),
    kj::mv(recommendation),
    causes.releaseAsArray(),
  };
}

}  // namespace guestbox
