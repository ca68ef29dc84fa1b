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


#ifndef GUESTBOX_CLASSIFIER_H_
#define GUESTBOX_CLASSIFIER_H_
// Annotates execution results with typed error guidance and a fuel analysis.

#include "result.h"
#include <kj/function.h>

namespace guestbox {

struct PackageCost {
  kj::StringPtr name;
  double minBillions;
  double maxBillions;
  // Fuel needed the first time the package is imported.
};

extern const kj::ArrayPtr<const PackageCost> DEFAULT_HEAVY_PACKAGES;

struct ClassifierPolicy {
  double moderateThreshold = 0.5;
  double warningThreshold = 0.75;
  double criticalThreshold = 0.9;
  // Utilization at which each fuel band begins. Utilization of 1.0 or more is always
  // "exhausted".

  double warningMargin = 1.5;
  double criticalMargin = 2.0;
  // Multipliers applied to consumption when recommending a new budget. The critical margin is
  // also used for exhausted budgets.

  size_t stderrScanBytes = 10000;
  // Only this much of stderr (and of the guest code) is ever examined.

  uint64_t largeDatasetFuel = 3000000000ull;
  // Consumption above which, with no heavy import detected, large data processing is the
  // presumed cause.

  kj::ArrayPtr<const PackageCost> heavyPackages = DEFAULT_HEAVY_PACKAGES;
  // Packages costing less than one billion are ignored.
};

struct ClassificationInput {
  kj::StringPtr code;
  // The user's code, before wrapping.

  kj::ArrayPtr<const kj::String> grantedRoots;
  // Guest paths visible to the guest. A failing path outside all of these is a path restriction.

  kj::StringPtr workdir = "/app";
  // Guest path that relative paths are resolved against.

  uint64_t memoryBytes = 0;
  // The memory ceiling that was in force, for recommendations.
};

class OutcomeClassifier {
public:
  struct RuleMatch {
    const ExecutionResult& result;
    const ClassificationInput& input;
    const ClassifierPolicy& policy;
    kj::StringPtr stderrPrefix;
    kj::Maybe<kj::String> captured;
    // Whatever the rule's extractor pulled out of stderr, e.g. the offending path.
  };

  enum class Extractor {
    NONE,
    QUOTED_PATH,
    // The first quoted path in stderr that lies outside the granted roots. The rule only
    // matches if there is one.
    MODULE_NAME,
    // The name in "No module named '<name>'", if present.
    QUOTED_NAME
    // The first single-quoted string, if present.
  };

  struct Rule {
    kj::Maybe<kj::StringPtr> language;
    kj::Maybe<TrapKind> trap;
    kj::Array<kj::StringPtr> markers;
    // All must occur in the stderr prefix.
    Extractor extractor;
    ErrorKind kind;
    ErrorReport (*buildReport)(const RuleMatch& match);
  };

  explicit OutcomeClassifier(ClassifierPolicy policy = ClassifierPolicy());
  OutcomeClassifier(ClassifierPolicy policy, kj::Array<Rule> rules);

  static kj::Array<Rule> defaultRules();

  void classify(ExecutionResult& result, const ClassificationInput& input) const;
  // Attaches `errorGuidance` if the execution trapped or exited with nonzero status, and
  // `fuelAnalysis` always. Nothing else in `result` is touched.

  kj::Maybe<ErrorReport> guidanceFor(
      const ExecutionResult& result, const ClassificationInput& input) const;
  FuelAnalysis analyzeFuel(const ExecutionResult& result, kj::StringPtr code) const;

  kj::Array<kj::StringPtr> detectHeavyPackages(kj::StringPtr text) const;

private:
  ClassifierPolicy policy;
  kj::Array<Rule> rules;
};

kj::String normalizeGuestPath(kj::StringPtr path, kj::StringPtr workdir);
// Resolve `path` against `workdir` and collapse "." and ".." components. ".." at the root stays
// at the root.

bool isUnderRoot(kj::StringPtr path, kj::ArrayPtr<const kj::String> roots);

}  // namespace guestbox

#endif // GUESTBOX_CLASSIFIER_H_
