//===- LintEngine.h - Single-pass rule evaluation ---------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The engine walks a SyntaxTree once in pre-order and hands each node to the
// active rules subscribed to its kind. Cost is linear in the size of the tree
// and in the number of interested rules per node, independent of the size of
// the catalog.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTENGINE_H
#define NORMA_ANALYSIS_LINTING_LINTENGINE_H

#include "norma/Analysis/Linting/LintDiagnostic.h"
#include "norma/Analysis/Linting/LintRuleRegistry.h"

namespace norma {
namespace lint {

/// Raw output of one traversal.
struct EvaluationResult {
  /// Findings of every rule, in dispatch order.
  std::vector<LintFinding> findings;

  /// NOLINT markers collected from comments.
  SuppressionSet suppressions;

  /// Statistics.
  size_t nodesVisited = 0;
  size_t ruleInvocations = 0;
  size_t ruleFailures = 0;
};

/// Evaluates an ActiveRuleSet over syntax trees. Holds no per-file state, so
/// one engine may evaluate several trees concurrently.
class LintEngine {
public:
  explicit LintEngine(const ActiveRuleSet &rules) : rules(rules) {}

  /// Walk `tree` and collect the findings of every interested rule. A rule
  /// that fails on a node contributes one internal-error finding for that
  /// node instead of its own findings. A rule whose scratch cannot be created
  /// is reported once on the root and not invoked.
  EvaluationResult evaluate(const SyntaxTree &tree) const;

  /// Evaluate `tree` and canonicalize the result into a report.
  LintReport run(const SyntaxTree &tree) const;

  const ActiveRuleSet &getRules() const { return rules; }

private:
  const ActiveRuleSet &rules;
};

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTENGINE_H
