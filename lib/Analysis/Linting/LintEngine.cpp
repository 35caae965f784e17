//===- LintEngine.cpp - Single-pass rule evaluation -----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintEngine.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <exception>
#include <system_error>

#define DEBUG_TYPE "norma-lint-engine"

using namespace norma;
using namespace norma::lint;

namespace {

/// Per-traversal state. Owned by the thread running the traversal.
class Traversal {
public:
  Traversal(const SyntaxTree &tree, const ActiveRuleSet &rules)
      : tree(tree), rules(rules), scratch(rules.size()),
        broken(rules.size(), false) {}

  EvaluationResult run();

private:
  void createScratch(unsigned ruleIndex);
  void visit(const SyntaxNode &node);
  void invoke(unsigned ruleIndex, const SyntaxNode &node);
  void recordFailure(const ActiveRule &active, const SyntaxNode &node,
                     const Twine &reason);
  Error checkFinding(const LintFinding &finding) const;

  const SyntaxTree &tree;
  const ActiveRuleSet &rules;
  TraversalIndex index;
  std::vector<std::unique_ptr<RuleScratch>> scratch;
  /// Rules whose scratch could not be created. They are not invoked.
  std::vector<bool> broken;
  EvaluationResult result;
};

} // namespace

EvaluationResult Traversal::run() {
  for (unsigned i = 0, e = rules.size(); i != e; ++i)
    createScratch(i);

  // Pre-order walk with an explicit stack. Children are pushed in reverse so
  // they pop in source order; a child is recorded in the index when pushed,
  // before any rule can ask about it.
  SmallVector<const SyntaxNode *, 64> worklist;
  worklist.push_back(&tree.getRoot());
  while (!worklist.empty()) {
    const SyntaxNode *node = worklist.pop_back_val();
    visit(*node);
    ArrayRef<std::unique_ptr<SyntaxNode>> children = node->getChildren();
    for (size_t i = children.size(); i != 0; --i) {
      index.record(*children[i - 1], node, i - 1);
      worklist.push_back(children[i - 1].get());
    }
  }

  LLVM_DEBUG(llvm::dbgs() << tree.getFilename() << ": visited "
                          << result.nodesVisited << " nodes, "
                          << result.ruleInvocations << " rule invocations, "
                          << result.findings.size() << " findings, "
                          << result.ruleFailures << " failures\n");
  return std::move(result);
}

void Traversal::createScratch(unsigned ruleIndex) {
  const ActiveRule &active = rules.getRules()[ruleIndex];
  try {
    scratch[ruleIndex] = active.rule->createScratch();
    return;
  } catch (const std::exception &ex) {
    recordFailure(active, tree.getRoot(), ex.what());
  } catch (...) {
    recordFailure(active, tree.getRoot(), "unknown exception");
  }
  broken[ruleIndex] = true;
}

void Traversal::visit(const SyntaxNode &node) {
  ++result.nodesVisited;
  if (node.getKind() == NodeKind::Comment)
    result.suppressions.addComment(tree.getText(node.getRange()),
                                   node.getRange());
  for (unsigned ruleIndex : rules.getRulesFor(node.getKind()))
    if (!broken[ruleIndex])
      invoke(ruleIndex, node);
}

void Traversal::invoke(unsigned ruleIndex, const SyntaxNode &node) {
  const ActiveRule &active = rules.getRules()[ruleIndex];
  RuleContext context(tree, index, active.config, scratch[ruleIndex].get());
  ++result.ruleInvocations;

  std::vector<LintFinding> findings;
  try {
    auto findingsOrErr = active.rule->check(node, context);
    if (!findingsOrErr) {
      recordFailure(active, node, llvm::toString(findingsOrErr.takeError()));
      return;
    }
    findings = std::move(*findingsOrErr);
  } catch (const std::exception &ex) {
    recordFailure(active, node, ex.what());
    return;
  } catch (...) {
    recordFailure(active, node, "unknown exception");
    return;
  }

  for (const LintFinding &finding : findings) {
    if (Error err = checkFinding(finding)) {
      recordFailure(active, node, llvm::toString(std::move(err)));
      return;
    }
  }

  // Findings are attributed to the rule that was invoked, whatever name the
  // rule wrote into them.
  for (LintFinding &finding : findings) {
    finding.ruleName = active.rule->getName().str();
    if (finding.fix)
      finding.fix->ruleName = finding.ruleName;
    result.findings.push_back(std::move(finding));
  }
}

Error Traversal::checkFinding(const LintFinding &finding) const {
  size_t size = tree.getSource().size();
  if (!finding.range.isValid() || finding.range.end.offset > size)
    return llvm::createStringError(
        std::make_error_code(std::errc::result_out_of_range),
        "finding range lies outside the source text");
  if (finding.fix && (!finding.fix->range.isValid() ||
                      finding.fix->range.end.offset > size))
    return llvm::createStringError(
        std::make_error_code(std::errc::result_out_of_range),
        "fix range lies outside the source text");
  return Error::success();
}

void Traversal::recordFailure(const ActiveRule &active, const SyntaxNode &node,
                              const Twine &reason) {
  ++result.ruleFailures;
  LLVM_DEBUG(llvm::dbgs() << "rule '" << active.rule->getName()
                          << "' failed on " << stringifyNodeKind(node.getKind())
                          << " at " << node.getRange() << ": " << reason
                          << "\n");
  LintFinding failure;
  failure.ruleName = kInternalErrorRuleName;
  failure.severity = LintSeverity::Error;
  failure.range = node.getRange();
  failure.message =
      ("rule '" + active.rule->getName() + "' failed: " + reason).str();
  result.findings.push_back(std::move(failure));
}

//===----------------------------------------------------------------------===//
// LintEngine
//===----------------------------------------------------------------------===//

EvaluationResult LintEngine::evaluate(const SyntaxTree &tree) const {
  return Traversal(tree, rules).run();
}

LintReport LintEngine::run(const SyntaxTree &tree) const {
  EvaluationResult evaluation = evaluate(tree);
  LintReport report;
  report.filename = tree.getFilename().str();
  report.diagnostics =
      canonicalizeFindings(tree.getFilename(), std::move(evaluation.findings),
                           rules, &evaluation.suppressions);
  report.summarize();
  return report;
}
