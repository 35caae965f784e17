//===----------------------------------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "gtest/gtest.h"

#include "TestRules.h"
#include "norma/Analysis/Linting/LintEngine.h"
#include "norma/Syntax/BraceParser.h"
#include "llvm/Support/raw_ostream.h"

#include <stdexcept>

using namespace norma;
using namespace norma::lint;
using namespace norma::lint::test;

namespace {

using Findings = std::vector<LintFinding>;

class LintEngineTest : public ::testing::Test {
protected:
  void addRule(StringRef name, std::vector<NodeKind> kinds,
               CallbackRule::Callback callback) {
    Error err = registry.registerRule(std::make_unique<CallbackRule>(
        name, std::move(kinds), std::move(callback)));
    ASSERT_FALSE(llvm::errorToBool(std::move(err)));
  }

  /// Resolve the registered rules and parse `source`.
  void prepare(StringRef source) {
    auto rulesOrErr = registry.resolve(config);
    ASSERT_TRUE(!!rulesOrErr) << llvm::toString(rulesOrErr.takeError());
    rules = std::move(*rulesOrErr);

    auto treeOrErr = BraceParser().parse(source, "engine.c");
    ASSERT_TRUE(!!treeOrErr) << llvm::toString(treeOrErr.takeError());
    tree = std::move(*treeOrErr);
  }

  std::vector<std::string> messages(ArrayRef<LintDiagnostic> diags) {
    std::vector<std::string> result;
    for (const auto &diag : diags)
      result.push_back((diag.getRuleName() + ": " + diag.getMessage()).str());
    return result;
  }

  LintRuleRegistry registry;
  LintConfig config;
  ActiveRuleSet rules;
  std::unique_ptr<SyntaxTree> tree;
};

/// Every node is visited once, in pre-order, and each node goes to its
/// subscribers in registration order.
TEST_F(LintEngineTest, DispatchOrder) {
  std::vector<std::string> log;
  auto recorder = [&log](StringRef tag) {
    return [&log, tag](const CallbackRule &, const SyntaxNode &node,
                       const RuleContext &context) -> Expected<Findings> {
      log.push_back((tag + " " + stringifyNodeKind(node.getKind()) + " " +
                     context.getText(node))
                        .str());
      return Findings();
    };
  };
  addRule("first", {NodeKind::Statement, NodeKind::Identifier},
          recorder("first"));
  addRule("second", {NodeKind::Identifier}, recorder("second"));
  prepare("a;\nb;\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  EXPECT_EQ(log, (std::vector<std::string>{
                     "first Statement a;", "first Identifier a",
                     "second Identifier a", "first Statement b;",
                     "first Identifier b", "second Identifier b"}));
  EXPECT_EQ(result.nodesVisited, tree->getRoot().countNodes());
  EXPECT_EQ(result.ruleInvocations, 6u);
  EXPECT_EQ(result.ruleFailures, 0u);
}

TEST_F(LintEngineTest, StructuralQueries) {
  addRule("context", {NodeKind::Identifier},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            const SyntaxNode *parent = context.getParent(node);
            const SyntaxNode *prev = context.getPrevSibling(node);
            const SyntaxNode *next = context.getNextSibling(node);
            std::string description;
            llvm::raw_string_ostream os(description);
            os << context.getText(node) << " parent="
               << (parent ? stringifyNodeKind(parent->getKind()) : "none")
               << " index=" << context.getSiblingIndex(node).value_or(99)
               << " prev=" << (prev ? context.getText(*prev) : "none")
               << " next=" << (next ? context.getText(*next) : "none")
               << " depth=" << context.getAncestors(node).size();
            return Findings{rule.report(node.getRange(), os.str())};
          });
  prepare("x = y;\nif (z) {\n}\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  ASSERT_EQ(result.findings.size(), 3u);
  EXPECT_EQ(result.findings[0].message,
            "x parent=Statement index=0 prev=none next=  depth=2");
  EXPECT_EQ(result.findings[1].message,
            "y parent=Statement index=4 prev=  next=; depth=2");
  EXPECT_EQ(result.findings[2].message,
            "z parent=Group index=1 prev=( next=) depth=3");
}

TEST_F(LintEngineTest, RootHasNoParent) {
  addRule("root", {NodeKind::TranslationUnit},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            if (context.getParent(node) || context.getSiblingIndex(node) ||
                !context.getAncestors(node).empty() ||
                context.getNextSibling(node))
              return Findings{rule.report(node.getRange(), "unexpected")};
            return Findings();
          });
  prepare("a;\n");
  EXPECT_TRUE(LintEngine(rules).evaluate(*tree).findings.empty());
}

/// A failing rule yields one internal error per failing node and does not
/// affect other nodes or other rules.
TEST_F(LintEngineTest, RuleFailuresAreContained) {
  addRule("fragile", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            StringRef text = context.getText(node);
            if (text == "b;")
              return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                             "cannot handle b");
            if (text == "c;")
              throw std::runtime_error("cannot handle c");
            return Findings{rule.report(node.getRange(), "saw " + text)};
          });
  addRule("steady", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            return Findings{rule.report(node.getRange(), "ok")};
          });
  prepare("a;\nb;\nc;\nd;\n");

  LintEngine engine(rules);
  EvaluationResult result = engine.evaluate(*tree);
  EXPECT_EQ(result.ruleFailures, 2u);
  EXPECT_EQ(result.ruleInvocations, 8u);

  LintReport report = engine.run(*tree);
  EXPECT_EQ(messages(report.diagnostics),
            (std::vector<std::string>{
                "fragile: saw a;", "steady: ok",
                "internal-error: rule 'fragile' failed: cannot handle b",
                "steady: ok",
                "internal-error: rule 'fragile' failed: cannot handle c",
                "steady: ok", "fragile: saw d;", "steady: ok"}));
  EXPECT_EQ(report.diagnostics[2].getSeverity(), LintSeverity::Error);
  EXPECT_EQ(report.diagnostics[2].getRange().start.line, 2u);
  EXPECT_EQ(report.status, LintStatus::Violations);
}

/// Exceptions that do not derive from std::exception are contained too.
TEST_F(LintEngineTest, ForeignExceptionsAreContained) {
  addRule("thrower", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            if (context.getText(node) == "a;")
              throw 42;
            return Findings{rule.report(node.getRange(), "survived")};
          });
  prepare("a;\nb;\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  EXPECT_EQ(result.ruleFailures, 1u);
  ASSERT_EQ(result.findings.size(), 2u);
  EXPECT_EQ(result.findings[0].ruleName, kInternalErrorRuleName);
  EXPECT_EQ(result.findings[0].message,
            "rule 'thrower' failed: unknown exception");
  EXPECT_EQ(result.findings[1].message, "survived");
}

/// A rule whose scratch cannot be created is reported once and skipped; the
/// other rules still run.
TEST_F(LintEngineTest, ScratchFailureIsContained) {
  class NoScratchRule : public LintRule {
  public:
    NoScratchRule() : LintRule("no-scratch", "cannot set up") {}
    ArrayRef<NodeKind> getInterestedKinds() const override {
      static const NodeKind kinds[] = {NodeKind::Statement};
      return kinds;
    }
    std::unique_ptr<RuleScratch> createScratch() const override {
      throw std::runtime_error("out of scratch");
    }
    Expected<Findings> check(const SyntaxNode &node,
                             const RuleContext &) const override {
      return Findings{makeFinding(node.getRange(), "should not run")};
    }
  };
  ASSERT_FALSE(llvm::errorToBool(
      registry.registerRule(std::make_unique<NoScratchRule>())));
  addRule("steady", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &) -> Expected<Findings> {
            return Findings{rule.report(node.getRange(), "ok")};
          });
  prepare("a;\nb;\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  EXPECT_EQ(result.ruleFailures, 1u);
  EXPECT_EQ(result.ruleInvocations, 2u);
  ASSERT_EQ(result.findings.size(), 3u);
  EXPECT_EQ(result.findings[0].ruleName, kInternalErrorRuleName);
  EXPECT_EQ(result.findings[0].message,
            "rule 'no-scratch' failed: out of scratch");
  EXPECT_EQ(result.findings[0].range, tree->getRoot().getRange());
  EXPECT_EQ(result.findings[1].ruleName, "steady");
  EXPECT_EQ(result.findings[2].ruleName, "steady");
}

TEST_F(LintEngineTest, OutOfRangeFindingIsAFailure) {
  addRule("overreach", {NodeKind::TranslationUnit},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            SourcePosition end = node.getRange().end;
            SourcePosition beyond(end.line, end.column + 5, end.offset + 5);
            return Findings{rule.report(node.getRange(), "fine"),
                            rule.report(SourceRange(end, beyond), "too far")};
          });
  addRule("badfix", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            if (context.getText(node) != "b;")
              return Findings();
            SourceRange inverted(node.getRange().end, node.getRange().start);
            return Findings{rule.reportWithFix(node.getRange(), "inverted",
                                               inverted, "")};
          });
  prepare("a;\nb;\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  EXPECT_EQ(result.ruleFailures, 2u);
  ASSERT_EQ(result.findings.size(), 2u);
  EXPECT_EQ(result.findings[0].ruleName, kInternalErrorRuleName);
  EXPECT_EQ(result.findings[0].message,
            "rule 'overreach' failed: finding range lies outside the source "
            "text");
  EXPECT_EQ(result.findings[1].message,
            "rule 'badfix' failed: fix range lies outside the source text");
}

TEST_F(LintEngineTest, FindingsAreAttributedToTheInvokedRule) {
  addRule("honest", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &) -> Expected<Findings> {
            LintFinding finding = rule.reportWithFix(
                node.getRange(), "claimed", node.getRange(), "");
            finding.ruleName = "impostor";
            finding.fix->ruleName = "impostor";
            return Findings{finding};
          });
  prepare("a;\n");

  EvaluationResult result = LintEngine(rules).evaluate(*tree);
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].ruleName, "honest");
  EXPECT_EQ(result.findings[0].fix->ruleName, "honest");
}

/// Scratch state is created for every traversal.
TEST_F(LintEngineTest, ScratchIsPerTraversal) {
  struct Counter : public RuleScratch {
    unsigned count = 0;
  };
  class CountingRule : public LintRule {
  public:
    CountingRule() : LintRule("counting", "numbers identifiers") {}
    ArrayRef<NodeKind> getInterestedKinds() const override {
      static const NodeKind kinds[] = {NodeKind::Identifier};
      return kinds;
    }
    std::unique_ptr<RuleScratch> createScratch() const override {
      return std::make_unique<Counter>();
    }
    Expected<Findings> check(const SyntaxNode &node,
                             const RuleContext &context) const override {
      unsigned count = ++context.getScratch<Counter>()->count;
      return Findings{makeFinding(node.getRange(), "#" + Twine(count))};
    }
  };
  ASSERT_FALSE(llvm::errorToBool(
      registry.registerRule(std::make_unique<CountingRule>())));
  prepare("a;\nb;\n");

  LintEngine engine(rules);
  for (int run = 0; run != 2; ++run) {
    LintReport report = engine.run(*tree);
    EXPECT_EQ(messages(report.diagnostics),
              (std::vector<std::string>{"counting: #1", "counting: #2"}));
  }
}

TEST_F(LintEngineTest, NoLintComments) {
  addRule("flag", {NodeKind::Identifier},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &context) -> Expected<Findings> {
            return Findings{rule.report(node.getRange(), context.getText(node))};
          });
  prepare("a; // NOLINT\n"
          "b; // NOLINT(other)\n"
          "// NOLINTNEXTLINE(flag)\n"
          "c;\n"
          "d; /* NOLINT(*) */\n"
          "e;\n");

  LintReport report = LintEngine(rules).run(*tree);
  EXPECT_EQ(messages(report.diagnostics),
            (std::vector<std::string>{"flag: b", "flag: e"}));
}

TEST_F(LintEngineTest, InternalErrorsIgnoreNoLint) {
  addRule("broken", {NodeKind::Statement},
          [](const CallbackRule &, const SyntaxNode &,
             const RuleContext &) -> Expected<Findings> {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "always");
          });
  prepare("a; // NOLINT\n");

  LintReport report = LintEngine(rules).run(*tree);
  ASSERT_EQ(report.diagnostics.size(), 1u);
  EXPECT_EQ(report.diagnostics[0].getRuleName(), kInternalErrorRuleName);
}

TEST_F(LintEngineTest, SeverityOverride) {
  addRule("noisy", {NodeKind::Statement},
          [](const CallbackRule &rule, const SyntaxNode &node,
             const RuleContext &) -> Expected<Findings> {
            return Findings{rule.report(node.getRange(), "noise")};
          });
  config.setRuleSeverity("noisy", LintSeverity::Error);
  prepare("a;\n");

  LintReport report = LintEngine(rules).run(*tree);
  ASSERT_EQ(report.diagnostics.size(), 1u);
  EXPECT_EQ(report.diagnostics[0].getSeverity(), LintSeverity::Error);
  EXPECT_EQ(report.errorCount, 1u);
  EXPECT_EQ(report.status, LintStatus::Violations);
}

} // namespace
