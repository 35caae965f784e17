//===----------------------------------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "gtest/gtest.h"

#include "TestRules.h"
#include "norma/Analysis/Linting/LintDriver.h"
#include "norma/Analysis/Linting/StyleRules.h"
#include "norma/Syntax/BraceParser.h"
#include "llvm/ADT/STLExtras.h"

#include <algorithm>

using namespace norma;
using namespace norma::lint;
using namespace norma::lint::test;

namespace {

using Findings = std::vector<LintFinding>;

class LintDriverTest : public ::testing::Test {
protected:
  /// Resolve the registered rules and create the driver.
  void build() {
    auto rulesOrErr = registry.resolve(config);
    ASSERT_TRUE(!!rulesOrErr) << llvm::toString(rulesOrErr.takeError());
    rules = std::move(*rulesOrErr);
    driver = std::make_unique<LintDriver>(parser, rules);
  }

  void useStyleRules() {
    ASSERT_FALSE(llvm::errorToBool(registerStyleRules(registry)));
    build();
  }

  /// Use a single fixable rule that proposes `replacement` at the end of the
  /// file on every pass.
  void useAppendRule(std::string replacement) {
    Error err = registry.registerRule(std::make_unique<CallbackRule>(
        "append", std::vector<NodeKind>{NodeKind::TranslationUnit},
        [replacement](const CallbackRule &rule, const SyntaxNode &node,
                      const RuleContext &) -> Expected<Findings> {
          SourceRange end = SourceRange::getPoint(node.getRange().end);
          return Findings{
              rule.reportWithFix(end, "wants more", end, replacement)};
        },
        /*fixable=*/true));
    ASSERT_FALSE(llvm::errorToBool(std::move(err)));
    build();
  }

  static bool hasNote(const LintDiagnostic &diag, StringRef note) {
    return llvm::is_contained(diag.getNotes(), note.str());
  }

  LintRuleRegistry registry;
  LintConfig config;
  ActiveRuleSet rules;
  BraceParser parser;
  std::unique_ptr<LintDriver> driver;
};

TEST_F(LintDriverTest, CleanFile) {
  useStyleRules();
  LintReport report = driver->lint("int main() {\n  return 0;\n}\n", "ok.c");
  EXPECT_EQ(report.filename, "ok.c");
  EXPECT_TRUE(report.diagnostics.empty());
  EXPECT_EQ(report.status, LintStatus::Clean);
}

TEST_F(LintDriverTest, ParseFailureIsReported) {
  useStyleRules();
  LintReport report = driver->lint("int f() {\n\treturn 0;  \n", "bad.c");
  EXPECT_EQ(report.status, LintStatus::ParseFailed);
  ASSERT_EQ(report.diagnostics.size(), 1u);
  EXPECT_EQ(report.diagnostics[0].getRuleName(), kSyntaxErrorRuleName);
  EXPECT_EQ(report.diagnostics[0].getMessage(), "missing '}' for '{'");
  EXPECT_EQ(report.diagnostics[0].getRange().start.column, 9u);
}

/// A file that fails to parse does not affect the other files of a batch.
TEST_F(LintDriverTest, BatchIsolatesParseFailures) {
  useStyleRules();
  std::vector<SourceFile> files = {{"a.c", "int a;  \n"},
                                   {"b.c", "int b = (1;\n"},
                                   {"c.c", "int c;\n"}};
  std::vector<LintReport> reports = driver->lintFiles(files, 3);
  ASSERT_EQ(reports.size(), 3u);
  EXPECT_EQ(reports[0].filename, "a.c");
  EXPECT_EQ(reports[0].status, LintStatus::Clean);
  EXPECT_EQ(reports[0].warningCount, 1u);
  EXPECT_EQ(reports[1].filename, "b.c");
  EXPECT_EQ(reports[1].status, LintStatus::ParseFailed);
  EXPECT_EQ(reports[2].filename, "c.c");
  EXPECT_TRUE(reports[2].diagnostics.empty());
}

/// A rule throwing inside a worker thread fails only its own file.
TEST_F(LintDriverTest, BatchContainsThrowingRules) {
  Error err = registry.registerRule(std::make_unique<CallbackRule>(
      "thrower", std::vector<NodeKind>{NodeKind::Statement},
      [](const CallbackRule &, const SyntaxNode &,
         const RuleContext &context) -> Expected<Findings> {
        if (context.getSource().startswith("boom"))
          throw 42;
        return Findings();
      }));
  ASSERT_FALSE(llvm::errorToBool(std::move(err)));
  build();

  std::vector<SourceFile> files = {
      {"a.c", "a;\n"}, {"b.c", "boom;\n"}, {"c.c", "c;\n"}};
  std::vector<LintReport> reports = driver->lintFiles(files, 3);
  ASSERT_EQ(reports.size(), 3u);
  EXPECT_EQ(reports[0].status, LintStatus::Clean);
  ASSERT_EQ(reports[1].diagnostics.size(), 1u);
  EXPECT_EQ(reports[1].diagnostics[0].getRuleName(), kInternalErrorRuleName);
  EXPECT_EQ(reports[1].status, LintStatus::Violations);
  EXPECT_EQ(reports[2].status, LintStatus::Clean);
}

/// Reports do not depend on the number of threads or the order of files.
TEST_F(LintDriverTest, BatchResultsAreDeterministic) {
  useStyleRules();
  std::vector<SourceFile> files;
  for (int i = 0; i != 12; ++i)
    files.push_back({"f" + std::to_string(i) + ".c",
                     "if(x) {\n\ty = " + std::to_string(i) + ";  \n}"});

  std::vector<LintReport> serial = driver->lintFiles(files, 1);
  std::vector<LintReport> parallel = driver->lintFiles(files, 4);
  std::reverse(files.begin(), files.end());
  std::vector<LintReport> reversed = driver->lintFiles(files, 0);
  std::reverse(reversed.begin(), reversed.end());

  ASSERT_EQ(serial.size(), 12u);
  for (size_t i = 0; i != serial.size(); ++i) {
    EXPECT_EQ(serial[i].diagnostics.size(), 4u);
    EXPECT_EQ(serial[i].diagnostics, parallel[i].diagnostics);
    EXPECT_EQ(serial[i].diagnostics, reversed[i].diagnostics);
  }
}

/// Registering the same rules in another order gives the same diagnostics.
TEST_F(LintDriverTest, RegistrationOrderDoesNotMatter) {
  useStyleRules();
  StringRef source = "#include <a.h>\n#include <a.h>\nif(x) {\t//c  \n}";
  LintReport forward = driver->lint(source, "order.c");

  LintRuleRegistry reversed;
  std::vector<std::unique_ptr<LintRule>> catalog;
  catalog.push_back(std::make_unique<MacroNamingRule>());
  catalog.push_back(std::make_unique<DuplicateIncludeRule>());
  catalog.push_back(std::make_unique<MaxNestingDepthRule>());
  catalog.push_back(std::make_unique<CommentSpacingRule>());
  catalog.push_back(std::make_unique<KeywordSpacingRule>());
  catalog.push_back(std::make_unique<FinalNewlineRule>());
  catalog.push_back(std::make_unique<LineLengthRule>());
  catalog.push_back(std::make_unique<NoTabsRule>());
  catalog.push_back(std::make_unique<TrailingWhitespaceRule>());
  for (auto &rule : catalog)
    ASSERT_FALSE(llvm::errorToBool(reversed.registerRule(std::move(rule))));
  auto rulesOrErr = reversed.resolve(config);
  ASSERT_TRUE(!!rulesOrErr);
  LintReport backward = LintDriver(parser, *rulesOrErr).lint(source, "order.c");

  EXPECT_EQ(forward.diagnostics.size(), 6u);
  EXPECT_EQ(forward.diagnostics, backward.diagnostics);
}

TEST_F(LintDriverTest, FixAppliesNonConflictingEdits) {
  useStyleRules();
  StringRef source = "if(a) {  \n\tb();\n}";
  FixResult result = driver->fix(source, "fix.c", 4);
  EXPECT_EQ(result.correctedText, "if (a) {\n    b();\n}\n");
  EXPECT_TRUE(result.changed(source));
  EXPECT_EQ(result.iterationsUsed, 1u);
  EXPECT_TRUE(result.conflicts.empty());
  EXPECT_TRUE(result.remainingDiagnostics.empty());
  EXPECT_EQ(result.status, LintStatus::Clean);
}

/// Fixing already fixed text changes nothing.
TEST_F(LintDriverTest, FixIsIdempotent) {
  useStyleRules();
  FixResult first = driver->fix("while(x){\n  #include <a.h>\n"
                                "  #include <a.h>\n\ty;\t\n}",
                                "idem.c", 4);
  ASSERT_EQ(first.status, LintStatus::Clean);
  FixResult second = driver->fix(first.correctedText, "idem.c", 4);
  EXPECT_EQ(second.correctedText, first.correctedText);
  EXPECT_FALSE(second.changed(first.correctedText));
  EXPECT_EQ(second.iterationsUsed, 0u);
}

/// Conflicting edits leave the text untouched and explain why.
TEST_F(LintDriverTest, ConflictLeavesTextUnchanged) {
  useStyleRules();
  StringRef source = "#include <a.h>\n\t#include <a.h>\n";
  FixResult result = driver->fix(source, "conflict.c", 4);

  EXPECT_EQ(result.correctedText, source);
  EXPECT_EQ(result.iterationsUsed, 0u);
  ASSERT_EQ(result.conflicts.size(), 1u);
  EXPECT_EQ(result.conflicts[0].firstRule, "no-tabs");
  EXPECT_EQ(result.conflicts[0].secondRule, "duplicate-include");

  ASSERT_EQ(result.remainingDiagnostics.size(), 2u);
  for (const auto &diag : result.remainingDiagnostics) {
    StringRef other =
        diag.getRuleName() == "no-tabs" ? "duplicate-include" : "no-tabs";
    EXPECT_TRUE(hasNote(diag, ("fix not applied: conflicts with rule '" +
                               other + "'")
                                  .str()));
  }
  EXPECT_EQ(result.status, LintStatus::Violations);
}

/// A rule whose fix never converges stops at the iteration limit.
TEST_F(LintDriverTest, IterationLimit) {
  useAppendRule(";");
  FixResult result = driver->fix("a", "grow.c", 3);
  EXPECT_EQ(result.correctedText, "a;;;");
  EXPECT_EQ(result.iterationsUsed, 3u);
  ASSERT_EQ(result.remainingDiagnostics.size(), 1u);
  EXPECT_TRUE(hasNote(result.remainingDiagnostics[0],
                      "fix not applied: iteration limit reached"));

  FixResult once = driver->fix("a", "grow.c", 1);
  EXPECT_EQ(once.correctedText, "a;");
  EXPECT_EQ(once.iterationsUsed, 1u);

  FixResult none = driver->fix("a", "grow.c", 0);
  EXPECT_EQ(none.correctedText, "a");
  EXPECT_EQ(none.iterationsUsed, 0u);
}

/// A pass whose output no longer parses is discarded.
TEST_F(LintDriverTest, UnparsableFixIsRolledBack) {
  useAppendRule("{");
  FixResult result = driver->fix("a;\n", "broken.c", 4);
  EXPECT_EQ(result.correctedText, "a;\n");
  EXPECT_EQ(result.iterationsUsed, 0u);
  EXPECT_EQ(result.status, LintStatus::Clean);
  ASSERT_EQ(result.remainingDiagnostics.size(), 1u);
  EXPECT_TRUE(hasNote(result.remainingDiagnostics[0],
                      "fix not applied: corrected text does not parse"));
}

TEST_F(LintDriverTest, FixOfUnparsableInput) {
  useStyleRules();
  FixResult result = driver->fix("a = (b;  \n", "bad.c", 4);
  EXPECT_EQ(result.correctedText, "a = (b;  \n");
  EXPECT_EQ(result.status, LintStatus::ParseFailed);
  EXPECT_EQ(result.iterationsUsed, 0u);
  ASSERT_EQ(result.remainingDiagnostics.size(), 1u);
  EXPECT_EQ(result.remainingDiagnostics[0].getRuleName(),
            kSyntaxErrorRuleName);
}

TEST_F(LintDriverTest, FixBatch) {
  useStyleRules();
  std::vector<SourceFile> files = {{"one.c", "x;  \n"},
                                   {"two.c", "{"},
                                   {"three.c", "y;"}};
  std::vector<FixResult> results = driver->fixFiles(files, 4, 2);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].correctedText, "x;\n");
  EXPECT_EQ(results[1].correctedText, "{");
  EXPECT_EQ(results[1].status, LintStatus::ParseFailed);
  EXPECT_EQ(results[2].correctedText, "y;\n");
  EXPECT_EQ(results[2].filename, "three.c");
}

} // namespace
