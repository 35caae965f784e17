//===- StyleRules.h - Built-in style rules ----------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This header declares the style rules shipped with norma. They work on the
// trees produced by BraceParser.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_STYLERULES_H
#define NORMA_ANALYSIS_LINTING_STYLERULES_H

#include "norma/Analysis/Linting/LintRuleRegistry.h"

namespace norma {
namespace lint {

//===----------------------------------------------------------------------===//
// Whitespace
//===----------------------------------------------------------------------===//

/// Rule: Flag spaces and tabs at the end of a line.
class TrailingWhitespaceRule : public LintRule {
public:
  TrailingWhitespaceRule();

  StringRef getCategory() const override { return "whitespace"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Flag tab characters used for spacing. Trailing tabs are left to
/// trailing-whitespace.
///
/// Options:
///   tab_width (int, default 4): column width of a tab stop.
class NoTabsRule : public LintRule {
public:
  NoTabsRule();

  LintSeverity getDefaultSeverity() const override {
    return LintSeverity::Error;
  }
  StringRef getCategory() const override { return "whitespace"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }
  Error validateOptions(const LintRuleConfig &config) const override;

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Require the file to end with a newline.
class FinalNewlineRule : public LintRule {
public:
  FinalNewlineRule();

  StringRef getCategory() const override { return "whitespace"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Require a space between a control keyword and its '('.
class KeywordSpacingRule : public LintRule {
public:
  KeywordSpacingRule();

  StringRef getCategory() const override { return "whitespace"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Require a space after the '//' of a line comment.
class CommentSpacingRule : public LintRule {
public:
  CommentSpacingRule();

  LintSeverity getDefaultSeverity() const override {
    return LintSeverity::Hint;
  }
  StringRef getCategory() const override { return "whitespace"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

//===----------------------------------------------------------------------===//
// Layout
//===----------------------------------------------------------------------===//

/// Rule: Limit the length of a line.
///
/// Options:
///   max_length (int, default 100): longest accepted line, in bytes.
class LineLengthRule : public LintRule {
public:
  LineLengthRule();

  LintSeverity getDefaultSeverity() const override {
    return LintSeverity::Error;
  }
  StringRef getCategory() const override { return "layout"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  Error validateOptions(const LintRuleConfig &config) const override;

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Limit how deeply blocks nest.
///
/// Options:
///   max_depth (int, default 4): deepest accepted block.
class MaxNestingDepthRule : public LintRule {
public:
  MaxNestingDepthRule();

  StringRef getCategory() const override { return "structure"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  Error validateOptions(const LintRuleConfig &config) const override;

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

//===----------------------------------------------------------------------===//
// Preprocessor
//===----------------------------------------------------------------------===//

/// Rule: Flag a header included more than once in the same file.
class DuplicateIncludeRule : public LintRule {
public:
  DuplicateIncludeRule();

  StringRef getCategory() const override { return "preprocessor"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  bool isAutoFixable() const override { return true; }
  std::unique_ptr<RuleScratch> createScratch() const override;

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Rule: Check macro names against a naming convention.
///
/// Options:
///   pattern (string, default "^[A-Z][A-Z0-9_]*$"): regex a macro name must
///   match.
class MacroNamingRule : public LintRule {
public:
  MacroNamingRule();

  StringRef getCategory() const override { return "naming"; }
  ArrayRef<NodeKind> getInterestedKinds() const override;
  Error validateOptions(const LintRuleConfig &config) const override;
  std::unique_ptr<RuleScratch> createScratch() const override;

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override;
};

/// Register every built-in style rule with `registry`.
Error registerStyleRules(LintRuleRegistry &registry);

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_STYLERULES_H
