//===- LintRule.cpp - Style lint rule contract ----------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintRule.h"

using namespace norma;
using namespace norma::lint;

RuleScratch::~RuleScratch() = default;

//===----------------------------------------------------------------------===//
// RuleContext
//===----------------------------------------------------------------------===//

SmallVector<const SyntaxNode *, 8>
RuleContext::getAncestors(const SyntaxNode &node) const {
  SmallVector<const SyntaxNode *, 8> ancestors;
  for (const SyntaxNode *parent = index.getParent(node); parent;
       parent = index.getParent(*parent))
    ancestors.push_back(parent);
  return ancestors;
}

const SyntaxNode *RuleContext::getPrevSibling(const SyntaxNode &node) const {
  const SyntaxNode *parent = index.getParent(node);
  std::optional<unsigned> position = index.getSiblingIndex(node);
  if (!parent || !position || *position == 0)
    return nullptr;
  return &parent->getChild(*position - 1);
}

const SyntaxNode *RuleContext::getNextSibling(const SyntaxNode &node) const {
  const SyntaxNode *parent = index.getParent(node);
  std::optional<unsigned> position = index.getSiblingIndex(node);
  if (!parent || !position || *position + 1 >= parent->getNumChildren())
    return nullptr;
  return &parent->getChild(*position + 1);
}

StringRef RuleContext::getStringOption(StringRef name,
                                       StringRef defaultValue) const {
  auto it = config.stringOptions.find(name);
  if (it == config.stringOptions.end())
    return defaultValue;
  return it->second;
}

int64_t RuleContext::getIntOption(StringRef name, int64_t defaultValue) const {
  auto it = config.intOptions.find(name);
  if (it == config.intOptions.end())
    return defaultValue;
  return it->second;
}

bool RuleContext::getBoolOption(StringRef name, bool defaultValue) const {
  auto it = config.boolOptions.find(name);
  if (it == config.boolOptions.end())
    return defaultValue;
  return it->second;
}

//===----------------------------------------------------------------------===//
// LintRule
//===----------------------------------------------------------------------===//

LintRule::LintRule(StringRef name, StringRef description, unsigned version)
    : name(name.str()), description(description.str()), version(version) {}

LintRule::~LintRule() = default;

LintFinding LintRule::makeFinding(SourceRange range,
                                  const Twine &message) const {
  LintFinding finding;
  finding.ruleName = name;
  finding.severity = getDefaultSeverity();
  finding.range = range;
  finding.message = message.str();
  return finding;
}

LintFinding LintRule::makeFinding(SourceRange range, const Twine &message,
                                  SourceRange editRange,
                                  StringRef replacement) const {
  LintFinding finding = makeFinding(range, message);
  finding.fix = TextEdit{name, editRange, replacement.str()};
  return finding;
}
