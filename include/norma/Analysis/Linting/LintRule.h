//===- LintRule.h - Style lint rule contract --------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This header declares the contract every style rule implements. A rule names
// the node kinds it wants to see and turns each such node into zero or more
// findings. Rules are shared by every file of a run and must not keep state
// between calls; per-file state lives in a RuleScratch object that the engine
// creates at the start of each traversal.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTRULE_H
#define NORMA_ANALYSIS_LINTING_LINTRULE_H

#include "norma/Analysis/Linting/LintConfig.h"
#include "norma/Syntax/SyntaxTree.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace norma {
namespace lint {

/// A proposed replacement of a source range.
struct TextEdit {
  /// The rule that proposed this edit.
  std::string ruleName;

  /// The range to replace. Empty ranges are insertions.
  SourceRange range;

  /// The replacement text.
  std::string replacement;

  bool operator==(const TextEdit &other) const {
    return ruleName == other.ruleName && range == other.range &&
           replacement == other.replacement;
  }
  bool operator!=(const TextEdit &other) const { return !(*this == other); }
};

/// Raw output of a rule, before canonicalization.
struct LintFinding {
  /// The rule that produced this finding.
  std::string ruleName;

  /// The severity the rule reported with.
  LintSeverity severity = LintSeverity::Warning;

  /// The source range of the issue.
  SourceRange range;

  /// The finding message.
  std::string message;

  /// Optional fix.
  std::optional<TextEdit> fix;
};

/// Per-file state owned by the engine on behalf of one rule.
class RuleScratch {
public:
  virtual ~RuleScratch();
};

//===----------------------------------------------------------------------===//
// Traversal Index
//===----------------------------------------------------------------------===//

/// Parent and sibling-index lookup for one traversal. Built by the engine as
/// it walks the tree and discarded with the traversal.
class TraversalIndex {
public:
  /// Record that `child` is the `index`th child of `parent`.
  void record(const SyntaxNode &child, const SyntaxNode *parent,
              unsigned index) {
    entries[&child] = {parent, index};
  }

  /// Return the parent of `node`, or null for the root and unknown nodes.
  const SyntaxNode *getParent(const SyntaxNode &node) const {
    auto it = entries.find(&node);
    return it == entries.end() ? nullptr : it->second.parent;
  }

  /// Return the position of `node` among its parent's children.
  std::optional<unsigned> getSiblingIndex(const SyntaxNode &node) const {
    auto it = entries.find(&node);
    if (it == entries.end() || !it->second.parent)
      return std::nullopt;
    return it->second.index;
  }

  size_t size() const { return entries.size(); }

private:
  struct Entry {
    const SyntaxNode *parent;
    unsigned index;
  };
  DenseMap<const SyntaxNode *, Entry> entries;
};

//===----------------------------------------------------------------------===//
// Rule Context
//===----------------------------------------------------------------------===//

/// Read-only view a rule gets of the traversal in progress.
class RuleContext {
public:
  RuleContext(const SyntaxTree &tree, const TraversalIndex &index,
              const LintRuleConfig &config, RuleScratch *scratch)
      : tree(tree), index(index), config(config), scratch(scratch) {}

  const SyntaxTree &getTree() const { return tree; }
  StringRef getSource() const { return tree.getSource(); }
  StringRef getFilename() const { return tree.getFilename(); }

  /// Return the source text of `node`.
  StringRef getText(const SyntaxNode &node) const {
    return tree.getText(node.getRange());
  }

  const SyntaxNode *getParent(const SyntaxNode &node) const {
    return index.getParent(node);
  }

  /// Return the ancestors of `node`, nearest first.
  SmallVector<const SyntaxNode *, 8> getAncestors(const SyntaxNode &node) const;

  std::optional<unsigned> getSiblingIndex(const SyntaxNode &node) const {
    return index.getSiblingIndex(node);
  }

  /// Return the sibling before or after `node`, or null at either end.
  const SyntaxNode *getPrevSibling(const SyntaxNode &node) const;
  const SyntaxNode *getNextSibling(const SyntaxNode &node) const;

  /// Rule-specific options, falling back to `defaultValue` when unset.
  StringRef getStringOption(StringRef name, StringRef defaultValue) const;
  int64_t getIntOption(StringRef name, int64_t defaultValue) const;
  bool getBoolOption(StringRef name, bool defaultValue) const;

  const LintRuleConfig &getConfig() const { return config; }

  /// The rule's per-file state, or null if the rule does not use one.
  template <typename T>
  T *getScratch() const {
    return static_cast<T *>(scratch);
  }

private:
  const SyntaxTree &tree;
  const TraversalIndex &index;
  const LintRuleConfig &config;
  RuleScratch *scratch;
};

//===----------------------------------------------------------------------===//
// LintRule
//===----------------------------------------------------------------------===//

/// Base class for all lint rules.
class LintRule {
public:
  LintRule(StringRef name, StringRef description, unsigned version = 1);
  virtual ~LintRule();

  /// Get the unique name of this rule (e.g., "trailing-whitespace").
  StringRef getName() const { return name; }

  /// Get a human-readable description of this rule.
  StringRef getDescription() const { return description; }

  /// Get the rule version. Bumped when the rule's behavior changes.
  unsigned getVersion() const { return version; }

  /// Get the default severity for this rule.
  virtual LintSeverity getDefaultSeverity() const {
    return LintSeverity::Warning;
  }

  /// Get the category of this rule (e.g., "whitespace", "naming").
  virtual StringRef getCategory() const { return "general"; }

  /// The node kinds this rule wants to be called for.
  virtual ArrayRef<NodeKind> getInterestedKinds() const = 0;

  /// Whether the edits this rule proposes may be applied automatically.
  virtual bool isAutoFixable() const { return false; }

  /// Check the rule-specific options before any file is processed.
  virtual Error validateOptions(const LintRuleConfig &config) const {
    return Error::success();
  }

  /// Create the per-file state for one traversal. Rules without per-file
  /// state return null.
  virtual std::unique_ptr<RuleScratch> createScratch() const {
    return nullptr;
  }

  /// Check one node of an interested kind.
  virtual Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const = 0;

protected:
  /// Build a finding attributed to this rule.
  LintFinding makeFinding(SourceRange range, const Twine &message) const;

  /// Build a finding that carries a fix replacing `editRange`.
  LintFinding makeFinding(SourceRange range, const Twine &message,
                          SourceRange editRange, StringRef replacement) const;

  std::string name;
  std::string description;
  unsigned version;
};

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTRULE_H
