//===- SyntaxTree.h - Immutable structural model of a source file -*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This header declares the structural model consumed by the lint engine: a
// single-owner tree of immutable nodes whose ranges tile the source text, and
// the parser interface that produces it.
//
// Tiling contract for any parser:
//   - the root covers the whole text;
//   - a parent's range is exactly the union of its children's ranges;
//   - siblings are disjoint, ordered by start offset and contiguous.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_SYNTAX_SYNTAXTREE_H
#define NORMA_SYNTAX_SYNTAXTREE_H

#include "norma/Support/LLVM.h"
#include "norma/Syntax/SourceLocation.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace norma {

//===----------------------------------------------------------------------===//
// Node Kinds
//===----------------------------------------------------------------------===//

/// The closed set of node kinds produced for brace-structured source text.
enum class NodeKind : uint8_t {
  TranslationUnit,
  Directive,
  Statement,
  Block,
  Group,
  Comment,
  Whitespace,
  Newline,
  Identifier,
  Keyword,
  Number,
  StringLiteral,
  CharLiteral,
  Punctuation,
};

/// Number of enumerators in NodeKind.
constexpr unsigned kNumNodeKinds =
    static_cast<unsigned>(NodeKind::Punctuation) + 1;

/// Convert a node kind to its printable name (e.g. "Statement").
StringRef stringifyNodeKind(NodeKind kind);

/// Return true for whitespace, newlines and comments.
bool isTrivia(NodeKind kind);

//===----------------------------------------------------------------------===//
// SyntaxNode
//===----------------------------------------------------------------------===//

/// A node of the structural model. Nodes never change after construction and
/// own their children.
class SyntaxNode {
public:
  using ChildList = std::vector<std::unique_ptr<SyntaxNode>>;

  /// Create a leaf node carrying its token text.
  SyntaxNode(NodeKind kind, SourceRange range, std::string text);

  /// Create an interior node owning `children`.
  SyntaxNode(NodeKind kind, SourceRange range, ChildList children);

  SyntaxNode(const SyntaxNode &) = delete;
  SyntaxNode &operator=(const SyntaxNode &) = delete;

  NodeKind getKind() const { return kind; }
  const SourceRange &getRange() const { return range; }

  /// Token text of a leaf. Empty for interior nodes.
  StringRef getText() const { return text; }

  bool isLeaf() const { return children.empty(); }
  size_t getNumChildren() const { return children.size(); }
  const SyntaxNode &getChild(size_t index) const { return *children[index]; }
  ArrayRef<std::unique_ptr<SyntaxNode>> getChildren() const {
    return children;
  }

  /// Return the first child, or null for a leaf.
  const SyntaxNode *getFirstChild() const {
    return children.empty() ? nullptr : children.front().get();
  }

  /// Count this node and all of its descendants.
  size_t countNodes() const;

  /// Print an indented outline of the subtree, one node per line.
  void dump(raw_ostream &os, unsigned indent = 0) const;

private:
  NodeKind kind;
  SourceRange range;
  std::string text;
  ChildList children;
};

//===----------------------------------------------------------------------===//
// SyntaxTree
//===----------------------------------------------------------------------===//

/// A parsed file: the source text, its name and the root node. Ranges in the
/// tree index into the text owned here.
class SyntaxTree {
public:
  SyntaxTree(std::string filename, std::string source,
             std::unique_ptr<SyntaxNode> root);

  StringRef getFilename() const { return filename; }
  StringRef getSource() const { return source; }
  const SyntaxNode &getRoot() const { return *root; }

  /// Return the source text covered by `range`.
  StringRef getText(const SourceRange &range) const;

private:
  std::string filename;
  std::string source;
  std::unique_ptr<SyntaxNode> root;
};

/// Check the tiling contract for `tree`. Returns an error describing the first
/// violation found.
Error verifyTiling(const SyntaxTree &tree);

//===----------------------------------------------------------------------===//
// Parser Interface
//===----------------------------------------------------------------------===//

/// Raised by a parser that cannot build a well-formed tree.
class SyntaxError : public llvm::ErrorInfo<SyntaxError> {
public:
  static char ID;

  SyntaxError(SourceRange range, std::string msg);

  const SourceRange &getRange() const { return range; }
  StringRef getMessage() const { return msg; }

  void log(raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  SourceRange range;
  std::string msg;
};

/// A language front end that turns text into a SyntaxTree. Implementations
/// must be safe to call concurrently from several threads.
class SyntaxParser {
public:
  virtual ~SyntaxParser();

  /// Parse `source`. On failure the error is a SyntaxError.
  virtual Expected<std::unique_ptr<SyntaxTree>>
  parse(StringRef source, StringRef filename) const = 0;
};

} // namespace norma

#endif // NORMA_SYNTAX_SYNTAXTREE_H
