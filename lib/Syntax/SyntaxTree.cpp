//===- SyntaxTree.cpp - Immutable structural model of a source file -------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Syntax/SyntaxTree.h"

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>

using namespace norma;

//===----------------------------------------------------------------------===//
// Source Locations
//===----------------------------------------------------------------------===//

SourcePosition SourcePosition::advance(StringRef text) const {
  SourcePosition pos = *this;
  for (size_t i = 0, e = text.size(); i != e; ++i) {
    char c = text[i];
    if (c == '\n' || (c == '\r' && i + 1 != e && text[i + 1] == '\n')) {
      if (c == '\r') {
        ++i;
        ++pos.offset;
      }
      ++pos.line;
      pos.column = 1;
    } else {
      ++pos.column;
    }
    ++pos.offset;
  }
  return pos;
}

raw_ostream &norma::operator<<(raw_ostream &os, const SourcePosition &pos) {
  return os << pos.line << ':' << pos.column;
}

raw_ostream &norma::operator<<(raw_ostream &os, const SourceRange &range) {
  return os << range.start << '-' << range.end;
}

//===----------------------------------------------------------------------===//
// Node Kinds
//===----------------------------------------------------------------------===//

StringRef norma::stringifyNodeKind(NodeKind kind) {
  switch (kind) {
  case NodeKind::TranslationUnit:
    return "TranslationUnit";
  case NodeKind::Directive:
    return "Directive";
  case NodeKind::Statement:
    return "Statement";
  case NodeKind::Block:
    return "Block";
  case NodeKind::Group:
    return "Group";
  case NodeKind::Comment:
    return "Comment";
  case NodeKind::Whitespace:
    return "Whitespace";
  case NodeKind::Newline:
    return "Newline";
  case NodeKind::Identifier:
    return "Identifier";
  case NodeKind::Keyword:
    return "Keyword";
  case NodeKind::Number:
    return "Number";
  case NodeKind::StringLiteral:
    return "StringLiteral";
  case NodeKind::CharLiteral:
    return "CharLiteral";
  case NodeKind::Punctuation:
    return "Punctuation";
  }
  llvm_unreachable("invalid node kind");
}

bool norma::isTrivia(NodeKind kind) {
  return kind == NodeKind::Whitespace || kind == NodeKind::Newline ||
         kind == NodeKind::Comment;
}

//===----------------------------------------------------------------------===//
// SyntaxNode
//===----------------------------------------------------------------------===//

SyntaxNode::SyntaxNode(NodeKind kind, SourceRange range, std::string text)
    : kind(kind), range(range), text(std::move(text)) {}

SyntaxNode::SyntaxNode(NodeKind kind, SourceRange range, ChildList children)
    : kind(kind), range(range), children(std::move(children)) {}

size_t SyntaxNode::countNodes() const {
  size_t count = 0;
  SmallVector<const SyntaxNode *, 32> worklist;
  worklist.push_back(this);
  while (!worklist.empty()) {
    const SyntaxNode *node = worklist.pop_back_val();
    ++count;
    for (const auto &child : node->children)
      worklist.push_back(child.get());
  }
  return count;
}

void SyntaxNode::dump(raw_ostream &os, unsigned indent) const {
  os.indent(indent) << stringifyNodeKind(kind) << ' ' << range;
  if (!text.empty()) {
    os << " \"";
    os.write_escaped(text);
    os << '"';
  }
  os << '\n';
  for (const auto &child : children)
    child->dump(os, indent + 2);
}

//===----------------------------------------------------------------------===//
// SyntaxTree
//===----------------------------------------------------------------------===//

SyntaxTree::SyntaxTree(std::string filename, std::string source,
                       std::unique_ptr<SyntaxNode> root)
    : filename(std::move(filename)), source(std::move(source)),
      root(std::move(root)) {}

StringRef SyntaxTree::getText(const SourceRange &range) const {
  return StringRef(source).slice(range.start.offset, range.end.offset);
}

static Error tilingError(const SyntaxNode &node, const Twine &message) {
  std::string buffer;
  llvm::raw_string_ostream os(buffer);
  os << stringifyNodeKind(node.getKind()) << " at " << node.getRange() << ": "
     << message;
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument), os.str());
}

Error norma::verifyTiling(const SyntaxTree &tree) {
  const SyntaxNode &root = tree.getRoot();
  if (root.getRange().start.offset != 0 ||
      root.getRange().end.offset != tree.getSource().size())
    return tilingError(root, "root does not cover the whole source text");

  SmallVector<const SyntaxNode *, 32> worklist;
  worklist.push_back(&root);
  while (!worklist.empty()) {
    const SyntaxNode *node = worklist.pop_back_val();
    const SourceRange &range = node->getRange();
    if (!range.isValid())
      return tilingError(*node, "range ends before it starts");
    if (range.end.offset > tree.getSource().size())
      return tilingError(*node, "range extends past the end of the source");

    if (node->isLeaf()) {
      if (!node->getText().empty() && node->getText() != tree.getText(range))
        return tilingError(*node, "leaf text differs from the source text");
      continue;
    }

    ArrayRef<std::unique_ptr<SyntaxNode>> children = node->getChildren();
    if (children.front()->getRange().start.offset != range.start.offset)
      return tilingError(*node, "first child does not start at the parent");
    if (children.back()->getRange().end.offset != range.end.offset)
      return tilingError(*node, "last child does not end at the parent");
    for (size_t i = 1, e = children.size(); i != e; ++i) {
      const SourceRange &prev = children[i - 1]->getRange();
      const SourceRange &next = children[i]->getRange();
      if (next.start.offset < prev.end.offset)
        return tilingError(*children[i], "overlaps its previous sibling");
      if (next.start.offset != prev.end.offset)
        return tilingError(*children[i], "leaves a gap after its previous "
                                         "sibling");
    }
    for (const auto &child : children)
      worklist.push_back(child.get());
  }
  return Error::success();
}

//===----------------------------------------------------------------------===//
// Parser Interface
//===----------------------------------------------------------------------===//

char SyntaxError::ID = 0;

SyntaxError::SyntaxError(SourceRange range, std::string msg)
    : range(range), msg(std::move(msg)) {}

void SyntaxError::log(raw_ostream &os) const {
  os << range.start << ": " << msg;
}

std::error_code SyntaxError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

SyntaxParser::~SyntaxParser() = default;
