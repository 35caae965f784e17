//===----------------------------------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "gtest/gtest.h"

#include "norma/Syntax/SyntaxTree.h"
#include "llvm/Support/raw_ostream.h"

using namespace norma;

namespace {

SourceRange rangeOf(StringRef source, size_t begin, size_t end) {
  SourcePosition start = SourcePosition().advance(source.take_front(begin));
  return SourceRange(start, start.advance(source.slice(begin, end)));
}

std::unique_ptr<SyntaxNode> leaf(NodeKind kind, StringRef source, size_t begin,
                                 size_t end) {
  return std::make_unique<SyntaxNode>(kind, rangeOf(source, begin, end),
                                      source.slice(begin, end).str());
}

std::unique_ptr<SyntaxNode> interior(NodeKind kind, StringRef source,
                                     size_t begin, size_t end,
                                     SyntaxNode::ChildList children) {
  return std::make_unique<SyntaxNode>(kind, rangeOf(source, begin, end),
                                      std::move(children));
}

/// Build "a;\nb;" the way a parser would.
std::unique_ptr<SyntaxTree> buildTwoStatements() {
  StringRef source = "a;\nb;";
  SyntaxNode::ChildList first;
  first.push_back(leaf(NodeKind::Identifier, source, 0, 1));
  first.push_back(leaf(NodeKind::Punctuation, source, 1, 2));
  SyntaxNode::ChildList second;
  second.push_back(leaf(NodeKind::Identifier, source, 3, 4));
  second.push_back(leaf(NodeKind::Punctuation, source, 4, 5));

  SyntaxNode::ChildList items;
  items.push_back(
      interior(NodeKind::Statement, source, 0, 2, std::move(first)));
  items.push_back(leaf(NodeKind::Newline, source, 2, 3));
  items.push_back(
      interior(NodeKind::Statement, source, 3, 5, std::move(second)));
  return std::make_unique<SyntaxTree>(
      "two.c", source.str(),
      interior(NodeKind::TranslationUnit, source, 0, 5, std::move(items)));
}

TEST(SourceLocationTest, AdvanceCountsLines) {
  SourcePosition pos = SourcePosition().advance("ab\ncd");
  EXPECT_EQ(pos.line, 2u);
  EXPECT_EQ(pos.column, 3u);
  EXPECT_EQ(pos.offset, 5u);

  // "\r\n" is one line break.
  pos = SourcePosition().advance("a\r\nb");
  EXPECT_EQ(pos.line, 2u);
  EXPECT_EQ(pos.column, 2u);
  EXPECT_EQ(pos.offset, 4u);

  // A lone "\r" is an ordinary byte.
  pos = SourcePosition().advance("a\rb");
  EXPECT_EQ(pos.line, 1u);
  EXPECT_EQ(pos.column, 4u);
}

TEST(SourceLocationTest, RangeRelations) {
  StringRef source = "0123456789";
  SourceRange outer = rangeOf(source, 2, 8);
  SourceRange inner = rangeOf(source, 3, 5);
  SourceRange adjacent = rangeOf(source, 8, 9);
  SourceRange point = SourceRange::getPoint(inner.start);

  EXPECT_TRUE(outer.contains(inner));
  EXPECT_FALSE(inner.contains(outer));
  EXPECT_TRUE(outer.overlaps(inner));
  EXPECT_FALSE(outer.overlaps(adjacent));
  EXPECT_TRUE(point.empty());
  EXPECT_FALSE(point.overlaps(inner));
  EXPECT_EQ(outer.size(), 6u);
}

TEST(SourceLocationTest, Printing) {
  std::string buffer;
  llvm::raw_string_ostream os(buffer);
  os << rangeOf("ab\ncd", 1, 4);
  EXPECT_EQ(os.str(), "1:2-2:2");
}

TEST(SyntaxTreeTest, Accessors) {
  auto tree = buildTwoStatements();
  const SyntaxNode &root = tree->getRoot();

  EXPECT_EQ(tree->getFilename(), "two.c");
  EXPECT_EQ(root.getKind(), NodeKind::TranslationUnit);
  EXPECT_EQ(root.getNumChildren(), 3u);
  EXPECT_EQ(root.countNodes(), 8u);
  EXPECT_EQ(tree->getText(root.getChild(2).getRange()), "b;");
  EXPECT_EQ(root.getFirstChild()->getFirstChild()->getText(), "a");
  EXPECT_TRUE(root.getChild(1).isLeaf());
}

TEST(SyntaxTreeTest, Dump) {
  auto tree = buildTwoStatements();
  std::string buffer;
  llvm::raw_string_ostream os(buffer);
  tree->getRoot().getChild(1).dump(os);
  EXPECT_EQ(os.str(), "Newline 1:3-2:1 \"\\n\"\n");
}

TEST(SyntaxTreeTest, WellFormedTreeTiles) {
  auto tree = buildTwoStatements();
  EXPECT_FALSE(llvm::errorToBool(verifyTiling(*tree)));
}

TEST(SyntaxTreeTest, GapIsRejected) {
  StringRef source = "a b";
  SyntaxNode::ChildList items;
  items.push_back(leaf(NodeKind::Identifier, source, 0, 1));
  items.push_back(leaf(NodeKind::Identifier, source, 2, 3));
  SyntaxTree tree("gap.c", source.str(),
                  interior(NodeKind::TranslationUnit, source, 0, 3,
                           std::move(items)));

  Error err = verifyTiling(tree);
  ASSERT_TRUE(!!err);
  EXPECT_NE(llvm::toString(std::move(err)).find("gap"), std::string::npos);
}

TEST(SyntaxTreeTest, OverlapIsRejected) {
  StringRef source = "abc";
  SyntaxNode::ChildList items;
  items.push_back(leaf(NodeKind::Identifier, source, 0, 2));
  items.push_back(leaf(NodeKind::Identifier, source, 1, 3));
  SyntaxTree tree("overlap.c", source.str(),
                  interior(NodeKind::TranslationUnit, source, 0, 3,
                           std::move(items)));

  Error err = verifyTiling(tree);
  ASSERT_TRUE(!!err);
  EXPECT_NE(llvm::toString(std::move(err)).find("overlaps"),
            std::string::npos);
}

TEST(SyntaxTreeTest, ChildOutsideParentIsRejected) {
  StringRef source = "ab;";
  SyntaxNode::ChildList statement;
  statement.push_back(leaf(NodeKind::Identifier, source, 0, 2));
  SyntaxNode::ChildList items;
  // The statement claims all three bytes but its only child ends early.
  items.push_back(
      interior(NodeKind::Statement, source, 0, 3, std::move(statement)));
  SyntaxTree tree("short.c", source.str(),
                  interior(NodeKind::TranslationUnit, source, 0, 3,
                           std::move(items)));

  Error err = verifyTiling(tree);
  ASSERT_TRUE(!!err);
  llvm::consumeError(std::move(err));
}

TEST(SyntaxTreeTest, PartialRootIsRejected) {
  StringRef source = "ab";
  SyntaxTree tree("partial.c", source.str(),
                  leaf(NodeKind::Identifier, source, 0, 1));
  Error err = verifyTiling(tree);
  ASSERT_TRUE(!!err);
  llvm::consumeError(std::move(err));
}

TEST(SyntaxTreeTest, SyntaxErrorCarriesRange) {
  StringRef source = "ab";
  Error err = llvm::make_error<SyntaxError>(rangeOf(source, 1, 2), "bad byte");
  bool handled = false;
  llvm::handleAllErrors(std::move(err), [&](const SyntaxError &syntaxError) {
    handled = true;
    EXPECT_EQ(syntaxError.getRange().start.column, 2u);
    EXPECT_EQ(syntaxError.getMessage(), "bad byte");
    EXPECT_EQ(syntaxError.message(), "1:2: bad byte");
  });
  EXPECT_TRUE(handled);
}

} // namespace
